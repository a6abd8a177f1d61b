#pragma once

/** \file query_compiler.hpp
 *  \brief PayloadFilter -> filter_expr.
 *
 * Semantics:
 * - match: every token of the value occurs in the field text.
 * - match_phrase: the tokens occur consecutively.
 * - wildcard: glob over the field text.
 * - term/terms: equality/membership under a cast chosen by the literal kind
 *   (number -> numeric, bool -> boolean, string -> text).
 * - exists: the key path is present (its value may be null).
 * - range: AND of the given bounds on the numeric cast; no bounds is constant true.
 * - bool: must AND, should OR, filter AND, must_not NOT(AND); empty clauses are skipped and
 *   an empty bool is constant true.
 * Casts: numeric accepts JSON numbers and strings that parse as numbers; boolean accepts JSON
 * bools and the strings "true"/"false"; text is the `->>` rendering. A value that does not cast
 * is NULL and fails every comparison.
 * Column fields (force_not_payload) are restricted to kFilterableColumns.
 *
 * Compilation is deterministic: compiling the same filter twice yields equal ASTs.
 */

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "embdb/error.hpp"
#include "embdb/filter_expr.hpp"
#include "embdb/payload_filter.hpp"

namespace embdb {

auto compile(const PayloadFilter& filter) -> std::expected<filter_expr, core::error>;

/** \brief Lower-cased alphanumeric runs of `text` (the tokenizer shared by match renderers).
 *
 * Case folding covers ASCII only. Bytes >= 0x80 are word characters kept verbatim, so
 * "Äpfel" and "äpfel" are different tokens here, while PostgreSQL's `simple` configuration
 * folds both to "äpfel".
 */
auto tokenize(std::string_view text) -> std::vector<std::string>;

/** \brief Numeric cast of stored text: [-+]?(digits[.digits]|.digits)([eE][-+]?digits), no spaces. */
auto numeric_from_text(std::string_view text) -> std::optional<double>;

/** \brief True when `name` is a column accepted by force_not_payload. */
bool is_filterable_column(std::string_view name) noexcept;

} // namespace embdb
