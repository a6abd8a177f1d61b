#pragma once

/** \file pg_render.hpp
 *  \brief Render filter_expr to a PostgreSQL boolean expression with bound parameters.
 *
 * No literal or identifier taken from user input is interpolated: literals and JSON paths
 * are appended to a parameter list and referenced as $n; column names come from the
 * filterable-column whitelist. Every predicate is wrapped in COALESCE(..., false) so NOT
 * behaves like the in-memory evaluator on missing fields.
 */

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "embdb/error.hpp"
#include "embdb/filter_expr.hpp"
#include "embdb/models.hpp"

namespace embdb::sql {

/** \brief SQL text plus its positional text parameters (nullopt binds NULL). */
struct statement {
  std::string text;
  std::vector<std::optional<std::string>> params;
};

/** \brief Positional parameter collector. */
class param_list {
public:
  /** \brief Append a value and return its placeholder ("$n"). */
  auto add(std::optional<std::string> value) -> std::string;
  auto values() const noexcept -> const std::vector<std::optional<std::string>>& { return values_; }
  auto take() noexcept -> std::vector<std::optional<std::string>> { return std::move(values_); }
  auto size() const noexcept -> std::size_t { return values_.size(); }

private:
  std::vector<std::optional<std::string>> values_;
};

/** \brief Text form of a scalar literal (strings verbatim, shortest round-trip numbers). */
auto literal_text(const Value& v) -> std::string;

/** \brief PostgreSQL array literal for text[] parameters: {"a","b"} with `"` and `\` escaped. */
auto text_array_literal(const std::vector<std::string>& items) -> std::string;

/** \brief pgvector text literal "[x,y,...]". */
auto vector_literal(std::span<const float> v) -> std::string;

/** \brief Parse a pgvector text literal; malformed input is data_integrity. */
auto parse_vector_literal(std::string_view text) -> std::expected<std::vector<float>, core::error>;

/** \brief Glob (`*`, `?`) to LIKE pattern with `%`, `_` and `\` escaped. */
auto glob_to_like(std::string_view glob) -> std::string;

/** \brief Render `expr` against rows aliased `alias` (payload column `<alias>.payload`). */
auto render_filter(const filter_expr& expr, param_list& params, std::string_view alias,
                   std::string_view text_search_language) -> std::expected<std::string, core::error>;

/** \brief Quoted physical table names of a collection. */
auto objects_table(std::string_view collection_id) -> std::string;
auto parts_table(std::string_view collection_id) -> std::string;

/** \brief pgvector distance operator and HNSW operator class per metric. */
auto distance_operator(MetricType metric) -> std::string_view;
auto hnsw_opclass(MetricType metric) -> std::string_view;

} // namespace embdb::sql
