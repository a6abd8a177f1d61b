#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of filter_expr against stored object rows.
 */

#include <optional>
#include <string>
#include <string_view>

#include "embdb/filter_expr.hpp"
#include "embdb/value.hpp"

namespace embdb::filter_eval {

/** \brief The fields of one object row a predicate may reference. */
struct row_view {
  const Value* payload{nullptr};
  std::string_view object_id;
  const std::optional<std::string>* user_id{nullptr};
  const std::optional<std::string>* session_id{nullptr};
  const std::optional<std::string>* original_id{nullptr};
};

// Evaluate whether a row matches the expression.
auto matches(const filter_expr& expr, const row_view& row) -> bool;

// Glob match: `*` any run (including empty), `?` exactly one byte. Case-sensitive.
auto glob_match(std::string_view text, std::string_view pattern) -> bool;

} // namespace embdb::filter_eval
