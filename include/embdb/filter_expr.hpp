#pragma once

/** \file filter_expr.hpp
 *  \brief Backend-neutral predicate AST compiled from a PayloadFilter.
 *
 * Leaves are {field, op, cast, value} predicates; interior nodes are AND/OR/NOT.
 * and_t{} is constant true, or_t{} is constant false, not_t{} is true (NOT of no children).
 * Renderers: filter_eval (in-memory rows) and sql::render_filter (PostgreSQL with bound parameters).
 * Ownership: this AST is value-semantic and self-contained.
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "embdb/value.hpp"

namespace embdb {

/** \brief Where a predicate's field lives. */
enum class field_scope : std::uint8_t {
  payload, /**< JSON path inside the payload document */
  column   /**< stored column (whitelisted names only) */
};

/** \brief Field reference; for payload scope `path` holds the dotted segments. */
struct field_ref {
  std::string name;               /**< dotted payload path or column name */
  std::vector<std::string> path;  /**< payload path segments */
  field_scope scope{field_scope::payload};
};

enum class predicate_op : std::uint8_t {
  text_match,    /**< all query tokens present */
  phrase_match,  /**< query tokens present consecutively */
  glob,          /**< `*`/`?` pattern over the field text */
  eq,
  in,            /**< value is an array of literals */
  exists,
  gte,
  lte,
  gt,
  lt
};

/** \brief Cast applied to the stored value before comparison. */
enum class value_cast : std::uint8_t { text, numeric, boolean };

struct predicate {
  field_ref field;
  predicate_op op{predicate_op::eq};
  value_cast cast{value_cast::text};
  Value value; /**< literal (string for text ops, array for `in`, null for `exists`) */
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<predicate, and_t, or_t, not_t> node; /**< root node */
};

/** \brief Columns addressable with force_not_payload. */
inline constexpr const char* kFilterableColumns[] = {"object_id", "user_id", "session_id", "original_id"};

} // namespace embdb
