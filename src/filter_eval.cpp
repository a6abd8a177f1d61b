#include "embdb/filter_eval.hpp"
#include "embdb/query_compiler.hpp"

#include <algorithm>
#include <unordered_set>

namespace embdb::filter_eval {

namespace {

/** Resolved field: present flag plus the stored value. */
struct stored {
  bool present{false};
  const Value* payload_value{nullptr};
  std::optional<std::string_view> column_value;
};

auto resolve(const field_ref& f, const row_view& row) -> stored {
  stored s;
  if (f.scope == field_scope::payload) {
    const Value* cur = row.payload;
    for (const auto& seg : f.path) {
      if (!cur) break;
      cur = cur->find(seg);
    }
    s.payload_value = cur;
    s.present = cur != nullptr;
    return s;
  }
  if (f.name == "object_id") {
    s.column_value = row.object_id;
    s.present = true;
    return s;
  }
  const std::optional<std::string>* col = nullptr;
  if (f.name == "user_id") col = row.user_id;
  else if (f.name == "session_id") col = row.session_id;
  else if (f.name == "original_id") col = row.original_id;
  if (col && col->has_value()) {
    s.column_value = std::string_view(col->value());
    s.present = true;
  }
  return s;
}

auto as_text(const stored& s) -> std::optional<std::string> {
  if (s.column_value) return std::string(*s.column_value);
  if (s.payload_value) return s.payload_value->to_text();
  return std::nullopt;
}

auto as_numeric(const stored& s) -> std::optional<double> {
  if (s.column_value) return numeric_from_text(*s.column_value);
  if (!s.payload_value) return std::nullopt;
  if (auto n = s.payload_value->as_number()) return n;
  if (const auto* str = s.payload_value->as_string()) return numeric_from_text(*str);
  return std::nullopt;
}

auto bool_from_text(std::string_view t) -> std::optional<bool> {
  if (t == "true") return true;
  if (t == "false") return false;
  return std::nullopt;
}

auto as_boolean(const stored& s) -> std::optional<bool> {
  if (s.column_value) return bool_from_text(*s.column_value);
  if (!s.payload_value) return std::nullopt;
  if (const auto* b = s.payload_value->as_bool()) return *b;
  if (const auto* str = s.payload_value->as_string()) return bool_from_text(*str);
  return std::nullopt;
}

auto equals(const stored& s, value_cast cast, const Value& literal) -> bool {
  switch (cast) {
  case value_cast::numeric: {
    auto v = as_numeric(s);
    auto l = literal.as_number();
    return v && l && *v == *l;
  }
  case value_cast::boolean: {
    auto v = as_boolean(s);
    return v && literal.as_bool() && *v == *literal.as_bool();
  }
  case value_cast::text: {
    auto v = as_text(s);
    return v && literal.as_string() && *v == *literal.as_string();
  }
  }
  return false;
}

auto text_match(const stored& s, const std::string& query, bool phrase) -> bool {
  auto text = as_text(s);
  if (!text) return false;
  const auto want = tokenize(query);
  if (want.empty()) return false;
  const auto have = tokenize(*text);
  if (phrase) {
    return std::search(have.begin(), have.end(), want.begin(), want.end()) != have.end();
  }
  std::unordered_set<std::string> set(have.begin(), have.end());
  return std::all_of(want.begin(), want.end(), [&](const std::string& t) { return set.count(t) > 0; });
}

auto compare(const stored& s, predicate_op op, const Value& literal) -> bool {
  auto v = as_numeric(s);
  auto l = literal.as_number();
  if (!v || !l) return false;
  switch (op) {
  case predicate_op::gte: return *v >= *l;
  case predicate_op::lte: return *v <= *l;
  case predicate_op::gt: return *v > *l;
  case predicate_op::lt: return *v < *l;
  default: return false;
  }
}

auto matches_predicate(const predicate& p, const row_view& row) -> bool {
  const stored s = resolve(p.field, row);
  switch (p.op) {
  case predicate_op::exists: return s.present;
  case predicate_op::text_match: return text_match(s, *p.value.as_string(), false);
  case predicate_op::phrase_match: return text_match(s, *p.value.as_string(), true);
  case predicate_op::glob: {
    auto text = as_text(s);
    return text && glob_match(*text, *p.value.as_string());
  }
  case predicate_op::eq: return equals(s, p.cast, p.value);
  case predicate_op::in: {
    const auto* arr = p.value.as_array();
    if (!arr) return false;
    return std::any_of(arr->begin(), arr->end(), [&](const Value& v) { return equals(s, p.cast, v); });
  }
  case predicate_op::gte:
  case predicate_op::lte:
  case predicate_op::gt:
  case predicate_op::lt: return compare(s, p.op, p.value);
  }
  return false;
}

} // namespace

static auto matches_node(const filter_expr& e, const row_view& row) -> bool {
  if (std::holds_alternative<predicate>(e.node)) {
    return matches_predicate(std::get<predicate>(e.node), row);
  } else if (std::holds_alternative<filter_expr::and_t>(e.node)) {
    const auto& a = std::get<filter_expr::and_t>(e.node);
    for (const auto& c : a.children) if (!matches_node(c, row)) return false;
    return true; // and([]) == true
  } else if (std::holds_alternative<filter_expr::or_t>(e.node)) {
    const auto& o = std::get<filter_expr::or_t>(e.node);
    for (const auto& c : o.children) if (matches_node(c, row)) return true;
    return false; // or([]) == false
  } else if (std::holds_alternative<filter_expr::not_t>(e.node)) {
    const auto& n = std::get<filter_expr::not_t>(e.node);
    bool v = true; // not([]) == true
    for (const auto& c : n.children) v = v && (!matches_node(c, row));
    return v;
  }
  return false;
}

auto matches(const filter_expr& expr, const row_view& row) -> bool {
  return matches_node(expr, row);
}

auto glob_match(std::string_view text, std::string_view pattern) -> bool {
  std::size_t t = 0, p = 0;
  std::size_t star = std::string_view::npos, mark = 0;
  while (t < text.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      mark = t;
    } else if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++t;
      ++p;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++mark;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

} // namespace embdb::filter_eval
