#include "embdb/query_compiler.hpp"

#include <charconv>

namespace embdb {

namespace {

constexpr const char* kComponent = "query_compiler";

auto invalid(std::string msg) -> std::unexpected<core::error> {
  return core::make_error(core::error_code::invalid_argument, std::move(msg), kComponent);
}

auto make_field(const std::string& name, bool column) -> std::expected<field_ref, core::error> {
  field_ref f;
  f.name = name;
  if (column) {
    if (!is_filterable_column(name)) return invalid("column is not filterable: " + name);
    f.scope = field_scope::column;
    return f;
  }
  if (name.empty()) return invalid("empty payload field");
  f.path = split_path(name);
  for (const auto& seg : f.path) {
    if (seg.empty()) return invalid("malformed payload path: " + name);
  }
  return f;
}

auto cast_for(const Value& literal) -> std::expected<value_cast, core::error> {
  if (literal.is_number()) return value_cast::numeric;
  if (literal.is_bool()) return value_cast::boolean;
  if (literal.is_string()) return value_cast::text;
  return invalid("literal must be a string, number or bool");
}

auto leaf(field_ref f, predicate_op op, value_cast cast, Value v) -> filter_expr {
  return filter_expr{predicate{std::move(f), op, cast, std::move(v)}};
}

auto compile_bool(const PayloadFilter::Bool& b) -> std::expected<filter_expr, core::error>;

auto compile_all(const std::vector<PayloadFilter>& xs) -> std::expected<std::vector<filter_expr>, core::error> {
  std::vector<filter_expr> out;
  out.reserve(xs.size());
  for (const auto& x : xs) {
    auto c = compile(x);
    if (!c) return std::unexpected(c.error());
    out.push_back(std::move(*c));
  }
  return out;
}

auto compile_bool(const PayloadFilter::Bool& b) -> std::expected<filter_expr, core::error> {
  filter_expr::and_t top;
  if (!b.must.empty()) {
    auto xs = compile_all(b.must);
    if (!xs) return std::unexpected(xs.error());
    top.children.push_back(filter_expr{filter_expr::and_t{std::move(*xs)}});
  }
  if (!b.should.empty()) {
    auto xs = compile_all(b.should);
    if (!xs) return std::unexpected(xs.error());
    top.children.push_back(filter_expr{filter_expr::or_t{std::move(*xs)}});
  }
  if (!b.filter.empty()) {
    auto xs = compile_all(b.filter);
    if (!xs) return std::unexpected(xs.error());
    top.children.push_back(filter_expr{filter_expr::and_t{std::move(*xs)}});
  }
  if (!b.must_not.empty()) {
    auto xs = compile_all(b.must_not);
    if (!xs) return std::unexpected(xs.error());
    filter_expr inner{filter_expr::and_t{std::move(*xs)}};
    top.children.push_back(filter_expr{filter_expr::not_t{{std::move(inner)}}});
  }
  return filter_expr{std::move(top)};
}

} // namespace

bool is_filterable_column(std::string_view name) noexcept {
  for (const char* c : kFilterableColumns) {
    if (name == c) return true;
  }
  return false;
}

auto tokenize(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string cur;
  for (unsigned char ch : text) {
    const bool word = (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch >= 0x80;
    if (word) {
      cur.push_back((ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : static_cast<char>(ch));
    } else if (!cur.empty()) {
      out.push_back(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) out.push_back(std::move(cur));
  return out;
}

auto numeric_from_text(std::string_view text) -> std::optional<double> {
  std::size_t i = 0;
  const std::size_t n = text.size();
  auto digit = [&](std::size_t k) { return k < n && text[k] >= '0' && text[k] <= '9'; };
  if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
  const std::size_t body = i;
  std::size_t int_digits = 0, frac_digits = 0;
  while (digit(i)) { ++i; ++int_digits; }
  if (i < n && text[i] == '.') {
    ++i;
    while (digit(i)) { ++i; ++frac_digits; }
  }
  if (int_digits == 0 && frac_digits == 0) return std::nullopt;
  if (i < n && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
    if (!digit(i)) return std::nullopt;
    while (digit(i)) ++i;
  }
  if (i != n) return std::nullopt;

  double v = 0.0;
  const char* first = text.data() + body;
  const char* last = text.data() + n;
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc{} || ptr != last) return std::nullopt;
  return (body > 0 && text[0] == '-') ? -v : v;
}

auto compile(const PayloadFilter& filter) -> std::expected<filter_expr, core::error> {
  const auto& q = filter.query;

  if (const auto* m = std::get_if<MatchQuery>(&q)) {
    auto f = make_field(m->field, m->force_not_payload);
    if (!f) return std::unexpected(f.error());
    return leaf(std::move(*f), predicate_op::text_match, value_cast::text, Value(m->value));
  }
  if (const auto* m = std::get_if<MatchPhraseQuery>(&q)) {
    auto f = make_field(m->field, m->force_not_payload);
    if (!f) return std::unexpected(f.error());
    return leaf(std::move(*f), predicate_op::phrase_match, value_cast::text, Value(m->value));
  }
  if (const auto* w = std::get_if<WildcardQuery>(&q)) {
    auto f = make_field(w->field, w->force_not_payload);
    if (!f) return std::unexpected(f.error());
    return leaf(std::move(*f), predicate_op::glob, value_cast::text, Value(w->value));
  }
  if (const auto* t = std::get_if<TermQuery>(&q)) {
    auto f = make_field(t->field, t->force_not_payload);
    if (!f) return std::unexpected(f.error());
    auto cast = cast_for(t->value);
    if (!cast) return std::unexpected(cast.error());
    return leaf(std::move(*f), predicate_op::eq, *cast, t->value);
  }
  if (const auto* t = std::get_if<TermsQuery>(&q)) {
    auto f = make_field(t->field, t->force_not_payload);
    if (!f) return std::unexpected(f.error());
    if (t->values.empty()) return filter_expr{filter_expr::or_t{}};
    auto cast = cast_for(t->values.front());
    if (!cast) return std::unexpected(cast.error());
    for (const auto& v : t->values) {
      auto c = cast_for(v);
      if (!c) return std::unexpected(c.error());
      if (*c != *cast) return invalid("terms: values must share one kind: " + t->field);
    }
    return leaf(std::move(*f), predicate_op::in, *cast, Value(Value::Array(t->values)));
  }
  if (const auto* e = std::get_if<ExistsQuery>(&q)) {
    auto f = make_field(e->field, e->force_not_payload);
    if (!f) return std::unexpected(f.error());
    return leaf(std::move(*f), predicate_op::exists, value_cast::text, Value{});
  }
  if (const auto* r = std::get_if<RangeQuery>(&q)) {
    auto f = make_field(r->field, r->force_not_payload);
    if (!f) return std::unexpected(f.error());
    filter_expr::and_t bounds;
    auto add = [&](const std::optional<double>& b, predicate_op op) {
      if (b) bounds.children.push_back(leaf(*f, op, value_cast::numeric, Value(*b)));
    };
    add(r->range.gte, predicate_op::gte);
    add(r->range.lte, predicate_op::lte);
    add(r->range.gt, predicate_op::gt);
    add(r->range.lt, predicate_op::lt);
    add(r->range.eq, predicate_op::eq);
    return filter_expr{std::move(bounds)};
  }
  return compile_bool(std::get<PayloadFilter::Bool>(q));
}

} // namespace embdb
