#include "embdb/sql/pg_render.hpp"

#include <charconv>

#include "embdb/query_compiler.hpp"

namespace embdb::sql {

namespace {

constexpr const char* kComponent = "sql.pg_render";

// Same grammar as numeric_from_text().
constexpr std::string_view kNumericPattern = "'^[-+]?([0-9]+(\\.[0-9]*)?|\\.[0-9]+)([eE][-+]?[0-9]+)?$'";

/** Typed accessors for one field reference. */
struct field_sql {
  std::string json;  // jsonb value (payload scope only)
  std::string text;  // text value
  bool payload{true};
};

auto field_expr(const field_ref& f, param_list& params, std::string_view alias)
    -> std::expected<field_sql, core::error> {
  field_sql out;
  if (f.scope == field_scope::column) {
    if (!is_filterable_column(f.name)) {
      return core::make_error(core::error_code::invalid_argument, "column is not filterable: " + f.name, kComponent);
    }
    out.payload = false;
    out.text = std::string(alias) + "." + f.name;
    return out;
  }
  const auto path = params.add(text_array_literal(f.path)) + "::text[]";
  out.json = "(" + std::string(alias) + ".payload #> " + path + ")";
  out.text = "(" + std::string(alias) + ".payload #>> " + path + ")";
  return out;
}

auto numeric_expr(const field_sql& f) -> std::string {
  const std::string guarded = "CASE WHEN " + f.text + " ~ " + std::string(kNumericPattern) + " THEN " + f.text +
                              "::numeric END";
  if (!f.payload) return "(" + guarded + ")";
  return "(CASE jsonb_typeof(" + f.json + ") WHEN 'number' THEN " + f.text + "::numeric WHEN 'string' THEN " +
         guarded + " END)";
}

auto boolean_expr(const field_sql& f) -> std::string {
  const std::string guarded = "CASE WHEN " + f.text + " IN ('true', 'false') THEN " + f.text + "::boolean END";
  if (!f.payload) return "(" + guarded + ")";
  return "(CASE jsonb_typeof(" + f.json + ") WHEN 'boolean' THEN " + f.text + "::boolean WHEN 'string' THEN " +
         guarded + " END)";
}

auto typed(const field_sql& f, value_cast cast) -> std::string {
  switch (cast) {
  case value_cast::numeric: return numeric_expr(f);
  case value_cast::boolean: return boolean_expr(f);
  case value_cast::text: return f.text;
  }
  return f.text;
}

auto bind_literal(const Value& v, value_cast cast, param_list& params) -> std::string {
  const auto placeholder = params.add(literal_text(v));
  switch (cast) {
  case value_cast::numeric: return placeholder + "::numeric";
  case value_cast::boolean: return placeholder + "::boolean";
  case value_cast::text: return placeholder + "::text";
  }
  return placeholder;
}

auto render_predicate(const predicate& p, param_list& params, std::string_view alias, std::string_view language)
    -> std::expected<std::string, core::error> {
  auto f = field_expr(p.field, params, alias);
  if (!f) return std::unexpected(f.error());

  std::string body;
  switch (p.op) {
  case predicate_op::exists:
    body = (f->payload ? f->json : f->text) + " IS NOT NULL";
    break;
  case predicate_op::text_match:
  case predicate_op::phrase_match: {
    const auto cfg = params.add(std::string(language)) + "::regconfig";
    const auto query = params.add(literal_text(p.value));
    const char* fn = p.op == predicate_op::text_match ? "plainto_tsquery" : "phraseto_tsquery";
    body = "to_tsvector(" + cfg + ", " + f->text + ") @@ " + fn + "(" + cfg + ", " + query + ")";
    break;
  }
  case predicate_op::glob:
    body = f->text + " LIKE " + params.add(glob_to_like(literal_text(p.value)));
    break;
  case predicate_op::eq:
    body = typed(*f, p.cast) + " = " + bind_literal(p.value, p.cast, params);
    break;
  case predicate_op::in: {
    const auto* items = p.value.as_array();
    if (!items || items->empty()) return std::string("FALSE");
    body = typed(*f, p.cast) + " IN (";
    for (std::size_t i = 0; i < items->size(); ++i) {
      if (i) body += ", ";
      body += bind_literal((*items)[i], p.cast, params);
    }
    body += ")";
    break;
  }
  case predicate_op::gte: body = numeric_expr(*f) + " >= " + bind_literal(p.value, value_cast::numeric, params); break;
  case predicate_op::lte: body = numeric_expr(*f) + " <= " + bind_literal(p.value, value_cast::numeric, params); break;
  case predicate_op::gt: body = numeric_expr(*f) + " > " + bind_literal(p.value, value_cast::numeric, params); break;
  case predicate_op::lt: body = numeric_expr(*f) + " < " + bind_literal(p.value, value_cast::numeric, params); break;
  }
  return "COALESCE((" + body + "), FALSE)";
}

auto render_node(const filter_expr& e, param_list& params, std::string_view alias, std::string_view language)
    -> std::expected<std::string, core::error>;

auto render_children(const std::vector<filter_expr>& children, std::string_view joiner, param_list& params,
                     std::string_view alias, std::string_view language) -> std::expected<std::string, core::error> {
  std::string out = "(";
  for (std::size_t i = 0; i < children.size(); ++i) {
    auto c = render_node(children[i], params, alias, language);
    if (!c) return c;
    if (i) out += joiner;
    out += *c;
  }
  out += ")";
  return out;
}

auto render_node(const filter_expr& e, param_list& params, std::string_view alias, std::string_view language)
    -> std::expected<std::string, core::error> {
  if (const auto* p = std::get_if<predicate>(&e.node)) return render_predicate(*p, params, alias, language);
  if (const auto* a = std::get_if<filter_expr::and_t>(&e.node)) {
    if (a->children.empty()) return std::string("TRUE");
    return render_children(a->children, " AND ", params, alias, language);
  }
  if (const auto* o = std::get_if<filter_expr::or_t>(&e.node)) {
    if (o->children.empty()) return std::string("FALSE");
    return render_children(o->children, " OR ", params, alias, language);
  }
  const auto& n = std::get<filter_expr::not_t>(e.node);
  if (n.children.empty()) return std::string("TRUE");
  auto any = render_children(n.children, " OR ", params, alias, language);
  if (!any) return any;
  return "(NOT " + *any + ")";
}

} // namespace

auto param_list::add(std::optional<std::string> value) -> std::string {
  values_.push_back(std::move(value));
  return "$" + std::to_string(values_.size());
}

auto literal_text(const Value& v) -> std::string {
  if (const auto* s = v.as_string()) return *s;
  if (const auto* i = v.as_int()) return std::to_string(*i);
  if (const auto* b = v.as_bool()) return *b ? "true" : "false";
  if (const auto* d = v.as_double()) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), *d);
    if (ec == std::errc{}) return std::string(buf, ptr);
    return std::to_string(*d);
  }
  return v.to_text().value_or("");
}

auto text_array_literal(const std::vector<std::string>& items) -> std::string {
  std::string out = "{";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) out.push_back(',');
    out.push_back('"');
    for (char ch : items[i]) {
      if (ch == '"' || ch == '\\') out.push_back('\\');
      out.push_back(ch);
    }
    out.push_back('"');
  }
  out.push_back('}');
  return out;
}

auto vector_literal(std::span<const float> v) -> std::string {
  std::string out = "[";
  char buf[32];
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out.push_back(',');
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v[i]);
    out.append(buf, ec == std::errc{} ? ptr : buf);
  }
  out.push_back(']');
  return out;
}

auto parse_vector_literal(std::string_view text) -> std::expected<std::vector<float>, core::error> {
  auto bad = [&] {
    return core::make_error(core::error_code::data_integrity, "malformed vector literal", kComponent);
  };
  if (text.size() < 2 || text.front() != '[' || text.back() != ']') return bad();
  text = text.substr(1, text.size() - 2);
  std::vector<float> out;
  while (!text.empty()) {
    const auto comma = text.find(',');
    auto item = text.substr(0, comma);
    while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
    float f = 0.0f;
    auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), f);
    if (ec != std::errc{} || ptr != item.data() + item.size()) return bad();
    out.push_back(f);
    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
  return out;
}

auto glob_to_like(std::string_view glob) -> std::string {
  std::string out;
  out.reserve(glob.size() + 4);
  for (char ch : glob) {
    switch (ch) {
    case '*': out.push_back('%'); break;
    case '?': out.push_back('_'); break;
    case '%':
    case '_':
    case '\\':
      out.push_back('\\');
      out.push_back(ch);
      break;
    default: out.push_back(ch);
    }
  }
  return out;
}

auto render_filter(const filter_expr& expr, param_list& params, std::string_view alias,
                   std::string_view text_search_language) -> std::expected<std::string, core::error> {
  return render_node(expr, params, alias, text_search_language);
}

auto objects_table(std::string_view collection_id) -> std::string {
  return "\"dbo_" + std::string(collection_id) + "\"";
}

auto parts_table(std::string_view collection_id) -> std::string {
  return "\"dbop_" + std::string(collection_id) + "\"";
}

auto distance_operator(MetricType metric) -> std::string_view {
  switch (metric) {
  case MetricType::cosine: return "<=>";
  case MetricType::dot: return "<#>";
  case MetricType::euclid: return "<->";
  }
  return "<=>";
}

auto hnsw_opclass(MetricType metric) -> std::string_view {
  switch (metric) {
  case MetricType::cosine: return "vector_cosine_ops";
  case MetricType::dot: return "vector_ip_ops";
  case MetricType::euclid: return "vector_l2_ops";
  }
  return "vector_cosine_ops";
}

} // namespace embdb::sql
