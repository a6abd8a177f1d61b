#include "embdb/payload_filter.hpp"
#include "embdb/json.hpp"

#include <type_traits>
#include <utility>

namespace embdb {

namespace {

constexpr std::string_view kComponent = "payload_filter.json";

auto bad(std::string msg) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::invalid_argument, std::move(msg), std::string(kComponent));
}

auto read_field(const nlohmann::json& body, std::string_view kind) -> std::expected<std::string, core::error> {
    auto it = body.find("field");
    if (it == body.end() || !it->is_string()) return bad(std::string(kind) + ": \"field\" must be a string");
    return it->get<std::string>();
}

auto read_flag(const nlohmann::json& body) -> bool {
    auto it = body.find("force_not_payload");
    return it != body.end() && it->is_boolean() && it->get<bool>();
}

auto read_text(const nlohmann::json& body, std::string_view kind) -> std::expected<std::string, core::error> {
    auto it = body.find("value");
    if (it == body.end() || !it->is_string()) return bad(std::string(kind) + ": \"value\" must be a string");
    return it->get<std::string>();
}

bool is_scalar_literal(const nlohmann::json& j) {
    return j.is_string() || j.is_number() || j.is_boolean();
}

auto read_bound(const nlohmann::json& cond, const char* key, std::optional<double>& out)
    -> std::expected<void, core::error> {
    auto it = cond.find(key);
    if (it == cond.end() || it->is_null()) return {};
    if (!it->is_number()) return bad(std::string("range: bound \"") + key + "\" must be numeric");
    out = it->get<double>();
    return {};
}

auto parse_clause_list(const nlohmann::json& arr, std::vector<PayloadFilter>& out, std::string_view name)
    -> std::expected<void, core::error> {
    if (arr.is_null()) return {};
    if (!arr.is_array()) return bad("bool." + std::string(name) + " must be an array");
    for (const auto& item : arr) {
        auto child = parse_payload_filter(item);
        if (!child) return std::unexpected(child.error());
        out.push_back(std::move(*child));
    }
    return {};
}

template <typename Leaf>
void write_flag(nlohmann::json& body, const Leaf& leaf) {
    if (leaf.force_not_payload) body["force_not_payload"] = true;
}

} // namespace

auto parse_payload_filter(const nlohmann::json& j) -> std::expected<PayloadFilter, core::error> {
    if (!j.is_object() || j.size() != 1) return bad("filter must be an object with exactly one query key");
    const auto first = j.begin();
    const std::string kind = first.key();
    const auto& body = first.value();
    if (kind == "query") return parse_payload_filter(body);
    if (!body.is_object()) return bad(kind + ": body must be an object");

    if (kind == "bool") {
        PayloadFilter::Bool b;
        for (auto [name, list] : {std::pair{"must", &b.must}, std::pair{"should", &b.should},
                                  std::pair{"filter", &b.filter}, std::pair{"must_not", &b.must_not}}) {
            auto it = body.find(name);
            if (it == body.end()) continue;
            if (auto r = parse_clause_list(*it, *list, name); !r) return std::unexpected(r.error());
        }
        return PayloadFilter{std::move(b)};
    }

    auto field = read_field(body, kind);
    if (!field) return std::unexpected(field.error());
    const bool column = read_flag(body);

    if (kind == "match" || kind == "match_phrase" || kind == "wildcard") {
        auto text = read_text(body, kind);
        if (!text) return std::unexpected(text.error());
        if (kind == "match") return PayloadFilter{MatchQuery{std::move(*field), std::move(*text), column}};
        if (kind == "match_phrase") return PayloadFilter{MatchPhraseQuery{std::move(*field), std::move(*text), column}};
        return PayloadFilter{WildcardQuery{std::move(*field), std::move(*text), column}};
    }
    if (kind == "term") {
        auto it = body.find("value");
        if (it == body.end() || !is_scalar_literal(*it)) return bad("term: \"value\" must be a string, number or bool");
        return PayloadFilter{TermQuery{std::move(*field), from_json(*it), column}};
    }
    if (kind == "terms") {
        auto it = body.find("values");
        if (it == body.end() || !it->is_array()) return bad("terms: \"values\" must be an array");
        std::vector<Value> values;
        for (const auto& v : *it) {
            if (!is_scalar_literal(v)) return bad("terms: values must be strings, numbers or bools");
            values.push_back(from_json(v));
        }
        return PayloadFilter{TermsQuery{std::move(*field), std::move(values), column}};
    }
    if (kind == "exists") {
        return PayloadFilter{ExistsQuery{std::move(*field), column}};
    }
    if (kind == "range") {
        auto it = body.find("range");
        if (it == body.end() || !it->is_object()) return bad("range: \"range\" must be an object");
        RangeCondition cond;
        for (auto [key, slot] : {std::pair{"gte", &cond.gte}, std::pair{"lte", &cond.lte}, std::pair{"gt", &cond.gt},
                                 std::pair{"lt", &cond.lt}, std::pair{"eq", &cond.eq}}) {
            if (auto r = read_bound(*it, key, *slot); !r) return std::unexpected(r.error());
        }
        return PayloadFilter{RangeQuery{std::move(*field), cond, column}};
    }
    return bad("unknown query kind: " + kind);
}

auto parse_payload_filter_json(std::string_view text) -> std::expected<PayloadFilter, core::error> {
    auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return bad("malformed JSON");
    return parse_payload_filter(j);
}

auto payload_filter_to_json(const PayloadFilter& f) -> nlohmann::json {
    return std::visit(
        [](const auto& q) -> nlohmann::json {
            using T = std::decay_t<decltype(q)>;
            nlohmann::json body = nlohmann::json::object();
            if constexpr (std::is_same_v<T, PayloadFilter::Bool>) {
                auto list = [](const std::vector<PayloadFilter>& xs) {
                    auto arr = nlohmann::json::array();
                    for (const auto& x : xs) arr.push_back(payload_filter_to_json(x));
                    return arr;
                };
                if (!q.must.empty()) body["must"] = list(q.must);
                if (!q.should.empty()) body["should"] = list(q.should);
                if (!q.filter.empty()) body["filter"] = list(q.filter);
                if (!q.must_not.empty()) body["must_not"] = list(q.must_not);
                return {{"bool", body}};
            } else {
                body["field"] = q.field;
                write_flag(body, q);
                if constexpr (std::is_same_v<T, MatchQuery>) {
                    body["value"] = q.value;
                    return {{"match", body}};
                } else if constexpr (std::is_same_v<T, MatchPhraseQuery>) {
                    body["value"] = q.value;
                    return {{"match_phrase", body}};
                } else if constexpr (std::is_same_v<T, WildcardQuery>) {
                    body["value"] = q.value;
                    return {{"wildcard", body}};
                } else if constexpr (std::is_same_v<T, TermQuery>) {
                    body["value"] = to_json(q.value);
                    return {{"term", body}};
                } else if constexpr (std::is_same_v<T, TermsQuery>) {
                    auto arr = nlohmann::json::array();
                    for (const auto& v : q.values) arr.push_back(to_json(v));
                    body["values"] = std::move(arr);
                    return {{"terms", body}};
                } else if constexpr (std::is_same_v<T, ExistsQuery>) {
                    return {{"exists", body}};
                } else {
                    nlohmann::json cond = nlohmann::json::object();
                    if (q.range.gte) cond["gte"] = *q.range.gte;
                    if (q.range.lte) cond["lte"] = *q.range.lte;
                    if (q.range.gt) cond["gt"] = *q.range.gt;
                    if (q.range.lt) cond["lt"] = *q.range.lt;
                    if (q.range.eq) cond["eq"] = *q.range.eq;
                    body["range"] = std::move(cond);
                    return {{"range", body}};
                }
            }
        },
        f.query);
}

} // namespace embdb
