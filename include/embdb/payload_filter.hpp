#pragma once

/** \file payload_filter.hpp
 *  \brief Caller-facing payload filter: a closed union of Elasticsearch-style queries.
 *
 * Every leaf binds a field. By default the field is a dotted JSON path inside the object's
 * payload; with force_not_payload it names a stored column instead (object_id, user_id,
 * session_id, original_id).
 *
 * JSON shape:
 *   {"bool": {"must": [{"term": {"field": "kind", "value": "shoe"}}],
 *             "must_not": [{"exists": {"field": "hidden"}}]}}
 * An outer {"query": ...} wrapper is accepted on input.
 */

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "embdb/error.hpp"
#include "embdb/value.hpp"

namespace embdb {

struct MatchQuery {
    std::string field;
    std::string value;
    bool force_not_payload{false};
};

struct MatchPhraseQuery {
    std::string field;
    std::string value;
    bool force_not_payload{false};
};

/** \brief Glob: `*` matches any run of characters, `?` exactly one. */
struct WildcardQuery {
    std::string field;
    std::string value;
    bool force_not_payload{false};
};

/** \brief Equality. The literal's kind (string, number, bool) selects the comparison cast. */
struct TermQuery {
    std::string field;
    Value value;
    bool force_not_payload{false};
};

/** \brief Set membership; all literals share one kind. */
struct TermsQuery {
    std::string field;
    std::vector<Value> values;
    bool force_not_payload{false};
};

struct ExistsQuery {
    std::string field;
    bool force_not_payload{false};
};

struct RangeCondition {
    std::optional<double> gte;
    std::optional<double> lte;
    std::optional<double> gt;
    std::optional<double> lt;
    std::optional<double> eq;
};

struct RangeQuery {
    std::string field;
    RangeCondition range;
    bool force_not_payload{false};
};

/** \brief Recursive payload filter. */
struct PayloadFilter {
    /** \brief must: AND, should: OR, filter: AND, must_not: NOT(AND). Empty clauses are skipped. */
    struct Bool {
        std::vector<PayloadFilter> must;
        std::vector<PayloadFilter> should;
        std::vector<PayloadFilter> filter;
        std::vector<PayloadFilter> must_not;
    };

    std::variant<MatchQuery, TermQuery, TermsQuery, MatchPhraseQuery, ExistsQuery, WildcardQuery,
                 RangeQuery, Bool>
        query;
};

using BoolQuery = PayloadFilter::Bool;

/** \brief Parse the JSON shape described above; malformed input is invalid_argument. */
auto parse_payload_filter(const nlohmann::json& j) -> std::expected<PayloadFilter, core::error>;
auto parse_payload_filter_json(std::string_view text) -> std::expected<PayloadFilter, core::error>;

auto payload_filter_to_json(const PayloadFilter& f) -> nlohmann::json;

/** \brief Builders for composing filters in code. */
namespace filters {

inline auto match(std::string field, std::string value) -> PayloadFilter {
    return {MatchQuery{std::move(field), std::move(value)}};
}
inline auto match_phrase(std::string field, std::string value) -> PayloadFilter {
    return {MatchPhraseQuery{std::move(field), std::move(value)}};
}
inline auto wildcard(std::string field, std::string pattern) -> PayloadFilter {
    return {WildcardQuery{std::move(field), std::move(pattern)}};
}
inline auto term(std::string field, Value value) -> PayloadFilter {
    return {TermQuery{std::move(field), std::move(value)}};
}
inline auto terms(std::string field, std::vector<Value> values) -> PayloadFilter {
    return {TermsQuery{std::move(field), std::move(values)}};
}
inline auto exists(std::string field) -> PayloadFilter { return {ExistsQuery{std::move(field)}}; }
inline auto range(std::string field, RangeCondition cond) -> PayloadFilter {
    return {RangeQuery{std::move(field), cond}};
}
/** \brief term against a stored column rather than the payload. */
inline auto column_term(std::string column, std::string value) -> PayloadFilter {
    return {TermQuery{std::move(column), Value(std::move(value)), true}};
}

} // namespace filters

} // namespace embdb
