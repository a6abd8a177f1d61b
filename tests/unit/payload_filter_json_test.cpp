#include <catch2/catch_all.hpp>
#include <embdb/payload_filter.hpp>

using namespace embdb;

TEST_CASE("payload filter JSON parses every query kind", "[payload_filter][json]") {
  auto f = parse_payload_filter_json(R"({"query": {"bool": {
      "must": [{"match": {"field": "title", "value": "red shoes"}},
               {"match_phrase": {"field": "title", "value": "red shoes"}}],
      "should": [{"wildcard": {"field": "sku", "value": "AB*"}},
                 {"term": {"field": "user_id", "value": "u1", "force_not_payload": true}}],
      "filter": [{"terms": {"field": "n", "values": [1, 2]}},
                 {"range": {"field": "price", "range": {"gte": 1, "lt": 5}}}],
      "must_not": [{"exists": {"field": "hidden"}}]}}})");
  REQUIRE(f.has_value());
  const auto& b = std::get<PayloadFilter::Bool>(f->query);
  REQUIRE(b.must.size() == 2);
  REQUIRE(std::holds_alternative<MatchPhraseQuery>(b.must[1].query));
  const auto& col = std::get<TermQuery>(b.should[1].query);
  REQUIRE(col.force_not_payload);
  REQUIRE(col.value == Value("u1"));
  const auto& r = std::get<RangeQuery>(b.filter[1].query);
  REQUIRE(r.range.gte == 1.0);
  REQUIRE(r.range.lt == 5.0);
  REQUIRE_FALSE(r.range.lte.has_value());
  REQUIRE(std::get<ExistsQuery>(b.must_not[0].query).field == "hidden");
}

TEST_CASE("payload filter JSON rejects malformed input", "[payload_filter][json]") {
  auto expect_invalid = [](std::string_view text) {
    auto f = parse_payload_filter_json(text);
    REQUIRE_FALSE(f.has_value());
    REQUIRE(f.error().code == core::error_code::invalid_argument);
  };
  expect_invalid("{");
  expect_invalid(R"({})");
  expect_invalid(R"({"term": {"field": "a", "value": 1}, "match": {"field": "b", "value": "x"}})");
  expect_invalid(R"({"fuzzy": {"field": "a", "value": "x"}})");
  expect_invalid(R"({"term": {"value": 1}})");
  expect_invalid(R"({"term": {"field": "a", "value": [1]}})");
  expect_invalid(R"({"terms": {"field": "a", "values": [{"x": 1}]}})");
  expect_invalid(R"({"range": {"field": "a", "range": {"gte": "1"}}})");
  expect_invalid(R"({"bool": {"must": {"exists": {"field": "a"}}}})");
}

TEST_CASE("payload filter serializes back to its JSON shape", "[payload_filter][json]") {
  PayloadFilter::Bool b;
  b.must.push_back(filters::term("kind", "shoe"));
  b.must_not.push_back(filters::range("price", {.gt = 10}));
  const auto j = payload_filter_to_json(PayloadFilter{b});

  REQUIRE(j.contains("bool"));
  REQUIRE_FALSE(j["bool"].contains("should"));
  REQUIRE(j["bool"]["must"][0]["term"]["value"] == "shoe");
  REQUIRE(j["bool"]["must_not"][0]["range"]["range"]["gt"] == 10.0);

  auto back = parse_payload_filter(j);
  REQUIRE(back.has_value());
  REQUIRE(payload_filter_to_json(*back) == j);
}
