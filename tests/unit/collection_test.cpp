#include <catch2/catch_all.hpp>

#include "collection_fixtures.hpp"
#include "collection_scenarios.hpp"

using namespace embdb;
using namespace collection_fixtures;

TEST_CASE("collection dimension invariant", "[collection]") {
  memory_db env;
  collection_scenarios::dimension_invariant(*env.db, "mem");
}

TEST_CASE("collection upsert shrink and merge", "[collection][upsert]") {
  memory_db env;
  collection_scenarios::upsert_shrink(*env.db, "mem");
}

TEST_CASE("collection aggregates part distances", "[collection][search]") {
  memory_db env;
  collection_scenarios::aggregation(*env.db, "mem");
}

TEST_CASE("collection personalization shadowing", "[collection][search]") {
  memory_db env;
  collection_scenarios::shadowing(*env.db, "mem");
}

TEST_CASE("collection pagination partitions results", "[collection][search]") {
  memory_db env;
  collection_scenarios::pagination(*env.db, "mem");
}

TEST_CASE("collection filtered and sorted search", "[collection][search]") {
  memory_db env;
  collection_scenarios::filtered_search(*env.db, "mem");
}

TEST_CASE("collection removal", "[collection]") {
  memory_db env;
  collection_scenarios::removal(*env.db, "mem");
}

TEST_CASE("collection sorts similarity hits by a field", "[collection][search]") {
  memory_db env;
  collection_scenarios::sorted_similarity(*env.db, "mem");
}

TEST_CASE("similarity hits list matched parts closest first", "[collection][search]") {
  memory_db env;
  collection_scenarios::matched_parts(*env.db, "mem");
}

TEST_CASE("a failed batch rolls back its earlier rows", "[collection][txn]") {
  memory_db env;
  collection_scenarios::batch_rollback(*env.db, "mem");
}

TEST_CASE("non-finite vectors are rejected", "[collection]") {
  memory_db env;
  collection_scenarios::non_finite(*env.db, "mem");
}

TEST_CASE("huge limits do not wrap", "[collection][search]") {
  memory_db env;
  collection_scenarios::huge_limits(*env.db, "mem");
}

TEST_CASE("metrics rank by smaller distance", "[collection][search]") {
  memory_db env;
  for (auto metric : {MetricType::cosine, MetricType::dot, MetricType::euclid}) {
    const std::string id = std::string("metric_") + std::string(to_string(metric));
    auto c = env.collection(model(id, 2, AggregationType::min, metric));
    REQUIRE(c->insert({object("near", {part({2, 0})}), object("far", {part({-2, 0})})}).has_value());
    auto r = c->find_similarities(std::vector<float>{1, 0}, {});
    REQUIRE(ids_of(*r) == std::vector<std::string>{"near", "far"});
    REQUIRE(*r->found_objects[0].distance < *r->found_objects[1].distance);
  }
}

TEST_CASE("average_only scores only average parts", "[collection][search]") {
  memory_db env;
  auto c = env.collection(model("avg_only"));
  REQUIRE(c->insert({object("a", {part(at_angle(0), "chunk"), part(at_angle(80), "mean", true)}),
                     object("b", {part(at_angle(30), "mean", true)})})
              .has_value());
  SimilarityParams p;
  REQUIRE(ids_of(*c->find_similarities(at_angle(0), p)) == std::vector<std::string>{"a", "b"});
  p.average_only = true;
  REQUIRE(ids_of(*c->find_similarities(at_angle(0), p)) == std::vector<std::string>{"b", "a"});
}

TEST_CASE("ties are broken by object id", "[collection][search]") {
  memory_db env;
  auto c = env.collection(model("ties"));
  REQUIRE(c->insert({object("z", {part({1, 0})}), object("m", {part({1, 0})}), object("a", {part({1, 0})})})
              .has_value());
  REQUIRE(ids_of(*c->find_similarities(std::vector<float>{1, 0}, {})) == std::vector<std::string>{"a", "m", "z"});
}

TEST_CASE("create_index marks the collection", "[collection]") {
  memory_db env;
  auto c = env.collection(model("indexed"));
  REQUIRE_FALSE(c->get_info()->index_created);
  REQUIRE(c->create_index().has_value());
  REQUIRE(c->create_index().has_value());
  REQUIRE(c->get_info()->index_created);
  REQUIRE(env.objects->has_vector_index("indexed"));
  REQUIRE(c->analyze().has_value());
}

TEST_CASE("query collection lookup by session", "[collection][query]") {
  memory_db env;
  auto q = env.db->create_query_collection(model("sessions"));
  REQUIRE(q.has_value());
  REQUIRE((*q)->collection_id() == "sessions_q");
  auto query = object("q1", {part({1, 0})});
  query.session_id = "s-1";
  REQUIRE((*q)->insert({query}).has_value());

  auto hit = (*q)->find_by_session_id("s-1");
  REQUIRE(hit->has_value());
  REQUIRE((*hit)->object_id == "q1");
  REQUIRE_FALSE((*q)->find_by_session_id("s-2")->has_value());
  REQUIRE((*q)->get_state_info()->contains_queries);
}

TEST_CASE("invalid object ids and filters are rejected before writing", "[collection]") {
  memory_db env;
  auto c = env.collection(model("validation"));
  REQUIRE(c->insert({object("", {part({1, 0})})}).error().code == core::error_code::invalid_argument);
  REQUIRE(c->insert({object(std::string(129, 'x'), {part({1, 0})})}).error().code ==
          core::error_code::invalid_argument);
  REQUIRE(c->insert({object("dup", {part({1, 0})}), object("dup", {part({1, 0})})}).error().code ==
          core::error_code::invalid_argument);
  REQUIRE(*c->get_total(false) == 0);

  PayloadSearchParams p;
  p.sort_by = SortByOptions{"payload", SortOrder::asc, true};
  REQUIRE(c->find_by_payload_filter(p).error().code == core::error_code::invalid_argument);
  p.sort_by.reset();
  p.payload_filter = PayloadFilter{TermQuery{"nope", Value("x"), true}};
  REQUIRE(c->find_by_payload_filter(p).error().code == core::error_code::invalid_argument);
}
