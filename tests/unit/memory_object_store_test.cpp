#include <catch2/catch_all.hpp>

#include <limits>

#include <embdb/query_compiler.hpp>
#include <embdb/store/memory_object_store.hpp>

#include "collection_fixtures.hpp"

using namespace embdb;
using namespace collection_fixtures;
using store::MemoryObjectStore;

namespace {

auto make_store(const std::string& id = "c1") -> std::shared_ptr<MemoryObjectStore> {
  auto s = std::make_shared<MemoryObjectStore>();
  SearchIndexInfo index;
  index.dimensions = 2;
  REQUIRE(s->create_tables(id, index).has_value());
  return s;
}

void commit_objects(store::ObjectStore& s, const std::vector<Object>& objects, const std::string& id = "c1") {
  auto txn = s.begin(id);
  REQUIRE(txn.has_value());
  REQUIRE((*txn)->insert_objects(objects).has_value());
  REQUIRE((*txn)->insert_parts(objects).has_value());
  REQUIRE((*txn)->commit().has_value());
}

} // namespace

TEST_CASE("memory store requires allocated tables", "[store][memory]") {
  MemoryObjectStore s;
  auto txn = s.begin("nope");
  REQUIRE_FALSE(txn.has_value());
  REQUIRE(txn.error().code == core::error_code::collection_not_found);
  REQUIRE_FALSE(s.count("nope", true).has_value());
  REQUIRE(s.drop_tables("nope").has_value());
}

TEST_CASE("uncommitted writes are invisible and rollback discards them", "[store][memory][txn]") {
  auto s = make_store();
  {
    auto txn = s->begin("c1");
    REQUIRE(txn.has_value());
    const std::vector<Object> objs{object("a", {part({1, 0}, "a_0")})};
    REQUIRE((*txn)->insert_objects(objs).has_value());
    REQUIRE((*txn)->insert_parts(objs).has_value());
    REQUIRE(*s->count("c1", false) == 0);
  }
  REQUIRE(*s->count("c1", false) == 0);

  commit_objects(*s, {object("a", {part({1, 0}, "a_0")})});
  auto found = s->find_by_ids("c1", {"a", "a", "missing"});
  REQUIRE(found->size() == 1);
  REQUIRE(found->front().parts.size() == 1);
}

TEST_CASE("duplicate objects and parts are rejected", "[store][memory][txn]") {
  auto s = make_store();
  commit_objects(*s, {object("a", {part({1, 0}, "a_0")})});

  auto txn = s->begin("c1");
  auto dup = (*txn)->insert_objects({object("a", {})});
  REQUIRE_FALSE(dup.has_value());
  REQUIRE(dup.error().code == core::error_code::already_exists);

  auto dup_part = (*txn)->insert_parts({object("a", {part({0, 1}, "a_0")})});
  REQUIRE(dup_part.error().code == core::error_code::already_exists);

  REQUIRE((*txn)->upsert_parts({object("a", {part({0, 1}, "a_0"), part({1, 1}, "a_1")})}).has_value());
  REQUIRE((*txn)->commit().has_value());
  const auto a = s->find_by_ids("c1", {"a"})->front();
  REQUIRE(a.parts.size() == 2);
  REQUIRE(a.parts[0].vector == std::vector<float>{0, 1});
  REQUIRE_FALSE((*txn)->commit().has_value());
}

TEST_CASE("row locks are exclusive NOWAIT and released at commit", "[store][memory][lock]") {
  auto s = make_store();
  auto t1 = s->begin("c1");
  auto t2 = s->begin("c1");
  REQUIRE((*t1)->lock_objects({"a", "b"}).has_value());

  auto conflict = (*t2)->lock_objects({"c", "b"});
  REQUIRE_FALSE(conflict.has_value());
  REQUIRE(conflict.error().code == core::error_code::lock_not_available);
  // all-or-nothing: "c" was not taken by t2
  auto t3 = s->begin("c1");
  REQUIRE((*t3)->lock_objects({"c"}).has_value());
  (*t3)->rollback();

  REQUIRE((*t1)->lock_objects({"a"}).has_value());
  REQUIRE((*t1)->commit().has_value());
  REQUIRE((*t2)->lock_objects({"b"}).has_value());
}

TEST_CASE("locks are scoped to a collection", "[store][memory][lock]") {
  auto s = make_store("c1");
  SearchIndexInfo index;
  index.dimensions = 2;
  REQUIRE(s->create_tables("c2", index).has_value());
  auto t1 = s->begin("c1");
  auto t2 = s->begin("c2");
  REQUIRE((*t1)->lock_objects({"a"}).has_value());
  REQUIRE((*t2)->lock_objects({"a"}).has_value());
}

TEST_CASE("visibility shadows customized canonical objects", "[store][memory][search]") {
  auto s = make_store();
  commit_objects(*s, {object("a", {part({1, 0})}), object("b", {part({0, 1})}),
                      personalized("a_u1", "a", "u1", {part({1, 0})}),
                      personalized("x_u2", "x", "u2", {part({1, 0})})});

  store::PayloadPlan plan;
  plan.limit = 10;
  REQUIRE(ids_of(*s->payload_search("c1", plan)) == std::vector<std::string>{"a", "b"});

  plan.user_id = "u1";
  REQUIRE(ids_of(*s->payload_search("c1", plan)) == std::vector<std::string>{"b", "a_u1"});

  REQUIRE(*s->count("c1", true) == 2);
  REQUIRE(*s->count("c1", false) == 4);
  REQUIRE(s->find_by_original_ids("c1", {"a"})->size() == 1);
}

TEST_CASE("similarity search ranks, filters and pages", "[store][memory][search]") {
  auto s = make_store();
  std::vector<Object> objects;
  for (int i = 0; i < 6; ++i) {
    objects.push_back(object("o" + std::to_string(i), {part(at_angle(10.0 * i))},
                             Value::map({{"even", i % 2 == 0}})));
  }
  commit_objects(*s, objects);

  store::SimilarityPlan plan;
  plan.query = at_angle(0);
  plan.limit = 2;
  auto page = s->similarity_search("c1", plan);
  REQUIRE(page.has_value());
  REQUIRE(ids_of(*page) == std::vector<std::string>{"o0", "o1"});
  REQUIRE(page->next_offset == 2u);
  REQUIRE(page->subset_count == 6u);
  REQUIRE(page->found_objects[0].parts[0].vector.empty());

  plan.filter = *compile(filters::term("even", true));
  plan.offset = 2;
  auto filtered = s->similarity_search("c1", plan);
  REQUIRE(ids_of(*filtered) == std::vector<std::string>{"o4"});
  REQUIRE_FALSE(filtered->next_offset.has_value());
  REQUIRE(filtered->subset_count == 3u);

  plan.query = {1.0f, 0.0f, 0.0f};
  auto bad = s->similarity_search("c1", plan);
  REQUIRE(bad.error().code == core::error_code::dimension_mismatch);
}

TEST_CASE("common data batches follow insertion order", "[store][memory]") {
  auto s = make_store();
  commit_objects(*s, {object("z", {part({1, 0})}), object("a", {part({1, 0})}),
                      personalized("p", "z", "u", {part({1, 0})}), object("m", {part({1, 0})})});
  auto page = s->common_data_batch("c1", 2, 1, true);
  REQUIRE(page->size() == 2);
  REQUIRE((*page)[0].object_id == "a");
  REQUIRE((*page)[1].object_id == "m");
  REQUIRE(s->common_data_batch("c1", 10, 0, false)->size() == 4);
}

TEST_CASE("delete removes rows and their parts", "[store][memory]") {
  auto s = make_store();
  commit_objects(*s, {object("a", {part({1, 0})}), object("b", {part({0, 1})})});
  auto txn = s->begin("c1");
  REQUIRE((*txn)->delete_objects({"a", "ghost"}).has_value());
  REQUIRE((*txn)->commit().has_value());
  REQUIRE(s->find_by_ids("c1", {"a"})->empty());
  REQUIRE(*s->count("c1", false) == 1);

  REQUIRE_FALSE(s->has_vector_index("c1"));
  REQUIRE(s->create_vector_index("c1", SearchIndexInfo{}).has_value());
  REQUIRE(s->has_vector_index("c1"));
}

TEST_CASE("delete and reinsert churn reclaims row slots", "[store][memory]") {
  auto s = make_store();
  commit_objects(*s, {object("first", {part({1, 0})}), personalized("mine", "first", "u", {part({0, 1})})});
  auto churn = [&](int rounds) {
    for (int i = 0; i < rounds; ++i) {
      commit_objects(*s, {object("tmp", {part({1, 1})})});
      auto txn = s->begin("c1");
      REQUIRE((*txn)->delete_parts({"tmp"}).has_value());
      REQUIRE((*txn)->delete_objects({"tmp"}).has_value());
      REQUIRE((*txn)->commit().has_value());
    }
  };
  churn(3000);
  commit_objects(*s, {object("second", {part({1, 0})})});
  churn(3000);

  REQUIRE(s->allocated_rows("c1") <= 1100);
  REQUIRE(*s->count("c1", false) == 3);
  auto order = s->common_data_batch("c1", 10, 0, false);
  REQUIRE(order->size() == 3);
  REQUIRE((*order)[0].object_id == "first");
  REQUIRE((*order)[1].object_id == "mine");
  REQUIRE((*order)[2].object_id == "second");

  store::PayloadPlan plan;
  plan.user_id = "u";
  REQUIRE(ids_of(*s->payload_search("c1", plan)) == std::vector<std::string>{"mine", "second"});
  REQUIRE(s->find_by_ids("c1", {"second"})->size() == 1);
}

TEST_CASE("a limit of SIZE_MAX returns the rest of the results", "[store][memory][search]") {
  auto s = make_store();
  commit_objects(*s, {object("a", {part(at_angle(0))}), object("b", {part(at_angle(10))}),
                      object("c", {part(at_angle(20))})});

  store::SimilarityPlan similar;
  similar.query = at_angle(0);
  similar.offset = 1;
  similar.limit = std::numeric_limits<std::size_t>::max();
  auto hits = s->similarity_search("c1", similar);
  REQUIRE(ids_of(*hits) == std::vector<std::string>{"b", "c"});
  REQUIRE_FALSE(hits->next_offset.has_value());

  store::PayloadPlan payload;
  payload.offset = 1;
  payload.limit = std::numeric_limits<std::size_t>::max();
  REQUIRE(ids_of(*s->payload_search("c1", payload)) == std::vector<std::string>{"b", "c"});

  REQUIRE(store::page_next_offset(5, 5, std::numeric_limits<std::size_t>::max() - 1) ==
          std::numeric_limits<std::size_t>::max());
}
