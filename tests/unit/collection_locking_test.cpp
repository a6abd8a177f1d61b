#include <catch2/catch_all.hpp>

#include <atomic>
#include <thread>

#include "collection_fixtures.hpp"

using namespace embdb;
using namespace collection_fixtures;

TEST_CASE("writes give up after bounded lock retries", "[collection][lock]") {
  memory_db env;
  auto c = env.collection(model("locked"));
  REQUIRE(c->insert({object("a", {part({1, 0})}), object("b", {part({0, 1})})}).has_value());

  auto holder = env.objects->begin("locked");
  REQUIRE(holder.has_value());
  REQUIRE((*holder)->lock_objects({"b"}).has_value());

  auto removed = c->remove({"a", "b"});
  REQUIRE_FALSE(removed.has_value());
  REQUIRE(removed.error().code == core::error_code::lock_acquisition_failed);
  REQUIRE(core::is_retryable(removed.error()));
  // nothing was deleted, including the unlocked id
  REQUIRE(c->find_by_ids({"a", "b"})->size() == 2);

  auto upserted = c->upsert({object("b", {part({1, 1})})});
  REQUIRE(upserted.error().code == core::error_code::lock_acquisition_failed);

  // ids that do not exist yet are locked too
  REQUIRE((*holder)->lock_objects({"new"}).has_value());
  REQUIRE(c->insert({object("new", {part({1, 0})})}).error().code == core::error_code::lock_acquisition_failed);

  (*holder)->rollback();
  REQUIRE(c->remove({"a", "b"}).has_value());
  REQUIRE(c->find_by_ids({"a", "b"})->empty());
}

TEST_CASE("a released lock lets a retry succeed", "[collection][lock]") {
  CollectionOptions slow;
  slow.lock_max_attempts = 50;
  slow.lock_wait = std::chrono::milliseconds(5);
  memory_db env(slow);
  auto c = env.collection(model("retry"));
  REQUIRE(c->insert({object("a", {part({1, 0})})}).has_value());

  auto holder = env.objects->begin("retry");
  REQUIRE((*holder)->lock_objects({"a"}).has_value());
  std::thread release([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    (*holder)->rollback();
  });
  auto ok = c->upsert({object("a", {part({0, 1})})});
  release.join();
  REQUIRE(ok.has_value());
  REQUIRE(c->find_by_ids({"a"})->front().parts[0].vector == std::vector<float>{0, 1});
}

TEST_CASE("concurrent overlapping deletes never interleave", "[collection][lock]") {
  memory_db env;
  auto c = env.collection(model("contended"));
  for (int round = 0; round < 20; ++round) {
    std::vector<Object> objects;
    for (int i = 0; i < 50; ++i) objects.push_back(object("o" + std::to_string(i), {part({1, 0})}));
    REQUIRE(c->upsert(objects).has_value());

    std::vector<std::string> first, second;
    for (int i = 0; i < 40; ++i) first.push_back("o" + std::to_string(i));
    for (int i = 10; i < 50; ++i) second.push_back("o" + std::to_string(i));

    std::atomic<bool> go{false};
    std::expected<void, core::error> r1, r2;
    std::thread t1([&] {
      while (!go.load()) std::this_thread::yield();
      r1 = c->remove(first);
    });
    std::thread t2([&] {
      while (!go.load()) std::this_thread::yield();
      r2 = c->remove(second);
    });
    go.store(true);
    t1.join();
    t2.join();

    REQUIRE((r1.has_value() || r2.has_value()));
    for (const auto* r : {&r1, &r2}) {
      if (!r->has_value()) REQUIRE(r->error().code == core::error_code::lock_acquisition_failed);
    }
    // each delete is all-or-nothing
    const std::size_t expected_left = (r1 && r2) ? 0 : 10;
    REQUIRE(*c->get_total() == expected_left);
  }
}
