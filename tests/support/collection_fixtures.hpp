#pragma once

/** \file collection_fixtures.hpp
 *  \brief Test-only builders for models, objects and in-memory VectorDb instances.
 */

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_all.hpp>

#include "embdb/store/document_store.hpp"
#include "embdb/store/memory_object_store.hpp"
#include "embdb/vectordb.hpp"

namespace collection_fixtures {

inline auto model(std::string id, std::uint32_t dims = 2,
                  embdb::AggregationType agg = embdb::AggregationType::min,
                  embdb::MetricType metric = embdb::MetricType::cosine) -> embdb::EmbeddingModelInfo {
  embdb::EmbeddingModelInfo m;
  m.name = "test-model";
  m.id = std::move(id);
  m.index.dimensions = dims;
  m.index.metric = metric;
  m.index.aggregation = agg;
  return m;
}

inline auto part(std::vector<float> v, std::string id = {}, bool is_average = false) -> embdb::ObjectPart {
  return embdb::ObjectPart{std::move(id), std::move(v), is_average};
}

inline auto object(std::string id, std::vector<embdb::ObjectPart> parts,
                   embdb::Value payload = embdb::Value::empty_map()) -> embdb::Object {
  embdb::Object o;
  o.object_id = std::move(id);
  o.payload = std::move(payload);
  o.parts = std::move(parts);
  return o;
}

/** Personalized copy of `original_id` owned by `user_id`. */
inline auto personalized(std::string id, std::string original_id, std::string user_id,
                         std::vector<embdb::ObjectPart> parts) -> embdb::Object {
  auto o = object(std::move(id), std::move(parts));
  o.original_id = std::move(original_id);
  o.user_id = std::move(user_id);
  return o;
}

/** Unit vector at `degrees` from the x axis. */
inline auto at_angle(double degrees) -> std::vector<float> {
  const double r = degrees * 3.14159265358979323846 / 180.0;
  return {static_cast<float>(std::cos(r)), static_cast<float>(std::sin(r))};
}

/** 2-d unit vector whose cosine distance to (1, 0) is `d`. */
inline auto at_cosine_distance(double d) -> std::vector<float> {
  const double c = 1.0 - d;
  return {static_cast<float>(c), static_cast<float>(std::sqrt(1.0 - c * c))};
}

struct memory_db {
  std::shared_ptr<embdb::store::MemoryObjectStore> objects = std::make_shared<embdb::store::MemoryObjectStore>();
  std::shared_ptr<embdb::store::MemoryDocumentStore> documents = std::make_shared<embdb::store::MemoryDocumentStore>();
  std::unique_ptr<embdb::VectorDb> db;

  explicit memory_db(embdb::CollectionOptions options = fast_locks(), std::string db_id = "test_db") {
    auto created = embdb::VectorDb::create(objects, documents, std::move(db_id), options);
    REQUIRE(created.has_value());
    db = std::move(*created);
  }

  static auto fast_locks() -> embdb::CollectionOptions {
    embdb::CollectionOptions o;
    o.lock_max_attempts = 2;
    o.lock_wait = std::chrono::milliseconds(1);
    return o;
  }

  auto collection(const embdb::EmbeddingModelInfo& m) -> std::shared_ptr<embdb::Collection> {
    auto c = db->create_collection(m);
    REQUIRE(c.has_value());
    return *c;
  }
};

inline auto ids_of(const embdb::SearchResults& r) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& f : r.found_objects) out.push_back(f.object_id);
  return out;
}

inline auto part_ids_of(const embdb::Object& o) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& p : o.parts) out.push_back(p.part_id);
  return out;
}

inline auto part_ids_of(const embdb::FoundObject& f) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& p : f.parts) out.push_back(p.part_id);
  return out;
}

} // namespace collection_fixtures
