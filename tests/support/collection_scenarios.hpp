#pragma once

/** \file collection_scenarios.hpp
 *  \brief Backend-independent Collection scenarios shared by the memory and pgvector suites.
 *
 * Each scenario creates its own collection named `<prefix>_<scenario>` in the given VectorDb.
 */

#include <algorithm>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "collection_fixtures.hpp"

namespace collection_scenarios {

using namespace collection_fixtures;
using embdb::AggregationType;
using embdb::MetricType;
using embdb::Value;

inline auto create(embdb::VectorDb& db, const embdb::EmbeddingModelInfo& m) -> std::shared_ptr<embdb::Collection> {
  auto c = db.create_collection(m);
  REQUIRE(c.has_value());
  return *c;
}

inline void dimension_invariant(embdb::VectorDb& db, const std::string& prefix) {
  auto c = create(db, model(prefix + "_dims", 3));
  auto bad = c->insert({object("ok", {part({1, 0, 0})}), object("bad", {part({1, 0, 0, 0})})});
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == embdb::core::error_code::dimension_mismatch);
  REQUIRE(*c->get_total() == 0);

  REQUIRE(c->insert({object("short", {part({1, 0})})}).error().code == embdb::core::error_code::dimension_mismatch);
  REQUIRE(c->find_similarities(std::vector<float>{1, 0}, {}).error().code ==
          embdb::core::error_code::dimension_mismatch);

  REQUIRE(c->insert({object("ok", {part({1, 0, 0})})}).has_value());
  const auto stored = c->find_by_ids({"ok"});
  REQUIRE(stored->size() == 1);
  for (const auto& p : stored->front().parts) REQUIRE(p.vector.size() == 3);
}

inline void upsert_shrink(embdb::VectorDb& db, const std::string& prefix) {
  auto c = create(db, model(prefix + "_shrink"));
  REQUIRE(c->insert({object("O", {part({1, 0}, "p0"), part({0, 1}, "p1")})}).has_value());

  REQUIRE(c->upsert({object("O", {part({1, 1}, "p2")})}, true).has_value());
  REQUIRE(part_ids_of(c->find_by_ids({"O"})->front()) == std::vector<std::string>{"p2"});

  REQUIRE(c->upsert({object("O", {part({1, 0}, "p0"), part({0, 1}, "p1")})}, true).has_value());
  REQUIRE(c->upsert({object("O", {part({1, 1}, "p2")}, Value::map({{"v", 2}}))}, false).has_value());
  const auto merged = c->find_by_ids({"O"})->front();
  auto ids = part_ids_of(merged);
  std::sort(ids.begin(), ids.end());
  REQUIRE(ids == std::vector<std::string>{"p0", "p1", "p2"});
  REQUIRE(*merged.payload.find("v") == Value(2));

  // default part ids
  REQUIRE(c->insert({object("N", {part({1, 0}), part({0, 1})})}).has_value());
  auto n_ids = part_ids_of(c->find_by_ids({"N"})->front());
  std::sort(n_ids.begin(), n_ids.end());
  REQUIRE(n_ids == std::vector<std::string>{"N_0", "N_1"});

  auto dup = c->insert({object("O", {part({1, 0})})});
  REQUIRE(dup.error().code == embdb::core::error_code::already_exists);
  REQUIRE(c->insert({object("X", {part({1, 0}, "a"), part({0, 1}, "a")})}).error().code ==
          embdb::core::error_code::invalid_argument);
}

inline void aggregation(embdb::VectorDb& db, const std::string& prefix) {
  using Catch::Approx;
  for (auto agg : {AggregationType::min, AggregationType::avg}) {
    auto c = create(db, model(prefix + (agg == AggregationType::min ? "_aggmin" : "_aggavg"), 2, agg));
    REQUIRE(c->insert({object("O", {part(at_cosine_distance(0.1)), part(at_cosine_distance(0.9))})}).has_value());
    auto r = c->find_similarities(std::vector<float>{1, 0}, {});
    REQUIRE(r.has_value());
    REQUIRE(r->found_objects.size() == 1);
    const double expected = agg == AggregationType::min ? 0.1 : 0.5;
    REQUIRE(*r->found_objects[0].distance == Approx(expected).margin(1e-5));
    REQUIRE(r->found_objects[0].parts_found == 2);

    embdb::SimilarityParams tight;
    tight.max_distance = 0.3;
    auto within = c->find_similarities(std::vector<float>{1, 0}, tight);
    if (agg == AggregationType::min) {
      REQUIRE(within->found_objects.size() == 1);
      REQUIRE(within->found_objects[0].parts_found == 1);
    } else {
      REQUIRE(within->found_objects.empty());
    }
  }
}

inline void shadowing(embdb::VectorDb& db, const std::string& prefix) {
  auto c = create(db, model(prefix + "_shadow"));
  REQUIRE(c->insert({object("A", {part(at_angle(5))}), object("B", {part(at_angle(40))}),
                     personalized("A_u", "A", "u", {part(at_angle(10))}),
                     personalized("B_v", "B", "v", {part(at_angle(0))})})
              .has_value());

  embdb::SimilarityParams as_u;
  as_u.user_id = "u";
  auto for_u = c->find_similarities(at_angle(0), as_u);
  REQUIRE(ids_of(*for_u) == std::vector<std::string>{"A_u", "B"});
  REQUIRE(for_u->found_objects[0].original_id == std::optional<std::string>("A"));

  auto anonymous = c->find_similarities(at_angle(0), {});
  REQUIRE(ids_of(*anonymous) == std::vector<std::string>{"A", "B"});

  embdb::PayloadSearchParams payload_u;
  payload_u.user_id = "u";
  REQUIRE(ids_of(*c->find_by_payload_filter(payload_u)) == std::vector<std::string>{"B", "A_u"});

  REQUIRE(*c->get_total() == 2);
  REQUIRE(*c->get_total(false) == 4);
  REQUIRE(c->find_by_original_ids({"A", "B"})->size() == 2);
}

inline void pagination(embdb::VectorDb& db, const std::string& prefix) {
  auto c = create(db, model(prefix + "_pages"));
  std::vector<embdb::Object> objects;
  for (int i = 0; i < 25; ++i) {
    objects.push_back(object("obj" + std::to_string(i), {part(at_angle(i))}, Value::map({{"i", i}})));
  }
  REQUIRE(c->insert(objects).has_value());

  std::set<std::string> seen;
  std::optional<std::size_t> last_next;
  for (std::size_t offset : {0u, 10u, 20u}) {
    embdb::PayloadSearchParams p;
    p.limit = 10;
    p.offset = offset;
    auto page = c->find_by_payload_filter(p);
    REQUIRE(page.has_value());
    for (const auto& id : ids_of(*page)) REQUIRE(seen.insert(id).second);
    last_next = page->next_offset;
    if (offset < 20) REQUIRE(page->next_offset == offset + 10);
  }
  REQUIRE(seen.size() == 25);
  REQUIRE_FALSE(last_next.has_value());

  auto batch = c->get_objects_common_data_batch(10, 20);
  REQUIRE(batch->objects.size() == 5);
  REQUIRE(batch->total == 25);
  REQUIRE_FALSE(batch->next_offset.has_value());
  REQUIRE(batch->objects.front().object_id == "obj20");

  embdb::SimilarityParams sp;
  sp.limit = 10;
  sp.offset = 20;
  auto similar = c->find_similarities(at_angle(0), sp);
  REQUIRE(ids_of(*similar).front() == "obj20");
  REQUIRE(similar->subset_count == 25u);
  REQUIRE_FALSE(similar->next_offset.has_value());
}

inline void filtered_search(embdb::VectorDb& db, const std::string& prefix) {
  namespace f = embdb::filters;
  auto c = create(db, model(prefix + "_filtered"));
  std::vector<embdb::Object> objects;
  for (int i = 0; i < 10; ++i) {
    objects.push_back(object("o" + std::to_string(i), {part(at_angle(5 * i))},
                             Value::map({{"kind", i < 8 ? "common" : "rare"}, {"price", 10 * i},
                                         {"title", "item number " + std::to_string(i)}})));
  }
  REQUIRE(c->insert(objects).has_value());

  embdb::SimilarityParams exact;
  exact.limit = 2;
  exact.payload_filter = f::term("kind", "rare");
  auto exact_hits = c->find_similarities(at_angle(0), exact);
  REQUIRE(ids_of(*exact_hits) == std::vector<std::string>{"o8", "o9"});
  REQUIRE(exact_hits->subset_count == 2u);

  // window = (0 + 1) * 4 closest candidates, none of which is rare
  embdb::SimilarityParams first = exact;
  first.limit = 1;
  first.similarity_first = true;
  auto first_hits = c->find_similarities(at_angle(0), first);
  REQUIRE(first_hits->found_objects.empty());
  REQUIRE(first_hits->subset_count == 0u);

  embdb::PayloadSearchParams by_price;
  by_price.payload_filter = f::range("price", {.gte = 30, .lt = 60});
  by_price.sort_by = embdb::SortByOptions{"price", embdb::SortOrder::desc};
  REQUIRE(ids_of(*c->find_by_payload_filter(by_price)) == std::vector<std::string>{"o5", "o4", "o3"});

  embdb::PayloadSearchParams by_id;
  by_id.limit = 3;
  by_id.sort_by = embdb::SortByOptions{"object_id", embdb::SortOrder::desc, true};
  REQUIRE(ids_of(*c->find_by_payload_filter(by_id)) == std::vector<std::string>{"o9", "o8", "o7"});

  REQUIRE(*c->count_by_payload_filter(f::match("title", "NUMBER 3")) == 1);
  REQUIRE(*c->count_by_payload_filter(std::nullopt) == 10);

  embdb::PayloadSearchParams with_vectors;
  with_vectors.payload_filter = f::column_term("object_id", "o1");
  with_vectors.with_vectors = true;
  auto hydrated = c->find_by_payload_filter(with_vectors);
  REQUIRE(hydrated->found_objects.size() == 1);
  REQUIRE(hydrated->found_objects[0].parts[0].vector.size() == 2);
}

/** Hits within max_distance ordered by a payload field, then by distance. */
inline void sorted_similarity(embdb::VectorDb& db, const std::string& prefix) {
  auto c = create(db, model(prefix + "_simsort"));
  REQUIRE(c->insert({object("near", {part(at_angle(0))}, Value::map({{"price", 30}})),
                     object("mid", {part(at_angle(20))}, Value::map({{"price", 10}})),
                     object("far", {part(at_angle(40))}, Value::map({{"price", 20}})),
                     object("unpriced", {part(at_angle(5))}),
                     object("outside", {part(at_angle(90))}, Value::map({{"price", 1}}))})
              .has_value());

  embdb::SimilarityParams p;
  p.max_distance = 0.3;
  p.sort_by = embdb::SortByOptions{"price", embdb::SortOrder::asc};
  auto asc = c->find_similarities(at_angle(0), p);
  REQUIRE(asc.has_value());
  REQUIRE(ids_of(*asc) == std::vector<std::string>{"mid", "far", "near", "unpriced"});
  REQUIRE(asc->subset_count == 5u);

  p.sort_by->order = embdb::SortOrder::desc;
  REQUIRE(ids_of(*c->find_similarities(at_angle(0), p)) == std::vector<std::string>{"near", "far", "mid", "unpriced"});

  p.limit = 2;
  p.offset = 1;
  auto page = c->find_similarities(at_angle(0), p);
  REQUIRE(ids_of(*page) == std::vector<std::string>{"far", "mid"});
  REQUIRE(page->next_offset == 3u);

  p.sort_by = embdb::SortByOptions{"object_id", embdb::SortOrder::asc, true};
  p.limit = 10;
  p.offset = 0;
  REQUIRE(ids_of(*c->find_similarities(at_angle(0), p)) ==
          std::vector<std::string>{"far", "mid", "near", "unpriced"});

  // similarity_first keeps distance order
  p.similarity_first = true;
  REQUIRE(ids_of(*c->find_similarities(at_angle(0), p)) ==
          std::vector<std::string>{"near", "unpriced", "mid", "far"});

  p.similarity_first = false;
  p.sort_by = embdb::SortByOptions{"payload", embdb::SortOrder::asc, true};
  REQUIRE(c->find_similarities(at_angle(0), p).error().code == embdb::core::error_code::invalid_argument);
}

/** A hit lists the parts within max_distance, closest first. */
inline void matched_parts(embdb::VectorDb& db, const std::string& prefix) {
  using Catch::Approx;
  auto c = create(db, model(prefix + "_matched"));
  REQUIRE(c->insert({object("doc", {part(at_cosine_distance(0.6), "intro"), part(at_cosine_distance(0.05), "body"),
                                    part(at_cosine_distance(0.2), "summary")})})
              .has_value());

  auto all = c->find_similarities(std::vector<float>{1, 0}, {});
  REQUIRE(all->found_objects.size() == 1);
  REQUIRE(part_ids_of(all->found_objects[0]) == std::vector<std::string>{"body", "summary", "intro"});
  REQUIRE(all->found_objects[0].parts_found == 3);

  embdb::SimilarityParams tight;
  tight.max_distance = 0.3;
  tight.with_vectors = true;
  auto within = c->find_similarities(std::vector<float>{1, 0}, tight);
  REQUIRE(within->found_objects.size() == 1);
  const auto& hit = within->found_objects[0];
  REQUIRE(part_ids_of(hit) == std::vector<std::string>{"body", "summary"});
  REQUIRE(hit.parts_found == 2);
  REQUIRE(hit.parts[0].vector.size() == 2);
  REQUIRE(hit.parts[0].vector[0] == Approx(0.95).margin(1e-5));

  // payload search still returns every part
  embdb::PayloadSearchParams everything;
  REQUIRE(c->find_by_payload_filter(everything)->found_objects[0].parts.size() == 3);
}

/** A store failure part way through a batch leaves no row of that batch behind. */
inline void batch_rollback(embdb::VectorDb& db, const std::string& prefix) {
  auto c = create(db, model(prefix + "_rollback"));
  REQUIRE(c->insert({object("existing", {part({1, 0}, "keep")})}).has_value());

  auto failed = c->insert({object("fresh", {part({0, 1})}), object("existing", {part({0, 1}, "other")})});
  REQUIRE_FALSE(failed.has_value());
  REQUIRE(failed.error().code == embdb::core::error_code::already_exists);

  REQUIRE(c->find_by_ids({"fresh"})->empty());
  const auto existing = c->find_by_ids({"existing"})->front();
  REQUIRE(part_ids_of(existing) == std::vector<std::string>{"keep"});
  REQUIRE(existing.parts[0].vector == std::vector<float>{1, 0});
  REQUIRE(*c->get_total(false) == 1);
}

inline void non_finite(embdb::VectorDb& db, const std::string& prefix) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();
  auto c = create(db, model(prefix + "_finite"));
  auto bad = c->insert({object("ok", {part({1, 0})}), object("nan", {part({nan, 0})})});
  REQUIRE(bad.error().code == embdb::core::error_code::invalid_argument);
  REQUIRE(c->upsert({object("inf", {part({1, inf})})}).error().code == embdb::core::error_code::invalid_argument);
  REQUIRE(*c->get_total(false) == 0);

  REQUIRE(c->insert({object("ok", {part({1, 0})})}).has_value());
  REQUIRE(c->find_similarities(std::vector<float>{nan, 0}, {}).error().code ==
          embdb::core::error_code::invalid_argument);
  REQUIRE(c->find_similarities(std::vector<float>{-inf, 1}, {}).error().code ==
          embdb::core::error_code::invalid_argument);

  embdb::SimilarityParams p;
  p.max_distance = std::numeric_limits<double>::quiet_NaN();
  REQUIRE(c->find_similarities(std::vector<float>{1, 0}, p).error().code == embdb::core::error_code::invalid_argument);
}

/** Limits near SIZE_MAX page like "everything after offset". */
inline void huge_limits(embdb::VectorDb& db, const std::string& prefix) {
  constexpr std::size_t kAll = std::numeric_limits<std::size_t>::max();
  auto c = create(db, model(prefix + "_huge"));
  REQUIRE(c->insert({object("a", {part(at_angle(0))}), object("b", {part(at_angle(10))}),
                     object("c", {part(at_angle(20))})})
              .has_value());

  embdb::SimilarityParams sp;
  sp.offset = 1;
  sp.limit = kAll;
  auto similar = c->find_similarities(at_angle(0), sp);
  REQUIRE(ids_of(*similar) == std::vector<std::string>{"b", "c"});
  REQUIRE_FALSE(similar->next_offset.has_value());

  sp.similarity_first = true;
  REQUIRE(ids_of(*c->find_similarities(at_angle(0), sp)) == std::vector<std::string>{"b", "c"});

  embdb::PayloadSearchParams pp;
  pp.offset = 1;
  pp.limit = kAll;
  REQUIRE(ids_of(*c->find_by_payload_filter(pp)) == std::vector<std::string>{"b", "c"});

  auto batch = c->get_objects_common_data_batch(kAll, 1);
  REQUIRE(batch->objects.size() == 2);
  REQUIRE_FALSE(batch->next_offset.has_value());
}

inline void removal(embdb::VectorDb& db, const std::string& prefix) {
  auto c = create(db, model(prefix + "_remove"));
  REQUIRE(c->insert({object("a", {part({1, 0})}), object("b", {part({0, 1})})}).has_value());
  REQUIRE(c->remove({"a", "a", "ghost"}).has_value());
  REQUIRE(c->find_by_ids({"a", "b"})->size() == 1);
  REQUIRE(ids_of(*c->find_similarities(std::vector<float>{1, 0}, {})) == std::vector<std::string>{"b"});
  REQUIRE(c->remove({}).has_value());
}

} // namespace collection_scenarios
