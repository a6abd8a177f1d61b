/** \file collection_search_bench.cpp
 *  \brief Similarity and payload search over the in-memory object store.
 */

#include <benchmark/benchmark.h>

#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "embdb/collection.hpp"
#include "embdb/store/document_store.hpp"
#include "embdb/store/memory_object_store.hpp"
#include "embdb/vectordb.hpp"

using namespace embdb;

namespace {

constexpr std::uint32_t kDim = 64;
constexpr std::size_t kPartsPerObject = 3;

std::vector<float> random_vector(std::mt19937& gen) {
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> v(kDim);
    for (auto& x : v) x = dist(gen);
    return v;
}

struct Fixture {
    std::unique_ptr<VectorDb> db;
    std::shared_ptr<Collection> collection;
    std::vector<float> query;
};

// Populated once per object count; benchmarks only read.
Fixture& fixture(std::size_t n_objects) {
    static std::size_t built_for = 0;
    static Fixture f;
    if (built_for == n_objects) return f;

    auto objects = std::make_shared<store::MemoryObjectStore>();
    auto documents = std::make_shared<store::MemoryDocumentStore>();
    auto db = VectorDb::create(objects, documents, "bench");
    if (!db) std::abort();
    f.db = std::move(*db);

    EmbeddingModelInfo model;
    model.name = "bench-model";
    model.id = "bench";
    model.index.dimensions = kDim;
    model.index.metric = MetricType::cosine;
    model.index.aggregation = AggregationType::min;
    auto c = f.db->create_collection(model);
    if (!c) std::abort();
    f.collection = *c;

    std::mt19937 gen(42);
    std::vector<Object> batch;
    for (std::size_t i = 0; i < n_objects; ++i) {
        Object o;
        o.object_id = "o" + std::to_string(i);
        o.payload = Value::map({{"rank", static_cast<std::int64_t>(i % 100)},
                                {"kind", i % 10 == 0 ? "rare" : "common"},
                                {"title", "item number " + std::to_string(i)}});
        for (std::size_t p = 0; p < kPartsPerObject; ++p) o.parts.push_back(ObjectPart{"", random_vector(gen), false});
        batch.push_back(std::move(o));
        if (batch.size() == 1000) {
            if (!f.collection->insert(batch)) std::abort();
            batch.clear();
        }
    }
    if (!batch.empty() && !f.collection->insert(batch)) std::abort();
    f.query = random_vector(gen);
    built_for = n_objects;
    return f;
}

} // namespace

static void BM_SimilarityUnfiltered(benchmark::State& state) {
    auto& f = fixture(static_cast<std::size_t>(state.range(0)));
    SimilarityParams params;
    params.limit = 10;
    for (auto _ : state) {
        auto r = f.collection->find_similarities(f.query, params);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SimilarityUnfiltered)->Arg(1000)->Arg(10000);

static void BM_SimilarityFiltered(benchmark::State& state) {
    auto& f = fixture(static_cast<std::size_t>(state.range(0)));
    SimilarityParams params;
    params.limit = 10;
    params.payload_filter = filters::term("kind", "rare");
    for (auto _ : state) {
        auto r = f.collection->find_similarities(f.query, params);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SimilarityFiltered)->Arg(1000)->Arg(10000);

static void BM_SimilarityFirstWindow(benchmark::State& state) {
    auto& f = fixture(static_cast<std::size_t>(state.range(0)));
    SimilarityParams params;
    params.limit = 10;
    params.similarity_first = true;
    params.payload_filter = filters::range("rank", RangeCondition{.gte = 50.0});
    for (auto _ : state) {
        auto r = f.collection->find_similarities(f.query, params);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_SimilarityFirstWindow)->Arg(1000)->Arg(10000);

static void BM_PayloadSearchSorted(benchmark::State& state) {
    auto& f = fixture(static_cast<std::size_t>(state.range(0)));
    PayloadSearchParams params;
    params.limit = 20;
    params.payload_filter = filters::match("title", "number");
    params.sort_by = SortByOptions{"rank", SortOrder::desc, false};
    for (auto _ : state) {
        auto r = f.collection->find_by_payload_filter(params);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_PayloadSearchSorted)->Arg(1000)->Arg(10000);

BENCHMARK_MAIN();
