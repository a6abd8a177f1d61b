#include <benchmark/benchmark.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "embdb/filter_eval.hpp"
#include "embdb/query_compiler.hpp"

using namespace embdb;

namespace {

filter_expr compiled(const PayloadFilter& f) {
    auto e = compile(f);
    if (!e) std::abort();
    return *e;
}

Value sample_payload() {
    return Value::map({{"kind", "shoe"},
                       {"price", 42.5},
                       {"title", "Red running shoes for trail and road"},
                       {"sku", "AB-1234-XY"},
                       {"meta", Value::map({{"brand", "acme"}, {"stock", 17}})}});
}

} // namespace

static void BenchTermLeaf(benchmark::State& state) {
    const auto payload = sample_payload();
    const std::optional<std::string> none;
    const filter_eval::row_view row{&payload, "o1", &none, &none, &none};
    const auto expr = compiled(filters::term("meta.brand", "acme"));
    for (auto _ : state) benchmark::DoNotOptimize(filter_eval::matches(expr, row));
}
BENCHMARK(BenchTermLeaf);

static void BenchMatchTokens(benchmark::State& state) {
    const auto payload = sample_payload();
    const std::optional<std::string> none;
    const filter_eval::row_view row{&payload, "o1", &none, &none, &none};
    const auto expr = compiled(filters::match("title", "trail shoes"));
    for (auto _ : state) benchmark::DoNotOptimize(filter_eval::matches(expr, row));
}
BENCHMARK(BenchMatchTokens);

static void BenchBoolTree(benchmark::State& state) {
    const auto payload = sample_payload();
    const std::optional<std::string> user("u1");
    const std::optional<std::string> none;
    const filter_eval::row_view row{&payload, "o1", &user, &none, &none};
    PayloadFilter::Bool b;
    b.must.push_back(filters::term("kind", "shoe"));
    b.filter.push_back(filters::range("price", RangeCondition{.gte = 10.0, .lt = 100.0}));
    b.should.push_back(filters::wildcard("sku", "AB-*"));
    b.should.push_back(filters::exists("meta.discount"));
    b.must_not.push_back(filters::column_term("user_id", "u2"));
    const auto expr = compiled(PayloadFilter{b});
    for (auto _ : state) benchmark::DoNotOptimize(filter_eval::matches(expr, row));
}
BENCHMARK(BenchBoolTree);

static void BenchCompile(benchmark::State& state) {
    PayloadFilter::Bool b;
    for (int i = 0; i < 16; ++i) b.should.push_back(filters::term("f" + std::to_string(i), i));
    const PayloadFilter f{b};
    for (auto _ : state) {
        auto e = compile(f);
        benchmark::DoNotOptimize(e);
    }
}
BENCHMARK(BenchCompile);

BENCHMARK_MAIN();
