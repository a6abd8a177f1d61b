#include "embdb/models.hpp"

#include <chrono>

namespace embdb {

namespace {

auto decode_error(std::string msg) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::data_integrity, std::move(msg), "models");
}

auto get_string(const Value& v, std::string_view key) -> std::optional<std::string> {
    const auto* f = v.find(key);
    if (!f || !f->as_string()) return std::nullopt;
    return *f->as_string();
}

auto get_uint(const Value& v, std::string_view key, std::uint32_t fallback) -> std::uint32_t {
    const auto* f = v.find(key);
    if (!f) return fallback;
    if (const auto* i = f->as_int(); i && *i >= 0) return static_cast<std::uint32_t>(*i);
    return fallback;
}

auto get_bool(const Value& v, std::string_view key) -> bool {
    const auto* f = v.find(key);
    return f && f->as_bool() && *f->as_bool();
}

} // namespace

auto to_string(MetricType m) -> std::string_view {
    switch (m) {
    case MetricType::cosine: return "cosine";
    case MetricType::dot: return "dot";
    case MetricType::euclid: return "euclid";
    }
    return "cosine";
}

auto to_string(AggregationType a) -> std::string_view {
    return a == AggregationType::avg ? "avg" : "min";
}

auto to_string(WorkState s) -> std::string_view {
    return s == WorkState::blue ? "blue" : "green";
}

auto parse_metric(std::string_view s) -> std::expected<MetricType, core::error> {
    if (s == "cosine") return MetricType::cosine;
    if (s == "dot") return MetricType::dot;
    if (s == "euclid") return MetricType::euclid;
    return core::make_error(core::error_code::invalid_argument, "unknown metric: " + std::string(s), "models");
}

auto parse_aggregation(std::string_view s) -> std::expected<AggregationType, core::error> {
    if (s == "min") return AggregationType::min;
    if (s == "avg") return AggregationType::avg;
    return core::make_error(core::error_code::invalid_argument, "unknown aggregation: " + std::string(s), "models");
}

auto to_value(const EmbeddingModelInfo& m) -> Value {
    return Value::map({
        {"name", m.name},
        {"id", m.id},
        {"dimensions", m.index.dimensions},
        {"metric_type", to_string(m.index.metric)},
        {"metric_aggregation_type", to_string(m.index.aggregation)},
        {"hnsw", Value::map({{"m", m.index.hnsw.m}, {"ef_construction", m.index.hnsw.ef_construction}})},
    });
}

auto to_value(const CollectionInfo& c, std::string_view db_id) -> Value {
    Value::Array opts;
    for (const auto& o : c.applied_optimizations) opts.emplace_back(o);
    return Value::map({
        {"db_id", db_id},
        {"collection_id", c.collection_id},
        {"embedding_model", to_value(c.embedding_model)},
        {"created_at", c.created_at_ms},
        {"index_created", c.index_created},
        {"applied_optimizations", Value(std::move(opts))},
        {"contains_queries", c.contains_queries},
    });
}

auto to_value(const BlueCollectionPointer& p) -> Value {
    Value v = Value::map({{"db_id", p.db_id}, {"collection_id", p.collection_id}});
    v.set("query_collection_id", p.query_collection_id ? Value(*p.query_collection_id) : Value{});
    return v;
}

auto model_from_value(const Value& v) -> std::expected<EmbeddingModelInfo, core::error> {
    EmbeddingModelInfo m;
    auto name = get_string(v, "name");
    auto id = get_string(v, "id");
    if (!name || !id) return decode_error("embedding model record lacks name or id");
    m.name = std::move(*name);
    m.id = std::move(*id);
    m.index.dimensions = get_uint(v, "dimensions", 0);
    if (auto metric = get_string(v, "metric_type")) {
        auto parsed = parse_metric(*metric);
        if (!parsed) return decode_error(parsed.error().message);
        m.index.metric = *parsed;
    }
    if (auto agg = get_string(v, "metric_aggregation_type")) {
        auto parsed = parse_aggregation(*agg);
        if (!parsed) return decode_error(parsed.error().message);
        m.index.aggregation = *parsed;
    }
    if (const auto* h = v.find("hnsw")) {
        m.index.hnsw.m = get_uint(*h, "m", 16);
        m.index.hnsw.ef_construction = get_uint(*h, "ef_construction", 64);
    }
    return m;
}

auto collection_info_from_value(const Value& v) -> std::expected<CollectionInfo, core::error> {
    CollectionInfo c;
    auto cid = get_string(v, "collection_id");
    if (!cid) return decode_error("collection record lacks collection_id");
    c.collection_id = std::move(*cid);
    const auto* model = v.find("embedding_model");
    if (!model) return decode_error("collection record lacks embedding_model: " + c.collection_id);
    auto m = model_from_value(*model);
    if (!m) return std::unexpected(m.error());
    c.embedding_model = std::move(*m);
    if (const auto* ts = v.find("created_at"); ts && ts->as_int()) c.created_at_ms = *ts->as_int();
    c.index_created = get_bool(v, "index_created");
    c.contains_queries = get_bool(v, "contains_queries");
    if (const auto* opts = v.find("applied_optimizations"); opts && opts->as_array()) {
        for (const auto& o : *opts->as_array()) {
            if (o.as_string()) c.applied_optimizations.push_back(*o.as_string());
        }
    }
    return c;
}

auto blue_pointer_from_value(const Value& v) -> std::expected<BlueCollectionPointer, core::error> {
    BlueCollectionPointer p;
    auto db = get_string(v, "db_id");
    auto cid = get_string(v, "collection_id");
    if (!db || !cid) return decode_error("blue pointer record lacks db_id or collection_id");
    p.db_id = std::move(*db);
    p.collection_id = std::move(*cid);
    p.query_collection_id = get_string(v, "query_collection_id");
    return p;
}

bool is_valid_collection_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > 48) return false;
    for (char ch : id) {
        const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
        if (!ok) return false;
    }
    return true;
}

auto now_ms() -> std::int64_t {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace embdb
