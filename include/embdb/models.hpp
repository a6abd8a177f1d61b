#pragma once

/** \file models.hpp
 *  \brief Metric, aggregation and collection metadata model.
 *
 * EmbeddingModelInfo binds a model identity to the search index parameters it produces
 * vectors for. CollectionInfo is the persisted metadata record of one collection;
 * CollectionStateInfo adds the blue/green state derived from the blue pointer at read time.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "embdb/error.hpp"
#include "embdb/value.hpp"

namespace embdb {

/** \brief Vector distance metric. Smaller distance is closer for every metric. */
enum class MetricType : std::uint8_t { cosine, dot, euclid };

/** \brief Per-object aggregation of part distances. */
enum class AggregationType : std::uint8_t { min, avg };

enum class WorkState : std::uint8_t { green, blue };

auto to_string(MetricType m) -> std::string_view;
auto to_string(AggregationType a) -> std::string_view;
auto to_string(WorkState s) -> std::string_view;
auto parse_metric(std::string_view s) -> std::expected<MetricType, core::error>;
auto parse_aggregation(std::string_view s) -> std::expected<AggregationType, core::error>;

/** \brief HNSW build parameters passed through to the store's index builder. */
struct HnswParameters {
    std::uint32_t m{16};
    std::uint32_t ef_construction{64};

    bool operator==(const HnswParameters&) const = default;
};

struct SearchIndexInfo {
    std::uint32_t dimensions{0};
    MetricType metric{MetricType::cosine};
    AggregationType aggregation{AggregationType::min};
    HnswParameters hnsw{};

    bool operator==(const SearchIndexInfo&) const = default;
};

struct EmbeddingModelInfo {
    std::string name;
    std::string id;
    SearchIndexInfo index{};

    /** \brief "name:id". */
    auto full_name() const -> std::string { return name + ":" + id; }

    bool operator==(const EmbeddingModelInfo&) const = default;
};

/** \brief Persisted metadata record of a collection. */
struct CollectionInfo {
    std::string collection_id;
    EmbeddingModelInfo embedding_model;
    std::int64_t created_at_ms{0};           /**< unix epoch milliseconds */
    bool index_created{false};
    std::vector<std::string> applied_optimizations;
    bool contains_queries{false};
};

/** \brief CollectionInfo plus the derived blue/green state. */
struct CollectionStateInfo : CollectionInfo {
    WorkState work_state{WorkState::green};
};

/** \brief Single source of truth for the blue collection of one namespace. */
struct BlueCollectionPointer {
    std::string db_id;
    std::string collection_id;
    std::optional<std::string> query_collection_id;
};

// Document encodings used by the metadata cache.
auto to_value(const EmbeddingModelInfo& m) -> Value;
auto to_value(const CollectionInfo& c, std::string_view db_id) -> Value;
auto to_value(const BlueCollectionPointer& p) -> Value;
auto model_from_value(const Value& v) -> std::expected<EmbeddingModelInfo, core::error>;
auto collection_info_from_value(const Value& v) -> std::expected<CollectionInfo, core::error>;
auto blue_pointer_from_value(const Value& v) -> std::expected<BlueCollectionPointer, core::error>;

/** \brief Collection ids name physical tables: [A-Za-z0-9_]{1,48}. */
bool is_valid_collection_id(std::string_view id) noexcept;

/** \brief Query-collection id paired with a collection id. */
inline auto query_collection_id_for(std::string_view collection_id) -> std::string {
    return std::string(collection_id) + "_q";
}

/** \brief Current wall-clock time in unix epoch milliseconds. */
auto now_ms() -> std::int64_t;

} // namespace embdb
