#pragma once

/** \file object_store.hpp
 *  \brief Transactional object/part storage contract consumed by Collection.
 *
 * Each collection owns two logical tables: objects (one row per object_id) and parts
 * (one row per (object_id, part_id)). Writes go through a Transaction that holds NOWAIT
 * exclusive row locks; reads take no locks and observe committed state only.
 *
 * Search plans are executed by the store. Both backends implement the same pipeline:
 * 1. visible candidates: user_id IS NULL, or user_id = u minus canonical objects shadowed by
 *    u's customized objects (their original_id);
 * 2. compiled payload filter;
 * 3. per-part distance under the metric, aggregated per object;
 * 4. drop objects above max_distance;
 * 5. order by (distance, object_id), or by sort_by then (distance, object_id); then offset/limit.
 * With similarity_first, steps 2 and 3 swap: the closest `window` candidates are kept first,
 * and sort_by is ignored.
 * A hit carries the parts within max_distance (all scored parts without one), closest first.
 */

#include <cstddef>
#include <expected>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "embdb/error.hpp"
#include "embdb/filter_expr.hpp"
#include "embdb/models.hpp"
#include "embdb/object.hpp"

namespace embdb::store {

/** \brief Fully resolved similarity query. */
struct SimilarityPlan {
    std::vector<float> query;
    MetricType metric{MetricType::cosine};
    AggregationType aggregation{AggregationType::min};
    std::size_t limit{10};
    std::size_t offset{0};
    std::optional<double> max_distance;
    std::optional<filter_expr> filter;
    std::optional<std::string> user_id;
    bool similarity_first{false};
    std::size_t window{0};          /**< similarity_first prefetch size */
    std::optional<SortByOptions> sort_by;
    bool average_only{false};
    bool with_vectors{false};
};

/** \brief Fully resolved payload query. */
struct PayloadPlan {
    std::optional<filter_expr> filter;
    std::size_t limit{10};
    std::size_t offset{0};
    std::optional<SortByOptions> sort_by;
    std::optional<std::string> user_id;
    bool with_vectors{false};
};

/** \brief Write transaction scoped to one collection. Destruction without commit rolls back. */
class Transaction {
public:
    virtual ~Transaction() = default;

    /** \brief Exclusive NOWAIT locks on `object_ids`; lock_not_available when any is held elsewhere. */
    virtual auto lock_objects(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> = 0;

    /** \brief Insert object rows; an existing object_id is already_exists. */
    virtual auto insert_objects(const std::vector<Object>& objects) -> std::expected<void, core::error> = 0;
    /** \brief Insert or overwrite object rows (payload, storage_meta, user/session/original ids). */
    virtual auto upsert_objects(const std::vector<Object>& objects) -> std::expected<void, core::error> = 0;

    /** \brief Insert the part rows of `objects`; an existing (object_id, part_id) is already_exists. */
    virtual auto insert_parts(const std::vector<Object>& objects) -> std::expected<void, core::error> = 0;
    /** \brief Insert or overwrite part rows by (object_id, part_id). */
    virtual auto upsert_parts(const std::vector<Object>& objects) -> std::expected<void, core::error> = 0;
    /** \brief Delete every part row of the given objects. */
    virtual auto delete_parts(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> = 0;
    /** \brief Delete object rows; ids that do not exist are ignored. */
    virtual auto delete_objects(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> = 0;

    virtual auto commit() -> std::expected<void, core::error> = 0;
    virtual void rollback() noexcept = 0;
};

/** \brief Object/part storage for all collections of one backend. */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /** \brief Allocate the object and part tables of a collection (idempotent). */
    virtual auto create_tables(const std::string& collection_id, const SearchIndexInfo& index)
        -> std::expected<void, core::error> = 0;
    /** \brief Drop the tables of a collection (idempotent). */
    virtual auto drop_tables(const std::string& collection_id) -> std::expected<void, core::error> = 0;
    /** \brief Build the HNSW index over the part vectors (idempotent). */
    virtual auto create_vector_index(const std::string& collection_id, const SearchIndexInfo& index)
        -> std::expected<void, core::error> = 0;
    /** \brief Refresh planner statistics. */
    virtual auto analyze(const std::string& collection_id) -> std::expected<void, core::error> = 0;

    virtual auto begin(const std::string& collection_id) -> std::expected<std::unique_ptr<Transaction>, core::error> = 0;

    virtual auto find_by_ids(const std::string& collection_id, const std::vector<std::string>& object_ids)
        -> std::expected<std::vector<Object>, core::error> = 0;
    /** \brief Objects whose original_id is one of `original_ids`. */
    virtual auto find_by_original_ids(const std::string& collection_id, const std::vector<std::string>& original_ids)
        -> std::expected<std::vector<Object>, core::error> = 0;
    virtual auto find_by_session_id(const std::string& collection_id, const std::string& session_id)
        -> std::expected<std::vector<Object>, core::error> = 0;

    /** \brief Object count; originals_only counts objects with no user_id. */
    virtual auto count(const std::string& collection_id, bool originals_only) -> std::expected<std::size_t, core::error> = 0;
    /** \brief Objects matching `filter` among shared (user_id IS NULL) objects. */
    virtual auto count_by_filter(const std::string& collection_id, const filter_expr* filter)
        -> std::expected<std::size_t, core::error> = 0;
    /** \brief Insertion-ordered page of object common data. */
    virtual auto common_data_batch(const std::string& collection_id, std::size_t limit, std::size_t offset,
                                   bool originals_only) -> std::expected<std::vector<ObjectCommonData>, core::error> = 0;

    virtual auto similarity_search(const std::string& collection_id, const SimilarityPlan& plan)
        -> std::expected<SearchResults, core::error> = 0;
    virtual auto payload_search(const std::string& collection_id, const PayloadPlan& plan)
        -> std::expected<SearchResults, core::error> = 0;
};

inline auto saturating_add(std::size_t a, std::size_t b) noexcept -> std::size_t {
    return b > std::numeric_limits<std::size_t>::max() - a ? std::numeric_limits<std::size_t>::max() : a + b;
}

inline auto saturating_mul(std::size_t a, std::size_t b) noexcept -> std::size_t {
    if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a) return std::numeric_limits<std::size_t>::max();
    return a * b;
}

/** \brief next_offset = offset + limit when a full page was returned. */
inline auto page_next_offset(std::size_t returned, std::size_t limit, std::size_t offset) -> std::optional<std::size_t> {
    if (limit > 0 && returned == limit) return saturating_add(offset, limit);
    return std::nullopt;
}

} // namespace embdb::store
