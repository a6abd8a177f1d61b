#pragma once

/** \file collection.hpp
 *  \brief Per-model storage unit: validated writes under NOWAIT row locks, and search.
 *
 * Writes (insert/upsert/remove) validate the whole batch first (ids, part ids, dimensions), then
 * run in one store transaction that locks exactly the written object ids. A lock conflict rolls
 * the transaction back, waits `lock_wait` and retries up to `lock_max_attempts` times before
 * failing with lock_acquisition_failed. Reads take no locks.
 *
 * Thread-safety: a Collection is a thin handle; concurrent calls are safe when the store is.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "embdb/collection_info_cache.hpp"
#include "embdb/error.hpp"
#include "embdb/models.hpp"
#include "embdb/object.hpp"
#include "embdb/store/object_store.hpp"

namespace embdb {

struct CollectionOptions {
    std::uint32_t lock_max_attempts{5};
    std::chrono::milliseconds lock_wait{2000};
    /** similarity_first window = (offset + limit) * prefetch_factor, saturating */
    std::size_t prefetch_factor{4};
};

class Collection {
public:
    Collection(std::string collection_id, SearchIndexInfo index, std::shared_ptr<store::ObjectStore> store,
               std::shared_ptr<CollectionInfoCache> cache, CollectionOptions options);
    virtual ~Collection() = default;

    auto collection_id() const -> const std::string& { return collection_id_; }
    auto index_info() const -> const SearchIndexInfo& { return index_; }

    /** \brief Cached metadata record of this collection. */
    auto get_info() const -> std::expected<CollectionInfo, core::error>;
    /** \brief Cached record plus blue/green state. */
    auto get_state_info() const -> std::expected<CollectionStateInfo, core::error>;

    /** \brief Insert new objects with their parts; an existing object_id is already_exists. */
    auto insert(const std::vector<Object>& objects) -> std::expected<void, core::error>;
    /** \brief Overwrite objects. With shrink_parts the previous parts are replaced, else merged by part_id. */
    auto upsert(const std::vector<Object>& objects, bool shrink_parts = true) -> std::expected<void, core::error>;
    /** \brief Delete objects and their parts; unknown ids are ignored. */
    auto remove(const std::vector<std::string>& object_ids) -> std::expected<void, core::error>;

    auto find_by_ids(const std::vector<std::string>& object_ids) const -> std::expected<std::vector<Object>, core::error>;
    auto find_by_original_ids(const std::vector<std::string>& original_ids) const
        -> std::expected<std::vector<Object>, core::error>;

    auto get_total(bool originals_only = true) const -> std::expected<std::size_t, core::error>;
    auto get_objects_common_data_batch(std::size_t limit, std::size_t offset, bool originals_only = true) const
        -> std::expected<ObjectsCommonDataBatch, core::error>;
    /** \brief Shared objects matching `filter` (all shared objects without one). */
    auto count_by_payload_filter(const std::optional<PayloadFilter>& filter) const
        -> std::expected<std::size_t, core::error>;

    /** \brief Build the HNSW index (idempotent) and mark index_created. */
    auto create_index() -> std::expected<void, core::error>;
    /** \brief Refresh store statistics. */
    auto analyze() -> std::expected<void, core::error>;

    auto find_similarities(std::span<const float> query, const SimilarityParams& params) const
        -> std::expected<SearchResults, core::error>;
    auto find_by_payload_filter(const PayloadSearchParams& params) const -> std::expected<SearchResults, core::error>;

protected:
    auto store() const -> store::ObjectStore& { return *store_; }
    virtual bool contains_queries() const noexcept { return false; }

private:
    /** Validated copy of `objects` with part ids assigned. */
    auto prepare(const std::vector<Object>& objects) const -> std::expected<std::vector<Object>, core::error>;
    /** Lock `object_ids`, run `write`, commit; retries on lock conflicts. */
    auto write_locked(const std::vector<std::string>& object_ids,
                      const std::function<std::expected<void, core::error>(store::Transaction&)>& write)
        -> std::expected<void, core::error>;

    std::string collection_id_;
    SearchIndexInfo index_;
    std::shared_ptr<store::ObjectStore> store_;
    std::shared_ptr<CollectionInfoCache> cache_;
    CollectionOptions options_;
};

/** \brief Collection of search-query vectors keyed by search session. */
class QueryCollection final : public Collection {
public:
    using Collection::Collection;

    /** \brief The object recorded for `session_id`, if any. */
    auto find_by_session_id(const std::string& session_id) const -> std::expected<std::optional<Object>, core::error>;

protected:
    bool contains_queries() const noexcept override { return true; }
};

} // namespace embdb
