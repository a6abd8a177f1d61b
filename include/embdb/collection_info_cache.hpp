#pragma once

/** \file collection_info_cache.hpp
 *  \brief Cached view of the collection metadata of one namespace (db_id).
 *
 * Records live in the document store:
 *   "vectordb_collection_info"    keyed by collection_id, filtered by db_id
 *   "vectordb_blue_collection_id" keyed by db_id (the blue pointer)
 * Every mutation writes through and then reloads the cache before returning. work_state is
 * derived from the blue pointer during reload.
 *
 * Thread-safety: readers take a shared lock and return copies. set_blue_collection calls on
 * one instance are serialized; concurrent switches from different processes are last-write-wins.
 */

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "embdb/error.hpp"
#include "embdb/models.hpp"
#include "embdb/store/document_store.hpp"

namespace embdb {

class CollectionInfoCache {
public:
    static constexpr const char* kCollectionInfo = "vectordb_collection_info";
    static constexpr const char* kBlueCollectionId = "vectordb_blue_collection_id";

    /** \brief Build a cache for `db_id` and load it. */
    static auto create(std::shared_ptr<store::DocumentStore> documents, std::string db_id)
        -> std::expected<std::unique_ptr<CollectionInfoCache>, core::error>;

    /** \brief Reload records and the blue pointer; rebuild the lists and blue markers. */
    auto invalidate_cache() -> std::expected<void, core::error>;

    auto list_collections() const -> std::vector<CollectionStateInfo>;
    auto list_query_collections() const -> std::vector<CollectionStateInfo>;
    auto get_collection(const std::string& collection_id) const -> std::optional<CollectionStateInfo>;
    auto get_query_collection(const std::string& collection_id) const -> std::optional<CollectionStateInfo>;
    auto get_blue_collection() const -> std::optional<CollectionStateInfo>;
    auto get_blue_query_collection() const -> std::optional<CollectionStateInfo>;

    /** \brief Register a collection record; an existing record is kept (logged). Returns the stored state. */
    auto add_collection(const CollectionInfo& info) -> std::expected<CollectionStateInfo, core::error>;
    auto add_query_collection(const CollectionInfo& info) -> std::expected<CollectionStateInfo, core::error>;

    /** \brief Point the namespace's blue pointer at `collection_id` (and optionally a query-collection).
     *  Both must be registered, else collection_not_found without any write.
     */
    auto set_blue_collection(const std::string& collection_id,
                             const std::optional<std::string>& query_collection_id) -> std::expected<void, core::error>;

    auto set_index_state(const std::string& collection_id, bool created) -> std::expected<void, core::error>;
    auto delete_collection(const std::string& collection_id) -> std::expected<void, core::error>;
    /** \brief Record `name` in applied_optimizations (no-op when present). */
    auto add_applied_optimization(const std::string& collection_id, const std::string& name)
        -> std::expected<void, core::error>;

    auto db_id() const -> const std::string& { return db_id_; }

private:
    CollectionInfoCache(std::shared_ptr<store::DocumentStore> documents, std::string db_id)
        : documents_(std::move(documents)), db_id_(std::move(db_id)) {}

    auto add(CollectionInfo info, bool contains_queries) -> std::expected<CollectionStateInfo, core::error>;
    auto find_any(const std::string& collection_id) const -> std::optional<CollectionStateInfo>;

    std::shared_ptr<store::DocumentStore> documents_;
    std::string db_id_;

    mutable std::shared_mutex mutex_;
    std::vector<CollectionStateInfo> collections_;
    std::vector<CollectionStateInfo> query_collections_;
    std::optional<std::string> blue_id_;
    std::optional<std::string> blue_query_id_;

    std::mutex set_blue_mutex_;
};

} // namespace embdb
