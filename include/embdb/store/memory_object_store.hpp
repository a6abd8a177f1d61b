#pragma once

/** \file memory_object_store.hpp
 *  \brief In-process ObjectStore with Roaring candidate bitmaps and NOWAIT row locks.
 *
 * Layout per collection: object rows addressed by a 32-bit row id assigned in insertion
 * order (row ids are never reused, so ascending row id is insertion order). Deleted rows leave
 * a tombstone; a commit that leaves more tombstones than live rows renumbers the live rows
 * densely in their existing order. Parts live inside their object row. Bitmaps: all rows, shared rows (no user_id), rows per user_id.
 *
 * Transactions stage writes in a private overlay and apply them at commit under the
 * exclusive store lock; readers hold the shared lock and see committed rows only.
 * Row locks are (collection_id, object_id) -> owning transaction, acquired all-or-nothing.
 *
 * Thread-safety: all operations are safe to call concurrently.
 */

#include <memory>

#include "embdb/store/object_store.hpp"

namespace embdb::store {

class MemoryObjectStore final : public ObjectStore {
public:
    MemoryObjectStore();
    ~MemoryObjectStore() override;

    MemoryObjectStore(const MemoryObjectStore&) = delete;
    MemoryObjectStore& operator=(const MemoryObjectStore&) = delete;

    auto create_tables(const std::string& collection_id, const SearchIndexInfo& index)
        -> std::expected<void, core::error> override;
    auto drop_tables(const std::string& collection_id) -> std::expected<void, core::error> override;
    auto create_vector_index(const std::string& collection_id, const SearchIndexInfo& index)
        -> std::expected<void, core::error> override;
    auto analyze(const std::string& collection_id) -> std::expected<void, core::error> override;

    auto begin(const std::string& collection_id) -> std::expected<std::unique_ptr<Transaction>, core::error> override;

    auto find_by_ids(const std::string& collection_id, const std::vector<std::string>& object_ids)
        -> std::expected<std::vector<Object>, core::error> override;
    auto find_by_original_ids(const std::string& collection_id, const std::vector<std::string>& original_ids)
        -> std::expected<std::vector<Object>, core::error> override;
    auto find_by_session_id(const std::string& collection_id, const std::string& session_id)
        -> std::expected<std::vector<Object>, core::error> override;

    auto count(const std::string& collection_id, bool originals_only) -> std::expected<std::size_t, core::error> override;
    auto count_by_filter(const std::string& collection_id, const filter_expr* filter)
        -> std::expected<std::size_t, core::error> override;
    auto common_data_batch(const std::string& collection_id, std::size_t limit, std::size_t offset, bool originals_only)
        -> std::expected<std::vector<ObjectCommonData>, core::error> override;

    auto similarity_search(const std::string& collection_id, const SimilarityPlan& plan)
        -> std::expected<SearchResults, core::error> override;
    auto payload_search(const std::string& collection_id, const PayloadPlan& plan)
        -> std::expected<SearchResults, core::error> override;

    /** \brief True once create_vector_index ran for the collection (for tests). */
    auto has_vector_index(const std::string& collection_id) const -> bool;
    /** \brief Row slots held by the collection, tombstones included (for tests). */
    auto allocated_rows(const std::string& collection_id) const -> std::size_t;

    class Impl;

private:
    std::shared_ptr<Impl> impl_;
};

} // namespace embdb::store
