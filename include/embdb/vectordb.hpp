#pragma once

/** \file vectordb.hpp
 *  \brief Collection registry of one namespace: lifecycle, blue/green switch, optimizations.
 *
 * Collection ids are embedding model ids; the paired query-collection id is "<id>_q".
 * Physical tables are allocated in the object store before the metadata record is written
 * and dropped before it is deleted. All metadata goes through the CollectionInfoCache, which
 * reloads after every mutation.
 *
 * Ownership: VectorDb shares its stores and cache with the Collection handles it returns;
 * handles stay usable after the VectorDb is destroyed.
 */

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "embdb/collection.hpp"
#include "embdb/collection_info_cache.hpp"
#include "embdb/error.hpp"
#include "embdb/optimization.hpp"
#include "embdb/store/document_store.hpp"
#include "embdb/store/object_store.hpp"

namespace embdb {

class VectorDb {
public:
    static auto create(std::shared_ptr<store::ObjectStore> objects, std::shared_ptr<store::DocumentStore> documents,
                       std::string db_id, CollectionOptions options = {})
        -> std::expected<std::unique_ptr<VectorDb>, core::error>;

    /** \brief Force a metadata reload. */
    auto update_info() -> std::expected<void, core::error>;

    auto list_collections() const -> std::vector<CollectionStateInfo>;
    auto list_query_collections() const -> std::vector<CollectionStateInfo>;
    bool collection_exists(const std::string& collection_id) const;
    bool query_collection_exists(const std::string& collection_id) const;

    /** \brief Handle of a registered collection; collection_not_found otherwise. */
    auto get_collection(const std::string& collection_id) const -> std::expected<std::shared_ptr<Collection>, core::error>;
    auto get_query_collection(const std::string& collection_id) const
        -> std::expected<std::shared_ptr<QueryCollection>, core::error>;
    /** \brief The blue collection, or null when none is set. */
    auto get_blue_collection() const -> std::shared_ptr<Collection>;
    auto get_blue_query_collection() const -> std::shared_ptr<QueryCollection>;

    /** \brief Allocate and register the collection of `model`.
     *  create_collection_conflict when the id is already bound to a different model.
     */
    auto create_collection(const EmbeddingModelInfo& model) -> std::expected<std::shared_ptr<Collection>, core::error>;
    auto create_query_collection(const EmbeddingModelInfo& model)
        -> std::expected<std::shared_ptr<QueryCollection>, core::error>;
    auto get_or_create_collection(const EmbeddingModelInfo& model)
        -> std::expected<std::shared_ptr<Collection>, core::error>;
    auto get_or_create_query_collection(const EmbeddingModelInfo& model)
        -> std::expected<std::shared_ptr<QueryCollection>, core::error>;

    /** \brief Drop tables then metadata. delete_blue_forbidden for the blue collection. */
    auto delete_collection(const std::string& collection_id) -> std::expected<void, core::error>;
    auto delete_query_collection(const std::string& collection_id) -> std::expected<void, core::error>;

    /** \brief Make `model_id` and its query-collection "<model_id>_q" blue. */
    auto set_blue_collection(const std::string& model_id) -> std::expected<void, core::error>;

    void add_optimization(std::shared_ptr<Optimization> optimization);
    void add_query_optimization(std::shared_ptr<Optimization> optimization);
    /** \brief Apply registered optimizations not yet recorded on each collection. */
    auto apply_optimizations() -> std::expected<void, core::error>;
    auto apply_query_optimizations() -> std::expected<void, core::error>;

    auto db_id() const -> const std::string& { return cache_->db_id(); }

private:
    VectorDb(std::shared_ptr<store::ObjectStore> objects, std::shared_ptr<CollectionInfoCache> cache,
             CollectionOptions options)
        : objects_(std::move(objects)), cache_(std::move(cache)), options_(options) {}

    auto register_collection(const EmbeddingModelInfo& model, bool query) -> std::expected<CollectionStateInfo, core::error>;
    auto drop(const std::string& collection_id, bool query) -> std::expected<void, core::error>;
    auto optimize(Collection& collection, const CollectionStateInfo& state,
                  const std::vector<std::shared_ptr<Optimization>>& optimizations) -> std::expected<void, core::error>;

    template <typename Handle>
    auto make_handle(const CollectionStateInfo& state) const -> std::shared_ptr<Handle> {
        return std::make_shared<Handle>(state.collection_id, state.embedding_model.index, objects_, cache_, options_);
    }

    std::shared_ptr<store::ObjectStore> objects_;
    std::shared_ptr<CollectionInfoCache> cache_;
    CollectionOptions options_;
    std::vector<std::shared_ptr<Optimization>> optimizations_;
    std::vector<std::shared_ptr<Optimization>> query_optimizations_;
};

} // namespace embdb
