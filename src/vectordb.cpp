#include "embdb/vectordb.hpp"

#include <algorithm>

#include "embdb/core/log.hpp"

namespace embdb {

namespace {

constexpr const char* kComponent = "vectordb";

auto not_found(const std::string& id) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::collection_not_found, "collection not found: " + id, kComponent);
}

auto conflict(const std::string& id, const EmbeddingModelInfo& requested, const EmbeddingModelInfo& bound)
    -> std::unexpected<core::error> {
    return core::make_error(core::error_code::create_collection_conflict,
                            "collection " + id + " is bound to " + bound.full_name() + ", requested " +
                                requested.full_name(),
                            kComponent);
}

} // namespace

auto VectorDb::create(std::shared_ptr<store::ObjectStore> objects, std::shared_ptr<store::DocumentStore> documents,
                      std::string db_id, CollectionOptions options) -> std::expected<std::unique_ptr<VectorDb>, core::error> {
    auto cache = CollectionInfoCache::create(std::move(documents), std::move(db_id));
    if (!cache) return std::unexpected(cache.error());
    std::shared_ptr<CollectionInfoCache> shared(std::move(*cache));
    return std::unique_ptr<VectorDb>(new VectorDb(std::move(objects), std::move(shared), options));
}

auto VectorDb::update_info() -> std::expected<void, core::error> { return cache_->invalidate_cache(); }

auto VectorDb::list_collections() const -> std::vector<CollectionStateInfo> { return cache_->list_collections(); }

auto VectorDb::list_query_collections() const -> std::vector<CollectionStateInfo> {
    return cache_->list_query_collections();
}

bool VectorDb::collection_exists(const std::string& collection_id) const {
    return cache_->get_collection(collection_id).has_value();
}

bool VectorDb::query_collection_exists(const std::string& collection_id) const {
    return cache_->get_query_collection(collection_id).has_value();
}

auto VectorDb::get_collection(const std::string& collection_id) const
    -> std::expected<std::shared_ptr<Collection>, core::error> {
    auto state = cache_->get_collection(collection_id);
    if (!state) return not_found(collection_id);
    return make_handle<Collection>(*state);
}

auto VectorDb::get_query_collection(const std::string& collection_id) const
    -> std::expected<std::shared_ptr<QueryCollection>, core::error> {
    auto state = cache_->get_query_collection(collection_id);
    if (!state) return not_found(collection_id);
    return make_handle<QueryCollection>(*state);
}

auto VectorDb::get_blue_collection() const -> std::shared_ptr<Collection> {
    auto state = cache_->get_blue_collection();
    if (!state) return nullptr;
    return make_handle<Collection>(*state);
}

auto VectorDb::get_blue_query_collection() const -> std::shared_ptr<QueryCollection> {
    auto state = cache_->get_blue_query_collection();
    if (!state) return nullptr;
    return make_handle<QueryCollection>(*state);
}

auto VectorDb::register_collection(const EmbeddingModelInfo& model, bool query)
    -> std::expected<CollectionStateInfo, core::error> {
    if (!is_valid_collection_id(model.id)) {
        return core::make_error(core::error_code::invalid_argument,
                                "model id must match [A-Za-z0-9_]{1,48}: " + model.id, kComponent);
    }
    if (model.index.dimensions == 0) {
        return core::make_error(core::error_code::invalid_argument, "dimensions must be positive", kComponent);
    }
    const std::string id = query ? query_collection_id_for(model.id) : model.id;

    auto existing = query ? cache_->get_query_collection(id) : cache_->get_collection(id);
    if (existing && existing->embedding_model != model) return conflict(id, model, existing->embedding_model);
    // A plain model id ending in "_q" shares its id with the query collection of another model.
    if (auto other = query ? cache_->get_collection(id) : cache_->get_query_collection(id)) {
        return core::make_error(core::error_code::create_collection_conflict,
                                std::string("id ") + id + " is taken by the " + (query ? "collection" : "query collection") +
                                    " of " + other->embedding_model.full_name(),
                                kComponent);
    }

    if (auto ok = objects_->create_tables(id, model.index); !ok) return std::unexpected(ok.error());

    CollectionInfo info;
    info.collection_id = id;
    info.embedding_model = model;
    auto stored = query ? cache_->add_query_collection(info) : cache_->add_collection(info);
    if (!stored) return stored;
    if (stored->embedding_model != model) return conflict(id, model, stored->embedding_model);
    core::logger()->info("{} {} registered for model {}", query ? "query collection" : "collection", id,
                         model.full_name());
    return stored;
}

auto VectorDb::create_collection(const EmbeddingModelInfo& model)
    -> std::expected<std::shared_ptr<Collection>, core::error> {
    auto state = register_collection(model, false);
    if (!state) return std::unexpected(state.error());
    auto collection = make_handle<Collection>(*state);
    if (auto ok = optimize(*collection, *state, optimizations_); !ok) return std::unexpected(ok.error());
    return collection;
}

auto VectorDb::create_query_collection(const EmbeddingModelInfo& model)
    -> std::expected<std::shared_ptr<QueryCollection>, core::error> {
    auto state = register_collection(model, true);
    if (!state) return std::unexpected(state.error());
    auto collection = make_handle<QueryCollection>(*state);
    if (auto ok = optimize(*collection, *state, query_optimizations_); !ok) return std::unexpected(ok.error());
    return collection;
}

auto VectorDb::get_or_create_collection(const EmbeddingModelInfo& model)
    -> std::expected<std::shared_ptr<Collection>, core::error> {
    if (!collection_exists(model.id)) return create_collection(model);
    return get_collection(model.id);
}

auto VectorDb::get_or_create_query_collection(const EmbeddingModelInfo& model)
    -> std::expected<std::shared_ptr<QueryCollection>, core::error> {
    const auto id = query_collection_id_for(model.id);
    if (!query_collection_exists(id)) return create_query_collection(model);
    return get_query_collection(id);
}

auto VectorDb::drop(const std::string& collection_id, bool query) -> std::expected<void, core::error> {
    auto state = query ? cache_->get_query_collection(collection_id) : cache_->get_collection(collection_id);
    if (!state) return not_found(collection_id);
    if (state->work_state == WorkState::blue) {
        return core::make_error(core::error_code::delete_blue_forbidden,
                                "cannot delete blue collection " + collection_id, kComponent);
    }
    if (auto ok = objects_->drop_tables(collection_id); !ok) return ok;
    if (auto ok = cache_->delete_collection(collection_id); !ok) return ok;
    core::logger()->info("{} {} deleted", query ? "query collection" : "collection", collection_id);
    return {};
}

auto VectorDb::delete_collection(const std::string& collection_id) -> std::expected<void, core::error> {
    return drop(collection_id, false);
}

auto VectorDb::delete_query_collection(const std::string& collection_id) -> std::expected<void, core::error> {
    return drop(collection_id, true);
}

auto VectorDb::set_blue_collection(const std::string& model_id) -> std::expected<void, core::error> {
    return cache_->set_blue_collection(model_id, query_collection_id_for(model_id));
}

void VectorDb::add_optimization(std::shared_ptr<Optimization> optimization) {
    optimizations_.push_back(std::move(optimization));
}

void VectorDb::add_query_optimization(std::shared_ptr<Optimization> optimization) {
    query_optimizations_.push_back(std::move(optimization));
}

auto VectorDb::optimize(Collection& collection, const CollectionStateInfo& state,
                        const std::vector<std::shared_ptr<Optimization>>& optimizations)
    -> std::expected<void, core::error> {
    const auto& applied = state.applied_optimizations;
    for (const auto& opt : optimizations) {
        if (std::find(applied.begin(), applied.end(), opt->name()) != applied.end()) continue;
        if (auto ok = opt->apply(collection); !ok) return ok;
        if (auto ok = cache_->add_applied_optimization(collection.collection_id(), opt->name()); !ok) return ok;
        core::logger()->debug("optimization {} applied to {}", opt->name(), collection.collection_id());
    }
    return {};
}

auto VectorDb::apply_optimizations() -> std::expected<void, core::error> {
    for (const auto& state : cache_->list_collections()) {
        auto collection = make_handle<Collection>(state);
        if (auto ok = optimize(*collection, state, optimizations_); !ok) return ok;
    }
    return {};
}

auto VectorDb::apply_query_optimizations() -> std::expected<void, core::error> {
    for (const auto& state : cache_->list_query_collections()) {
        auto collection = make_handle<QueryCollection>(state);
        if (auto ok = optimize(*collection, state, query_optimizations_); !ok) return ok;
    }
    return {};
}

} // namespace embdb
