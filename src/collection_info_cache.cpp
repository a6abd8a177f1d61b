#include "embdb/collection_info_cache.hpp"

#include <algorithm>

#include "embdb/core/log.hpp"

namespace embdb {

namespace {

constexpr const char* kComponent = "collection_info_cache";

auto find_in(const std::vector<CollectionStateInfo>& list, const std::string& id)
    -> std::optional<CollectionStateInfo> {
    auto it = std::find_if(list.begin(), list.end(), [&](const auto& c) { return c.collection_id == id; });
    if (it == list.end()) return std::nullopt;
    return *it;
}

auto not_found(const std::string& id) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::collection_not_found, "collection not found: " + id, kComponent);
}

} // namespace

auto CollectionInfoCache::create(std::shared_ptr<store::DocumentStore> documents, std::string db_id)
    -> std::expected<std::unique_ptr<CollectionInfoCache>, core::error> {
    std::unique_ptr<CollectionInfoCache> cache(new CollectionInfoCache(std::move(documents), std::move(db_id)));
    if (auto loaded = cache->invalidate_cache(); !loaded) return std::unexpected(loaded.error());
    return cache;
}

auto CollectionInfoCache::invalidate_cache() -> std::expected<void, core::error> {
    auto records = documents_->find(kCollectionInfo, "db_id", Value(db_id_));
    if (!records) return std::unexpected(records.error());
    auto pointer_doc = documents_->find_one(kBlueCollectionId, db_id_);
    if (!pointer_doc) return std::unexpected(pointer_doc.error());

    std::optional<BlueCollectionPointer> pointer;
    if (*pointer_doc) {
        auto p = blue_pointer_from_value(**pointer_doc);
        if (!p) return std::unexpected(p.error());
        pointer = std::move(*p);
    }

    std::vector<CollectionStateInfo> collections;
    std::vector<CollectionStateInfo> query_collections;
    for (const auto& record : *records) {
        auto info = collection_info_from_value(record);
        if (!info) return std::unexpected(info.error());
        CollectionStateInfo state;
        static_cast<CollectionInfo&>(state) = std::move(*info);
        if (pointer) {
            const bool blue = state.contains_queries
                                  ? pointer->query_collection_id && *pointer->query_collection_id == state.collection_id
                                  : pointer->collection_id == state.collection_id;
            if (blue) state.work_state = WorkState::blue;
        }
        (state.contains_queries ? query_collections : collections).push_back(std::move(state));
    }

    std::unique_lock lock(mutex_);
    collections_ = std::move(collections);
    query_collections_ = std::move(query_collections);
    blue_id_.reset();
    blue_query_id_.reset();
    if (pointer) {
        if (find_in(collections_, pointer->collection_id)) blue_id_ = pointer->collection_id;
        if (pointer->query_collection_id && find_in(query_collections_, *pointer->query_collection_id)) {
            blue_query_id_ = pointer->query_collection_id;
        }
    }
    return {};
}

auto CollectionInfoCache::list_collections() const -> std::vector<CollectionStateInfo> {
    std::shared_lock lock(mutex_);
    return collections_;
}

auto CollectionInfoCache::list_query_collections() const -> std::vector<CollectionStateInfo> {
    std::shared_lock lock(mutex_);
    return query_collections_;
}

auto CollectionInfoCache::get_collection(const std::string& collection_id) const
    -> std::optional<CollectionStateInfo> {
    std::shared_lock lock(mutex_);
    return find_in(collections_, collection_id);
}

auto CollectionInfoCache::get_query_collection(const std::string& collection_id) const
    -> std::optional<CollectionStateInfo> {
    std::shared_lock lock(mutex_);
    return find_in(query_collections_, collection_id);
}

auto CollectionInfoCache::get_blue_collection() const -> std::optional<CollectionStateInfo> {
    std::shared_lock lock(mutex_);
    if (!blue_id_) return std::nullopt;
    return find_in(collections_, *blue_id_);
}

auto CollectionInfoCache::get_blue_query_collection() const -> std::optional<CollectionStateInfo> {
    std::shared_lock lock(mutex_);
    if (!blue_query_id_) return std::nullopt;
    return find_in(query_collections_, *blue_query_id_);
}

auto CollectionInfoCache::find_any(const std::string& collection_id) const -> std::optional<CollectionStateInfo> {
    std::shared_lock lock(mutex_);
    if (auto c = find_in(collections_, collection_id)) return c;
    return find_in(query_collections_, collection_id);
}

auto CollectionInfoCache::add(CollectionInfo info, bool contains_queries)
    -> std::expected<CollectionStateInfo, core::error> {
    info.contains_queries = contains_queries;
    info.created_at_ms = now_ms();
    info.index_created = false;
    auto inserted = documents_->insert_one(kCollectionInfo, info.collection_id, to_value(info, db_id_));
    if (!inserted) {
        if (inserted.error().code != core::error_code::already_exists) return std::unexpected(inserted.error());
        core::logger()->warn("collection {} already exists", info.collection_id);
    }
    if (auto loaded = invalidate_cache(); !loaded) return std::unexpected(loaded.error());
    auto stored = contains_queries ? get_query_collection(info.collection_id) : get_collection(info.collection_id);
    if (!stored) {
        return core::make_error(core::error_code::internal,
                                "collection record missing after insert: " + info.collection_id, kComponent);
    }
    return *stored;
}

auto CollectionInfoCache::add_collection(const CollectionInfo& info) -> std::expected<CollectionStateInfo, core::error> {
    return add(info, false);
}

auto CollectionInfoCache::add_query_collection(const CollectionInfo& info)
    -> std::expected<CollectionStateInfo, core::error> {
    return add(info, true);
}

auto CollectionInfoCache::set_blue_collection(const std::string& collection_id,
                                              const std::optional<std::string>& query_collection_id)
    -> std::expected<void, core::error> {
    std::lock_guard serial(set_blue_mutex_);
    if (auto loaded = invalidate_cache(); !loaded) return loaded;
    if (!get_collection(collection_id)) return not_found(collection_id);
    if (query_collection_id && !get_query_collection(*query_collection_id)) return not_found(*query_collection_id);

    const BlueCollectionPointer pointer{db_id_, collection_id, query_collection_id};
    if (auto ok = documents_->upsert_one(kBlueCollectionId, db_id_, to_value(pointer)); !ok) return ok;
    core::logger()->info("blue collection of {} set to {}", db_id_, collection_id);
    return invalidate_cache();
}

auto CollectionInfoCache::set_index_state(const std::string& collection_id, bool created)
    -> std::expected<void, core::error> {
    auto ok = documents_->update_fields(kCollectionInfo, collection_id, Value::map({{"index_created", Value(created)}}));
    if (!ok) {
        if (ok.error().code == core::error_code::not_found) return not_found(collection_id);
        return ok;
    }
    return invalidate_cache();
}

auto CollectionInfoCache::delete_collection(const std::string& collection_id) -> std::expected<void, core::error> {
    auto deleted = documents_->delete_one(kCollectionInfo, collection_id);
    if (!deleted) return std::unexpected(deleted.error());
    return invalidate_cache();
}

auto CollectionInfoCache::add_applied_optimization(const std::string& collection_id, const std::string& name)
    -> std::expected<void, core::error> {
    auto current = find_any(collection_id);
    if (!current) return not_found(collection_id);
    auto& applied = current->applied_optimizations;
    if (std::find(applied.begin(), applied.end(), name) != applied.end()) return {};
    applied.push_back(name);

    Value::Array names;
    for (const auto& n : applied) names.emplace_back(n);
    auto ok = documents_->update_fields(kCollectionInfo, collection_id,
                                        Value::map({{"applied_optimizations", Value(std::move(names))}}));
    if (!ok) return ok;
    return invalidate_cache();
}

} // namespace embdb
