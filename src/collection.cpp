#include "embdb/collection.hpp"

#include <algorithm>
#include <cmath>
#include <thread>
#include <unordered_set>

#include "embdb/core/log.hpp"
#include "embdb/kernels/distance.hpp"
#include "embdb/query_compiler.hpp"

namespace embdb {

namespace {

constexpr const char* kComponent = "collection";
constexpr std::size_t kMaxObjectIdLength = 128;

auto invalid(std::string message) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::invalid_argument, std::move(message), kComponent);
}

auto unique_ids(const std::vector<std::string>& ids) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& id : ids) {
        if (seen.insert(id).second) out.push_back(id);
    }
    return out;
}

auto ids_of(const std::vector<Object>& objects) -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(objects.size());
    for (const auto& o : objects) out.push_back(o.object_id);
    return out;
}

auto compile_optional(const std::optional<PayloadFilter>& filter)
    -> std::expected<std::optional<filter_expr>, core::error> {
    if (!filter) return std::optional<filter_expr>{};
    auto expr = compile(*filter);
    if (!expr) return std::unexpected(expr.error());
    return std::optional<filter_expr>(std::move(*expr));
}

auto check_sortable(const std::optional<SortByOptions>& sort_by) -> std::expected<void, core::error> {
    if (sort_by && sort_by->force_not_payload && !is_filterable_column(sort_by->field)) {
        return invalid("column is not sortable: " + sort_by->field);
    }
    return {};
}

} // namespace

Collection::Collection(std::string collection_id, SearchIndexInfo index, std::shared_ptr<store::ObjectStore> store,
                       std::shared_ptr<CollectionInfoCache> cache, CollectionOptions options)
    : collection_id_(std::move(collection_id)),
      index_(index),
      store_(std::move(store)),
      cache_(std::move(cache)),
      options_(options) {}

auto Collection::get_state_info() const -> std::expected<CollectionStateInfo, core::error> {
    auto info = contains_queries() ? cache_->get_query_collection(collection_id_) : cache_->get_collection(collection_id_);
    if (!info) {
        return core::make_error(core::error_code::collection_not_found, "collection not found: " + collection_id_,
                                kComponent);
    }
    return *info;
}

auto Collection::get_info() const -> std::expected<CollectionInfo, core::error> {
    auto state = get_state_info();
    if (!state) return std::unexpected(state.error());
    return static_cast<CollectionInfo>(*state);
}

auto Collection::prepare(const std::vector<Object>& objects) const -> std::expected<std::vector<Object>, core::error> {
    std::vector<Object> out = objects;
    std::unordered_set<std::string> object_ids;
    for (auto& o : out) {
        if (o.object_id.empty() || o.object_id.size() > kMaxObjectIdLength) {
            return invalid("object_id must be 1.." + std::to_string(kMaxObjectIdLength) + " characters");
        }
        if (!object_ids.insert(o.object_id).second) return invalid("duplicate object_id in batch: " + o.object_id);

        std::unordered_set<std::string> part_ids;
        for (std::size_t i = 0; i < o.parts.size(); ++i) {
            auto& part = o.parts[i];
            if (part.part_id.empty()) part.part_id = o.object_id + "_" + std::to_string(i);
            if (!part_ids.insert(part.part_id).second) {
                return invalid("duplicate part_id " + part.part_id + " in object " + o.object_id);
            }
            if (auto ok = kernels::validate_dimensions(part.vector, index_.dimensions, "part " + part.part_id); !ok) {
                return std::unexpected(ok.error());
            }
            if (auto ok = kernels::validate_finite(part.vector, "part " + part.part_id); !ok) {
                return std::unexpected(ok.error());
            }
        }
    }
    return out;
}

auto Collection::write_locked(const std::vector<std::string>& object_ids,
                              const std::function<std::expected<void, core::error>(store::Transaction&)>& write)
    -> std::expected<void, core::error> {
    const std::uint32_t attempts = std::max<std::uint32_t>(1, options_.lock_max_attempts);
    for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        auto txn = store_->begin(collection_id_);
        if (!txn) return std::unexpected(txn.error());

        auto locked = (*txn)->lock_objects(object_ids);
        if (!locked) {
            (*txn)->rollback();
            if (locked.error().code != core::error_code::lock_not_available) return locked;
            core::logger()->warn("{}: objects locked, attempt {}/{}", collection_id_, attempt, attempts);
            if (attempt < attempts) std::this_thread::sleep_for(options_.lock_wait);
            continue;
        }

        if (auto ok = write(**txn); !ok) {
            (*txn)->rollback();
            return ok;
        }
        return (*txn)->commit();
    }
    return core::make_error(core::error_code::lock_acquisition_failed,
                            "could not lock objects of " + collection_id_ + " after " + std::to_string(attempts) +
                                " attempts",
                            kComponent);
}

auto Collection::insert(const std::vector<Object>& objects) -> std::expected<void, core::error> {
    if (objects.empty()) return {};
    auto prepared = prepare(objects);
    if (!prepared) return std::unexpected(prepared.error());
    auto ok = write_locked(ids_of(*prepared), [&](store::Transaction& txn) -> std::expected<void, core::error> {
        if (auto r = txn.insert_objects(*prepared); !r) return r;
        return txn.insert_parts(*prepared);
    });
    if (ok) core::logger()->debug("{}: inserted {} objects", collection_id_, prepared->size());
    return ok;
}

auto Collection::upsert(const std::vector<Object>& objects, bool shrink_parts) -> std::expected<void, core::error> {
    if (objects.empty()) return {};
    auto prepared = prepare(objects);
    if (!prepared) return std::unexpected(prepared.error());
    const auto ids = ids_of(*prepared);
    auto ok = write_locked(ids, [&](store::Transaction& txn) -> std::expected<void, core::error> {
        if (auto r = txn.upsert_objects(*prepared); !r) return r;
        if (!shrink_parts) return txn.upsert_parts(*prepared);
        if (auto r = txn.delete_parts(ids); !r) return r;
        return txn.insert_parts(*prepared);
    });
    if (ok) core::logger()->debug("{}: upserted {} objects", collection_id_, prepared->size());
    return ok;
}

auto Collection::remove(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> {
    const auto ids = unique_ids(object_ids);
    if (ids.empty()) return {};
    auto ok = write_locked(ids, [&](store::Transaction& txn) -> std::expected<void, core::error> {
        if (auto r = txn.delete_parts(ids); !r) return r;
        return txn.delete_objects(ids);
    });
    if (ok) core::logger()->debug("{}: removed {} objects", collection_id_, ids.size());
    return ok;
}

auto Collection::find_by_ids(const std::vector<std::string>& object_ids) const
    -> std::expected<std::vector<Object>, core::error> {
    return store_->find_by_ids(collection_id_, unique_ids(object_ids));
}

auto Collection::find_by_original_ids(const std::vector<std::string>& original_ids) const
    -> std::expected<std::vector<Object>, core::error> {
    return store_->find_by_original_ids(collection_id_, unique_ids(original_ids));
}

auto Collection::get_total(bool originals_only) const -> std::expected<std::size_t, core::error> {
    return store_->count(collection_id_, originals_only);
}

auto Collection::get_objects_common_data_batch(std::size_t limit, std::size_t offset, bool originals_only) const
    -> std::expected<ObjectsCommonDataBatch, core::error> {
    auto total = store_->count(collection_id_, originals_only);
    if (!total) return std::unexpected(total.error());
    auto objects = store_->common_data_batch(collection_id_, limit, offset, originals_only);
    if (!objects) return std::unexpected(objects.error());
    ObjectsCommonDataBatch batch;
    batch.next_offset = store::page_next_offset(objects->size(), limit, offset);
    batch.objects = std::move(*objects);
    batch.total = *total;
    return batch;
}

auto Collection::count_by_payload_filter(const std::optional<PayloadFilter>& filter) const
    -> std::expected<std::size_t, core::error> {
    auto expr = compile_optional(filter);
    if (!expr) return std::unexpected(expr.error());
    return store_->count_by_filter(collection_id_, *expr ? &**expr : nullptr);
}

auto Collection::create_index() -> std::expected<void, core::error> {
    if (auto ok = store_->create_vector_index(collection_id_, index_); !ok) return ok;
    core::logger()->info("{}: vector index created", collection_id_);
    return cache_->set_index_state(collection_id_, true);
}

auto Collection::analyze() -> std::expected<void, core::error> {
    return store_->analyze(collection_id_);
}

auto Collection::find_similarities(std::span<const float> query, const SimilarityParams& params) const
    -> std::expected<SearchResults, core::error> {
    if (auto ok = kernels::validate_dimensions(query, index_.dimensions, "query vector"); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = kernels::validate_finite(query, "query vector"); !ok) return std::unexpected(ok.error());
    if (params.max_distance && std::isnan(*params.max_distance)) return invalid("max_distance is NaN");
    if (auto ok = check_sortable(params.sort_by); !ok) return std::unexpected(ok.error());
    auto filter = compile_optional(params.payload_filter);
    if (!filter) return std::unexpected(filter.error());

    store::SimilarityPlan plan;
    plan.query.assign(query.begin(), query.end());
    plan.metric = index_.metric;
    plan.aggregation = index_.aggregation;
    plan.limit = params.limit;
    plan.offset = params.offset;
    plan.max_distance = params.max_distance;
    plan.filter = std::move(*filter);
    plan.user_id = params.user_id;
    plan.similarity_first = params.similarity_first;
    plan.window = store::saturating_mul(store::saturating_add(params.offset, params.limit), options_.prefetch_factor);
    plan.sort_by = params.sort_by;
    plan.average_only = params.average_only;
    plan.with_vectors = params.with_vectors;
    return store_->similarity_search(collection_id_, plan);
}

auto Collection::find_by_payload_filter(const PayloadSearchParams& params) const
    -> std::expected<SearchResults, core::error> {
    if (auto ok = check_sortable(params.sort_by); !ok) return std::unexpected(ok.error());
    auto filter = compile_optional(params.payload_filter);
    if (!filter) return std::unexpected(filter.error());

    store::PayloadPlan plan;
    plan.filter = std::move(*filter);
    plan.limit = params.limit;
    plan.offset = params.offset;
    plan.sort_by = params.sort_by;
    plan.user_id = params.user_id;
    plan.with_vectors = params.with_vectors;
    return store_->payload_search(collection_id_, plan);
}

auto QueryCollection::find_by_session_id(const std::string& session_id) const
    -> std::expected<std::optional<Object>, core::error> {
    auto objects = store().find_by_session_id(collection_id(), session_id);
    if (!objects) return std::unexpected(objects.error());
    if (objects->empty()) return std::optional<Object>{};
    return std::optional<Object>(std::move(objects->front()));
}

} // namespace embdb
