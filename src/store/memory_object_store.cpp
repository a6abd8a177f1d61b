/** \file memory_object_store.cpp
 *  \brief In-process ObjectStore: staged transactions over Roaring-indexed object rows.
 */

#include "embdb/store/memory_object_store.hpp"

#include <algorithm>
#include <atomic>
#include <limits>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "roaring.hh"

#include "embdb/core/log.hpp"
#include "embdb/filter_eval.hpp"
#include "embdb/kernels/distance.hpp"

namespace embdb::store {

namespace {

constexpr const char* kComponent = "store.memory";
constexpr std::size_t kCompactMinDeadRows = 1024;

struct Table {
    SearchIndexInfo index;
    bool vector_index{false};
    std::unordered_map<std::string, std::uint32_t> rows_by_id;
    std::vector<std::optional<Object>> rows;  // row id -> object; deleted rows stay empty until compaction
    std::size_t dead{0};
    roaring::Roaring all;
    roaring::Roaring shared;
    std::unordered_map<std::string, roaring::Roaring> by_user;
};

auto missing_collection(const std::string& id) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::collection_not_found, "no tables for collection: " + id, kComponent);
}

auto view_of(const Object& o) -> filter_eval::row_view {
    return filter_eval::row_view{&o.payload, o.object_id, &o.user_id, &o.session_id, &o.original_id};
}

void index_row(Table& t, std::uint32_t row, const Object& o) {
    t.all.add(row);
    if (o.user_id) t.by_user[*o.user_id].add(row);
    else t.shared.add(row);
}

void unindex_row(Table& t, std::uint32_t row, const Object& o) {
    t.all.remove(row);
    if (!o.user_id) {
        t.shared.remove(row);
        return;
    }
    auto it = t.by_user.find(*o.user_id);
    if (it == t.by_user.end()) return;
    it->second.remove(row);
    if (it->second.isEmpty()) t.by_user.erase(it);
}

/** Shared rows, plus the user's rows minus the canonical rows they customize. */
auto visible_rows(const Table& t, const std::optional<std::string>& user_id) -> roaring::Roaring {
    roaring::Roaring out = t.shared;
    if (!user_id) return out;
    auto it = t.by_user.find(*user_id);
    if (it == t.by_user.end()) return out;
    out |= it->second;
    for (auto r = it->second.begin(); r != it->second.end(); ++r) {
        const auto& o = *t.rows[*r];
        if (!o.original_id) continue;
        auto orig = t.rows_by_id.find(*o.original_id);
        if (orig != t.rows_by_id.end()) out.remove(orig->second);
    }
    return out;
}

/** Drop the tombstones and renumber live rows densely, keeping insertion order. */
void compact(Table& t) {
    std::vector<std::optional<Object>> rows;
    rows.reserve(t.rows.size() - t.dead);
    t.all = roaring::Roaring{};
    t.shared = roaring::Roaring{};
    t.by_user.clear();
    for (auto& slot : t.rows) {
        if (!slot) continue;
        const auto row = static_cast<std::uint32_t>(rows.size());
        t.rows_by_id[slot->object_id] = row;
        rows.push_back(std::move(slot));
        index_row(t, row, *rows.back());
    }
    core::logger()->debug("memory store: compacted {} dead row(s), {} live", t.dead, rows.size());
    t.rows = std::move(rows);
    t.dead = 0;
}

/** `only` selects parts by index, in that order; null copies every part. */
auto to_found(const Object& o, bool with_vectors, const std::vector<std::uint32_t>* only = nullptr) -> FoundObject {
    FoundObject f;
    f.object_id = o.object_id;
    f.original_id = o.original_id;
    f.user_id = o.user_id;
    f.session_id = o.session_id;
    f.payload = o.payload;
    f.storage_meta = o.storage_meta;
    if (only) {
        f.parts.reserve(only->size());
        for (auto i : *only) f.parts.push_back(o.parts[i]);
    } else {
        f.parts = o.parts;
    }
    if (!with_vectors) {
        for (auto& p : f.parts) p.vector.clear();
    }
    return f;
}

struct scored {
    std::uint32_t row;
    double distance;
    std::vector<std::uint32_t> matched;  // part indices within max_distance, closest first
    std::optional<Value> key;            // sort_by key
};

auto score_object(std::uint32_t row, const Object& o, const SimilarityPlan& plan) -> std::optional<scored> {
    std::vector<double> ds;
    ds.reserve(o.parts.size());
    std::vector<std::pair<double, std::uint32_t>> within;
    for (std::uint32_t i = 0; i < o.parts.size(); ++i) {
        const auto& p = o.parts[i];
        if (plan.average_only && !p.is_average) continue;
        if (p.vector.size() != plan.query.size()) continue;
        const double d = kernels::distance(plan.metric, plan.query, p.vector);
        ds.push_back(d);
        if (!plan.max_distance || d <= *plan.max_distance) within.emplace_back(d, i);
    }
    if (ds.empty()) return std::nullopt;
    const double agg = kernels::aggregate(plan.aggregation, ds);
    if (plan.max_distance && agg > *plan.max_distance) return std::nullopt;

    std::sort(within.begin(), within.end(), [&](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first < b.first;
        return o.parts[a.second].part_id < o.parts[b.second].part_id;
    });
    scored s{row, agg, {}, std::nullopt};
    s.matched.reserve(within.size());
    for (const auto& w : within) s.matched.push_back(w.second);
    return s;
}

/** jsonb btree ordering: Null < String < Number < Boolean < Array < Object. */
auto kind_rank(const Value& v) -> int {
    switch (v.kind()) {
    case Value::Kind::Null: return 0;
    case Value::Kind::String: return 1;
    case Value::Kind::Int:
    case Value::Kind::Double: return 2;
    case Value::Kind::Bool: return 3;
    case Value::Kind::Array: return 4;
    case Value::Kind::Map: return 5;
    }
    return 0;
}

auto compare_values(const Value& a, const Value& b) -> int {
    const int ra = kind_rank(a), rb = kind_rank(b);
    if (ra != rb) return ra < rb ? -1 : 1;
    switch (a.kind()) {
    case Value::Kind::String: {
        const int c = a.as_string()->compare(*b.as_string());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    case Value::Kind::Int:
    case Value::Kind::Double: {
        const double x = *a.as_number(), y = *b.as_number();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    case Value::Kind::Bool: return static_cast<int>(*a.as_bool()) - static_cast<int>(*b.as_bool());
    case Value::Kind::Array: {
        const auto& xa = *a.as_array();
        const auto& xb = *b.as_array();
        if (xa.size() != xb.size()) return xa.size() < xb.size() ? -1 : 1;
        for (std::size_t i = 0; i < xa.size(); ++i) {
            if (int c = compare_values(xa[i], xb[i]); c != 0) return c;
        }
        return 0;
    }
    case Value::Kind::Map: {
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        return 0;
    }
    default: return 0;
    }
}

/** Sort key of one row: nullopt sorts last in both directions. */
auto sort_key(const Object& o, const SortByOptions& s) -> std::optional<Value> {
    if (!s.force_not_payload) {
        const Value* v = o.payload.find_path(s.field);
        if (!v) return std::nullopt;
        return *v;
    }
    if (s.field == "object_id") return Value(o.object_id);
    const std::optional<std::string>* col = nullptr;
    if (s.field == "user_id") col = &o.user_id;
    else if (s.field == "session_id") col = &o.session_id;
    else if (s.field == "original_id") col = &o.original_id;
    if (!col || !col->has_value()) return std::nullopt;
    return Value(**col);
}

auto key_before(const std::optional<Value>& a, const std::optional<Value>& b, SortOrder order) -> bool {
    if (!a || !b) return a.has_value() && !b.has_value();
    const int c = compare_values(*a, *b);
    return order == SortOrder::asc ? c < 0 : c > 0;
}

auto lock_key(const std::string& collection_id, const std::string& object_id) -> std::string {
    std::string k;
    k.reserve(collection_id.size() + object_id.size() + 1);
    k.append(collection_id).push_back('\x1f');
    k.append(object_id);
    return k;
}

} // namespace

class MemoryObjectStore::Impl {
public:
    auto create_tables(const std::string& collection_id, const SearchIndexInfo& index) -> std::expected<void, core::error> {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = tables_.try_emplace(collection_id);
        if (inserted) it->second.index = index;
        return {};
    }

    auto drop_tables(const std::string& collection_id) -> std::expected<void, core::error> {
        std::unique_lock lock(mutex_);
        tables_.erase(collection_id);
        return {};
    }

    auto create_vector_index(const std::string& collection_id) -> std::expected<void, core::error> {
        std::unique_lock lock(mutex_);
        auto it = tables_.find(collection_id);
        if (it == tables_.end()) return missing_collection(collection_id);
        it->second.vector_index = true;
        return {};
    }

    auto has_table(const std::string& collection_id) const -> bool {
        std::shared_lock lock(mutex_);
        return tables_.count(collection_id) > 0;
    }

    auto has_vector_index(const std::string& collection_id) const -> bool {
        std::shared_lock lock(mutex_);
        auto it = tables_.find(collection_id);
        return it != tables_.end() && it->second.vector_index;
    }

    auto allocated_rows(const std::string& collection_id) const -> std::size_t {
        std::shared_lock lock(mutex_);
        auto it = tables_.find(collection_id);
        return it == tables_.end() ? 0 : it->second.rows.size();
    }

    auto next_transaction_id() -> std::uint64_t { return next_txn_.fetch_add(1, std::memory_order_relaxed); }

    /** Committed copy of one object, or nullopt when absent. */
    auto committed(const std::string& collection_id, const std::string& object_id) const
        -> std::expected<std::optional<Object>, core::error> {
        std::shared_lock lock(mutex_);
        auto t = tables_.find(collection_id);
        if (t == tables_.end()) return missing_collection(collection_id);
        auto r = t->second.rows_by_id.find(object_id);
        if (r == t->second.rows_by_id.end()) return std::optional<Object>{};
        return t->second.rows[r->second];
    }

    /** All-or-nothing NOWAIT acquisition of row locks for `txn`. */
    auto try_lock(const std::string& collection_id, const std::vector<std::string>& ids, std::uint64_t txn)
        -> std::expected<std::vector<std::string>, core::error> {
        std::lock_guard lock(lock_mutex_);
        std::vector<std::string> acquired;
        for (const auto& id : ids) {
            auto it = row_locks_.find(lock_key(collection_id, id));
            if (it != row_locks_.end() && it->second != txn) {
                return core::make_error(core::error_code::lock_not_available,
                                        "row is locked by another transaction: " + id, kComponent);
            }
        }
        for (const auto& id : ids) {
            auto [it, inserted] = row_locks_.try_emplace(lock_key(collection_id, id), txn);
            if (inserted) acquired.push_back(id);
        }
        return acquired;
    }

    void release(const std::string& collection_id, const std::vector<std::string>& ids, std::uint64_t txn) noexcept {
        std::lock_guard lock(lock_mutex_);
        for (const auto& id : ids) {
            auto it = row_locks_.find(lock_key(collection_id, id));
            if (it != row_locks_.end() && it->second == txn) row_locks_.erase(it);
        }
    }

    auto apply(const std::string& collection_id, std::unordered_map<std::string, std::optional<Object>>& staged,
               const std::vector<std::string>& order) -> std::expected<void, core::error> {
        std::unique_lock lock(mutex_);
        auto tit = tables_.find(collection_id);
        if (tit == tables_.end()) return missing_collection(collection_id);
        Table& t = tit->second;

        std::size_t fresh = 0;
        for (const auto& id : order) {
            if (staged[id] && t.rows_by_id.find(id) == t.rows_by_id.end()) ++fresh;
        }
        if (t.rows.size() + fresh > std::numeric_limits<std::uint32_t>::max() && t.dead > 0) compact(t);
        if (t.rows.size() + fresh > std::numeric_limits<std::uint32_t>::max()) {
            return std::unexpected(core::error{core::error_code::precondition_failed,
                                               "row count exceeds 32-bit limit required by Roaring", kComponent});
        }

        for (const auto& id : order) {
            auto& next = staged[id];
            auto existing = t.rows_by_id.find(id);
            if (existing != t.rows_by_id.end()) {
                const std::uint32_t row = existing->second;
                unindex_row(t, row, *t.rows[row]);
                if (next) {
                    t.rows[row] = std::move(next);
                    index_row(t, row, *t.rows[row]);
                } else {
                    t.rows[row].reset();
                    t.rows_by_id.erase(existing);
                    ++t.dead;
                }
            } else if (next) {
                const auto row = static_cast<std::uint32_t>(t.rows.size());
                t.rows.push_back(std::move(next));
                t.rows_by_id.emplace(id, row);
                index_row(t, row, *t.rows[row]);
            }
        }
        if (t.dead >= kCompactMinDeadRows && t.dead > t.rows.size() - t.dead) compact(t);
        return {};
    }

    template <typename Fn>
    auto read(const std::string& collection_id, Fn&& fn) const {
        std::shared_lock lock(mutex_);
        using R = decltype(fn(std::declval<const Table&>()));
        auto it = tables_.find(collection_id);
        if (it == tables_.end()) return R(missing_collection(collection_id));
        return fn(it->second);
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Table> tables_;

    std::mutex lock_mutex_;
    std::unordered_map<std::string, std::uint64_t> row_locks_;
    std::atomic<std::uint64_t> next_txn_{1};
};

namespace {

class MemoryTransaction final : public Transaction {
public:
    MemoryTransaction(std::shared_ptr<MemoryObjectStore::Impl> store, std::string collection_id)
        : store_(std::move(store)), collection_id_(std::move(collection_id)), id_(store_->next_transaction_id()) {}

    ~MemoryTransaction() override { rollback(); }

    auto lock_objects(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> override {
        if (auto r = check_open(); !r) return r;
        auto acquired = store_->try_lock(collection_id_, object_ids, id_);
        if (!acquired) return std::unexpected(acquired.error());
        locked_.insert(locked_.end(), acquired->begin(), acquired->end());
        return {};
    }

    auto insert_objects(const std::vector<Object>& objects) -> std::expected<void, core::error> override {
        if (auto r = check_open(); !r) return r;
        for (const auto& o : objects) {
            auto cur = current(o.object_id);
            if (!cur) return std::unexpected(cur.error());
            if (*cur) {
                return core::make_error(core::error_code::already_exists, "object already exists: " + o.object_id,
                                        kComponent);
            }
            Object row = o;
            row.parts.clear();
            stage(o.object_id, std::move(row));
        }
        return {};
    }

    auto upsert_objects(const std::vector<Object>& objects) -> std::expected<void, core::error> override {
        if (auto r = check_open(); !r) return r;
        for (const auto& o : objects) {
            auto cur = current(o.object_id);
            if (!cur) return std::unexpected(cur.error());
            Object row = o;
            row.parts = *cur ? std::move((*cur)->parts) : std::vector<ObjectPart>{};
            stage(o.object_id, std::move(row));
        }
        return {};
    }

    auto insert_parts(const std::vector<Object>& objects) -> std::expected<void, core::error> override {
        return write_parts(objects, /*overwrite=*/false);
    }

    auto upsert_parts(const std::vector<Object>& objects) -> std::expected<void, core::error> override {
        return write_parts(objects, /*overwrite=*/true);
    }

    auto delete_parts(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> override {
        if (auto r = check_open(); !r) return r;
        for (const auto& id : object_ids) {
            auto cur = current(id);
            if (!cur) return std::unexpected(cur.error());
            if (!*cur) continue;
            (*cur)->parts.clear();
            stage(id, std::move(*cur));
        }
        return {};
    }

    auto delete_objects(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> override {
        if (auto r = check_open(); !r) return r;
        for (const auto& id : object_ids) {
            auto cur = current(id);
            if (!cur) return std::unexpected(cur.error());
            if (*cur) stage(id, std::nullopt);
        }
        return {};
    }

    auto commit() -> std::expected<void, core::error> override {
        if (auto r = check_open(); !r) return r;
        auto applied = store_->apply(collection_id_, staged_, order_);
        finish();
        if (!applied) return applied;
        core::logger()->debug("memory commit {}: {} row(s) in {}", id_, order_.size(), collection_id_);
        return {};
    }

    void rollback() noexcept override {
        if (done_) return;
        finish();
    }

private:
    auto check_open() const -> std::expected<void, core::error> {
        if (!done_) return {};
        return core::make_error(core::error_code::precondition_failed, "transaction already finished", kComponent);
    }

    /** Staged state when present, else the committed row. */
    auto current(const std::string& id) -> std::expected<std::optional<Object>, core::error> {
        auto it = staged_.find(id);
        if (it != staged_.end()) return it->second;
        return store_->committed(collection_id_, id);
    }

    void stage(const std::string& id, std::optional<Object> next) {
        auto [it, inserted] = staged_.insert_or_assign(id, std::move(next));
        if (inserted) order_.push_back(id);
    }

    auto write_parts(const std::vector<Object>& objects, bool overwrite) -> std::expected<void, core::error> {
        if (auto r = check_open(); !r) return r;
        for (const auto& o : objects) {
            auto cur = current(o.object_id);
            if (!cur) return std::unexpected(cur.error());
            if (!*cur) {
                return core::make_error(core::error_code::not_found, "parts reference a missing object: " + o.object_id,
                                        kComponent);
            }
            auto& parts = (*cur)->parts;
            for (const auto& p : o.parts) {
                auto same = std::find_if(parts.begin(), parts.end(),
                                         [&](const ObjectPart& x) { return x.part_id == p.part_id; });
                if (same == parts.end()) {
                    parts.push_back(p);
                } else if (overwrite) {
                    *same = p;
                } else {
                    return core::make_error(core::error_code::already_exists,
                                            "part already exists: " + o.object_id + "/" + p.part_id, kComponent);
                }
            }
            stage(o.object_id, std::move(*cur));
        }
        return {};
    }

    void finish() noexcept {
        done_ = true;
        store_->release(collection_id_, locked_, id_);
        locked_.clear();
    }

    std::shared_ptr<MemoryObjectStore::Impl> store_;
    std::string collection_id_;
    std::uint64_t id_;
    bool done_{false};
    std::vector<std::string> locked_;
    std::unordered_map<std::string, std::optional<Object>> staged_;
    std::vector<std::string> order_;
};

} // namespace

MemoryObjectStore::MemoryObjectStore() : impl_(std::make_shared<Impl>()) {}
MemoryObjectStore::~MemoryObjectStore() = default;

auto MemoryObjectStore::create_tables(const std::string& collection_id, const SearchIndexInfo& index)
    -> std::expected<void, core::error> {
    core::logger()->debug("memory store: create tables for {}", collection_id);
    return impl_->create_tables(collection_id, index);
}

auto MemoryObjectStore::drop_tables(const std::string& collection_id) -> std::expected<void, core::error> {
    core::logger()->debug("memory store: drop tables for {}", collection_id);
    return impl_->drop_tables(collection_id);
}

auto MemoryObjectStore::create_vector_index(const std::string& collection_id, const SearchIndexInfo&)
    -> std::expected<void, core::error> {
    return impl_->create_vector_index(collection_id);
}

auto MemoryObjectStore::analyze(const std::string& collection_id) -> std::expected<void, core::error> {
    if (!impl_->has_table(collection_id)) return missing_collection(collection_id);
    return {};
}

auto MemoryObjectStore::has_vector_index(const std::string& collection_id) const -> bool {
    return impl_->has_vector_index(collection_id);
}

auto MemoryObjectStore::allocated_rows(const std::string& collection_id) const -> std::size_t {
    return impl_->allocated_rows(collection_id);
}

auto MemoryObjectStore::begin(const std::string& collection_id)
    -> std::expected<std::unique_ptr<Transaction>, core::error> {
    if (!impl_->has_table(collection_id)) return missing_collection(collection_id);
    return std::make_unique<MemoryTransaction>(impl_, collection_id);
}

auto MemoryObjectStore::find_by_ids(const std::string& collection_id, const std::vector<std::string>& object_ids)
    -> std::expected<std::vector<Object>, core::error> {
    return impl_->read(collection_id, [&](const Table& t) -> std::expected<std::vector<Object>, core::error> {
        std::vector<Object> out;
        std::unordered_set<std::string> seen;
        for (const auto& id : object_ids) {
            if (!seen.insert(id).second) continue;
            auto it = t.rows_by_id.find(id);
            if (it != t.rows_by_id.end()) out.push_back(*t.rows[it->second]);
        }
        return out;
    });
}

auto MemoryObjectStore::find_by_original_ids(const std::string& collection_id,
                                             const std::vector<std::string>& original_ids)
    -> std::expected<std::vector<Object>, core::error> {
    return impl_->read(collection_id, [&](const Table& t) -> std::expected<std::vector<Object>, core::error> {
        const std::unordered_set<std::string> wanted(original_ids.begin(), original_ids.end());
        std::vector<Object> out;
        for (auto r = t.all.begin(); r != t.all.end(); ++r) {
            const auto& o = *t.rows[*r];
            if (o.original_id && wanted.count(*o.original_id)) out.push_back(o);
        }
        return out;
    });
}

auto MemoryObjectStore::find_by_session_id(const std::string& collection_id, const std::string& session_id)
    -> std::expected<std::vector<Object>, core::error> {
    return impl_->read(collection_id, [&](const Table& t) -> std::expected<std::vector<Object>, core::error> {
        std::vector<Object> out;
        for (auto r = t.all.begin(); r != t.all.end(); ++r) {
            const auto& o = *t.rows[*r];
            if (o.session_id && *o.session_id == session_id) out.push_back(o);
        }
        return out;
    });
}

auto MemoryObjectStore::count(const std::string& collection_id, bool originals_only)
    -> std::expected<std::size_t, core::error> {
    return impl_->read(collection_id, [&](const Table& t) -> std::expected<std::size_t, core::error> {
        return static_cast<std::size_t>(originals_only ? t.shared.cardinality() : t.all.cardinality());
    });
}

auto MemoryObjectStore::count_by_filter(const std::string& collection_id, const filter_expr* filter)
    -> std::expected<std::size_t, core::error> {
    return impl_->read(collection_id, [&](const Table& t) -> std::expected<std::size_t, core::error> {
        if (!filter) return static_cast<std::size_t>(t.shared.cardinality());
        std::size_t n = 0;
        for (auto r = t.shared.begin(); r != t.shared.end(); ++r) {
            if (filter_eval::matches(*filter, view_of(*t.rows[*r]))) ++n;
        }
        return n;
    });
}

auto MemoryObjectStore::common_data_batch(const std::string& collection_id, std::size_t limit, std::size_t offset,
                                          bool originals_only)
    -> std::expected<std::vector<ObjectCommonData>, core::error> {
    return impl_->read(collection_id, [&](const Table& t) -> std::expected<std::vector<ObjectCommonData>, core::error> {
        const auto& rows = originals_only ? t.shared : t.all;
        std::vector<ObjectCommonData> out;
        std::size_t skipped = 0;
        for (auto r = rows.begin(); r != rows.end() && out.size() < limit; ++r) {
            if (skipped < offset) {
                ++skipped;
                continue;
            }
            const auto& o = *t.rows[*r];
            out.push_back(ObjectCommonData{o.object_id, o.payload, o.storage_meta});
        }
        return out;
    });
}

auto MemoryObjectStore::similarity_search(const std::string& collection_id, const SimilarityPlan& plan)
    -> std::expected<SearchResults, core::error> {
    return impl_->read(collection_id, [&](const Table& t) -> std::expected<SearchResults, core::error> {
        if (auto ok = kernels::validate_dimensions(plan.query, t.index.dimensions, "query vector"); !ok) {
            return std::unexpected(ok.error());
        }
        const roaring::Roaring visible = visible_rows(t, plan.user_id);
        auto passes = [&](std::uint32_t row) {
            return !plan.filter || filter_eval::matches(*plan.filter, view_of(*t.rows[row]));
        };
        auto closer = [&](const scored& a, const scored& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            return t.rows[a.row]->object_id < t.rows[b.row]->object_id;
        };

        std::vector<scored> hits;
        std::size_t subset = 0;
        if (!plan.similarity_first) {
            for (auto r = visible.begin(); r != visible.end(); ++r) {
                if (!passes(*r)) continue;
                ++subset;
                auto s = score_object(*r, *t.rows[*r], plan);
                if (!s) continue;
                if (plan.sort_by) s->key = sort_key(*t.rows[*r], *plan.sort_by);
                hits.push_back(std::move(*s));
            }
            std::sort(hits.begin(), hits.end(), closer);
            if (plan.sort_by) {
                std::stable_sort(hits.begin(), hits.end(), [&](const scored& a, const scored& b) {
                    return key_before(a.key, b.key, plan.sort_by->order);
                });
            }
        } else {
            for (auto r = visible.begin(); r != visible.end(); ++r) {
                if (auto s = score_object(*r, *t.rows[*r], plan)) hits.push_back(std::move(*s));
            }
            std::sort(hits.begin(), hits.end(), closer);
            if (plan.window > 0 && hits.size() > plan.window) hits.resize(plan.window);
            std::erase_if(hits, [&](const scored& s) { return !passes(s.row); });
            subset = hits.size();
        }

        SearchResults res;
        const std::size_t first = std::min(plan.offset, hits.size());
        const std::size_t last = first + std::min(plan.limit, hits.size() - first);
        for (std::size_t i = first; i < last; ++i) {
            auto found = to_found(*t.rows[hits[i].row], plan.with_vectors, &hits[i].matched);
            found.parts_found = static_cast<std::uint32_t>(hits[i].matched.size());
            found.distance = hits[i].distance;
            res.found_objects.push_back(std::move(found));
        }
        res.next_offset = page_next_offset(res.found_objects.size(), plan.limit, plan.offset);
        res.subset_count = subset;
        return res;
    });
}

auto MemoryObjectStore::payload_search(const std::string& collection_id, const PayloadPlan& plan)
    -> std::expected<SearchResults, core::error> {
    return impl_->read(collection_id, [&](const Table& t) -> std::expected<SearchResults, core::error> {
        const roaring::Roaring visible = visible_rows(t, plan.user_id);
        std::vector<std::uint32_t> rows;
        for (auto r = visible.begin(); r != visible.end(); ++r) {
            if (!plan.filter || filter_eval::matches(*plan.filter, view_of(*t.rows[*r]))) rows.push_back(*r);
        }

        if (plan.sort_by) {
            const auto& s = *plan.sort_by;
            std::vector<std::pair<std::uint32_t, std::optional<Value>>> keyed;
            keyed.reserve(rows.size());
            for (auto r : rows) keyed.emplace_back(r, sort_key(*t.rows[r], s));
            std::stable_sort(keyed.begin(), keyed.end(),
                             [&](const auto& a, const auto& b) { return key_before(a.second, b.second, s.order); });
            for (std::size_t i = 0; i < keyed.size(); ++i) rows[i] = keyed[i].first;
        }

        SearchResults res;
        const std::size_t first = std::min(plan.offset, rows.size());
        const std::size_t last = first + std::min(plan.limit, rows.size() - first);
        for (std::size_t i = first; i < last; ++i) {
            auto found = to_found(*t.rows[rows[i]], plan.with_vectors);
            found.parts_found = static_cast<std::uint32_t>(found.parts.size());
            res.found_objects.push_back(std::move(found));
        }
        res.next_offset = page_next_offset(res.found_objects.size(), plan.limit, plan.offset);
        return res;
    });
}

} // namespace embdb::store
