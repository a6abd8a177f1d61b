#include "embdb/store/pg_object_store.hpp"

#include <charconv>
#include <unordered_map>
#include <utility>

#include "embdb/core/log.hpp"
#include "embdb/json.hpp"
#include "embdb/sql/pg_statements.hpp"

namespace embdb::store {

namespace {

constexpr const char* kComponent = "store.pg";

auto run(PgConnection& conn, const sql::statement& st) -> std::expected<pg_result, core::error> {
    return conn.exec_params(st.text, st.params);
}

auto text_at(PGresult* res, int row, int col) -> std::optional<std::string> {
    if (PQgetisnull(res, row, col)) return std::nullopt;
    return std::string(PQgetvalue(res, row, col), static_cast<std::size_t>(PQgetlength(res, row, col)));
}

auto json_at(PGresult* res, int row, int col) -> std::expected<Value, core::error> {
    auto text = text_at(res, row, col);
    if (!text) return Value::empty_map();
    return parse_json_value(*text);
}

template <typename T>
auto number_at(PGresult* res, int row, int col) -> std::expected<T, core::error> {
    const char* s = PQgetvalue(res, row, col);
    const char* end = s + PQgetlength(res, row, col);
    T out{};
    auto [ptr, ec] = std::from_chars(s, end, out);
    if (ec != std::errc{} || ptr != end) {
        return core::make_error(core::error_code::data_integrity, std::string("bad numeric column: ") + s, kComponent);
    }
    return out;
}

/** Object row laid out as sql::kObjectColumns starting at `col`. */
auto object_at(PGresult* res, int row, int col) -> std::expected<Object, core::error> {
    Object o;
    o.object_id = text_at(res, row, col).value_or("");
    auto payload = json_at(res, row, col + 1);
    if (!payload) return std::unexpected(payload.error());
    auto meta = json_at(res, row, col + 2);
    if (!meta) return std::unexpected(meta.error());
    o.payload = std::move(*payload);
    o.storage_meta = std::move(*meta);
    o.user_id = text_at(res, row, col + 3);
    o.session_id = text_at(res, row, col + 4);
    o.original_id = text_at(res, row, col + 5);
    return o;
}

auto objects_of(PGresult* res) -> std::expected<std::vector<Object>, core::error> {
    std::vector<Object> out;
    const int n = PQntuples(res);
    out.reserve(static_cast<std::size_t>(n));
    for (int r = 0; r < n; ++r) {
        auto o = object_at(res, r, 0);
        if (!o) return std::unexpected(o.error());
        out.push_back(std::move(*o));
    }
    return out;
}

/** Load the parts of `objects` in pseq order. */
template <typename Item, typename IdOf, typename PartsOf>
auto hydrate(PgConnection& conn, std::string_view collection_id, std::vector<Item>& items, bool with_vectors,
             IdOf id_of, PartsOf parts_of) -> std::expected<void, core::error> {
    if (items.empty()) return {};
    std::vector<std::string> ids;
    std::unordered_map<std::string, Item*> by_id;
    ids.reserve(items.size());
    for (auto& item : items) {
        ids.push_back(id_of(item));
        by_id.emplace(id_of(item), &item);
    }
    auto res = run(conn, sql::parts_by_object_ids(collection_id, ids, with_vectors));
    if (!res) return std::unexpected(res.error());
    PGresult* r = res->get();
    for (int row = 0; row < PQntuples(r); ++row) {
        auto it = by_id.find(text_at(r, row, 0).value_or(""));
        if (it == by_id.end()) continue;
        ObjectPart part;
        part.part_id = text_at(r, row, 1).value_or("");
        part.is_average = text_at(r, row, 2).value_or("f") == "t";
        if (with_vectors) {
            auto v = sql::parse_vector_literal(text_at(r, row, 3).value_or(""));
            if (!v) return std::unexpected(v.error());
            part.vector = std::move(*v);
        }
        parts_of(*it->second).push_back(std::move(part));
    }
    return {};
}

auto hydrate_objects(PgConnection& conn, std::string_view collection_id, std::vector<Object>& objects)
    -> std::expected<void, core::error> {
    return hydrate(conn, collection_id, objects, true, [](const Object& o) { return o.object_id; },
                   [](Object& o) -> std::vector<ObjectPart>& { return o.parts; });
}

auto hydrate_found(PgConnection& conn, std::string_view collection_id, std::vector<FoundObject>& found,
                   bool with_vectors) -> std::expected<void, core::error> {
    return hydrate(conn, collection_id, found, with_vectors, [](const FoundObject& f) { return f.object_id; },
                   [](FoundObject& f) -> std::vector<ObjectPart>& { return f.parts; });
}

/** Part ids of a JSON text array; NULL yields none. */
auto part_ids_at(PGresult* res, int row, int col) -> std::expected<std::vector<std::string>, core::error> {
    std::vector<std::string> out;
    auto text = text_at(res, row, col);
    if (!text) return out;
    auto parsed = parse_json_value(*text);
    if (!parsed) return std::unexpected(parsed.error());
    const auto* items = parsed->as_array();
    if (!items) return core::make_error(core::error_code::data_integrity, "matched parts is not an array", kComponent);
    out.reserve(items->size());
    for (const auto& item : *items) {
        const auto* id = item.as_string();
        if (!id) return core::make_error(core::error_code::data_integrity, "matched part id is not a string", kComponent);
        out.push_back(*id);
    }
    return out;
}

/** Keep the parts named in `order`, in that order. */
void select_parts(FoundObject& f, const std::vector<std::string>& order) {
    std::unordered_map<std::string, ObjectPart*> by_id;
    for (auto& p : f.parts) by_id.emplace(p.part_id, &p);
    std::vector<ObjectPart> kept;
    kept.reserve(order.size());
    for (const auto& id : order) {
        auto it = by_id.find(id);
        if (it != by_id.end()) kept.push_back(std::move(*it->second));
    }
    f.parts = std::move(kept);
}

auto to_found(Object&& o) -> FoundObject {
    FoundObject f;
    f.object_id = std::move(o.object_id);
    f.original_id = std::move(o.original_id);
    f.user_id = std::move(o.user_id);
    f.session_id = std::move(o.session_id);
    f.payload = std::move(o.payload);
    f.storage_meta = std::move(o.storage_meta);
    return f;
}

class PgTransaction final : public Transaction {
public:
    PgTransaction(PooledConnection conn, std::string collection_id)
        : conn_(std::move(conn)), collection_id_(std::move(collection_id)) {}

    ~PgTransaction() override {
        if (!finished_) rollback();
    }

    auto lock_objects(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> override {
        if (object_ids.empty()) return {};
        return exec(sql::lock_objects(collection_id_, object_ids));
    }

    auto insert_objects(const std::vector<Object>& objects) -> std::expected<void, core::error> override {
        return exec_all(sql::insert_objects(collection_id_, objects, /*upsert=*/false));
    }

    auto upsert_objects(const std::vector<Object>& objects) -> std::expected<void, core::error> override {
        return exec_all(sql::insert_objects(collection_id_, objects, /*upsert=*/true));
    }

    auto insert_parts(const std::vector<Object>& objects) -> std::expected<void, core::error> override {
        return exec_all(sql::insert_parts(collection_id_, objects, /*upsert=*/false));
    }

    auto upsert_parts(const std::vector<Object>& objects) -> std::expected<void, core::error> override {
        return exec_all(sql::insert_parts(collection_id_, objects, /*upsert=*/true));
    }

    auto delete_parts(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> override {
        if (object_ids.empty()) return {};
        return exec(sql::delete_parts(collection_id_, object_ids));
    }

    auto delete_objects(const std::vector<std::string>& object_ids) -> std::expected<void, core::error> override {
        if (object_ids.empty()) return {};
        return exec(sql::delete_objects(collection_id_, object_ids));
    }

    auto commit() -> std::expected<void, core::error> override {
        if (finished_) return finished_error();
        finished_ = true;
        auto res = conn_->exec("COMMIT");
        if (!res) return std::unexpected(res.error());
        return {};
    }

    void rollback() noexcept override {
        if (finished_) return;
        finished_ = true;
        if (auto res = conn_->exec("ROLLBACK"); !res) {
            core::logger()->warn("rollback on {} failed: {}", collection_id_, res.error().message);
        }
    }

private:
    auto finished_error() const -> std::unexpected<core::error> {
        return core::make_error(core::error_code::precondition_failed, "transaction already finished", kComponent);
    }

    auto exec(const sql::statement& st) -> std::expected<void, core::error> {
        if (finished_) return finished_error();
        auto res = run(*conn_, st);
        if (!res) return std::unexpected(res.error());
        return {};
    }

    auto exec_all(const std::vector<sql::statement>& statements) -> std::expected<void, core::error> {
        for (const auto& st : statements) {
            if (auto ok = exec(st); !ok) return ok;
        }
        return {};
    }

    PooledConnection conn_;
    std::string collection_id_;
    bool finished_{false};
};

} // namespace

auto PgObjectStore::open(std::shared_ptr<PgPool> pool, std::string text_search_language)
    -> std::expected<std::unique_ptr<PgObjectStore>, core::error> {
    auto conn = pool->acquire();
    if (!conn) return std::unexpected(conn.error());
    if (auto res = (*conn)->exec(sql::create_extension()); !res) return std::unexpected(res.error());
    return std::unique_ptr<PgObjectStore>(new PgObjectStore(std::move(pool), std::move(text_search_language)));
}

auto PgObjectStore::create_tables(const std::string& collection_id, const SearchIndexInfo& index)
    -> std::expected<void, core::error> {
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    if (auto res = (*conn)->exec(sql::create_tables(collection_id, index)); !res) return std::unexpected(res.error());
    core::logger()->debug("tables created for collection {}", collection_id);
    return {};
}

auto PgObjectStore::drop_tables(const std::string& collection_id) -> std::expected<void, core::error> {
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    if (auto res = (*conn)->exec(sql::drop_tables(collection_id)); !res) return std::unexpected(res.error());
    core::logger()->debug("tables dropped for collection {}", collection_id);
    return {};
}

auto PgObjectStore::create_vector_index(const std::string& collection_id, const SearchIndexInfo& index)
    -> std::expected<void, core::error> {
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    if (auto res = (*conn)->exec(sql::create_hnsw_index(collection_id, index)); !res) {
        return std::unexpected(res.error());
    }
    return {};
}

auto PgObjectStore::analyze(const std::string& collection_id) -> std::expected<void, core::error> {
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    if (auto res = (*conn)->exec(sql::analyze_tables(collection_id)); !res) return std::unexpected(res.error());
    return {};
}

auto PgObjectStore::begin(const std::string& collection_id)
    -> std::expected<std::unique_ptr<Transaction>, core::error> {
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    if (auto res = (*conn)->exec("BEGIN"); !res) return std::unexpected(res.error());
    return std::make_unique<PgTransaction>(std::move(*conn), collection_id);
}

auto PgObjectStore::find_by_ids(const std::string& collection_id, const std::vector<std::string>& object_ids)
    -> std::expected<std::vector<Object>, core::error> {
    if (object_ids.empty()) return std::vector<Object>{};
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    auto res = run(**conn, sql::objects_by(collection_id, sql::object_key::object_id, object_ids));
    if (!res) return std::unexpected(res.error());
    auto objects = objects_of(res->get());
    if (!objects) return objects;
    if (auto ok = hydrate_objects(**conn, collection_id, *objects); !ok) return std::unexpected(ok.error());
    return objects;
}

auto PgObjectStore::find_by_original_ids(const std::string& collection_id,
                                         const std::vector<std::string>& original_ids)
    -> std::expected<std::vector<Object>, core::error> {
    if (original_ids.empty()) return std::vector<Object>{};
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    auto res = run(**conn, sql::objects_by(collection_id, sql::object_key::original_id, original_ids));
    if (!res) return std::unexpected(res.error());
    auto objects = objects_of(res->get());
    if (!objects) return objects;
    if (auto ok = hydrate_objects(**conn, collection_id, *objects); !ok) return std::unexpected(ok.error());
    return objects;
}

auto PgObjectStore::find_by_session_id(const std::string& collection_id, const std::string& session_id)
    -> std::expected<std::vector<Object>, core::error> {
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    auto res = run(**conn, sql::objects_by(collection_id, sql::object_key::session_id, {session_id}));
    if (!res) return std::unexpected(res.error());
    auto objects = objects_of(res->get());
    if (!objects) return objects;
    if (auto ok = hydrate_objects(**conn, collection_id, *objects); !ok) return std::unexpected(ok.error());
    return objects;
}

auto PgObjectStore::count(const std::string& collection_id, bool originals_only)
    -> std::expected<std::size_t, core::error> {
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    auto res = run(**conn, sql::count_objects(collection_id, originals_only));
    if (!res) return std::unexpected(res.error());
    return number_at<std::size_t>(res->get(), 0, 0);
}

auto PgObjectStore::count_by_filter(const std::string& collection_id, const filter_expr* filter)
    -> std::expected<std::size_t, core::error> {
    auto st = sql::count_by_filter(collection_id, filter, language_);
    if (!st) return std::unexpected(st.error());
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    auto res = run(**conn, *st);
    if (!res) return std::unexpected(res.error());
    return number_at<std::size_t>(res->get(), 0, 0);
}

auto PgObjectStore::common_data_batch(const std::string& collection_id, std::size_t limit, std::size_t offset,
                                      bool originals_only) -> std::expected<std::vector<ObjectCommonData>, core::error> {
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    auto res = run(**conn, sql::common_data_page(collection_id, limit, offset, originals_only));
    if (!res) return std::unexpected(res.error());
    PGresult* r = res->get();
    std::vector<ObjectCommonData> out;
    for (int row = 0; row < PQntuples(r); ++row) {
        auto payload = json_at(r, row, 1);
        if (!payload) return std::unexpected(payload.error());
        auto meta = json_at(r, row, 2);
        if (!meta) return std::unexpected(meta.error());
        out.push_back(ObjectCommonData{text_at(r, row, 0).value_or(""), std::move(*payload), std::move(*meta)});
    }
    return out;
}

auto PgObjectStore::similarity_search(const std::string& collection_id, const SimilarityPlan& plan)
    -> std::expected<SearchResults, core::error> {
    auto st = sql::similarity_search(collection_id, plan, language_);
    if (!st) return std::unexpected(st.error());
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    auto res = run(**conn, *st);
    if (!res) return std::unexpected(res.error());

    PGresult* r = res->get();
    SearchResults out;
    constexpr int kObject = 1;
    constexpr int kDistance = kObject + sql::kObjectColumnCount;
    constexpr int kPartsFound = kDistance + 1;
    constexpr int kMatched = kPartsFound + 1;
    std::vector<std::vector<std::string>> matched;
    for (int row = 0; row < PQntuples(r); ++row) {
        if (!out.subset_count) {
            auto subset = number_at<std::size_t>(r, row, 0);
            if (!subset) return std::unexpected(subset.error());
            out.subset_count = *subset;
        }
        if (PQgetisnull(r, row, kObject)) continue;
        auto o = object_at(r, row, kObject);
        if (!o) return std::unexpected(o.error());
        auto distance = number_at<double>(r, row, kDistance);
        if (!distance) return std::unexpected(distance.error());
        auto parts_found = number_at<std::uint32_t>(r, row, kPartsFound);
        if (!parts_found) return std::unexpected(parts_found.error());
        auto ids = part_ids_at(r, row, kMatched);
        if (!ids) return std::unexpected(ids.error());
        matched.push_back(std::move(*ids));
        auto found = to_found(std::move(*o));
        found.distance = *distance;
        found.parts_found = *parts_found;
        out.found_objects.push_back(std::move(found));
    }
    if (auto ok = hydrate_found(**conn, collection_id, out.found_objects, plan.with_vectors); !ok) {
        return std::unexpected(ok.error());
    }
    for (std::size_t i = 0; i < out.found_objects.size(); ++i) select_parts(out.found_objects[i], matched[i]);
    out.next_offset = page_next_offset(out.found_objects.size(), plan.limit, plan.offset);
    return out;
}

auto PgObjectStore::payload_search(const std::string& collection_id, const PayloadPlan& plan)
    -> std::expected<SearchResults, core::error> {
    auto st = sql::payload_search(collection_id, plan, language_);
    if (!st) return std::unexpected(st.error());
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    auto res = run(**conn, *st);
    if (!res) return std::unexpected(res.error());
    auto objects = objects_of(res->get());
    if (!objects) return std::unexpected(objects.error());

    SearchResults out;
    for (auto& o : *objects) out.found_objects.push_back(to_found(std::move(o)));
    if (auto ok = hydrate_found(**conn, collection_id, out.found_objects, plan.with_vectors); !ok) {
        return std::unexpected(ok.error());
    }
    for (auto& f : out.found_objects) f.parts_found = static_cast<std::uint32_t>(f.parts.size());
    out.next_offset = page_next_offset(out.found_objects.size(), plan.limit, plan.offset);
    return out;
}

} // namespace embdb::store
