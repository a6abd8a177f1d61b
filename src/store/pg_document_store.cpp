#include "embdb/store/pg_document_store.hpp"

#include <cstring>

#include "embdb/json.hpp"

namespace embdb::store {

namespace {

constexpr const char* kComponent = "store.pg_documents";

constexpr const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS embdb_documents (collection TEXT NOT NULL, key TEXT NOT NULL, "
    "body JSONB NOT NULL, PRIMARY KEY (collection, key))";

auto affected_rows(PGresult* res) -> bool {
    const char* n = PQcmdTuples(res);
    return n != nullptr && std::strcmp(n, "0") != 0 && *n != '\0';
}

auto documents_of(PGresult* res) -> std::expected<std::vector<Value>, core::error> {
    std::vector<Value> out;
    for (int row = 0; row < PQntuples(res); ++row) {
        auto doc = parse_json_value(PQgetvalue(res, row, 0));
        if (!doc) return std::unexpected(doc.error());
        out.push_back(std::move(*doc));
    }
    return out;
}

} // namespace

auto PgDocumentStore::open(std::shared_ptr<PgPool> pool) -> std::expected<std::unique_ptr<PgDocumentStore>, core::error> {
    std::unique_ptr<PgDocumentStore> store(new PgDocumentStore(std::move(pool)));
    if (auto res = store->exec(kCreateTable, {}); !res) return std::unexpected(res.error());
    return store;
}

auto PgDocumentStore::exec(const std::string& sql, const std::vector<pg_param>& params)
    -> std::expected<pg_result, core::error> {
    auto conn = pool_->acquire();
    if (!conn) return std::unexpected(conn.error());
    return (*conn)->exec_params(sql, params);
}

auto PgDocumentStore::insert_one(const std::string& collection, const std::string& key, const Value& doc)
    -> std::expected<void, core::error> {
    auto res = exec("INSERT INTO embdb_documents (collection, key, body) VALUES ($1, $2, $3::jsonb)",
                    {collection, key, to_json_text(doc)});
    if (!res) {
        if (res.error().code == core::error_code::already_exists) {
            return core::make_error(core::error_code::already_exists,
                                    "document already exists: " + collection + "/" + key, kComponent);
        }
        return std::unexpected(res.error());
    }
    return {};
}

auto PgDocumentStore::upsert_one(const std::string& collection, const std::string& key, const Value& doc)
    -> std::expected<void, core::error> {
    auto res = exec("INSERT INTO embdb_documents (collection, key, body) VALUES ($1, $2, $3::jsonb) "
                    "ON CONFLICT (collection, key) DO UPDATE SET body = EXCLUDED.body",
                    {collection, key, to_json_text(doc)});
    if (!res) return std::unexpected(res.error());
    return {};
}

auto PgDocumentStore::update_fields(const std::string& collection, const std::string& key, const Value& fields)
    -> std::expected<void, core::error> {
    auto res = exec("UPDATE embdb_documents SET body = body || $3::jsonb WHERE collection = $1 AND key = $2",
                    {collection, key, to_json_text(fields)});
    if (!res) return std::unexpected(res.error());
    if (!affected_rows(res->get())) {
        return core::make_error(core::error_code::not_found, "document not found: " + collection + "/" + key,
                                kComponent);
    }
    return {};
}

auto PgDocumentStore::delete_one(const std::string& collection, const std::string& key)
    -> std::expected<bool, core::error> {
    auto res = exec("DELETE FROM embdb_documents WHERE collection = $1 AND key = $2", {collection, key});
    if (!res) return std::unexpected(res.error());
    return affected_rows(res->get());
}

auto PgDocumentStore::find_one(const std::string& collection, const std::string& key)
    -> std::expected<std::optional<Value>, core::error> {
    auto res = exec("SELECT body::text FROM embdb_documents WHERE collection = $1 AND key = $2", {collection, key});
    if (!res) return std::unexpected(res.error());
    auto docs = documents_of(res->get());
    if (!docs) return std::unexpected(docs.error());
    if (docs->empty()) return std::optional<Value>{};
    return std::optional<Value>(std::move(docs->front()));
}

auto PgDocumentStore::find(const std::string& collection, const std::string& field, const Value& value)
    -> std::expected<std::vector<Value>, core::error> {
    auto res = exec("SELECT body::text FROM embdb_documents WHERE collection = $1 AND body -> $2 = $3::jsonb "
                    "ORDER BY key",
                    {collection, field, to_json_text(value)});
    if (!res) return std::unexpected(res.error());
    return documents_of(res->get());
}

} // namespace embdb::store
