#pragma once

/** \file pg_document_store.hpp
 *  \brief DocumentStore over one PostgreSQL JSONB table.
 *
 * Table: embdb_documents(collection TEXT, key TEXT, body JSONB, PRIMARY KEY (collection, key)).
 * Key conflicts surface as already_exists through the unique-violation SQLSTATE.
 */

#include <memory>

#include "embdb/store/document_store.hpp"
#include "embdb/store/pg_connection.hpp"

namespace embdb::store {

class PgDocumentStore final : public DocumentStore {
public:
    /** \brief Create the documents table when missing and wrap `pool`. */
    static auto open(std::shared_ptr<PgPool> pool) -> std::expected<std::unique_ptr<PgDocumentStore>, core::error>;

    auto insert_one(const std::string& collection, const std::string& key, const Value& doc)
        -> std::expected<void, core::error> override;
    auto upsert_one(const std::string& collection, const std::string& key, const Value& doc)
        -> std::expected<void, core::error> override;
    auto update_fields(const std::string& collection, const std::string& key, const Value& fields)
        -> std::expected<void, core::error> override;
    auto delete_one(const std::string& collection, const std::string& key) -> std::expected<bool, core::error> override;
    auto find_one(const std::string& collection, const std::string& key)
        -> std::expected<std::optional<Value>, core::error> override;
    auto find(const std::string& collection, const std::string& field, const Value& value)
        -> std::expected<std::vector<Value>, core::error> override;

private:
    explicit PgDocumentStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {}

    /** Run one statement on a pooled connection. */
    auto exec(const std::string& sql, const std::vector<pg_param>& params) -> std::expected<pg_result, core::error>;

    std::shared_ptr<PgPool> pool_;
};

} // namespace embdb::store
