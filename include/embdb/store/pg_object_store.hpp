#pragma once

/** \file pg_object_store.hpp
 *  \brief ObjectStore over PostgreSQL + pgvector (libpq).
 *
 * Statements come from sql/pg_statements.hpp. A transaction borrows one pooled connection for
 * its lifetime (BEGIN ... COMMIT); reads borrow a connection per call. Row locks are
 * `SELECT ... FOR UPDATE NOWAIT`, so a held lock surfaces as lock_not_available (SQLSTATE 55P03).
 */

#include <memory>
#include <string>

#include "embdb/store/object_store.hpp"
#include "embdb/store/pg_connection.hpp"

namespace embdb::store {

class PgObjectStore final : public ObjectStore {
public:
    /** \brief Ensure the pgvector extension exists and wrap `pool`. */
    static auto open(std::shared_ptr<PgPool> pool, std::string text_search_language)
        -> std::expected<std::unique_ptr<PgObjectStore>, core::error>;

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

private:
    PgObjectStore(std::shared_ptr<PgPool> pool, std::string language)
        : pool_(std::move(pool)), language_(std::move(language)) {}

    std::shared_ptr<PgPool> pool_;
    std::string language_;
};

} // namespace embdb::store
