#pragma once

/** \file pg_statements.hpp
 *  \brief PostgreSQL/pgvector statements for one collection's object and part tables.
 *
 * Layout (per collection id X):
 *   "dbo_X"   object_id PK, seq BIGSERIAL (insertion order), payload/storage_meta JSONB,
 *             user_id, session_id, original_id
 *   "dbop_X"  (object_id, part_id) PK, object_id FK ON DELETE CASCADE, pseq BIGSERIAL,
 *             vector vector(D), is_average, user_id
 *   "hnsw_X"  HNSW index over dbop.vector with the metric's operator class
 *
 * Object rows are selected with kObjectColumns; part rows with parts_by_object_ids().
 * Similarity and payload searches return object rows followed by search columns
 * (see the function docs for the exact column order).
 */

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "embdb/error.hpp"
#include "embdb/sql/pg_render.hpp"
#include "embdb/store/object_store.hpp"

namespace embdb::sql {

/** Rows per multi-row INSERT. */
inline constexpr std::size_t kInsertChunkRows = 1000;

/** object_id, payload::text, storage_meta::text, user_id, session_id, original_id */
inline constexpr std::string_view kObjectColumns =
    "o.object_id, o.payload::text, o.storage_meta::text, o.user_id, o.session_id, o.original_id";
inline constexpr int kObjectColumnCount = 6;

// DDL
auto create_extension() -> std::string;
auto create_tables(std::string_view collection_id, const SearchIndexInfo& index) -> std::string;
auto drop_tables(std::string_view collection_id) -> std::string;
auto create_hnsw_index(std::string_view collection_id, const SearchIndexInfo& index) -> std::string;
auto analyze_tables(std::string_view collection_id) -> std::string;

// Writes
/** \brief SELECT ... FOR UPDATE NOWAIT over existing rows with the given ids. */
auto lock_objects(std::string_view collection_id, const std::vector<std::string>& object_ids) -> statement;
/** \brief Chunked multi-row INSERT of object rows; `upsert` adds ON CONFLICT DO UPDATE. */
auto insert_objects(std::string_view collection_id, const std::vector<Object>& objects, bool upsert)
    -> std::vector<statement>;
/** \brief Chunked multi-row INSERT of all parts of `objects`; `upsert` overwrites by (object_id, part_id). */
auto insert_parts(std::string_view collection_id, const std::vector<Object>& objects, bool upsert)
    -> std::vector<statement>;
auto delete_parts(std::string_view collection_id, const std::vector<std::string>& object_ids) -> statement;
auto delete_objects(std::string_view collection_id, const std::vector<std::string>& object_ids) -> statement;

// Reads
enum class object_key { object_id, original_id, session_id };

/** \brief Object rows (kObjectColumns) whose `key` is one of `values`, in insertion order. */
auto objects_by(std::string_view collection_id, object_key key, const std::vector<std::string>& values) -> statement;
/** \brief object_id, part_id, is_average[, vector::text] of parts, ordered by pseq. */
auto parts_by_object_ids(std::string_view collection_id, const std::vector<std::string>& object_ids,
                         bool with_vectors) -> statement;
auto count_objects(std::string_view collection_id, bool originals_only) -> statement;
auto count_by_filter(std::string_view collection_id, const filter_expr* filter, std::string_view language)
    -> std::expected<statement, core::error>;
/** \brief object_id, payload::text, storage_meta::text in insertion order. */
auto common_data_page(std::string_view collection_id, std::size_t limit, std::size_t offset, bool originals_only)
    -> statement;

/** \brief Ranked page of a similarity search.
 *
 * Always yields at least one row. Columns: subset_count, then kObjectColumns, distance,
 * parts_found, matched (JSON array of the counted part ids, closest first), ord.
 * When the page is empty the single row carries only subset_count and NULLs.
 * plan.sort_by orders hits ahead of distance unless plan.similarity_first is set.
 */
auto similarity_search(std::string_view collection_id, const store::SimilarityPlan& plan, std::string_view language)
    -> std::expected<statement, core::error>;

/** \brief Page of a payload search (kObjectColumns), sorted by plan.sort_by then insertion order. */
auto payload_search(std::string_view collection_id, const store::PayloadPlan& plan, std::string_view language)
    -> std::expected<statement, core::error>;

} // namespace embdb::sql
