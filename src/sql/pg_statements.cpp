#include "embdb/sql/pg_statements.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

#include "embdb/json.hpp"
#include "embdb/query_compiler.hpp"

namespace embdb::sql {

namespace {

constexpr const char* kComponent = "sql.pg_statements";

auto quoted(std::string_view prefix, std::string_view collection_id, std::string_view suffix = {}) -> std::string {
  std::string out = "\"";
  out.append(prefix).append(collection_id).append(suffix).push_back('"');
  return out;
}

/** Candidate rows of alias `o` visible to `user_id`. */
auto visibility(std::string_view collection_id, const std::optional<std::string>& user_id, param_list& params)
    -> std::string {
  if (!user_id) return "o.user_id IS NULL";
  const auto u = params.add(*user_id);
  return "(o.user_id IS NULL OR o.user_id = " + u + ") AND o.object_id NOT IN (SELECT c.original_id FROM " +
         objects_table(collection_id) + " c WHERE c.user_id = " + u + " AND c.original_id IS NOT NULL)";
}

auto with_filter(std::string where, const std::optional<filter_expr>& filter, param_list& params,
                 std::string_view language) -> std::expected<std::string, core::error> {
  if (!filter) return where;
  auto rendered = render_filter(*filter, params, "o", language);
  if (!rendered) return rendered;
  return where + " AND " + *rendered;
}

auto sort_expression(const SortByOptions& sort, param_list& params) -> std::expected<std::string, core::error> {
  if (sort.force_not_payload) {
    if (!is_filterable_column(sort.field)) {
      return core::make_error(core::error_code::invalid_argument, "column is not sortable: " + sort.field, kComponent);
    }
    return "o." + sort.field;
  }
  return "(o.payload #> " + params.add(text_array_literal(split_path(sort.field))) + "::text[])";
}

/** LIMIT/OFFSET operand; values past the bigint range clamp to its maximum. */
auto bigint_text(std::size_t n) -> std::string {
  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  return std::to_string(std::min<std::uint64_t>(n, kMax));
}

} // namespace

auto create_extension() -> std::string { return "CREATE EXTENSION IF NOT EXISTS vector"; }

auto create_tables(std::string_view collection_id, const SearchIndexInfo& index) -> std::string {
  const auto objects = objects_table(collection_id);
  std::string sql;
  sql += "CREATE TABLE IF NOT EXISTS " + objects +
         " (object_id VARCHAR(128) PRIMARY KEY, seq BIGSERIAL, payload JSONB NOT NULL DEFAULT '{}'::jsonb, "
         "storage_meta JSONB NOT NULL DEFAULT '{}'::jsonb, user_id VARCHAR(128), session_id VARCHAR(128), "
         "original_id VARCHAR(128));\n";
  sql += "CREATE INDEX IF NOT EXISTS " + quoted("ix_", collection_id, "_uid") + " ON " + objects + " (user_id);\n";
  sql += "CREATE INDEX IF NOT EXISTS " + quoted("ix_", collection_id, "_oid") + " ON " + objects + " (original_id);\n";
  sql += "CREATE TABLE IF NOT EXISTS " + parts_table(collection_id) +
         " (object_id VARCHAR(128) NOT NULL REFERENCES " + objects +
         " (object_id) ON DELETE CASCADE, part_id VARCHAR(256) NOT NULL, pseq BIGSERIAL, vector vector(" +
         std::to_string(index.dimensions) +
         ") NOT NULL, is_average BOOLEAN NOT NULL DEFAULT FALSE, user_id VARCHAR(128), "
         "PRIMARY KEY (object_id, part_id));";
  return sql;
}

auto drop_tables(std::string_view collection_id) -> std::string {
  return "DROP TABLE IF EXISTS " + parts_table(collection_id) + ", " + objects_table(collection_id);
}

auto create_hnsw_index(std::string_view collection_id, const SearchIndexInfo& index) -> std::string {
  return "CREATE INDEX IF NOT EXISTS " + quoted("hnsw_", collection_id) + " ON " + parts_table(collection_id) +
         " USING hnsw (vector " + std::string(hnsw_opclass(index.metric)) + ") WITH (m = " +
         std::to_string(index.hnsw.m) + ", ef_construction = " + std::to_string(index.hnsw.ef_construction) + ")";
}

auto analyze_tables(std::string_view collection_id) -> std::string {
  return "ANALYZE " + objects_table(collection_id) + ", " + parts_table(collection_id);
}

auto lock_objects(std::string_view collection_id, const std::vector<std::string>& object_ids) -> statement {
  return statement{"SELECT object_id FROM " + objects_table(collection_id) +
                       " WHERE object_id = ANY($1::text[]) FOR UPDATE NOWAIT",
                   {text_array_literal(object_ids)}};
}

auto insert_objects(std::string_view collection_id, const std::vector<Object>& objects, bool upsert)
    -> std::vector<statement> {
  std::vector<statement> out;
  for (std::size_t begin = 0; begin < objects.size(); begin += kInsertChunkRows) {
    const std::size_t end = std::min(objects.size(), begin + kInsertChunkRows);
    param_list params;
    std::string sql = "INSERT INTO " + objects_table(collection_id) +
                      " (object_id, payload, storage_meta, user_id, session_id, original_id) VALUES ";
    for (std::size_t i = begin; i < end; ++i) {
      const auto& o = objects[i];
      if (i != begin) sql += ", ";
      sql += "(" + params.add(o.object_id) + ", " + params.add(to_json_text(o.payload)) + "::jsonb, " +
             params.add(to_json_text(o.storage_meta)) + "::jsonb, " + params.add(o.user_id) + ", " +
             params.add(o.session_id) + ", " + params.add(o.original_id) + ")";
    }
    if (upsert) {
      sql += " ON CONFLICT (object_id) DO UPDATE SET payload = EXCLUDED.payload, storage_meta = "
             "EXCLUDED.storage_meta, user_id = EXCLUDED.user_id, session_id = EXCLUDED.session_id, "
             "original_id = EXCLUDED.original_id";
    }
    out.push_back(statement{std::move(sql), params.take()});
  }
  return out;
}

auto insert_parts(std::string_view collection_id, const std::vector<Object>& objects, bool upsert)
    -> std::vector<statement> {
  struct part_row {
    const Object* object;
    const ObjectPart* part;
  };
  std::vector<part_row> rows;
  for (const auto& o : objects) {
    for (const auto& p : o.parts) rows.push_back(part_row{&o, &p});
  }

  std::vector<statement> out;
  for (std::size_t begin = 0; begin < rows.size(); begin += kInsertChunkRows) {
    const std::size_t end = std::min(rows.size(), begin + kInsertChunkRows);
    param_list params;
    std::string sql = "INSERT INTO " + parts_table(collection_id) +
                      " (object_id, part_id, vector, is_average, user_id) VALUES ";
    for (std::size_t i = begin; i < end; ++i) {
      const auto& [o, p] = rows[i];
      if (i != begin) sql += ", ";
      sql += "(" + params.add(o->object_id) + ", " + params.add(p->part_id) + ", " +
             params.add(vector_literal(p->vector)) + "::vector, " +
             params.add(std::string(p->is_average ? "true" : "false")) + "::boolean, " + params.add(o->user_id) +
             ")";
    }
    if (upsert) {
      sql += " ON CONFLICT (object_id, part_id) DO UPDATE SET vector = EXCLUDED.vector, is_average = "
             "EXCLUDED.is_average, user_id = EXCLUDED.user_id";
    }
    out.push_back(statement{std::move(sql), params.take()});
  }
  return out;
}

auto delete_parts(std::string_view collection_id, const std::vector<std::string>& object_ids) -> statement {
  return statement{"DELETE FROM " + parts_table(collection_id) + " WHERE object_id = ANY($1::text[])",
                   {text_array_literal(object_ids)}};
}

auto delete_objects(std::string_view collection_id, const std::vector<std::string>& object_ids) -> statement {
  return statement{"DELETE FROM " + objects_table(collection_id) + " WHERE object_id = ANY($1::text[])",
                   {text_array_literal(object_ids)}};
}

auto objects_by(std::string_view collection_id, object_key key, const std::vector<std::string>& values) -> statement {
  std::string where;
  std::optional<std::string> param;
  switch (key) {
  case object_key::object_id:
    where = "o.object_id = ANY($1::text[])";
    param = text_array_literal(values);
    break;
  case object_key::original_id:
    where = "o.original_id = ANY($1::text[])";
    param = text_array_literal(values);
    break;
  case object_key::session_id:
    where = "o.session_id = $1";
    param = values.empty() ? std::string{} : values.front();
    break;
  }
  return statement{"SELECT " + std::string(kObjectColumns) + " FROM " + objects_table(collection_id) + " o WHERE " +
                       where + " ORDER BY o.seq",
                   {std::move(param)}};
}

auto parts_by_object_ids(std::string_view collection_id, const std::vector<std::string>& object_ids,
                         bool with_vectors) -> statement {
  std::string cols = "p.object_id, p.part_id, p.is_average";
  if (with_vectors) cols += ", p.vector::text";
  return statement{"SELECT " + cols + " FROM " + parts_table(collection_id) +
                       " p WHERE p.object_id = ANY($1::text[]) ORDER BY p.pseq",
                   {text_array_literal(object_ids)}};
}

auto count_objects(std::string_view collection_id, bool originals_only) -> statement {
  std::string sql = "SELECT count(*) FROM " + objects_table(collection_id);
  if (originals_only) sql += " WHERE user_id IS NULL";
  return statement{std::move(sql), {}};
}

auto count_by_filter(std::string_view collection_id, const filter_expr* filter, std::string_view language)
    -> std::expected<statement, core::error> {
  param_list params;
  std::string where = "o.user_id IS NULL";
  if (filter) {
    auto rendered = render_filter(*filter, params, "o", language);
    if (!rendered) return std::unexpected(rendered.error());
    where += " AND " + *rendered;
  }
  return statement{"SELECT count(*) FROM " + objects_table(collection_id) + " o WHERE " + where, params.take()};
}

auto common_data_page(std::string_view collection_id, std::size_t limit, std::size_t offset, bool originals_only)
    -> statement {
  std::string sql = "SELECT o.object_id, o.payload::text, o.storage_meta::text FROM " + objects_table(collection_id) +
                    " o";
  if (originals_only) sql += " WHERE o.user_id IS NULL";
  sql += " ORDER BY o.seq LIMIT $1 OFFSET $2";
  return statement{std::move(sql), {bigint_text(limit), bigint_text(offset)}};
}

auto similarity_search(std::string_view collection_id, const store::SimilarityPlan& plan, std::string_view language)
    -> std::expected<statement, core::error> {
  param_list params;
  const auto objects = objects_table(collection_id);
  const auto query = params.add(vector_literal(plan.query)) + "::vector";
  const std::string max = plan.max_distance ? params.add(literal_text(Value(*plan.max_distance))) + "::float8" : "";

  std::string visible_where = visibility(collection_id, plan.user_id, params);
  if (!plan.similarity_first) {
    auto w = with_filter(std::move(visible_where), plan.filter, params, language);
    if (!w) return std::unexpected(w.error());
    visible_where = std::move(*w);
  }

  const char* agg = plan.aggregation == AggregationType::avg ? "avg" : "min";
  std::string sql = "WITH visible AS (SELECT o.object_id FROM " + objects + " o WHERE " + visible_where + "), ";
  sql += "scored AS (SELECT p.object_id, p.part_id, (p.vector " + std::string(distance_operator(plan.metric)) + " " +
         query + ")::float8 AS d FROM " + parts_table(collection_id) + " p JOIN visible v ON v.object_id = p.object_id";
  if (plan.average_only) sql += " WHERE p.is_average";
  sql += "), ";
  sql += "agg AS (SELECT object_id, " + std::string(agg) + "(d) AS distance, ";
  const std::string within = max.empty() ? std::string() : " FILTER (WHERE d <= " + max + ")";
  sql += "count(*)" + within + " AS parts_found, ";
  sql += "to_json(array_agg(part_id ORDER BY d, part_id)" + within + ")::text AS matched";
  sql += " FROM scored GROUP BY object_id";
  if (!max.empty()) sql += " HAVING " + std::string(agg) + "(d) <= " + max;
  sql += "), ";

  if (plan.similarity_first) {
    sql += "ranked AS (SELECT a.* FROM agg a ORDER BY a.distance, a.object_id";
    if (plan.window > 0) sql += " LIMIT " + params.add(bigint_text(plan.window)) + "::bigint";
    sql += "), ";
    std::string where = "TRUE";
    if (plan.filter) {
      auto rendered = render_filter(*plan.filter, params, "o", language);
      if (!rendered) return std::unexpected(rendered.error());
      where = *rendered;
    }
    sql += "hits AS (SELECT r.* FROM ranked r JOIN " + objects + " o ON o.object_id = r.object_id WHERE " + where +
           "), ";
    sql += "subset AS (SELECT count(*) AS n FROM hits) ";
  } else {
    sql += "hits AS (SELECT * FROM agg), ";
    sql += "subset AS (SELECT count(*) AS n FROM visible) ";
  }

  std::string order = "h.distance, h.object_id";
  if (plan.sort_by && !plan.similarity_first) {
    auto key = sort_expression(*plan.sort_by, params);
    if (!key) return std::unexpected(key.error());
    order = *key + (plan.sort_by->order == SortOrder::desc ? " DESC" : " ASC") + " NULLS LAST, " + order;
  }
  const auto limit = params.add(bigint_text(plan.limit)) + "::bigint";
  const auto offset = params.add(bigint_text(plan.offset)) + "::bigint";
  sql += "SELECT s.n, pg.* FROM subset s LEFT JOIN LATERAL (SELECT " + std::string(kObjectColumns) +
         ", h.distance, h.parts_found, h.matched, row_number() OVER (ORDER BY " + order + ") AS ord FROM hits h JOIN " +
         objects + " o ON o.object_id = h.object_id ORDER BY " + order + " LIMIT " + limit + " OFFSET " + offset +
         ") pg ON TRUE ORDER BY pg.ord";
  return statement{std::move(sql), params.take()};
}

auto payload_search(std::string_view collection_id, const store::PayloadPlan& plan, std::string_view language)
    -> std::expected<statement, core::error> {
  param_list params;
  auto where = with_filter(visibility(collection_id, plan.user_id, params), plan.filter, params, language);
  if (!where) return std::unexpected(where.error());

  std::string order = "o.seq";
  if (plan.sort_by) {
    auto key = sort_expression(*plan.sort_by, params);
    if (!key) return std::unexpected(key.error());
    order = *key + (plan.sort_by->order == SortOrder::desc ? " DESC" : " ASC") + " NULLS LAST, o.seq";
  }
  const auto limit = params.add(bigint_text(plan.limit)) + "::bigint";
  const auto offset = params.add(bigint_text(plan.offset)) + "::bigint";
  return statement{"SELECT " + std::string(kObjectColumns) + " FROM " + objects_table(collection_id) + " o WHERE " +
                       *where + " ORDER BY " + order + " LIMIT " + limit + " OFFSET " + offset,
                   params.take()};
}

} // namespace embdb::sql
