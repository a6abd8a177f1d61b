#include "embdb/config.hpp"

#include "embdb/core/log.hpp"
#include "embdb/core/platform_utils.hpp"
#include "embdb/store/memory_object_store.hpp"
#include "embdb/store/pg_document_store.hpp"
#include "embdb/store/pg_object_store.hpp"

namespace embdb {

namespace {

constexpr const char* kComponent = "config";

auto config_error(std::string message) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::config_invalid, std::move(message), kComponent);
}

template <typename T>
auto read_number(const char* name, T& out) -> std::expected<void, core::error> {
    auto v = core::getenv_integer<T>(name);
    if (!v) return std::unexpected(v.error());
    if (*v) out = **v;
    return {};
}

auto read_millis(const char* name, std::chrono::milliseconds& out) -> std::expected<void, core::error> {
    std::int64_t ms = out.count();
    if (auto ok = read_number(name, ms); !ok) return ok;
    if (ms < 0) return config_error(std::string(name) + ": must not be negative");
    out = std::chrono::milliseconds(ms);
    return {};
}

} // namespace

auto to_string(StoreBackend b) -> std::string_view {
    switch (b) {
    case StoreBackend::memory: return "memory";
    case StoreBackend::pgvector: return "pgvector";
    }
    return "memory";
}

auto parse_backend(std::string_view s) -> std::expected<StoreBackend, core::error> {
    if (s == "memory") return StoreBackend::memory;
    if (s == "pgvector") return StoreBackend::pgvector;
    return config_error("unknown backend: " + std::string(s));
}

auto VectorDbConfig::from_env() -> std::expected<VectorDbConfig, core::error> {
    VectorDbConfig c;
    if (auto v = core::safe_getenv("EMBDB_BACKEND")) {
        auto b = parse_backend(*v);
        if (!b) return std::unexpected(b.error());
        c.backend = *b;
    }
    if (auto v = core::safe_getenv("EMBDB_DB_ID")) c.db_id = *v;
    if (auto v = core::safe_getenv("EMBDB_PG_DSN")) c.pg_dsn = *v;
    if (auto v = core::safe_getenv("EMBDB_METADATA_PATH"); v && !v->empty()) c.metadata_path = *v;
    if (auto v = core::safe_getenv("EMBDB_TEXT_SEARCH_LANGUAGE")) c.text_search_language = *v;
    if (auto v = core::safe_getenv("EMBDB_LOG_LEVEL")) c.log_level = *v;

    if (auto ok = read_number("EMBDB_PG_POOL_SIZE", c.pg_pool_size); !ok) return std::unexpected(ok.error());
    if (auto ok = read_millis("EMBDB_PG_POOL_TIMEOUT_MS", c.pg_pool_timeout); !ok) return std::unexpected(ok.error());
    if (auto ok = read_number("EMBDB_LOCK_MAX_ATTEMPTS", c.lock_max_attempts); !ok) return std::unexpected(ok.error());
    if (auto ok = read_millis("EMBDB_LOCK_WAIT_MS", c.lock_wait); !ok) return std::unexpected(ok.error());
    if (auto ok = read_number("EMBDB_PREFETCH_FACTOR", c.prefetch_factor); !ok) return std::unexpected(ok.error());

    if (auto ok = c.validate(); !ok) return std::unexpected(ok.error());
    return c;
}

auto VectorDbConfig::validate() const -> std::expected<void, core::error> {
    if (db_id.empty()) return config_error("db_id must not be empty");
    if (lock_max_attempts == 0) return config_error("lock_max_attempts must be at least 1");
    if (prefetch_factor == 0) return config_error("prefetch_factor must be at least 1");
    if (text_search_language.empty()) return config_error("text_search_language must not be empty");
    spdlog::level::level_enum level{};
    if (!core::parse_log_level(log_level, level)) return config_error("unknown log level: " + log_level);
    if (backend == StoreBackend::pgvector) {
        if (pg_dsn.empty()) return config_error("pgvector backend requires EMBDB_PG_DSN");
        if (pg_pool_size == 0) return config_error("pg_pool_size must be at least 1");
    }
    return {};
}

auto make_vector_db(const VectorDbConfig& config) -> std::expected<std::unique_ptr<VectorDb>, core::error> {
    if (auto ok = config.validate(); !ok) return std::unexpected(ok.error());
    spdlog::level::level_enum level{};
    if (core::parse_log_level(config.log_level, level)) core::logger()->set_level(level);

    std::shared_ptr<store::ObjectStore> objects;
    std::shared_ptr<store::DocumentStore> documents;
    switch (config.backend) {
    case StoreBackend::memory: {
        objects = std::make_shared<store::MemoryObjectStore>();
        if (config.metadata_path) {
            auto docs = store::MemoryDocumentStore::open(*config.metadata_path);
            if (!docs) return std::unexpected(docs.error());
            documents = std::move(*docs);
        } else {
            documents = std::make_shared<store::MemoryDocumentStore>();
        }
        break;
    }
    case StoreBackend::pgvector: {
        auto pool = store::PgPool::create(config.pg_dsn, config.pg_pool_size, config.pg_pool_timeout);
        if (!pool) return std::unexpected(pool.error());
        auto pg_objects = store::PgObjectStore::open(*pool, config.text_search_language);
        if (!pg_objects) return std::unexpected(pg_objects.error());
        auto pg_documents = store::PgDocumentStore::open(*pool);
        if (!pg_documents) return std::unexpected(pg_documents.error());
        objects = std::move(*pg_objects);
        documents = std::move(*pg_documents);
        break;
    }
    }
    core::logger()->info("vector db {} starting on {} backend", config.db_id, to_string(config.backend));
    return VectorDb::create(std::move(objects), std::move(documents), config.db_id, config.collection_options());
}

} // namespace embdb
