#pragma once

/** \file config.hpp
 *  \brief VectorDb configuration and backend factory.
 *
 * Environment variables read by VectorDbConfig::from_env():
 *   EMBDB_BACKEND              memory | pgvector               (memory)
 *   EMBDB_DB_ID                namespace of the blue pointer   (embdb_default)
 *   EMBDB_PG_DSN               libpq connection string         (required for pgvector)
 *   EMBDB_PG_POOL_SIZE         connections, >= 1               (4)
 *   EMBDB_PG_POOL_TIMEOUT_MS   acquire timeout                 (5000)
 *   EMBDB_METADATA_PATH        memory document snapshot file   (unset: not persisted)
 *   EMBDB_LOCK_MAX_ATTEMPTS    >= 1                            (5)
 *   EMBDB_LOCK_WAIT_MS         delay between lock attempts     (2000)
 *   EMBDB_PREFETCH_FACTOR      >= 1                            (4)
 *   EMBDB_TEXT_SEARCH_LANGUAGE PostgreSQL text search config   (simple)
 *   EMBDB_LOG_LEVEL            trace|debug|info|warn|error|off (info)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "embdb/error.hpp"
#include "embdb/vectordb.hpp"

namespace embdb {

enum class StoreBackend : std::uint8_t { memory, pgvector };

auto to_string(StoreBackend b) -> std::string_view;
auto parse_backend(std::string_view s) -> std::expected<StoreBackend, core::error>;

struct VectorDbConfig {
    StoreBackend backend{StoreBackend::memory};
    std::string db_id{"embdb_default"};
    std::string pg_dsn;
    std::size_t pg_pool_size{4};
    std::chrono::milliseconds pg_pool_timeout{5000};
    std::optional<std::filesystem::path> metadata_path;
    std::uint32_t lock_max_attempts{5};
    std::chrono::milliseconds lock_wait{2000};
    std::size_t prefetch_factor{4};
    std::string text_search_language{"simple"};
    std::string log_level{"info"};

    /** \brief Defaults overridden by EMBDB_* variables; malformed values are config_invalid. */
    static auto from_env() -> std::expected<VectorDbConfig, core::error>;

    /** \brief Cross-field checks (pool size, attempts, DSN for pgvector, db_id). */
    auto validate() const -> std::expected<void, core::error>;

    auto collection_options() const -> CollectionOptions {
        return CollectionOptions{lock_max_attempts, lock_wait, prefetch_factor};
    }
};

/** \brief Apply the log level, open the configured stores and build a VectorDb. */
auto make_vector_db(const VectorDbConfig& config) -> std::expected<std::unique_ptr<VectorDb>, core::error>;

} // namespace embdb
