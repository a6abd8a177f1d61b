#pragma once

/** \file pg_connection.hpp
 *  \brief RAII libpq connection, result handle and a small bounded connection pool.
 *
 * All statements run with text-format parameters ($1, $2, ...). Server errors are mapped
 * to error codes by SQLSTATE:
 *   55P03 lock_not_available -> lock_not_available
 *   23505 unique_violation   -> already_exists
 *   23503 foreign_key        -> not_found
 *   42P01 undefined_table    -> collection_not_found
 *   08*   connection         -> unavailable
 *   other                    -> io_failed
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <libpq-fe.h>

#include "embdb/error.hpp"

namespace embdb::store {

struct pg_result_deleter {
    void operator()(PGresult* r) const noexcept { PQclear(r); }
};
using pg_result = std::unique_ptr<PGresult, pg_result_deleter>;

/** \brief Text parameter; nullopt binds SQL NULL. */
using pg_param = std::optional<std::string>;

/** \brief Map an SQLSTATE to an error code. */
auto error_code_for_sqlstate(std::string_view sqlstate) -> core::error_code;

class PgConnection {
public:
    static auto connect(const std::string& dsn) -> std::expected<std::unique_ptr<PgConnection>, core::error>;

    ~PgConnection();
    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    /** \brief Run a statement without parameters (DDL, BEGIN/COMMIT). */
    auto exec(const std::string& sql) -> std::expected<pg_result, core::error>;
    /** \brief Run a parameterized statement. */
    auto exec_params(const std::string& sql, const std::vector<pg_param>& params) -> std::expected<pg_result, core::error>;

    bool healthy() const noexcept;
    /** \brief True when the session is inside a transaction block. */
    bool in_transaction() const noexcept;

private:
    explicit PgConnection(PGconn* conn) : conn_(conn) {}
    auto check(PGresult* raw) -> std::expected<pg_result, core::error>;

    PGconn* conn_;
};

class PgPool;

/** \brief Borrowed connection; returned to its pool on destruction. */
class PooledConnection {
public:
    PooledConnection(std::shared_ptr<PgPool> pool, std::unique_ptr<PgConnection> conn)
        : pool_(std::move(pool)), conn_(std::move(conn)) {}
    PooledConnection(PooledConnection&&) noexcept = default;
    PooledConnection& operator=(PooledConnection&&) = delete;
    ~PooledConnection();

    PgConnection* operator->() const noexcept { return conn_.get(); }
    PgConnection& operator*() const noexcept { return *conn_; }

private:
    std::shared_ptr<PgPool> pool_;
    std::unique_ptr<PgConnection> conn_;
};

/** \brief At most `size` connections, opened lazily. acquire() waits at most `timeout`. */
class PgPool : public std::enable_shared_from_this<PgPool> {
public:
    static auto create(std::string dsn, std::size_t size, std::chrono::milliseconds timeout)
        -> std::expected<std::shared_ptr<PgPool>, core::error>;

    auto acquire() -> std::expected<PooledConnection, core::error>;

private:
    friend class PooledConnection;
    PgPool(std::string dsn, std::size_t size, std::chrono::milliseconds timeout)
        : dsn_(std::move(dsn)), size_(size), timeout_(timeout) {}
    void release(std::unique_ptr<PgConnection> conn) noexcept;

    std::string dsn_;
    std::size_t size_;
    std::chrono::milliseconds timeout_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<PgConnection>> idle_;
    std::size_t open_{0};
};

} // namespace embdb::store
