#include "embdb/store/pg_connection.hpp"

#include "embdb/core/log.hpp"

namespace embdb::store {

namespace {
constexpr const char* kComponent = "store.pg";
}

auto error_code_for_sqlstate(std::string_view sqlstate) -> core::error_code {
    using core::error_code;
    if (sqlstate == "55P03") return error_code::lock_not_available;
    if (sqlstate == "23505") return error_code::already_exists;
    if (sqlstate == "23503") return error_code::not_found;
    if (sqlstate == "42P01") return error_code::collection_not_found;
    if (sqlstate.size() >= 2 && sqlstate.substr(0, 2) == "08") return error_code::unavailable;
    return error_code::io_failed;
}

auto PgConnection::connect(const std::string& dsn) -> std::expected<std::unique_ptr<PgConnection>, core::error> {
    PGconn* raw = PQconnectdb(dsn.c_str());
    if (raw == nullptr) {
        return std::unexpected(core::error{core::error_code::unavailable, "libpq allocation failed", kComponent});
    }
    if (PQstatus(raw) != CONNECTION_OK) {
        std::string msg = PQerrorMessage(raw);
        PQfinish(raw);
        return std::unexpected(core::error{core::error_code::unavailable, "connection failed: " + msg, kComponent});
    }
    return std::unique_ptr<PgConnection>(new PgConnection(raw));
}

PgConnection::~PgConnection() {
    if (conn_) PQfinish(conn_);
}

auto PgConnection::check(PGresult* raw) -> std::expected<pg_result, core::error> {
    pg_result res(raw);
    if (!res) {
        return std::unexpected(core::error{core::error_code::unavailable, PQerrorMessage(conn_), kComponent});
    }
    const auto status = PQresultStatus(res.get());
    if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) return res;
    const char* state = PQresultErrorField(res.get(), PG_DIAG_SQLSTATE);
    const char* msg = PQresultErrorMessage(res.get());
    return std::unexpected(core::error{error_code_for_sqlstate(state ? state : ""), msg ? msg : "statement failed",
                                       kComponent});
}

auto PgConnection::exec(const std::string& sql) -> std::expected<pg_result, core::error> {
    core::logger()->trace("pg exec: {}", sql);
    return check(PQexec(conn_, sql.c_str()));
}

auto PgConnection::exec_params(const std::string& sql, const std::vector<pg_param>& params)
    -> std::expected<pg_result, core::error> {
    core::logger()->debug("pg exec ({} params): {}", params.size(), sql);
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p ? p->c_str() : nullptr);
    return check(PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()), nullptr, values.data(), nullptr,
                              nullptr, /*resultFormat=*/0));
}

bool PgConnection::healthy() const noexcept {
    return PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::in_transaction() const noexcept {
    const auto s = PQtransactionStatus(conn_);
    return s == PQTRANS_INTRANS || s == PQTRANS_INERROR;
}

PooledConnection::~PooledConnection() {
    if (pool_ && conn_) pool_->release(std::move(conn_));
}

auto PgPool::create(std::string dsn, std::size_t size, std::chrono::milliseconds timeout)
    -> std::expected<std::shared_ptr<PgPool>, core::error> {
    if (size == 0) {
        return std::unexpected(core::error{core::error_code::config_invalid, "pool size must be positive", kComponent});
    }
    std::shared_ptr<PgPool> pool(new PgPool(std::move(dsn), size, timeout));
    // Fail fast on a bad DSN.
    auto first = PgConnection::connect(pool->dsn_);
    if (!first) return std::unexpected(first.error());
    pool->idle_.push_back(std::move(*first));
    pool->open_ = 1;
    return pool;
}

auto PgPool::acquire() -> std::expected<PooledConnection, core::error> {
    std::unique_lock lock(mutex_);
    const bool ready = cv_.wait_for(lock, timeout_, [&] { return !idle_.empty() || open_ < size_; });
    if (!ready) {
        return std::unexpected(core::error{core::error_code::unavailable, "connection pool exhausted", kComponent});
    }
    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return PooledConnection(shared_from_this(), std::move(conn));
    }
    ++open_;
    lock.unlock();
    auto conn = PgConnection::connect(dsn_);
    if (!conn) {
        std::lock_guard relock(mutex_);
        --open_;
        cv_.notify_one();
        return std::unexpected(conn.error());
    }
    return PooledConnection(shared_from_this(), std::move(*conn));
}

void PgPool::release(std::unique_ptr<PgConnection> conn) noexcept {
    if (conn && conn->healthy() && conn->in_transaction()) {
        if (!conn->exec("ROLLBACK")) conn.reset();
    }
    std::lock_guard lock(mutex_);
    if (conn && conn->healthy()) {
        idle_.push_back(std::move(conn));
    } else {
        --open_;
    }
    cv_.notify_one();
}

} // namespace embdb::store
