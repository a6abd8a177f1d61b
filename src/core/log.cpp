#include "embdb/core/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace embdb::core {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

auto make_default_logger() -> std::shared_ptr<spdlog::logger> {
    auto existing = spdlog::get("embdb");
    if (existing) return existing;
    auto created = spdlog::stderr_color_mt("embdb");
    created->set_level(spdlog::level::info);
    return created;
}

} // namespace

auto logger() -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(g_logger_mutex);
    if (!g_logger) g_logger = make_default_logger();
    return g_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    std::lock_guard lock(g_logger_mutex);
    g_logger = replacement ? std::move(replacement) : make_default_logger();
}

bool parse_log_level(std::string_view name, spdlog::level::level_enum& out) {
    if (name == "trace") out = spdlog::level::trace;
    else if (name == "debug") out = spdlog::level::debug;
    else if (name == "info") out = spdlog::level::info;
    else if (name == "warn" || name == "warning") out = spdlog::level::warn;
    else if (name == "error") out = spdlog::level::err;
    else if (name == "critical") out = spdlog::level::critical;
    else if (name == "off") out = spdlog::level::off;
    else return false;
    return true;
}

} // namespace embdb::core
