#pragma once

/** \file platform_utils.hpp
 *  \brief Environment access for configuration.
 */

#include <charconv>
#include <cstdlib>
#include <expected>
#include <optional>
#include <string>
#include <system_error>

#include "embdb/error.hpp"

namespace embdb::core {

/** \brief Value of an environment variable; nullopt when unset, "" when set empty.
 *
 * Windows reads through _dupenv_s (the buffer is freed here); elsewhere std::getenv.
 */
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || buf == nullptr) {
        std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (v == nullptr) return std::nullopt;
    return std::string(v);
#endif
}

/** \brief Integer environment variable: nullopt when unset; config_invalid unless the whole text parses. */
template <typename T>
auto getenv_integer(const char* name) -> std::expected<std::optional<T>, error> {
    auto raw = safe_getenv(name);
    if (!raw) return std::optional<T>{};
    T value{};
    const char* end = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(raw->data(), end, value);
    if (raw->empty() || ec != std::errc{} || ptr != end) {
        return make_error(error_code::config_invalid, std::string(name) + ": not a number: " + *raw, "config");
    }
    return std::optional<T>(value);
}

} // namespace embdb::core
