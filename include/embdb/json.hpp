#pragma once

/** \file json.hpp
 *  \brief JSON interchange for Value (nlohmann::json).
 */

#include <expected>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "embdb/error.hpp"
#include "embdb/value.hpp"

namespace embdb {

auto to_json(const Value& v) -> nlohmann::json;
auto from_json(const nlohmann::json& j) -> Value;

/** \brief Compact JSON text of a value. */
auto to_json_text(const Value& v) -> std::string;

/** \brief Parse JSON text; malformed input is invalid_argument. */
auto parse_json_value(std::string_view text) -> std::expected<Value, core::error>;

} // namespace embdb
