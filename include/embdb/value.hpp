#pragma once

/** \file value.hpp
 *  \brief Payload value model: a closed union used for object payloads, storage metadata,
 *  metadata records and filter literals.
 *
 * Kinds: null, bool, 64-bit integer, double, string, array and insertion-ordered map.
 * Maps keep insertion order and unique keys; set() replaces an existing key in place.
 * Ownership: value-semantic and self-contained.
 */

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace embdb {

struct Member;

class Value {
public:
    using Array = std::vector<Value>;
    using Map = std::vector<Member>;

    enum class Kind : std::uint8_t { Null, Bool, Int, Double, String, Array, Map };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    template <typename T>
        requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
    Value(T i) : data_(static_cast<std::int64_t>(i)) {}
    Value(float d) : data_(static_cast<double>(d)) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(Array a);
    Value(Map m);

    /** \brief Build a map value from key/value pairs (later duplicates replace earlier ones). */
    static auto map(std::initializer_list<Member> members) -> Value;
    /** \brief Empty map value. */
    static auto empty_map() -> Value;

    auto kind() const noexcept -> Kind { return static_cast<Kind>(data_.index()); }
    bool is_null() const noexcept { return kind() == Kind::Null; }
    bool is_bool() const noexcept { return kind() == Kind::Bool; }
    bool is_number() const noexcept { return kind() == Kind::Int || kind() == Kind::Double; }
    bool is_string() const noexcept { return kind() == Kind::String; }
    bool is_array() const noexcept { return kind() == Kind::Array; }
    bool is_map() const noexcept { return kind() == Kind::Map; }

    const bool* as_bool() const noexcept { return std::get_if<bool>(&data_); }
    const std::int64_t* as_int() const noexcept { return std::get_if<std::int64_t>(&data_); }
    const double* as_double() const noexcept { return std::get_if<double>(&data_); }
    const std::string* as_string() const noexcept { return std::get_if<std::string>(&data_); }
    const Array* as_array() const noexcept { return std::get_if<Array>(&data_); }
    const Map* as_map() const noexcept { return std::get_if<Map>(&data_); }
    Array* as_array() noexcept { return std::get_if<Array>(&data_); }
    Map* as_map() noexcept { return std::get_if<Map>(&data_); }

    /** \brief Numeric view of an int or double value; nullopt for other kinds. */
    auto as_number() const noexcept -> std::optional<double>;

    /** \brief Text rendering equivalent to JSONB `->>`: strings unquoted, scalars formatted,
     *  containers as compact JSON, null as nullopt. */
    auto to_text() const -> std::optional<std::string>;

    /** \brief Map member lookup; null when this is not a map or the key is absent. */
    auto find(std::string_view key) const -> const Value*;

    /** \brief Nested lookup by dotted path ("a.b.c"). */
    auto find_path(std::string_view dotted) const -> const Value*;

    /** \brief Insert or replace a map member. Converts a null value into an empty map first. */
    void set(std::string key, Value value);

    /** \brief Remove a map member; returns false when absent. */
    bool erase(std::string_view key);

    auto size() const noexcept -> std::size_t;

    const auto& data() const noexcept { return data_; }

    friend bool operator==(const Value& a, const Value& b);

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, Map> data_;
};

/** \brief One map entry. */
struct Member {
    std::string key;
    Value value;

    friend bool operator==(const Member&, const Member&) = default;
};

inline Value::Value(Array a) : data_(std::move(a)) {}
inline Value::Value(Map m) : data_(std::move(m)) {}
inline auto Value::empty_map() -> Value { return Value(Map{}); }

/** \brief Payload and storage metadata are map values. */
using Payload = Value;

/** \brief Split a dotted field path into its segments ("a.b" -> {"a","b"}). */
auto split_path(std::string_view dotted) -> std::vector<std::string>;

} // namespace embdb
