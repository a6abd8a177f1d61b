#include "embdb/value.hpp"
#include "embdb/json.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace embdb {

auto Value::map(std::initializer_list<Member> members) -> Value {
    Value out = empty_map();
    for (const auto& m : members) out.set(m.key, m.value);
    return out;
}

auto Value::as_number() const noexcept -> std::optional<double> {
    if (const auto* i = as_int()) return static_cast<double>(*i);
    if (const auto* d = as_double()) return *d;
    return std::nullopt;
}

auto Value::to_text() const -> std::optional<std::string> {
    switch (kind()) {
    case Kind::Null: return std::nullopt;
    case Kind::Bool: return *as_bool() ? std::string("true") : std::string("false");
    case Kind::Int: return std::to_string(*as_int());
    case Kind::String: return *as_string();
    default: return to_json_text(*this);
    }
}

auto Value::find(std::string_view key) const -> const Value* {
    const auto* m = as_map();
    if (!m) return nullptr;
    for (const auto& member : *m) {
        if (member.key == key) return &member.value;
    }
    return nullptr;
}

auto Value::find_path(std::string_view dotted) const -> const Value* {
    const Value* cur = this;
    std::size_t pos = 0;
    while (cur) {
        const auto dot = dotted.find('.', pos);
        const auto seg = dotted.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
        cur = cur->find(seg);
        if (dot == std::string_view::npos) return cur;
        pos = dot + 1;
    }
    return nullptr;
}

void Value::set(std::string key, Value value) {
    if (is_null()) data_ = Map{};
    auto* m = as_map();
    if (!m) return;
    for (auto& member : *m) {
        if (member.key == key) {
            member.value = std::move(value);
            return;
        }
    }
    m->push_back(Member{std::move(key), std::move(value)});
}

bool Value::erase(std::string_view key) {
    auto* m = as_map();
    if (!m) return false;
    auto it = std::find_if(m->begin(), m->end(), [&](const Member& x) { return x.key == key; });
    if (it == m->end()) return false;
    m->erase(it);
    return true;
}

auto Value::size() const noexcept -> std::size_t {
    if (const auto* a = as_array()) return a->size();
    if (const auto* m = as_map()) return m->size();
    return 0;
}

bool operator==(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.kind() == Value::Kind::Int && b.kind() == Value::Kind::Int) return *a.as_int() == *b.as_int();
        return *a.as_number() == *b.as_number();
    }
    if (a.kind() != b.kind()) return false;
    if (const auto* am = a.as_map()) {
        const auto* bm = b.as_map();
        if (am->size() != bm->size()) return false;
        for (const auto& m : *am) {
            const auto* other = b.find(m.key);
            if (!other || !(*other == m.value)) return false;
        }
        return true;
    }
    return a.data_ == b.data_;
}

auto split_path(std::string_view dotted) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t pos = 0;
    for (;;) {
        const auto dot = dotted.find('.', pos);
        if (dot == std::string_view::npos) {
            out.emplace_back(dotted.substr(pos));
            return out;
        }
        out.emplace_back(dotted.substr(pos, dot - pos));
        pos = dot + 1;
    }
}

// JSON bridge

auto to_json(const Value& v) -> nlohmann::json {
    switch (v.kind()) {
    case Value::Kind::Null: return nullptr;
    case Value::Kind::Bool: return *v.as_bool();
    case Value::Kind::Int: return *v.as_int();
    case Value::Kind::Double: {
        const double d = *v.as_double();
        if (!std::isfinite(d)) return nullptr;
        return d;
    }
    case Value::Kind::String: return *v.as_string();
    case Value::Kind::Array: {
        auto arr = nlohmann::json::array();
        for (const auto& e : *v.as_array()) arr.push_back(to_json(e));
        return arr;
    }
    case Value::Kind::Map: {
        auto obj = nlohmann::json::object();
        for (const auto& m : *v.as_map()) obj[m.key] = to_json(m.value);
        return obj;
    }
    }
    return nullptr;
}

auto from_json(const nlohmann::json& j) -> Value {
    switch (j.type()) {
    case nlohmann::json::value_t::boolean: return Value(j.get<bool>());
    case nlohmann::json::value_t::number_integer: return Value(j.get<std::int64_t>());
    case nlohmann::json::value_t::number_unsigned: {
        const auto u = j.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return Value(static_cast<double>(u));
        return Value(static_cast<std::int64_t>(u));
    }
    case nlohmann::json::value_t::number_float: return Value(j.get<double>());
    case nlohmann::json::value_t::string: return Value(j.get<std::string>());
    case nlohmann::json::value_t::array: {
        Value::Array arr;
        arr.reserve(j.size());
        for (const auto& e : j) arr.push_back(from_json(e));
        return Value(std::move(arr));
    }
    case nlohmann::json::value_t::object: {
        Value out = Value::empty_map();
        for (auto it = j.begin(); it != j.end(); ++it) out.set(it.key(), from_json(it.value()));
        return out;
    }
    default: return Value{};
    }
}

auto to_json_text(const Value& v) -> std::string {
    return to_json(v).dump();
}

auto parse_json_value(std::string_view text) -> std::expected<Value, core::error> {
    auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return core::make_error(core::error_code::invalid_argument, "malformed JSON", "value.json");
    }
    return from_json(j);
}

} // namespace embdb
