/** \file memory_document_store.cpp
 *  \brief In-process document store with atomic JSON snapshots.
 */

#include "embdb/store/document_store.hpp"

#include <fstream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

#include "embdb/core/log.hpp"
#include "embdb/json.hpp"

namespace embdb::store {

namespace {

constexpr const char* kComponent = "store.documents";
constexpr const char* kSnapshotHeader = "embdb-documents v1";

using collection_map = std::map<std::string, std::map<std::string, Value>>;

auto encode(const collection_map& docs) -> std::string {
    nlohmann::json root = nlohmann::json::object();
    root["format"] = kSnapshotHeader;
    auto& cols = root["collections"] = nlohmann::json::object();
    for (const auto& [name, entries] : docs) {
        auto& col = cols[name] = nlohmann::json::object();
        for (const auto& [key, doc] : entries) col[key] = to_json(doc);
    }
    return root.dump();
}

auto decode(const std::string& text) -> std::expected<collection_map, core::error> {
    auto root = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded() || !root.is_object()) {
        return std::unexpected(core::error{core::error_code::data_integrity, "snapshot is not valid JSON", kComponent});
    }
    auto fmt = root.find("format");
    if (fmt == root.end() || *fmt != kSnapshotHeader) {
        return std::unexpected(core::error{core::error_code::data_integrity, "bad snapshot header", kComponent});
    }
    collection_map out;
    auto cols = root.find("collections");
    if (cols == root.end() || !cols->is_object()) return out;
    for (auto c = cols->begin(); c != cols->end(); ++c) {
        if (!c.value().is_object()) continue;
        auto& entries = out[c.key()];
        for (auto d = c.value().begin(); d != c.value().end(); ++d) entries.emplace(d.key(), from_json(d.value()));
    }
    return out;
}

/** Write tmp, fsync, rename over the destination. */
auto write_atomically(const std::filesystem::path& dst, const std::string& contents) -> std::expected<void, core::error> {
    auto tmp = dst;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) return std::unexpected(core::error{core::error_code::io_failed, "snapshot tmp write failed", kComponent});
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out.good()) return std::unexpected(core::error{core::error_code::io_failed, "snapshot tmp write failed", kComponent});
    }
#if defined(__linux__) || defined(__APPLE__)
    int fd = ::open(tmp.string().c_str(), O_RDONLY);
    if (fd < 0) return std::unexpected(core::error{core::error_code::io_failed, "snapshot fsync open failed", kComponent});
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) return std::unexpected(core::error{core::error_code::io_failed, "snapshot fsync failed", kComponent});
#endif
    std::error_code ec;
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return std::unexpected(core::error{core::error_code::io_failed, "snapshot rename failed", kComponent});
    }
    return {};
}

} // namespace

class MemoryDocumentStore::Impl {
public:
    explicit Impl(std::optional<std::filesystem::path> snapshot) : snapshot_(std::move(snapshot)) {}

    auto load() -> std::expected<void, core::error> {
        if (!snapshot_) return {};
        std::error_code ec;
        if (!std::filesystem::exists(*snapshot_, ec)) return {};
        std::ifstream in(*snapshot_, std::ios::binary);
        if (!in.good()) return std::unexpected(core::error{core::error_code::io_failed, "snapshot open failed", kComponent});
        std::ostringstream ss;
        ss << in.rdbuf();
        auto docs = decode(ss.str());
        if (!docs) return std::unexpected(docs.error());
        std::unique_lock lock(mutex_);
        docs_ = std::move(*docs);
        return {};
    }

    template <typename Fn>
    auto write(Fn&& mutate) -> decltype(mutate(std::declval<collection_map&>())) {
        std::unique_lock lock(mutex_);
        collection_map before;
        if (snapshot_) before = docs_;
        auto r = mutate(docs_);
        if (!r || !snapshot_) return r;
        if (auto saved = write_atomically(*snapshot_, encode(docs_)); !saved) {
            docs_ = std::move(before);
            return std::unexpected(saved.error());
        }
        return r;
    }

    template <typename Fn>
    auto read(Fn&& fn) const {
        std::shared_lock lock(mutex_);
        return fn(docs_);
    }

private:
    std::optional<std::filesystem::path> snapshot_;
    mutable std::shared_mutex mutex_;
    collection_map docs_;
};

MemoryDocumentStore::MemoryDocumentStore() : impl_(std::make_unique<Impl>(std::nullopt)) {}
MemoryDocumentStore::~MemoryDocumentStore() = default;

auto MemoryDocumentStore::open(const std::filesystem::path& snapshot)
    -> std::expected<std::unique_ptr<MemoryDocumentStore>, core::error> {
    auto store = std::make_unique<MemoryDocumentStore>();
    store->impl_ = std::make_unique<Impl>(snapshot);
    if (auto loaded = store->impl_->load(); !loaded) return std::unexpected(loaded.error());
    core::logger()->debug("document snapshot loaded from {}", snapshot.string());
    return store;
}

auto MemoryDocumentStore::insert_one(const std::string& collection, const std::string& key, const Value& doc)
    -> std::expected<void, core::error> {
    return impl_->write([&](collection_map& docs) -> std::expected<void, core::error> {
        auto [it, inserted] = docs[collection].try_emplace(key, doc);
        if (!inserted) {
            return std::unexpected(core::error{core::error_code::already_exists,
                                               "document already exists: " + collection + "/" + key, kComponent});
        }
        return {};
    });
}

auto MemoryDocumentStore::upsert_one(const std::string& collection, const std::string& key, const Value& doc)
    -> std::expected<void, core::error> {
    return impl_->write([&](collection_map& docs) -> std::expected<void, core::error> {
        docs[collection].insert_or_assign(key, doc);
        return {};
    });
}

auto MemoryDocumentStore::update_fields(const std::string& collection, const std::string& key, const Value& fields)
    -> std::expected<void, core::error> {
    return impl_->write([&](collection_map& docs) -> std::expected<void, core::error> {
        auto col = docs.find(collection);
        if (col == docs.end() || col->second.find(key) == col->second.end()) {
            return std::unexpected(core::error{core::error_code::not_found,
                                               "document not found: " + collection + "/" + key, kComponent});
        }
        auto& doc = col->second[key];
        if (const auto* members = fields.as_map()) {
            for (const auto& m : *members) doc.set(m.key, m.value);
        }
        return {};
    });
}

auto MemoryDocumentStore::delete_one(const std::string& collection, const std::string& key)
    -> std::expected<bool, core::error> {
    return impl_->write([&](collection_map& docs) -> std::expected<bool, core::error> {
        auto col = docs.find(collection);
        if (col == docs.end()) return false;
        return col->second.erase(key) > 0;
    });
}

auto MemoryDocumentStore::find_one(const std::string& collection, const std::string& key)
    -> std::expected<std::optional<Value>, core::error> {
    return impl_->read([&](const collection_map& docs) -> std::expected<std::optional<Value>, core::error> {
        auto col = docs.find(collection);
        if (col == docs.end()) return std::optional<Value>{};
        auto it = col->second.find(key);
        if (it == col->second.end()) return std::optional<Value>{};
        return it->second;
    });
}

auto MemoryDocumentStore::find(const std::string& collection, const std::string& field, const Value& value)
    -> std::expected<std::vector<Value>, core::error> {
    return impl_->read([&](const collection_map& docs) -> std::expected<std::vector<Value>, core::error> {
        std::vector<Value> out;
        auto col = docs.find(collection);
        if (col == docs.end()) return out;
        for (const auto& [key, doc] : col->second) {
            const Value* f = doc.find(field);
            if (f && *f == value) out.push_back(doc);
        }
        return out;
    });
}

} // namespace embdb::store
