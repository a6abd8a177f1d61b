#pragma once

/** \file document_store.hpp
 *  \brief Small keyed document store for metadata records.
 *
 * Documents are map Values grouped in named collections and addressed by a string key that is
 * unique per collection. insert_one detects key conflicts (already_exists); find() filters on
 * a top-level field.
 */

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "embdb/error.hpp"
#include "embdb/value.hpp"

namespace embdb::store {

class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /** \brief Insert a new document; an existing key is already_exists. */
    virtual auto insert_one(const std::string& collection, const std::string& key, const Value& doc)
        -> std::expected<void, core::error> = 0;
    /** \brief Insert or replace a document. */
    virtual auto upsert_one(const std::string& collection, const std::string& key, const Value& doc)
        -> std::expected<void, core::error> = 0;
    /** \brief Set top-level fields of an existing document; not_found when absent. */
    virtual auto update_fields(const std::string& collection, const std::string& key, const Value& fields)
        -> std::expected<void, core::error> = 0;
    /** \brief Delete a document; returns whether one existed. */
    virtual auto delete_one(const std::string& collection, const std::string& key) -> std::expected<bool, core::error> = 0;
    virtual auto find_one(const std::string& collection, const std::string& key)
        -> std::expected<std::optional<Value>, core::error> = 0;
    /** \brief Documents whose top-level `field` equals `value`, in key order. */
    virtual auto find(const std::string& collection, const std::string& field, const Value& value)
        -> std::expected<std::vector<Value>, core::error> = 0;
};

/** \brief In-process DocumentStore with an optional JSON snapshot file.
 *
 * With a snapshot path every write rewrites the file atomically (tmp, fsync, rename) and
 * open() reloads it. Thread-safe.
 */
class MemoryDocumentStore final : public DocumentStore {
public:
    MemoryDocumentStore();
    ~MemoryDocumentStore() override;

    /** \brief Open a store persisted at `snapshot`; a missing file starts empty. */
    static auto open(const std::filesystem::path& snapshot) -> std::expected<std::unique_ptr<MemoryDocumentStore>, core::error>;

    auto insert_one(const std::string& collection, const std::string& key, const Value& doc)
        -> std::expected<void, core::error> override;
    auto upsert_one(const std::string& collection, const std::string& key, const Value& doc)
        -> std::expected<void, core::error> override;
    auto update_fields(const std::string& collection, const std::string& key, const Value& fields)
        -> std::expected<void, core::error> override;
    auto delete_one(const std::string& collection, const std::string& key) -> std::expected<bool, core::error> override;
    auto find_one(const std::string& collection, const std::string& key)
        -> std::expected<std::optional<Value>, core::error> override;
    auto find(const std::string& collection, const std::string& field, const Value& value)
        -> std::expected<std::vector<Value>, core::error> override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace embdb::store
