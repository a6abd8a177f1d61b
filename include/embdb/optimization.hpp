#pragma once

/** \file optimization.hpp
 *  \brief Named, apply-once maintenance steps run against collections.
 *
 * VectorDb applies each registered optimization at most once per collection and records its
 * name in the collection's applied_optimizations.
 */

#include <expected>
#include <string>

#include "embdb/collection.hpp"
#include "embdb/error.hpp"

namespace embdb {

class Optimization {
public:
    explicit Optimization(std::string name) : name_(std::move(name)) {}
    virtual ~Optimization() = default;

    auto name() const -> const std::string& { return name_; }

    virtual auto apply(Collection& collection) -> std::expected<void, core::error> = 0;

private:
    std::string name_;
};

/** \brief Build the collection's HNSW index. */
class CreateIndexOptimization final : public Optimization {
public:
    CreateIndexOptimization() : Optimization("create_index") {}
    auto apply(Collection& collection) -> std::expected<void, core::error> override { return collection.create_index(); }
};

/** \brief Refresh planner statistics of the object and part tables. */
class AnalyzeTablesOptimization final : public Optimization {
public:
    AnalyzeTablesOptimization() : Optimization("analyze_tables") {}
    auto apply(Collection& collection) -> std::expected<void, core::error> override { return collection.analyze(); }
};

} // namespace embdb
