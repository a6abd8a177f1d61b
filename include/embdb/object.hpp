#pragma once

/** \file object.hpp
 *  \brief Object model and search request/result types.
 *
 * An object carries a payload, storage metadata and one or more named vector parts.
 * Personalized objects set user_id and point at the canonical object they customize
 * through original_id.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "embdb/payload_filter.hpp"
#include "embdb/value.hpp"

namespace embdb {

struct ObjectPart {
    std::string part_id;            /**< empty on input: assigned "<object_id>_<index>" */
    std::vector<float> vector;
    bool is_average{false};
};

struct Object {
    std::string object_id;
    Value payload{Value::empty_map()};
    Value storage_meta{Value::empty_map()};
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
    std::optional<std::string> original_id;
    std::vector<ObjectPart> parts;
};

/** \brief One search hit. `parts` carries part ids and flags; vectors only with with_vectors.
 *
 * Similarity hits carry only the parts counted in parts_found, closest first.
 */
struct FoundObject {
    std::string object_id;
    std::optional<std::string> original_id;
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
    Value payload;
    Value storage_meta;
    std::uint32_t parts_found{0};
    std::vector<ObjectPart> parts;
    std::optional<double> distance;  /**< aggregated; set for similarity results */
};

struct SearchResults {
    std::vector<FoundObject> found_objects;
    std::optional<std::size_t> next_offset;   /**< offset + limit when the page was full */
    std::optional<std::size_t> subset_count;  /**< objects that passed filtering (similarity only) */
};

struct ObjectCommonData {
    std::string object_id;
    Value payload;
    Value storage_meta;
};

struct ObjectsCommonDataBatch {
    std::vector<ObjectCommonData> objects;
    std::size_t total{0};
    std::optional<std::size_t> next_offset;
};

enum class SortOrder : std::uint8_t { asc, desc };

struct SortByOptions {
    std::string field;
    SortOrder order{SortOrder::asc};
    bool force_not_payload{false};
};

/** \brief Parameters of Collection::find_similarities. */
struct SimilarityParams {
    std::size_t limit{10};
    std::size_t offset{0};
    std::optional<double> max_distance;
    std::optional<PayloadFilter> payload_filter;
    std::optional<std::string> user_id;
    /** Rank first, then filter a prefetch window (faster, may under-return). */
    bool similarity_first{false};
    /** Order hits within max_distance by a field instead of distance; ignored with similarity_first. */
    std::optional<SortByOptions> sort_by;
    /** Score only parts flagged is_average. */
    bool average_only{false};
    bool with_vectors{false};
};

/** \brief Parameters of Collection::find_by_payload_filter. */
struct PayloadSearchParams {
    std::optional<PayloadFilter> payload_filter;
    std::size_t limit{10};
    std::size_t offset{0};
    std::optional<SortByOptions> sort_by;
    std::optional<std::string> user_id;
    bool with_vectors{false};
};

} // namespace embdb
