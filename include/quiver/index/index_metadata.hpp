#pragma once

/** \file index_metadata.hpp
 *  \brief Index registry records: kind, state, parameters, metadata and statistics.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/index/btree_index.hpp"
#include "quiver/index/ivf_pq.hpp"
#include "quiver/kernels/distance.hpp"

namespace quiver::index {

enum class IndexKind : std::uint8_t { Vector = 0, Scalar = 1 };

/** \brief Per-name lifecycle: Absent -> Building -> Ready (-> Building -> Ready) -> Dropped. */
enum class IndexState : std::uint8_t { Absent = 0, Building = 1, Ready = 2, Dropped = 3 };

constexpr auto to_string(IndexKind k) noexcept -> std::string_view {
    return k == IndexKind::Vector ? "vector" : "scalar";
}

constexpr auto to_string(IndexState s) noexcept -> std::string_view {
    switch (s) {
        case IndexState::Absent: return "absent";
        case IndexState::Building: return "building";
        case IndexState::Ready: return "ready";
        case IndexState::Dropped: return "dropped";
    }
    return "unknown";
}

using IndexParams = std::variant<IvfPqBuildParams, BTreeBuildParams>;

/** \brief Published index structure; shared read-only with in-flight queries. */
using IndexVariant = std::variant<std::shared_ptr<const IvfPqIndex>, std::shared_ptr<const BTreeIndex>>;

inline auto kind_of(const IndexParams& p) noexcept -> IndexKind {
    return std::holds_alternative<IvfPqBuildParams>(p) ? IndexKind::Vector : IndexKind::Scalar;
}

inline auto kind_of(const IndexVariant& v) noexcept -> IndexKind {
    return std::holds_alternative<std::shared_ptr<const IvfPqIndex>>(v) ? IndexKind::Vector : IndexKind::Scalar;
}

struct IndexMetadata {
    std::string name;
    std::string column;
    IndexKind kind{IndexKind::Vector};
    std::string uuid;                                   /**< Unique per published version */
    std::optional<kernels::DistanceType> distance_type; /**< Vector indices only */
    IndexParams params;                                 /**< Resolved build parameters */
    bool replace{true};
    std::int64_t build_timestamp{0};                    /**< Unix seconds */
    std::uint64_t version{0};                           /**< Monotonic per index name */
    std::uint64_t num_indexed_rows{0};
    std::uint64_t data_version{0};                      /**< Source data version at build time */
    bool stale{false};                                  /**< Filled in when listed */
};

struct IndexStatistics {
    std::string name;
    IndexKind kind{IndexKind::Vector};
    IndexState state{IndexState::Absent};
    std::uint64_t version{0};
    std::uint64_t num_indexed_rows{0};
    std::uint64_t num_unindexed_rows{0};   /**< Live source rows not covered by the index */
    std::optional<std::uint32_t> num_partitions;
    std::optional<std::size_t> num_blocks;
    std::size_t memory_bytes{0};
    bool stale{false};
};

struct BuildReport {
    IndexMetadata metadata;
    std::vector<std::string> warnings;
    float build_time_sec{0.0f};
    std::optional<IvfPqBuildStats> vector_stats;
};

/** \brief Random 128-bit identifier rendered as 32 hex digits. */
auto generate_uuid() -> std::string;

/** \brief Metadata section payload (params are rebuilt from the index sections). */
auto encode_metadata(const IndexMetadata& meta) -> std::vector<std::uint8_t>;

/** \brief Inverse of encode_metadata; params are left default. Errors: data_integrity. */
auto decode_metadata(std::span<const std::uint8_t> bytes) -> std::expected<IndexMetadata, core::error>;

} // namespace quiver::index
