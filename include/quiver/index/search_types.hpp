#pragma once

/** \file search_types.hpp
 *  \brief Result types shared by vector search paths.
 */

#include <cstdint>
#include <functional>
#include <span>
#include <expected>
#include <vector>

#include "quiver/error.hpp"

namespace quiver::index {

/** \brief One ranked result; smaller distance is closer. */
struct SearchHit {
    std::uint64_t row_id{0};
    float distance{0.0f};

    friend bool operator==(const SearchHit&, const SearchHit&) = default;
};

/** \brief Ordering used by every result list: distance, then row id. */
inline bool hit_less(const SearchHit& a, const SearchHit& b) noexcept {
    return a.distance < b.distance || (a.distance == b.distance && a.row_id < b.row_id);
}

/** \brief Fetches original vectors (flattened, in request order) for exact re-ranking. */
using VectorFetcher = std::function<
    std::expected<std::vector<float>, core::error>(std::span<const std::uint64_t>)>;

} // namespace quiver::index
