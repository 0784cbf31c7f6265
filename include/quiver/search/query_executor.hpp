#pragma once

/** \file query_executor.hpp
 *  \brief Vector query execution: indexed ADC search or exact flat scan,
 *         with optional prefilter / postfilter and exact re-ranking.
 *
 * Prefilter evaluates the filter first (BTree index on the filter column when
 * available, else a full column scan) and restricts scanning to the matching
 * row ids. Postfilter searches first and drops non-matching hits, so it may
 * return fewer than k results.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/filter_eval.hpp"
#include "quiver/filter_expr.hpp"
#include "quiver/index/ivf_pq.hpp"
#include "quiver/index/search_types.hpp"
#include "quiver/kernels/distance.hpp"
#include "quiver/storage/data_source.hpp"

namespace quiver::search {

/** \brief Nearest-neighbour query over a vector column. */
struct VectorQuery {
    std::optional<std::string> column;           /**< Default: the only vector column */
    std::vector<float> vector;
    std::uint32_t k{10};
    std::optional<std::uint32_t> nprobes;        /**< Default: ManagerOptions::default_nprobes */
    std::optional<std::uint32_t> refine_factor;  /**< Default 1 (no re-ranking) */
    std::optional<kernels::DistanceType> distance_type;  /**< Flat search only; indexed search uses the index metric */
    std::optional<filter_expr> filter;
    bool prefilter{true};
    bool use_index{true};                        /**< false forces an exact flat scan */
};

class QueryExecutor {
public:
    QueryExecutor(const storage::DataSource& source, filter_eval::ScalarIndexLookup scalar_lookup,
                  std::uint32_t default_nprobes = 20);

    /** \brief Run a query against a resolved column.
     *
     * \param column Resolved vector column name
     * \param vector_index Index on the column, or nullptr for a flat scan
     *
     * Indexed search only returns rows the source still holds; rows removed
     * since the build are skipped.
     * Errors: invalid_parameter (k, nprobes or refine_factor == 0),
     * dimension_mismatch, column_resolution, plus filter evaluation errors.
     */
    auto execute(const VectorQuery& query, const std::string& column,
                 const std::shared_ptr<const index::IvfPqIndex>& vector_index) const
        -> std::expected<std::vector<index::SearchHit>, core::error>;

    /** \brief Exact brute-force top-k over a column, optionally restricted to allowed. */
    auto flat_search(const std::string& column, std::span<const float> query, std::uint32_t k,
                     kernels::DistanceType metric, const roaring::Roaring64Map* allowed) const
        -> std::expected<std::vector<index::SearchHit>, core::error>;

private:
    auto apply_postfilter(const filter_expr& filter, std::vector<index::SearchHit> hits) const
        -> std::expected<std::vector<index::SearchHit>, core::error>;

    const storage::DataSource& source_;
    filter_eval::ScalarIndexLookup scalar_lookup_;
    std::uint32_t default_nprobes_;
};

} // namespace quiver::search
