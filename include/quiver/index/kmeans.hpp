#pragma once

/** \file kmeans.hpp
 *  \brief K-means clustering shared by the IVF partitioner and the product quantizer.
 *
 * Implements k-means++ initialization and Lloyd's algorithm.
 * Features:
 * - Metric-aware assignment (L2, cosine, dot)
 * - Early stopping once the largest centroid shift drops below epsilon
 * - Parallel assignment over row ranges; centroid sums reduced from
 *   per-thread partial accumulators merged in thread order
 * - Cooperative cancellation between iterations
 *
 * Determinism: a fixed seed and thread count produce reproducible results.
 * Tie-breaking: on equal distances the lowest centroid index wins.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "quiver/core/cancellation.hpp"
#include "quiver/error.hpp"
#include "quiver/kernels/distance.hpp"

namespace quiver::index {

/** \brief K-means clustering parameters. */
struct KmeansParams {
    std::uint32_t k{256};                /**< Number of clusters */
    std::uint32_t max_iter{50};          /**< Maximum Lloyd iterations */
    float epsilon{1e-4f};                /**< Convergence threshold on max squared centroid shift */
    std::uint32_t seed{42};              /**< Random seed */
    kernels::DistanceType metric{kernels::DistanceType::L2};
    std::uint32_t num_threads{0};        /**< 0 = OpenMP default */
    bool verbose{false};                 /**< Progress output */
};

/** \brief K-means clustering result. */
struct KmeansResult {
    std::vector<std::vector<float>> centroids;  /**< Cluster centers [k x dim] */
    std::vector<std::uint32_t> assignments;     /**< Point assignments [n] */
    std::vector<std::uint32_t> cluster_sizes;   /**< Points per cluster [k] */
    float inertia{0.0f};                        /**< Sum of distances to assigned centroid */
    std::uint32_t iterations{0};                /**< Iterations performed */
    bool converged{false};                      /**< Stopped on epsilon before max_iter */
    float time_sec{0.0f};                       /**< Wall time */
};

/** \brief K-means clustering algorithm.
 *
 * \param data Input vectors [n x dim]
 * \param n Number of vectors
 * \param dim Vector dimensionality
 * \param params Clustering parameters
 * \param cancel Optional cancellation token, polled once per iteration
 * \return Clustering result or error
 *
 * Errors: insufficient_data when n < k; invalid_parameter when k == 0 or dim == 0;
 * cancelled when the token fires.
 * Complexity: O(n * k * dim * iterations)
 */
auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params,
                    const core::CancellationToken* cancel = nullptr)
    -> std::expected<KmeansResult, core::error>;

/** \brief K-means++ initialization.
 *
 * Selects initial centroids with probability proportional to distance from
 * the closest already chosen centroid.
 *
 * Complexity: O(n * k * dim)
 */
auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed,
                          kernels::DistanceType metric)
    -> std::vector<std::vector<float>>;

/** \brief Index of the nearest centroid and its distance; lowest index on ties. */
auto find_nearest_centroid(const float* point,
                           const std::vector<std::vector<float>>& centroids,
                           std::size_t dim,
                           kernels::DistanceType metric) -> std::pair<std::uint32_t, float>;

/** \brief Assign points to nearest centroids.
 *
 * \return Total inertia (sum of distances)
 * Thread-safety: internally parallelized; no shared mutable state.
 */
auto kmeans_assign(const float* data, std::size_t n,
                   const std::vector<std::vector<float>>& centroids,
                   kernels::DistanceType metric,
                   std::span<std::uint32_t> assignments,
                   std::uint32_t num_threads = 0) -> float;

/** \brief Recompute centroids as the mean of their members.
 *
 * Empty clusters keep their previous centroid.
 * \return Largest squared shift of any centroid
 */
auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids,
                             std::uint32_t num_threads = 0) -> float;

} // namespace quiver::index
