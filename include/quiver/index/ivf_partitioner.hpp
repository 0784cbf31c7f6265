#pragma once

/** \file ivf_partitioner.hpp
 *  \brief Coarse quantizer partitioning vectors into IVF cells.
 *
 * Trains num_partitions centroids with k-means on a uniform sample drawn
 * without replacement, then assigns each vector to its nearest centroid.
 * Ties resolve to the lowest centroid index. Inputs are expected to be
 * pre-normalized when the metric is cosine.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include "quiver/core/cancellation.hpp"
#include "quiver/error.hpp"
#include "quiver/kernels/distance.hpp"

namespace quiver::index {

struct IvfTrainParams {
    std::uint32_t num_partitions{0};
    kernels::DistanceType metric{kernels::DistanceType::L2};
    std::uint32_t max_iterations{50};
    std::uint32_t sample_rate{256};      /**< Training sample = sample_rate * num_partitions */
    float epsilon{1e-4f};
    std::uint32_t seed{42};
    std::uint32_t num_threads{0};
    bool verbose{false};
};

class IvfPartitioner {
public:
    IvfPartitioner() = default;

    /** \brief Train centroids.
     *
     * Errors: invalid_parameter (num_partitions == 0, dim == 0),
     * insufficient_data (n < num_partitions), cancelled.
     * sampled_all is set when n is at or below the requested sample size.
     */
    static auto train(const float* data, std::size_t n, std::size_t dim,
                      const IvfTrainParams& params,
                      const core::CancellationToken* cancel = nullptr,
                      bool* sampled_all = nullptr)
        -> std::expected<IvfPartitioner, core::error>;

    /** \brief Rebuild from persisted centroids [k x dim]. */
    static auto from_centroids(std::vector<float> centroids, std::size_t dim,
                               kernels::DistanceType metric)
        -> std::expected<IvfPartitioner, core::error>;

    /** \brief Nearest partition for one vector. */
    auto assign(std::span<const float> vec) const -> std::expected<std::uint32_t, core::error>;

    /** \brief Parallel nearest-partition assignment for n vectors. */
    void assign_batch(const float* data, std::size_t n, std::span<std::uint32_t> out,
                      std::uint32_t num_threads = 0) const;

    /** \brief Up to nprobes closest partitions as (id, distance), nearest first. */
    auto nearest(std::span<const float> query, std::uint32_t nprobes) const
        -> std::vector<std::pair<std::uint32_t, float>>;

    auto num_partitions() const noexcept -> std::uint32_t { return num_partitions_; }
    auto dimension() const noexcept -> std::size_t { return dim_; }
    auto metric() const noexcept -> kernels::DistanceType { return metric_; }

    auto centroid(std::uint32_t id) const noexcept -> std::span<const float> {
        return {centroids_.data() + static_cast<std::size_t>(id) * dim_, dim_};
    }
    auto centroids() const noexcept -> std::span<const float> { return centroids_; }

private:
    auto nearest_one(const float* vec) const noexcept -> std::uint32_t;

    std::vector<float> centroids_;       // [k x dim]
    std::size_t dim_{0};
    std::uint32_t num_partitions_{0};
    kernels::DistanceType metric_{kernels::DistanceType::L2};
};

/** \brief ceil(sqrt(rows)), at least 1. */
auto suggested_num_partitions(std::uint64_t rows) noexcept -> std::uint32_t;

/** \brief Indices of k rows drawn uniformly without replacement from [0, n), sorted. */
auto sample_without_replacement(std::size_t n, std::size_t k, std::uint32_t seed)
    -> std::vector<std::size_t>;

} // namespace quiver::index
