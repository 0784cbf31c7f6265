#include "quiver/index/kmeans.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

#include <omp.h>

namespace quiver::index {

namespace {

// Upper bound on doubles held by per-thread partial accumulators (256 MiB).
constexpr std::size_t kMaxPartialDoubles = std::size_t{32} * 1024 * 1024;

inline auto resolve_threads(std::uint32_t requested) -> int {
    return requested > 0 ? static_cast<int>(requested) : omp_get_max_threads();
}

/** \brief Seeding weight; must be non-negative, so dot falls back to L2^2. */
inline auto seeding_weight(const float* a, const float* b, std::size_t dim,
                           kernels::DistanceType metric) -> float {
    if (metric == kernels::DistanceType::Dot) {
        return kernels::l2_sq({a, dim}, {b, dim});
    }
    return std::max(0.0f, kernels::distance(metric, {a, dim}, {b, dim}));
}

} // anonymous namespace

auto find_nearest_centroid(const float* point,
                           const std::vector<std::vector<float>>& centroids,
                           std::size_t dim,
                           kernels::DistanceType metric) -> std::pair<std::uint32_t, float> {
    std::uint32_t best_idx = 0;
    float best_dist = std::numeric_limits<float>::max();

    for (std::uint32_t i = 0; i < centroids.size(); ++i) {
        const float dist = kernels::distance(metric, {point, dim}, {centroids[i].data(), dim});
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = i;
        }
    }

    return {best_idx, best_dist};
}

auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed,
                          kernels::DistanceType metric)
    -> std::vector<std::vector<float>> {
    std::vector<std::vector<float>> centroids;
    centroids.reserve(k);

    std::mt19937 gen(seed);

    std::uniform_int_distribution<std::size_t> first_dist(0, n - 1);
    const std::size_t first_idx = first_dist(gen);
    centroids.emplace_back(data + first_idx * dim, data + (first_idx + 1) * dim);

    std::vector<float> min_distances(n, std::numeric_limits<float>::max());
    std::vector<double> cumsum(n);

    for (std::uint32_t c = 1; c < k; ++c) {
        const auto& last_centroid = centroids.back();

        #pragma omp parallel for schedule(static)
        for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
            const float w = seeding_weight(data + static_cast<std::size_t>(i) * dim,
                                           last_centroid.data(), dim, metric);
            min_distances[i] = std::min(min_distances[i], w);
        }

        cumsum[0] = min_distances[0];
        for (std::size_t i = 1; i < n; ++i) {
            cumsum[i] = cumsum[i - 1] + min_distances[i];
        }

        std::size_t idx = 0;
        if (cumsum.back() > 0.0) {
            std::uniform_real_distribution<double> sample_dist(0.0, cumsum.back());
            const double target = sample_dist(gen);
            const auto it = std::upper_bound(cumsum.begin(), cumsum.end(), target);
            idx = std::min<std::size_t>(static_cast<std::size_t>(std::distance(cumsum.begin(), it)), n - 1);
        } else {
            // Every point coincides with a chosen centroid; any pick is as good.
            idx = first_dist(gen);
        }

        centroids.emplace_back(data + idx * dim, data + (idx + 1) * dim);
    }

    return centroids;
}

auto kmeans_assign(const float* data, std::size_t n,
                   const std::vector<std::vector<float>>& centroids,
                   kernels::DistanceType metric,
                   std::span<std::uint32_t> assignments,
                   std::uint32_t num_threads) -> float {
    const std::size_t dim = centroids[0].size();
    double total_inertia = 0.0;

    #pragma omp parallel for schedule(static) num_threads(resolve_threads(num_threads)) reduction(+:total_inertia)
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
        const auto [idx, dist] = find_nearest_centroid(
            data + static_cast<std::size_t>(i) * dim, centroids, dim, metric);
        assignments[static_cast<std::size_t>(i)] = idx;
        total_inertia += dist;
    }

    return static_cast<float>(total_inertia);
}

auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids,
                             std::uint32_t num_threads) -> float {
    const std::size_t cells = static_cast<std::size_t>(k) * dim;
    int threads = resolve_threads(num_threads);
    threads = static_cast<int>(std::max<std::size_t>(1,
        std::min<std::size_t>(static_cast<std::size_t>(threads), kMaxPartialDoubles / std::max<std::size_t>(cells, 1))));

    // Per-thread partial accumulators, merged below in thread order.
    std::vector<std::vector<double>> partial_sums(static_cast<std::size_t>(threads));
    std::vector<std::vector<std::uint32_t>> partial_counts(static_cast<std::size_t>(threads));

    #pragma omp parallel num_threads(threads)
    {
        const auto t = static_cast<std::size_t>(omp_get_thread_num());
        auto& sums = partial_sums[t];
        auto& counts = partial_counts[t];
        sums.assign(cells, 0.0);
        counts.assign(k, 0);

        #pragma omp for schedule(static)
        for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
            const std::uint32_t cluster = assignments[static_cast<std::size_t>(i)];
            counts[cluster]++;
            const float* point = data + static_cast<std::size_t>(i) * dim;
            double* acc = sums.data() + static_cast<std::size_t>(cluster) * dim;
            for (std::size_t d = 0; d < dim; ++d) {
                acc[d] += point[d];
            }
        }
    }

    std::vector<double> sums(cells, 0.0);
    std::vector<std::uint64_t> counts(k, 0);
    for (std::size_t t = 0; t < partial_sums.size(); ++t) {
        if (partial_sums[t].empty()) continue;
        for (std::size_t j = 0; j < cells; ++j) sums[j] += partial_sums[t][j];
        for (std::uint32_t c = 0; c < k; ++c) counts[c] += partial_counts[t][c];
    }

    float max_shift = 0.0f;
    for (std::uint32_t c = 0; c < k; ++c) {
        if (counts[c] == 0) continue;  // empty cluster keeps its previous centroid
        float shift = 0.0f;
        const double* acc = sums.data() + static_cast<std::size_t>(c) * dim;
        for (std::size_t d = 0; d < dim; ++d) {
            const float updated = static_cast<float>(acc[d] / static_cast<double>(counts[c]));
            const float diff = updated - centroids[c][d];
            shift += diff * diff;
            centroids[c][d] = updated;
        }
        max_shift = std::max(max_shift, shift);
    }
    return max_shift;
}

auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params,
                    const core::CancellationToken* cancel)
    -> std::expected<KmeansResult, core::error> {
    using core::error_code;

    if (params.k == 0) {
        return core::make_error(error_code::invalid_parameter, "k must be > 0", "kmeans");
    }
    if (dim == 0) {
        return core::make_error(error_code::invalid_parameter, "dimension must be > 0", "kmeans");
    }
    if (n < params.k) {
        return core::make_error(error_code::insufficient_data,
            "Not enough data points for k clusters (n=" + std::to_string(n) +
            ", k=" + std::to_string(params.k) + ")", "kmeans");
    }

    const auto start_time = std::chrono::steady_clock::now();

    auto centroids = kmeans_plusplus_init(data, n, dim, params.k, params.seed, params.metric);
    std::vector<std::uint32_t> assignments(n);

    std::uint32_t iter = 0;
    bool converged = false;
    float inertia = 0.0f;

    // Lloyd's algorithm iterations
    for (; iter < params.max_iter; ++iter) {
        if (core::is_cancelled(cancel)) {
            return std::unexpected(core::cancelled_error("kmeans"));
        }

        inertia = kmeans_assign(data, n, centroids, params.metric, assignments, params.num_threads);
        const float shift = kmeans_update_centroids(data, n, dim, assignments, params.k,
                                                    centroids, params.num_threads);

        if (params.verbose) {
            std::cerr << "[KMEANS] iter=" << iter << " inertia=" << inertia
                      << " max_shift=" << shift << std::endl;
        }

        if (shift < params.epsilon) {
            ++iter;
            converged = true;
            break;
        }
    }

    // Final assignment against the returned centroids keeps both consistent.
    inertia = kmeans_assign(data, n, centroids, params.metric, assignments, params.num_threads);

    std::vector<std::uint32_t> cluster_sizes(params.k, 0);
    for (std::uint32_t a : assignments) {
        cluster_sizes[a]++;
    }

    const auto duration = std::chrono::duration<float>(std::chrono::steady_clock::now() - start_time);

    KmeansResult result;
    result.centroids = std::move(centroids);
    result.assignments = std::move(assignments);
    result.cluster_sizes = std::move(cluster_sizes);
    result.inertia = inertia;
    result.iterations = iter;
    result.converged = converged;
    result.time_sec = duration.count();
    return result;
}

} // namespace quiver::index
