#include "quiver/index/ivf_partitioner.hpp"
#include "quiver/index/kmeans.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <numeric>
#include <random>

#include <omp.h>

namespace quiver::index {

auto suggested_num_partitions(std::uint64_t rows) noexcept -> std::uint32_t {
    if (rows <= 1) return 1;
    auto p = static_cast<std::uint64_t>(std::ceil(std::sqrt(static_cast<double>(rows))));
    // Guard against sqrt rounding just below an exact square.
    while (p * p < rows) ++p;
    while (p > 1 && (p - 1) * (p - 1) >= rows) --p;
    return static_cast<std::uint32_t>(p);
}

auto sample_without_replacement(std::size_t n, std::size_t k, std::uint32_t seed)
    -> std::vector<std::size_t> {
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    if (k >= n) return idx;

    // Partial Fisher-Yates: the first k slots end up a uniform sample.
    std::mt19937 gen(seed);
    for (std::size_t i = 0; i < k; ++i) {
        std::uniform_int_distribution<std::size_t> pick(i, n - 1);
        std::swap(idx[i], idx[pick(gen)]);
    }
    idx.resize(k);
    std::sort(idx.begin(), idx.end());
    return idx;
}

auto IvfPartitioner::train(const float* data, std::size_t n, std::size_t dim,
                           const IvfTrainParams& params,
                           const core::CancellationToken* cancel,
                           bool* sampled_all)
    -> std::expected<IvfPartitioner, core::error> {
    using core::error_code;

    if (params.num_partitions == 0) {
        return core::make_error(error_code::invalid_parameter, "num_partitions must be > 0", "ivf_partitioner");
    }
    if (dim == 0) {
        return core::make_error(error_code::invalid_parameter, "dimension must be > 0", "ivf_partitioner");
    }
    if (n < params.num_partitions) {
        return core::make_error(error_code::insufficient_data,
            "Need at least num_partitions rows (rows=" + std::to_string(n) +
            ", num_partitions=" + std::to_string(params.num_partitions) + ")", "ivf_partitioner");
    }

    const std::size_t want = static_cast<std::size_t>(params.sample_rate) * params.num_partitions;
    const bool use_all = want == 0 || n <= want;
    if (sampled_all) *sampled_all = use_all && n < want;

    std::vector<float> sample;
    const float* train_data = data;
    std::size_t train_n = n;
    if (!use_all) {
        const auto rows = sample_without_replacement(n, want, params.seed);
        sample.resize(rows.size() * dim);
        for (std::size_t i = 0; i < rows.size(); ++i) {
            std::memcpy(sample.data() + i * dim, data + rows[i] * dim, dim * sizeof(float));
        }
        train_data = sample.data();
        train_n = rows.size();
    }

    if (params.verbose) {
        std::cerr << "[IVF][train] k=" << params.num_partitions << " sample=" << train_n
                  << " of " << n << " dim=" << dim << std::endl;
    }

    KmeansParams kp;
    kp.k = params.num_partitions;
    kp.max_iter = params.max_iterations;
    kp.epsilon = params.epsilon;
    kp.seed = params.seed;
    kp.metric = params.metric;
    kp.num_threads = params.num_threads;
    kp.verbose = params.verbose;

    auto result = kmeans_cluster(train_data, train_n, dim, kp, cancel);
    if (!result) {
        return std::unexpected(result.error());
    }

    IvfPartitioner out;
    out.dim_ = dim;
    out.num_partitions_ = params.num_partitions;
    out.metric_ = params.metric;
    out.centroids_.resize(static_cast<std::size_t>(params.num_partitions) * dim);
    for (std::uint32_t c = 0; c < params.num_partitions; ++c) {
        std::memcpy(out.centroids_.data() + static_cast<std::size_t>(c) * dim,
                    result->centroids[c].data(), dim * sizeof(float));
    }
    return out;
}

auto IvfPartitioner::from_centroids(std::vector<float> centroids, std::size_t dim,
                                    kernels::DistanceType metric)
    -> std::expected<IvfPartitioner, core::error> {
    if (dim == 0 || centroids.size() % dim != 0) {
        return core::make_error(core::error_code::data_integrity,
            "Centroid table size is not a multiple of the dimension", "ivf_partitioner");
    }
    IvfPartitioner out;
    out.dim_ = dim;
    out.num_partitions_ = static_cast<std::uint32_t>(centroids.size() / dim);
    out.metric_ = metric;
    out.centroids_ = std::move(centroids);
    return out;
}

auto IvfPartitioner::nearest_one(const float* vec) const noexcept -> std::uint32_t {
    std::uint32_t best = 0;
    float best_dist = std::numeric_limits<float>::max();
    for (std::uint32_t c = 0; c < num_partitions_; ++c) {
        const float d = kernels::distance(metric_, {vec, dim_}, centroid(c));
        if (d < best_dist) {
            best_dist = d;
            best = c;
        }
    }
    return best;
}

auto IvfPartitioner::assign(std::span<const float> vec) const -> std::expected<std::uint32_t, core::error> {
    if (num_partitions_ == 0) {
        return core::make_error(core::error_code::invalid_parameter, "Partitioner has no centroids",
                                "ivf_partitioner");
    }
    if (vec.size() != dim_) {
        return core::make_error(core::error_code::dimension_mismatch,
            "Expected dimension " + std::to_string(dim_) + ", got " + std::to_string(vec.size()),
            "ivf_partitioner");
    }
    return nearest_one(vec.data());
}

void IvfPartitioner::assign_batch(const float* data, std::size_t n, std::span<std::uint32_t> out,
                                  std::uint32_t num_threads) const {
    const int threads = num_threads > 0 ? static_cast<int>(num_threads) : omp_get_max_threads();
    #pragma omp parallel for schedule(static) num_threads(threads)
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
        out[static_cast<std::size_t>(i)] = nearest_one(data + static_cast<std::size_t>(i) * dim_);
    }
}

auto IvfPartitioner::nearest(std::span<const float> query, std::uint32_t nprobes) const
    -> std::vector<std::pair<std::uint32_t, float>> {
    std::vector<std::pair<std::uint32_t, float>> scored;
    scored.reserve(num_partitions_);
    for (std::uint32_t c = 0; c < num_partitions_; ++c) {
        scored.emplace_back(c, kernels::distance(metric_, query, centroid(c)));
    }
    const std::size_t keep = std::min<std::size_t>(nprobes, scored.size());
    auto by_distance = [](const auto& a, const auto& b) {
        return a.second < b.second || (a.second == b.second && a.first < b.first);
    };
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep), scored.end(),
                      by_distance);
    scored.resize(keep);
    return scored;
}

} // namespace quiver::index
