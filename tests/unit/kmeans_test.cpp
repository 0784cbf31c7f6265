#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <algorithm>
#include <limits>
#include <vector>

#include "quiver/index/kmeans.hpp"
#include "../support/test_data.hpp"

using Catch::Matchers::WithinAbs;
using quiver::kernels::DistanceType;

namespace {

/** \brief Fraction of points whose cluster's majority label matches their own. */
auto compute_purity(const std::vector<std::uint32_t>& assignments,
                    std::size_t n_labels, std::uint32_t k) -> float {
    const std::size_t n = assignments.size();
    std::size_t correct = 0;
    for (std::uint32_t c = 0; c < k; ++c) {
        std::vector<std::size_t> label_counts(n_labels, 0);
        for (std::size_t i = 0; i < n; ++i) {
            if (assignments[i] == c) label_counts[i % n_labels]++;
        }
        correct += *std::max_element(label_counts.begin(), label_counts.end());
    }
    return static_cast<float>(correct) / static_cast<float>(n);
}

} // anonymous namespace

TEST_CASE("K-means clustering", "[kmeans]") {

    SECTION("K-means++ initialization produces k distinct centroids") {
        const std::size_t n = 100;
        const std::size_t dim = 8;
        const std::uint32_t k = 5;
        const auto data = quiver::test::clustered_vectors(n, dim, k, 42);

        auto centroids = quiver::index::kmeans_plusplus_init(data.data(), n, dim, k, 42, DistanceType::L2);

        REQUIRE(centroids.size() == k);
        for (std::size_t i = 0; i < k; ++i) {
            REQUIRE(centroids[i].size() == dim);
            for (std::size_t j = i + 1; j < k; ++j) {
                REQUIRE(quiver::kernels::l2_sq(centroids[i], centroids[j]) > 0.0f);
            }
        }
    }

    SECTION("Assignment covers every point") {
        const std::size_t n = 100;
        const std::size_t dim = 8;
        const std::uint32_t k = 5;
        const auto data = quiver::test::clustered_vectors(n, dim, k, 42);
        auto centroids = quiver::index::kmeans_plusplus_init(data.data(), n, dim, k, 42, DistanceType::L2);

        std::vector<std::uint32_t> assignments(n, k);
        const float inertia = quiver::index::kmeans_assign(data.data(), n, centroids, DistanceType::L2, assignments);

        REQUIRE(inertia > 0.0f);
        REQUIRE(inertia < std::numeric_limits<float>::max());
        for (std::uint32_t a : assignments) REQUIRE(a < k);
    }

    SECTION("Converges on well-separated clusters") {
        const std::size_t n_clusters = 4;
        const std::size_t n = 200;
        const std::size_t dim = 8;
        const auto data = quiver::test::clustered_vectors(n, dim, n_clusters, 7);

        quiver::index::KmeansParams params;
        params.k = n_clusters;
        params.max_iter = 100;
        auto result = quiver::index::kmeans_cluster(data.data(), n, dim, params);

        REQUIRE(result.has_value());
        REQUIRE(result->centroids.size() == n_clusters);
        REQUIRE(result->assignments.size() == n);
        REQUIRE(result->cluster_sizes.size() == n_clusters);
        REQUIRE(result->iterations > 0);
        REQUIRE(result->iterations <= params.max_iter);

        std::size_t total = 0;
        for (auto s : result->cluster_sizes) total += s;
        REQUIRE(total == n);

        REQUIRE(compute_purity(result->assignments, n_clusters, n_clusters) > 0.9f);
    }

    SECTION("Edge cases") {
        const std::size_t dim = 4;

        SECTION("Single cluster of identical points") {
            std::vector<float> data(10 * dim, 1.0f);
            quiver::index::KmeansParams params;
            params.k = 1;
            auto result = quiver::index::kmeans_cluster(data.data(), 10, dim, params);
            REQUIRE(result.has_value());
            REQUIRE(result->centroids.size() == 1);
            REQUIRE_THAT(result->inertia, WithinAbs(0.0f, 1e-6f));
        }

        SECTION("K equals N") {
            const auto data = quiver::test::clustered_vectors(5, dim, 5, 42);
            quiver::index::KmeansParams params;
            params.k = 5;
            auto result = quiver::index::kmeans_cluster(data.data(), 5, dim, params);
            REQUIRE(result.has_value());
            REQUIRE_THAT(result->inertia, WithinAbs(0.0f, 1e-4f));
        }

        SECTION("Invalid parameters") {
            std::vector<float> data(10 * dim);
            quiver::index::KmeansParams too_many;
            too_many.k = 11;
            auto r1 = quiver::index::kmeans_cluster(data.data(), 10, dim, too_many);
            REQUIRE_FALSE(r1.has_value());
            REQUIRE(r1.error().code == quiver::core::error_code::insufficient_data);

            quiver::index::KmeansParams zero;
            zero.k = 0;
            auto r2 = quiver::index::kmeans_cluster(data.data(), 10, dim, zero);
            REQUIRE_FALSE(r2.has_value());
            REQUIRE(r2.error().code == quiver::core::error_code::invalid_parameter);
        }
    }

    SECTION("Deterministic with fixed seed and thread count") {
        const std::size_t n = 300;
        const std::size_t dim = 8;
        const auto data = quiver::test::random_vectors(n, dim, 3);
        quiver::index::KmeansParams params;
        params.k = 6;
        params.num_threads = 2;

        auto a = quiver::index::kmeans_cluster(data.data(), n, dim, params);
        auto b = quiver::index::kmeans_cluster(data.data(), n, dim, params);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->assignments == b->assignments);
        REQUIRE(a->centroids == b->centroids);
    }

    SECTION("Cancelled token stops training") {
        const auto data = quiver::test::random_vectors(100, 4, 5);
        quiver::core::CancellationToken token;
        token.cancel();
        quiver::index::KmeansParams params;
        params.k = 4;
        auto result = quiver::index::kmeans_cluster(data.data(), 100, 4, params, &token);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == quiver::core::error_code::cancelled);
    }
}
