#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

#include "quiver/index/ivf_pq.hpp"
#include "../support/test_data.hpp"

using namespace quiver::index;
using quiver::core::error_code;
using quiver::kernels::DistanceType;

namespace {

constexpr std::size_t kDim = 16;

auto small_params() -> IvfPqBuildParams {
    IvfPqBuildParams p;
    p.num_partitions = 8;
    p.num_sub_vectors = 4;
    p.num_bits = 6;
    p.max_iterations = 20;
    p.sample_rate = 64;
    return p;
}

auto fetcher_over(const std::vector<float>& data, std::size_t dim) -> VectorFetcher {
    return [&data, dim](std::span<const std::uint64_t> ids)
               -> std::expected<std::vector<float>, quiver::core::error> {
        std::vector<float> out;
        out.reserve(ids.size() * dim);
        for (auto id : ids) {
            out.insert(out.end(), data.begin() + static_cast<std::ptrdiff_t>(id * dim),
                       data.begin() + static_cast<std::ptrdiff_t>((id + 1) * dim));
        }
        return out;
    };
}

auto is_ordered(const std::vector<SearchHit>& hits) -> bool {
    return std::is_sorted(hits.begin(), hits.end(), hit_less);
}

} // anonymous namespace

TEST_CASE("IVF-PQ build covers every row exactly once", "[ivfpq]") {
    const std::size_t n = 2000;
    const auto data = quiver::test::clustered_vectors(n, kDim, 8, 21);
    const auto ids = quiver::test::sequential_ids(n, 1000);

    auto built = IvfPqIndex::build("embedding", ids, data, kDim, small_params());
    REQUIRE(built.has_value());
    const auto& index = *built->index;

    REQUIRE(index.size() == n);
    REQUIRE(index.num_partitions() == 8);
    REQUIRE(index.num_sub_vectors() == 4);
    REQUIRE(index.num_bits() == 6);
    REQUIRE(index.column() == "embedding");
    REQUIRE(built->stats.num_rows == n);
    REQUIRE(built->stats.partition_train_rows == 512);
    REQUIRE(built->stats.pq_train_rows == n);  // 64 * 64 > 2000
    REQUIRE_FALSE(built->warnings.empty());

    std::vector<std::uint64_t> seen;
    for (std::uint32_t p = 0; p < index.num_partitions(); ++p) {
        const auto part = index.partition_row_ids(p);
        REQUIRE(index.partition_codes(p).size() == part.size() * 4);
        seen.insert(seen.end(), part.begin(), part.end());
    }
    std::sort(seen.begin(), seen.end());
    REQUIRE(seen == ids);
    REQUIRE(index.indexed_rows().cardinality() == n);
}

TEST_CASE("IVF-PQ search", "[ivfpq]") {
    const std::size_t n = 2000;
    const auto data = quiver::test::clustered_vectors(n, kDim, 8, 22);
    const auto ids = quiver::test::sequential_ids(n);
    auto built = IvfPqIndex::build("embedding", ids, data, kDim, small_params());
    REQUIRE(built.has_value());
    const auto& index = *built->index;

    IvfPqSearchParams sp;
    sp.k = 10;
    sp.nprobes = 8;

    SECTION("results are ordered and bounded by k") {
        auto hits = index.search({data.data() + 17 * kDim, kDim}, sp);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 10);
        REQUIRE(is_ordered(*hits));
    }

    SECTION("refine re-ranks with exact distances") {
        const auto fetch = fetcher_over(data, kDim);
        sp.refine_factor = 4;
        auto hits = index.search({data.data() + 17 * kDim, kDim}, sp, nullptr, &fetch);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 10);
        REQUIRE(hits->front().row_id == 17);
        REQUIRE(hits->front().distance == Catch::Approx(0.0f).margin(1e-5));
        REQUIRE(is_ordered(*hits));
    }

    SECTION("refine without a fetcher is rejected") {
        sp.refine_factor = 2;
        auto hits = index.search({data.data(), kDim}, sp);
        REQUIRE_FALSE(hits.has_value());
        REQUIRE(hits.error().code == error_code::invalid_parameter);
    }

    SECTION("allowed set restricts results") {
        roaring::Roaring64Map allowed;
        for (std::uint64_t id = 0; id < n; id += 3) allowed.add(id);
        auto hits = index.search({data.data(), kDim}, sp, &allowed);
        REQUIRE(hits.has_value());
        REQUIRE_FALSE(hits->empty());
        for (const auto& h : *hits) REQUIRE(h.row_id % 3 == 0);
    }

    SECTION("invalid queries") {
        auto bad_dim = index.search(std::vector<float>(kDim - 1, 0.0f), sp);
        REQUIRE_FALSE(bad_dim.has_value());
        REQUIRE(bad_dim.error().code == error_code::dimension_mismatch);

        sp.k = 0;
        auto bad_k = index.search({data.data(), kDim}, sp);
        REQUIRE_FALSE(bad_k.has_value());
        REQUIRE(bad_k.error().code == error_code::invalid_parameter);

        sp.k = 10;
        sp.nprobes = 0;
        auto bad_probes = index.search({data.data(), kDim}, sp);
        REQUIRE_FALSE(bad_probes.has_value());
        REQUIRE(bad_probes.error().code == error_code::invalid_parameter);
    }
}

TEST_CASE("IVF-PQ builds are reproducible", "[ivfpq]") {
    const std::size_t n = 1500;
    const auto data = quiver::test::random_vectors(n, kDim, 23);
    const auto ids = quiver::test::sequential_ids(n);
    auto params = small_params();
    params.num_threads = 2;

    auto a = IvfPqIndex::build("v", ids, data, kDim, params);
    auto b = IvfPqIndex::build("v", ids, data, kDim, params);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());

    IvfPqSearchParams sp;
    sp.k = 5;
    for (std::size_t q = 0; q < 20; ++q) {
        auto ra = a->index->search({data.data() + q * kDim, kDim}, sp);
        auto rb = b->index->search({data.data() + q * kDim, kDim}, sp);
        REQUIRE(ra.has_value());
        REQUIRE(rb.has_value());
        REQUIRE(*ra == *rb);
    }
}

TEST_CASE("IVF-PQ boundary conditions", "[ivfpq]") {
    SECTION("empty column yields an empty index") {
        auto built = IvfPqIndex::build("v", {}, {}, kDim, small_params());
        REQUIRE(built.has_value());
        REQUIRE(built->index->size() == 0);
        REQUIRE(built->index->num_partitions() == 0);
        IvfPqSearchParams sp;
        auto hits = built->index->search(std::vector<float>(kDim, 1.0f), sp);
        REQUIRE(hits.has_value());
        REQUIRE(hits->empty());
    }

    SECTION("more partitions than rows") {
        const auto data = quiver::test::random_vectors(100, kDim, 1);
        auto params = small_params();
        params.num_partitions = 101;
        params.num_bits = 4;
        auto built = IvfPqIndex::build("v", quiver::test::sequential_ids(100), data, kDim, params);
        REQUIRE_FALSE(built.has_value());
        REQUIRE(built.error().code == error_code::insufficient_data);
    }

    SECTION("parameter validation") {
        const auto data = quiver::test::random_vectors(300, kDim, 2);
        const auto ids = quiver::test::sequential_ids(300);
        auto params = small_params();
        params.num_bits = 0;
        REQUIRE(IvfPqIndex::build("v", ids, data, kDim, params).error().code == error_code::invalid_parameter);
        params = small_params();
        params.num_sub_vectors = 5;
        REQUIRE(IvfPqIndex::build("v", ids, data, kDim, params).error().code == error_code::invalid_parameter);
        params = small_params();
        params.num_partitions = 0;
        REQUIRE(IvfPqIndex::build("v", ids, data, kDim, params).error().code == error_code::invalid_parameter);
    }

    SECTION("data length must equal rows x dim") {
        const auto data = quiver::test::random_vectors(300, kDim, 5);
        const auto ids = quiver::test::sequential_ids(301);
        auto built = IvfPqIndex::build("v", ids, data, kDim, small_params());
        REQUIRE_FALSE(built.has_value());
        REQUIRE(built.error().code == error_code::dimension_mismatch);

        std::span<const float> ragged(data.data(), data.size() - 3);
        built = IvfPqIndex::build("v", quiver::test::sequential_ids(300), ragged, kDim, small_params());
        REQUIRE(built.error().code == error_code::dimension_mismatch);
    }

    SECTION("indivisible dimension falls back to one sub-vector with a warning") {
        const std::size_t dim = 10;
        const auto data = quiver::test::random_vectors(300, dim, 3);
        IvfPqBuildParams params;
        params.num_partitions = 4;
        params.num_bits = 4;
        params.max_iterations = 10;
        auto built = IvfPqIndex::build("v", quiver::test::sequential_ids(300), data, dim, params);
        REQUIRE(built.has_value());
        REQUIRE(built->index->num_sub_vectors() == 1);
        const bool mentioned = std::any_of(built->warnings.begin(), built->warnings.end(),
            [](const std::string& w) { return w.find("num_sub_vectors=1") != std::string::npos; });
        REQUIRE(mentioned);
    }

    SECTION("cancelled build") {
        const auto data = quiver::test::random_vectors(500, kDim, 4);
        quiver::core::CancellationToken token;
        token.cancel();
        auto built = IvfPqIndex::build("v", quiver::test::sequential_ids(500), data, kDim,
                                       small_params(), &token);
        REQUIRE_FALSE(built.has_value());
        REQUIRE(built.error().code == error_code::cancelled);
    }
}

TEST_CASE("IVF-PQ metrics", "[ivfpq]") {
    const std::size_t n = 1200;
    const auto data = quiver::test::clustered_vectors(n, kDim, 6, 31);
    const auto ids = quiver::test::sequential_ids(n);
    const auto fetch = fetcher_over(data, kDim);

    for (auto metric : {DistanceType::Cosine, DistanceType::Dot}) {
        auto params = small_params();
        params.metric = metric;
        auto built = IvfPqIndex::build("v", ids, data, kDim, params);
        REQUIRE(built.has_value());
        REQUIRE(built->index->metric() == metric);

        IvfPqSearchParams sp;
        sp.k = 5;
        sp.nprobes = 8;
        auto approx = built->index->search({data.data(), kDim}, sp);
        REQUIRE(approx.has_value());
        REQUIRE(approx->size() == 5);
        REQUIRE(is_ordered(*approx));

        sp.refine_factor = 10;
        auto exact = built->index->search({data.data(), kDim}, sp, nullptr, &fetch);
        REQUIRE(exact.has_value());
        for (const auto& h : *exact) {
            const float d = quiver::kernels::distance(metric, {data.data(), kDim},
                                                      {data.data() + h.row_id * kDim, kDim});
            REQUIRE(h.distance == Catch::Approx(d).margin(1e-4));
        }
    }
}

TEST_CASE("IVF-PQ persistence", "[ivfpq][persistence]") {
    quiver::test::TempDir dir("quiver_ivfpq");
    const std::size_t n = 1000;
    const auto data = quiver::test::random_vectors(n, kDim, 41);
    auto built = IvfPqIndex::build("embedding", quiver::test::sequential_ids(n), data, kDim, small_params());
    REQUIRE(built.has_value());
    const auto path = dir.path() / "index.qidx";
    REQUIRE(built->index->save(path).has_value());

    SECTION("load preserves search results") {
        auto loaded = IvfPqIndex::load(path);
        REQUIRE(loaded.has_value());
        REQUIRE((*loaded)->size() == n);
        REQUIRE((*loaded)->column() == "embedding");
        REQUIRE((*loaded)->build_params().num_partitions == built->index->build_params().num_partitions);

        IvfPqSearchParams sp;
        sp.k = 7;
        sp.nprobes = 3;
        for (std::size_t q = 0; q < 10; ++q) {
            auto a = built->index->search({data.data() + q * kDim, kDim}, sp);
            auto b = (*loaded)->search({data.data() + q * kDim, kDim}, sp);
            REQUIRE(a.has_value());
            REQUIRE(b.has_value());
            REQUIRE(*a == *b);
        }
    }

    SECTION("a corrupted byte is detected") {
        {
            std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
            f.seekp(static_cast<std::streamoff>(std::filesystem::file_size(path) / 2));
            char c = 0;
            f.read(&c, 1);
            f.seekp(-1, std::ios::cur);
            c = static_cast<char>(c ^ 0x5A);
            f.write(&c, 1);
        }
        auto loaded = IvfPqIndex::load(path);
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().code == error_code::data_integrity);
    }

    SECTION("missing file") {
        auto loaded = IvfPqIndex::load(dir.path() / "absent.qidx");
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().code == error_code::io_failed);
    }
}
