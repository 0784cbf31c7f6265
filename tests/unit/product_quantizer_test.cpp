#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <vector>

#include "quiver/index/product_quantizer.hpp"
#include "../support/test_data.hpp"

using namespace quiver::index;
using quiver::core::error_code;
using quiver::kernels::DistanceType;

TEST_CASE("PQ training validates parameters", "[pq]") {
    const auto data = quiver::test::random_vectors(512, 16, 1);
    ProductQuantizer pq;

    PqTrainParams p;
    p.m = 3;  // 16 % 3 != 0
    auto r = pq.train(data.data(), 512, 16, p);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::invalid_parameter);

    p.m = 4;
    p.nbits = 9;
    r = pq.train(data.data(), 512, 16, p);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::invalid_parameter);

    p.nbits = 8;
    r = pq.train(data.data(), 100, 16, p);  // 100 < 256 codewords
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::insufficient_data);
    REQUIRE_FALSE(pq.is_trained());
}

TEST_CASE("PQ encode and decode", "[pq]") {
    const std::size_t n = 1000, dim = 16;
    const auto data = quiver::test::clustered_vectors(n, dim, 10, 2);

    ProductQuantizer pq;
    PqTrainParams p;
    p.m = 4;
    p.nbits = 6;
    REQUIRE(pq.train(data.data(), n, dim, p).has_value());
    REQUIRE(pq.is_trained());

    const auto info = pq.get_info();
    REQUIRE(info.m == 4);
    REQUIRE(info.ksub == 64);
    REQUIRE(info.dsub == 4);
    REQUIRE(pq.code_size() == 4);
    REQUIRE(pq.codebooks().size() == 4u * 64u * 4u);

    std::vector<std::uint8_t> codes(n * pq.code_size());
    REQUIRE(pq.encode(data.data(), n, dim, codes.data()).has_value());
    for (auto c : codes) REQUIRE(c < 64);

    SECTION("decode approximates the input") {
        auto decoded = pq.decode({codes.data(), pq.code_size()});
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->size() == dim);
        const float err = quiver::kernels::l2_sq({data.data(), dim}, *decoded);
        float norm = 0.0f;
        for (std::size_t d = 0; d < dim; ++d) norm += data[d] * data[d];
        REQUIRE(err < norm);
    }

    SECTION("encode_one matches batch encode") {
        auto one = pq.encode_one({data.data() + 5 * dim, dim});
        REQUIRE(one.has_value());
        REQUIRE(std::equal(one->begin(), one->end(), codes.begin() + 5 * 4));
    }

    SECTION("ADC distance equals distance to the reconstruction") {
        const auto query = quiver::test::random_vectors(1, dim, 9);
        auto table = pq.compute_distance_table(query);
        REQUIRE(table.has_value());
        REQUIRE(table->size() == 4u * 64u);
        auto decoded = pq.decode({codes.data(), 4});
        REQUIRE(decoded.has_value());
        const float adc = pq.adc_distance(table->data(), codes.data());
        REQUIRE(adc == Catch::Approx(quiver::kernels::l2_sq(query, *decoded)).epsilon(1e-4));
    }

    SECTION("dimension mismatch") {
        auto r = pq.encode(data.data(), 1, dim - 1, codes.data());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == error_code::dimension_mismatch);
        auto t = pq.compute_distance_table(std::vector<float>(8, 0.0f));
        REQUIRE_FALSE(t.has_value());
        REQUIRE(t.error().code == error_code::dimension_mismatch);
    }
}

TEST_CASE("PQ reconstruction error does not grow with more bits", "[pq]") {
    const std::size_t n = 2000, dim = 16;
    const auto data = quiver::test::random_vectors(n, dim, 4);

    float previous = 0.0f;
    bool first = true;
    for (std::uint32_t nbits : {2u, 4u, 8u}) {
        ProductQuantizer pq;
        PqTrainParams p;
        p.m = 4;
        p.nbits = nbits;
        p.max_iter = 25;
        REQUIRE(pq.train(data.data(), n, dim, p).has_value());
        const float err = pq.compute_quantization_error(data.data(), n);
        INFO("nbits=" << nbits << " err=" << err);
        if (!first) REQUIRE(err <= previous);
        previous = err;
        first = false;
    }
}

TEST_CASE("PQ dot metric tables hold negative inner products", "[pq]") {
    const std::size_t n = 300, dim = 8;
    const auto data = quiver::test::random_vectors(n, dim, 6);
    ProductQuantizer pq;
    PqTrainParams p;
    p.m = 2;
    p.nbits = 4;
    p.metric = DistanceType::Dot;
    REQUIRE(pq.train(data.data(), n, dim, p).has_value());

    std::vector<std::uint8_t> code(2);
    pq.encode_unchecked(data.data(), code.data());
    auto decoded = pq.decode(code);
    REQUIRE(decoded.has_value());
    auto table = pq.compute_distance_table({data.data() + dim, dim});
    REQUIRE(table.has_value());
    const float adc = pq.adc_distance(table->data(), code.data());
    REQUIRE(adc == Catch::Approx(-quiver::kernels::inner_product({data.data() + dim, dim}, *decoded)).margin(1e-4));
}

TEST_CASE("PQ rebuilt from codebooks encodes identically", "[pq]") {
    const std::size_t n = 400, dim = 8;
    const auto data = quiver::test::random_vectors(n, dim, 8);
    ProductQuantizer pq;
    PqTrainParams p;
    p.m = 2;
    p.nbits = 5;
    REQUIRE(pq.train(data.data(), n, dim, p).has_value());

    std::vector<float> books(pq.codebooks().begin(), pq.codebooks().end());
    auto copy = ProductQuantizer::from_codebooks(dim, 2, 5, DistanceType::L2, books);
    REQUIRE(copy.has_value());
    REQUIRE(copy->encode_one({data.data(), dim}).value() == pq.encode_one({data.data(), dim}).value());

    books.pop_back();
    auto bad = ProductQuantizer::from_codebooks(dim, 2, 5, DistanceType::L2, books);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == error_code::data_integrity);
}

TEST_CASE("suggested sub-vector counts", "[pq]") {
    bool degraded = true;
    REQUIRE(suggested_num_sub_vectors(1536, &degraded) == 96);
    REQUIRE_FALSE(degraded);
    REQUIRE(suggested_num_sub_vectors(24, &degraded) == 3);
    REQUIRE_FALSE(degraded);
    REQUIRE(suggested_num_sub_vectors(30, &degraded) == 1);
    REQUIRE(degraded);
}
