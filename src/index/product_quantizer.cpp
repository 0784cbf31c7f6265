/** \file product_quantizer.cpp
 *  \brief Implementation of Product Quantization for vector compression.
 */

#include "quiver/index/product_quantizer.hpp"
#include "quiver/index/kmeans.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <limits>

namespace quiver::index {

class ProductQuantizer::Impl {
public:
    auto train(const float* data, std::size_t n, std::size_t dim,
               const PqTrainParams& params, const core::CancellationToken* cancel)
        -> std::expected<void, core::error> {
        using core::error_code;

        if (auto v = validate_shape(dim, params.m, params.nbits); !v) {
            return v;
        }

        const std::uint32_t ksub = 1U << params.nbits;
        if (n < ksub) {
            return core::make_error(error_code::insufficient_data,
                "Need at least 2^nbits training vectors (n=" + std::to_string(n) +
                ", ksub=" + std::to_string(ksub) + ")", "product_quantizer");
        }

        m_ = params.m;
        nbits_ = params.nbits;
        ksub_ = ksub;
        dsub_ = static_cast<std::uint32_t>(dim / params.m);
        dim_ = dim;
        metric_ = params.metric;
        trained_ = false;

        std::vector<float> codebooks(static_cast<std::size_t>(m_) * ksub_ * dsub_);
        std::vector<float> subvectors(n * dsub_);

        for (std::uint32_t sq = 0; sq < m_; ++sq) {
            for (std::size_t i = 0; i < n; ++i) {
                std::memcpy(subvectors.data() + i * dsub_,
                            data + i * dim_ + static_cast<std::size_t>(sq) * dsub_,
                            dsub_ * sizeof(float));
            }

            KmeansParams kmeans_params;
            kmeans_params.k = ksub_;
            kmeans_params.max_iter = params.max_iter;
            kmeans_params.epsilon = params.epsilon;
            kmeans_params.seed = params.seed + sq;
            kmeans_params.metric = kernels::DistanceType::L2;
            kmeans_params.num_threads = params.num_threads;
            kmeans_params.verbose = params.verbose && (sq == 0);

            auto result = kmeans_cluster(subvectors.data(), n, dsub_, kmeans_params, cancel);
            if (!result) {
                return std::unexpected(result.error());
            }

            for (std::uint32_t k = 0; k < ksub_; ++k) {
                std::memcpy(codebooks.data() + (static_cast<std::size_t>(sq) * ksub_ + k) * dsub_,
                            result->centroids[k].data(), dsub_ * sizeof(float));
            }

            if (params.verbose) {
                std::cerr << "[PQ][train] subspace " << (sq + 1) << "/" << m_
                          << " iterations=" << result->iterations << std::endl;
            }
        }

        codebooks_ = std::move(codebooks);
        trained_ = true;
        return {};
    }

    static auto validate_shape(std::size_t dim, std::uint32_t m, std::uint32_t nbits)
        -> std::expected<void, core::error> {
        using core::error_code;
        if (m == 0 || dim == 0) {
            return core::make_error(error_code::invalid_parameter,
                "num_sub_vectors and dimension must be > 0", "product_quantizer");
        }
        if (dim % m != 0) {
            return core::make_error(error_code::invalid_parameter,
                "Dimension " + std::to_string(dim) + " is not divisible by num_sub_vectors " +
                std::to_string(m), "product_quantizer");
        }
        if (nbits < 1 || nbits > 8) {
            return core::make_error(error_code::invalid_parameter,
                "num_bits must be in [1, 8], got " + std::to_string(nbits), "product_quantizer");
        }
        return {};
    }

    void encode_one_impl(const float* vec, std::uint8_t* code) const noexcept {
        for (std::uint32_t sq = 0; sq < m_; ++sq) {
            const float* sub = vec + static_cast<std::size_t>(sq) * dsub_;
            const float* book = codebooks_.data() + static_cast<std::size_t>(sq) * ksub_ * dsub_;
            std::uint32_t best = 0;
            float best_dist = std::numeric_limits<float>::max();
            for (std::uint32_t k = 0; k < ksub_; ++k) {
                const float d = kernels::l2_sq({sub, dsub_},
                                               {book + static_cast<std::size_t>(k) * dsub_, dsub_});
                if (d < best_dist) {
                    best_dist = d;
                    best = k;
                }
            }
            code[sq] = static_cast<std::uint8_t>(best);
        }
    }

    void decode_impl(const std::uint8_t* code, float* out) const noexcept {
        for (std::uint32_t sq = 0; sq < m_; ++sq) {
            const float* entry = codebooks_.data() +
                (static_cast<std::size_t>(sq) * ksub_ + code[sq]) * dsub_;
            std::memcpy(out + static_cast<std::size_t>(sq) * dsub_, entry, dsub_ * sizeof(float));
        }
    }

    void table_impl(const float* query, float* table) const noexcept {
        for (std::uint32_t sq = 0; sq < m_; ++sq) {
            const float* sub = query + static_cast<std::size_t>(sq) * dsub_;
            const float* book = codebooks_.data() + static_cast<std::size_t>(sq) * ksub_ * dsub_;
            float* row = table + static_cast<std::size_t>(sq) * ksub_;
            for (std::uint32_t k = 0; k < ksub_; ++k) {
                const float* entry = book + static_cast<std::size_t>(k) * dsub_;
                row[k] = metric_ == kernels::DistanceType::Dot
                    ? -kernels::inner_product({sub, dsub_}, {entry, dsub_})
                    : kernels::l2_sq({sub, dsub_}, {entry, dsub_});
            }
        }
    }

    std::uint32_t m_{0};
    std::uint32_t nbits_{0};
    std::uint32_t ksub_{0};
    std::uint32_t dsub_{0};
    std::size_t dim_{0};
    kernels::DistanceType metric_{kernels::DistanceType::L2};
    bool trained_{false};
    std::vector<float> codebooks_;   // [m x ksub x dsub]
};

ProductQuantizer::ProductQuantizer() : impl_(std::make_unique<Impl>()) {}
ProductQuantizer::~ProductQuantizer() = default;
ProductQuantizer::ProductQuantizer(ProductQuantizer&&) noexcept = default;
ProductQuantizer& ProductQuantizer::operator=(ProductQuantizer&&) noexcept = default;

auto ProductQuantizer::train(const float* data, std::size_t n, std::size_t dim,
                             const PqTrainParams& params,
                             const core::CancellationToken* cancel)
    -> std::expected<void, core::error> {
    return impl_->train(data, n, dim, params, cancel);
}

auto ProductQuantizer::encode(const float* data, std::size_t n, std::size_t dim,
                              std::uint8_t* codes) const
    -> std::expected<void, core::error> {
    using core::error_code;
    if (!impl_->trained_) {
        return core::make_error(error_code::invalid_parameter, "Quantizer not trained", "product_quantizer");
    }
    if (dim != impl_->dim_) {
        return core::make_error(error_code::dimension_mismatch,
            "Expected dimension " + std::to_string(impl_->dim_) + ", got " + std::to_string(dim),
            "product_quantizer");
    }

    const std::size_t m = impl_->m_;
    #pragma omp parallel for schedule(dynamic, 64)
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
        impl_->encode_one_impl(data + static_cast<std::size_t>(i) * dim,
                               codes + static_cast<std::size_t>(i) * m);
    }
    return {};
}

auto ProductQuantizer::encode_one(std::span<const float> vec) const
    -> std::expected<std::vector<std::uint8_t>, core::error> {
    std::vector<std::uint8_t> code(impl_->m_);
    if (auto r = encode(vec.data(), 1, vec.size(), code.data()); !r) {
        return std::unexpected(r.error());
    }
    return code;
}

void ProductQuantizer::encode_unchecked(const float* vec, std::uint8_t* code) const noexcept {
    impl_->encode_one_impl(vec, code);
}

auto ProductQuantizer::decode(std::span<const std::uint8_t> code) const
    -> std::expected<std::vector<float>, core::error> {
    using core::error_code;
    if (!impl_->trained_) {
        return core::make_error(error_code::invalid_parameter, "Quantizer not trained", "product_quantizer");
    }
    if (code.size() != impl_->m_) {
        return core::make_error(error_code::dimension_mismatch, "Code length does not match num_sub_vectors",
                                "product_quantizer");
    }
    for (std::uint8_t c : code) {
        if (c >= impl_->ksub_) {
            return core::make_error(error_code::invalid_parameter, "Code entry out of codebook range",
                                    "product_quantizer");
        }
    }
    std::vector<float> out(impl_->dim_);
    impl_->decode_impl(code.data(), out.data());
    return out;
}

auto ProductQuantizer::compute_distance_table(std::span<const float> query) const
    -> std::expected<std::vector<float>, core::error> {
    using core::error_code;
    if (!impl_->trained_) {
        return core::make_error(error_code::invalid_parameter, "Quantizer not trained", "product_quantizer");
    }
    if (query.size() != impl_->dim_) {
        return core::make_error(error_code::dimension_mismatch,
            "Expected dimension " + std::to_string(impl_->dim_) + ", got " + std::to_string(query.size()),
            "product_quantizer");
    }
    std::vector<float> table(static_cast<std::size_t>(impl_->m_) * impl_->ksub_);
    impl_->table_impl(query.data(), table.data());
    return table;
}

void ProductQuantizer::compute_distance_table_unchecked(const float* query, float* table) const noexcept {
    impl_->table_impl(query, table);
}

auto ProductQuantizer::adc_distance(const float* table, const std::uint8_t* code) const noexcept -> float {
    const std::uint32_t m = impl_->m_;
    const std::uint32_t ksub = impl_->ksub_;
    float sum = 0.0f;
    for (std::uint32_t sq = 0; sq < m; ++sq) {
        sum += table[static_cast<std::size_t>(sq) * ksub + code[sq]];
    }
    return sum;
}

auto ProductQuantizer::compute_quantization_error(const float* data, std::size_t n) const -> float {
    if (!impl_->trained_ || n == 0) return 0.0f;

    const std::size_t dim = impl_->dim_;
    double total = 0.0;

    #pragma omp parallel reduction(+:total)
    {
        std::vector<std::uint8_t> code(impl_->m_);
        std::vector<float> recon(dim);
        #pragma omp for schedule(static)
        for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
            const float* v = data + static_cast<std::size_t>(i) * dim;
            impl_->encode_one_impl(v, code.data());
            impl_->decode_impl(code.data(), recon.data());
            total += kernels::l2_sq({v, dim}, recon);
        }
    }
    return static_cast<float>(total / static_cast<double>(n));
}

auto ProductQuantizer::get_info() const noexcept -> Info {
    return Info{impl_->m_, impl_->nbits_, impl_->ksub_, impl_->dsub_, impl_->dim_, impl_->metric_};
}

auto ProductQuantizer::is_trained() const noexcept -> bool {
    return impl_->trained_;
}

auto ProductQuantizer::code_size() const noexcept -> std::size_t {
    return impl_->m_;
}

auto ProductQuantizer::codebooks() const noexcept -> std::span<const float> {
    return impl_->codebooks_;
}

auto ProductQuantizer::from_codebooks(std::size_t dim, std::uint32_t m, std::uint32_t nbits,
                                      kernels::DistanceType metric, std::vector<float> codebooks)
    -> std::expected<ProductQuantizer, core::error> {
    if (auto v = Impl::validate_shape(dim, m, nbits); !v) {
        return std::unexpected(v.error());
    }
    const std::uint32_t ksub = 1U << nbits;
    const std::size_t dsub = dim / m;
    if (codebooks.size() != static_cast<std::size_t>(m) * ksub * dsub) {
        return core::make_error(core::error_code::data_integrity,
            "Codebook table size does not match m x 2^nbits x dsub", "product_quantizer");
    }

    ProductQuantizer pq;
    pq.impl_->m_ = m;
    pq.impl_->nbits_ = nbits;
    pq.impl_->ksub_ = ksub;
    pq.impl_->dsub_ = static_cast<std::uint32_t>(dsub);
    pq.impl_->dim_ = dim;
    pq.impl_->metric_ = metric;
    pq.impl_->codebooks_ = std::move(codebooks);
    pq.impl_->trained_ = true;
    return pq;
}

auto suggested_num_sub_vectors(std::uint32_t dim, bool* degraded) noexcept -> std::uint32_t {
    if (degraded) *degraded = false;
    if (dim != 0 && dim % 16 == 0) return dim / 16;
    if (dim != 0 && dim % 8 == 0) return dim / 8;
    if (degraded) *degraded = true;
    return 1;
}

} // namespace quiver::index
