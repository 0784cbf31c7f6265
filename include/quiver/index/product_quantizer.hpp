#pragma once

/** \file product_quantizer.hpp
 *  \brief Product Quantization for compact vector encoding.
 *
 * Decomposes D-dimensional vectors into m contiguous subspaces and quantizes
 * each independently against a codebook of 2^nbits centroids learned by
 * k-means. Enables fast approximate distance computation via lookup tables.
 *
 * Features:
 * - Configurable subspace partitioning (m subquantizers), 1..8 bits per code
 * - Asymmetric Distance Computation (ADC) with precomputed tables
 * - Codebook export/import for persistence
 *
 * Thread-safety: training is internally parallel but not reentrant;
 * encode/decode/table computation are const and safe for concurrent calls.
 * Memory: O(m * ksub * dsub) for codebooks, m bytes per encoded vector.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "quiver/core/cancellation.hpp"
#include "quiver/error.hpp"
#include "quiver/kernels/distance.hpp"

namespace quiver::index {

/** \brief Product Quantizer training parameters. */
struct PqTrainParams {
    std::uint32_t m{8};                  /**< Number of subquantizers */
    std::uint32_t nbits{8};              /**< Bits per subquantizer, in [1, 8] */
    std::uint32_t max_iter{50};          /**< K-means iterations per subspace */
    float epsilon{1e-4f};                /**< Convergence threshold */
    std::uint32_t seed{42};              /**< Random seed */
    kernels::DistanceType metric{kernels::DistanceType::L2};  /**< Selects the ADC table form */
    std::uint32_t num_threads{0};        /**< 0 = OpenMP default */
    bool verbose{false};                 /**< Training progress */
};

/** \brief Product Quantizer for vector compression.
 *
 * Divides d-dimensional vectors into m subspaces of dimension d/m,
 * learning a codebook for each subspace via k-means. Codebooks are trained
 * and codes assigned under squared L2 regardless of metric, since they
 * approximate reconstruction.
 */
class ProductQuantizer {
public:
    ProductQuantizer();
    ~ProductQuantizer();
    ProductQuantizer(ProductQuantizer&&) noexcept;
    ProductQuantizer& operator=(ProductQuantizer&&) noexcept;
    ProductQuantizer(const ProductQuantizer&) = delete;
    ProductQuantizer& operator=(const ProductQuantizer&) = delete;

    /** \brief Train product quantizer on data.
     *
     * \param data Training vectors [n x dim]
     * \param n Number of training vectors
     * \param dim Vector dimensionality
     * \param params Training parameters
     * \param cancel Optional cancellation token (polled per k-means iteration)
     *
     * Errors: invalid_parameter (m == 0, dim % m != 0, nbits outside [1, 8]);
     * insufficient_data (n < 2^nbits); cancelled.
     * Complexity: O(n * m * ksub * dsub * iterations)
     */
    auto train(const float* data, std::size_t n, std::size_t dim,
               const PqTrainParams& params,
               const core::CancellationToken* cancel = nullptr)
        -> std::expected<void, core::error>;

    /** \brief Encode n vectors of dimension dim into codes [n x m].
     *
     * Errors: not trained (invalid_parameter), dimension_mismatch.
     * Thread-safety: safe for concurrent calls; internally parallel.
     */
    auto encode(const float* data, std::size_t n, std::size_t dim, std::uint8_t* codes) const
        -> std::expected<void, core::error>;

    /** \brief Encode a single vector. */
    auto encode_one(std::span<const float> vec) const
        -> std::expected<std::vector<std::uint8_t>, core::error>;

    /** \brief Unchecked single-vector encode; caller guarantees dim and training. */
    void encode_unchecked(const float* vec, std::uint8_t* code) const noexcept;

    /** \brief Reconstruct the approximate vector for a code. */
    auto decode(std::span<const std::uint8_t> code) const
        -> std::expected<std::vector<float>, core::error>;

    /** \brief Compute ADC table [m x ksub] for a query.
     *
     * Entries hold per-subspace partial distances: squared L2 for L2 and
     * cosine codebooks, negative inner product for dot codebooks. The ADC
     * distance of a code is the sum of its m table entries.
     */
    auto compute_distance_table(std::span<const float> query) const
        -> std::expected<std::vector<float>, core::error>;

    /** \brief Unchecked table computation into a caller-provided [m x ksub] buffer. */
    void compute_distance_table_unchecked(const float* query, float* table) const noexcept;

    /** \brief Sum of table lookups for one code. O(m). */
    auto adc_distance(const float* table, const std::uint8_t* code) const noexcept -> float;

    /** \brief Mean squared reconstruction error over n vectors. */
    auto compute_quantization_error(const float* data, std::size_t n) const -> float;

    struct Info {
        std::uint32_t m{0};              /**< Number of subquantizers */
        std::uint32_t nbits{0};          /**< Bits per code */
        std::uint32_t ksub{0};           /**< Codebook size per subquantizer */
        std::uint32_t dsub{0};           /**< Subspace dimension */
        std::size_t dim{0};              /**< Total dimension */
        kernels::DistanceType metric{kernels::DistanceType::L2};
    };

    auto get_info() const noexcept -> Info;
    auto is_trained() const noexcept -> bool;
    auto code_size() const noexcept -> std::size_t;

    /** \brief Flat codebooks [m x ksub x dsub]. */
    auto codebooks() const noexcept -> std::span<const float>;

    /** \brief Rebuild a trained quantizer from exported codebooks. */
    static auto from_codebooks(std::size_t dim, std::uint32_t m, std::uint32_t nbits,
                               kernels::DistanceType metric, std::vector<float> codebooks)
        -> std::expected<ProductQuantizer, core::error>;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief Default subvector count for a dimension.
 *
 * dim/16 when divisible by 16, else dim/8 when divisible by 8, else 1.
 * The last case is a poor-performance fallback; degraded is set so callers
 * can surface a warning.
 */
auto suggested_num_sub_vectors(std::uint32_t dim, bool* degraded = nullptr) noexcept -> std::uint32_t;

} // namespace quiver::index
