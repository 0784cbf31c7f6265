#pragma once

/** \file ivf_pq.hpp
 *  \brief Inverted File with Product Quantization index for scalable vector search.
 *
 * IVF-PQ provides space-efficient indexing with Asymmetric Distance Computation (ADC).
 * Features:
 * - Coarse quantization via k-means on a sample (IvfPartitioner)
 * - Global PQ codebooks trained on residuals (vector minus its partition centroid)
 * - Fast ADC using precomputed lookup tables, bounded max-heap top-k
 * - Optional row-id prefilter and exact re-ranking of k * refine_factor candidates
 * - Sectioned, checksummed persistence
 *
 * An index is immutable once built and shared through std::shared_ptr<const IvfPqIndex>.
 * Thread-safety: build is internally parallel; search is safe for concurrent calls.
 * Memory: O(nlist*d + m*ksub*dsub + N*(m + 8)) where N is number of vectors.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <roaring/roaring64map.hh>

#include "quiver/core/cancellation.hpp"
#include "quiver/error.hpp"
#include "quiver/index/ivf_partitioner.hpp"
#include "quiver/index/product_quantizer.hpp"
#include "quiver/index/search_types.hpp"
#include "quiver/io/section_file.hpp"
#include "quiver/kernels/distance.hpp"

namespace quiver::index {

/** \brief Build parameters for IVF-PQ index. */
struct IvfPqBuildParams {
    kernels::DistanceType metric{kernels::DistanceType::L2};
    std::optional<std::uint32_t> num_partitions;   /**< Default ceil(sqrt(rows)) */
    std::optional<std::uint32_t> num_sub_vectors;  /**< Default suggested_num_sub_vectors(dim) */
    std::uint32_t num_bits{8};           /**< Bits per subquantizer, in [1, 8] */
    std::uint32_t max_iterations{50};    /**< K-means iterations (partitions and codebooks) */
    std::uint32_t sample_rate{256};      /**< Training rows per centroid */
    float epsilon{1e-4f};                /**< Convergence threshold */
    std::uint32_t seed{42};              /**< Random seed for reproducibility */
    std::uint32_t num_threads{0};        /**< 0 = OpenMP default */
    bool verbose{false};                 /**< Training progress output */
};

/** \brief Search parameters for IVF-PQ index. */
struct IvfPqSearchParams {
    std::uint32_t k{10};                 /**< Number of neighbors to return */
    std::uint32_t nprobes{20};           /**< Partitions to scan; clamped to num_partitions */
    std::uint32_t refine_factor{1};      /**< > 1 re-ranks k * refine_factor candidates exactly */
};

/** \brief Statistics from a build. */
struct IvfPqBuildStats {
    std::size_t num_rows{0};
    std::uint32_t num_partitions{0};
    std::uint32_t num_sub_vectors{0};
    std::uint32_t num_bits{0};
    std::size_t partition_train_rows{0};
    std::size_t pq_train_rows{0};
    float quantization_error{0.0f};      /**< Mean squared residual reconstruction error */
    float train_time_sec{0.0f};
    float encode_time_sec{0.0f};
};

class IvfPqIndex;

struct IvfPqBuildResult {
    std::shared_ptr<const IvfPqIndex> index;
    std::vector<std::string> warnings;   /**< Degraded but valid conditions */
    IvfPqBuildStats stats;
};

/** \brief IVF-PQ index for approximate nearest neighbor search. */
class IvfPqIndex {
public:
    ~IvfPqIndex();
    IvfPqIndex(IvfPqIndex&&) noexcept;
    IvfPqIndex& operator=(IvfPqIndex&&) noexcept;
    IvfPqIndex(const IvfPqIndex&) = delete;
    IvfPqIndex& operator=(const IvfPqIndex&) = delete;

    /** \brief Train and populate an index over one vector column.
     *
     * \param column Source column name, recorded for fetches and persistence
     * \param row_ids Row identifiers [n]
     * \param data Vectors [n x dim], n = row_ids.size()
     * \param dim Vector dimensionality
     * \param params Build parameters
     * \param cancel Optional token, polled between k-means iterations and encode batches
     *
     * An empty column yields a valid empty index. Errors: dimension_mismatch
     * (data.size() != n * dim), invalid_parameter (num_bits outside [1, 8],
     * explicit num_sub_vectors not dividing dim, zero num_partitions),
     * insufficient_data (rows < num_partitions or
     * rows < 2^num_bits), cancelled.
     * Complexity: O(n * (nlist * dim + m * ksub * dsub) + training)
     */
    static auto build(std::string column, std::span<const std::uint64_t> row_ids,
                      std::span<const float> data, std::size_t dim,
                      const IvfPqBuildParams& params,
                      const core::CancellationToken* cancel = nullptr)
        -> std::expected<IvfPqBuildResult, core::error>;

    /** \brief Search for k nearest neighbors.
     *
     * \param query Query vector [dim]
     * \param params Search parameters
     * \param allowed Optional prefilter; rows outside the set are skipped during scanning
     * \param fetcher Required when refine_factor > 1
     * \return Hits ordered by distance, then row id
     *
     * Errors: dimension_mismatch, invalid_parameter (k, nprobes or refine_factor == 0,
     * refine without fetcher).
     * Complexity: O(nprobes * (dim + m * ksub + avg_list_size * m))
     * Thread-safety: Safe for concurrent calls
     */
    auto search(std::span<const float> query, const IvfPqSearchParams& params,
                const roaring::Roaring64Map* allowed = nullptr,
                const VectorFetcher* fetcher = nullptr) const
        -> std::expected<std::vector<SearchHit>, core::error>;

    auto column() const noexcept -> const std::string&;
    auto dimension() const noexcept -> std::size_t;
    auto metric() const noexcept -> kernels::DistanceType;
    auto size() const noexcept -> std::size_t;
    auto num_partitions() const noexcept -> std::uint32_t;
    auto num_sub_vectors() const noexcept -> std::uint32_t;
    auto num_bits() const noexcept -> std::uint32_t;

    /** \brief Resolved build parameters (optionals filled in). */
    auto build_params() const noexcept -> const IvfPqBuildParams&;

    auto partitioner() const noexcept -> const IvfPartitioner&;
    auto quantizer() const noexcept -> const ProductQuantizer&;

    auto partition_row_ids(std::uint32_t partition) const noexcept -> std::span<const std::uint64_t>;
    auto partition_codes(std::uint32_t partition) const noexcept -> std::span<const std::uint8_t>;

    /** \brief Every indexed row id. */
    auto indexed_rows() const noexcept -> const roaring::Roaring64Map&;

    auto memory_bytes() const noexcept -> std::size_t;

    /** \brief Append params, centroid, codebook, offset, row-id and code sections. */
    auto write_sections(io::SectionWriter& writer) const -> std::expected<void, core::error>;

    /** \brief Reconstruct from sections written by write_sections. Errors: data_integrity. */
    static auto read_sections(const io::SectionReader& reader)
        -> std::expected<std::shared_ptr<const IvfPqIndex>, core::error>;

    /** \brief Standalone artifact (kind Vector). */
    auto save(const std::filesystem::path& path, int zstd_level = 3) const
        -> std::expected<void, core::error>;

    static auto load(const std::filesystem::path& path)
        -> std::expected<std::shared_ptr<const IvfPqIndex>, core::error>;

private:
    IvfPqIndex();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::index
