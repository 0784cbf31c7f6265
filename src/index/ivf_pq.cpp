/** \file ivf_pq.cpp
 *  \brief IVF-PQ build, ADC search and sectioned persistence.
 */

#include "quiver/index/ivf_pq.hpp"
#include "quiver/core/platform_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>

#include <omp.h>

namespace quiver::index {

namespace {

// Rows encoded between cancellation checks.
constexpr std::size_t kEncodeBatch = 4096;

inline auto resolve_threads(std::uint32_t requested) -> int {
    return requested > 0 ? static_cast<int>(requested) : omp_get_max_threads();
}

auto integrity_error(std::string message) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::data_integrity, std::move(message), "ivf_pq.load");
}

/** \brief Whole-section array of exactly count elements. */
template <typename T>
auto read_array(const io::SectionReader& reader, std::uint32_t id, std::size_t count)
    -> std::expected<std::vector<T>, core::error> {
    auto bytes = reader.section(id);
    if (!bytes) return std::unexpected(bytes.error());
    if (bytes->size() != count * sizeof(T)) {
        return integrity_error("Section " + std::to_string(id) + " has unexpected size");
    }
    io::ByteReader r(*bytes);
    return r.get_array<T>(count);
}

} // anonymous namespace

class IvfPqIndex::Impl {
public:
    std::string column_;
    IvfPqBuildParams params_;            // resolved
    std::size_t dim_{0};
    std::uint32_t m_{0};
    IvfPartitioner partitioner_;
    ProductQuantizer pq_;
    std::vector<std::uint64_t> offsets_{0};  // [nlist + 1] into row_ids_/codes_
    std::vector<std::uint64_t> row_ids_;     // grouped by partition
    std::vector<std::uint8_t> codes_;        // [N x m], same order as row_ids_
    roaring::Roaring64Map indexed_;
};

IvfPqIndex::IvfPqIndex() : impl_(std::make_unique<Impl>()) {}
IvfPqIndex::~IvfPqIndex() = default;
IvfPqIndex::IvfPqIndex(IvfPqIndex&&) noexcept = default;
IvfPqIndex& IvfPqIndex::operator=(IvfPqIndex&&) noexcept = default;

auto IvfPqIndex::build(std::string column, std::span<const std::uint64_t> row_ids,
                       std::span<const float> data, std::size_t dim,
                       const IvfPqBuildParams& params,
                       const core::CancellationToken* cancel)
    -> std::expected<IvfPqBuildResult, core::error> {
    using core::error_code;
    using clock = std::chrono::steady_clock;

    const bool verbose = params.verbose || core::verbose_from_env();
    const std::size_t n = row_ids.size();

    IvfPqBuildResult result;
    auto warn = [&result](std::string msg) {
        std::cerr << "[IVFPQ][warn] " << msg << std::endl;
        result.warnings.push_back(std::move(msg));
    };

    if (params.num_bits < 1 || params.num_bits > 8) {
        return core::make_error(error_code::invalid_parameter,
            "num_bits must be in [1, 8], got " + std::to_string(params.num_bits), "ivf_pq.build");
    }
    if (dim == 0) {
        return core::make_error(error_code::invalid_parameter, "dimension must be > 0", "ivf_pq.build");
    }
    if (data.size() != n * dim) {
        return core::make_error(error_code::dimension_mismatch,
            "Expected " + std::to_string(n) + " x " + std::to_string(dim) + " = " + std::to_string(n * dim) +
            " floats, got " + std::to_string(data.size()), "ivf_pq.build");
    }
    if (params.num_partitions && *params.num_partitions == 0) {
        return core::make_error(error_code::invalid_parameter, "num_partitions must be > 0", "ivf_pq.build");
    }
    if (params.sample_rate == 0 || params.max_iterations == 0) {
        return core::make_error(error_code::invalid_parameter,
            "sample_rate and max_iterations must be > 0", "ivf_pq.build");
    }

    std::uint32_t m = 0;
    if (params.num_sub_vectors) {
        m = *params.num_sub_vectors;
        if (m == 0 || dim % m != 0) {
            return core::make_error(error_code::invalid_parameter,
                "Dimension " + std::to_string(dim) + " is not divisible by num_sub_vectors " +
                std::to_string(m), "ivf_pq.build");
        }
    } else {
        bool degraded = false;
        m = suggested_num_sub_vectors(static_cast<std::uint32_t>(dim), &degraded);
        if (degraded) {
            warn("dimension " + std::to_string(dim) +
                 " is not divisible by 8 or 16; using num_sub_vectors=1 (poor recall expected)");
        }
    }

    std::shared_ptr<IvfPqIndex> index(new IvfPqIndex());
    auto& impl = *index->impl_;
    impl.column_ = std::move(column);
    impl.dim_ = dim;
    impl.m_ = m;
    impl.params_ = params;
    impl.params_.num_sub_vectors = m;

    result.stats.num_rows = n;
    result.stats.num_sub_vectors = m;
    result.stats.num_bits = params.num_bits;

    if (n == 0) {
        auto empty = IvfPartitioner::from_centroids({}, dim, params.metric);
        if (!empty) return std::unexpected(empty.error());
        impl.partitioner_ = std::move(*empty);
        impl.params_.num_partitions = 0;
        if (verbose) {
            std::cerr << "[IVFPQ][build] column=" << impl.column_ << " is empty; built empty index" << std::endl;
        }
        result.index = std::move(index);
        return result;
    }

    const std::uint32_t nlist = params.num_partitions.value_or(suggested_num_partitions(n));
    if (nlist > n) {
        return core::make_error(error_code::insufficient_data,
            "num_partitions " + std::to_string(nlist) + " exceeds row count " + std::to_string(n),
            "ivf_pq.build");
    }
    const std::uint32_t ksub = 1U << params.num_bits;
    if (n < ksub) {
        return core::make_error(error_code::insufficient_data,
            "Need at least 2^num_bits=" + std::to_string(ksub) + " rows, got " + std::to_string(n),
            "ivf_pq.build");
    }
    impl.params_.num_partitions = nlist;
    result.stats.num_partitions = nlist;

    // Cosine indexes store and compare unit vectors.
    std::vector<float> normalized;
    const float* vecs = data.data();
    if (params.metric == kernels::DistanceType::Cosine) {
        normalized.assign(data.begin(), data.end());
        for (std::size_t i = 0; i < n; ++i) {
            kernels::normalize_inplace({normalized.data() + i * dim, dim});
        }
        vecs = normalized.data();
    }

    if (verbose) {
        std::cerr << "[IVFPQ][build] column=" << impl.column_ << " rows=" << n << " dim=" << dim
                  << " nlist=" << nlist << " m=" << m << " nbits=" << params.num_bits
                  << " metric=" << kernels::to_string(params.metric) << std::endl;
    }

    const auto t_train = clock::now();

    // 1) Coarse partitions
    IvfTrainParams tp;
    tp.num_partitions = nlist;
    tp.metric = params.metric;
    tp.max_iterations = params.max_iterations;
    tp.sample_rate = params.sample_rate;
    tp.epsilon = params.epsilon;
    tp.seed = params.seed;
    tp.num_threads = params.num_threads;
    tp.verbose = verbose;

    bool sampled_all = false;
    auto partitioner = IvfPartitioner::train(vecs, n, dim, tp, cancel, &sampled_all);
    if (!partitioner) {
        return std::unexpected(partitioner.error());
    }
    impl.partitioner_ = std::move(*partitioner);
    result.stats.partition_train_rows = std::min<std::size_t>(n, static_cast<std::size_t>(params.sample_rate) * nlist);
    if (sampled_all) {
        warn("row count " + std::to_string(n) + " is below the partition training sample of " +
             std::to_string(static_cast<std::size_t>(params.sample_rate) * nlist) + "; training on all rows");
    }

    std::vector<std::uint32_t> assignment(n);
    impl.partitioner_.assign_batch(vecs, n, assignment, params.num_threads);
    if (core::is_cancelled(cancel)) {
        return std::unexpected(core::cancelled_error("ivf_pq.build"));
    }

    // 2) Global codebooks on residuals of a sample
    const std::size_t pq_want = static_cast<std::size_t>(params.sample_rate) * ksub;
    const auto pq_rows = sample_without_replacement(n, pq_want, params.seed + 1);
    if (pq_want >= n) {
        warn("row count " + std::to_string(n) + " is below the codebook training sample of " +
             std::to_string(pq_want) + "; training on all rows");
    }
    std::vector<float> residuals(pq_rows.size() * dim);
    for (std::size_t i = 0; i < pq_rows.size(); ++i) {
        const float* v = vecs + pq_rows[i] * dim;
        const auto c = impl.partitioner_.centroid(assignment[pq_rows[i]]);
        float* r = residuals.data() + i * dim;
        for (std::size_t d = 0; d < dim; ++d) r[d] = v[d] - c[d];
    }

    PqTrainParams pp;
    pp.m = m;
    pp.nbits = params.num_bits;
    pp.max_iter = params.max_iterations;
    pp.epsilon = params.epsilon;
    pp.seed = params.seed;
    pp.metric = params.metric;
    pp.num_threads = params.num_threads;
    pp.verbose = verbose;

    if (auto trained = impl.pq_.train(residuals.data(), pq_rows.size(), dim, pp, cancel); !trained) {
        return std::unexpected(trained.error());
    }
    result.stats.pq_train_rows = pq_rows.size();
    result.stats.quantization_error = impl.pq_.compute_quantization_error(residuals.data(), pq_rows.size());
    result.stats.train_time_sec = std::chrono::duration<float>(clock::now() - t_train).count();

    // 3) Encode every row in batches
    const auto t_encode = clock::now();
    const int threads = resolve_threads(params.num_threads);
    std::vector<std::uint8_t> codes(n * m);
    for (std::size_t begin = 0; begin < n; begin += kEncodeBatch) {
        if (core::is_cancelled(cancel)) {
            return std::unexpected(core::cancelled_error("ivf_pq.build"));
        }
        const auto lo = static_cast<std::int64_t>(begin);
        const auto hi = static_cast<std::int64_t>(std::min(n, begin + kEncodeBatch));

        #pragma omp parallel num_threads(threads)
        {
            std::vector<float> residual(dim);
            #pragma omp for schedule(static)
            for (std::int64_t i = lo; i < hi; ++i) {
                const auto row = static_cast<std::size_t>(i);
                const float* v = vecs + row * dim;
                const auto c = impl.partitioner_.centroid(assignment[row]);
                for (std::size_t d = 0; d < dim; ++d) residual[d] = v[d] - c[d];
                impl.pq_.encode_unchecked(residual.data(), codes.data() + row * m);
            }
        }
    }

    // 4) Group (row id, code) by partition, preserving input order within a partition
    impl.offsets_.assign(static_cast<std::size_t>(nlist) + 1, 0);
    for (auto a : assignment) impl.offsets_[a + 1]++;
    for (std::uint32_t p = 0; p < nlist; ++p) impl.offsets_[p + 1] += impl.offsets_[p];

    std::vector<std::uint64_t> cursor(impl.offsets_.begin(), impl.offsets_.end() - 1);
    impl.row_ids_.resize(n);
    impl.codes_.resize(n * m);
    for (std::size_t i = 0; i < n; ++i) {
        const std::uint64_t pos = cursor[assignment[i]]++;
        impl.row_ids_[pos] = row_ids[i];
        std::memcpy(impl.codes_.data() + pos * m, codes.data() + i * m, m);
    }
    impl.indexed_.addMany(n, row_ids.data());
    result.stats.encode_time_sec = std::chrono::duration<float>(clock::now() - t_encode).count();

    if (verbose) {
        std::size_t largest = 0;
        for (std::uint32_t p = 0; p < nlist; ++p) {
            largest = std::max<std::size_t>(largest, impl.offsets_[p + 1] - impl.offsets_[p]);
        }
        std::cerr << "[IVFPQ][build] done train=" << result.stats.train_time_sec << "s encode="
                  << result.stats.encode_time_sec << "s qerr=" << result.stats.quantization_error
                  << " largest_partition=" << largest << std::endl;
    }

    result.index = std::move(index);
    return result;
}

auto IvfPqIndex::search(std::span<const float> query, const IvfPqSearchParams& params,
                        const roaring::Roaring64Map* allowed,
                        const VectorFetcher* fetcher) const
    -> std::expected<std::vector<SearchHit>, core::error> {
    using core::error_code;

    if (params.k == 0 || params.nprobes == 0 || params.refine_factor == 0) {
        return core::make_error(error_code::invalid_parameter,
            "k, nprobes and refine_factor must be > 0", "ivf_pq.search");
    }
    if (query.size() != impl_->dim_) {
        return core::make_error(error_code::dimension_mismatch,
            "Expected dimension " + std::to_string(impl_->dim_) + ", got " + std::to_string(query.size()),
            "ivf_pq.search");
    }
    const bool refine = params.refine_factor > 1;
    if (refine && (fetcher == nullptr || !*fetcher)) {
        return core::make_error(error_code::invalid_parameter,
            "refine_factor > 1 requires a vector fetcher", "ivf_pq.search");
    }
    if (impl_->row_ids_.empty()) {
        return std::vector<SearchHit>{};
    }

    const auto metric = impl_->params_.metric;
    const std::size_t dim = impl_->dim_;
    std::vector<float> q(query.begin(), query.end());
    if (metric == kernels::DistanceType::Cosine) {
        kernels::normalize_inplace(q);
    }

    const auto probes = impl_->partitioner_.nearest(q, params.nprobes);
    const std::size_t want = static_cast<std::size_t>(params.k) * params.refine_factor;

    // Bounded max-heap; front is the worst kept hit.
    std::vector<SearchHit> heap;
    heap.reserve(want + 1);
    auto consider = [&heap, want](SearchHit hit) {
        if (heap.size() < want) {
            heap.push_back(hit);
            std::push_heap(heap.begin(), heap.end(), hit_less);
        } else if (hit_less(hit, heap.front())) {
            std::pop_heap(heap.begin(), heap.end(), hit_less);
            heap.back() = hit;
            std::push_heap(heap.begin(), heap.end(), hit_less);
        }
    };

    const auto info = impl_->pq_.get_info();
    const std::size_t m = info.m;
    std::vector<float> table(m * info.ksub);
    std::vector<float> residual(dim);
    const bool dot = metric == kernels::DistanceType::Dot;
    // Unit vectors: ||q - v||^2 = 2 * (1 - cos).
    const float scale = metric == kernels::DistanceType::Cosine ? 0.5f : 1.0f;

    if (dot) {
        impl_->pq_.compute_distance_table_unchecked(q.data(), table.data());
    }

    for (const auto& [pid, centroid_distance] : probes) {
        const auto ids = partition_row_ids(pid);
        if (ids.empty()) continue;
        const std::uint8_t* codes = partition_codes(pid).data();

        float base = 0.0f;
        if (dot) {
            // 1 - q.(c + r) = (1 - q.c) - q.r
            base = centroid_distance;
        } else {
            const auto c = impl_->partitioner_.centroid(pid);
            for (std::size_t d = 0; d < dim; ++d) residual[d] = q[d] - c[d];
            impl_->pq_.compute_distance_table_unchecked(residual.data(), table.data());
        }

        for (std::size_t j = 0; j < ids.size(); ++j) {
            if (allowed != nullptr && !allowed->contains(ids[j])) continue;
            const float adc = impl_->pq_.adc_distance(table.data(), codes + j * m);
            consider(SearchHit{ids[j], (base + adc) * scale});
        }
    }

    std::sort_heap(heap.begin(), heap.end(), hit_less);

    if (refine && !heap.empty()) {
        std::vector<std::uint64_t> ids;
        ids.reserve(heap.size());
        for (const auto& h : heap) ids.push_back(h.row_id);

        auto originals = (*fetcher)(ids);
        if (!originals) {
            return std::unexpected(originals.error());
        }
        if (originals->size() != ids.size() * dim) {
            return core::make_error(error_code::internal,
                "Fetcher returned " + std::to_string(originals->size()) + " floats for " +
                std::to_string(ids.size()) + " rows", "ivf_pq.search");
        }
        for (std::size_t i = 0; i < heap.size(); ++i) {
            heap[i].distance = kernels::distance(metric, query, {originals->data() + i * dim, dim});
        }
        std::sort(heap.begin(), heap.end(), hit_less);
    }

    if (heap.size() > params.k) heap.resize(params.k);
    return heap;
}

auto IvfPqIndex::column() const noexcept -> const std::string& { return impl_->column_; }
auto IvfPqIndex::dimension() const noexcept -> std::size_t { return impl_->dim_; }
auto IvfPqIndex::metric() const noexcept -> kernels::DistanceType { return impl_->params_.metric; }
auto IvfPqIndex::size() const noexcept -> std::size_t { return impl_->row_ids_.size(); }
auto IvfPqIndex::num_partitions() const noexcept -> std::uint32_t { return impl_->partitioner_.num_partitions(); }
auto IvfPqIndex::num_sub_vectors() const noexcept -> std::uint32_t { return impl_->m_; }
auto IvfPqIndex::num_bits() const noexcept -> std::uint32_t { return impl_->params_.num_bits; }
auto IvfPqIndex::build_params() const noexcept -> const IvfPqBuildParams& { return impl_->params_; }
auto IvfPqIndex::partitioner() const noexcept -> const IvfPartitioner& { return impl_->partitioner_; }
auto IvfPqIndex::quantizer() const noexcept -> const ProductQuantizer& { return impl_->pq_; }
auto IvfPqIndex::indexed_rows() const noexcept -> const roaring::Roaring64Map& { return impl_->indexed_; }

auto IvfPqIndex::partition_row_ids(std::uint32_t partition) const noexcept -> std::span<const std::uint64_t> {
    if (partition + 1 >= impl_->offsets_.size()) return {};
    const auto lo = impl_->offsets_[partition];
    const auto hi = impl_->offsets_[partition + 1];
    return {impl_->row_ids_.data() + lo, static_cast<std::size_t>(hi - lo)};
}

auto IvfPqIndex::partition_codes(std::uint32_t partition) const noexcept -> std::span<const std::uint8_t> {
    if (partition + 1 >= impl_->offsets_.size()) return {};
    const auto lo = impl_->offsets_[partition];
    const auto hi = impl_->offsets_[partition + 1];
    return {impl_->codes_.data() + lo * impl_->m_, static_cast<std::size_t>(hi - lo) * impl_->m_};
}

auto IvfPqIndex::memory_bytes() const noexcept -> std::size_t {
    return impl_->partitioner_.centroids().size_bytes() +
           impl_->pq_.codebooks().size_bytes() +
           impl_->offsets_.size() * sizeof(std::uint64_t) +
           impl_->row_ids_.size() * sizeof(std::uint64_t) +
           impl_->codes_.size();
}

auto IvfPqIndex::write_sections(io::SectionWriter& writer) const -> std::expected<void, core::error> {
    const auto& p = impl_->params_;

    io::ByteWriter params;
    params.put(static_cast<std::uint8_t>(p.metric));
    params.put(static_cast<std::uint32_t>(impl_->dim_));
    params.put(num_partitions());
    params.put(impl_->m_);
    params.put(p.num_bits);
    params.put(p.max_iterations);
    params.put(p.sample_rate);
    params.put(p.epsilon);
    params.put(p.seed);
    params.put(static_cast<std::uint64_t>(impl_->row_ids_.size()));
    params.put_string(impl_->column_);

    io::ByteWriter centroids;
    centroids.put_array<float>(impl_->partitioner_.centroids());
    io::ByteWriter codebooks;
    codebooks.put_array<float>(impl_->pq_.codebooks());
    io::ByteWriter offsets;
    offsets.put_array<std::uint64_t>(impl_->offsets_);
    io::ByteWriter rows;
    rows.put_array<std::uint64_t>(impl_->row_ids_);
    io::ByteWriter codes;
    codes.put_array<std::uint8_t>(impl_->codes_);

    if (auto r = writer.add(io::section_id::kIvfParams, std::move(params).take()); !r) return r;
    if (auto r = writer.add(io::section_id::kIvfCentroids, std::move(centroids).take()); !r) return r;
    if (auto r = writer.add(io::section_id::kPqCodebooks, std::move(codebooks).take()); !r) return r;
    if (auto r = writer.add(io::section_id::kIvfOffsets, std::move(offsets).take()); !r) return r;
    if (auto r = writer.add(io::section_id::kIvfRowIds, std::move(rows).take()); !r) return r;
    return writer.add(io::section_id::kIvfCodes, std::move(codes).take());
}

auto IvfPqIndex::read_sections(const io::SectionReader& reader)
    -> std::expected<std::shared_ptr<const IvfPqIndex>, core::error> {
    auto params_bytes = reader.section(io::section_id::kIvfParams);
    if (!params_bytes) return std::unexpected(params_bytes.error());

    io::ByteReader pr(*params_bytes);
    auto metric_u8 = pr.get<std::uint8_t>();
    auto dim = pr.get<std::uint32_t>();
    auto nlist = pr.get<std::uint32_t>();
    auto m = pr.get<std::uint32_t>();
    auto nbits = pr.get<std::uint32_t>();
    auto max_iterations = pr.get<std::uint32_t>();
    auto sample_rate = pr.get<std::uint32_t>();
    auto epsilon = pr.get<float>();
    auto seed = pr.get<std::uint32_t>();
    auto nrows = pr.get<std::uint64_t>();
    auto column = pr.get_string();
    if (!metric_u8 || !dim || !nlist || !m || !nbits || !max_iterations || !sample_rate ||
        !epsilon || !seed || !nrows || !column) {
        return integrity_error("Truncated IVF-PQ params section");
    }
    const auto metric = kernels::distance_type_from_u8(*metric_u8);
    if (!metric) return integrity_error("Unknown distance type " + std::to_string(*metric_u8));
    if (*dim == 0 || *m == 0 || *dim % *m != 0 || *nbits < 1 || *nbits > 8) {
        return integrity_error("Inconsistent IVF-PQ shape parameters");
    }

    std::shared_ptr<IvfPqIndex> index(new IvfPqIndex());
    auto& impl = *index->impl_;
    impl.column_ = std::move(*column);
    impl.dim_ = *dim;
    impl.m_ = *m;
    impl.params_.metric = *metric;
    impl.params_.num_partitions = *nlist;
    impl.params_.num_sub_vectors = *m;
    impl.params_.num_bits = *nbits;
    impl.params_.max_iterations = *max_iterations;
    impl.params_.sample_rate = *sample_rate;
    impl.params_.epsilon = *epsilon;
    impl.params_.seed = *seed;

    const std::size_t rows = static_cast<std::size_t>(*nrows);
    const std::size_t ksub = std::size_t{1} << *nbits;

    auto centroids = read_array<float>(reader, io::section_id::kIvfCentroids,
                                      static_cast<std::size_t>(*nlist) * *dim);
    if (!centroids) return std::unexpected(centroids.error());
    auto partitioner = IvfPartitioner::from_centroids(std::move(*centroids), *dim, *metric);
    if (!partitioner) return std::unexpected(partitioner.error());
    impl.partitioner_ = std::move(*partitioner);

    const std::size_t codebook_floats = rows == 0 ? 0 : static_cast<std::size_t>(*m) * ksub * (*dim / *m);
    auto codebooks = read_array<float>(reader, io::section_id::kPqCodebooks, codebook_floats);
    if (!codebooks) return std::unexpected(codebooks.error());
    if (rows > 0) {
        auto pq = ProductQuantizer::from_codebooks(*dim, *m, *nbits, *metric, std::move(*codebooks));
        if (!pq) return std::unexpected(pq.error());
        impl.pq_ = std::move(*pq);
    }

    auto offsets = read_array<std::uint64_t>(reader, io::section_id::kIvfOffsets,
                                            static_cast<std::size_t>(*nlist) + 1);
    if (!offsets) return std::unexpected(offsets.error());
    if (offsets->front() != 0 || offsets->back() != rows ||
        !std::is_sorted(offsets->begin(), offsets->end())) {
        return integrity_error("Partition offsets are not a valid prefix sum");
    }
    impl.offsets_ = std::move(*offsets);

    auto row_ids = read_array<std::uint64_t>(reader, io::section_id::kIvfRowIds, rows);
    if (!row_ids) return std::unexpected(row_ids.error());
    impl.row_ids_ = std::move(*row_ids);

    auto codes = read_array<std::uint8_t>(reader, io::section_id::kIvfCodes, rows * *m);
    if (!codes) return std::unexpected(codes.error());
    for (std::uint8_t c : *codes) {
        if (c >= ksub) return integrity_error("PQ code outside codebook range");
    }
    impl.codes_ = std::move(*codes);

    impl.indexed_.addMany(impl.row_ids_.size(), impl.row_ids_.data());
    if (impl.indexed_.cardinality() != rows) {
        return integrity_error("Duplicate row ids in IVF-PQ artifact");
    }

    return std::shared_ptr<const IvfPqIndex>(std::move(index));
}

auto IvfPqIndex::save(const std::filesystem::path& path, int zstd_level) const
    -> std::expected<void, core::error> {
    io::SectionWriter writer(io::ArtifactKind::Vector, zstd_level);
    if (auto r = write_sections(writer); !r) return r;
    return writer.write_atomic(path);
}

auto IvfPqIndex::load(const std::filesystem::path& path)
    -> std::expected<std::shared_ptr<const IvfPqIndex>, core::error> {
    auto reader = io::SectionReader::open(path);
    if (!reader) return std::unexpected(reader.error());
    if (reader->kind() != io::ArtifactKind::Vector) {
        return integrity_error("Artifact " + path.string() + " is not a vector index");
    }
    return read_sections(*reader);
}

} // namespace quiver::index
