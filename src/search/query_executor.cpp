#include "quiver/search/query_executor.hpp"

#include <algorithm>

namespace quiver::search {

QueryExecutor::QueryExecutor(const storage::DataSource& source,
                             filter_eval::ScalarIndexLookup scalar_lookup,
                             std::uint32_t default_nprobes)
    : source_(source), scalar_lookup_(std::move(scalar_lookup)), default_nprobes_(default_nprobes) {}

auto QueryExecutor::execute(const VectorQuery& query, const std::string& column,
                            const std::shared_ptr<const index::IvfPqIndex>& vector_index) const
    -> std::expected<std::vector<index::SearchHit>, core::error> {
    using core::error_code;

    const std::uint32_t nprobes = query.nprobes.value_or(default_nprobes_);
    const std::uint32_t refine_factor = query.refine_factor.value_or(1);
    if (query.k == 0 || nprobes == 0 || refine_factor == 0) {
        return core::make_error(error_code::invalid_parameter,
            "k, nprobes and refine_factor must be > 0", "query_executor");
    }

    std::optional<roaring::Roaring64Map> allowed;
    if (query.filter && query.prefilter) {
        auto bitmap = filter_eval::evaluate(*query.filter, source_, scalar_lookup_);
        if (!bitmap) return std::unexpected(bitmap.error());
        allowed = std::move(*bitmap);
    }

    const bool indexed = vector_index && query.use_index;
    if (indexed) {
        // Rows removed after the build are still in the index.
        const auto ids = source_.row_ids();
        roaring::Roaring64Map live;
        live.addMany(ids.size(), ids.data());
        if (!vector_index->indexed_rows().isSubset(live)) {
            if (allowed) {
                *allowed &= live;
            } else {
                allowed = std::move(live);
            }
        }
    }
    const roaring::Roaring64Map* allowed_ptr = allowed ? &*allowed : nullptr;

    std::expected<std::vector<index::SearchHit>, core::error> hits;
    if (indexed) {
        index::IvfPqSearchParams params;
        params.k = query.k;
        params.nprobes = nprobes;
        params.refine_factor = refine_factor;
        const index::VectorFetcher fetcher = [this, &column](std::span<const std::uint64_t> ids) {
            return source_.fetch_vectors(column, ids);
        };
        hits = vector_index->search(query.vector, params, allowed_ptr, &fetcher);
    } else {
        const auto metric = query.distance_type.value_or(kernels::DistanceType::L2);
        hits = flat_search(column, query.vector, query.k, metric, allowed_ptr);
    }
    if (!hits) return hits;

    if (query.filter && !query.prefilter) {
        return apply_postfilter(*query.filter, std::move(*hits));
    }
    return hits;
}

auto QueryExecutor::flat_search(const std::string& column, std::span<const float> query, std::uint32_t k,
                                kernels::DistanceType metric, const roaring::Roaring64Map* allowed) const
    -> std::expected<std::vector<index::SearchHit>, core::error> {
    if (k == 0) {
        return core::make_error(core::error_code::invalid_parameter, "k must be > 0", "query_executor");
    }
    auto col = source_.read_vector_column(column);
    if (!col) return std::unexpected(col.error());
    if (query.size() != col->dim) {
        return core::make_error(core::error_code::dimension_mismatch,
            "Expected dimension " + std::to_string(col->dim) + ", got " + std::to_string(query.size()),
            "query_executor");
    }

    const std::size_t dim = col->dim;
    std::vector<index::SearchHit> heap;
    heap.reserve(static_cast<std::size_t>(k) + 1);
    for (std::size_t i = 0; i < col->row_ids.size(); ++i) {
        const std::uint64_t id = col->row_ids[i];
        if (allowed != nullptr && !allowed->contains(id)) continue;
        const index::SearchHit hit{id, kernels::distance(metric, query, {col->data.data() + i * dim, dim})};
        if (heap.size() < k) {
            heap.push_back(hit);
            std::push_heap(heap.begin(), heap.end(), index::hit_less);
        } else if (index::hit_less(hit, heap.front())) {
            std::pop_heap(heap.begin(), heap.end(), index::hit_less);
            heap.back() = hit;
            std::push_heap(heap.begin(), heap.end(), index::hit_less);
        }
    }
    std::sort_heap(heap.begin(), heap.end(), index::hit_less);
    return heap;
}

auto QueryExecutor::apply_postfilter(const filter_expr& filter, std::vector<index::SearchHit> hits) const
    -> std::expected<std::vector<index::SearchHit>, core::error> {
    std::vector<std::uint64_t> ids;
    ids.reserve(hits.size());
    for (const auto& h : hits) ids.push_back(h.row_id);

    auto keep = filter_eval::evaluate_on_rows(filter, source_, ids);
    if (!keep) return std::unexpected(keep.error());

    std::vector<index::SearchHit> out;
    out.reserve(hits.size());
    for (std::size_t i = 0; i < hits.size(); ++i) {
        if ((*keep)[i]) out.push_back(hits[i]);
    }
    return out;
}

} // namespace quiver::search
