#include "quiver/storage/in_memory_table.hpp"

#include <atomic>
#include <cstring>
#include <mutex>
#include <shared_mutex>
#include <unordered_set>

namespace quiver::storage {

namespace {

struct ColumnData {
    ColumnInfo info;
    std::vector<float> vectors;          // [rows x dim] for vector columns
    std::vector<ScalarValue> scalars;    // [rows] for scalar columns
};

} // anonymous namespace

class InMemoryTable::Impl {
public:
    auto find_column(const std::string& name) const -> const ColumnData* {
        auto it = column_index_.find(name);
        return it == column_index_.end() ? nullptr : &columns_[it->second];
    }

    auto unknown_column(const std::string& name) const -> std::unexpected<core::error> {
        return core::make_error(core::error_code::column_resolution,
                                "Unknown column '" + name + "'", "in_memory_table");
    }

    auto validate_row(const Row& row, std::unordered_set<std::uint64_t>& batch_ids) const
        -> std::expected<void, core::error> {
        using core::error_code;
        if (row_position_.contains(row.row_id) || !batch_ids.insert(row.row_id).second) {
            return core::make_error(error_code::invalid_parameter,
                "Duplicate row id " + std::to_string(row.row_id), "in_memory_table");
        }
        if (row.vectors.size() + row.scalars.size() != columns_.size()) {
            return core::make_error(error_code::invalid_parameter,
                "Row " + std::to_string(row.row_id) + " does not match the schema column count",
                "in_memory_table");
        }
        for (const auto& col : columns_) {
            if (is_vector_column(col.info.type)) {
                auto it = row.vectors.find(col.info.name);
                if (it == row.vectors.end()) {
                    return core::make_error(error_code::invalid_parameter,
                        "Row missing vector column '" + col.info.name + "'", "in_memory_table");
                }
                if (it->second.size() != col.info.dimension) {
                    return core::make_error(error_code::dimension_mismatch,
                        "Column '" + col.info.name + "' expects dimension " +
                        std::to_string(col.info.dimension) + ", got " + std::to_string(it->second.size()),
                        "in_memory_table");
                }
            } else {
                auto it = row.scalars.find(col.info.name);
                if (it == row.scalars.end()) {
                    return core::make_error(error_code::invalid_parameter,
                        "Row missing scalar column '" + col.info.name + "'", "in_memory_table");
                }
                if (scalar_type(it->second) != scalar_type_of(col.info.type)) {
                    return core::make_error(error_code::invalid_parameter,
                        "Column '" + col.info.name + "' holds " +
                        std::string(to_string(scalar_type_of(col.info.type))) + " values",
                        "in_memory_table");
                }
            }
        }
        return {};
    }

    std::vector<ColumnData> columns_;
    std::unordered_map<std::string, std::size_t> column_index_;
    std::vector<std::uint64_t> row_ids_;
    std::unordered_map<std::uint64_t, std::size_t> row_position_;
    std::atomic<std::uint64_t> version_{0};
    mutable std::shared_mutex mutex_;
};

InMemoryTable::InMemoryTable() : impl_(std::make_unique<Impl>()) {}
InMemoryTable::~InMemoryTable() = default;

auto InMemoryTable::create(std::vector<ColumnInfo> schema)
    -> std::expected<std::shared_ptr<InMemoryTable>, core::error> {
    std::shared_ptr<InMemoryTable> table(new InMemoryTable());
    for (auto& info : schema) {
        if (info.name.empty() || table->impl_->column_index_.contains(info.name)) {
            return core::make_error(core::error_code::invalid_parameter,
                "Empty or duplicate column name '" + info.name + "'", "in_memory_table");
        }
        if (is_vector_column(info.type) && info.dimension == 0) {
            return core::make_error(core::error_code::invalid_parameter,
                "Vector column '" + info.name + "' must have dimension > 0", "in_memory_table");
        }
        table->impl_->column_index_.emplace(info.name, table->impl_->columns_.size());
        table->impl_->columns_.push_back(ColumnData{std::move(info), {}, {}});
    }
    return table;
}

auto InMemoryTable::append(std::span<const Row> rows) -> std::expected<void, core::error> {
    std::unique_lock lock(impl_->mutex_);

    std::unordered_set<std::uint64_t> batch_ids;
    for (const auto& row : rows) {
        if (auto v = impl_->validate_row(row, batch_ids); !v) {
            return v;
        }
    }

    for (const auto& row : rows) {
        impl_->row_position_.emplace(row.row_id, impl_->row_ids_.size());
        impl_->row_ids_.push_back(row.row_id);
        for (auto& col : impl_->columns_) {
            if (is_vector_column(col.info.type)) {
                const auto& v = row.vectors.at(col.info.name);
                col.vectors.insert(col.vectors.end(), v.begin(), v.end());
            } else {
                col.scalars.push_back(row.scalars.at(col.info.name));
            }
        }
    }
    if (!rows.empty()) {
        impl_->version_.fetch_add(1, std::memory_order_acq_rel);
    }
    return {};
}

auto InMemoryTable::remove(std::span<const std::uint64_t> row_ids) -> std::size_t {
    std::unique_lock lock(impl_->mutex_);

    std::unordered_set<std::uint64_t> doomed;
    for (auto id : row_ids) {
        if (impl_->row_position_.contains(id)) doomed.insert(id);
    }
    if (doomed.empty()) return 0;

    // Compact every column in place, preserving insertion order of survivors.
    std::size_t out = 0;
    for (std::size_t in = 0; in < impl_->row_ids_.size(); ++in) {
        if (doomed.contains(impl_->row_ids_[in])) continue;
        if (out != in) {
            impl_->row_ids_[out] = impl_->row_ids_[in];
            for (auto& col : impl_->columns_) {
                if (is_vector_column(col.info.type)) {
                    const std::size_t dim = col.info.dimension;
                    std::memmove(col.vectors.data() + out * dim, col.vectors.data() + in * dim,
                                 dim * sizeof(float));
                } else {
                    col.scalars[out] = std::move(col.scalars[in]);
                }
            }
        }
        ++out;
    }
    impl_->row_ids_.resize(out);
    impl_->row_position_.clear();
    for (std::size_t i = 0; i < out; ++i) impl_->row_position_.emplace(impl_->row_ids_[i], i);
    for (auto& col : impl_->columns_) {
        if (is_vector_column(col.info.type)) {
            col.vectors.resize(out * col.info.dimension);
        } else {
            col.scalars.resize(out);
        }
    }

    impl_->version_.fetch_add(1, std::memory_order_acq_rel);
    return doomed.size();
}

auto InMemoryTable::schema() const -> std::vector<ColumnInfo> {
    std::shared_lock lock(impl_->mutex_);
    std::vector<ColumnInfo> out;
    out.reserve(impl_->columns_.size());
    for (const auto& col : impl_->columns_) out.push_back(col.info);
    return out;
}

auto InMemoryTable::read_vector_column(const std::string& name) const
    -> std::expected<VectorColumn, core::error> {
    std::shared_lock lock(impl_->mutex_);
    const auto* col = impl_->find_column(name);
    if (!col) return impl_->unknown_column(name);
    if (!is_vector_column(col->info.type)) {
        return core::make_error(core::error_code::invalid_parameter,
            "Column '" + name + "' is not a vector column", "in_memory_table");
    }
    return VectorColumn{impl_->row_ids_, col->vectors, col->info.dimension};
}

auto InMemoryTable::read_scalar_column(const std::string& name) const
    -> std::expected<ScalarColumn, core::error> {
    std::shared_lock lock(impl_->mutex_);
    const auto* col = impl_->find_column(name);
    if (!col) return impl_->unknown_column(name);
    if (is_vector_column(col->info.type)) {
        return core::make_error(core::error_code::invalid_parameter,
            "Column '" + name + "' is not a scalar column", "in_memory_table");
    }
    return ScalarColumn{impl_->row_ids_, col->scalars};
}

auto InMemoryTable::fetch_vectors(const std::string& name, std::span<const std::uint64_t> row_ids) const
    -> std::expected<std::vector<float>, core::error> {
    std::shared_lock lock(impl_->mutex_);
    const auto* col = impl_->find_column(name);
    if (!col) return impl_->unknown_column(name);
    if (!is_vector_column(col->info.type)) {
        return core::make_error(core::error_code::invalid_parameter,
            "Column '" + name + "' is not a vector column", "in_memory_table");
    }
    const std::size_t dim = col->info.dimension;
    std::vector<float> out;
    out.reserve(row_ids.size() * dim);
    for (auto id : row_ids) {
        auto it = impl_->row_position_.find(id);
        if (it == impl_->row_position_.end()) {
            return core::make_error(core::error_code::invalid_parameter,
                "Row id " + std::to_string(id) + " not present", "in_memory_table");
        }
        const float* v = col->vectors.data() + it->second * dim;
        out.insert(out.end(), v, v + dim);
    }
    return out;
}

auto InMemoryTable::fetch_scalars(const std::string& name, std::span<const std::uint64_t> row_ids) const
    -> std::expected<std::vector<ScalarValue>, core::error> {
    std::shared_lock lock(impl_->mutex_);
    const auto* col = impl_->find_column(name);
    if (!col) return impl_->unknown_column(name);
    if (is_vector_column(col->info.type)) {
        return core::make_error(core::error_code::invalid_parameter,
            "Column '" + name + "' is not a scalar column", "in_memory_table");
    }
    std::vector<ScalarValue> out;
    out.reserve(row_ids.size());
    for (auto id : row_ids) {
        auto it = impl_->row_position_.find(id);
        if (it == impl_->row_position_.end()) {
            return core::make_error(core::error_code::invalid_parameter,
                "Row id " + std::to_string(id) + " not present", "in_memory_table");
        }
        out.push_back(col->scalars[it->second]);
    }
    return out;
}

auto InMemoryTable::row_ids() const -> std::vector<std::uint64_t> {
    std::shared_lock lock(impl_->mutex_);
    return impl_->row_ids_;
}

auto InMemoryTable::row_count() const -> std::uint64_t {
    std::shared_lock lock(impl_->mutex_);
    return impl_->row_ids_.size();
}

auto InMemoryTable::data_version() const -> std::uint64_t {
    return impl_->version_.load(std::memory_order_acquire);
}

} // namespace quiver::storage
