#pragma once

/** \file in_memory_table.hpp
 *  \brief Thread-safe in-memory DataSource used by embedders and tests.
 *
 * Rows are appended in batches and may be removed by id. Every mutation bumps
 * data_version(), which index metadata records for staleness checks.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "quiver/storage/data_source.hpp"

namespace quiver::storage {

/** \brief One row; must carry a value for every schema column. */
struct Row {
    std::uint64_t row_id{0};
    std::unordered_map<std::string, std::vector<float>> vectors;
    std::unordered_map<std::string, ScalarValue> scalars;
};

class InMemoryTable final : public DataSource {
public:
    /** \brief Create an empty table.
     *
     * Errors: invalid_parameter for duplicate column names or vector columns
     * with dimension 0.
     */
    static auto create(std::vector<ColumnInfo> schema)
        -> std::expected<std::shared_ptr<InMemoryTable>, core::error>;

    ~InMemoryTable() override;

    /** \brief Append a batch atomically; nothing is applied on error.
     *
     * Errors: invalid_parameter (missing/unknown column, wrong value type,
     * duplicate row id), dimension_mismatch (vector length).
     */
    auto append(std::span<const Row> rows) -> std::expected<void, core::error>;

    /** \brief Remove rows by id; unknown ids are ignored. Returns rows removed. */
    auto remove(std::span<const std::uint64_t> row_ids) -> std::size_t;

    auto schema() const -> std::vector<ColumnInfo> override;
    auto read_vector_column(const std::string& name) const
        -> std::expected<VectorColumn, core::error> override;
    auto read_scalar_column(const std::string& name) const
        -> std::expected<ScalarColumn, core::error> override;
    auto fetch_vectors(const std::string& name, std::span<const std::uint64_t> row_ids) const
        -> std::expected<std::vector<float>, core::error> override;
    auto fetch_scalars(const std::string& name, std::span<const std::uint64_t> row_ids) const
        -> std::expected<std::vector<ScalarValue>, core::error> override;
    auto row_ids() const -> std::vector<std::uint64_t> override;
    auto row_count() const -> std::uint64_t override;
    auto data_version() const -> std::uint64_t override;

private:
    InMemoryTable();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::storage
