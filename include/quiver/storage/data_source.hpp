#pragma once

/** \file data_source.hpp
 *  \brief Columnar data source consumed by index builds and queries.
 *
 * The storage layer owns rows; indices only read columns through this
 * interface. Implementations must be safe for concurrent readers.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/scalar_value.hpp"

namespace quiver::storage {

enum class ColumnType : std::uint8_t {
    Float32Vector = 0,
    Int64 = 1,
    Float64 = 2,
    String = 3,
    Bool = 4,
};

inline auto is_vector_column(ColumnType t) noexcept -> bool {
    return t == ColumnType::Float32Vector;
}

/** \brief Scalar alternative stored by a scalar column type. */
inline auto scalar_type_of(ColumnType t) noexcept -> ScalarType {
    switch (t) {
        case ColumnType::Int64: return ScalarType::Int64;
        case ColumnType::Float64: return ScalarType::Float64;
        case ColumnType::String: return ScalarType::String;
        case ColumnType::Bool: return ScalarType::Bool;
        case ColumnType::Float32Vector: break;
    }
    return ScalarType::Float64;
}

struct ColumnInfo {
    std::string name;
    ColumnType type{ColumnType::Float32Vector};
    std::uint32_t dimension{0};          /**< Vector columns only */
};

/** \brief Materialized vector column, row-major [row_ids.size() x dim]. */
struct VectorColumn {
    std::vector<std::uint64_t> row_ids;
    std::vector<float> data;
    std::uint32_t dim{0};
};

struct ScalarColumn {
    std::vector<std::uint64_t> row_ids;
    std::vector<ScalarValue> values;
};

/** \brief Abstract columnar storage.
 *
 * Errors: column_resolution for unknown columns, invalid_parameter when the
 * column has the wrong kind.
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    virtual auto schema() const -> std::vector<ColumnInfo> = 0;

    virtual auto read_vector_column(const std::string& name) const
        -> std::expected<VectorColumn, core::error> = 0;

    virtual auto read_scalar_column(const std::string& name) const
        -> std::expected<ScalarColumn, core::error> = 0;

    /** \brief Vectors for row_ids in order, flattened. Missing ids are an error. */
    virtual auto fetch_vectors(const std::string& name, std::span<const std::uint64_t> row_ids) const
        -> std::expected<std::vector<float>, core::error> = 0;

    /** \brief Scalar cells for row_ids in order. Missing ids are an error. */
    virtual auto fetch_scalars(const std::string& name, std::span<const std::uint64_t> row_ids) const
        -> std::expected<std::vector<ScalarValue>, core::error> = 0;

    /** \brief Every live row id. */
    virtual auto row_ids() const -> std::vector<std::uint64_t> = 0;

    virtual auto row_count() const -> std::uint64_t = 0;

    /** \brief Monotonic counter bumped by every mutation. */
    virtual auto data_version() const -> std::uint64_t = 0;
};

} // namespace quiver::storage
