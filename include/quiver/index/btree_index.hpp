#pragma once

/** \file btree_index.hpp
 *  \brief Exact scalar index: sorted (value, row id) entries cut into fixed-size blocks.
 *
 * Each block carries a header {min, max, offset, count}; the header array is
 * sorted and binary-searched to prune blocks before any entry is touched.
 * Supports equality, range (inclusive/exclusive, open-ended) and set
 * membership predicates, returning row ids as a Roaring bitmap.
 *
 * A column holds one ScalarValue alternative; predicates must use the same
 * alternative. Immutable after build; search is safe for concurrent calls.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <roaring/roaring64map.hh>

#include "quiver/error.hpp"
#include "quiver/io/section_file.hpp"
#include "quiver/scalar_value.hpp"

namespace quiver::index {

inline constexpr std::uint32_t kDefaultBlockSize = 4096;

struct BTreeBuildParams {
    std::optional<std::uint32_t> block_size;  /**< Entries per block; default kDefaultBlockSize */
    bool verbose{false};
};

struct BTreeEntry {
    ScalarValue value;
    std::uint64_t row_id{0};
};

struct BlockHeader {
    ScalarValue min;
    ScalarValue max;
    std::uint64_t offset{0};             /**< Position of the first entry */
    std::uint32_t count{0};
};

struct Bound {
    ScalarValue value;
    bool inclusive{true};
};

struct Equals {
    ScalarValue value;
};

/** \brief Range predicate; a missing bound is unbounded on that side. */
struct Range {
    std::optional<Bound> lower;
    std::optional<Bound> upper;
};

struct InSet {
    std::vector<ScalarValue> values;
};

using ScalarPredicate = std::variant<Equals, Range, InSet>;

struct ScalarSearchResult {
    roaring::Roaring64Map row_ids;
    std::vector<std::uint32_t> blocks_read;  /**< Ascending block indices touched */
};

/** \brief True when value satisfies predicate; false on alternative mismatch. */
auto predicate_matches(const ScalarPredicate& predicate, const ScalarValue& value) -> bool;

/** \brief Every ScalarValue referenced by the predicate has alternative t. */
auto predicate_has_type(const ScalarPredicate& predicate, ScalarType t) -> bool;

/** \brief Some value referenced by the predicate is a NaN double. */
auto predicate_has_nan(const ScalarPredicate& predicate) -> bool;

class BTreeIndex {
public:
    ~BTreeIndex();
    BTreeIndex(const BTreeIndex&) = delete;
    BTreeIndex& operator=(const BTreeIndex&) = delete;

    /** \brief Sort and block a scalar column.
     *
     * Errors: invalid_parameter (block_size == 0, size mismatch, mixed
     * alternatives in values). An empty column yields an empty index.
     * Complexity: O(n log n)
     */
    static auto build(std::string column, std::span<const std::uint64_t> row_ids,
                      std::span<const ScalarValue> values, const BTreeBuildParams& params)
        -> std::expected<std::shared_ptr<const BTreeIndex>, core::error>;

    /** \brief Evaluate a predicate.
     *
     * Errors: invalid_parameter when a predicate value's alternative differs
     * from the column's or a value is NaN.
     * Complexity: O(log B + blocks_read * log block_size + matches)
     */
    auto search(const ScalarPredicate& predicate) const
        -> std::expected<ScalarSearchResult, core::error>;

    auto column() const noexcept -> const std::string&;
    /** \brief Alternative stored; nullopt for an empty index. */
    auto value_type() const noexcept -> std::optional<ScalarType>;
    auto size() const noexcept -> std::size_t;
    auto block_size() const noexcept -> std::uint32_t;
    auto num_blocks() const noexcept -> std::size_t;
    auto headers() const noexcept -> std::span<const BlockHeader>;
    auto entries() const noexcept -> std::span<const BTreeEntry>;
    auto indexed_rows() const noexcept -> const roaring::Roaring64Map&;
    auto memory_bytes() const noexcept -> std::size_t;

    auto write_sections(io::SectionWriter& writer) const -> std::expected<void, core::error>;
    static auto read_sections(const io::SectionReader& reader)
        -> std::expected<std::shared_ptr<const BTreeIndex>, core::error>;

    auto save(const std::filesystem::path& path, int zstd_level = 3) const
        -> std::expected<void, core::error>;
    static auto load(const std::filesystem::path& path)
        -> std::expected<std::shared_ptr<const BTreeIndex>, core::error>;

private:
    BTreeIndex();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::index
