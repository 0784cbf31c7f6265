#pragma once

/** \file filter_eval.hpp
 *  \brief Evaluation of filter_expr against scalar columns.
 *
 * Two strategies:
 * - evaluate(): compile the whole expression to a row-id bitmap, using a
 *   BTree index for a leaf's column when one is available, else a full scan
 *   of that column (prefilter).
 * - evaluate_on_rows(): fetch only the referenced cells of the given rows and
 *   test each row (postfilter).
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include <roaring/roaring64map.hh>

#include "quiver/error.hpp"
#include "quiver/filter_expr.hpp"
#include "quiver/index/btree_index.hpp"
#include "quiver/storage/data_source.hpp"

namespace quiver::filter_eval {

using row_t = std::unordered_map<std::string, ScalarValue>;

/** \brief Returns the BTree index on a column, or nullptr. */
using ScalarIndexLookup = std::function<std::shared_ptr<const index::BTreeIndex>(const std::string&)>;

// Evaluate whether a row with given column values matches the expression.
// Leaves over a missing column do not match.
auto matches(const filter_expr& expr, const row_t& row) -> bool;

/** \brief Predicate form of a leaf node; nullopt for and/or/not. */
auto leaf_predicate(const filter_expr& expr) -> std::optional<std::pair<std::string, index::ScalarPredicate>>;

/** \brief Distinct column names referenced by the expression, in first-use order. */
auto referenced_fields(const filter_expr& expr) -> std::vector<std::string>;

/** \brief Compile expr to the set of matching row ids.
 *
 * and([]) and not([]) are the full row set; or([]) is empty.
 * Errors: column_resolution (unknown column), invalid_parameter (vector
 * column, or predicate value type differs from the column type).
 */
auto evaluate(const filter_expr& expr, const storage::DataSource& source,
              const ScalarIndexLookup& lookup = {})
    -> std::expected<roaring::Roaring64Map, core::error>;

/** \brief Per-row evaluation over rows; result[i] corresponds to rows[i]. */
auto evaluate_on_rows(const filter_expr& expr, const storage::DataSource& source,
                      std::span<const std::uint64_t> rows)
    -> std::expected<std::vector<bool>, core::error>;

} // namespace quiver::filter_eval
