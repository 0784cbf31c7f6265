#pragma once

/** \file filter_expr.hpp
 *  \brief Filter expression AST for scalar column predicates.
 *
 * Use cases: compile to Roaring bitmaps (prefilter) or evaluate per row (postfilter).
 * Ownership: this AST is value-semantic and self-contained.
 */

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "quiver/scalar_value.hpp"

namespace quiver {

/** \brief Equality predicate field == value. */
struct term {
  std::string field; /**< column name */
  ScalarValue value;
};

/** \brief Range predicate; an absent bound is open on that side. */
struct range {
  std::string field;                     /**< column name */
  std::optional<ScalarValue> min_value;
  std::optional<ScalarValue> max_value;
  bool min_inclusive{true};
  bool max_inclusive{true};
};

/** \brief Set membership predicate field IN (values). */
struct in_set {
  std::string field;                     /**< column name */
  std::vector<ScalarValue> values;
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<term, range, in_set, and_t, or_t, not_t> node; /**< root node */
};

} // namespace quiver
