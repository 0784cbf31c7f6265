#include "quiver/filter_eval.hpp"

#include <algorithm>
#include <optional>

namespace quiver::filter_eval {

namespace {

// Checks every leaf against the schema before any column is read.
auto validate_types(const filter_expr& e, const std::vector<storage::ColumnInfo>& schema)
    -> std::expected<void, core::error> {
  if (auto leaf = leaf_predicate(e)) {
    const auto& [field, pred] = *leaf;
    auto it = std::find_if(schema.begin(), schema.end(),
                           [&field](const storage::ColumnInfo& c) { return c.name == field; });
    if (it == schema.end()) {
      return core::make_error(core::error_code::column_resolution,
                              "Filter references unknown column '" + field + "'", "filter_eval");
    }
    if (storage::is_vector_column(it->type)) {
      return core::make_error(core::error_code::invalid_parameter,
                              "Filter references vector column '" + field + "'", "filter_eval");
    }
    const ScalarType t = storage::scalar_type_of(it->type);
    if (!index::predicate_has_type(pred, t)) {
      return core::make_error(core::error_code::invalid_parameter,
                              "Filter value type does not match " + std::string(to_string(t)) +
                              " column '" + field + "'", "filter_eval");
    }
    if (index::predicate_has_nan(pred)) {
      return core::make_error(core::error_code::invalid_parameter,
                              "Filter compares column '" + field + "' against NaN", "filter_eval");
    }
    return {};
  }
  return std::visit([&schema](const auto& node) -> std::expected<void, core::error> {
    using T = std::decay_t<decltype(node)>;
    if constexpr (std::is_same_v<T, filter_expr::and_t> || std::is_same_v<T, filter_expr::or_t> ||
                  std::is_same_v<T, filter_expr::not_t>) {
      for (const auto& c : node.children) {
        if (auto r = validate_types(c, schema); !r) return r;
      }
    }
    return {};
  }, e.node);
}

class Compiler {
public:
  Compiler(const storage::DataSource& source, const ScalarIndexLookup& lookup)
      : source_(source), lookup_(lookup) {}

  auto compile(const filter_expr& e) -> std::expected<roaring::Roaring64Map, core::error> {
    if (auto leaf = leaf_predicate(e)) {
      return compile_leaf(leaf->first, leaf->second);
    }
    if (const auto* a = std::get_if<filter_expr::and_t>(&e.node)) {
      if (a->children.empty()) return all_rows(); // and([]) == true
      auto acc = compile(a->children[0]);
      if (!acc) return acc;
      for (std::size_t i = 1; i < a->children.size(); ++i) {
        auto rhs = compile(a->children[i]);
        if (!rhs) return rhs;
        *acc &= *rhs;
      }
      return acc;
    }
    if (const auto* o = std::get_if<filter_expr::or_t>(&e.node)) {
      roaring::Roaring64Map acc; // or([]) == false
      for (const auto& c : o->children) {
        auto rhs = compile(c);
        if (!rhs) return rhs;
        acc |= *rhs;
      }
      return acc;
    }
    const auto& n = std::get<filter_expr::not_t>(e.node);
    // not(a, b, ...) == !a && !b && ...
    roaring::Roaring64Map res = all_rows();
    for (const auto& c : n.children) {
      auto child = compile(c);
      if (!child) return child;
      res -= *child;
    }
    return res;
  }

private:
  auto compile_leaf(const std::string& field, const index::ScalarPredicate& pred)
      -> std::expected<roaring::Roaring64Map, core::error> {
    if (lookup_) {
      if (auto idx = lookup_(field)) {
        auto r = idx->search(pred);
        if (!r) return std::unexpected(r.error());
        return std::move(r->row_ids);
      }
    }
    auto col = source_.read_scalar_column(field);
    if (!col) return std::unexpected(col.error());
    roaring::Roaring64Map out;
    for (std::size_t i = 0; i < col->values.size(); ++i) {
      if (index::predicate_matches(pred, col->values[i])) out.add(col->row_ids[i]);
    }
    return out;
  }

  auto all_rows() -> const roaring::Roaring64Map& {
    if (!universe_) {
      const auto ids = source_.row_ids();
      universe_.emplace();
      universe_->addMany(ids.size(), ids.data());
    }
    return *universe_;
  }

  const storage::DataSource& source_;
  const ScalarIndexLookup& lookup_;
  std::optional<roaring::Roaring64Map> universe_;
};

void collect_fields(const filter_expr& e, std::vector<std::string>& out) {
  std::visit([&out](const auto& node) {
    using T = std::decay_t<decltype(node)>;
    if constexpr (std::is_same_v<T, term> || std::is_same_v<T, range> || std::is_same_v<T, in_set>) {
      if (std::find(out.begin(), out.end(), node.field) == out.end()) out.push_back(node.field);
    } else {
      for (const auto& c : node.children) collect_fields(c, out);
    }
  }, e.node);
}

} // anonymous namespace

auto leaf_predicate(const filter_expr& expr) -> std::optional<std::pair<std::string, index::ScalarPredicate>> {
  if (const auto* t = std::get_if<term>(&expr.node)) {
    return std::pair{t->field, index::ScalarPredicate{index::Equals{t->value}}};
  }
  if (const auto* r = std::get_if<range>(&expr.node)) {
    index::Range pred;
    if (r->min_value) pred.lower = index::Bound{*r->min_value, r->min_inclusive};
    if (r->max_value) pred.upper = index::Bound{*r->max_value, r->max_inclusive};
    return std::pair{r->field, index::ScalarPredicate{std::move(pred)}};
  }
  if (const auto* s = std::get_if<in_set>(&expr.node)) {
    return std::pair{s->field, index::ScalarPredicate{index::InSet{s->values}}};
  }
  return std::nullopt;
}

auto referenced_fields(const filter_expr& expr) -> std::vector<std::string> {
  std::vector<std::string> out;
  collect_fields(expr, out);
  return out;
}

auto matches(const filter_expr& e, const row_t& row) -> bool {
  if (auto leaf = leaf_predicate(e)) {
    auto it = row.find(leaf->first);
    return it != row.end() && index::predicate_matches(leaf->second, it->second);
  }
  if (const auto* a = std::get_if<filter_expr::and_t>(&e.node)) {
    for (const auto& c : a->children) if (!matches(c, row)) return false;
    return true; // and([]) == true
  }
  if (const auto* o = std::get_if<filter_expr::or_t>(&e.node)) {
    for (const auto& c : o->children) if (matches(c, row)) return true;
    return false; // or([]) == false
  }
  const auto& n = std::get<filter_expr::not_t>(e.node);
  bool v = true; // not([]) == true
  for (const auto& c : n.children) v = v && !matches(c, row);
  return v;
}

auto evaluate(const filter_expr& expr, const storage::DataSource& source,
              const ScalarIndexLookup& lookup)
    -> std::expected<roaring::Roaring64Map, core::error> {
  if (auto v = validate_types(expr, source.schema()); !v) return std::unexpected(v.error());
  Compiler compiler(source, lookup);
  return compiler.compile(expr);
}

auto evaluate_on_rows(const filter_expr& expr, const storage::DataSource& source,
                      std::span<const std::uint64_t> rows)
    -> std::expected<std::vector<bool>, core::error> {
  if (auto v = validate_types(expr, source.schema()); !v) return std::unexpected(v.error());

  const auto fields = referenced_fields(expr);
  std::vector<std::vector<ScalarValue>> cells;
  cells.reserve(fields.size());
  for (const auto& f : fields) {
    auto values = source.fetch_scalars(f, rows);
    if (!values) return std::unexpected(values.error());
    cells.push_back(std::move(*values));
  }

  std::vector<bool> out(rows.size());
  row_t row;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    for (std::size_t f = 0; f < fields.size(); ++f) row[fields[f]] = cells[f][i];
    out[i] = matches(expr, row);
  }
  return out;
}

} // namespace quiver::filter_eval
