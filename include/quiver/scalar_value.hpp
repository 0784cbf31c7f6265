#pragma once

/** \file scalar_value.hpp
 *  \brief Typed scalar cell values used by scalar columns, BTree entries and filters.
 *
 * A scalar column holds a single alternative. Ordering is defined only between
 * values of the same alternative; comparing different alternatives is a caller
 * error reported as invalid_parameter by the components that compare.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace quiver {

using ScalarValue = std::variant<bool, std::int64_t, double, std::string>;

/** \brief Alternative tag, in variant index order. */
enum class ScalarType : std::uint8_t { Bool = 0, Int64 = 1, Float64 = 2, String = 3 };

inline auto scalar_type(const ScalarValue& v) noexcept -> ScalarType {
    return static_cast<ScalarType>(v.index());
}

constexpr auto to_string(ScalarType t) noexcept -> std::string_view {
    switch (t) {
        case ScalarType::Bool: return "bool";
        case ScalarType::Int64: return "int64";
        case ScalarType::Float64: return "float64";
        case ScalarType::String: return "string";
    }
    return "unknown";
}

inline auto same_type(const ScalarValue& a, const ScalarValue& b) noexcept -> bool {
    return a.index() == b.index();
}

/** \brief Human readable rendering for log lines and error messages. */
inline auto to_display_string(const ScalarValue& v) -> std::string {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + x + "'";
        } else {
            return std::to_string(x);
        }
    }, v);
}

} // namespace quiver
