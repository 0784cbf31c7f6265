#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace quiver::core {

/** \brief Environment lookup that avoids getenv on MSVC.
 *
 * Unset yields std::nullopt; set-but-empty yields an empty string.
 */
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || name[0] == '\0') return std::nullopt;
#if defined(_WIN32)
    char* raw = nullptr;
    std::size_t size = 0;
    if (_dupenv_s(&raw, &size, name) != 0 || raw == nullptr) {
        std::free(raw);
        return std::nullopt;
    }
    std::optional<std::string> out{std::string(raw)};
    std::free(raw);
    return out;
#else
    if (const char* raw = std::getenv(name)) return std::string(raw);
    return std::nullopt;
#endif
}

inline std::optional<std::string> getenv_nonempty(const char* key) noexcept {
    auto v = safe_getenv(key);
    if (v && !v->empty()) return v;
    return std::nullopt;
}

// Accepts 1/0 and true/false (case-insensitive); anything else is false.
inline bool parse_bool_ci(std::string_view s) noexcept {
    auto eq_ci = [](char a, char b){
        if (a >= 'A' && a <= 'Z') a = static_cast<char>(a - 'A' + 'a');
        if (b >= 'A' && b <= 'Z') b = static_cast<char>(b - 'A' + 'a');
        return a == b;
    };
    if (s.size() == 1 && (s[0] == '1' || s[0] == '0')) return s[0] == '1';
    if (s.size() == 4 && eq_ci(s[0],'t') && eq_ci(s[1],'r') && eq_ci(s[2],'u') && eq_ci(s[3],'e')) return true;
    return false;
}

/** \brief True when QUIVER_VERBOSE is set to a truthy value. */
inline bool verbose_from_env() noexcept {
    auto v = getenv_nonempty("QUIVER_VERBOSE");
    return v && parse_bool_ci(*v);
}

} // namespace quiver::core
