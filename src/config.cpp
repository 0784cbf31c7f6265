#include "quiver/config.hpp"
#include "quiver/core/platform_utils.hpp"

#include <charconv>
#include <iostream>
#include <string>

namespace quiver {

namespace {

template <typename T>
auto parse_number(const char* key) -> std::optional<T> {
    auto v = core::getenv_nonempty(key);
    if (!v) return std::nullopt;
    T out{};
    const char* beg = v->data();
    const char* end = beg + v->size();
    auto [ptr, ec] = std::from_chars(beg, end, out, 10);
    if (ec != std::errc{} || ptr != end) {
        std::cerr << "[CONFIG][warn] ignoring malformed " << key << "=" << *v << std::endl;
        return std::nullopt;
    }
    return out;
}

} // anonymous namespace

auto ManagerOptions::from_env() -> ManagerOptions {
    ManagerOptions opts;
    opts.apply_env_overrides();
    return opts;
}

void ManagerOptions::apply_env_overrides() {
    if (auto v = core::getenv_nonempty("QUIVER_VERBOSE")) {
        verbose = core::parse_bool_ci(*v);
    }
    if (auto v = parse_number<std::uint32_t>("QUIVER_NPROBES"); v && *v > 0) {
        default_nprobes = *v;
    }
    if (auto v = parse_number<int>("QUIVER_ZSTD_LEVEL"); v && *v >= 0 && *v <= 19) {
        zstd_level = *v;
    }
    if (auto v = parse_number<std::uint32_t>("QUIVER_BTREE_BLOCK_SIZE"); v && *v > 0) {
        btree_block_size = *v;
    }
    if (auto v = parse_number<std::uint32_t>("QUIVER_NUM_THREADS")) {
        num_threads = *v;
    }
}

} // namespace quiver
