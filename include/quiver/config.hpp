#pragma once

/** \file config.hpp
 *  \brief Index manager configuration and environment overrides.
 *
 * Recognized environment variables (malformed values are ignored):
 * - QUIVER_VERBOSE            1/true enables diagnostic logging
 * - QUIVER_NPROBES            default nprobes for vector queries (> 0)
 * - QUIVER_ZSTD_LEVEL         artifact section compression, 0 (off) to 19
 * - QUIVER_BTREE_BLOCK_SIZE   default BTree block size (> 0)
 * - QUIVER_NUM_THREADS        build parallelism, 0 = OpenMP default
 */

#include <cstdint>
#include <filesystem>
#include <optional>

namespace quiver {

struct ManagerOptions {
    std::optional<std::filesystem::path> storage_dir;  /**< Persist artifacts here when set */
    std::uint32_t default_nprobes{20};
    std::uint32_t btree_block_size{4096};
    int zstd_level{3};
    std::uint32_t num_threads{0};
    bool verbose{false};

    /** \brief Defaults with environment overrides applied. */
    static auto from_env() -> ManagerOptions;

    /** \brief Overwrite fields for which a well-formed environment variable is set. */
    void apply_env_overrides();
};

} // namespace quiver
