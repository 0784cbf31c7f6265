#pragma once

/** \file cancellation.hpp
 *  \brief Cooperative cancellation flag shared between a build task and its owner.
 *
 * Long-running work polls is_cancelled() at safe interruption points
 * (between k-means iterations, between encode batches). Cancellation is
 * sticky: once requested it cannot be withdrawn.
 */

#include <atomic>

#include "quiver/error.hpp"

namespace quiver::core {

class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/** \brief Null-safe poll; a missing token never cancels. */
inline bool is_cancelled(const CancellationToken* token) noexcept {
    return token != nullptr && token->is_cancelled();
}

inline auto cancelled_error(std::string component) -> error {
    return error{error_code::cancelled, "operation cancelled", std::move(component)};
}

} // namespace quiver::core
