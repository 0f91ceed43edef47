/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag for detection runs
 */

#pragma once

#include <atomic>

namespace Twinscan {

/**
 * @brief Coarse-grained abort flag, checked by the manager between stages.
 *
 * Another thread may call cancel() at any time; a detector already running
 * finishes, and the run stops at the next stage boundary.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace Twinscan
