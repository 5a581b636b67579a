#pragma once

#include <atomic>

namespace RTE {

/**
 * @brief Run-wide abort flag shared by every suite invocation of a run
 *
 * cancel() is a single lock-free atomic store and may be called from a
 * signal handler. Once canceled a token stays canceled.
 */
class CancellationToken {
public:
    void cancel() {
        canceled_.store(true, std::memory_order_release);
    }

    bool isCanceled() const {
        return canceled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> canceled_{false};
};

}  // namespace RTE
