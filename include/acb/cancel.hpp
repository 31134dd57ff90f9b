#pragma once

#include <atomic>

namespace acb {

// Cooperative cancellation flag shared between a caller and a long-running
// archive operation. The operation polls it between entries and chunks.
class CancelToken {
public:
    void cancel() { flag_.store(true, std::memory_order_relaxed); }
    void reset() { flag_.store(false, std::memory_order_relaxed); }
    bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
};

inline bool is_cancelled(const CancelToken* token) {
    return token != nullptr && token->is_cancelled();
}

} // namespace acb
