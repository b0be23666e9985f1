#pragma once

#include <atomic>

namespace panannot {

// Run-wide cancellation flag. Safe to set from a signal handler.
class CancellationToken {
public:
    void request() { requested_.store(true, std::memory_order_release); }
    bool requested() const { return requested_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> requested_{false};
};

} // namespace panannot
