#pragma once

#include <atomic>

namespace gatewatch {

// Shutdown signal shared by the scheduler and the components that block on
// external calls. The scheduler trips it on stop and clears it on start.
class CancelToken {
public:
    void cancel()          { cancelled_.store(true, std::memory_order_release); }
    void reset()           { cancelled_.store(false, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace gatewatch
