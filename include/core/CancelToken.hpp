#pragma once

#include <atomic>
#include <chrono>

namespace chunkwire {

/**
 * Cooperative cancellation flag shared between an upload loop and whoever wants to stop it.
 * cancel() only touches an atomic, so it may be called from a signal handler.
 */
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

    // Sleeps for the given duration unless cancelled first. Returns true if cancelled.
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace chunkwire
