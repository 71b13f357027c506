#include "core/CancelToken.hpp"
#include <algorithm>
#include <thread>

namespace chunkwire {

namespace {
    const std::chrono::milliseconds kPollSlice(50);
}

bool CancelToken::waitFor(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, kPollSlice));
    }
    return true;
}

} // namespace chunkwire
