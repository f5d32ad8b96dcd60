#include "utils/shutdown_token.hpp"

#include <algorithm>
#include <thread>

namespace shutdown_token {

bool ShutdownToken::sleep_for(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!is_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kPollInterval));
    }
    return true;
}

} // namespace shutdown_token
