#pragma once

#include <atomic>

namespace digitloom {

// Cooperative stop flag shared between the caller and a running generation.
// Checked per digit by the spigot streamer and per merge by binary splitting.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool is_cancelled(const CancellationToken* token) {
    return token && token->cancelled();
}

} // namespace digitloom
