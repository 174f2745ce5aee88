#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace kfx {

// Cooperative cancel flag with an optional deadline. Decode loops poll it
// between frames; the container probe polls it from the demuxer's
// interrupt callback.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    explicit CancellationToken(std::chrono::milliseconds timeout);

    // No deadline for seconds <= 0; deadlines past 30 days are clamped
    static CancellationToken with_timeout_seconds(double seconds);

    void cancel() noexcept;
    bool is_cancelled() const noexcept;

    // Throws CancellationRequested naming the stage that was interrupted
    void throw_if_cancelled(const std::string& stage) const;

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace kfx
