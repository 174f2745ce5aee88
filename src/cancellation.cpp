#include "cancellation.hpp"
#include "keyframe_types.hpp"
#include <algorithm>

namespace kfx {

namespace {

constexpr double kMaxTimeoutSeconds = 30.0 * 24.0 * 3600.0;

} // namespace

CancellationToken::CancellationToken(std::chrono::milliseconds timeout)
    : deadline_(Clock::now() + timeout) {}

CancellationToken CancellationToken::with_timeout_seconds(double seconds) {
    if (!(seconds > 0.0)) {
        return CancellationToken();
    }
    // Keeps now() + timeout far from the clock's range
    const double bounded = std::min(seconds, kMaxTimeoutSeconds);
    return CancellationToken(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(bounded)));
}

void CancellationToken::cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
}

bool CancellationToken::is_cancelled() const noexcept {
    if (cancelled_.load(std::memory_order_acquire)) return true;
    return deadline_ && Clock::now() >= *deadline_;
}

void CancellationToken::throw_if_cancelled(const std::string& stage) const {
    if (is_cancelled()) {
        throw CancellationRequested("Cancelled during " + stage);
    }
}

} // namespace kfx
