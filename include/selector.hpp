#pragma once

#include "keyframe_types.hpp"
#include <optional>
#include <vector>

namespace kfx {

enum class Verdict {
    Accepted,
    BelowThreshold,
    TooClose,
    Full
};

struct SelectorStats {
    size_t offered = 0;
    size_t below_threshold = 0;
    size_t too_close = 0;
};

// Greedy, order-preserving selection of keyframes from a time-ordered
// candidate stream:
//   - scored candidates below the threshold are rejected;
//   - candidates less than min_interval_s after the last accepted keyframe
//     are rejected (first seen wins);
//   - once max_keyframes are accepted the selector is full and every further
//     offer returns Verdict::Full.
class Selector {
public:
    Selector(std::optional<double> threshold, double min_interval_s, int max_keyframes);

    Verdict offer(Candidate&& candidate);

    bool full() const;
    const std::vector<Keyframe>& keyframes() const { return keyframes_; }
    std::vector<Keyframe> take();

    const SelectorStats& stats() const { return stats_; }

private:
    std::optional<double> threshold_;
    double min_interval_s_;
    size_t max_keyframes_;
    std::vector<Keyframe> keyframes_;
    SelectorStats stats_;
};

} // namespace kfx
