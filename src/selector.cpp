#include "selector.hpp"
#include <stdexcept>

namespace kfx {

Selector::Selector(std::optional<double> threshold, double min_interval_s, int max_keyframes)
    : threshold_(threshold)
    , min_interval_s_(min_interval_s)
    , max_keyframes_(static_cast<size_t>(max_keyframes > 0 ? max_keyframes : 0)) {
    if (max_keyframes <= 0) {
        throw std::invalid_argument("max_keyframes must be positive");
    }
    if (!(min_interval_s >= 0.0)) {
        throw std::invalid_argument("min_interval_s must be non-negative");
    }
    keyframes_.reserve(max_keyframes_);
}

Verdict Selector::offer(Candidate&& candidate) {
    if (full()) {
        return Verdict::Full;
    }
    ++stats_.offered;

    if (threshold_ && candidate.score && *candidate.score < *threshold_) {
        ++stats_.below_threshold;
        return Verdict::BelowThreshold;
    }

    if (!keyframes_.empty()) {
        const double last_ts = keyframes_.back().timestamp_s;
        if (candidate.timestamp_s <= last_ts || candidate.timestamp_s - last_ts < min_interval_s_) {
            ++stats_.too_close;
            return Verdict::TooClose;
        }
    }

    Keyframe keyframe;
    keyframe.frame_index = candidate.frame_index;
    keyframe.timestamp_s = candidate.timestamp_s;
    keyframe.method = candidate.method;
    keyframe.score = candidate.score;
    keyframe.image = std::move(candidate.pixels);
    keyframes_.push_back(std::move(keyframe));

    return Verdict::Accepted;
}

bool Selector::full() const {
    return keyframes_.size() >= max_keyframes_;
}

std::vector<Keyframe> Selector::take() {
    std::vector<Keyframe> out;
    out.swap(keyframes_);
    return out;
}

} // namespace kfx
