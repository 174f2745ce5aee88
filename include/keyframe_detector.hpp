#pragma once

#include "frame_source.hpp"
#include "keyframe_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kfx {

class CancellationToken;

enum class RunState {
    Pending,
    Scoring,
    Selecting,
    Resolved,
    Exhausted,
    Cancelled
};

enum class AttemptOutcome {
    Selected,
    Empty,
    Unavailable,
    DecodeFailed,
    Cancelled
};

std::string run_state_name(RunState state);
std::string attempt_outcome_name(AttemptOutcome outcome);

struct MethodAttempt {
    Method method = Method::IFrame;
    AttemptOutcome outcome = AttemptOutcome::Empty;
    size_t candidates = 0;
    size_t keyframes = 0;
    std::string detail;
};

struct DetectionResult {
    RunState state = RunState::Pending;
    std::optional<Method> method;
    std::vector<Keyframe> keyframes;
    std::vector<MethodAttempt> attempts;

    bool resolved() const { return state == RunState::Resolved; }
    bool cancelled() const { return state == RunState::Cancelled; }
};

// Tries the configured methods in order against one FrameSource. The first
// method whose selection is non-empty wins; methods are never mixed.
// A method that is unavailable for the input or fails mid-decode counts as
// empty. SourceError other than DecodeError propagates to the caller.
class KeyframeDetector {
public:
    explicit KeyframeDetector(const ExtractionConfig& config);

    DetectionResult detect(FrameSource& source, const CancellationToken& cancel) const;

    const ExtractionConfig& config() const { return config_; }

private:
    MethodAttempt run_method(const MethodSpec& spec,
                             FrameSource& source,
                             const CancellationToken& cancel,
                             std::vector<Keyframe>& selected) const;

    ExtractionConfig config_;
};

} // namespace kfx
