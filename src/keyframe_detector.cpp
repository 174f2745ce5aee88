#include "keyframe_detector.hpp"
#include "cancellation.hpp"
#include "scorer.hpp"
#include "selector.hpp"
#include <opencv2/core.hpp>
#include <iostream>

namespace kfx {

std::string run_state_name(RunState state) {
    switch (state) {
        case RunState::Pending: return "pending";
        case RunState::Scoring: return "scoring";
        case RunState::Selecting: return "selecting";
        case RunState::Resolved: return "resolved";
        case RunState::Exhausted: return "exhausted";
        case RunState::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string attempt_outcome_name(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::Selected: return "selected";
        case AttemptOutcome::Empty: return "empty";
        case AttemptOutcome::Unavailable: return "unavailable";
        case AttemptOutcome::DecodeFailed: return "decode_failed";
        case AttemptOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

KeyframeDetector::KeyframeDetector(const ExtractionConfig& config) : config_(config) {
    config_.validate();
}

DetectionResult KeyframeDetector::detect(FrameSource& source, const CancellationToken& cancel) const {
    const std::vector<MethodSpec> specs = config_.method_specs();

    DetectionResult result;
    std::vector<Keyframe> selected;
    size_t current = 0;

    while (true) {
        switch (result.state) {
            case RunState::Pending:
                result.state = specs.empty() ? RunState::Exhausted : RunState::Scoring;
                break;

            case RunState::Scoring: {
                selected.clear();
                MethodAttempt attempt = run_method(specs[current], source, cancel, selected);
                const bool cancelled = attempt.outcome == AttemptOutcome::Cancelled;
                result.attempts.push_back(std::move(attempt));
                result.state = cancelled ? RunState::Cancelled : RunState::Selecting;
                break;
            }

            case RunState::Selecting:
                if (!selected.empty()) {
                    result.method = specs[current].method;
                    result.keyframes = std::move(selected);
                    result.state = RunState::Resolved;
                } else if (++current < specs.size()) {
                    result.state = RunState::Scoring;
                } else {
                    result.state = RunState::Exhausted;
                }
                break;

            case RunState::Resolved:
            case RunState::Exhausted:
            case RunState::Cancelled:
                if (config_.verbose) {
                    std::cerr << "[KeyframeDetector] Run " << run_state_name(result.state);
                    if (result.method) {
                        std::cerr << " with " << method_name(*result.method)
                                  << " (" << result.keyframes.size() << " keyframes)";
                    }
                    std::cerr << std::endl;
                }
                return result;
        }
    }
}

MethodAttempt KeyframeDetector::run_method(const MethodSpec& spec,
                                           FrameSource& source,
                                           const CancellationToken& cancel,
                                           std::vector<Keyframe>& selected) const {
    MethodAttempt attempt;
    attempt.method = spec.method;

    std::unique_ptr<Scorer> scorer = make_scorer(spec.method, config_);
    Selector selector(spec.effective_threshold(), config_.min_interval_s, config_.max_keyframes);

    if (config_.verbose) {
        std::cerr << "[KeyframeDetector] Trying " << method_name(spec.method);
        if (auto threshold = spec.effective_threshold()) {
            std::cerr << " (threshold " << *threshold << ")";
        }
        std::cerr << std::endl;
    }

    try {
        scorer->score(source, cancel, [&](Candidate&& candidate) {
            ++attempt.candidates;
            selector.offer(std::move(candidate));
            return !selector.full();
        });
    } catch (const MethodUnavailable& e) {
        attempt.outcome = AttemptOutcome::Unavailable;
        attempt.detail = e.what();
    } catch (const DecodeError& e) {
        attempt.outcome = AttemptOutcome::DecodeFailed;
        attempt.detail = e.what();
    } catch (const cv::Exception& e) {
        attempt.outcome = AttemptOutcome::DecodeFailed;
        attempt.detail = e.what();
    } catch (const CancellationRequested& e) {
        attempt.outcome = AttemptOutcome::Cancelled;
        attempt.detail = e.what();
    }

    if (attempt.outcome != AttemptOutcome::Empty) {
        std::cerr << "[KeyframeDetector] " << method_name(spec.method) << " "
                  << attempt_outcome_name(attempt.outcome) << ": " << attempt.detail << std::endl;
        return attempt;
    }

    selected = selector.take();
    attempt.keyframes = selected.size();
    attempt.outcome = selected.empty() ? AttemptOutcome::Empty : AttemptOutcome::Selected;

    if (config_.verbose) {
        const SelectorStats& stats = selector.stats();
        std::cerr << "[KeyframeDetector] " << method_name(spec.method) << ": "
                  << attempt.candidates << " candidates, "
                  << stats.below_threshold << " below threshold, "
                  << stats.too_close << " too close, "
                  << attempt.keyframes << " kept" << std::endl;
    }
    return attempt;
}

} // namespace kfx
