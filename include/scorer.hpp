#pragma once

#include "frame_source.hpp"
#include "keyframe_types.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace kfx {

class CancellationToken;

// Receives candidates in time order; returning false stops the scorer
using CandidateSink = std::function<bool(Candidate&&)>;

class Scorer {
public:
    virtual ~Scorer() = default;

    virtual Method method() const = 0;

    // Runs one forward pass over `source`, feeding every examined frame to
    // `sink`. Any decode session opened here is closed before returning or
    // throwing.
    virtual void score(FrameSource& source, const CancellationToken& cancel, const CandidateSink& sink) = 0;
};

// Container keyframes, no pixel decode, no score.
// Throws MethodUnavailable when the container declares no keyframes.
class IFrameScorer : public Scorer {
public:
    Method method() const override { return Method::IFrame; }
    void score(FrameSource& source, const CancellationToken& cancel, const CandidateSink& sink) override;
};

// Base for methods that compare each sampled frame with the one before it
class FrameDeltaScorer : public Scorer {
public:
    explicit FrameDeltaScorer(int step = 1);

    void score(FrameSource& source, const CancellationToken& cancel, const CandidateSink& sink) override;

protected:
    // Score of `frame` against the previously sampled frame, or nothing for
    // the first frame of the pass
    virtual std::optional<double> score_frame(const Frame& frame) = 0;
    virtual void reset() = 0;

private:
    int step_;
};

// Mean absolute luma difference, 0..255
class DifferenceScorer : public FrameDeltaScorer {
public:
    Method method() const override { return Method::Difference; }

protected:
    std::optional<double> score_frame(const Frame& frame) override;
    void reset() override;

private:
    cv::Mat prev_gray_;
};

// Bhattacharyya distance between 64-bin luma histograms, 0..1
class HistogramScorer : public FrameDeltaScorer {
public:
    static constexpr int kBins = 64;

    Method method() const override { return Method::Histogram; }

protected:
    std::optional<double> score_frame(const Frame& frame) override;
    void reset() override;

private:
    cv::Mat prev_hist_;
};

// Mean Farneback flow magnitude in pixels between sampled frames
class OpticalFlowScorer : public FrameDeltaScorer {
public:
    explicit OpticalFlowScorer(int flow_step);

    Method method() const override { return Method::OpticalFlow; }

protected:
    std::optional<double> score_frame(const Frame& frame) override;
    void reset() override;

private:
    cv::Mat prev_gray_;
};

std::unique_ptr<Scorer> make_scorer(Method method, const ExtractionConfig& config);

} // namespace kfx
