#include "scorer.hpp"
#include "cancellation.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/video/tracking.hpp>

namespace kfx {

namespace {

cv::Mat to_luma(const cv::Mat& bgr) {
    if (bgr.channels() == 1) return bgr;
    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    return gray;
}

} // namespace

void IFrameScorer::score(FrameSource& source, const CancellationToken& cancel, const CandidateSink& sink) {
    const std::vector<IndexEntry> entries = source.probe_keyframe_indices(cancel);
    if (entries.empty()) {
        throw MethodUnavailable("Container declares no keyframes");
    }

    for (const auto& entry : entries) {
        cancel.throw_if_cancelled("I_frame selection");

        Candidate candidate;
        candidate.frame_index = entry.frame_index;
        candidate.timestamp_s = entry.timestamp_s;
        candidate.method = Method::IFrame;
        if (!sink(std::move(candidate))) break;
    }
}

FrameDeltaScorer::FrameDeltaScorer(int step) : step_(step) {
    if (step_ <= 0) {
        throw std::invalid_argument("frame step must be positive");
    }
}

void FrameDeltaScorer::score(FrameSource& source, const CancellationToken& cancel, const CandidateSink& sink) {
    reset();
    std::unique_ptr<FrameStream> stream = source.decode(step_, cancel);

    Frame frame;
    while (stream->next(frame)) {
        std::optional<double> value = score_frame(frame);
        if (!value) continue;

        Candidate candidate;
        candidate.frame_index = frame.index;
        candidate.timestamp_s = frame.timestamp_s;
        candidate.method = method();
        candidate.score = value;
        candidate.pixels = std::move(frame.pixels);
        if (!sink(std::move(candidate))) break;
    }
    reset();
}

std::optional<double> DifferenceScorer::score_frame(const Frame& frame) {
    cv::Mat gray = to_luma(frame.pixels);

    std::optional<double> score;
    if (!prev_gray_.empty() && prev_gray_.size() == gray.size()) {
        cv::Mat diff;
        cv::absdiff(gray, prev_gray_, diff);
        score = cv::mean(diff)[0];
    }
    prev_gray_ = gray;
    return score;
}

void DifferenceScorer::reset() {
    prev_gray_.release();
}

std::optional<double> HistogramScorer::score_frame(const Frame& frame) {
    cv::Mat gray = to_luma(frame.pixels);

    const int channels[] = {0};
    const int hist_size[] = {kBins};
    const float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};

    cv::Mat hist;
    cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, hist_size, ranges);
    cv::normalize(hist, hist);

    std::optional<double> score;
    if (!prev_hist_.empty()) {
        score = cv::compareHist(prev_hist_, hist, cv::HISTCMP_BHATTACHARYYA);
    }
    prev_hist_ = hist;
    return score;
}

void HistogramScorer::reset() {
    prev_hist_.release();
}

OpticalFlowScorer::OpticalFlowScorer(int flow_step) : FrameDeltaScorer(flow_step) {}

std::optional<double> OpticalFlowScorer::score_frame(const Frame& frame) {
    cv::Mat gray = to_luma(frame.pixels);

    std::optional<double> score;
    if (!prev_gray_.empty() && prev_gray_.size() == gray.size()) {
        cv::Mat flow;
        cv::calcOpticalFlowFarneback(prev_gray_, gray, flow,
                                     0.5,   // pyr_scale
                                     3,     // levels
                                     15,    // winsize
                                     3,     // iterations
                                     5,     // poly_n
                                     1.2,   // poly_sigma
                                     0);

        cv::Mat components[2];
        cv::split(flow, components);
        cv::Mat magnitude, angle;
        cv::cartToPolar(components[0], components[1], magnitude, angle);
        score = cv::mean(magnitude)[0];
    }
    prev_gray_ = gray;
    return score;
}

void OpticalFlowScorer::reset() {
    prev_gray_.release();
}

std::unique_ptr<Scorer> make_scorer(Method method, const ExtractionConfig& config) {
    switch (method) {
        case Method::IFrame:
            return std::make_unique<IFrameScorer>();
        case Method::Difference:
            return std::make_unique<DifferenceScorer>();
        case Method::Histogram:
            return std::make_unique<HistogramScorer>();
        case Method::OpticalFlow:
            return std::make_unique<OpticalFlowScorer>(config.flow_step);
    }
    throw std::invalid_argument("Unsupported method: " + method_name(method));
}

} // namespace kfx
