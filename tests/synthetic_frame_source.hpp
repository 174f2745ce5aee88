#pragma once

#include "cancellation.hpp"
#include "frame_source.hpp"
#include <cmath>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/imgproc.hpp>

namespace kfx {
namespace testing_support {

using FrameGenerator = std::function<cv::Mat(int64_t index)>;

// Solid gray frame whose level is chosen per index
inline FrameGenerator solid_gray(std::function<int(int64_t)> level, cv::Size size = cv::Size(64, 48)) {
    return [level, size](int64_t index) {
        return cv::Mat(size, CV_8UC3, cv::Scalar::all(level(index)));
    };
}

// Static frames with one hard cut at `cut_index`
inline FrameGenerator single_cut(int64_t cut_index) {
    return solid_gray([cut_index](int64_t index) { return index < cut_index ? 50 : 200; });
}

// Brightness toggles every `period` frames
inline FrameGenerator periodic_cuts(int64_t period) {
    return solid_gray([period](int64_t index) { return (index / period) % 2 == 0 ? 40 : 210; });
}

// Deterministic smooth texture translated `pixels_per_frame` to the right each frame
inline FrameGenerator moving_texture(double pixels_per_frame, cv::Size size = cv::Size(128, 96)) {
    cv::Mat base(size.height, size.width + 256, CV_8UC1);
    cv::RNG rng(1234);
    rng.fill(base, cv::RNG::UNIFORM, 0, 255);
    cv::GaussianBlur(base, base, cv::Size(0, 0), 3.0);
    cv::normalize(base, base, 0, 255, cv::NORM_MINMAX);

    return [base, size, pixels_per_frame](int64_t index) {
        const double shift = std::fmod(index * pixels_per_frame, 200.0);
        cv::Mat m = (cv::Mat_<double>(2, 3) << 1, 0, -shift, 0, 1, 0);
        cv::Mat moved;
        cv::warpAffine(base, moved, m, base.size(), cv::INTER_LINEAR, cv::BORDER_REFLECT);
        cv::Mat bgr;
        cv::cvtColor(moved(cv::Rect(0, 0, size.width, size.height)), bgr, cv::COLOR_GRAY2BGR);
        return bgr;
    };
}

// In-memory FrameSource. Tracks how many decode sessions are open so tests
// can check that every session is released.
class SyntheticFrameSource : public FrameSource {
public:
    SyntheticFrameSource(int64_t frame_count, double fps, FrameGenerator generator,
                         std::vector<IndexEntry> index_frames = {})
        : frame_count_(frame_count)
        , fps_(fps)
        , generator_(std::move(generator))
        , index_frames_(std::move(index_frames))
        , open_sessions_(std::make_shared<int>(0)) {}

    // Every `period`-th frame declared as a container keyframe
    static std::vector<IndexEntry> index_every(int64_t period, int64_t frame_count, double fps) {
        std::vector<IndexEntry> entries;
        for (int64_t i = 0; i < frame_count; i += period) {
            entries.push_back(IndexEntry{i, static_cast<double>(i) / fps});
        }
        return entries;
    }

    void fail_decode_at(int64_t index) { fail_at_ = index; }
    void fail_open() { fail_open_ = true; }
    void on_frame(std::function<void(int64_t)> hook) { on_frame_ = std::move(hook); }

    int open_sessions() const { return *open_sessions_; }
    int sessions_opened() const { return sessions_opened_; }
    int probes() const { return probes_; }

    std::vector<IndexEntry> probe_keyframe_indices(const CancellationToken& cancel) override {
        ++probes_;
        if (fail_open_) throw SourceError("synthetic source cannot be opened");
        cancel.throw_if_cancelled("synthetic probe");
        return index_frames_;
    }

    std::unique_ptr<FrameStream> decode(int step, const CancellationToken& cancel) override {
        if (fail_open_) throw SourceError("synthetic source cannot be opened");
        ++sessions_opened_;
        return std::make_unique<Stream>(*this, step, cancel);
    }

    cv::Mat frame_at(double timestamp_s) override {
        return generator_(std::llround(timestamp_s * fps_));
    }

    VideoInfo info() override {
        VideoInfo info;
        info.total_frames = frame_count_;
        info.fps = fps_;
        info.duration_s = frame_count_ / fps_;
        info.frame_size = generator_(0).size();
        info.codec = "synthetic";
        return info;
    }

private:
    class Stream : public FrameStream {
    public:
        Stream(SyntheticFrameSource& owner, int step, const CancellationToken& cancel)
            : owner_(owner), step_(step), cancel_(cancel), open_sessions_(owner.open_sessions_) {
            ++*open_sessions_;
        }
        ~Stream() override { --*open_sessions_; }

        bool next(Frame& out) override {
            cancel_.throw_if_cancelled("synthetic decode");
            if (next_index_ >= owner_.frame_count_) return false;
            if (owner_.fail_at_ && next_index_ >= *owner_.fail_at_) {
                throw DecodeError("synthetic decode failure at frame " + std::to_string(next_index_));
            }
            if (owner_.on_frame_) owner_.on_frame_(next_index_);

            out.index = next_index_;
            out.timestamp_s = static_cast<double>(next_index_) / owner_.fps_;
            out.pixels = owner_.generator_(next_index_);
            next_index_ += step_;
            return true;
        }

    private:
        SyntheticFrameSource& owner_;
        int step_;
        const CancellationToken& cancel_;
        std::shared_ptr<int> open_sessions_;
        int64_t next_index_ = 0;
    };

    int64_t frame_count_;
    double fps_;
    FrameGenerator generator_;
    std::vector<IndexEntry> index_frames_;
    std::optional<int64_t> fail_at_;
    bool fail_open_ = false;
    std::function<void(int64_t)> on_frame_;

    std::shared_ptr<int> open_sessions_;
    int sessions_opened_ = 0;
    int probes_ = 0;
};

} // namespace testing_support
} // namespace kfx
