#include "video_file_source.hpp"
#include "cancellation.hpp"
#include "container_index.hpp"
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <stdexcept>

namespace kfx {

namespace {

constexpr double kFallbackFps = 30.0;

// Containers that estimate their frame count from the duration can overshoot
constexpr int64_t kFrameCountSlack = 2;

std::string fourcc_to_string(int fourcc) {
    char codec_chars[5];
    codec_chars[0] = static_cast<char>(fourcc & 0xFF);
    codec_chars[1] = static_cast<char>((fourcc >> 8) & 0xFF);
    codec_chars[2] = static_cast<char>((fourcc >> 16) & 0xFF);
    codec_chars[3] = static_cast<char>((fourcc >> 24) & 0xFF);
    codec_chars[4] = '\0';
    return std::string(codec_chars);
}

class VideoCaptureStream : public FrameStream {
public:
    VideoCaptureStream(const std::string& uri, double fps, int64_t total_frames, int step,
                       const CancellationToken& cancel)
        : uri_(uri), fps_(fps), total_frames_(total_frames), step_(step), cancel_(cancel) {
        if (!cap_.open(uri_)) {
            throw SourceError("Failed to open video: " + uri_);
        }
    }

    ~VideoCaptureStream() override {
        cap_.release();
    }

    bool next(Frame& out) override {
        while (true) {
            cancel_.throw_if_cancelled("decode of " + uri_);

            const int64_t index = next_index_;
            if (index % step_ != 0) {
                // Skipped frames are demuxed and decoded but never converted
                if (!cap_.grab()) return end_of_stream(index);
                ++next_index_;
                continue;
            }

            cv::Mat frame;
            if (!cap_.read(frame) || frame.empty()) return end_of_stream(index);
            ++next_index_;

            out.index = index;
            out.timestamp_s = static_cast<double>(index) / fps_;
            out.pixels = frame;
            return true;
        }
    }

private:
    // A failed grab is the end of the stream only once the container's
    // frame count is reached, give or take kFrameCountSlack
    bool end_of_stream(int64_t index) {
        if (index == 0) {
            throw DecodeError("No decodable frames in " + uri_);
        }
        if (total_frames_ > 0) {
            const int64_t slack = std::max<int64_t>(kFrameCountSlack, total_frames_ / 100);
            if (index < total_frames_ - slack) {
                throw DecodeError("Frame " + std::to_string(index) + " of " + std::to_string(total_frames_) +
                                  " failed to decode in " + uri_);
            }
        }
        return false;
    }

    std::string uri_;
    double fps_;
    int64_t total_frames_;
    int step_;
    const CancellationToken& cancel_;
    cv::VideoCapture cap_;
    int64_t next_index_ = 0;
};

} // namespace

class VideoFileSource::Impl {
public:
    explicit Impl(const std::string& uri) : uri_(uri) {
        cv::VideoCapture cap(uri_);
        if (!cap.isOpened()) {
            throw SourceError("Cannot open video file: " + uri_);
        }

        info_.total_frames = static_cast<int64_t>(cap.get(cv::CAP_PROP_FRAME_COUNT));
        info_.fps = cap.get(cv::CAP_PROP_FPS);
        if (!(info_.fps > 0.0)) {
            info_.fps = kFallbackFps;
        }
        info_.duration_s = info_.total_frames > 0 ? info_.total_frames / info_.fps : 0.0;
        info_.frame_size = cv::Size(
            static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
            static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT))
        );
        info_.codec = fourcc_to_string(static_cast<int>(cap.get(cv::CAP_PROP_FOURCC)));
    }

    std::vector<IndexEntry> probe_keyframe_indices(const CancellationToken& cancel) {
        return read_container_keyframes(uri_, info_.fps, cancel);
    }

    std::unique_ptr<FrameStream> decode(int step, const CancellationToken& cancel) {
        if (step <= 0) {
            throw std::invalid_argument("decode step must be positive");
        }
        return std::make_unique<VideoCaptureStream>(uri_, info_.fps, info_.total_frames, step, cancel);
    }

    cv::Mat frame_at(double timestamp_s) {
        cv::VideoCapture cap(uri_);
        if (!cap.isOpened()) {
            throw SourceError("Cannot reopen video for seeking: " + uri_);
        }
        cap.set(cv::CAP_PROP_POS_MSEC, timestamp_s * 1000.0);

        cv::Mat frame;
        if (!cap.read(frame) || frame.empty()) {
            throw DecodeError("Failed to decode frame at " + std::to_string(timestamp_s) + "s in " + uri_);
        }
        return frame;
    }

    const VideoInfo& info() const { return info_; }
    const std::string& uri() const { return uri_; }

private:
    std::string uri_;
    VideoInfo info_;
};

VideoFileSource::VideoFileSource(const std::string& uri)
    : pimpl_(std::make_unique<Impl>(uri)) {}

VideoFileSource::~VideoFileSource() = default;

std::vector<IndexEntry> VideoFileSource::probe_keyframe_indices(const CancellationToken& cancel) {
    return pimpl_->probe_keyframe_indices(cancel);
}

std::unique_ptr<FrameStream> VideoFileSource::decode(int step, const CancellationToken& cancel) {
    return pimpl_->decode(step, cancel);
}

cv::Mat VideoFileSource::frame_at(double timestamp_s) {
    return pimpl_->frame_at(timestamp_s);
}

VideoInfo VideoFileSource::info() {
    return pimpl_->info();
}

const std::string& VideoFileSource::uri() const {
    return pimpl_->uri();
}

} // namespace kfx
