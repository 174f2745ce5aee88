#pragma once

#include "frame_source.hpp"
#include <memory>
#include <string>

namespace kfx {

// FrameSource over a local file or HTTP(S) URL. Pixel decode goes through
// cv::VideoCapture; the keyframe index is read from the container with
// libavformat.
class VideoFileSource : public FrameSource {
public:
    // Throws SourceError if the input cannot be opened as a video
    explicit VideoFileSource(const std::string& uri);
    ~VideoFileSource() override;

    std::vector<IndexEntry> probe_keyframe_indices(const CancellationToken& cancel) override;
    std::unique_ptr<FrameStream> decode(int step, const CancellationToken& cancel) override;
    cv::Mat frame_at(double timestamp_s) override;
    VideoInfo info() override;

    const std::string& uri() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace kfx
