#pragma once

#include "frame_source.hpp"
#include "keyframe_detector.hpp"
#include "keyframe_types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace kfx {

class CancellationToken;

class KeyframeExtractor {
public:
    explicit KeyframeExtractor(const ExtractionConfig& config = {});
    ~KeyframeExtractor();

    // Probe only; no frames are decoded
    VideoInfo get_video_info(const std::string& input_path);

    // Resolves `input_path`, selects keyframes and writes the configured
    // artifacts. An empty result means no method found any keyframe.
    // Throws SourceError, ArtifactError, or CancellationRequested when the
    // run was cancelled or timed out.
    std::vector<Keyframe> extract(const std::string& input_path);
    std::vector<Keyframe> extract(const std::string& input_path, const CancellationToken& cancel);

    // Same, over an already opened source
    std::vector<Keyframe> extract(FrameSource& source, const CancellationToken& cancel);

    // Last run's orchestration record (attempts, terminal state)
    const DetectionResult& last_result() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace kfx
