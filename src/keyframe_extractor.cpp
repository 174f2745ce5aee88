#include "keyframe_extractor.hpp"
#include "artifact_writer.hpp"
#include "cancellation.hpp"
#include "input_resolver.hpp"
#include "video_file_source.hpp"
#include <chrono>
#include <iostream>

namespace kfx {

class KeyframeExtractor::Impl {
public:
    explicit Impl(const ExtractionConfig& config)
        : config_(config)
        , detector_(config) {
        if (config_.verbose) {
            std::cerr << "KeyframeExtractor initialized with:" << std::endl;
            std::cerr << "  Methods: ";
            for (size_t i = 0; i < config_.methods.size(); ++i) {
                std::cerr << (i ? "," : "") << method_name(config_.methods[i]);
            }
            std::cerr << std::endl;
            std::cerr << "  Threshold: ";
            if (config_.threshold) std::cerr << *config_.threshold;
            else std::cerr << "per-method default";
            std::cerr << std::endl;
            std::cerr << "  Max keyframes: " << config_.max_keyframes << std::endl;
            std::cerr << "  Min interval: " << config_.min_interval_s << "s" << std::endl;
            std::cerr << "  Flow step: " << config_.flow_step << std::endl;
        }
    }

    VideoInfo get_video_info(const std::string& input_path) {
        const ResolvedInput input = resolve_input(input_path);
        VideoFileSource source(input.uri);
        return source.info();
    }

    std::vector<Keyframe> extract(const std::string& input_path, const CancellationToken& cancel) {
        const ResolvedInput input = resolve_input(input_path);
        VideoFileSource source(input.uri);

        if (config_.verbose) {
            const VideoInfo info = source.info();
            std::cerr << "Extracting keyframes from " << input.uri
                      << " (frames: " << info.total_frames
                      << ", fps: " << info.fps
                      << ", size: " << info.frame_size.width << "x" << info.frame_size.height << ")"
                      << std::endl;
        }
        return extract(source, cancel);
    }

    std::vector<Keyframe> extract(FrameSource& source, const CancellationToken& cancel) {
        auto start_time = std::chrono::steady_clock::now();

        last_result_ = detector_.detect(source, cancel);
        if (last_result_.cancelled()) {
            throw CancellationRequested("Keyframe extraction cancelled before any method completed");
        }

        std::vector<Keyframe> keyframes = std::move(last_result_.keyframes);
        last_result_.keyframes.clear();

        // An exhausted run leaves no artifacts behind
        if (!keyframes.empty()) {
            if (config_.output_dir) {
                ArtifactWriter writer(*config_.output_dir, config_.image_format);
                writer.write_images(keyframes, source, cancel);
            }
            if (config_.manifest_path) {
                write_manifest(keyframes, *config_.manifest_path);
            }
        }

        if (config_.verbose) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
            std::cerr << "Selected " << keyframes.size() << " keyframes in "
                      << elapsed.count() << "ms" << std::endl;
        }

        // Decoded pixels are not part of the result
        for (auto& kf : keyframes) {
            kf.image.release();
        }
        return keyframes;
    }

    const DetectionResult& last_result() const { return last_result_; }
    const ExtractionConfig& config() const { return config_; }

private:
    ExtractionConfig config_;
    KeyframeDetector detector_;
    DetectionResult last_result_;
};

KeyframeExtractor::KeyframeExtractor(const ExtractionConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

KeyframeExtractor::~KeyframeExtractor() = default;

VideoInfo KeyframeExtractor::get_video_info(const std::string& input_path) {
    return pimpl_->get_video_info(input_path);
}

std::vector<Keyframe> KeyframeExtractor::extract(const std::string& input_path) {
    const CancellationToken cancel = CancellationToken::with_timeout_seconds(pimpl_->config().timeout_s);
    return pimpl_->extract(input_path, cancel);
}

std::vector<Keyframe> KeyframeExtractor::extract(const std::string& input_path, const CancellationToken& cancel) {
    return pimpl_->extract(input_path, cancel);
}

std::vector<Keyframe> KeyframeExtractor::extract(FrameSource& source, const CancellationToken& cancel) {
    return pimpl_->extract(source, cancel);
}

const DetectionResult& KeyframeExtractor::last_result() const {
    return pimpl_->last_result();
}

} // namespace kfx
