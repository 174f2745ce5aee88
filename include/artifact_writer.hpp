#pragma once

#include "frame_source.hpp"
#include "keyframe_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace kfx {

class CancellationToken;

class ArtifactWriter {
public:
    // `image_format` is jpg, jpeg or png; throws std::invalid_argument otherwise
    ArtifactWriter(std::string output_dir, const std::string& image_format, int jpeg_quality = 95);

    // Writes one image per keyframe and records its path in `local_path`.
    // Pixels come from the retained decode output, or are decoded from
    // `source` by timestamp when none were retained.
    // Throws ArtifactError on the first failed write, CancellationRequested
    // when `cancel` fires between keyframes.
    void write_images(std::vector<Keyframe>& keyframes, FrameSource& source,
                      const CancellationToken& cancel) const;

    const std::string& output_dir() const { return output_dir_; }
    const std::string& extension() const { return extension_; }

    // keyframe_0001_0000005000.jpg: 1-based position, timestamp in ms
    static std::string build_output_filename(size_t position, double timestamp_s, const std::string& extension);
    static std::string normalize_image_format(const std::string& image_format);

private:
    std::string output_dir_;
    std::string extension_;
    int jpeg_quality_;
};

nlohmann::json keyframe_to_json(const Keyframe& keyframe);
nlohmann::json keyframes_to_json(const std::vector<Keyframe>& keyframes);

// Writes the manifest as an indented JSON array; throws ArtifactError
void write_manifest(const std::vector<Keyframe>& keyframes, const std::string& manifest_path);

} // namespace kfx
