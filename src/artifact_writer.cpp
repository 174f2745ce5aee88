#include "artifact_writer.hpp"
#include "cancellation.hpp"
#include <opencv2/imgcodecs.hpp>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace kfx {

ArtifactWriter::ArtifactWriter(std::string output_dir, const std::string& image_format, int jpeg_quality)
    : output_dir_(std::move(output_dir))
    , extension_(normalize_image_format(image_format))
    , jpeg_quality_(jpeg_quality) {}

std::string ArtifactWriter::normalize_image_format(const std::string& image_format) {
    std::string ext = image_format;
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (ext == "jpeg") ext = "jpg";
    if (ext != "jpg" && ext != "png") {
        throw std::invalid_argument("Unsupported image_format: " + image_format);
    }
    return ext;
}

std::string ArtifactWriter::build_output_filename(size_t position, double timestamp_s, const std::string& extension) {
    const long long ts_ms = std::llround(timestamp_s * 1000.0);

    std::ostringstream name;
    name << "keyframe_"
         << std::setw(4) << std::setfill('0') << position << "_"
         << std::setw(10) << std::setfill('0') << ts_ms
         << "." << extension;
    return name.str();
}

void ArtifactWriter::write_images(std::vector<Keyframe>& keyframes, FrameSource& source,
                                  const CancellationToken& cancel) const {
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        throw ArtifactError("Cannot create output directory " + output_dir_ + ": " + ec.message());
    }

    std::vector<int> params;
    if (extension_ == "jpg") {
        params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};
    }

    for (size_t i = 0; i < keyframes.size(); ++i) {
        cancel.throw_if_cancelled("image writing");

        Keyframe& kf = keyframes[i];
        const std::string path =
            (fs::path(output_dir_) / build_output_filename(i + 1, kf.timestamp_s, extension_)).string();

        try {
            cv::Mat image = kf.image.empty() ? source.frame_at(kf.timestamp_s) : kf.image;
            if (!cv::imwrite(path, image, params)) {
                throw ArtifactError("imwrite returned false");
            }
        } catch (const ArtifactError& e) {
            throw ArtifactError("Failed to write " + path + ": " + e.what());
        } catch (const SourceError& e) {
            throw ArtifactError("Failed to decode frame for " + path + ": " + e.what());
        } catch (const cv::Exception& e) {
            throw ArtifactError("Failed to write " + path + ": " + e.what());
        }

        kf.local_path = path;
    }
}

json keyframe_to_json(const Keyframe& keyframe) {
    json j;
    j["frame_index"] = keyframe.frame_index;
    j["timestamp_s"] = keyframe.timestamp_s;
    j["method"] = method_name(keyframe.method);
    j["score"] = keyframe.score ? json(*keyframe.score) : json(nullptr);
    j["local_path"] = keyframe.local_path ? json(*keyframe.local_path) : json(nullptr);
    return j;
}

json keyframes_to_json(const std::vector<Keyframe>& keyframes) {
    json out = json::array();
    for (const auto& kf : keyframes) {
        out.push_back(keyframe_to_json(kf));
    }
    return out;
}

void write_manifest(const std::vector<Keyframe>& keyframes, const std::string& manifest_path) {
    const fs::path path(manifest_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ArtifactError("Cannot create manifest directory for " + manifest_path + ": " + ec.message());
        }
    }

    std::ofstream file(manifest_path);
    if (!file.is_open()) {
        throw ArtifactError("Cannot open manifest for writing: " + manifest_path);
    }
    file << keyframes_to_json(keyframes).dump(2) << "\n";
    if (!file) {
        throw ArtifactError("Failed to write manifest: " + manifest_path);
    }
}

} // namespace kfx
