#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kfx {

enum class Method {
    IFrame,
    Difference,
    Histogram,
    OpticalFlow
};

// Canonical names: "I_frame", "difference", "histogram", "optical_flow"
std::string method_name(Method method);
Method parse_method(const std::string& name);

// Comma-separated list, order preserved, empty entries skipped
std::vector<Method> parse_method_list(const std::string& list);

// Per-method default threshold; empty for I_frame
std::optional<double> default_threshold(Method method);

struct MethodSpec {
    Method method = Method::IFrame;
    std::optional<double> threshold;

    std::optional<double> effective_threshold() const;
};

struct Frame {
    int64_t index = 0;
    double timestamp_s = 0.0;
    cv::Mat pixels; // BGR
};

struct IndexEntry {
    int64_t frame_index = 0;
    double timestamp_s = 0.0;
};

struct Candidate {
    int64_t frame_index = 0;
    double timestamp_s = 0.0;
    Method method = Method::IFrame;
    std::optional<double> score;
    cv::Mat pixels; // empty when the scorer did not decode the frame
};

struct Keyframe {
    int64_t frame_index = 0;
    double timestamp_s = 0.0;
    Method method = Method::IFrame;
    std::optional<double> score;
    std::optional<std::string> local_path;

    // Not serialized. Retained decode output for the artifact writer.
    cv::Mat image;
};

struct VideoInfo {
    int64_t total_frames = 0;
    double fps = 0.0;
    double duration_s = 0.0;
    cv::Size frame_size;
    std::string codec;
};

struct ExtractionConfig {
    std::vector<Method> methods{Method::IFrame};
    std::optional<double> threshold;
    int max_keyframes = 20;
    double min_interval_s = 0.5;
    int flow_step = 2;

    std::optional<std::string> output_dir;
    std::string image_format = "jpg"; // jpg|jpeg|png
    std::optional<std::string> manifest_path;

    double timeout_s = 0.0; // 0 disables the deadline
    bool verbose = false;

    // Throws std::invalid_argument
    void validate() const;

    std::vector<MethodSpec> method_specs() const;
};

// Input cannot be opened or decoded
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A frame failed to decode after the session was opened
class DecodeError : public SourceError {
public:
    using SourceError::SourceError;
};

// The signal a method depends on is missing from the input
class MethodUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CancellationRequested : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ArtifactError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace kfx
