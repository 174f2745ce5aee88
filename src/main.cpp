#include "artifact_writer.hpp"
#include "cancellation.hpp"
#include "keyframe_extractor.hpp"
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr int kExitError = 1;
constexpr int kExitCancelled = 2;

kfx::CancellationToken* g_cancel = nullptr;

void handle_signal(int) {
    if (g_cancel) g_cancel->cancel();
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT\n"
              << "Extract keyframes (I_frame/difference/histogram/optical_flow) to images.\n"
              << "INPUT is a local video path or an http(s):// URL.\n"
              << "Options:\n"
              << "  -m, --method LIST      Method or comma-separated list, first non-empty wins\n"
              << "                         (I_frame, difference, histogram, optical_flow; default: I_frame)\n"
              << "  -t, --threshold F      Score threshold for non-I_frame methods\n"
              << "  -n, --max-keyframes N  Maximum number of keyframes (default: 20)\n"
              << "  --min-interval-s F     Minimum seconds between keyframes (default: 0.5)\n"
              << "  -o, --output-dir DIR   Directory to write images\n"
              << "  --image-format FMT     jpg or png (default: jpg)\n"
              << "  --manifest FILE        Write a JSON manifest\n"
              << "  --flow-step N          For optical_flow, compare every Nth frame (default: 2)\n"
              << "  --timeout-s F          Abort the run after F seconds\n"
              << "  --info                 Show video information only\n"
              << "  -v, --verbose          Log progress to stderr\n"
              << "  -h, --help             Show this help\n";
}

bool take_value(int argc, char* argv[], int& i, std::string& out) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << argv[i] << " requires a value\n";
        return false;
    }
    out = argv[++i];
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return kExitError;
    }

    kfx::ExtractionConfig config;
    std::string input_path;
    bool info_only = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string value;

            if (arg == "-m" || arg == "--method") {
                if (!take_value(argc, argv, i, value)) return kExitError;
                config.methods = kfx::parse_method_list(value);
            } else if (arg == "-t" || arg == "--threshold") {
                if (!take_value(argc, argv, i, value)) return kExitError;
                config.threshold = std::stod(value);
            } else if (arg == "-n" || arg == "--max-keyframes") {
                if (!take_value(argc, argv, i, value)) return kExitError;
                config.max_keyframes = std::stoi(value);
            } else if (arg == "--min-interval-s") {
                if (!take_value(argc, argv, i, value)) return kExitError;
                config.min_interval_s = std::stod(value);
            } else if (arg == "-o" || arg == "--output-dir") {
                if (!take_value(argc, argv, i, value)) return kExitError;
                config.output_dir = value;
            } else if (arg == "--image-format") {
                if (!take_value(argc, argv, i, value)) return kExitError;
                config.image_format = value;
            } else if (arg == "--manifest") {
                if (!take_value(argc, argv, i, value)) return kExitError;
                config.manifest_path = value;
            } else if (arg == "--flow-step") {
                if (!take_value(argc, argv, i, value)) return kExitError;
                config.flow_step = std::stoi(value);
            } else if (arg == "--timeout-s") {
                if (!take_value(argc, argv, i, value)) return kExitError;
                config.timeout_s = std::stod(value);
            } else if (arg == "--info") {
                info_only = true;
            } else if (arg == "-v" || arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Error: Unknown option '" << arg << "'\n";
                return kExitError;
            } else if (input_path.empty()) {
                input_path = arg;
            } else {
                std::cerr << "Error: Unexpected argument '" << arg << "'\n";
                return kExitError;
            }
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }

    if (input_path.empty()) {
        std::cerr << "Error: No input path provided\n";
        return kExitError;
    }

    kfx::CancellationToken cancel = kfx::CancellationToken::with_timeout_seconds(config.timeout_s);
    g_cancel = &cancel;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        kfx::KeyframeExtractor extractor(config);

        if (info_only) {
            auto info = extractor.get_video_info(input_path);

            json info_json;
            info_json["input_path"] = input_path;
            info_json["total_frames"] = info.total_frames;
            info_json["fps"] = info.fps;
            info_json["duration_s"] = info.duration_s;
            info_json["frame_size"] = {info.frame_size.width, info.frame_size.height};
            info_json["codec"] = info.codec;

            std::cout << info_json.dump(2) << std::endl;
            return 0;
        }

        auto keyframes = extractor.extract(input_path, cancel);
        std::cout << kfx::keyframes_to_json(keyframes).dump(2) << std::endl;

    } catch (const kfx::CancellationRequested& e) {
        std::cerr << "Cancelled: " << e.what() << std::endl;
        return kExitCancelled;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }

    return 0;
}
