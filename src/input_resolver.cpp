#include "input_resolver.hpp"
#include "keyframe_types.hpp"
#include <cctype>
#include <filesystem>

namespace kfx {

namespace {

bool has_scheme(const std::string& path, const std::string& scheme) {
    const std::string prefix = scheme + "://";
    if (path.size() <= prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(path[i])) != prefix[i]) return false;
    }
    return true;
}

} // namespace

bool is_http_url(const std::string& path) {
    return has_scheme(path, "http") || has_scheme(path, "https");
}

bool is_s3_url(const std::string& path) {
    return has_scheme(path, "s3");
}

ResolvedInput resolve_input(const std::string& input_path) {
    if (input_path.empty()) {
        throw SourceError("Input path is empty");
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(input_path, ec)) {
        return ResolvedInput{input_path, InputKind::LocalFile};
    }
    if (is_http_url(input_path)) {
        return ResolvedInput{input_path, InputKind::HttpUrl};
    }
    if (is_s3_url(input_path)) {
        throw SourceError("Object-store inputs are not supported: " + input_path);
    }
    throw SourceError("Unsupported input path: " + input_path);
}

} // namespace kfx
