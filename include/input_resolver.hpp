#pragma once

#include <string>

namespace kfx {

enum class InputKind {
    LocalFile,
    HttpUrl
};

struct ResolvedInput {
    std::string uri;
    InputKind kind = InputKind::LocalFile;
};

bool is_http_url(const std::string& path);
bool is_s3_url(const std::string& path);

// Local paths must name an existing regular file. HTTP(S) URLs are handed to
// the decoders as-is. Throws SourceError for anything else.
ResolvedInput resolve_input(const std::string& input_path);

} // namespace kfx
