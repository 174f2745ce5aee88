#pragma once

#include "keyframe_types.hpp"
#include <string>
#include <vector>

namespace kfx {

class CancellationToken;

// Demuxes the best video stream of `uri` and returns the packets the
// container flags as keyframes, sorted by presentation time. Frame indices
// are derived from the timestamp and `fps`; when `fps` is not positive the
// stream's average frame rate is used.
//
// Throws SourceError if the container cannot be opened or has no video
// stream, CancellationRequested if `cancel` fires while demuxing.
std::vector<IndexEntry> read_container_keyframes(const std::string& uri,
                                                 double fps,
                                                 const CancellationToken& cancel);

} // namespace kfx
