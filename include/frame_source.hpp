#pragma once

#include "keyframe_types.hpp"
#include <memory>
#include <vector>

namespace kfx {

class CancellationToken;

// One forward-only decode session. The session's decoder handle is owned by
// the stream and released when the stream is destroyed.
class FrameStream {
public:
    virtual ~FrameStream() = default;

    // Fills `out` with the next sampled frame; false at end of stream.
    // Throws DecodeError if decoding fails mid-stream.
    virtual bool next(Frame& out) = 0;
};

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Container keyframes in timestamp order, without pixel decode
    virtual std::vector<IndexEntry> probe_keyframe_indices(const CancellationToken& cancel) = 0;

    // Opens a new decode session yielding every `step`-th frame
    virtual std::unique_ptr<FrameStream> decode(int step, const CancellationToken& cancel) = 0;

    // Seeks to and decodes the frame shown at `timestamp_s`
    virtual cv::Mat frame_at(double timestamp_s) = 0;

    virtual VideoInfo info() = 0;
};

} // namespace kfx
