#include "container_index.hpp"
#include "cancellation.hpp"
#include <algorithm>
#include <cmath>
#include <memory>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

namespace kfx {

namespace {

// FFmpeg interrupt callback: return non-zero to abort I/O.
int interrupt_callback(void* opaque) {
    const auto* cancel = static_cast<const CancellationToken*>(opaque);
    return cancel->is_cancelled() ? 1 : 0;
}

std::string av_error_string(int err) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(err, errbuf, sizeof(errbuf));
    return errbuf;
}

struct FormatContextDeleter {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};

struct PacketDeleter {
    void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};

struct ScopedPacketUnref {
    explicit ScopedPacketUnref(AVPacket* pkt) : pkt_(pkt) {}
    ~ScopedPacketUnref() { av_packet_unref(pkt_); }
    AVPacket* pkt_;
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;

FormatContextPtr open_format(const std::string& uri, const CancellationToken& cancel) {
    AVFormatContext* raw = avformat_alloc_context();
    if (!raw) {
        throw SourceError("Failed to allocate format context for: " + uri);
    }
    raw->interrupt_callback.callback = interrupt_callback;
    raw->interrupt_callback.opaque = const_cast<CancellationToken*>(&cancel);

    // avformat_open_input frees the context on failure
    int ret = avformat_open_input(&raw, uri.c_str(), nullptr, nullptr);
    if (ret < 0) {
        cancel.throw_if_cancelled("container open");
        throw SourceError("Failed to open container: " + uri + " (" + av_error_string(ret) + ")");
    }
    FormatContextPtr ctx(raw);

    ret = avformat_find_stream_info(ctx.get(), nullptr);
    if (ret < 0) {
        cancel.throw_if_cancelled("stream probe");
        throw SourceError("Failed to read stream info: " + uri + " (" + av_error_string(ret) + ")");
    }
    return ctx;
}

double stream_fps(const AVStream* stream) {
    double fps = av_q2d(stream->avg_frame_rate);
    if (!(fps > 0.0)) fps = av_q2d(stream->r_frame_rate);
    if (!(fps > 0.0)) fps = 30.0;
    return fps;
}

} // namespace

std::vector<IndexEntry> read_container_keyframes(const std::string& uri,
                                                 double fps,
                                                 const CancellationToken& cancel) {
    FormatContextPtr ctx = open_format(uri, cancel);

    const int stream_index = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (stream_index < 0) {
        throw SourceError("No video stream in: " + uri);
    }
    const AVStream* stream = ctx->streams[stream_index];
    const double time_base = av_q2d(stream->time_base);
    const int64_t start = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
    if (!(fps > 0.0)) fps = stream_fps(stream);

    PacketPtr packet(av_packet_alloc());
    if (!packet) {
        throw SourceError("Failed to allocate packet for: " + uri);
    }

    std::vector<IndexEntry> entries;
    while (true) {
        const int ret = av_read_frame(ctx.get(), packet.get());
        if (ret == AVERROR_EOF) break;
        if (ret < 0) {
            cancel.throw_if_cancelled("container index scan");
            throw DecodeError("Failed to read packet from " + uri + " (" + av_error_string(ret) + ")");
        }
        ScopedPacketUnref guard(packet.get());

        if (packet->stream_index != stream_index) continue;
        if (!(packet->flags & AV_PKT_FLAG_KEY)) continue;

        const int64_t ts = packet->pts != AV_NOPTS_VALUE ? packet->pts : packet->dts;
        if (ts == AV_NOPTS_VALUE) continue;

        IndexEntry entry;
        entry.timestamp_s = std::max(0.0, static_cast<double>(ts - start) * time_base);
        entry.frame_index = std::llround(entry.timestamp_s * fps);
        entries.push_back(entry);
    }

    // Packets arrive in decode order
    std::sort(entries.begin(), entries.end(), [](const IndexEntry& a, const IndexEntry& b) {
        return a.timestamp_s < b.timestamp_s;
    });
    entries.erase(std::unique(entries.begin(), entries.end(), [](const IndexEntry& a, const IndexEntry& b) {
        return a.timestamp_s == b.timestamp_s;
    }), entries.end());

    return entries;
}

} // namespace kfx
