/**
 * @file ffmpeg_util.hpp
 * @brief Small helpers around FFmpeg C structures
 */

#ifndef GALLERY_FFMPEG_UTIL_HPP
#define GALLERY_FFMPEG_UTIL_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
}

#include <memory>
#include <string>

namespace gallery {

/// av_strerror as std::string
inline std::string av_error_text(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return std::string(buf);
}

struct AVFrameDeleter {
  void operator()(AVFrame *frame) const { av_frame_free(&frame); }
};

struct AVPacketDeleter {
  void operator()(AVPacket *pkt) const { av_packet_free(&pkt); }
};

struct AVCodecContextDeleter {
  void operator()(AVCodecContext *ctx) const { avcodec_free_context(&ctx); }
};

using FramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, AVCodecContextDeleter>;

inline FramePtr make_frame() { return FramePtr(av_frame_alloc()); }
inline PacketPtr make_packet() { return PacketPtr(av_packet_alloc()); }
inline CodecContextPtr make_codec_context(const AVCodec *codec) {
  return CodecContextPtr(avcodec_alloc_context3(codec));
}

} // namespace gallery

#endif // GALLERY_FFMPEG_UTIL_HPP
