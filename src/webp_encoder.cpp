/**
 * @file webp_encoder.cpp
 * @brief Lossy WebP encoding implementation
 */

#include "gallery/webp_encoder.hpp"

extern "C" {
#include <libavutil/dict.h>
#include <libavutil/pixdesc.h>
}

#include <fmt/core.h>

#include "gallery/ffmpeg_util.hpp"
#include "gallery/logging.hpp"
#include "gallery/preview_geometry.hpp"

namespace gallery {

namespace {

constexpr const char *WEBP_ENCODER_NAME = "libwebp";

/**
 * @brief Map the deprecated full-range "J" formats the MJPEG decoder emits to
 *        their plain equivalents plus a full-range flag for swscale.
 */
AVPixelFormat normalize_format(AVPixelFormat fmt, bool &full_range) {
  switch (fmt) {
  case AV_PIX_FMT_YUVJ420P:
    full_range = true;
    return AV_PIX_FMT_YUV420P;
  case AV_PIX_FMT_YUVJ422P:
    full_range = true;
    return AV_PIX_FMT_YUV422P;
  case AV_PIX_FMT_YUVJ444P:
    full_range = true;
    return AV_PIX_FMT_YUV444P;
  case AV_PIX_FMT_YUVJ440P:
    full_range = true;
    return AV_PIX_FMT_YUV440P;
  case AV_PIX_FMT_YUVJ411P:
    full_range = true;
    return AV_PIX_FMT_YUV411P;
  default:
    return fmt;
  }
}

std::string pixel_format_name(int fmt) {
  const char *name = av_get_pix_fmt_name(static_cast<AVPixelFormat>(fmt));
  return name ? std::string(name) : fmt::format("#{}", fmt);
}

} // anonymous namespace

WebpEncoder::WebpEncoder() : scaled(make_frame()), pkt(make_packet()) {}

bool WebpEncoder::available() {
  return avcodec_find_encoder_by_name(WEBP_ENCODER_NAME) != nullptr;
}

bool WebpEncoder::convert(const AVFrame *frame, Dimensions target,
                          std::string &error) {
  bool full_range = (frame->color_range == AVCOL_RANGE_JPEG);
  AVPixelFormat src_fmt =
      normalize_format(static_cast<AVPixelFormat>(frame->format), full_range);

  sws_ctx.reset(sws_getContext(frame->width, frame->height, src_fmt,
                               target.width, target.height,
                               AV_PIX_FMT_YUV420P, SWS_BICUBIC, nullptr,
                               nullptr, nullptr));
  if (!sws_ctx) {
    error = fmt::format("cannot convert {} {}x{} to yuv420p {}x{}",
                        pixel_format_name(frame->format), frame->width,
                        frame->height, target.width, target.height);
    return false;
  }

  /// Range hint only; swscale keeps its default conversion if it refuses it
  const int *coefficients = sws_getCoefficients(SWS_CS_DEFAULT);
  int ret = sws_setColorspaceDetails(sws_ctx.get(), coefficients,
                                     full_range ? 1 : 0, coefficients, 0, 0,
                                     1 << 16, 1 << 16);
  if (ret < 0) {
    LOG_DEBUG("swscale ignored the {} range hint for {}",
              full_range ? "full" : "limited",
              pixel_format_name(frame->format));
  }

  scaled->format = AV_PIX_FMT_YUV420P;
  scaled->width = target.width;
  scaled->height = target.height;
  ret = av_frame_get_buffer(scaled.get(), 0);
  if (ret < 0) {
    error = fmt::format("failed to allocate preview frame: {}",
                        av_error_text(ret));
    return false;
  }

  ret = sws_scale(sws_ctx.get(), frame->data, frame->linesize, 0,
                  frame->height, scaled->data, scaled->linesize);
  if (ret <= 0) {
    error = "scaling failed";
    return false;
  }
  scaled->pts = 0;
  return true;
}

bool WebpEncoder::encode(const AVFrame *frame, Dimensions box, float quality,
                         std::vector<uint8_t> &out, Dimensions &size,
                         std::string &error) {
  if (!scaled || !pkt) {
    error = "failed to allocate encoder buffers";
    return false;
  }
  if (enc_ctx) {
    error = "encoder already used";
    return false;
  }
  if (box.width <= 0 || box.height <= 0) {
    error = fmt::format("invalid preview box {}x{}", box.width, box.height);
    return false;
  }

  const AVCodec *codec = avcodec_find_encoder_by_name(WEBP_ENCODER_NAME);
  if (!codec) {
    error = "FFmpeg was built without the libwebp encoder";
    return false;
  }

  const Dimensions target = fit_within({frame->width, frame->height}, box);

  enc_ctx = make_codec_context(codec);
  if (!enc_ctx) {
    error = "failed to allocate encoder context";
    return false;
  }
  enc_ctx->width = target.width;
  enc_ctx->height = target.height;
  enc_ctx->pix_fmt = AV_PIX_FMT_YUV420P;
  enc_ctx->time_base = AVRational{1, 1};
  enc_ctx->thread_count = 1;

  AVDictionary *opts = nullptr;
  av_dict_set(&opts, "lossless", "0", 0);
  av_dict_set(&opts, "quality", fmt::format("{:.1f}", quality).c_str(), 0);
  int ret = avcodec_open2(enc_ctx.get(), codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    error = fmt::format("avcodec_open2 failed: {}", av_error_text(ret));
    return false;
  }

  if (!convert(frame, target, error))
    return false;

  ret = avcodec_send_frame(enc_ctx.get(), scaled.get());
  if (ret < 0) {
    error = fmt::format("encode failed: {}", av_error_text(ret));
    return false;
  }
  ret = avcodec_send_frame(enc_ctx.get(), nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    error = fmt::format("encoder flush failed: {}", av_error_text(ret));
    return false;
  }

  ret = avcodec_receive_packet(enc_ctx.get(), pkt.get());
  if (ret < 0) {
    error = fmt::format("encoder produced no output: {}", av_error_text(ret));
    return false;
  }

  out.assign(pkt->data, pkt->data + pkt->size);
  av_packet_unref(pkt.get());
  size = target;
  return true;
}

} // namespace gallery
