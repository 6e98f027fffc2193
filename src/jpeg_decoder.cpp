/**
 * @file jpeg_decoder.cpp
 * @brief JPEG decoding with decoder-level downscaling implementation
 *
 * @details The whole file is handed to the MJPEG decoder as one packet.
 *          No demuxer is involved: a JPEG file is exactly one MJPEG frame.
 */

#include "gallery/jpeg_decoder.hpp"

#include <cstring>

#include <fmt/core.h>

#include "gallery/ffmpeg_util.hpp"
#include "gallery/preview_geometry.hpp"

namespace gallery {

// **---- Frame header probe ----**

namespace {

constexpr uint8_t MARKER_SOI = 0xD8;
constexpr uint8_t MARKER_EOI = 0xD9;
constexpr uint8_t MARKER_SOS = 0xDA;
constexpr uint8_t MARKER_TEM = 0x01;

/// SOF0..SOF15 except DHT (C4), JPG (C8) and DAC (CC)
bool is_start_of_frame(uint8_t marker) {
  return marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 &&
         marker != 0xC8 && marker != 0xCC;
}

/// Markers without a length field
bool is_standalone(uint8_t marker) {
  return marker == MARKER_SOI || marker == MARKER_TEM ||
         (marker >= 0xD0 && marker <= 0xD7);
}

} // anonymous namespace

bool probe_jpeg_size(const uint8_t *data, size_t size, Dimensions &out,
                     std::string &error) {
  if (size < 4 || data[0] != 0xFF || data[1] != MARKER_SOI) {
    error = "not a JPEG stream (missing start-of-image marker)";
    return false;
  }

  size_t pos = 2;
  while (pos + 1 < size) {
    if (data[pos] != 0xFF) {
      error = fmt::format("corrupt marker at offset {}", pos);
      return false;
    }
    const uint8_t marker = data[pos + 1];
    if (marker == 0xFF) {
      /// Fill byte
      pos++;
      continue;
    }
    pos += 2;
    if (is_standalone(marker))
      continue;
    if (marker == MARKER_EOI || marker == MARKER_SOS)
      break;

    if (pos + 2 > size)
      break;
    const size_t length = (static_cast<size_t>(data[pos]) << 8) | data[pos + 1];
    if (length < 2 || pos + length > size) {
      error = fmt::format("truncated segment 0xFF{:02X} at offset {}", marker,
                          pos - 2);
      return false;
    }

    if (is_start_of_frame(marker)) {
      /// length(2) precision(1) height(2) width(2)
      if (length < 7) {
        error = "frame header too short";
        return false;
      }
      out.height = (data[pos + 3] << 8) | data[pos + 4];
      out.width = (data[pos + 5] << 8) | data[pos + 6];
      if (out.width == 0 || out.height == 0) {
        error = fmt::format("unsupported frame size {}x{}", out.width,
                            out.height);
        return false;
      }
      return true;
    }
    pos += length;
  }

  error = "no frame header found";
  return false;
}

// **---- JpegDecoder ----**

JpegDecoder::JpegDecoder(const std::vector<uint8_t> &data)
    : pkt(make_packet()), file_data(data) {}

bool JpegDecoder::initialize(Dimensions box, std::string &error) {
  if (!pkt) {
    error = "failed to allocate packet";
    return false;
  }

  if (!fits_single_packet(file_data.size())) {
    error = fmt::format("file of {} bytes exceeds the {} byte packet limit",
                        file_data.size(), MAX_PACKET_BYTES);
    return false;
  }

  if (!probe_jpeg_size(file_data.data(), file_data.size(), source_size_,
                       error)) {
    return false;
  }

  const AVCodec *codec = avcodec_find_decoder(AV_CODEC_ID_MJPEG);
  if (!codec) {
    error = "no MJPEG decoder available";
    return false;
  }

  dec_ctx = make_codec_context(codec);
  if (!dec_ctx) {
    error = "failed to allocate decoder context";
    return false;
  }

  // **--- DECODER SETUP ---**

  /// Decode straight to (roughly) preview size via DCT scaling
  lowres_ = select_lowres(source_size_, box, codec->max_lowres);
  dec_ctx->lowres = lowres_;

  /// Single-threaded decoding (parallelism is per image, in the pool)
  dec_ctx->thread_count = 1;

  /// Treat damaged entropy-coded data as an error instead of concealing it
  dec_ctx->err_recognition |= AV_EF_EXPLODE;

  int ret = avcodec_open2(dec_ctx.get(), codec, nullptr);
  if (ret < 0) {
    error = fmt::format("avcodec_open2 failed: {}", av_error_text(ret));
    return false;
  }

  /// Padded copy of the file as the single packet
  ret = av_new_packet(pkt.get(), static_cast<int>(file_data.size()));
  if (ret < 0) {
    error = fmt::format("failed to allocate packet: {}", av_error_text(ret));
    return false;
  }
  std::memcpy(pkt->data, file_data.data(), file_data.size());

  return true;
}

bool JpegDecoder::decode(AVFrame *frame, std::string &error) {
  if (!dec_ctx) {
    error = "decoder not initialized";
    return false;
  }

  int ret = avcodec_send_packet(dec_ctx.get(), pkt.get());
  av_packet_unref(pkt.get());
  if (ret < 0) {
    error = fmt::format("decode failed: {}", av_error_text(ret));
    return false;
  }

  /// Drain: a still image yields exactly one frame
  ret = avcodec_send_packet(dec_ctx.get(), nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    error = fmt::format("decoder flush failed: {}", av_error_text(ret));
    return false;
  }

  ret = avcodec_receive_frame(dec_ctx.get(), frame);
  if (ret < 0) {
    error = (ret == AVERROR_EOF)
                ? std::string("decoder produced no frame")
                : fmt::format("decode failed: {}", av_error_text(ret));
    return false;
  }

  if (frame->width <= 0 || frame->height <= 0) {
    error = "decoded frame is empty";
    return false;
  }
  return true;
}

} // namespace gallery
