/**
 * @file webp_encoder.hpp
 * @brief Lossy WebP encoding of decoded preview frames
 *
 * @details Converts a decoded frame to YUV420P at its fitted preview size
 *          (libswscale) and encodes it with FFmpeg's libwebp encoder. The
 *          output packet is a complete .webp file.
 */

#ifndef GALLERY_WEBP_ENCODER_HPP
#define GALLERY_WEBP_ENCODER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
}

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ffmpeg_util.hpp"
#include "types.hpp"

namespace gallery {

struct SwsContextDeleter {
  void operator()(SwsContext *ctx) const { sws_freeContext(ctx); }
};

using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;

/**
 * @class WebpEncoder
 * @brief One-shot WebP encoder for a single frame.
 * @note Like JpegDecoder, one instance per transcode; never shared.
 */
class WebpEncoder {
  CodecContextPtr enc_ctx;
  SwsContextPtr sws_ctx;
  FramePtr scaled;
  PacketPtr pkt;

  bool convert(const AVFrame *frame, Dimensions target, std::string &error);

public:
  WebpEncoder();

  WebpEncoder(const WebpEncoder &) = delete;
  WebpEncoder &operator=(const WebpEncoder &) = delete;

  /**
   * @brief Encode frame as a lossy WebP image that fits box.
   *
   * @param frame Decoded source frame (any pixel format swscale accepts)
   * @param box Preview bounding box; the frame is shrunk to fit, never grown.
   *            Both sides must be positive.
   * @param quality libwebp quality, 0-100
   * @param out Output: the .webp file bytes
   * @param size Output: encoded width and height
   * @param error Output: reason for the failure
   * @return true on success
   */
  bool encode(const AVFrame *frame, Dimensions box, float quality,
              std::vector<uint8_t> &out, Dimensions &size,
              std::string &error);

  /**
   * @brief Whether the linked FFmpeg provides the libwebp encoder.
   */
  static bool available();
};

} // namespace gallery

#endif // GALLERY_WEBP_ENCODER_HPP
