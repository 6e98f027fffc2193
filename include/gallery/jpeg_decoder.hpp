/**
 * @file jpeg_decoder.hpp
 * @brief JPEG decoding with decoder-level downscaling
 *
 * @details The JpegDecoder class decodes one in-memory JPEG with FFmpeg's
 *          MJPEG decoder. Before opening the decoder, the frame header is
 *          read to learn the coded size, and the "lowres" reduction is chosen
 *          so the decoded frame is already close to preview size.
 *
 * @attention THREAD MODEL:
 *            - Each transcode creates its own JpegDecoder instance.
 *
 *            - FFmpeg decoder state is not thread-safe and is never shared.
 *
 */

#ifndef GALLERY_JPEG_DECODER_HPP
#define GALLERY_JPEG_DECODER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
}

#include <climits>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ffmpeg_util.hpp"
#include "types.hpp"

namespace gallery {

/**
 * @brief Largest file that can be handed to the decoder as one packet.
 * @note AVPacket sizes are int and carry AV_INPUT_BUFFER_PADDING_SIZE extra
 *       bytes.
 */
constexpr size_t MAX_PACKET_BYTES =
    static_cast<size_t>(INT_MAX) - AV_INPUT_BUFFER_PADDING_SIZE;

inline bool fits_single_packet(size_t size) {
  return size > 0 && size <= MAX_PACKET_BYTES;
}

/**
 * @brief Read the frame size from the JPEG's SOF segment.
 *
 * @note Walks the marker segments up to the first start-of-frame. Rejects
 *       anything that does not start with SOI or whose segments run past the
 *       end of the buffer.
 *
 * @param data JPEG bytes
 * @param size Number of bytes
 * @param out Output: coded width and height
 * @param error Output: reason the header was rejected
 * @return true if a frame header was found
 */
bool probe_jpeg_size(const uint8_t *data, size_t size, Dimensions &out,
                     std::string &error);

/**
 * @class JpegDecoder
 * @brief Decodes one JPEG at the reduction that fits a preview box.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - FFmpeg objects are owned by unique_ptr deleters, so partial
 *              initialization failures clean up on their own
 *
 *            - The source buffer is borrowed and must outlive the decoder
 */
class JpegDecoder {
  CodecContextPtr dec_ctx;
  PacketPtr pkt;

  /// Reference to the caller's file buffer (not owned)
  const std::vector<uint8_t> &file_data;

  Dimensions source_size_;
  int lowres_ = 0;

public:
  explicit JpegDecoder(const std::vector<uint8_t> &data);

  /// Disable copy (FFmpeg contexts are not copyable)
  JpegDecoder(const JpegDecoder &) = delete;
  JpegDecoder &operator=(const JpegDecoder &) = delete;

  /**
   * @brief Probe the header, pick the reduction and open the decoder.
   * @note Files larger than MAX_PACKET_BYTES are rejected before any
   *       allocation.
   * @param box Preview bounding box the decoded frame should fit
   * @param error Output: reason for the failure
   * @return true on success, false on failure
   */
  bool initialize(Dimensions box, std::string &error);

  /**
   * @brief Decode the image into frame.
   * @param frame Output frame (allocated by the caller)
   * @param error Output: reason for the failure
   * @return true if a frame was produced
   */
  bool decode(AVFrame *frame, std::string &error);

  /// Coded size from the frame header
  Dimensions source_size() const { return source_size_; }

  /// Selected reduction: the frame is 1 / (1 << lowres) of the coded size
  int lowres() const { return lowres_; }
};

} // namespace gallery

#endif // GALLERY_JPEG_DECODER_HPP
