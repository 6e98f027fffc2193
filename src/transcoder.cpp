/**
 * @file transcoder.cpp
 * @brief Read, decode and preview-encode one source image
 */

#include "gallery/transcoder.hpp"

#include <exception>
#include <utility>

#include <fmt/core.h>

#include "gallery/ffmpeg_util.hpp"
#include "gallery/jpeg_decoder.hpp"
#include "gallery/logging.hpp"
#include "gallery/memory_io.hpp"
#include "gallery/webp_encoder.hpp"

namespace gallery {

namespace {

TranscodeResult run_transcode(const SourceImage &image,
                              const PreviewSettings &settings) {
  // **--- READ ---**

  TIMER_START(read);
  std::vector<uint8_t> file_data;
  std::string error;
  if (!MemoryLoader::load_file(image.path, file_data, error)) {
    return TranscodeResult::failure(image, fmt::format("read: {}", error));
  }
  TIMER_END(read);

  // **--- DECODE ---**

  TIMER_START(decode);
  FramePtr frame = make_frame();
  if (!frame) {
    return TranscodeResult::failure(image, "decode: failed to allocate frame");
  }
  {
    JpegDecoder decoder(file_data);
    if (!decoder.initialize(settings.box, error) ||
        !decoder.decode(frame.get(), error)) {
      return TranscodeResult::failure(image, fmt::format("decode: {}", error));
    }
    LOG_DEBUG("{}: {}x{} decoded at 1/{} -> {}x{}", image.file_name,
              decoder.source_size().width, decoder.source_size().height,
              1 << decoder.lowres(), frame->width, frame->height);
  }
  TIMER_END(decode);

  // **--- ENCODE ---**

  TIMER_START(encode);
  std::vector<uint8_t> webp;
  Dimensions preview_size;
  {
    WebpEncoder encoder;
    if (!encoder.encode(frame.get(), settings.box, settings.quality, webp,
                        preview_size, error)) {
      return TranscodeResult::failure(image, fmt::format("encode: {}", error));
    }
  }
  TIMER_END(encode);

  /// The file buffer becomes the full asset as-is
  return TranscodeResult::completed(image, make_bytes(std::move(file_data)),
                                    make_bytes(std::move(webp)), preview_size);
}

} // anonymous namespace

TranscodeResult transcode_image(const SourceImage &image,
                                const PreviewSettings &settings) {
  try {
    return run_transcode(image, settings);
  } catch (const std::exception &e) {
    return TranscodeResult::failure(image,
                                    fmt::format("transcode: {}", e.what()));
  }
}

TranscodeFn make_transcoder(PreviewSettings settings) {
  return [settings](const SourceImage &image) {
    return transcode_image(image, settings);
  };
}

} // namespace gallery
