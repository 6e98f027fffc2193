/**
 * @file transcoder.hpp
 * @brief One unit of gallery work: JPEG in, original + WebP preview out
 */

#ifndef GALLERY_TRANSCODER_HPP
#define GALLERY_TRANSCODER_HPP

#include "types.hpp"

namespace gallery {

/**
 * @struct PreviewSettings
 * @brief How previews are produced.
 */
struct PreviewSettings {
  Dimensions box{DEFAULT_PREVIEW_WIDTH, DEFAULT_PREVIEW_HEIGHT};
  float quality = DEFAULT_PREVIEW_QUALITY;
};

/**
 * @brief Transcode one source image.
 *
 * @details Reads the file, decodes it at the reduction that fits
 *          settings.box, and encodes the preview as lossy WebP. The file
 *          bytes are returned untouched as the full representation.
 *
 * @note Never throws. Every failure (read, probe, decode, scale, encode, or
 *       an exception from FFmpeg glue) comes back as a failure marker that
 *       names the failing step.
 */
TranscodeResult transcode_image(const SourceImage &image,
                                const PreviewSettings &settings);

/**
 * @brief Bind settings into a TranscodeFn for the worker pool.
 */
TranscodeFn make_transcoder(PreviewSettings settings);

} // namespace gallery

#endif // GALLERY_TRANSCODER_HPP
