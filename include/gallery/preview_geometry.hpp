/**
 * @file preview_geometry.hpp
 * @brief Size arithmetic for decoder-level downscaling and preview fitting
 *
 * @details The JPEG decoder can reduce a frame by 1/2, 1/4 or 1/8 while
 *          decoding (DCT scaling, FFmpeg "lowres"). The smallest reduction
 *          that fits the preview box is picked so the full-resolution frame
 *          is never materialized. What remains is a final fit into the box
 *          that only ever shrinks.
 */

#ifndef GALLERY_PREVIEW_GEOMETRY_HPP
#define GALLERY_PREVIEW_GEOMETRY_HPP

#include <algorithm>
#include <cmath>

#include "types.hpp"

namespace gallery {

/// Frame size after decoding with the given lowres factor (ceil division)
inline Dimensions reduced_size(Dimensions source, int lowres) {
  const int div = 1 << lowres;
  return {(source.width + div - 1) / div, (source.height + div - 1) / div};
}

inline bool fits_within(Dimensions size, Dimensions box) {
  return size.width <= box.width && size.height <= box.height;
}

/**
 * @brief Pick the decoder reduction for a source and preview box.
 * @param source Coded frame size
 * @param box Preview bounding box
 * @param max_lowres Largest reduction the decoder supports (3 for MJPEG)
 * @return Smallest lowres in [0, max_lowres] that fits the box, or
 *         max_lowres if none does
 */
inline int select_lowres(Dimensions source, Dimensions box, int max_lowres) {
  for (int lowres = 0; lowres < max_lowres; ++lowres) {
    if (fits_within(reduced_size(source, lowres), box))
      return lowres;
  }
  return std::max(0, max_lowres);
}

/**
 * @brief Largest size inside the box with the source's aspect ratio.
 * @note Never upscales; a size that already fits is returned unchanged.
 *       A degenerate box (side <= 0) yields at least 1x1.
 */
inline Dimensions fit_within(Dimensions source, Dimensions box) {
  if (fits_within(source, box))
    return source;
  const double scale =
      std::min(static_cast<double>(box.width) / source.width,
               static_cast<double>(box.height) / source.height);
  Dimensions fitted;
  fitted.width = static_cast<int>(std::lround(source.width * scale));
  fitted.height = static_cast<int>(std::lround(source.height * scale));
  fitted.width = std::clamp(fitted.width, 1, std::max(1, box.width));
  fitted.height = std::clamp(fitted.height, 1, std::max(1, box.height));
  return fitted;
}

} // namespace gallery

#endif // GALLERY_PREVIEW_GEOMETRY_HPP
