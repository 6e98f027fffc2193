/**
 * @file types.hpp
 * @brief Core data types shared by the gallery build pipeline
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Bytes: shared immutable byte buffer
 *
 *          - SourceImage: one candidate found by the directory scan
 *
 *          - TranscodeResult: the outcome of transcoding one SourceImage
 *
 *          - PresentationEntry: one row of the ordered listing
 */

#ifndef GALLERY_TYPES_HPP
#define GALLERY_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gallery {

// **----- CONSTANTS -----**

/// Default preview bounding box (decoded previews never exceed it)
constexpr int DEFAULT_PREVIEW_WIDTH = 900;
constexpr int DEFAULT_PREVIEW_HEIGHT = 600;

/**
 * @brief Default WebP quality for previews (0-100).
 * @note Earlier builds alternated between 0 and 35; 50 is the fixed value
 *       now, overridable through PREVIEW_QUALITY.
 */
constexpr float DEFAULT_PREVIEW_QUALITY = 50.0f;

// **----- DATA STRUCTURES -----**

/**
 * @brief Immutable, reference-counted byte buffer.
 * @note One per asset. Whoever holds the last reference frees it; in the
 *       serving phase that is the frozen AssetTable.
 */
using Bytes = std::shared_ptr<const std::vector<uint8_t>>;

/// Wrap an owned vector into a shared immutable buffer
inline Bytes make_bytes(std::vector<uint8_t> &&data) {
  return std::make_shared<const std::vector<uint8_t>>(std::move(data));
}

/**
 * @struct Dimensions
 * @brief Width and height of an image in pixels.
 */
struct Dimensions {
  int width = 0;
  int height = 0;
};

/**
 * @struct SourceImage
 * @brief One JPEG candidate found by the directory scan.
 */
struct SourceImage {
  size_t ordinal;           //< Position in the original directory listing
  std::string path;         //< Full path to the file
  std::string file_name;    //< File name with extension (archive entry name)
  std::string display_name; //< File name stem (preview route, listing label)
};

/**
 * @struct TranscodeResult
 * @brief The outcome of transcoding one SourceImage.
 * @note Either a success carrying both representations or a failure marker
 *       carrying an error description. Never both.
 */
struct TranscodeResult {
  size_t ordinal = 0;       //< Copied from SourceImage::ordinal
  std::string file_name;    //< Copied from SourceImage::file_name
  std::string display_name; //< Copied from SourceImage::display_name
  bool success = false;     //< Whether both representations were produced
  Bytes preview;            //< WebP preview (success only)
  Bytes full;               //< Untouched original bytes (success only)
  Dimensions preview_size;  //< Encoded preview dimensions (success only)
  std::string error;        //< What went wrong (failure only)

  static TranscodeResult failure(const SourceImage &image, std::string error);
  static TranscodeResult completed(const SourceImage &image, Bytes full,
                                   Bytes preview, Dimensions preview_size);
};

inline TranscodeResult TranscodeResult::failure(const SourceImage &image,
                                                std::string error) {
  TranscodeResult result;
  result.ordinal = image.ordinal;
  result.file_name = image.file_name;
  result.display_name = image.display_name;
  result.error = std::move(error);
  return result;
}

inline TranscodeResult TranscodeResult::completed(const SourceImage &image,
                                                  Bytes full, Bytes preview,
                                                  Dimensions preview_size) {
  TranscodeResult result;
  result.ordinal = image.ordinal;
  result.file_name = image.file_name;
  result.display_name = image.display_name;
  result.success = true;
  result.full = std::move(full);
  result.preview = std::move(preview);
  result.preview_size = preview_size;
  return result;
}

/**
 * @brief Signature of one unit of transcode work.
 * @note Must not touch shared state; everything it produces is returned.
 */
using TranscodeFn = std::function<TranscodeResult(const SourceImage &)>;

/**
 * @struct PresentationEntry
 * @brief One row of the listing page, in original scan order.
 */
struct PresentationEntry {
  std::string display_name; //< Label shown on the page
  std::string preview_key;  //< Route key of the WebP preview
  std::string full_key;     //< Route key of the original JPEG
};

} // namespace gallery

#endif // GALLERY_TYPES_HPP
