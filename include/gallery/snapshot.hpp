/**
 * @file snapshot.hpp
 * @brief The frozen result of a gallery build
 *
 * @details Everything the serving phase needs, handed over as a group once
 *          the build has finished. All members are read-only from here on.
 */

#ifndef GALLERY_SNAPSHOT_HPP
#define GALLERY_SNAPSHOT_HPP

#include <memory>
#include <string>
#include <vector>

#include "asset_table.hpp"
#include "types.hpp"

namespace gallery {

/**
 * @struct FailedImage
 * @brief A candidate left out of the gallery, and why.
 */
struct FailedImage {
  size_t ordinal;
  std::string file_name;
  std::string error;
};

/**
 * @struct BuildStats
 * @brief Totals of one build, printed in the build summary.
 */
struct BuildStats {
  size_t candidates = 0;            //< JPEG candidates found by the scan
  size_t skipped = 0;               //< Directory entries the scan left out
  size_t succeeded = 0;             //< Images in the gallery
  size_t failed = 0;                //< Images that failed to transcode
  size_t archive_bytes = 0;         //< Size of /gallery.zip
  size_t preview_bytes = 0;         //< Sum of all preview sizes
  size_t original_bytes = 0;        //< Sum of all original sizes
  std::vector<FailedImage> failures; //< In scan order
};

/**
 * @struct Gallery
 * @brief Immutable hand-off from the build phase to the server.
 */
struct Gallery {
  std::shared_ptr<const AssetTable> assets;
  std::shared_ptr<const std::vector<PresentationEntry>> listing;
  BuildStats stats;
};

} // namespace gallery

#endif // GALLERY_SNAPSHOT_HPP
