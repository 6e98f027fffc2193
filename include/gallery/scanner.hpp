/**
 * @file scanner.hpp
 * @brief Directory scan for JPEG candidates
 *
 * @details Lists one directory (not recursive) and keeps the regular files
 *          with a .jpg or .jpeg extension, in any letter case. The order of
 *          the directory listing becomes the canonical gallery order; each
 *          candidate is tagged with its position (ordinal).
 */

#ifndef GALLERY_SCANNER_HPP
#define GALLERY_SCANNER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace gallery {

/**
 * @struct ScanResult
 * @brief Candidates in listing order plus what was left out.
 */
struct ScanResult {
  std::vector<SourceImage> images; //< Ordinals are 0..images.size()-1
  size_t skipped = 0;              //< Entries that could not be inspected
                                   //< or whose display name was taken
};

/**
 * @brief Case-insensitive check for the JPEG extensions (.jpg, .jpeg).
 */
bool has_jpeg_extension(const std::string &file_name);

/**
 * @brief Scan a directory for JPEG candidates.
 *
 * @param dir Directory to list
 * @return Candidates in directory-iteration order
 * @throws std::runtime_error if the directory itself cannot be listed
 *
 * @note A single unreadable entry is logged and skipped. A file whose stem
 *       was already used by an earlier candidate (a.jpg, a.JPEG) is skipped
 *       too, because the stem keys the preview route.
 */
ScanResult scan_directory(const std::string &dir);

} // namespace gallery

#endif // GALLERY_SCANNER_HPP
