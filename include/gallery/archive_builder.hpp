/**
 * @file archive_builder.hpp
 * @brief In-memory zip of the original images
 *
 * @details Accumulates (file name, bytes) entries into a zip held entirely in
 *          memory (libzip buffer source). Entries are stored, not deflated:
 *          JPEG data does not compress further.
 *
 * @attention THREAD MODEL:
 *            - Single writer. Only the aggregator thread touches it.
 */

#ifndef GALLERY_ARCHIVE_BUILDER_HPP
#define GALLERY_ARCHIVE_BUILDER_HPP

#include <zip.h>

#include <string>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace gallery {

/**
 * @class ArchiveBuilder
 * @brief Append-only zip writer finalized once into an immutable buffer.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Appended buffers are borrowed by libzip until finalize(), so
 *              the builder keeps a reference to each of them
 *
 *            - Destructor discards an unfinished archive
 */
class ArchiveBuilder {
  zip_source_t *source_ = nullptr;
  zip_t *archive_ = nullptr;

  std::vector<Bytes> pending_;
  std::unordered_set<std::string> names_;
  bool finalized_ = false;

  Bytes read_back();

public:
  /// @throws std::runtime_error if libzip cannot create the archive
  ArchiveBuilder();
  ~ArchiveBuilder();

  ArchiveBuilder(const ArchiveBuilder &) = delete;
  ArchiveBuilder &operator=(const ArchiveBuilder &) = delete;

  /**
   * @brief Add one stored entry.
   * @param name Entry name (UTF-8), unique within the archive
   * @param bytes Entry contents
   * @throws std::logic_error on a duplicate name, null bytes, or after
   *         finalize()
   * @throws std::runtime_error if libzip rejects the entry
   */
  void append(const std::string &name, Bytes bytes);

  /**
   * @brief Write the central directory and return the complete zip.
   * @throws std::logic_error if called twice
   * @throws std::runtime_error if libzip fails to write the archive
   */
  Bytes finalize();

  size_t entry_count() const { return names_.size(); }
};

} // namespace gallery

#endif // GALLERY_ARCHIVE_BUILDER_HPP
