/**
 * @file gallery.hpp
 * @brief Gallery build orchestration
 *
 * @details The GalleryBuilder runs the whole build phase:
 *
 *          1. Scan the directory for JPEG candidates
 *
 *          2. Launch the worker pool (one transcode per candidate)
 *
 *          3. Aggregate results on a single consumer thread
 *
 *          4. Wait for the barrier (all workers joined, queue closed)
 *
 *          5. Finalize archive, asset table and listing into a Gallery
 *
 * @note Serving starts only after build() has returned.
 */

#ifndef GALLERY_GALLERY_HPP
#define GALLERY_GALLERY_HPP

#include <string>
#include <utility>

#include "snapshot.hpp"
#include "transcoder.hpp"
#include "types.hpp"

namespace gallery {

/**
 * @struct BuildOptions
 * @brief Knobs of one build.
 */
struct BuildOptions {
  int workers = 0;          //< Worker threads (0 = auto)
  PreviewSettings preview;  //< Preview box and quality

  /**
   * @brief Options from the GALLERY_WORKERS / PREVIEW_* environment variables.
   * @throws std::runtime_error naming the variable if a value is malformed
   *         or out of range
   */
  static BuildOptions from_config();

  /**
   * @brief Reject values no build can run with.
   * @throws std::runtime_error naming the offending setting: negative
   *         workers, a non-positive box side, or quality outside 0-100
   */
  void validate() const;
};

/**
 * @class GalleryBuilder
 * @brief Builds one immutable Gallery from one directory.
 *
 * @attention WORKFLOW:
 *
 * 1. scan_directory() fixes N and the ordinals
 *
 * 2. WorkerPool fans the N transcodes out over the workers
 *
 * 3. ResultAggregator drains the ResultQueue on its own thread
 *
 * 4. WorkerPool::wait() closes the queue; the aggregator thread returns
 *
 * 5. ResultAggregator::finalize() freezes everything in scan order
 */
class GalleryBuilder {
  std::string directory_;
  BuildOptions options_;
  TranscodeFn transcode_;

  void print_build_summary(const BuildStats &stats, double elapsed_sec) const;

public:
  /**
   * @brief Construct a builder.
   * @param directory Directory to scan (not recursive)
   * @param options Worker count and preview settings
   * @throws std::runtime_error if options fail BuildOptions::validate()
   */
  GalleryBuilder(std::string directory, BuildOptions options);

  /**
   * @brief Replace the transcode function.
   * @note Used by tests to inject delays or failures.
   */
  void set_transcoder(TranscodeFn fn) { transcode_ = std::move(fn); }

  /**
   * @brief Run the build phase to completion.
   * @return The frozen gallery
   * @throws std::runtime_error if the directory cannot be listed or the
   *         archive cannot be written
   * @throws std::logic_error if an internal invariant is broken
   */
  Gallery build();
};

} // namespace gallery

#endif // GALLERY_GALLERY_HPP
