/**
 * @file aggregator.hpp
 * @brief Ordered collection of transcode results
 *
 * @details The ResultAggregator is the single consumer of the ResultQueue.
 *          Results arrive in completion order; each is parked in the slot of
 *          its ordinal. Once all of them are in, finalize() walks the slots
 *          in scan order and builds the archive, the asset table and the
 *          listing, then freezes them into a Gallery.
 *
 * @attention THREAD MODEL:
 *            - Not thread-safe. Exactly one thread calls add()/drain() and
 *              then finalize(); archive and table have no other writer.
 */

#ifndef GALLERY_AGGREGATOR_HPP
#define GALLERY_AGGREGATOR_HPP

#include <vector>

#include "result_queue.hpp"
#include "snapshot.hpp"
#include "types.hpp"

namespace gallery {

/**
 * @class ResultAggregator
 * @brief Slot-per-ordinal result store feeding archive and asset table.
 */
class ResultAggregator {
  size_t expected_;
  size_t received_ = 0;
  bool finalized_ = false;

  std::vector<TranscodeResult> slots_;
  std::vector<bool> seen_;
  std::vector<FailedImage> failures_;

public:
  /// @param expected Number of candidates (N from the scan)
  explicit ResultAggregator(size_t expected);

  /**
   * @brief Accept one result.
   * @note Failures are logged and excluded from every output.
   * @throws std::logic_error on an out-of-range or repeated ordinal, a
   *         success without both buffers, or after finalize()
   */
  void add(TranscodeResult result);

  /**
   * @brief Pop from queue until it is closed and empty.
   * @return Number of results consumed
   */
  size_t drain(ResultQueue &queue);

  /**
   * @brief Build and freeze the gallery in scan order.
   * @throws std::logic_error unless exactly `expected` results were added,
   *         or if called twice
   * @throws std::runtime_error if the archive cannot be written
   */
  Gallery finalize();

  size_t expected() const { return expected_; }
  size_t received() const { return received_; }
};

} // namespace gallery

#endif // GALLERY_AGGREGATOR_HPP
