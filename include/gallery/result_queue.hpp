/**
 * @file result_queue.hpp
 * @brief Completion channel between transcode workers and the aggregator
 *
 * @details Producer-consumer pattern:
 *
 *          - Transcode workers (producers) push one result per image
 *
 *          - The aggregator (single consumer) pops until the queue closes
 *
 *          - The pool closes the queue after its last worker has exited,
 *            so a false pop() means every result has been delivered
 */

#ifndef GALLERY_RESULT_QUEUE_HPP
#define GALLERY_RESULT_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "types.hpp"

namespace gallery {

/**
 * @class ResultQueue
 * @brief Thread-safe queue of TranscodeResults (many producers, one
 *        consumer).
 *
 * @attention USAGE:
 *
 *   - Workers call push() once per image, success or failure
 *
 *   - The aggregator calls pop() in a loop
 *
 *   - finish() is called once no producer is left
 */
class ResultQueue {
public:
  /**
   * @brief Push a result to the queue.
   * @param result Finished (or failed) transcode
   */
  void push(TranscodeResult result);

  /**
   * @brief Pop a result from the queue (blocking).
   * @param result Output: the next result in arrival order
   * @return true if a result was retrieved, false if the queue is closed and
   *         drained
   */
  bool pop(TranscodeResult &result);

  /**
   * @brief Signal that no more results will be pushed.
   */
  void finish();

  /**
   * @brief Check if queue is finished and empty.
   */
  bool is_done() const { return done_.load() && empty(); }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<TranscodeResult> results_;
  std::atomic<bool> done_{false};
};

} // namespace gallery

#endif // GALLERY_RESULT_QUEUE_HPP
