/**
 * @file task_queue.hpp
 * @brief Thread-safe work queue feeding the transcode workers
 *
 * @details The queue is filled with one task per SourceImage before the
 *          workers start, then closed. Workers pop until it runs dry.
 */

#ifndef GALLERY_TASK_QUEUE_HPP
#define GALLERY_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "types.hpp"

namespace gallery {

/**
 * @class TaskQueue
 * @brief Thread-safe work-stealing queue for dynamic load balancing.
 *
 * @attention DESIGN:
 *
 * - Workers pop tasks from a shared queue
 *
 * - A worker stuck on a large image does not hold back the others
 *
 * - All workers stay busy until every image has been taken
 */
class TaskQueue {
  std::queue<SourceImage> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a task to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(SourceImage task);

  /**
   * @brief Pop a task from the queue.
   * @note Blocks until a task is available or queue is finished.
   * @param task Output parameter for the task
   * @return true if a task was retrieved, false if queue is empty and done
   */
  bool pop(SourceImage &task);

  /**
   * @brief Signal that no more tasks will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();
};

} // namespace gallery

#endif // GALLERY_TASK_QUEUE_HPP
