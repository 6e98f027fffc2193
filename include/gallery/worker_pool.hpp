/**
 * @file worker_pool.hpp
 * @brief Bounded pool of transcode workers
 *
 * @details The WorkerPool runs one TranscodeFn per SourceImage:
 *
 *          - Spawns min(workers, images) threads
 *
 *          - Work-stealing queue distributes images across workers
 *
 *          - Every image yields exactly one result on the ResultQueue,
 *            success or failure marker
 *
 *          - The ResultQueue is closed once the last worker has exited
 *
 * @note Configuration via environment variables:
 *
 *       - GALLERY_WORKERS: Number of transcode workers (0 = auto)
 */

#ifndef GALLERY_WORKER_POOL_HPP
#define GALLERY_WORKER_POOL_HPP

#include <atomic>
#include <thread>
#include <vector>

#include "result_queue.hpp"
#include "task_queue.hpp"
#include "types.hpp"

namespace gallery {

/**
 * @class WorkerPool
 * @brief Fan-out of transcode work with a single completion channel.
 *
 * @attention LIFECYCLE:
 *
 *   - start() may be called once
 *
 *   - wait() joins every worker, then closes the ResultQueue
 *
 *   - The destructor waits if wait() was never called
 */
class WorkerPool {
public:
  /**
   * @brief Construct a worker pool.
   * @param num_workers Number of workers (0 = auto-detect)
   */
  explicit WorkerPool(int num_workers = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Queue every image and launch the workers.
   *
   * @param images Work items, one result each
   * @param fn Transcode function, called concurrently from the workers
   * @param results Completion channel (must outlive wait())
   * @throws std::logic_error if the pool was already started
   */
  void start(std::vector<SourceImage> images, TranscodeFn fn,
             ResultQueue *results);

  /**
   * @brief Join all workers and close the completion channel.
   */
  void wait();

  /// Threads launched by start() (0 before start or with no images)
  int active_workers() const { return static_cast<int>(workers_.size()); }

  /// Workers the pool would launch for an unbounded number of images
  int max_workers() const { return num_workers_; }

private:
  int num_workers_;

  TaskQueue tasks_;
  TranscodeFn fn_;
  ResultQueue *results_ = nullptr;
  std::vector<std::thread> workers_;
  std::atomic<size_t> completed_{0};
  size_t total_ = 0;
  bool started_ = false;
  bool closed_ = false;

  /**
   * @brief Worker loop: pop, transcode, publish.
   * @param worker_id Worker index for logging
   */
  void worker(int worker_id);
};

} // namespace gallery

#endif // GALLERY_WORKER_POOL_HPP
