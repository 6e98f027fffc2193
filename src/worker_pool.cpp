/**
 * @file worker_pool.cpp
 * @brief Bounded transcode worker pool implementation
 *
 * @details Implements the WorkerPool class:
 *
 *          - Work-stealing queue for load balancing
 *
 *          - Worker-prefixed logging
 *
 *          - Exceptions from the transcode function become failure markers
 */

#include "gallery/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "gallery/logging.hpp"
#include "gallery/system.hpp"

namespace gallery {

WorkerPool::WorkerPool(int num_workers)
    : num_workers_(calculate_worker_count(
          num_workers, std::numeric_limits<size_t>::max())) {}

WorkerPool::~WorkerPool() {
  if (started_ && !closed_)
    wait();
}

void WorkerPool::start(std::vector<SourceImage> images, TranscodeFn fn,
                       ResultQueue *results) {
  if (started_)
    throw std::logic_error("WorkerPool::start called twice");
  if (!results)
    throw std::logic_error("WorkerPool::start needs a result queue");
  if (!fn)
    throw std::logic_error("WorkerPool::start needs a transcode function");

  started_ = true;
  fn_ = std::move(fn);
  results_ = results;
  total_ = images.size();

  /// Populate work queue, then close it: workers exit when it runs dry
  for (auto &image : images) {
    tasks_.push(std::move(image));
  }
  tasks_.finish();

  if (total_ == 0)
    return;

  const int actual_workers = calculate_worker_count(num_workers_, total_);
  LOG_INFO("Transcoding {} images on {} workers", total_, actual_workers);

  for (int i = 0; i < actual_workers; ++i) {
    workers_.emplace_back(&WorkerPool::worker, this, i);
  }
}

void WorkerPool::wait() {
  if (closed_)
    return;

  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }

  /// Every result has been pushed: let the aggregator finish
  if (results_)
    results_->finish();
  closed_ = true;
}

void WorkerPool::worker(int worker_id) {
  SourceImage image;
  while (tasks_.pop(image)) {
    TranscodeResult result;
    try {
      result = fn_(image);
    } catch (const std::exception &e) {
      result = TranscodeResult::failure(image, e.what());
    }

    /// The result must describe the image it was produced for
    if (result.ordinal != image.ordinal) {
      result = TranscodeResult::failure(
          image, fmt::format("transcoder returned ordinal {} for ordinal {}",
                             result.ordinal, image.ordinal));
    }

    const size_t done = ++completed_;
    if (result.success) {
      LOG_INFO("[Worker {}] {}/{} {} -> {}x{} preview", worker_id, done, total_,
               image.file_name, result.preview_size.width,
               result.preview_size.height);
    } else {
      LOG_WARN("[Worker {}] {}/{} {} failed: {}", worker_id, done, total_,
               image.file_name, result.error);
    }

    results_->push(std::move(result));
  }
}

} // namespace gallery
