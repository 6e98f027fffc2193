/**
 * @file result_queue.cpp
 * @brief Completion channel implementation
 */

#include "gallery/result_queue.hpp"

#include <utility>

namespace gallery {

void ResultQueue::push(TranscodeResult result) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push(std::move(result));
  }
  cv_.notify_one();
}

bool ResultQueue::pop(TranscodeResult &result) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !results_.empty() || done_.load(); });

  if (results_.empty()) {
    return false;
  }

  result = std::move(results_.front());
  results_.pop();
  return true;
}

void ResultQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

} // namespace gallery
