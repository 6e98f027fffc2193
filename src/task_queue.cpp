/**
 * @file task_queue.cpp
 * @brief Thread-safe work queue implementation
 */

#include "gallery/task_queue.hpp"

#include <utility>

namespace gallery {

void TaskQueue::push(SourceImage task) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    tasks.push(std::move(task));
  }
  cv.notify_one();
}

bool TaskQueue::pop(SourceImage &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = std::move(tasks.front());
  tasks.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

} // namespace gallery
