#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gallery/result_queue.hpp"
#include "gallery/system.hpp"
#include "gallery/worker_pool.hpp"

using namespace gallery;

namespace {

std::vector<SourceImage> make_images(size_t count) {
  std::vector<SourceImage> images;
  for (size_t i = 0; i < count; ++i) {
    SourceImage image;
    image.ordinal = i;
    image.file_name = std::to_string(i) + ".jpg";
    image.display_name = std::to_string(i);
    image.path = "/nonexistent/" + image.file_name;
    images.push_back(image);
  }
  return images;
}

TranscodeResult fake_success(const SourceImage &image) {
  return TranscodeResult::completed(
      image, make_bytes(std::vector<uint8_t>(image.file_name.begin(),
                                             image.file_name.end())),
      make_bytes(std::vector<uint8_t>{1, 2, 3}), Dimensions{3, 1});
}

std::vector<TranscodeResult> collect(ResultQueue &queue) {
  std::vector<TranscodeResult> results;
  TranscodeResult result;
  while (queue.pop(result))
    results.push_back(std::move(result));
  return results;
}

} // namespace

TEST(WorkerPoolTest, EveryImageYieldsExactlyOneResult) {
  constexpr size_t COUNT = 64;
  ResultQueue queue;
  WorkerPool pool(4);

  std::mt19937 rng(42);
  std::vector<int> delays(COUNT);
  for (auto &delay : delays)
    delay = static_cast<int>(rng() % 5);

  pool.start(make_images(COUNT),
             [&delays](const SourceImage &image) {
               std::this_thread::sleep_for(
                   std::chrono::milliseconds(delays[image.ordinal]));
               return fake_success(image);
             },
             &queue);
  pool.wait();

  std::vector<TranscodeResult> results = collect(queue);
  ASSERT_EQ(results.size(), COUNT);

  std::set<size_t> ordinals;
  for (const auto &result : results) {
    EXPECT_TRUE(result.success);
    ordinals.insert(result.ordinal);
  }
  EXPECT_EQ(ordinals.size(), COUNT);
  EXPECT_TRUE(queue.is_done());
}

TEST(WorkerPoolTest, ConcurrencyNeverExceedsWorkerCount) {
  constexpr int WORKERS = 3;
  std::atomic<int> active{0};
  std::atomic<int> peak{0};

  ResultQueue queue;
  WorkerPool pool(WORKERS);
  pool.start(make_images(30),
             [&](const SourceImage &image) {
               int now = ++active;
               int seen = peak.load();
               while (now > seen && !peak.compare_exchange_weak(seen, now)) {
               }
               std::this_thread::sleep_for(std::chrono::milliseconds(2));
               --active;
               return fake_success(image);
             },
             &queue);
  EXPECT_LE(pool.active_workers(), WORKERS);
  pool.wait();

  EXPECT_EQ(collect(queue).size(), 30u);
  EXPECT_LE(peak.load(), WORKERS);
  EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, ReportsConfiguredLimit) {
  EXPECT_EQ(WorkerPool(3).max_workers(), 3);
  EXPECT_EQ(WorkerPool(0).max_workers(), detect_cpu_limit());
}

TEST(WorkerPoolTest, NeverStartsMoreWorkersThanImages) {
  ResultQueue queue;
  WorkerPool pool(16);
  pool.start(make_images(2), fake_success, &queue);
  EXPECT_EQ(pool.active_workers(), 2);
  pool.wait();
  EXPECT_EQ(collect(queue).size(), 2u);
}

TEST(WorkerPoolTest, ExceptionBecomesFailureMarker) {
  ResultQueue queue;
  WorkerPool pool(2);
  pool.start(make_images(6),
             [](const SourceImage &image) -> TranscodeResult {
               if (image.ordinal % 2 == 1)
                 throw std::runtime_error("boom " + image.file_name);
               return fake_success(image);
             },
             &queue);
  pool.wait();

  std::vector<TranscodeResult> results = collect(queue);
  ASSERT_EQ(results.size(), 6u);
  for (const auto &result : results) {
    if (result.ordinal % 2 == 1) {
      EXPECT_FALSE(result.success);
      EXPECT_EQ(result.error, "boom " + result.file_name);
    } else {
      EXPECT_TRUE(result.success);
    }
  }
}

TEST(WorkerPoolTest, MislabelledResultBecomesFailureMarker) {
  ResultQueue queue;
  WorkerPool pool(1);
  pool.start(make_images(1),
             [](const SourceImage &image) {
               TranscodeResult result = fake_success(image);
               result.ordinal = 99;
               return result;
             },
             &queue);
  pool.wait();

  std::vector<TranscodeResult> results = collect(queue);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].ordinal, 0u);
  EXPECT_FALSE(results[0].success);
}

TEST(WorkerPoolTest, NoImagesClosesQueueImmediately) {
  ResultQueue queue;
  WorkerPool pool(4);
  pool.start({}, fake_success, &queue);
  EXPECT_EQ(pool.active_workers(), 0);
  pool.wait();

  TranscodeResult result;
  EXPECT_FALSE(queue.pop(result));
}

TEST(WorkerPoolTest, SecondStartThrows) {
  ResultQueue queue;
  WorkerPool pool(1);
  pool.start(make_images(1), fake_success, &queue);
  EXPECT_THROW(pool.start(make_images(1), fake_success, &queue),
               std::logic_error);
  pool.wait();
}

TEST(WorkerPoolTest, MissingQueueThrows) {
  WorkerPool pool(1);
  EXPECT_THROW(pool.start(make_images(1), fake_success, nullptr),
               std::logic_error);
}

TEST(WorkerPoolTest, DestructorJoinsAndClosesQueue) {
  ResultQueue queue;
  {
    WorkerPool pool(2);
    pool.start(make_images(5), fake_success, &queue);
  }
  EXPECT_EQ(collect(queue).size(), 5u);
}
