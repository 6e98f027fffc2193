/**
 * @file gallery.cpp
 * @brief Gallery build orchestration implementation
 *
 * @details Orchestrates the build phase:
 *
 *          1. Scan the directory
 *
 *          2. Fan transcodes out over the worker pool
 *
 *          3. Drain results on the aggregator thread
 *
 *          4. Freeze archive, asset table and listing
 */

#include "gallery/gallery.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "gallery/aggregator.hpp"
#include "gallery/config.hpp"
#include "gallery/logging.hpp"
#include "gallery/result_queue.hpp"
#include "gallery/scanner.hpp"
#include "gallery/system.hpp"
#include "gallery/worker_pool.hpp"

namespace gallery {

// **---- Options ----**

BuildOptions BuildOptions::from_config() {
  BuildOptions options;
  options.workers = Config::worker_threads();
  options.preview.box = {Config::preview_max_width(),
                         Config::preview_max_height()};
  options.preview.quality = Config::preview_quality();
  options.validate();
  return options;
}

void BuildOptions::validate() const {
  if (workers < 0) {
    throw std::runtime_error(
        fmt::format("GALLERY_WORKERS must be 0 (auto) or positive, got {}",
                    workers));
  }
  if (preview.box.width <= 0) {
    throw std::runtime_error(fmt::format(
        "PREVIEW_MAX_WIDTH must be positive, got {}", preview.box.width));
  }
  if (preview.box.height <= 0) {
    throw std::runtime_error(fmt::format(
        "PREVIEW_MAX_HEIGHT must be positive, got {}", preview.box.height));
  }
  if (!(preview.quality >= 0.0f && preview.quality <= 100.0f)) {
    throw std::runtime_error(fmt::format(
        "PREVIEW_QUALITY must be within 0-100, got {}", preview.quality));
  }
}

// **---- Constructor ----**

GalleryBuilder::GalleryBuilder(std::string directory, BuildOptions options)
    : directory_(std::move(directory)), options_(options),
      transcode_(make_transcoder(options.preview)) {
  options_.validate();
}

// **---- Build ----**

Gallery GalleryBuilder::build() {
  TIMER_START(build);
  auto build_start = std::chrono::steady_clock::now();

  LOG_PHASE("=================== GALLERY BUILD ===================");
  LOG_INFO("Directory: {}", directory_);
  LOG_INFO("Preview box: {}x{} @ quality {:.0f}", options_.preview.box.width,
           options_.preview.box.height, options_.preview.quality);

  // **----- PHASE 1: SCAN -----**

  LOG_PHASE("Scanning...");
  TIMER_START(scan);
  ScanResult scan = scan_directory(directory_);
  TIMER_END(scan);

  const size_t total = scan.images.size();
  LOG_INFO("Found {} JPEG candidates ({} skipped)", total, scan.skipped);

  // **----- PHASE 2: TRANSCODE -----**

  LOG_PHASE("Transcoding...");
  TIMER_START(transcode_all);

  ResultQueue results;
  ResultAggregator aggregator(total);

  WorkerPool pool(options_.workers);
  LOG_INFO("Worker limit: {} threads", pool.max_workers());
  pool.start(std::move(scan.images), transcode_, &results);

  /// Single consumer: the only thread that touches archive and table
  std::exception_ptr consumer_error;
  std::thread consumer([&aggregator, &results, &consumer_error]() {
    try {
      aggregator.drain(results);
    } catch (const std::exception &) {
      consumer_error = std::current_exception();
    }
  });

  /// Barrier: every worker has exited and the queue is closed
  pool.wait();
  consumer.join();
  TIMER_END(transcode_all);

  if (consumer_error)
    std::rethrow_exception(consumer_error);

  // **----- PHASE 3: FREEZE -----**

  LOG_PHASE("Packaging...");
  TIMER_START(package);
  Gallery gallery = aggregator.finalize();
  TIMER_END(package);

  gallery.stats.skipped = scan.skipped;

  TIMER_END(build);
  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - build_start)
                           .count();
  print_build_summary(gallery.stats, elapsed_sec);

  return gallery;
}

// **---- Build Summary ----**

void GalleryBuilder::print_build_summary(const BuildStats &stats,
                                         double elapsed_sec) const {
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== BUILD SUMMARY ===================\n");

  fmt::print("{:<20} {:>15}\n", "Candidates:", stats.candidates);
  fmt::print("{:<20} {:>15}\n", "Skipped entries:", stats.skipped);
  fmt::print("{:<20} {:>15}\n", "Published:", stats.succeeded);
  fmt::print("{:<20} {:>15}\n", "Failed:", stats.failed);
  fmt::print("{:<20} {:>15}\n", "Originals:",
             format_size(stats.original_bytes));
  fmt::print("{:<20} {:>15}\n", "Previews:", format_size(stats.preview_bytes));
  fmt::print("{:<20} {:>15}\n", "Archive:", format_size(stats.archive_bytes));
  fmt::print("{:<20} {:>14.2f}s\n", "Wall time:", elapsed_sec);

  if (!stats.failures.empty()) {
    fmt::print(fg(fmt::color::yellow), "Failed images:\n");
    for (const auto &failure : stats.failures) {
      fmt::print("  {}: {}\n", failure.file_name, failure.error);
    }
  }

  fmt::print(fg(fmt::color::cyan),
             "=====================================================\n");
  std::fflush(stdout);
}

} // namespace gallery
