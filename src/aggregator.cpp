/**
 * @file aggregator.cpp
 * @brief Ordered result collection implementation
 */

#include "gallery/aggregator.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "gallery/archive_builder.hpp"
#include "gallery/logging.hpp"

namespace gallery {

ResultAggregator::ResultAggregator(size_t expected)
    : expected_(expected), slots_(expected), seen_(expected, false) {}

void ResultAggregator::add(TranscodeResult result) {
  if (finalized_)
    throw std::logic_error("result received after finalize");
  if (result.ordinal >= expected_) {
    throw std::logic_error(fmt::format("result ordinal {} out of range (N={})",
                                       result.ordinal, expected_));
  }
  if (seen_[result.ordinal]) {
    throw std::logic_error(
        fmt::format("second result for ordinal {} ({})", result.ordinal,
                    result.file_name));
  }
  seen_[result.ordinal] = true;
  received_++;

  if (!result.success) {
    LOG_ERROR("Excluded {}: {}", result.file_name, result.error);
    failures_.push_back({result.ordinal, result.file_name, result.error});
    return;
  }

  if (!result.full || !result.preview) {
    throw std::logic_error(fmt::format(
        "successful result for {} is missing image data", result.file_name));
  }
  slots_[result.ordinal] = std::move(result);
}

size_t ResultAggregator::drain(ResultQueue &queue) {
  size_t consumed = 0;
  TranscodeResult result;
  while (queue.pop(result)) {
    add(std::move(result));
    consumed++;
  }
  return consumed;
}

Gallery ResultAggregator::finalize() {
  if (finalized_)
    throw std::logic_error("finalize called twice");
  if (received_ != expected_) {
    throw std::logic_error(fmt::format(
        "finalize before all results arrived ({} of {})", received_,
        expected_));
  }
  finalized_ = true;

  auto table = std::make_shared<AssetTable>();
  auto listing = std::make_shared<std::vector<PresentationEntry>>();
  ArchiveBuilder archive;

  BuildStats stats;
  stats.candidates = expected_;

  /// Slot order is scan order, whatever order the results arrived in
  for (auto &slot : slots_) {
    if (!slot.success)
      continue;

    archive.append(slot.file_name, slot.full);

    PresentationEntry entry;
    entry.display_name = slot.display_name;
    entry.full_key = full_image_key(slot.file_name);
    entry.preview_key = preview_image_key(slot.display_name);

    stats.original_bytes += slot.full->size();
    stats.preview_bytes += slot.preview->size();

    table->insert(entry.full_key,
                  Asset{std::move(slot.full), ContentType::Jpeg});
    table->insert(entry.preview_key,
                  Asset{std::move(slot.preview), ContentType::Webp});
    listing->push_back(std::move(entry));
  }

  Bytes zip = archive.finalize();
  stats.archive_bytes = zip->size();
  table->insert(ARCHIVE_ROUTE_KEY, Asset{std::move(zip), ContentType::Zip});

  stats.succeeded = listing->size();
  stats.failed = failures_.size();
  std::sort(failures_.begin(), failures_.end(),
            [](const FailedImage &a, const FailedImage &b) {
              return a.ordinal < b.ordinal;
            });
  stats.failures = std::move(failures_);

  slots_.clear();

  Gallery gallery;
  gallery.assets = std::move(table);
  gallery.listing = std::move(listing);
  gallery.stats = std::move(stats);
  return gallery;
}

} // namespace gallery
