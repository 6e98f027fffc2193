#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gallery/aggregator.hpp"
#include "gallery/result_queue.hpp"
#include "test_support.hpp"

using namespace gallery;

namespace {

SourceImage image_at(size_t ordinal, const std::string &stem) {
  SourceImage image;
  image.ordinal = ordinal;
  image.file_name = stem + ".jpg";
  image.display_name = stem;
  return image;
}

Bytes bytes_of(const std::string &text) {
  return make_bytes(std::vector<uint8_t>(text.begin(), text.end()));
}

TranscodeResult success_at(size_t ordinal, const std::string &stem) {
  return TranscodeResult::completed(image_at(ordinal, stem),
                                    bytes_of("jpeg:" + stem),
                                    bytes_of("webp:" + stem), {10, 10});
}

TranscodeResult failure_at(size_t ordinal, const std::string &stem) {
  return TranscodeResult::failure(image_at(ordinal, stem), "decode: broken");
}

std::string text_of(const Bytes &bytes) {
  return std::string(bytes->begin(), bytes->end());
}

std::vector<std::string> listing_names(const Gallery &gallery) {
  std::vector<std::string> names;
  for (const auto &entry : *gallery.listing)
    names.push_back(entry.display_name);
  return names;
}

} // namespace

TEST(ResultAggregatorTest, OrdersByOrdinalNotArrival) {
  const std::vector<std::string> stems = {"a", "b", "c", "d", "e", "f"};
  std::vector<size_t> order(stems.size());
  std::iota(order.begin(), order.end(), 0);

  std::mt19937 rng(7);
  for (int round = 0; round < 5; ++round) {
    std::shuffle(order.begin(), order.end(), rng);

    ResultAggregator aggregator(stems.size());
    for (size_t ordinal : order)
      aggregator.add(success_at(ordinal, stems[ordinal]));
    Gallery gallery = aggregator.finalize();

    EXPECT_EQ(listing_names(gallery), stems);

    auto zip = gallery.assets->get(ARCHIVE_ROUTE_KEY);
    ASSERT_TRUE(zip.has_value());
    auto entries = gallery_test::read_zip(*zip->bytes);
    ASSERT_EQ(entries.size(), stems.size());
    for (size_t i = 0; i < stems.size(); ++i)
      EXPECT_EQ(entries[i].name, stems[i] + ".jpg");
  }
}

TEST(ResultAggregatorTest, PublishesEveryRouteOfASuccess) {
  ResultAggregator aggregator(1);
  aggregator.add(success_at(0, "a"));
  Gallery gallery = aggregator.finalize();

  ASSERT_EQ(gallery.listing->size(), 1u);
  const PresentationEntry &entry = gallery.listing->front();
  EXPECT_EQ(entry.display_name, "a");
  EXPECT_EQ(entry.full_key, "/a.jpg");
  EXPECT_EQ(entry.preview_key, "/a.webp");

  auto full = gallery.assets->get("/a.jpg");
  ASSERT_TRUE(full.has_value());
  EXPECT_EQ(full->content_type, ContentType::Jpeg);
  EXPECT_EQ(text_of(full->bytes), "jpeg:a");

  auto preview = gallery.assets->get("/a.webp");
  ASSERT_TRUE(preview.has_value());
  EXPECT_EQ(preview->content_type, ContentType::Webp);
  EXPECT_EQ(text_of(preview->bytes), "webp:a");

  auto zip = gallery.assets->get("/gallery.zip");
  ASSERT_TRUE(zip.has_value());
  EXPECT_EQ(zip->content_type, ContentType::Zip);

  EXPECT_EQ(gallery.assets->size(), 3u);
}

TEST(ResultAggregatorTest, FailuresAreExcludedEverywhere) {
  ResultAggregator aggregator(4);
  aggregator.add(failure_at(3, "d"));
  aggregator.add(success_at(1, "b"));
  aggregator.add(failure_at(2, "c"));
  aggregator.add(success_at(0, "a"));
  Gallery gallery = aggregator.finalize();

  EXPECT_EQ(listing_names(gallery), (std::vector<std::string>{"a", "b"}));
  EXPECT_FALSE(gallery.assets->contains("/c.jpg"));
  EXPECT_FALSE(gallery.assets->contains("/c.webp"));
  EXPECT_FALSE(gallery.assets->contains("/d.jpg"));

  auto entries =
      gallery_test::read_zip(*gallery.assets->get("/gallery.zip")->bytes);
  ASSERT_EQ(entries.size(), 2u);

  EXPECT_EQ(gallery.stats.candidates, 4u);
  EXPECT_EQ(gallery.stats.succeeded, 2u);
  EXPECT_EQ(gallery.stats.failed, 2u);
  ASSERT_EQ(gallery.stats.failures.size(), 2u);
  EXPECT_EQ(gallery.stats.failures[0].file_name, "c.jpg");
  EXPECT_EQ(gallery.stats.failures[1].file_name, "d.jpg");
  EXPECT_EQ(gallery.stats.failures[0].error, "decode: broken");
  EXPECT_EQ(gallery.stats.succeeded + gallery.stats.failed,
            gallery.stats.candidates);
}

TEST(ResultAggregatorTest, NothingExpectedGivesEmptyGallery) {
  ResultAggregator aggregator(0);
  Gallery gallery = aggregator.finalize();
  EXPECT_TRUE(gallery.listing->empty());
  EXPECT_EQ(gallery.assets->size(), 1u);
  EXPECT_TRUE(
      gallery_test::read_zip(*gallery.assets->get("/gallery.zip")->bytes)
          .empty());
}

TEST(ResultAggregatorTest, DrainConsumesUntilClose) {
  ResultQueue queue;
  ResultAggregator aggregator(3);

  std::thread producer([&queue]() {
    queue.push(success_at(2, "c"));
    queue.push(success_at(0, "a"));
    queue.push(failure_at(1, "b"));
    queue.finish();
  });
  EXPECT_EQ(aggregator.drain(queue), 3u);
  producer.join();

  EXPECT_EQ(aggregator.received(), 3u);
  Gallery gallery = aggregator.finalize();
  EXPECT_EQ(listing_names(gallery), (std::vector<std::string>{"a", "c"}));
}

TEST(ResultAggregatorTest, FinalizeBeforeAllResultsThrows) {
  ResultAggregator aggregator(2);
  aggregator.add(success_at(0, "a"));
  EXPECT_THROW(aggregator.finalize(), std::logic_error);
}

TEST(ResultAggregatorTest, DuplicateOrdinalThrows) {
  ResultAggregator aggregator(2);
  aggregator.add(success_at(0, "a"));
  EXPECT_THROW(aggregator.add(success_at(0, "a")), std::logic_error);
  EXPECT_THROW(aggregator.add(failure_at(0, "a")), std::logic_error);
}

TEST(ResultAggregatorTest, OutOfRangeOrdinalThrows) {
  ResultAggregator aggregator(2);
  EXPECT_THROW(aggregator.add(success_at(2, "c")), std::logic_error);
}

TEST(ResultAggregatorTest, SuccessWithoutDataThrows) {
  ResultAggregator aggregator(1);
  TranscodeResult result = success_at(0, "a");
  result.preview.reset();
  EXPECT_THROW(aggregator.add(std::move(result)), std::logic_error);
}

TEST(ResultAggregatorTest, SecondFinalizeThrows) {
  ResultAggregator aggregator(1);
  aggregator.add(success_at(0, "a"));
  aggregator.finalize();
  EXPECT_THROW(aggregator.finalize(), std::logic_error);
  EXPECT_THROW(aggregator.add(success_at(0, "a")), std::logic_error);
}
