#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "gallery/jpeg_decoder.hpp"
#include "gallery/preview_geometry.hpp"
#include "test_support.hpp"

using namespace gallery;

namespace {

const Dimensions BOX{DEFAULT_PREVIEW_WIDTH, DEFAULT_PREVIEW_HEIGHT};

} // namespace

// **---- Reduction selection ----**

TEST(PreviewGeometryTest, ReducedSizeRoundsUp) {
  Dimensions size = reduced_size({1001, 667}, 1);
  EXPECT_EQ(size.width, 501);
  EXPECT_EQ(size.height, 334);

  size = reduced_size({1001, 667}, 3);
  EXPECT_EQ(size.width, 126);
  EXPECT_EQ(size.height, 84);
}

TEST(PreviewGeometryTest, SmallSourceIsNotReduced) {
  EXPECT_EQ(select_lowres({640, 480}, BOX, 3), 0);
  EXPECT_EQ(select_lowres({900, 600}, BOX, 3), 0);
}

TEST(PreviewGeometryTest, PicksSmallestReductionThatFits) {
  EXPECT_EQ(select_lowres({1800, 1200}, BOX, 3), 1);
  EXPECT_EQ(select_lowres({1801, 1200}, BOX, 3), 2);
  EXPECT_EQ(select_lowres({4000, 3000}, BOX, 3), 3);
  /// Portrait: height decides
  EXPECT_EQ(select_lowres({1000, 2400}, BOX, 3), 2);
}

TEST(PreviewGeometryTest, HugeSourceUsesLargestReduction) {
  EXPECT_EQ(select_lowres({20000, 15000}, BOX, 3), 3);
  EXPECT_EQ(select_lowres({20000, 15000}, BOX, 0), 0);
}

// **---- Final fit ----**

TEST(PreviewGeometryTest, FitNeverUpscales) {
  Dimensions size = fit_within({320, 200}, BOX);
  EXPECT_EQ(size.width, 320);
  EXPECT_EQ(size.height, 200);
}

TEST(PreviewGeometryTest, FitPreservesAspectRatio) {
  const std::vector<Dimensions> sources = {
      {2500, 1000}, {1000, 2500}, {1200, 900}, {20000, 10}, {901, 601}};
  for (const auto &source : sources) {
    Dimensions fitted = fit_within(source, BOX);
    EXPECT_LE(fitted.width, BOX.width);
    EXPECT_LE(fitted.height, BOX.height);
    EXPECT_GE(fitted.width, 1);
    EXPECT_GE(fitted.height, 1);

    const double source_ratio =
        static_cast<double>(source.width) / source.height;
    const double fitted_ratio =
        static_cast<double>(fitted.width) / fitted.height;
    /// One pixel of rounding on the short side
    const double tolerance =
        source_ratio / std::min(fitted.width, fitted.height) + 1e-9;
    if (fitted.height > 1 && fitted.width > 1) {
      EXPECT_NEAR(fitted_ratio, source_ratio, tolerance * 1.5)
          << source.width << "x" << source.height;
    }
  }
}

TEST(PreviewGeometryTest, FitTouchesTheLimitingSide) {
  Dimensions wide = fit_within({1800, 600}, BOX);
  EXPECT_EQ(wide.width, 900);
  EXPECT_EQ(wide.height, 300);

  Dimensions tall = fit_within({600, 1800}, BOX);
  EXPECT_EQ(tall.width, 200);
  EXPECT_EQ(tall.height, 600);
}

TEST(PreviewGeometryTest, DegenerateBoxStillYieldsAPixel) {
  Dimensions fitted = fit_within({900, 600}, {0, 600});
  EXPECT_EQ(fitted.width, 1);
  EXPECT_GE(fitted.height, 1);

  fitted = fit_within({900, 600}, {-5, -5});
  EXPECT_EQ(fitted.width, 1);
  EXPECT_EQ(fitted.height, 1);
}

// **---- Frame header ----**

TEST(JpegHeaderTest, ReadsFrameSize) {
  std::vector<uint8_t> jpeg = gallery_test::make_jpeg(123, 45);
  Dimensions size;
  std::string error;
  ASSERT_TRUE(probe_jpeg_size(jpeg.data(), jpeg.size(), size, error)) << error;
  EXPECT_EQ(size.width, 123);
  EXPECT_EQ(size.height, 45);
}

TEST(JpegHeaderTest, RejectsNonJpeg) {
  const std::string text = "definitely not a jpeg";
  Dimensions size;
  std::string error;
  EXPECT_FALSE(probe_jpeg_size(reinterpret_cast<const uint8_t *>(text.data()),
                               text.size(), size, error));
  EXPECT_FALSE(error.empty());
}

TEST(JpegHeaderTest, RejectsTruncatedHeader) {
  std::vector<uint8_t> jpeg = gallery_test::make_jpeg(64, 64);
  Dimensions size;
  std::string error;
  EXPECT_FALSE(probe_jpeg_size(jpeg.data(), 10, size, error));
  EXPECT_FALSE(error.empty());
}

TEST(JpegHeaderTest, RejectsEmptyBuffer) {
  Dimensions size;
  std::string error;
  EXPECT_FALSE(probe_jpeg_size(nullptr, 0, size, error));
}
