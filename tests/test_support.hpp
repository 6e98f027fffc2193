/**
 * @file test_support.hpp
 * @brief Fixtures shared by the gallery tests
 *
 * @details Temporary directories, synthetic JPEGs (FFmpeg MJPEG encoder),
 *          WebP inspection (FFmpeg WebP decoder) and zip read-back (libzip).
 */

#ifndef GALLERY_TEST_SUPPORT_HPP
#define GALLERY_TEST_SUPPORT_HPP

extern "C" {
#include <libavcodec/avcodec.h>
}

#include <zip.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gallery/ffmpeg_util.hpp"
#include "gallery/types.hpp"

namespace gallery_test {

namespace fs = std::filesystem;

/// Unique scratch directory, removed with everything in it
class TempDir {
  fs::path path_;

public:
  TempDir() {
    std::string pattern =
        (fs::temp_directory_path() / "gallery_test_XXXXXX").string();
    if (!mkdtemp(pattern.data()))
      throw std::runtime_error("mkdtemp failed");
    path_ = pattern;
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  std::string str() const { return path_.string(); }
  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }
};

inline void write_file(const std::string &path,
                       const std::vector<uint8_t> &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
  if (!out)
    throw std::runtime_error("cannot write " + path);
}

inline void write_file(const std::string &path, const std::string &text) {
  write_file(path, std::vector<uint8_t>(text.begin(), text.end()));
}

/**
 * @brief Encode a width x height test pattern as a baseline JPEG.
 * @param seed Varies the pattern so different images differ in bytes
 */
inline std::vector<uint8_t> make_jpeg(int width, int height, int seed = 0) {
  const AVCodec *codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
  if (!codec)
    throw std::runtime_error("no MJPEG encoder");

  AVCodecContext *ctx = avcodec_alloc_context3(codec);
  ctx->width = width;
  ctx->height = height;
  ctx->pix_fmt = AV_PIX_FMT_YUVJ420P;
  ctx->color_range = AVCOL_RANGE_JPEG;
  ctx->time_base = AVRational{1, 25};
  if (avcodec_open2(ctx, codec, nullptr) < 0) {
    avcodec_free_context(&ctx);
    throw std::runtime_error("cannot open MJPEG encoder");
  }

  gallery::FramePtr frame = gallery::make_frame();
  frame->format = AV_PIX_FMT_YUVJ420P;
  frame->width = width;
  frame->height = height;
  if (av_frame_get_buffer(frame.get(), 0) < 0) {
    avcodec_free_context(&ctx);
    throw std::runtime_error("cannot allocate frame");
  }

  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      frame->data[0][y * frame->linesize[0] + x] =
          static_cast<uint8_t>((x * 255 / width + y + seed * 37) & 0xFF);
    }
  }
  for (int y = 0; y < (height + 1) / 2; ++y) {
    for (int x = 0; x < (width + 1) / 2; ++x) {
      frame->data[1][y * frame->linesize[1] + x] =
          static_cast<uint8_t>(128 + ((x + seed) % 32));
      frame->data[2][y * frame->linesize[2] + x] =
          static_cast<uint8_t>(128 - ((y + seed) % 32));
    }
  }
  frame->pts = 0;

  gallery::PacketPtr pkt = gallery::make_packet();
  std::vector<uint8_t> out;
  if (avcodec_send_frame(ctx, frame.get()) >= 0 &&
      avcodec_send_frame(ctx, nullptr) >= 0 &&
      avcodec_receive_packet(ctx, pkt.get()) >= 0) {
    out.assign(pkt->data, pkt->data + pkt->size);
  }
  avcodec_free_context(&ctx);
  if (out.empty())
    throw std::runtime_error("MJPEG encode failed");
  return out;
}

/// Decode a .webp buffer and report its size; {0, 0} if it does not decode
inline gallery::Dimensions webp_dimensions(const std::vector<uint8_t> &webp) {
  gallery::Dimensions size;
  const AVCodec *codec = avcodec_find_decoder(AV_CODEC_ID_WEBP);
  if (!codec)
    return size;

  AVCodecContext *ctx = avcodec_alloc_context3(codec);
  if (avcodec_open2(ctx, codec, nullptr) < 0) {
    avcodec_free_context(&ctx);
    return size;
  }

  gallery::PacketPtr pkt = gallery::make_packet();
  gallery::FramePtr frame = gallery::make_frame();
  if (av_new_packet(pkt.get(), static_cast<int>(webp.size())) == 0) {
    std::copy(webp.begin(), webp.end(), pkt->data);
    if (avcodec_send_packet(ctx, pkt.get()) >= 0 &&
        avcodec_send_packet(ctx, nullptr) >= 0 &&
        avcodec_receive_frame(ctx, frame.get()) >= 0) {
      size = {frame->width, frame->height};
    }
  }
  avcodec_free_context(&ctx);
  return size;
}

/// "RIFF....WEBP" container signature
inline bool looks_like_webp(const std::vector<uint8_t> &data) {
  return data.size() >= 12 &&
         std::equal(data.begin(), data.begin() + 4, "RIFF") &&
         std::equal(data.begin() + 8, data.begin() + 12, "WEBP");
}

struct ZipEntry {
  std::string name;
  std::vector<uint8_t> data;
  zip_int32_t method;
};

/// Read every entry of an in-memory zip, in central directory order
inline std::vector<ZipEntry> read_zip(const std::vector<uint8_t> &zip_bytes) {
  zip_error_t err;
  zip_error_init(&err);
  zip_source_t *src =
      zip_source_buffer_create(zip_bytes.data(), zip_bytes.size(), 0, &err);
  if (!src) {
    zip_error_fini(&err);
    throw std::runtime_error("zip_source_buffer_create failed");
  }
  zip_t *archive = zip_open_from_source(src, ZIP_RDONLY | ZIP_CHECKCONS, &err);
  if (!archive) {
    std::string message = zip_error_strerror(&err);
    zip_error_fini(&err);
    zip_source_free(src);
    throw std::runtime_error("zip_open_from_source failed: " + message);
  }
  zip_error_fini(&err);

  std::vector<ZipEntry> entries;
  const zip_int64_t total = zip_get_num_entries(archive, 0);
  for (zip_int64_t i = 0; i < total; ++i) {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(archive, static_cast<zip_uint64_t>(i), 0, &st) != 0)
      continue;

    ZipEntry entry;
    entry.name = st.name;
    entry.method = static_cast<zip_int32_t>(st.comp_method);
    entry.data.resize(st.size);

    zip_file_t *file =
        zip_fopen_index(archive, static_cast<zip_uint64_t>(i), 0);
    if (!file)
      continue;
    zip_int64_t got = zip_fread(file, entry.data.data(), st.size);
    zip_fclose(file);
    if (got < 0 || static_cast<zip_uint64_t>(got) != st.size)
      continue;

    entries.push_back(std::move(entry));
  }
  zip_discard(archive);
  return entries;
}

} // namespace gallery_test

#endif // GALLERY_TEST_SUPPORT_HPP
