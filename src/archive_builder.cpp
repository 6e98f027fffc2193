/**
 * @file archive_builder.cpp
 * @brief In-memory zip writer implementation
 */

#include "gallery/archive_builder.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace gallery {

namespace {

/// End-of-central-directory record of a zip with no entries
constexpr uint8_t EMPTY_ZIP[22] = {0x50, 0x4B, 0x05, 0x06};

std::string take_error(zip_error_t &err) {
  std::string message = zip_error_strerror(&err);
  zip_error_fini(&err);
  return message;
}

} // anonymous namespace

ArchiveBuilder::ArchiveBuilder() {
  zip_error_t err;
  zip_error_init(&err);

  source_ = zip_source_buffer_create(nullptr, 0, 0, &err);
  if (!source_) {
    throw std::runtime_error(
        fmt::format("zip: cannot create buffer: {}", take_error(err)));
  }

  archive_ = zip_open_from_source(source_, ZIP_CREATE | ZIP_TRUNCATE, &err);
  if (!archive_) {
    zip_source_free(source_);
    source_ = nullptr;
    throw std::runtime_error(
        fmt::format("zip: cannot open archive: {}", take_error(err)));
  }
  zip_error_fini(&err);

  /// Keep the buffer alive past zip_close() so it can be read back
  zip_source_keep(source_);
}

ArchiveBuilder::~ArchiveBuilder() {
  if (archive_)
    zip_discard(archive_);
  if (source_)
    zip_source_free(source_);
}

void ArchiveBuilder::append(const std::string &name, Bytes bytes) {
  if (finalized_)
    throw std::logic_error(fmt::format("zip: append '{}' after finalize", name));
  if (!bytes)
    throw std::logic_error(fmt::format("zip: no data for '{}'", name));
  if (names_.count(name))
    throw std::logic_error(fmt::format("zip: duplicate entry '{}'", name));

  zip_source_t *entry =
      zip_source_buffer(archive_, bytes->data(), bytes->size(), 0);
  if (!entry) {
    throw std::runtime_error(
        fmt::format("zip: cannot add '{}': {}", name, zip_strerror(archive_)));
  }

  const zip_int64_t index =
      zip_file_add(archive_, name.c_str(), entry, ZIP_FL_ENC_UTF_8);
  if (index < 0) {
    zip_source_free(entry);
    throw std::runtime_error(
        fmt::format("zip: cannot add '{}': {}", name, zip_strerror(archive_)));
  }

  if (zip_set_file_compression(archive_, static_cast<zip_uint64_t>(index),
                               ZIP_CM_STORE, 0) < 0) {
    throw std::runtime_error(fmt::format("zip: cannot store '{}': {}", name,
                                         zip_strerror(archive_)));
  }

  pending_.push_back(std::move(bytes));
  names_.insert(name);
}

Bytes ArchiveBuilder::finalize() {
  if (finalized_)
    throw std::logic_error("zip: finalize called twice");
  finalized_ = true;

  /// libzip removes an archive without entries on close instead of writing
  /// an empty central directory
  if (names_.empty()) {
    zip_discard(archive_);
    archive_ = nullptr;
    return make_bytes(
        std::vector<uint8_t>(EMPTY_ZIP, EMPTY_ZIP + sizeof(EMPTY_ZIP)));
  }

  if (zip_close(archive_) < 0) {
    std::string message = zip_strerror(archive_);
    zip_discard(archive_);
    archive_ = nullptr;
    throw std::runtime_error(
        fmt::format("zip: cannot write archive: {}", message));
  }
  archive_ = nullptr;
  pending_.clear();

  return read_back();
}

Bytes ArchiveBuilder::read_back() {
  if (zip_source_open(source_) < 0) {
    throw std::runtime_error(fmt::format(
        "zip: cannot reopen buffer: {}",
        zip_error_strerror(zip_source_error(source_))));
  }

  zip_int64_t size = -1;
  if (zip_source_seek(source_, 0, SEEK_END) == 0) {
    size = zip_source_tell(source_);
  }
  if (size < 0 || zip_source_seek(source_, 0, SEEK_SET) < 0) {
    std::string message = zip_error_strerror(zip_source_error(source_));
    zip_source_close(source_);
    throw std::runtime_error(
        fmt::format("zip: cannot size buffer: {}", message));
  }

  std::vector<uint8_t> data(static_cast<size_t>(size));
  const zip_int64_t got =
      zip_source_read(source_, data.data(), static_cast<zip_uint64_t>(size));
  zip_source_close(source_);
  if (got != size) {
    throw std::runtime_error(
        fmt::format("zip: short read ({} of {} bytes)", got, size));
  }

  return make_bytes(std::move(data));
}

} // namespace gallery
