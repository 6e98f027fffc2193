/**
 * @file asset_table.cpp
 * @brief Route key to asset mapping implementation
 */

#include "gallery/asset_table.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace gallery {

const char *mime_type(ContentType type) {
  switch (type) {
  case ContentType::Jpeg:
    return "image/jpeg";
  case ContentType::Webp:
    return "image/webp";
  case ContentType::Zip:
    return "application/zip";
  }
  return "application/octet-stream";
}

std::string full_image_key(const std::string &file_name) {
  return "/" + file_name;
}

std::string preview_image_key(const std::string &display_name) {
  return "/" + display_name + ".webp";
}

void AssetTable::insert(const std::string &key, Asset asset) {
  if (!asset.bytes)
    throw std::logic_error(fmt::format("asset '{}' has no data", key));

  const size_t size = asset.bytes->size();
  if (!assets_.emplace(key, std::move(asset)).second)
    throw std::logic_error(fmt::format("duplicate asset key '{}'", key));
  total_bytes_ += size;
}

std::optional<Asset> AssetTable::get(const std::string &key) const {
  auto it = assets_.find(key);
  if (it == assets_.end())
    return std::nullopt;
  return it->second;
}

bool AssetTable::contains(const std::string &key) const {
  return assets_.find(key) != assets_.end();
}

} // namespace gallery
