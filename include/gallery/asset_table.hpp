/**
 * @file asset_table.hpp
 * @brief Route key to asset mapping served after the build
 *
 * @details Filled by the aggregator during the build phase, then frozen by
 *          handing it out as std::shared_ptr<const AssetTable>. After that
 *          only const member functions are reachable, and any number of
 *          threads may read it without locking.
 */

#ifndef GALLERY_ASSET_TABLE_HPP
#define GALLERY_ASSET_TABLE_HPP

#include <optional>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace gallery {

/// Fixed route key of the zip of all originals
constexpr const char *ARCHIVE_ROUTE_KEY = "/gallery.zip";

enum class ContentType { Jpeg, Webp, Zip };

/// MIME type sent with an asset of this type
const char *mime_type(ContentType type);

/**
 * @struct Asset
 * @brief One retrievable byte buffer and its content type.
 */
struct Asset {
  Bytes bytes;
  ContentType content_type = ContentType::Jpeg;
};

/// Route key of the original image: "/<file_name>"
std::string full_image_key(const std::string &file_name);

/// Route key of the preview: "/<display_name>.webp"
std::string preview_image_key(const std::string &display_name);

/**
 * @class AssetTable
 * @brief Hash map of route keys, written once and read concurrently.
 */
class AssetTable {
  std::unordered_map<std::string, Asset> assets_;
  size_t total_bytes_ = 0;

public:
  /**
   * @brief Register an asset under key.
   * @throws std::logic_error if key is already present or bytes is null
   */
  void insert(const std::string &key, Asset asset);

  /// Lookup by route key; empty if absent
  std::optional<Asset> get(const std::string &key) const;

  bool contains(const std::string &key) const;
  size_t size() const { return assets_.size(); }

  /// Sum of all asset sizes
  size_t total_bytes() const { return total_bytes_; }
};

} // namespace gallery

#endif // GALLERY_ASSET_TABLE_HPP
