/**
 * @file scanner.cpp
 * @brief Directory scan implementation
 */

#include "gallery/scanner.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <utility>

#include <fmt/core.h>

#include "gallery/logging.hpp"

namespace gallery {

namespace fs = std::filesystem;

bool has_jpeg_extension(const std::string &file_name) {
  std::string ext = fs::path(file_name).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".jpg" || ext == ".jpeg";
}

ScanResult scan_directory(const std::string &dir) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw std::runtime_error(
        fmt::format("cannot list directory '{}': {}", dir, ec.message()));
  }

  ScanResult result;
  /// display_name -> file that claimed it first
  std::unordered_map<std::string, std::string> taken;

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;

    const fs::directory_entry &entry = *it;
    std::string file_name = entry.path().filename().string();
    if (!has_jpeg_extension(file_name))
      continue;

    std::error_code entry_ec;
    bool regular = entry.is_regular_file(entry_ec);
    if (entry_ec) {
      LOG_WARN("Skipping {}: {}", file_name, entry_ec.message());
      result.skipped++;
      continue;
    }
    if (!regular)
      continue;

    std::string display_name = entry.path().stem().string();
    auto claimed = taken.emplace(display_name, file_name);
    if (!claimed.second) {
      LOG_WARN("Skipping {}: name '{}' already used by {}", file_name,
               display_name, claimed.first->second);
      result.skipped++;
      continue;
    }

    SourceImage image;
    image.ordinal = result.images.size();
    image.path = entry.path().string();
    image.file_name = std::move(file_name);
    image.display_name = std::move(display_name);
    result.images.push_back(std::move(image));
  }

  /// The listing broke off part way; what was collected so far is kept
  if (ec) {
    LOG_WARN("Directory listing of {} stopped early: {}", dir, ec.message());
  }

  return result;
}

} // namespace gallery
