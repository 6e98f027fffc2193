/**
 * @file memory_io.hpp
 * @brief Loading source files into RAM
 *
 * @details Each worker reads its image fully into an owned buffer. The same
 *          buffer later becomes the "full" asset, so it is read once and
 *          never copied.
 *
 */

#ifndef GALLERY_MEMORY_IO_HPP
#define GALLERY_MEMORY_IO_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace gallery {

/**
 * @class MemoryLoader
 * @brief Reads whole files into memory.
 *
 * @attention ROBUSTNESS:
 *
 * - Validates file size before allocating
 *
 * - Retries short reads and EINTR
 *
 * - Reports a readable reason instead of logging, so the caller can attach
 *   it to a failure marker
 */
class MemoryLoader {
public:
  /**
   * @brief Read an entire regular file into memory.
   * @param path Path to the file
   * @param data Output buffer (replaced on success, untouched on failure)
   * @param error Output: reason for the failure
   * @return true on success, false on failure
   */
  static bool load_file(const std::string &path, std::vector<uint8_t> &data,
                        std::string &error);
};

} // namespace gallery

#endif // GALLERY_MEMORY_IO_HPP
