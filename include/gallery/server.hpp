/**
 * @file server.hpp
 * @brief HTTP front of a frozen Gallery
 *
 * @details Serves the listing page at "/" and every asset of the Gallery
 *          under its route key. The Gallery is immutable, so the handlers
 *          read it from any number of server threads without locking.
 */

#ifndef GALLERY_SERVER_HPP
#define GALLERY_SERVER_HPP

#include <memory>
#include <string>
#include <vector>

#include "snapshot.hpp"
#include "types.hpp"

namespace httplib {
class Server;
}

namespace gallery {

/// Escape &, <, >, " and ' for HTML text and attribute values
std::string html_escape(const std::string &text);

/// Percent-encode a route key for use in a URL (keeps '/' and unreserved)
std::string url_encode_path(const std::string &key);

/**
 * @brief Render the listing page: one preview per entry, in list order,
 *        each linking to its original, plus a link to the archive.
 */
std::string render_index_page(const std::vector<PresentationEntry> &listing);

/**
 * @struct ListenOptions
 * @brief Where the server listens.
 */
struct ListenOptions {
  std::string host = "0.0.0.0";
  int port = 8080; //< 0 = any free port

  /**
   * @brief Options from GALLERY_HOST / GALLERY_PORT.
   * @throws std::runtime_error naming the variable if a value is malformed
   *         or out of range
   */
  static ListenOptions from_config();

  /// @throws std::runtime_error on an empty host or a port outside 0-65535
  void validate() const;
};

/**
 * @class GalleryServer
 * @brief cpp-httplib server bound to one Gallery.
 *
 * @attention USAGE:
 *
 *   - bind() once, then listen_after_bind() blocks until stop()
 *
 *   - stop() is safe to call from any thread, including a signal thread
 */
class GalleryServer {
  Gallery gallery_;
  std::string index_page_;
  std::unique_ptr<httplib::Server> server_;

  void register_routes();

public:
  explicit GalleryServer(Gallery gallery);
  ~GalleryServer();

  GalleryServer(const GalleryServer &) = delete;
  GalleryServer &operator=(const GalleryServer &) = delete;

  /**
   * @brief Bind the listening socket.
   * @param host Address to bind
   * @param port Port to bind (0 = any free port)
   * @return The bound port, or -1 on failure
   */
  int bind(const std::string &host, int port);

  /**
   * @brief Serve until stop() is called.
   * @return false if the server could not run
   */
  bool listen_after_bind();

  void stop();
  bool is_running() const;

  /// Block until the accept loop is running (or has failed)
  void wait_until_ready() const;
};

} // namespace gallery

#endif // GALLERY_SERVER_HPP
