/**
 * @file server.cpp
 * @brief HTTP front implementation
 */

#include "gallery/server.hpp"

#include <cctype>
#include <optional>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>
#include <httplib.h>

#include "gallery/asset_table.hpp"
#include "gallery/config.hpp"
#include "gallery/logging.hpp"

namespace gallery {

// **---- Page Rendering ----**

std::string html_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string url_encode_path(const std::string &key) {
  static const char HEX[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(key.size());
  for (unsigned char c : key) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        c == '/') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += HEX[c >> 4];
      out += HEX[c & 0x0F];
    }
  }
  return out;
}

std::string render_index_page(const std::vector<PresentationEntry> &listing) {
  std::string page;
  page.reserve(512 + listing.size() * 256);

  page += "<!DOCTYPE html>\n"
          "<html>\n<head>\n<meta charset=\"utf-8\">\n"
          "<title>Gallery</title>\n"
          "<style>\n"
          "body{font-family:sans-serif;margin:2em}\n"
          "ul{list-style:none;padding:0;display:flex;flex-wrap:wrap;gap:1em}\n"
          "li{text-align:center}\n"
          "img{display:block;max-width:300px;max-height:200px}\n"
          "</style>\n</head>\n<body>\n";
  page += fmt::format("<h1>Gallery ({} images)</h1>\n", listing.size());
  page += fmt::format("<p><a href=\"{}\">Download all originals</a></p>\n",
                      ARCHIVE_ROUTE_KEY);
  page += "<ul>\n";

  for (const auto &entry : listing) {
    const std::string name = html_escape(entry.display_name);
    page += fmt::format("<li><a href=\"{}\"><img src=\"{}\" alt=\"{}\" "
                        "loading=\"lazy\"></a>{}</li>\n",
                        html_escape(url_encode_path(entry.full_key)),
                        html_escape(url_encode_path(entry.preview_key)), name,
                        name);
  }

  page += "</ul>\n</body>\n</html>\n";
  return page;
}

// **---- Listen Options ----**

ListenOptions ListenOptions::from_config() {
  ListenOptions options;
  options.host = Config::listen_host();
  options.port = Config::listen_port();
  options.validate();
  return options;
}

void ListenOptions::validate() const {
  if (host.empty())
    throw std::runtime_error("GALLERY_HOST must not be empty");
  if (port < 0 || port > 65535) {
    throw std::runtime_error(
        fmt::format("GALLERY_PORT must be within 0-65535, got {}", port));
  }
}

// **---- GalleryServer ----**

GalleryServer::GalleryServer(Gallery gallery)
    : gallery_(std::move(gallery)),
      server_(std::make_unique<httplib::Server>()) {
  if (gallery_.listing)
    index_page_ = render_index_page(*gallery_.listing);
  else
    index_page_ = render_index_page({});
  register_routes();
}

GalleryServer::~GalleryServer() {
  if (server_->is_running())
    server_->stop();
}

void GalleryServer::register_routes() {
  server_->Get("/", [this](const httplib::Request &, httplib::Response &res) {
    res.set_content(index_page_, "text/html; charset=utf-8");
  });

  /// Everything else is a route key into the asset table
  server_->Get(".*", [this](const httplib::Request &req,
                            httplib::Response &res) {
    std::optional<Asset> asset;
    if (gallery_.assets)
      asset = gallery_.assets->get(req.path);

    if (!asset) {
      res.status = 404;
      res.set_content("Not Found", "text/plain");
      return;
    }

    /// The provider holds a reference to the buffer, never a copy
    Bytes bytes = asset->bytes;
    res.set_content_provider(
        bytes->size(), mime_type(asset->content_type),
        [bytes](size_t offset, size_t length, httplib::DataSink &sink) {
          sink.write(reinterpret_cast<const char *>(bytes->data()) + offset,
                     length);
          return true;
        });
  });

  server_->set_logger([](const httplib::Request &req,
                         const httplib::Response &res) {
    LOG_INFO("{} {} -> {}", req.method, req.path, res.status);
  });
}

int GalleryServer::bind(const std::string &host, int port) {
  if (port == 0)
    return server_->bind_to_any_port(host);
  return server_->bind_to_port(host, port) ? port : -1;
}

bool GalleryServer::listen_after_bind() {
  return server_->listen_after_bind();
}

void GalleryServer::stop() { server_->stop(); }

bool GalleryServer::is_running() const { return server_->is_running(); }

void GalleryServer::wait_until_ready() const { server_->wait_until_ready(); }

} // namespace gallery
