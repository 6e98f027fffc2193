/**
 * @file main.cpp
 * @brief Entry point for the gallery server
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Build phase: scan, transcode and package one directory
 *
 *          - Serving phase: HTTP server over the frozen gallery until
 *            SIGINT or SIGTERM
 *
 * @note Worker count, preview size and quality, and the listen address come
 *       from environment variables (see config.hpp).
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <pthread.h>

extern "C" {
#include <libavutil/log.h>
}

#include "gallery/gallery.hpp"
#include "gallery/logging.hpp"
#include "gallery/server.hpp"
#include "gallery/system.hpp"

using namespace gallery;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  /// Decode errors are reported per image; keep FFmpeg's own output quiet
  av_log_set_level(AV_LOG_FATAL);

  if (argc > 2) {
    LOG_WARN("Usage: ./gallery [directory]");
    return 1;
  }
  std::string directory = (argc == 2) ? argv[1] : ".";

  // **---- BUILD PHASE ----**

  Gallery gallery;
  try {
    GalleryBuilder builder(directory, BuildOptions::from_config());
    gallery = builder.build();
  } catch (const std::exception &e) {
    LOG_ERROR("Build failed: {}", e.what());
    return 1;
  }
  TimingCollector::print_summary();

  // **---- SERVING PHASE ----**

  /// Block shutdown signals before the server starts its threads; a
  /// dedicated thread receives them with sigwait()
  sigset_t shutdown_signals;
  sigemptyset(&shutdown_signals);
  sigaddset(&shutdown_signals, SIGINT);
  sigaddset(&shutdown_signals, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr) != 0) {
    LOG_ERROR("Failed to block shutdown signals");
    return 1;
  }

  ListenOptions listen;
  try {
    listen = ListenOptions::from_config();
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid listen configuration: {}", e.what());
    return 1;
  }

  GalleryServer server(std::move(gallery));
  int bound_port = server.bind(listen.host, listen.port);
  if (bound_port < 0) {
    LOG_ERROR("Failed to bind {}:{}", listen.host, listen.port);
    return 1;
  }

  std::atomic<bool> listening_done{false};
  std::atomic<bool> signal_received{false};
  std::thread signal_thread(
      [&server, &listening_done, &signal_received, shutdown_signals]() {
        int sig = 0;
        if (sigwait(&shutdown_signals, &sig) != 0)
          return;
        signal_received.store(true);
        if (listening_done.load())
          return;
        LOG_INFO("Received {}, shutting down", signal_name(sig));
        /// stop() is a no-op until the accept loop runs; give up waiting
        /// if listen_after_bind() returns without ever running
        while (!server.is_running() && !listening_done.load())
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
        if (!listening_done.load())
          server.stop();
      });

  LOG_SUCCESS("Serving gallery on http://{}:{}/", listen.host, bound_port);
  bool ok = server.listen_after_bind();
  listening_done.store(true);

  /// Wake the signal thread if the server stopped on its own
  if (!signal_received.load())
    pthread_kill(signal_thread.native_handle(), SIGTERM);
  signal_thread.join();

  if (!ok) {
    LOG_ERROR("Server stopped with an error");
    return 1;
  }
  LOG_INFO("Server stopped");
  return 0;
}
