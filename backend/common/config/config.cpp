#include "config.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace config {

namespace {

std::string homeDir() {
  if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
    return home;
  }
  return ".";
}

const char* readEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return nullptr;
  }
  return value;
}

// Malformed numbers keep the compiled default.
template <typename T>
void overrideNumber(const char* name, T& target) {
  const char* value = readEnv(name);
  if (!value) {
    return;
  }
  try {
    target = static_cast<T>(std::stoll(value));
  } catch (const std::exception& e) {
    std::cerr << "[Config] Ignoring " << name << "=" << value << ": " << e.what() << std::endl;
  }
}

} // namespace

  Config::Config() {
    server_ = {
      .host = "0.0.0.0",
      .port = 8000,
      .io_threads = 2
    };

    storage_ = {
      .download_dir = homeDir() + "/Downloads/youtube_videos",
      .partial_dir = ".partial"
    };

    ytdlp_ = {
      .binary = "yt-dlp",
      .extra_args = "",
      .user_agent = "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 "
                    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
      .retries = 3
    };

    auto hw = std::thread::hardware_concurrency();
    orchestrator_ = {
      .worker_threads = hw < 2 ? 2 : hw,
      .heartbeat_interval = std::chrono::seconds(30),
      .observer_queue_limit = 256,
      .event_log_limit = 1024,
      .fallback_ladder = {"480p", "720p", "lowest"}
    };

    applyEnvironment();
  }

  void Config::applyEnvironment() {
    if (const char* host = readEnv("TUBEFETCH_HOST")) {
      server_.host = host;
    }
    overrideNumber("TUBEFETCH_PORT", server_.port);
    overrideNumber("TUBEFETCH_IO_THREADS", server_.io_threads);

    if (const char* dir = readEnv("TUBEFETCH_DOWNLOAD_DIR")) {
      storage_.download_dir = dir;
    }

    if (const char* binary = readEnv("TUBEFETCH_YTDLP")) {
      ytdlp_.binary = binary;
    }
    if (const char* args = readEnv("TUBEFETCH_YTDLP_ARGS")) {
      ytdlp_.extra_args = args;
    }

    overrideNumber("TUBEFETCH_WORKERS", orchestrator_.worker_threads);
    if (orchestrator_.worker_threads < 1) {
      orchestrator_.worker_threads = 1;
    }

    long long heartbeat_seconds = -1;
    overrideNumber("TUBEFETCH_HEARTBEAT_SECONDS", heartbeat_seconds);
    if (heartbeat_seconds > 0) {
      orchestrator_.heartbeat_interval = std::chrono::seconds(heartbeat_seconds);
    }
  }
}
