#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <chrono>

namespace config {

struct ServerConfig {
  std::string host;
  unsigned int port;
  int io_threads;
};

struct StorageConfig {
  std::string download_dir;
  std::string partial_dir;   // scratch area for in-flight attempts, relative to download_dir
};

struct YtDlpConfig {
  std::string binary;
  std::string extra_args;
  std::string user_agent;
  int retries;
};

struct OrchestratorConfig {
  size_t worker_threads;
  std::chrono::milliseconds heartbeat_interval;
  size_t observer_queue_limit;
  size_t event_log_limit;
  std::vector<std::string> fallback_ladder;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const ServerConfig& getServer() const { return server_; }
const StorageConfig& getStorage() const { return storage_; }
const YtDlpConfig& getYtDlp() const { return ytdlp_; }
const OrchestratorConfig& getOrchestrator() const { return orchestrator_; }
std::string getServerIpPort() const { return server_.host+":"+std::to_string(server_.port);}

private:
  Config();
  void applyEnvironment();

  ServerConfig server_;
  StorageConfig storage_;
  YtDlpConfig ytdlp_;
  OrchestratorConfig orchestrator_;
};

} // namespace config
