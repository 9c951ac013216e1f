#include "application/download_orchestrator.hpp"
#include "infrastructure/ytdlp_fetcher.hpp"
#include "infrastructure/ytdlp_resolver.hpp"
#include "interface/rest_api_handler.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

int main(int argc, char** argv) {
  try {
    const auto& cfg = config::Config::getInstance();
    const auto& storage = cfg.getStorage();
    std::filesystem::create_directories(storage.download_dir);

    const auto& ytdlp_config = cfg.getYtDlp();
    download_service::YtDlpOptions ytdlp{
      .binary = ytdlp_config.binary,
      .extra_args = ytdlp_config.extra_args,
      .user_agent = ytdlp_config.user_agent,
      .retries = ytdlp_config.retries
    };

    const auto& orchestrator_config = cfg.getOrchestrator();
    download_service::OrchestratorOptions options;
    options.worker.download_dir = storage.download_dir;
    options.worker.partial_dir = storage.partial_dir;
    options.broker.heartbeat_interval = orchestrator_config.heartbeat_interval;
    options.broker.observer_queue_limit = orchestrator_config.observer_queue_limit;
    options.broker.event_log_limit = orchestrator_config.event_log_limit;
    options.fallback_ladder = orchestrator_config.fallback_ladder;
    options.worker_threads = static_cast<unsigned int>(orchestrator_config.worker_threads);

    auto orchestrator = std::make_shared<download_service::DownloadOrchestrator>(
      std::make_shared<download_service::YtDlpResolver>(ytdlp),
      std::make_shared<download_service::YtDlpFetcher>(ytdlp),
      options
    );

    const auto& server_config = cfg.getServer();
    int io_threads = std::max(1, server_config.io_threads);
    boost::asio::io_context ioc{io_threads};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(server_config.host),
      static_cast<unsigned short>(server_config.port)
    };

    auto api_handler = std::make_shared<download_service::RestApiHandler>(orchestrator);
    common::HttpServer http_server{ioc, http_endpoint, api_handler};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "Received signal " << signal_number << ", shutting down" << std::endl;
      http_server.stop();
      orchestrator->shutdown();
      ioc.stop();
    });

    std::cout << "HTTP Server listening on " << cfg.getServerIpPort() << std::endl;
    std::cout << "Downloads will be saved to: " << storage.download_dir << std::endl;

    http_server.run();

    std::vector<std::thread> threads;
    threads.reserve(io_threads - 1);
    for (int i = 1; i < io_threads; ++i) {
      threads.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();

    for (auto& t : threads) {
      t.join();
    }

    orchestrator->shutdown();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
