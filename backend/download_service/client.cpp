#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "common/config/config.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string connectHost(const std::string& host) {
  return host == "0.0.0.0" ? "127.0.0.1" : host;
}

nlohmann::json submit(const std::string& host, const std::string& port,
                      const std::string& url, const std::string& quality) {
  net::io_context ioc;
  tcp::resolver resolver{ioc};
  beast::tcp_stream stream{ioc};
  stream.connect(resolver.resolve(host, port));

  http::request<http::string_body> req{http::verb::post, "/downloads", 11};
  req.set(http::field::host, host);
  req.set(http::field::content_type, "application/json");
  req.body() = nlohmann::json{{"url", url}, {"quality", quality}}.dump();
  req.prepare_payload();
  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);

  auto body = nlohmann::json::parse(res.body());
  if (res.result() != http::status::ok) {
    throw std::runtime_error(body.value("error", std::string("request failed")));
  }
  return body;
}

// Prints one line per event; returns true once a terminal status arrived.
bool printEvent(const std::string& data) {
  auto event = nlohmann::json::parse(data, nullptr, false);
  if (event.is_discarded()) {
    return false;
  }
  auto status = event.value("status", std::string());
  if (status == "keepalive") {
    return false;
  }
  if (status == "downloading") {
    std::cout << "\r" << event.value("progress", 0.0) << "% "
              << event.value("speed", std::string()) << " ETA "
              << event.value("eta", std::string()) << " [" << event.value("quality", std::string())
              << "]" << std::flush;
    return false;
  }
  std::cout << std::endl;
  if (status == "completed") {
    std::cout << "Completed: " << event.value("filename", std::string()) << std::endl;
  } else if (status == "failed") {
    std::cout << "Failed: " << event.value("error", std::string()) << std::endl;
  } else {
    std::cout << "Status: " << status << std::endl;
  }
  return status == "completed" || status == "failed" || status == "cancelled";
}

// Reads the SSE stream chunk by chunk until a terminal event.
void follow(const std::string& host, const std::string& port, const std::string& id) {
  net::io_context ioc;
  tcp::resolver resolver{ioc};
  beast::tcp_stream stream{ioc};
  stream.connect(resolver.resolve(host, port));

  http::request<http::empty_body> req{http::verb::get, "/download-progress/" + id, 11};
  req.set(http::field::host, host);
  req.set(http::field::accept, "text/event-stream");
  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response_parser<http::empty_body> parser;
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
  http::read_header(stream, buffer, parser);
  if (parser.get().result() != http::status::ok) {
    throw std::runtime_error("progress stream rejected");
  }

  std::string pending;
  bool done = false;
  auto on_chunk_body = [&](std::uint64_t remain, beast::string_view body, beast::error_code& ec) {
    boost::ignore_unused(remain, ec);
    pending.append(body.data(), body.size());
    size_t pos;
    while (!done && (pos = pending.find("\n\n")) != std::string::npos) {
      auto frame = pending.substr(0, pos);
      pending.erase(0, pos + 2);
      if (frame.rfind("data: ", 0) == 0) {
        done = printEvent(frame.substr(6));
      }
    }
    return body.size();
  };
  parser.on_chunk_body(on_chunk_body);

  beast::error_code ec;
  while (!done && !parser.is_done()) {
    http::read_some(stream, buffer, parser, ec);
    if (ec) {
      break;
    }
  }
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " URL [quality]" << std::endl;
    return 1;
  }
  std::string url = argv[1];
  std::string quality = argc > 2 ? argv[2] : "best";

  const auto& cfg = config::Config::getInstance();
  auto host = connectHost(cfg.getServer().host);
  auto port = std::to_string(cfg.getServer().port);

  try {
    auto response = submit(host, port, url, quality);
    auto id = response.value("download_id", std::string());
    std::cout << response.value("message", std::string()) << " (" << id << ")" << std::endl;
    follow(host, port, id);
  } catch (const std::exception& e) {
    std::cerr << "Request failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
