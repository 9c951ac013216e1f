#pragma once
#include <memory>
#include <string>
#include <variant>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "common/restful/event_source.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

struct EventStreamReply {
  std::shared_ptr<EventSource> source;
  unsigned version{11};
};

using StringResponse = http::response<http::string_body>;
using FileResponse = http::response<http::file_body>;
using ApiResponse = std::variant<StringResponse, FileResponse, EventStreamReply>;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

template<class Fields>
void addCorsHeaders(Fields& fields) {
  fields.set(http::field::access_control_allow_origin, "*");
  fields.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
  fields.set(http::field::access_control_allow_headers, "Content-Type, Authorization, Cache-Control");
}

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  ApiResponse handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    if (req.method() == http::verb::options) {
      StringResponse res{http::status::ok, req.version()};
      addCorsHeaders(res);
      res.prepare_payload();
      return res;
    }

    ApiResponse response = [&]() -> ApiResponse {
      try {
        return doHandleRequest(std::move(req));
      } catch (const std::exception& e) {
        return createErrorResponse(http::status::internal_server_error,
                                   "Internal server error: " + std::string(e.what()));
      }
    }();

    std::visit(overloaded{
      [](StringResponse& res) { addCorsHeaders(res); },
      [](FileResponse& res) { addCorsHeaders(res); },
      [](EventStreamReply&) {}
    }, response);
    return response;
  }

protected:
  virtual ApiResponse doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  StringResponse createJsonResponse(
    http::status status, const nlohmann::json& json);

  StringResponse createErrorResponse(
    http::status status, const std::string& message);

  // 404 JSON error when the file cannot be opened.
  ApiResponse createFileResponse(
    const std::string& path, const std::string& download_name, const std::string& content_type);

  nlohmann::json parseRequestBody(const std::string& body);
};

}
