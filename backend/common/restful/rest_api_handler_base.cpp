#include "rest_api_handler_base.hpp"

namespace common {

StringResponse RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  StringResponse res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res.prepare_payload();
  return res;
}

StringResponse RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

ApiResponse RestApiHandlerBase::createFileResponse(
  const std::string& path, const std::string& download_name, const std::string& content_type) {

  http::file_body::value_type body;
  beast::error_code ec;
  body.open(path.c_str(), beast::file_mode::scan, ec);
  if (ec) {
    return createErrorResponse(http::status::not_found, "File not available: " + ec.message());
  }

  auto size = body.size();
  FileResponse res{std::piecewise_construct,
                   std::make_tuple(std::move(body)),
                   std::make_tuple(http::status::ok, 11)};
  res.set(http::field::content_type, content_type);
  res.set(http::field::content_disposition, "attachment; filename=\"" + download_name + "\"");
  res.content_length(size);
  return res;
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  try {
    if (body.empty()) {
        return nlohmann::json{};
    }
    return nlohmann::json::parse(body);
  } catch (const std::exception& e) {
    throw std::invalid_argument("Invalid JSON in request body: " + std::string(e.what()));
  }
}

}
