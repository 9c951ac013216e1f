#pragma once
#include "application/download_orchestrator.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <memory>
#include <string_view>
#include <nlohmann/json.hpp>

namespace download_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  explicit RestApiHandler(std::shared_ptr<DownloadOrchestrator> orchestrator);

protected:
  common::ApiResponse doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<DownloadOrchestrator> orchestrator_;

  common::ApiResponse route(http::verb method, std::string_view path, const std::string& body,
                            unsigned version);

  common::StringResponse handleVideoInfo(const nlohmann::json &body);
  common::StringResponse handleSubmit(const nlohmann::json &body, const std::string &preset);
  common::StringResponse handleList();
  common::StringResponse handleGet(const std::string &id);
  common::StringResponse handleCancel(const std::string &id);
  common::ApiResponse handleFile(const std::string &id);
  common::ApiResponse handleProgress(const std::string &id, unsigned version);

  common::StringResponse taskErrorResponse(TaskError error);
};

} // namespace download_service
