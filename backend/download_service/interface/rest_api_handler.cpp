#include "rest_api_handler.hpp"
#include "interface/json_mapping.hpp"
#include "interface/progress_event_source.hpp"
#include <array>
#include <iostream>

namespace download_service {

namespace {

constexpr std::string_view kDownloadsPrefix = "/downloads/";
constexpr std::string_view kProgressPrefix = "/download-progress/";
constexpr std::string_view kFileSuffix = "/file";

struct PresetRoute {
  std::string_view path;
  std::string_view quality;
};

// Fixed-quality shortcuts kept from the first version of the API.
constexpr std::array<PresetRoute, 5> kPresetRoutes = {{
  {"/download-simple", "simple"},
  {"/download-1080p", "1080p"},
  {"/download-720p", "720p"},
  {"/download-480p", "480p"},
  {"/download-360p", "360p"},
}};

std::string stringMember(const nlohmann::json& body, const char* key) {
  if (!body.is_object()) {
    return {};
  }
  auto it = body.find(key);
  if (it == body.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<DownloadOrchestrator> orchestrator)
    : orchestrator_(std::move(orchestrator)) {}

common::ApiResponse RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  std::string target = std::string(req.target());
  std::string_view path = target;
  path = path.substr(0, path.find('?'));

  try {
    return route(req.method(), path, req.body(), req.version());
  } catch (const std::invalid_argument& e) {
    return createErrorResponse(http::status::bad_request, e.what());
  }
}

common::ApiResponse RestApiHandler::route(http::verb method, std::string_view path,
                                          const std::string& body, unsigned version) {
  if (path == "/" && method == http::verb::get) {
    return createJsonResponse(http::status::ok, {{"message", "Download service is running"}});
  }
  if (path == "/video-info" && method == http::verb::post) {
    return handleVideoInfo(parseRequestBody(body));
  }
  if (path == "/downloads") {
    if (method == http::verb::post) {
      return handleSubmit(parseRequestBody(body), "");
    }
    if (method == http::verb::get) {
      return handleList();
    }
  }
  for (const auto& preset : kPresetRoutes) {
    if (path == preset.path && method == http::verb::post) {
      return handleSubmit(parseRequestBody(body), std::string(preset.quality));
    }
  }

  if (path.starts_with(kProgressPrefix) && method == http::verb::get) {
    return handleProgress(std::string(path.substr(kProgressPrefix.size())), version);
  }

  if (path.starts_with(kDownloadsPrefix)) {
    auto rest = path.substr(kDownloadsPrefix.size());
    if (rest.ends_with(kFileSuffix) && method == http::verb::get) {
      return handleFile(std::string(rest.substr(0, rest.size() - kFileSuffix.size())));
    }
    if (!rest.empty() && rest.find('/') == std::string_view::npos) {
      if (method == http::verb::get) {
        return handleGet(std::string(rest));
      }
      if (method == http::verb::delete_) {
        return handleCancel(std::string(rest));
      }
    }
  }

  return createErrorResponse(http::status::not_found, "Endpoint not found");
}

common::StringResponse RestApiHandler::handleVideoInfo(const nlohmann::json &body) {
  auto url = stringMember(body, "url");
  if (url.empty()) {
    return createErrorResponse(http::status::bad_request, "URL is required");
  }

  auto info = orchestrator_->videoInfo(url);
  if (!info) {
    auto status = info.error().kind == LookupError::Kind::InvalidRequest
      ? http::status::bad_request
      : http::status::bad_gateway;
    return createErrorResponse(status, info.error().message);
  }
  return createJsonResponse(http::status::ok, videoInfoToJson(*info));
}

common::StringResponse RestApiHandler::handleSubmit(const nlohmann::json &body,
                                                    const std::string &preset) {
  auto url = stringMember(body, "url");
  if (url.empty()) {
    return createErrorResponse(http::status::bad_request, "URL is required");
  }

  auto quality = preset;
  if (quality.empty()) {
    quality = stringMember(body, "quality");
  }
  if (quality.empty()) {
    quality = stringMember(body, "format_id");
  }
  if (quality.empty()) {
    quality = "best";
  }

  auto outcome = orchestrator_->submit(url, quality);
  return std::visit(common::overloaded{
    [this](const SubmitCreated& created) {
      std::cout << "[HttpServer] Download " << created.task.id.substr(0, 8) << " started ("
                << created.task.quality << ")" << std::endl;
      return createJsonResponse(http::status::ok, {
        {"download_id", created.task.id},
        {"status", std::string(wireStatus(created.task.state))},
        {"state", std::string(toString(created.task.state))},
        {"message", "Download started"},
        {"progress", created.task.progress_percent},
        {"duplicate", false}
      });
    },
    [this](const SubmitAlreadyRunning& running) {
      return createJsonResponse(http::status::ok, {
        {"download_id", running.task.id},
        {"status", std::string(wireStatus(running.task.state))},
        {"state", std::string(toString(running.task.state))},
        {"message", "Download already in progress"},
        {"progress", running.task.progress_percent},
        {"duplicate", true}
      });
    },
    [this](const SubmitRejected& rejected) {
      return createErrorResponse(http::status::bad_request, rejected.reason);
    }
  }, outcome);
}

common::StringResponse RestApiHandler::handleList() {
  nlohmann::json tasks = nlohmann::json::array();
  for (const auto& task : orchestrator_->listTasks()) {
    tasks.push_back(taskToJson(task));
  }
  return createJsonResponse(http::status::ok, {{"downloads", std::move(tasks)}});
}

common::StringResponse RestApiHandler::handleGet(const std::string &id) {
  auto task = orchestrator_->getTask(id);
  if (!task) {
    return taskErrorResponse(task.error());
  }
  return createJsonResponse(http::status::ok, taskToJson(*task));
}

common::StringResponse RestApiHandler::handleCancel(const std::string &id) {
  auto task = orchestrator_->cancel(id);
  if (!task) {
    return taskErrorResponse(task.error());
  }
  return createJsonResponse(http::status::ok, {
    {"success", true},
    {"download_id", task->id},
    {"status", std::string(wireStatus(task->state))},
    {"message", "Download cancelled"}
  });
}

common::ApiResponse RestApiHandler::handleFile(const std::string &id) {
  auto file = orchestrator_->resultFile(id);
  if (!file) {
    return taskErrorResponse(file.error());
  }
  return createFileResponse(file->path.string(), file->download_name, file->content_type);
}

common::ApiResponse RestApiHandler::handleProgress(const std::string &id, unsigned version) {
  auto observer = orchestrator_->subscribe(id);
  if (!observer) {
    return taskErrorResponse(observer.error());
  }

  std::weak_ptr<DownloadOrchestrator> weak = orchestrator_;
  auto source = std::make_shared<ProgressEventSource>(
    std::move(*observer),
    [weak](const std::shared_ptr<Observer>& released) {
      if (auto orchestrator = weak.lock()) {
        orchestrator->unsubscribe(released);
      }
    });
  return common::EventStreamReply{std::move(source), version};
}

common::StringResponse RestApiHandler::taskErrorResponse(TaskError error) {
  switch (error) {
    case TaskError::NotFound:
      return createErrorResponse(http::status::not_found, std::string(toString(error)));
    case TaskError::AlreadyTerminal:
    case TaskError::NotReady:
      return createErrorResponse(http::status::conflict, std::string(toString(error)));
    case TaskError::InvalidRequest:
      return createErrorResponse(http::status::bad_request, std::string(toString(error)));
    case TaskError::InvalidTransition:
      break;
  }
  return createErrorResponse(http::status::internal_server_error, std::string(toString(error)));
}

} // namespace download_service
