#pragma once

#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace download_service {

struct YtDlpOptions {
  std::string binary{"yt-dlp"};
  std::string extra_args;
  std::string user_agent;
  int retries{3};
};

struct ProcessOutcome {
  int exit_code{0};
  bool stopped{false};
  std::string last_error;   // last "ERROR:" line, if any
};

// Splits a command-line fragment on whitespace, honouring double quotes.
std::vector<std::string> splitArguments(std::string_view text);

// Options shared by every invocation (retries, user agent, extra args).
std::vector<std::string> baseArguments(const YtDlpOptions& options);

// Runs yt-dlp with stdout and stderr merged, handing each line to
// `on_line`. Stopping the token terminates the whole process group.
std::expected<ProcessOutcome, std::string> runYtDlp(
  const YtDlpOptions& options,
  const std::vector<std::string>& args,
  const std::function<void(std::string_view)>& on_line,
  std::stop_token stop = {});

} // namespace download_service
