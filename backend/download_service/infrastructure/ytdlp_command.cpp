#include "ytdlp_command.hpp"
#include <iostream>
#include <istream>
#include <signal.h>
#include <boost/process.hpp>

namespace download_service {

namespace bp = boost::process;

std::vector<std::string> splitArguments(std::string_view text) {
  std::vector<std::string> args;
  std::string current;
  bool in_quotes = false;
  bool has_token = false;

  for (char c : text) {
    if (c == '"') {
      in_quotes = !in_quotes;
      has_token = true;
    } else if (!in_quotes && (c == ' ' || c == '\t' || c == '\n')) {
      if (has_token) {
        args.push_back(std::move(current));
        current.clear();
        has_token = false;
      }
    } else {
      current.push_back(c);
      has_token = true;
    }
  }
  if (has_token) {
    args.push_back(std::move(current));
  }
  return args;
}

std::vector<std::string> baseArguments(const YtDlpOptions& options) {
  std::vector<std::string> args = {
    "--ignore-config",
    "--no-color",
    "--extractor-retries", std::to_string(options.retries),
    "--retries", std::to_string(options.retries),
    "--fragment-retries", std::to_string(options.retries),
  };
  if (!options.user_agent.empty()) {
    args.push_back("--user-agent");
    args.push_back(options.user_agent);
  }
  for (auto& extra : splitArguments(options.extra_args)) {
    args.push_back(std::move(extra));
  }
  return args;
}

std::expected<ProcessOutcome, std::string> runYtDlp(
  const YtDlpOptions& options,
  const std::vector<std::string>& args,
  const std::function<void(std::string_view)>& on_line,
  std::stop_token stop) {

  boost::filesystem::path exe = options.binary;
  if (options.binary.find('/') == std::string::npos) {
    exe = bp::search_path(options.binary);
  }
  if (exe.empty()) {
    return std::unexpected(options.binary + " is not installed or not found in PATH");
  }

  if (stop.stop_requested()) {
    return ProcessOutcome{.exit_code = -1, .stopped = true};
  }

  bp::ipstream output;
  bp::group group;
  std::error_code ec;
  bp::child child(bp::exe = exe.string(), bp::args = args,
                  (bp::std_out & bp::std_err) > output,
                  bp::std_in < bp::null,
                  group, ec);
  if (ec) {
    return std::unexpected("Failed to start " + options.binary + ": " + ec.message());
  }

  ProcessOutcome outcome;
  {
    auto pgid = group.native_handle();
    std::stop_callback on_stop(stop, [pgid]() {
      ::killpg(pgid, SIGTERM);
    });

    std::string line;
    while (std::getline(output, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.starts_with("ERROR:")) {
        outcome.last_error = line.substr(6);
        auto first = outcome.last_error.find_first_not_of(' ');
        outcome.last_error.erase(0, first == std::string::npos ? outcome.last_error.size() : first);
      }
      if (on_line) {
        on_line(line);
      }
    }

    child.wait(ec);
  }

  outcome.stopped = stop.stop_requested();
  outcome.exit_code = ec ? -1 : child.exit_code();
  if (ec && !outcome.stopped) {
    std::cerr << "[YtDlp] wait failed: " << ec.message() << std::endl;
  }
  return outcome;
}

} // namespace download_service
