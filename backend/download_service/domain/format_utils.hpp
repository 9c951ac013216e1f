#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace download_service {

// "0 B", "512 B", "1.5 KB", "3.2 MB"
std::string formatBytes(uint64_t bytes);
std::string formatSpeed(std::optional<double> bytes_per_second);

// "MM:SS" or "HH:MM:SS"; "Unknown" for a missing or zero duration.
std::string formatDuration(std::optional<int64_t> seconds);
std::string formatEta(std::optional<double> seconds);

// ISO-8601 UTC with milliseconds.
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

// Drops characters that are unsafe in file names and trims whitespace.
std::string sanitizeFilename(std::string_view name);

std::string contentTypeForExtension(std::string_view ext);

} // namespace download_service
