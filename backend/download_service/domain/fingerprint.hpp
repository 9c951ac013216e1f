#pragma once
#include <expected>
#include <string>
#include <string_view>

namespace download_service {

struct Fingerprint {
  std::string id;             // 32 lowercase hex characters
  std::string canonical_url;
  std::string quality;        // normalized selector
};

// Scheme/host casing, default ports, "www."/"m." prefixes, fragments and
// tracking parameters are normalized away; YouTube watch/short/embed/
// youtu.be forms collapse to https://youtube.com/watch?v=ID.
std::expected<std::string, std::string> canonicalizeUrl(std::string_view url);

// Digest of an already canonical URL and normalized quality.
std::string digestRequest(std::string_view canonical_url, std::string_view quality);

// Stable task identity for a download request. Fails only when the URL
// cannot be canonicalized or the selector is empty.
std::expected<Fingerprint, std::string> fingerprint(std::string_view url, std::string_view quality);

} // namespace download_service
