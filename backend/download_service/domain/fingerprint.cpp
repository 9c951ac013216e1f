#include "fingerprint.hpp"
#include "quality.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>
#include <openssl/evp.h>

namespace download_service {

namespace {

constexpr size_t kIdLength = 32;

const std::array<std::string_view, 13> kTrackingParams = {
  "si", "feature", "fbclid", "gclid", "dclid", "msclkid", "igshid",
  "pp", "ab_channel", "ref_src", "spm", "mc_cid", "mc_eid"
};

std::string toLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool isTrackingParam(std::string_view key) {
  auto lowered = toLower(key);
  if (lowered.starts_with("utm_")) {
    return true;
  }
  return std::find(kTrackingParams.begin(), kTrackingParams.end(), lowered) != kTrackingParams.end();
}

using QueryParams = std::vector<std::pair<std::string, std::string>>;

QueryParams parseQuery(std::string_view query) {
  QueryParams params;
  while (!query.empty()) {
    auto amp = query.find('&');
    auto part = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (part.empty()) {
      continue;
    }
    auto eq = part.find('=');
    if (eq == std::string_view::npos) {
      params.emplace_back(std::string(part), std::string{});
    } else {
      params.emplace_back(std::string(part.substr(0, eq)), std::string(part.substr(eq + 1)));
    }
  }
  return params;
}

std::string firstSegment(std::string_view path) {
  while (!path.empty() && path.front() == '/') path.remove_prefix(1);
  return std::string(path.substr(0, path.find('/')));
}

std::string stripHostPrefix(std::string host) {
  for (std::string_view prefix : {"www.", "m."}) {
    if (host.starts_with(prefix) && host.size() > prefix.size()) {
      return host.substr(prefix.size());
    }
  }
  return host;
}

// Video id for YouTube URLs, empty for anything else.
std::string youtubeVideoId(const std::string& host, std::string_view path, const QueryParams& params) {
  if (host == "youtu.be") {
    return firstSegment(path);
  }
  if (host != "youtube.com" && host != "music.youtube.com" && host != "youtube-nocookie.com") {
    return {};
  }
  if (path == "/watch" || path == "/watch/") {
    for (const auto& [key, value] : params) {
      if (key == "v") {
        return value;
      }
    }
    return {};
  }
  for (std::string_view prefix : {"/shorts/", "/embed/", "/live/", "/v/"}) {
    if (path.starts_with(prefix)) {
      return firstSegment(path.substr(prefix.size()));
    }
  }
  return {};
}

} // namespace

std::expected<std::string, std::string> canonicalizeUrl(std::string_view raw) {
  auto url = trim(raw);
  if (url.empty()) {
    return std::unexpected("URL is required");
  }

  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    return std::unexpected("URL must start with http:// or https://");
  }
  auto scheme = toLower(url.substr(0, scheme_end));
  if (scheme != "http" && scheme != "https") {
    return std::unexpected("Unsupported URL scheme: " + scheme);
  }

  auto rest = url.substr(scheme_end + 3);
  auto fragment = rest.find('#');
  if (fragment != std::string_view::npos) {
    rest = rest.substr(0, fragment);
  }

  auto authority_end = rest.find_first_of("/?");
  auto authority = rest.substr(0, authority_end);
  auto remainder = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }

  std::string_view host_part = authority;
  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::unexpected("Malformed IPv6 host in URL");
    }
    host_part = authority.substr(0, close + 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':') {
      port = authority.substr(close + 2);
    }
  } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host_part = authority.substr(0, colon);
    port = authority.substr(colon + 1);
  }

  auto host = stripHostPrefix(toLower(host_part));
  if (host.empty()) {
    return std::unexpected("URL has no host");
  }
  if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::unexpected("Malformed port in URL");
  }
  if ((scheme == "http" && port == "80") || (scheme == "https" && port == "443")) {
    port = {};
  }

  auto query_start = remainder.find('?');
  std::string path(remainder.substr(0, query_start));
  auto query = query_start == std::string_view::npos ? std::string_view{} : remainder.substr(query_start + 1);
  if (path.empty()) {
    path = "/";
  }

  auto params = parseQuery(query);
  std::erase_if(params, [](const auto& param) { return isTrackingParam(param.first); });

  if (auto video_id = youtubeVideoId(host, path, params); !video_id.empty()) {
    return "https://youtube.com/watch?v=" + video_id;
  }

  std::stable_sort(params.begin(), params.end());

  std::string canonical = scheme + "://" + host;
  if (!port.empty()) {
    canonical += ":" + std::string(port);
  }
  canonical += path;
  for (size_t i = 0; i < params.size(); ++i) {
    canonical += i == 0 ? '?' : '&';
    canonical += params[i].first;
    if (!params[i].second.empty()) {
      canonical += '=' + params[i].second;
    }
  }
  return canonical;
}

std::string digestRequest(std::string_view canonical_url, std::string_view quality) {
  std::string material;
  material.reserve(canonical_url.size() + quality.size() + 1);
  material.append(canonical_url);
  material.push_back('\x1f');
  material.append(quality);

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(material.data(), material.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(kIdLength);
  for (unsigned int i = 0; i < digest_len && hex.size() < kIdLength; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0f]);
  }
  return hex;
}

std::expected<Fingerprint, std::string> fingerprint(std::string_view url, std::string_view quality) {
  auto canonical = canonicalizeUrl(url);
  if (!canonical) {
    return std::unexpected(canonical.error());
  }

  auto normalized = normalizeQuality(quality);
  if (normalized.empty()) {
    return std::unexpected("Quality selector is required");
  }

  return Fingerprint{
    .id = digestRequest(*canonical, normalized),
    .canonical_url = *canonical,
    .quality = normalized
  };
}

} // namespace download_service
