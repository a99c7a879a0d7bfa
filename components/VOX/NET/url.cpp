#include "url.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

static const char *TAG = "Url";

std::string ParsedUrl::hostHeader() const {
  bool defaultPort = (secure && port == "443") || (!secure && port == "80");
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  return defaultPort ? h : h + ":" + port;
}

vox_err_t parseUrl(const std::string &url, ParsedUrl &out) {
  out = ParsedUrl();
  size_t schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0) {
    VOX_LOGE(TAG, "missing scheme: %s", url.c_str());
    return VOX_ERR_INVALID_ARG;
  }
  out.scheme = url.substr(0, schemeEnd);
  std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (out.scheme == "ws" || out.scheme == "http") {
    out.secure = false;
  } else if (out.scheme == "wss" || out.scheme == "https") {
    out.secure = true;
  } else {
    VOX_LOGE(TAG, "unsupported scheme: %s", out.scheme.c_str());
    return VOX_ERR_INVALID_ARG;
  }

  size_t authStart = schemeEnd + 3;
  size_t pathStart = url.find_first_of("/?#", authStart);
  std::string authority = url.substr(
      authStart,
      pathStart == std::string::npos ? std::string::npos : pathStart - authStart);
  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    authority = authority.substr(at + 1);
  }

  std::string port;
  if (!authority.empty() && authority[0] == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos) {
      return VOX_ERR_INVALID_ARG;
    }
    out.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':') {
      port = authority.substr(close + 2);
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      out.host = authority.substr(0, colon);
      port = authority.substr(colon + 1);
    } else {
      out.host = authority;
    }
  }
  if (out.host.empty()) {
    VOX_LOGE(TAG, "missing host: %s", url.c_str());
    return VOX_ERR_INVALID_ARG;
  }
  if (!port.empty() &&
      !std::all_of(port.begin(), port.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    VOX_LOGE(TAG, "bad port: %s", port.c_str());
    return VOX_ERR_INVALID_ARG;
  }
  out.port = port.empty() ? (out.secure ? "443" : "80") : port;

  if (pathStart == std::string::npos) {
    out.target = "/";
  } else {
    out.target = url.substr(pathStart);
    size_t hash = out.target.find('#');
    if (hash != std::string::npos) {
      out.target.erase(hash);
    }
    if (out.target.empty() || out.target[0] != '/') {
      out.target = "/" + out.target;
    }
  }
  return VOX_OK;
}

std::string urlEncode(const std::string &value) {
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back((char)c);
    } else {
      char buf[4];
      snprintf(buf, sizeof(buf), "%%%02X", c);
      out.append(buf);
    }
  }
  return out;
}

std::string appendQueryParam(const std::string &url, const std::string &key,
                             const std::string &value) {
  std::string base = url;
  std::string fragment;
  size_t hash = base.find('#');
  if (hash != std::string::npos) {
    fragment = base.substr(hash);
    base.erase(hash);
  }
  char sep = base.find('?') == std::string::npos ? '?' : '&';
  return base + sep + urlEncode(key) + "=" + urlEncode(value) + fragment;
}
