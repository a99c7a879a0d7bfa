#include "webhook_client.h"
#include "url.h"

#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>

static const char *TAG = "Webhook";

namespace {

bool containsNoCase(const std::string &haystack, const char *needle) {
  std::string lower(haystack);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return lower.find(needle) != std::string::npos;
}

std::string makeBoundary() {
  unsigned char raw[12];
  char hex[sizeof(raw) * 2 + 1] = {0};
  if (RAND_bytes(raw, sizeof(raw)) != 1) {
    // fall back to the clock
    snprintf(hex, sizeof(hex), "%016llx",
             (unsigned long long)std::time(nullptr));
  } else {
    for (size_t i = 0; i < sizeof(raw); i++) {
      snprintf(hex + i * 2, sizeof(hex) - i * 2, "%02x", raw[i]);
    }
  }
  return std::string("----voxlink") + hex;
}

std::string recordingFilename() {
  std::time_t t = std::time(nullptr);
  std::tm utc{};
  gmtime_r(&t, &utc);
  char name[48];
  std::strftime(name, sizeof(name), "recording_%Y%m%d_%H%M%S.wav", &utc);
  return name;
}

void logHexPrefix(const uint8_t *data, size_t len) {
  char prefix[2 * 32 + 1] = {0};
  size_t n = std::min((size_t)32, len);
  for (size_t i = 0; i < n; i++) {
    snprintf(prefix + i * 2, sizeof(prefix) - i * 2, "%02X", data[i]);
  }
  VOX_LOGW(TAG, "prefix(hex): %s", prefix);
}

} // namespace

ReplyFormat sniffReplyFormat(const uint8_t *data, size_t len,
                             const std::string &contentType) {
  if (data != nullptr) {
    if (len >= 12 && memcmp(data, "RIFF", 4) == 0 &&
        memcmp(data + 8, "WAVE", 4) == 0) {
      return ReplyFormat::Wav;
    }
    if (len >= 3 && memcmp(data, "ID3", 3) == 0) {
      return ReplyFormat::Mp3;
    }
    if (len >= 2 && data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) {
      return ReplyFormat::Mp3;
    }
  }
  if (containsNoCase(contentType, "wav")) {
    return ReplyFormat::Wav;
  }
  if (containsNoCase(contentType, "mpeg") || containsNoCase(contentType, "mp3")) {
    return ReplyFormat::Mp3;
  }
  return ReplyFormat::Unknown;
}

MultipartBody buildMultipartFile(const std::string &boundary,
                                 const std::string &field,
                                 const std::string &filename,
                                 const std::string &mime, const uint8_t *data,
                                 size_t len) {
  MultipartBody out;
  out.content_type = "multipart/form-data; boundary=" + boundary;

  std::string &b = out.body;
  b.reserve(len + 256);
  b += "--" + boundary + "\r\n";
  b += "Content-Disposition: form-data; name=\"" + field + "\"; filename=\"" +
       filename + "\"\r\n";
  b += "Content-Type: " + mime + "\r\n\r\n";
  if (data != nullptr && len > 0) {
    b.append(reinterpret_cast<const char *>(data), len);
  }
  b += "\r\n--" + boundary + "--\r\n";
  return out;
}

vox_err_t WebhookClient::init(const WebhookConfig &cfg) {
  if (cfg.url.empty()) {
    VOX_LOGE(TAG, "webhook url is empty");
    return VOX_ERR_INVALID_ARG;
  }
  ParsedUrl parsed;
  VOX_RETURN_ON_ERROR(parseUrl(cfg.url, parsed), TAG, "bad webhook url: %s",
                      cfg.url.c_str());
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    VOX_LOGE(TAG, "webhook url must be http(s): %s", cfg.url.c_str());
    return VOX_ERR_INVALID_ARG;
  }
  VOX_RETURN_ON_ERROR(m_http.init(cfg.http), TAG, "http client init failed");

  m_cfg = cfg;
  m_requestUrl = m_cfg.user_id.empty()
                     ? m_cfg.url
                     : appendQueryParam(m_cfg.url, "userId", m_cfg.user_id);
  m_inited = true;
  return VOX_OK;
}

vox_err_t WebhookClient::postWav(const uint8_t *wav, size_t len,
                                 WebhookReply &reply) {
  if (!m_inited) {
    return VOX_ERR_INVALID_STATE;
  }
  if (wav == nullptr || len == 0) {
    return VOX_ERR_INVALID_ARG;
  }

  MultipartBody form = buildMultipartFile(makeBoundary(), "file",
                                          recordingFilename(), "audio/wav",
                                          wav, len);

  HttpRequest req;
  req.method = "POST";
  req.url = m_requestUrl;
  req.headers["Content-Type"] = form.content_type;
  req.headers["Accept"] = "audio/wav,audio/mpeg,*/*";
  req.body = std::move(form.body);

  VOX_LOGI(TAG, "POST %s (wav=%u bytes)", m_requestUrl.c_str(), (unsigned)len);

  HttpResponse resp;
  vox_err_t err = m_http.perform(req, resp);
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "upload failed: %s", vox_err_to_name(err));
    return err;
  }

  reply = WebhookReply();
  reply.status = resp.status;
  reply.content_type = resp.content_type;

  if (resp.status < 200 || resp.status >= 300) {
    VOX_LOGE(TAG, "webhook http status=%d", resp.status);
    if (!resp.body.empty()) {
      size_t n = std::min((size_t)255, resp.body.size());
      std::string text(reinterpret_cast<const char *>(resp.body.data()), n);
      VOX_LOGE(TAG, "webhook body: %s", text.c_str());
    }
    return VOX_FAIL;
  }

  if (resp.body.empty()) {
    VOX_LOGW(TAG, "empty reply body");
    return VOX_ERR_FORMAT;
  }

  reply.format =
      sniffReplyFormat(resp.body.data(), resp.body.size(), resp.content_type);
  if (reply.format == ReplyFormat::Unknown) {
    VOX_LOGW(TAG, "unrecognised reply (content-type=%s, %u bytes)",
             resp.content_type.c_str(), (unsigned)resp.body.size());
    logHexPrefix(resp.body.data(), resp.body.size());
  } else {
    VOX_LOGI(TAG, "reply: %s, %u bytes", GetReplyFormatName(reply.format),
             (unsigned)resp.body.size());
  }
  reply.audio = std::move(resp.body);
  return VOX_OK;
}
