#pragma once

#include "http_client.h"
#include "vox_err.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief webhook 回复的音频格式
 */
enum class ReplyFormat { Unknown, Wav, Mp3 };

inline const char *GetReplyFormatName(ReplyFormat format) {
  switch (format) {
  case ReplyFormat::Wav:
    return "wav";
  case ReplyFormat::Mp3:
    return "mp3";
  case ReplyFormat::Unknown:
  default:
    return "unknown";
  }
}

/**
 * @brief 判断回复格式：先看魔数，再看 Content-Type
 *
 * RIFF....WAVE -> Wav；"ID3" 或 MPEG 帧同步 (0xFF 0xEx) -> Mp3；
 * 否则 Content-Type 含 "wav" -> Wav，含 "mpeg"/"mp3" -> Mp3。
 */
ReplyFormat sniffReplyFormat(const uint8_t *data, size_t len,
                             const std::string &contentType);

/**
 * @brief multipart/form-data 请求体（单个文件字段）
 */
struct MultipartBody {
  std::string content_type; ///< 含 boundary
  std::string body;
};

MultipartBody buildMultipartFile(const std::string &boundary,
                                 const std::string &field,
                                 const std::string &filename,
                                 const std::string &mime, const uint8_t *data,
                                 size_t len);

struct WebhookConfig {
  std::string url;     ///< 例如 https://n8n.example.com/webhook/voice
  std::string user_id; ///< 以 ?userId= 附加，用于服务端维持上下文
  HttpClientConfig http;
};

struct WebhookReply {
  int status = 0;
  std::string content_type;
  ReplyFormat format = ReplyFormat::Unknown;
  std::vector<uint8_t> audio;
};

/**
 * @brief 批量模式：上传一段 WAV，取回合成的回复音频
 */
class WebhookClient {
public:
  vox_err_t init(const WebhookConfig &cfg);
  bool isInitialized() const { return m_inited; }

  /**
   * @brief POST multipart 字段 "file"（audio/wav）
   *
   * @return VOX_FAIL 非 2xx；VOX_ERR_FORMAT 回复为空；网络错误见 HttpClient
   */
  vox_err_t postWav(const uint8_t *wav, size_t len, WebhookReply &reply);

  /**
   * @brief 实际请求的 URL（含 userId 查询参数）
   */
  const std::string &requestUrl() const { return m_requestUrl; }

private:
  WebhookConfig m_cfg;
  std::string m_requestUrl;
  HttpClient m_http;
  bool m_inited = false;
};
