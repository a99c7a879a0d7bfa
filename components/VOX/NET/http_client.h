#pragma once

#include "vox_err.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace boost {
namespace asio {
namespace ssl {
class context;
}
} // namespace asio
} // namespace boost

struct HttpClientConfig {
  int timeout_ms = 60000;                     ///< 连接到收完响应的总时长
  size_t max_response_bytes = 8 * 1024 * 1024; ///< 响应体上限
  bool verify_peer = true;
  std::string ca_file;
  std::string user_agent = "voxlink";
};

struct HttpRequest {
  std::string method = "POST";
  std::string url; ///< http:// 或 https://
  std::map<std::string, std::string> headers;
  std::string body;
};

struct HttpResponse {
  int status = 0;
  std::string content_type;
  std::vector<uint8_t> body;
};

/**
 * @brief 同步 HTTP(S) 客户端
 *
 * 每次 perform() 在调用线程上跑一个独立的 io_context，完成后关闭连接
 * （不复用连接）。非 2xx 状态不算失败，由调用方检查 status。
 */
class HttpClient {
public:
  HttpClient();
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  vox_err_t init(const HttpClientConfig &cfg);
  bool isInitialized() const { return m_inited; }

  /**
   * @return VOX_ERR_TIMEOUT 超时；VOX_ERR_INVALID_SIZE 响应体超过上限；
   *         VOX_ERR_CONNECTION 解析/连接/TLS/读写失败
   */
  vox_err_t perform(const HttpRequest &req, HttpResponse &resp);

  const HttpClientConfig &config() const { return m_cfg; }

private:
  HttpClientConfig m_cfg;
  bool m_inited = false;
  std::unique_ptr<boost::asio::ssl::context> m_tls;
};
