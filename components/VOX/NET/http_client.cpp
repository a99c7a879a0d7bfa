#include "http_client.h"
#include "url.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/http/vector_body.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <exception>
#include <type_traits>

static const char *TAG = "HttpClient";

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using PlainStream = beast::tcp_stream;
using SecureStream = beast::ssl_stream<beast::tcp_stream>;
using ResponseBody = http::vector_body<uint8_t>;

vox_err_t mapError(const beast::error_code &ec) {
  if (ec == beast::error::timeout) {
    return VOX_ERR_TIMEOUT;
  }
  if (ec == http::error::body_limit || ec == http::error::header_limit) {
    return VOX_ERR_INVALID_SIZE;
  }
  return VOX_ERR_CONNECTION;
}

// One request/response on a fresh connection; every step shares a deadline.
template <class Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
  static constexpr bool kSecure = std::is_same<Stream, SecureStream>::value;

public:
  Exchange(net::io_context &ioc, ssl::context &ctx, const ParsedUrl &url,
           http::request<http::string_body> req, const HttpClientConfig &cfg,
           HttpResponse &out, vox_err_t &result)
      : m_resolver(ioc), m_url(url), m_req(std::move(req)), m_cfg(cfg),
        m_out(out), m_result(result) {
    if constexpr (kSecure) {
      m_stream.reset(new Stream(ioc, ctx));
    } else {
      (void)ctx;
      m_stream.reset(new Stream(ioc));
    }
    m_deadline = std::chrono::steady_clock::now() +
                 std::chrono::milliseconds(cfg.timeout_ms);
    m_parser.body_limit(cfg.max_response_bytes);
  }

  void run() {
    m_resolver.async_resolve(m_url.host, m_url.port,
                             beast::bind_front_handler(
                                 &Exchange::onResolve, this->shared_from_this()));
  }

private:
  PlainStream &lowest() { return beast::get_lowest_layer(*m_stream); }

  void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      return fail(ec, "resolve");
    }
    lowest().expires_at(m_deadline);
    lowest().async_connect(results,
                           beast::bind_front_handler(&Exchange::onConnect,
                                                     this->shared_from_this()));
  }

  void onConnect(beast::error_code ec,
                 tcp::resolver::results_type::endpoint_type) {
    if (ec) {
      return fail(ec, "connect");
    }
    if constexpr (kSecure) {
      if (!SSL_set_tlsext_host_name(m_stream->native_handle(),
                                    m_url.host.c_str())) {
        beast::error_code sni(static_cast<int>(::ERR_get_error()),
                              net::error::get_ssl_category());
        return fail(sni, "tls sni");
      }
      if (m_cfg.verify_peer) {
        m_stream->set_verify_mode(ssl::verify_peer);
        m_stream->set_verify_callback(ssl::host_name_verification(m_url.host));
      } else {
        m_stream->set_verify_mode(ssl::verify_none);
      }
      lowest().expires_at(m_deadline);
      m_stream->async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&Exchange::onTlsHandshake,
                                    this->shared_from_this()));
    } else {
      doWrite();
    }
  }

  void onTlsHandshake(beast::error_code ec) {
    if (ec) {
      return fail(ec, "tls handshake");
    }
    doWrite();
  }

  void doWrite() {
    lowest().expires_at(m_deadline);
    http::async_write(*m_stream, m_req,
                      beast::bind_front_handler(&Exchange::onWrite,
                                                this->shared_from_this()));
  }

  void onWrite(beast::error_code ec, std::size_t bytes) {
    if (ec) {
      return fail(ec, "write");
    }
    VOX_LOGD(TAG, "request sent (%u bytes)", (unsigned)bytes);
    lowest().expires_at(m_deadline);
    http::async_read(*m_stream, m_buffer, m_parser,
                     beast::bind_front_handler(&Exchange::onRead,
                                               this->shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t) {
    if (ec) {
      return fail(ec, "read");
    }
    auto res = m_parser.release();
    m_out.status = static_cast<int>(res.result_int());
    beast::string_view ct = res[http::field::content_type];
    m_out.content_type.assign(ct.data(), ct.size());
    m_out.body = std::move(res.body());
    m_result = VOX_OK;

    // No TLS close_notify; the server may already have dropped the link.
    beast::error_code ignored;
    lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);
    lowest().close();
  }

  void fail(beast::error_code ec, const char *what) {
    VOX_LOGE(TAG, "%s failed: %s", what, ec.message().c_str());
    m_result = mapError(ec);
    lowest().close();
  }

  tcp::resolver m_resolver;
  std::unique_ptr<Stream> m_stream;
  ParsedUrl m_url;
  http::request<http::string_body> m_req;
  const HttpClientConfig &m_cfg;
  HttpResponse &m_out;
  vox_err_t &m_result;

  std::chrono::steady_clock::time_point m_deadline;
  beast::flat_buffer m_buffer;
  http::response_parser<ResponseBody> m_parser;
};

} // namespace

HttpClient::HttpClient() = default;
HttpClient::~HttpClient() = default;

vox_err_t HttpClient::init(const HttpClientConfig &cfg) {
  if (cfg.timeout_ms <= 0 || cfg.max_response_bytes == 0) {
    VOX_LOGE(TAG, "invalid config: timeout=%d max_response=%u", cfg.timeout_ms,
             (unsigned)cfg.max_response_bytes);
    return VOX_ERR_INVALID_ARG;
  }
  m_cfg = cfg;

  try {
    m_tls.reset(new ssl::context(ssl::context::tlsv12_client));
    m_tls->set_default_verify_paths();
    if (!m_cfg.ca_file.empty()) {
      m_tls->load_verify_file(m_cfg.ca_file);
    }
  } catch (const boost::system::system_error &e) {
    VOX_LOGE(TAG, "tls context setup failed: %s", e.what());
    m_tls.reset();
    return VOX_FAIL;
  }

  m_inited = true;
  return VOX_OK;
}

vox_err_t HttpClient::perform(const HttpRequest &req, HttpResponse &resp) {
  if (!m_inited) {
    return VOX_ERR_INVALID_STATE;
  }

  ParsedUrl url;
  VOX_RETURN_ON_ERROR(parseUrl(req.url, url), TAG, "bad url: %s",
                      req.url.c_str());
  if (url.scheme != "http" && url.scheme != "https") {
    VOX_LOGE(TAG, "not an http url: %s", req.url.c_str());
    return VOX_ERR_INVALID_ARG;
  }

  http::verb verb = http::string_to_verb(req.method);
  if (verb == http::verb::unknown) {
    VOX_LOGE(TAG, "unknown method: %s", req.method.c_str());
    return VOX_ERR_INVALID_ARG;
  }

  http::request<http::string_body> msg{verb, url.target, 11};
  msg.set(http::field::host, url.hostHeader());
  msg.set(http::field::user_agent, m_cfg.user_agent);
  for (const auto &kv : req.headers) {
    msg.set(kv.first, kv.second);
  }
  msg.body() = req.body;
  msg.prepare_payload();

  resp = HttpResponse();
  vox_err_t result = VOX_FAIL;

  try {
    net::io_context ioc{1};
    if (url.secure) {
      std::make_shared<Exchange<SecureStream>>(ioc, *m_tls, url, std::move(msg),
                                               m_cfg, resp, result)
          ->run();
    } else {
      std::make_shared<Exchange<PlainStream>>(ioc, *m_tls, url, std::move(msg),
                                              m_cfg, resp, result)
          ->run();
    }
    ioc.run();
  } catch (const std::exception &e) {
    VOX_LOGE(TAG, "request aborted: %s", e.what());
    return VOX_ERR_CONNECTION;
  }

  if (result == VOX_OK) {
    VOX_LOGI(TAG, "%s %s -> %d (%u bytes, %s)", req.method.c_str(),
             req.url.c_str(), resp.status, (unsigned)resp.body.size(),
             resp.content_type.empty() ? "-" : resp.content_type.c_str());
  }
  return result;
}
