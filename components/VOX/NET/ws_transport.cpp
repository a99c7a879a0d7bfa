#include "ws_transport.h"
#include "url.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

static const char *TAG = "WsTransport";

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using PlainWs = websocket::stream<beast::tcp_stream>;
using SecureWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

using LinkEmit = std::function<void(TransportEvent, const std::string &)>;
using SendDone = std::function<void(vox_err_t)>;

// Everything below runs on the transport's io thread.
class LinkBase {
public:
  virtual ~LinkBase() = default;
  virtual void run() = 0;
  virtual void send(std::string text, SendDone done) = 0;
  virtual void close() = 0;
};

template <class WsStream>
class Link : public LinkBase,
             public std::enable_shared_from_this<Link<WsStream>> {
  static constexpr bool kSecure = std::is_same<WsStream, SecureWs>::value;

public:
  Link(net::io_context &ioc, ssl::context &ctx, const ParsedUrl &url,
       int timeoutMs, const WsTransportConfig &cfg, LinkEmit emit)
      : m_resolver(ioc), m_url(url), m_timeout(timeoutMs), m_cfg(cfg),
        m_emit(std::move(emit)) {
    if constexpr (kSecure) {
      m_ws.reset(new WsStream(ioc, ctx));
    } else {
      (void)ctx;
      m_ws.reset(new WsStream(ioc));
    }
  }

  void run() override {
    m_resolver.async_resolve(
        m_url.host, m_url.port,
        beast::bind_front_handler(&Link::onResolve, this->shared_from_this()));
  }

  void send(std::string text, SendDone done) override {
    if (!m_open || m_closing || m_failed) {
      done(VOX_ERR_INVALID_STATE);
      return;
    }
    m_queue.emplace_back(std::move(text), std::move(done));
    if (m_queue.size() == 1) {
      doWrite();
    }
  }

  void close() override {
    if (m_closing) {
      return;
    }
    m_closing = true;
    if (m_open && m_queue.empty()) {
      auto self = this->shared_from_this();
      m_ws->async_close(websocket::close_code::normal,
                        [self](beast::error_code ec) {
                          if (ec) {
                            VOX_LOGD(TAG, "close: %s", ec.message().c_str());
                          }
                        });
    } else {
      // Mid-connect or mid-write: no close frame, just drop the socket
      m_resolver.cancel();
      beast::get_lowest_layer(*m_ws).close();
    }
    m_open = false;
    failPending(VOX_ERR_INVALID_STATE);
  }

private:
  void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      return fail(ec, "resolve");
    }
    beast::get_lowest_layer(*m_ws).expires_after(
        std::chrono::milliseconds(m_timeout));
    beast::get_lowest_layer(*m_ws).async_connect(
        results,
        beast::bind_front_handler(&Link::onConnect, this->shared_from_this()));
  }

  void onConnect(beast::error_code ec,
                 tcp::resolver::results_type::endpoint_type ep) {
    if (ec) {
      return fail(ec, "connect");
    }
    VOX_LOGD(TAG, "TCP connected to %s:%u", ep.address().to_string().c_str(),
             (unsigned)ep.port());

    if constexpr (kSecure) {
      // SNI
      if (!SSL_set_tlsext_host_name(m_ws->next_layer().native_handle(),
                                    m_url.host.c_str())) {
        beast::error_code sni(static_cast<int>(::ERR_get_error()),
                              net::error::get_ssl_category());
        return fail(sni, "tls sni");
      }
      if (m_cfg.verify_peer) {
        m_ws->next_layer().set_verify_mode(ssl::verify_peer);
        m_ws->next_layer().set_verify_callback(
            ssl::host_name_verification(m_url.host));
      } else {
        m_ws->next_layer().set_verify_mode(ssl::verify_none);
      }
      beast::get_lowest_layer(*m_ws).expires_after(
          std::chrono::milliseconds(m_timeout));
      m_ws->next_layer().async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&Link::onTlsHandshake,
                                    this->shared_from_this()));
    } else {
      startWsHandshake();
    }
  }

  void onTlsHandshake(beast::error_code ec) {
    if (ec) {
      return fail(ec, "tls handshake");
    }
    startWsHandshake();
  }

  void startWsHandshake() {
    // The websocket stream applies its own timeouts from here on
    beast::get_lowest_layer(*m_ws).expires_never();

    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::milliseconds(m_timeout);
    if (m_cfg.keepalive_idle_sec > 0) {
      opt.idle_timeout = std::chrono::seconds(m_cfg.keepalive_idle_sec);
      opt.keep_alive_pings = true;
    } else {
      opt.idle_timeout = websocket::stream_base::none();
      opt.keep_alive_pings = false;
    }
    m_ws->set_option(opt);

    std::string ua = m_cfg.user_agent;
    std::map<std::string, std::string> headers = m_cfg.headers;
    m_ws->set_option(websocket::stream_base::decorator(
        [ua, headers](websocket::request_type &req) {
          req.set(http::field::user_agent, ua);
          for (const auto &kv : headers) {
            req.set(kv.first, kv.second);
          }
        }));
    m_ws->read_message_max(m_cfg.max_message_bytes);

    m_ws->async_handshake(
        m_url.hostHeader(), m_url.target,
        beast::bind_front_handler(&Link::onHandshake, this->shared_from_this()));
  }

  void onHandshake(beast::error_code ec) {
    if (ec) {
      return fail(ec, "handshake");
    }
    m_ws->text(true);
    m_open = true;
    VOX_LOGI(TAG, "WebSocket connected: %s%s", m_url.hostHeader().c_str(),
             m_url.target.c_str());
    m_emit(TransportEvent::Connected, std::string());
    doRead();
  }

  void doRead() {
    m_ws->async_read(m_buffer, beast::bind_front_handler(
                                   &Link::onRead, this->shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t bytes) {
    if (m_closing || m_failed) {
      return;
    }
    if (ec == websocket::error::closed) {
      m_open = false;
      const websocket::close_reason &cr = m_ws->reason();
      std::string reason(cr.reason.data(), cr.reason.size());
      VOX_LOGI(TAG, "Closed by peer (code=%u %s)", (unsigned)cr.code,
               reason.c_str());
      failPending(VOX_ERR_CONNECTION);
      m_emit(TransportEvent::Closed, reason);
      m_emit(TransportEvent::Disconnected, std::string());
      return;
    }
    if (ec) {
      return fail(ec, "read");
    }

    if (m_ws->got_text()) {
      std::string payload = beast::buffers_to_string(m_buffer.data());
      m_buffer.consume(m_buffer.size());
      m_emit(TransportEvent::Data, payload);
    } else {
      VOX_LOGD(TAG, "Ignore binary message (%u bytes)", (unsigned)bytes);
      m_buffer.consume(m_buffer.size());
    }
    doRead();
  }

  void doWrite() {
    m_ws->async_write(
        net::buffer(m_queue.front().first),
        beast::bind_front_handler(&Link::onWrite, this->shared_from_this()));
  }

  void onWrite(beast::error_code ec, std::size_t) {
    if (m_queue.empty()) {
      return;
    }
    SendDone done = std::move(m_queue.front().second);
    m_queue.pop_front();
    if (ec) {
      done(VOX_ERR_CONNECTION);
      return fail(ec, "write");
    }
    done(VOX_OK);
    if (!m_queue.empty() && !m_closing) {
      doWrite();
    }
  }

  void failPending(vox_err_t err) {
    while (!m_queue.empty()) {
      SendDone done = std::move(m_queue.front().second);
      m_queue.pop_front();
      done(err);
    }
  }

  void fail(beast::error_code ec, const char *what) {
    if (m_closing || m_failed) {
      return;
    }
    m_failed = true;
    m_open = false;
    VOX_LOGE(TAG, "%s: %s", what, ec.message().c_str());
    failPending(VOX_ERR_CONNECTION);
    beast::get_lowest_layer(*m_ws).close();
    m_emit(TransportEvent::Error, std::string(what) + ": " + ec.message());
    m_emit(TransportEvent::Disconnected, std::string());
  }

  tcp::resolver m_resolver;
  std::unique_ptr<WsStream> m_ws;
  beast::flat_buffer m_buffer;
  ParsedUrl m_url;
  int m_timeout;
  WsTransportConfig m_cfg;
  LinkEmit m_emit;

  std::deque<std::pair<std::string, SendDone>> m_queue;
  bool m_open = false;
  bool m_closing = false;
  bool m_failed = false;
};

} // namespace

struct WebSocketTransport::Impl {
  std::atomic<int> pending{0};
  std::atomic<bool> stopping{false};
  std::atomic<bool> connected{false};
  std::promise<void> finished;
  std::future<void> finishedFuture = finished.get_future();

  net::io_context ioc{1};
  ssl::context ssl{ssl::context::tlsv12_client};
  std::shared_ptr<LinkBase> link;
  std::thread thread;
};

WebSocketTransport::WebSocketTransport(const WsTransportConfig &cfg)
    : m_cfg(cfg) {}

WebSocketTransport::~WebSocketTransport() { stop(); }

vox_err_t WebSocketTransport::start(const std::string &uri, int timeout_ms) {
  ParsedUrl url;
  VOX_RETURN_ON_ERROR(parseUrl(uri, url), TAG, "bad uri");
  if (url.scheme != "ws" && url.scheme != "wss") {
    VOX_LOGE(TAG, "not a websocket uri: %s", url.scheme.c_str());
    return VOX_ERR_INVALID_ARG;
  }
  if (timeout_ms <= 0) {
    return VOX_ERR_INVALID_ARG;
  }

  // Previous link, if any, goes away first
  stop();

  auto impl = std::make_shared<Impl>();
  if (url.secure) {
    boost::system::error_code ec;
    impl->ssl.set_default_verify_paths(ec);
    if (ec) {
      VOX_LOGW(TAG, "no system trust store: %s", ec.message().c_str());
    }
    if (!m_cfg.ca_file.empty()) {
      impl->ssl.load_verify_file(m_cfg.ca_file, ec);
      if (ec) {
        VOX_LOGE(TAG, "load CA file %s: %s", m_cfg.ca_file.c_str(),
                 ec.message().c_str());
        return VOX_ERR_INVALID_ARG;
      }
    }
  }

  Impl *raw = impl.get();
  LinkEmit emit = [this, raw](TransportEvent ev, const std::string &payload) {
    onLinkEvent(raw, ev, payload);
  };
  if (url.secure) {
    impl->link = std::make_shared<Link<SecureWs>>(impl->ioc, impl->ssl, url,
                                                  timeout_ms, m_cfg, emit);
  } else {
    impl->link = std::make_shared<Link<PlainWs>>(impl->ioc, impl->ssl, url,
                                                 timeout_ms, m_cfg, emit);
  }
  impl->link->run();

  VOX_LOGI(TAG, "Connecting to %s://%s%s (timeout %dms)", url.scheme.c_str(),
           url.hostHeader().c_str(), url.target.c_str(), timeout_ms);

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_impl = impl;
  }
  impl->thread = std::thread([impl]() {
    try {
      impl->ioc.run();
    } catch (const std::exception &e) {
      VOX_LOGE(TAG, "io thread: %s", e.what());
      impl->connected.store(false);
    }
    impl->finished.set_value();
  });
  return VOX_OK;
}

void WebSocketTransport::stop() {
  std::shared_ptr<Impl> impl;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    impl.swap(m_impl);
  }
  if (!impl) {
    return;
  }

  impl->stopping.store(true);
  impl->connected.store(false);
  std::shared_ptr<LinkBase> link = impl->link;
  net::post(impl->ioc, [link]() { link->close(); });

  if (!impl->thread.joinable()) {
    return;
  }
  if (impl->thread.get_id() == std::this_thread::get_id()) {
    // Called from our own event handler; the io thread winds down by itself
    impl->thread.detach();
    return;
  }

  if (impl->finishedFuture.wait_for(std::chrono::milliseconds(
          m_cfg.close_timeout_ms)) == std::future_status::timeout) {
    VOX_LOGW(TAG, "close timed out after %dms, forcing", m_cfg.close_timeout_ms);
    impl->ioc.stop();
  }
  impl->thread.join();
  VOX_LOGI(TAG, "Stopped");
}

bool WebSocketTransport::isConnected() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_impl && m_impl->connected.load();
}

vox_err_t WebSocketTransport::sendText(const std::string &text) {
  std::shared_ptr<Impl> impl;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    impl = m_impl;
  }
  if (!impl || !impl->connected.load()) {
    return VOX_ERR_INVALID_STATE;
  }
  if (impl->pending.load() >= m_cfg.max_pending_messages) {
    VOX_LOGW(TAG, "write queue full (%d), dropping %u bytes",
             impl->pending.load(), (unsigned)text.size());
    return VOX_ERR_NO_MEM;
  }

  std::atomic<int> *pending = &impl->pending;
  pending->fetch_add(1);
  SendDone done = [pending](vox_err_t err) {
    pending->fetch_sub(1);
    if (err != VOX_OK) {
      VOX_LOGW(TAG, "send failed: %s", vox_err_to_name(err));
    }
  };

  if (impl->thread.get_id() == std::this_thread::get_id()) {
    // Already on the io thread (e.g. answering a ping)
    impl->link->send(text, std::move(done));
    return VOX_OK;
  }
  std::shared_ptr<LinkBase> link = impl->link;
  net::post(impl->ioc, [link, text, done]() { link->send(text, done); });
  return VOX_OK;
}

void WebSocketTransport::onLinkEvent(Impl *impl, TransportEvent event,
                                     const std::string &payload) {
  if (impl->stopping.load()) {
    return;
  }
  switch (event) {
  case TransportEvent::Connected:
    impl->connected.store(true);
    break;
  case TransportEvent::Disconnected:
  case TransportEvent::Closed:
  case TransportEvent::Error:
    impl->connected.store(false);
    break;
  default:
    break;
  }
  emit(event, payload);
}
