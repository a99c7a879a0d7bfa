#pragma once

#include "session_transport.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

struct WsTransportConfig {
  std::map<std::string, std::string> headers; ///< 额外握手头
  std::string user_agent = "voxlink";
  bool verify_peer = true; ///< wss 校验证书和主机名
  std::string ca_file;     ///< 额外的 CA 文件（PEM），空则只用系统证书
  int max_pending_messages = 256; ///< 写队列上限，超过后 sendText 直接失败
  int close_timeout_ms = 2000;
  int keepalive_idle_sec = 30; ///< 空闲一半时间发 ping，超时未回则断开
  size_t max_message_bytes = 4 * 1024 * 1024;
};

/**
 * @brief WebSocket 传输层（ws:// 与 wss://）
 *
 * 每次 start() 创建一个独立的 io 线程，连接、TLS、握手和接收循环都在该
 * 线程上异步完成；sendText() 不阻塞，消息进入该线程的写队列串行发送，
 * 写失败通过 Error/Disconnected 事件报告。
 *
 * @example
 *   WebSocketTransport ws;
 *   ws.setEventHandler([](TransportEvent ev, const std::string& payload) { ... });
 *   ws.start("wss://api.example.com/v1/convai/conversation?agent_id=xxx", 10000);
 *   ws.sendText("{\"type\":\"pong\",\"event_id\":1}");
 *   ws.stop();
 */
class WebSocketTransport : public SessionTransport {
public:
  explicit WebSocketTransport(const WsTransportConfig &cfg = WsTransportConfig());
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport &) = delete;
  WebSocketTransport &operator=(const WebSocketTransport &) = delete;

  vox_err_t start(const std::string &uri, int timeout_ms) override;
  void stop() override;
  bool isConnected() const override;
  vox_err_t sendText(const std::string &text) override;

private:
  struct Impl;

  void onLinkEvent(Impl *impl, TransportEvent event, const std::string &payload);

  WsTransportConfig m_cfg;
  mutable std::mutex m_mutex; // guards m_impl
  std::shared_ptr<Impl> m_impl;
};
