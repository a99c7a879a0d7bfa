#pragma once

#include "vox_err.h"

#include <functional>
#include <string>

/**
 * @brief 传输层事件
 */
enum class TransportEvent {
    Connected,    ///< 连接和握手完成，可以发送
    Disconnected, ///< 连接断开（失败、对端关闭或出错后都会收到）
    Data,         ///< 一条完整的文本消息
    Error,        ///< 出错，payload 为错误描述；之后跟随 Disconnected
    Closed,       ///< 对端发起的正常关闭
};

/**
 * @brief 会话传输层抽象（WebSocket 或测试用的 mock）
 *
 * 事件在传输层自己的接收线程上回调。stop() 返回后不再有任何回调。
 */
class SessionTransport {
public:
    using EventHandler = std::function<void(TransportEvent event, const std::string& payload)>;

    virtual ~SessionTransport() = default;

    /**
     * @brief 异步开始连接；结果通过 Connected 或 Error/Disconnected 事件返回
     */
    virtual vox_err_t start(const std::string& uri, int timeout_ms) = 0;

    /**
     * @brief 关闭连接并等待接收线程退出，可重复调用
     */
    virtual void stop() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief 发送一条文本帧（线程安全）
     */
    virtual vox_err_t sendText(const std::string& text) = 0;

    /**
     * @brief 必须在 start() 之前设置
     */
    void setEventHandler(EventHandler handler) { handler_ = std::move(handler); }

protected:
    void emit(TransportEvent event, const std::string& payload = std::string()) {
        if (handler_) {
            handler_(event, payload);
        }
    }

private:
    EventHandler handler_;
};
