#pragma once

#include "session_messages.h"
#include "session_state_machine.h"
#include "session_transport.h"
#include "vox_err.h"
#include "vox_time.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

/**
 * @brief 打断策略（本地开始说话时如何处理 agent 音频）
 */
struct BargeInPolicy {
    bool duck_playback = true;       ///< 压低播放音量
    float duck_volume = 0.0f;        ///< 压低后的增益，0 为静音
    bool drop_inbound_audio = true;  ///< 说话期间丢弃收到的音频
};

/**
 * @brief 流式会话配置
 */
struct SessionProtocolConfig {
    std::string agent_id;                                              ///< 与 url 二选一
    std::string endpoint = "wss://api.elevenlabs.io/v1/convai/conversation";
    std::string url;                                                   ///< 完整 URL，优先于 endpoint + agent_id
    SessionInitiation initiation;                                      ///< 语言 / user_id / 动态变量
    int connection_timeout_ms = 10000;                                 ///< 连接 + 握手总超时
    int max_reconnect_attempts = 3;
    int reconnect_delay_ms = 2000;
    BargeInPolicy barge_in;
};

/**
 * @brief 会话错误
 */
struct SessionError {
    vox_err_t code = VOX_OK;
    bool fatal = false;   ///< true: 会话不会自行恢复
    std::string message;
};

/**
 * @brief 流式对话会话协议
 *
 * 负责连接、握手、消息分发（ping/pong、音频、转写、agent 文本）、
 * 断线重连和打断协调。传输层事件在其接收线程上处理；超时和重连
 * 调度由调用方周期调用 tick() 驱动。
 *
 * 回调可能在接收线程或 tick() 所在线程上触发，回调里不要再调用本类的
 * connect()/disconnect()/tick()。
 *
 * @example
 *   WebSocketTransport ws;
 *   SessionProtocol session(ws);
 *   session.init(cfg);
 *   session.setOnAudio([&](const uint8_t* pcm, size_t len) { pipe.handleInboundPcm(pcm, len); });
 *   session.connect();
 *   while (...) { session.tick(); }
 *   session.disconnect();
 */
class SessionProtocol {
public:
    explicit SessionProtocol(SessionTransport& transport);
    ~SessionProtocol();

    SessionProtocol(const SessionProtocol&) = delete;
    SessionProtocol& operator=(const SessionProtocol&) = delete;

    /**
     * @return VOX_ERR_INVALID_ARG 缺少 agent_id/url 或参数越界
     */
    vox_err_t init(const SessionProtocolConfig& config);

    /**
     * @brief 开始连接（异步），结果通过状态回调/错误回调通知
     */
    vox_err_t connect();

    /**
     * @brief 主动断开；可重复调用，不会触发重连
     */
    void disconnect();

    /**
     * @brief 发送一块 16 kHz PCM16 mono 音频；仅 Active 状态下允许
     * @return VOX_ERR_INVALID_STATE 尚未 Active，数据不会发出
     */
    vox_err_t sendAudio(const uint8_t* pcm, size_t len);

    /**
     * @brief 发送文字消息 {"type":"user_message"}
     */
    vox_err_t sendUserMessage(const std::string& text);

    /**
     * @brief 本地说话状态（来自 VAD），驱动打断
     */
    void setLocalSpeaking(bool speaking);

    /**
     * @brief 处理连接超时和重连调度，建议 10 ~ 50 ms 调用一次
     */
    void tick();

    SessionState getState() const { return sm_.getState(); }
    bool isActive() const { return sm_.getState() == SessionState::Active; }
    bool isLocalSpeaking() const { return local_speaking_.load(); }
    std::string conversationId() const;
    int reconnectAttempts() const;
    bool reconnectPending() const;
    const std::string& url() const { return url_; }

    uint64_t audioChunksSent() const { return audio_sent_.load(); }
    uint64_t audioChunksReceived() const { return audio_received_.load(); }
    uint64_t audioChunksDropped() const { return audio_dropped_.load(); }

    /**
     * @brief 替换时钟源（测试用）
     */
    void setTimeSource(VoxClock clock) { clock_ = std::move(clock); }

    // ========== 回调设置 ==========

    using StateCallback = std::function<void(SessionState old_state, SessionState new_state)>;
    void setOnStateChange(StateCallback cb) { on_state_ = std::move(cb); }

    /**
     * @brief agent 音频（已 base64 解码的 16 kHz PCM16）
     */
    using AudioCallback = std::function<void(const uint8_t* pcm, size_t len)>;
    void setOnAudio(AudioCallback cb) { on_audio_ = std::move(cb); }

    using TextCallback = std::function<void(const std::string& text)>;
    void setOnUserTranscript(TextCallback cb) { on_transcript_ = std::move(cb); }
    void setOnAgentResponse(TextCallback cb) { on_agent_response_ = std::move(cb); }

    using ErrorCallback = std::function<void(const SessionError& error)>;
    void setOnError(ErrorCallback cb) { on_error_ = std::move(cb); }

    /**
     * @brief 播放控制 (增益, 是否清空播放缓冲)，打断时触发
     */
    using PlaybackControlCallback = std::function<void(float gain, bool flush)>;
    void setOnPlaybackControl(PlaybackControlCallback cb) { on_playback_control_ = std::move(cb); }

private:
    vox_err_t startAttempt();
    void onTransportEvent(TransportEvent event, const std::string& payload);
    void handleTextMessage(const std::string& text);
    void handleLinkDown();
    void handleAttemptFailed(vox_err_t code, const std::string& message);
    bool scheduleReconnectLocked();
    vox_err_t sendText(const std::string& text);
    void reportError(vox_err_t code, bool fatal, const std::string& message);
    int64_t now() const { return clock_ ? clock_() : vox_time_ms(); }

    SessionTransport& transport_;
    SessionProtocolConfig config_;
    std::string url_;
    bool initialized_ = false;

    SessionStateMachine sm_;
    VoxClock clock_ = vox_default_clock();

    mutable std::mutex mutex_;        // 状态决策、会话 ID、重连计数
    std::mutex send_mutex_;           // 所有写操作
    std::string conversation_id_;
    std::string last_transport_error_;
    int64_t attempt_started_ms_ = 0;
    bool user_disconnect_ = false;
    bool reached_active_ = false;     // 本次会话曾进入 Active，断线后才允许重连
    int reconnect_attempts_ = 0;
    bool reconnect_pending_ = false;
    int64_t reconnect_at_ms_ = 0;

    std::atomic<bool> local_speaking_{false};
    std::atomic<uint64_t> audio_sent_{0};
    std::atomic<uint64_t> audio_received_{0};
    std::atomic<uint64_t> audio_dropped_{0};

    StateCallback on_state_;
    AudioCallback on_audio_;
    TextCallback on_transcript_;
    TextCallback on_agent_response_;
    ErrorCallback on_error_;
    PlaybackControlCallback on_playback_control_;
};
