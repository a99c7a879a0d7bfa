#pragma once

#include "audio_device.h"
#include "audio_transcoder_pipeline.h"
#include "conversation_events.h"
#include "session_protocol.h"
#include "session_transport.h"
#include "vox_err.h"
#include "vox_time.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief 对话阶段
 */
enum class ConversationPhase {
  Idle,
  Greeting,   ///< 播放开场白
  Connecting, ///< 等待会话 Active
  Warmup,     ///< 连接后短暂等待再开麦
  Active,
  Ending,     ///< 已停止采集，等待尾包发出
};

inline const char *GetConversationPhaseName(ConversationPhase phase) {
  switch (phase) {
  case ConversationPhase::Idle:
    return "Idle";
  case ConversationPhase::Greeting:
    return "Greeting";
  case ConversationPhase::Connecting:
    return "Connecting";
  case ConversationPhase::Warmup:
    return "Warmup";
  case ConversationPhase::Active:
    return "Active";
  case ConversationPhase::Ending:
    return "Ending";
  default:
    return "Invalid";
  }
}

struct OrchestratorConfig {
  TranscoderConfig transcoder;
  SessionProtocolConfig session;

  int warmup_ms = 500;               ///< Active 之后到开麦的延迟
  int end_grace_ms = 300;            ///< 停止采集到断开连接的延迟
  int max_conversation_seconds = 300; ///< 0 不限制
  int greeting_timeout_ms = 10000;
  size_t event_queue_capacity = 256;
};

/**
 * @brief 对话生命周期编排
 *
 * begin -> (开场白) -> 连接 -> 握手 -> 预热 -> 开麦 -> 对话 -> 结束。
 * 所有阶段推进和事件分发都在 tick() 中完成，beginConversation()、
 * endConversation() 和 tick() 需在同一线程调用；会话/采集线程只往
 * 事件队列里放事件。
 *
 * @example
 *   WebSocketTransport ws;
 *   ConversationOrchestrator conv(ws, &mic, &speaker);
 *   conv.init(cfg);
 *   conv.setOnEvent([](const ConversationEvent& ev) { ... });
 *   conv.beginConversation();
 *   while (conv.phase() != ConversationPhase::Idle) {
 *       conv.tick();
 *       vox_delay_ms(20);
 *   }
 */
class ConversationOrchestrator {
public:
  ConversationOrchestrator(SessionTransport &transport, AudioCaptureDevice *mic,
                           AudioPlaybackDevice *speaker);
  ~ConversationOrchestrator();

  ConversationOrchestrator(const ConversationOrchestrator &) = delete;
  ConversationOrchestrator &operator=(const ConversationOrchestrator &) = delete;

  vox_err_t init(const OrchestratorConfig &cfg);

  /**
   * @brief 开场白（单声道），下次 beginConversation 时先播放
   */
  void setGreeting(const float *mono, size_t n, int sampleRate);
  void clearGreeting() { m_greeting.clear(); }

  /**
   * @return VOX_ERR_DEVICE_UNAVAILABLE 没有麦克风（状态不变）；
   *         VOX_ERR_INVALID_STATE 对话已在进行
   */
  vox_err_t beginConversation();

  /**
   * @brief 正常结束：停采集、发尾包、等待 end_grace_ms 后断开
   */
  vox_err_t endConversation();

  /**
   * @brief 立即结束，不等待
   */
  void forceEndConversation();

  /**
   * @brief 推进状态机并分发事件，建议 10 ~ 50 ms 调用一次
   */
  void tick();

  vox_err_t sendTextMessage(const std::string &text);

  /**
   * @brief 一行可读状态，例如 "Active | session=Active | id=abc123 | 42s left"
   */
  std::string getStatus() const;
  bool isReadyForConversation() const;

  ConversationPhase phase() const { return m_phase.load(); }
  bool isActive() const { return m_phase.load() == ConversationPhase::Active; }
  EndReason lastEndReason() const { return m_lastEndReason; }

  using EventCallback = std::function<void(const ConversationEvent &event)>;
  void setOnEvent(EventCallback cb) { m_onEvent = std::move(cb); }

  /**
   * @brief 替换时钟源（同时作用于会话），测试用
   */
  void setTimeSource(VoxClock clock);

  AudioTranscoderPipeline &pipeline() { return m_pipeline; }
  SessionProtocol &session() { return m_session; }

private:
  void wireCallbacks();
  vox_err_t preparePipeline();
  void startConnecting();
  void startCapture();
  void beginEnding(EndReason reason);
  void finishConversation(EndReason reason);
  void cleanup();
  void feedGreeting();
  void releaseGreeting();
  void drainEvents();
  void handleEvent(const ConversationEvent &event);
  void pushError(vox_err_t code, bool fatal, const std::string &message);
  void setPhase(ConversationPhase phase);
  int64_t now() const { return m_clock ? m_clock() : vox_time_ms(); }

  AudioCaptureDevice *m_mic;
  AudioPlaybackDevice *m_speaker;

  OrchestratorConfig m_cfg;
  bool m_inited = false;

  AudioTranscoderPipeline m_pipeline;
  SessionProtocol m_session;
  EventQueue m_events;
  VoxClock m_clock = vox_default_clock();

  std::atomic<ConversationPhase> m_phase{ConversationPhase::Idle};
  int64_t m_phaseDeadline = 0;
  int64_t m_startedAt = 0;
  int64_t m_lastPump = 0;
  EndReason m_endReason = EndReason::None;
  EndReason m_lastEndReason = EndReason::None;

  std::vector<float> m_greeting;
  int m_greetingRate = 0;
  std::vector<float> m_greetingOut; // at the output rate, fed as it drains
  size_t m_greetingPos = 0;
  bool m_speakerStarted = false;

  EventCallback m_onEvent;
};
