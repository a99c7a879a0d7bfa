#pragma once

#include "session_state.h"
#include "vox_err.h"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

enum class ConversationEventType {
  Started,
  Ended,
  Transcript,       ///< 用户语音转写
  AgentText,        ///< agent 回复文本
  ConnectionStatus, ///< 会话状态变化
  Error,
};

inline const char *GetConversationEventName(ConversationEventType type) {
  switch (type) {
  case ConversationEventType::Started:
    return "Started";
  case ConversationEventType::Ended:
    return "Ended";
  case ConversationEventType::Transcript:
    return "Transcript";
  case ConversationEventType::AgentText:
    return "AgentText";
  case ConversationEventType::ConnectionStatus:
    return "ConnectionStatus";
  case ConversationEventType::Error:
    return "Error";
  default:
    return "Invalid";
  }
}

/**
 * @brief 对话结束原因
 */
enum class EndReason {
  None,
  User,           ///< endConversation / forceEndConversation
  SessionTimeout, ///< 超过最长对话时长
  ConnectionLost, ///< 断线且重连失败
  Error,          ///< 连接/握手/设备错误
};

inline const char *GetEndReasonName(EndReason reason) {
  switch (reason) {
  case EndReason::None:
    return "None";
  case EndReason::User:
    return "User";
  case EndReason::SessionTimeout:
    return "SessionTimeout";
  case EndReason::ConnectionLost:
    return "ConnectionLost";
  case EndReason::Error:
    return "Error";
  default:
    return "Invalid";
  }
}

struct ConversationEvent {
  ConversationEventType type = ConversationEventType::Error;
  std::string text;  ///< 转写 / agent 文本 / 错误描述 / 会话 ID (Started)
  SessionState old_state = SessionState::Disconnected;
  SessionState new_state = SessionState::Disconnected;
  vox_err_t code = VOX_OK;
  bool fatal = false;
  EndReason reason = EndReason::None;
};

/**
 * @brief 多生产者、单消费者事件队列
 *
 * 网络线程和调用线程 push()，tick() 所在线程 pop()。满了丢最旧的。
 */
class EventQueue {
public:
  explicit EventQueue(size_t capacity = 256) : m_capacity(capacity) {}

  void setCapacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_capacity = capacity > 0 ? capacity : 1;
  }

  /**
   * @return false 队列已满，丢弃了最旧的一条
   */
  bool push(ConversationEvent event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    bool fits = m_events.size() < m_capacity;
    if (!fits) {
      m_events.pop_front();
    }
    m_events.push_back(std::move(event));
    return fits;
  }

  bool pop(ConversationEvent &out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_events.empty()) {
      return false;
    }
    out = std::move(m_events.front());
    m_events.pop_front();
    return true;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
  }

private:
  mutable std::mutex m_mutex;
  std::deque<ConversationEvent> m_events;
  size_t m_capacity;
};
