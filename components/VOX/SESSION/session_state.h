#ifndef _SESSION_STATE_H_
#define _SESSION_STATE_H_

/**
 * @brief 流式会话连接状态
 *
 * Disconnected -> Connecting -> Handshaking -> Active -> Closing -> Disconnected
 */
enum class SessionState {
    Disconnected = 0, ///< 未连接
    Connecting,       ///< 传输层连接中
    Handshaking,      ///< 已发送 initiation，等待 conversation_id
    Active,           ///< 双向音频流
    Closing,          ///< 本地主动关闭中
};

inline const char* GetSessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting:   return "Connecting";
        case SessionState::Handshaking:  return "Handshaking";
        case SessionState::Active:       return "Active";
        case SessionState::Closing:      return "Closing";
        default:                         return "Invalid";
    }
}

#endif // _SESSION_STATE_H_
