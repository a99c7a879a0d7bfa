#ifndef _SESSION_STATE_MACHINE_H_
#define _SESSION_STATE_MACHINE_H_

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

#include "session_state.h"

/**
 * @brief 会话状态机
 *
 * 校验状态转换，非法转换被拒绝并记录日志；转换成功后通知监听器。
 *
 * @example
 *   SessionStateMachine sm;
 *   sm.addStateChangeListener([](SessionState old, SessionState now) {
 *       VOX_LOGI("SM", "State: %s -> %s",
 *                GetSessionStateName(old), GetSessionStateName(now));
 *   });
 *   sm.transitionTo(SessionState::Connecting);
 */
class SessionStateMachine {
public:
    SessionStateMachine() = default;

    SessionStateMachine(const SessionStateMachine&) = delete;
    SessionStateMachine& operator=(const SessionStateMachine&) = delete;

    SessionState getState() const { return current_state_.load(); }

    /**
     * @brief 尝试转换到新状态
     * @return true 转换成功（或已在目标状态）, false 转换无效
     */
    bool transitionTo(SessionState new_state);

    /**
     * @brief 仅当当前状态为 expected 时转换
     */
    bool transitionFrom(SessionState expected, SessionState new_state);

    bool canTransitionTo(SessionState target) const;

    /**
     * @brief 状态变化回调 (旧状态, 新状态)
     */
    using StateCallback = std::function<void(SessionState, SessionState)>;

    /**
     * @return 监听器ID，用于移除
     */
    int addStateChangeListener(StateCallback callback);
    void removeStateChangeListener(int listener_id);

    /**
     * @brief 强制回到 Disconnected（不校验）
     */
    void reset();

    static bool isValidTransition(SessionState from, SessionState to);

private:
    std::atomic<SessionState> current_state_{SessionState::Disconnected};
    std::vector<std::pair<int, StateCallback>> listeners_;
    int next_listener_id_{0};
    mutable std::mutex mutex_;

    void notifyStateChange(SessionState old_state, SessionState new_state);
};

#endif // _SESSION_STATE_MACHINE_H_
