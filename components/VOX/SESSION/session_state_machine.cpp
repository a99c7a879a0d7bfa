#include "session_state_machine.h"
#include "vox_log.h"
#include <algorithm>

static const char* TAG = "SessionSM";

bool SessionStateMachine::transitionTo(SessionState new_state) {
    SessionState old_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_state = current_state_.load();

        if (old_state == new_state) {
            return true;
        }

        if (!isValidTransition(old_state, new_state)) {
            VOX_LOGW(TAG, "Invalid transition: %s -> %s",
                     GetSessionStateName(old_state), GetSessionStateName(new_state));
            return false;
        }

        VOX_LOGI(TAG, "State transition: %s -> %s",
                 GetSessionStateName(old_state), GetSessionStateName(new_state));
        current_state_.store(new_state);
    }

    // 锁外通知，监听器里可以再查询状态
    notifyStateChange(old_state, new_state);
    return true;
}

bool SessionStateMachine::transitionFrom(SessionState expected, SessionState new_state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_state_.load() != expected) {
            return false;
        }
        if (!isValidTransition(expected, new_state)) {
            VOX_LOGW(TAG, "Invalid transition: %s -> %s",
                     GetSessionStateName(expected), GetSessionStateName(new_state));
            return false;
        }
        VOX_LOGI(TAG, "State transition: %s -> %s",
                 GetSessionStateName(expected), GetSessionStateName(new_state));
        current_state_.store(new_state);
    }
    notifyStateChange(expected, new_state);
    return true;
}

bool SessionStateMachine::canTransitionTo(SessionState target) const {
    return isValidTransition(current_state_.load(), target);
}

bool SessionStateMachine::isValidTransition(SessionState from, SessionState to) {
    switch (from) {
        case SessionState::Disconnected:
            return to == SessionState::Connecting;

        case SessionState::Connecting:
            return to == SessionState::Handshaking ||
                   to == SessionState::Closing ||
                   to == SessionState::Disconnected;

        case SessionState::Handshaking:
            return to == SessionState::Active ||
                   to == SessionState::Closing ||
                   to == SessionState::Disconnected;

        case SessionState::Active:
            return to == SessionState::Closing ||
                   to == SessionState::Disconnected;

        case SessionState::Closing:
            return to == SessionState::Disconnected;

        default:
            return false;
    }
}

int SessionStateMachine::addStateChangeListener(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(callback));
    VOX_LOGD(TAG, "Added state change listener: %d", id);
    return id;
}

void SessionStateMachine::removeStateChangeListener(int listener_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [listener_id](const auto& pair) {
                           return pair.first == listener_id;
                       }),
        listeners_.end());
}

void SessionStateMachine::reset() {
    SessionState old_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_state = current_state_.load();
        current_state_.store(SessionState::Disconnected);
    }
    if (old_state != SessionState::Disconnected) {
        notifyStateChange(old_state, SessionState::Disconnected);
    }
}

void SessionStateMachine::notifyStateChange(SessionState old_state, SessionState new_state) {
    std::vector<std::pair<int, StateCallback>> listeners_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_copy = listeners_;
    }
    for (const auto& [id, callback] : listeners_copy) {
        if (callback) {
            callback(old_state, new_state);
        }
    }
}
