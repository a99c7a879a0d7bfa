#include "session_protocol.h"
#include "base64.h"
#include "url.h"

#include <vector>

static const char* TAG = "Session";

SessionProtocol::SessionProtocol(SessionTransport& transport) : transport_(transport) {
    sm_.addStateChangeListener([this](SessionState old_state, SessionState new_state) {
        if (on_state_) {
            on_state_(old_state, new_state);
        }
    });
}

SessionProtocol::~SessionProtocol() {
    disconnect();
    transport_.setEventHandler(nullptr);
}

vox_err_t SessionProtocol::init(const SessionProtocolConfig& config) {
    if (initialized_) {
        VOX_LOGW(TAG, "Already initialized");
        return VOX_OK;
    }

    if (config.url.empty() && (config.agent_id.empty() || config.endpoint.empty())) {
        VOX_LOGE(TAG, "Agent ID is required");
        return VOX_ERR_INVALID_ARG;
    }
    if (config.connection_timeout_ms <= 0 || config.max_reconnect_attempts < 0 ||
        config.reconnect_delay_ms < 0) {
        VOX_LOGE(TAG, "Invalid timing: timeout=%d attempts=%d delay=%d",
                 config.connection_timeout_ms, config.max_reconnect_attempts,
                 config.reconnect_delay_ms);
        return VOX_ERR_INVALID_ARG;
    }
    if (config.barge_in.duck_volume < 0.0f || config.barge_in.duck_volume > 1.0f) {
        VOX_LOGE(TAG, "duck_volume must be within [0, 1]");
        return VOX_ERR_INVALID_ARG;
    }

    config_ = config;
    url_ = !config_.url.empty() ? config_.url
                                : appendQueryParam(config_.endpoint, "agent_id", config_.agent_id);

    transport_.setEventHandler([this](TransportEvent event, const std::string& payload) {
        onTransportEvent(event, payload);
    });

    initialized_ = true;
    VOX_LOGI(TAG, "Session initialized, URL: %s, language=%s", url_.c_str(),
             config_.initiation.language.c_str());
    return VOX_OK;
}

vox_err_t SessionProtocol::connect() {
    if (!initialized_) {
        VOX_LOGE(TAG, "Not initialized");
        return VOX_ERR_INVALID_STATE;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sm_.getState() != SessionState::Disconnected || reconnect_pending_) {
            VOX_LOGW(TAG, "Already connected or connecting");
            return VOX_OK;
        }
        user_disconnect_ = false;
        reached_active_ = false;
        reconnect_attempts_ = 0;
        conversation_id_.clear();
    }
    local_speaking_.store(false);
    return startAttempt();
}

vox_err_t SessionProtocol::startAttempt() {
    int attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sm_.transitionTo(SessionState::Connecting)) {
            return VOX_ERR_INVALID_STATE;
        }
        attempt_started_ms_ = now();
        last_transport_error_.clear();
        attempt = reconnect_attempts_;
    }

    if (attempt > 0) {
        VOX_LOGI(TAG, "Reconnecting (attempt %d/%d)...", attempt, config_.max_reconnect_attempts);
    } else {
        VOX_LOGI(TAG, "Connecting to conversation server...");
    }

    vox_err_t err = transport_.start(url_, config_.connection_timeout_ms);
    if (err != VOX_OK) {
        VOX_LOGE(TAG, "Failed to start transport: %s", vox_err_to_name(err));
        bool failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failed = sm_.transitionFrom(SessionState::Connecting, SessionState::Disconnected);
        }
        if (failed) {
            handleAttemptFailed(VOX_ERR_CONNECTION, "transport start failed");
        }
    }
    return err;
}

void SessionProtocol::disconnect() {
    bool was_connected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        user_disconnect_ = true;
        reconnect_pending_ = false;
        if (sm_.getState() != SessionState::Disconnected) {
            was_connected = sm_.transitionTo(SessionState::Closing);
        }
    }

    if (was_connected) {
        VOX_LOGI(TAG, "Disconnecting...");
    }
    transport_.stop();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sm_.getState() != SessionState::Disconnected) {
            (void)sm_.transitionTo(SessionState::Disconnected);
        }
        conversation_id_.clear();
    }
    local_speaking_.store(false);
}

void SessionProtocol::tick() {
    if (!initialized_) {
        return;
    }

    const int64_t t = now();
    bool timed_out = false;
    bool do_reconnect = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SessionState s = sm_.getState();
        if ((s == SessionState::Connecting || s == SessionState::Handshaking) &&
            t - attempt_started_ms_ >= config_.connection_timeout_ms) {
            // Moving to Disconnected first makes late transport events no-ops
            timed_out = sm_.transitionTo(SessionState::Disconnected);
        } else if (s == SessionState::Disconnected && reconnect_pending_ && !user_disconnect_ &&
                   t >= reconnect_at_ms_) {
            reconnect_pending_ = false;
            do_reconnect = true;
        }
    }

    if (timed_out) {
        VOX_LOGW(TAG, "Connection timed out after %dms", config_.connection_timeout_ms);
        transport_.stop();
        handleAttemptFailed(VOX_ERR_CONNECTION_TIMEOUT, "connection timed out");
    } else if (do_reconnect) {
        (void)startAttempt();
    }
}

vox_err_t SessionProtocol::sendText(const std::string& text) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    vox_err_t err = transport_.sendText(text);
    if (err != VOX_OK) {
        VOX_LOGW(TAG, "Failed to send (%u bytes): %s", (unsigned)text.size(), vox_err_to_name(err));
    }
    return err;
}

vox_err_t SessionProtocol::sendAudio(const uint8_t* pcm, size_t len) {
    if (sm_.getState() != SessionState::Active) {
        return VOX_ERR_INVALID_STATE;
    }
    if (!pcm || len == 0) {
        return VOX_ERR_INVALID_ARG;
    }

    vox_err_t err = sendText(buildAudioChunkMessage(base64Encode(pcm, len)));
    if (err == VOX_OK) {
        audio_sent_.fetch_add(1);
    }
    return err;
}

vox_err_t SessionProtocol::sendUserMessage(const std::string& text) {
    if (sm_.getState() != SessionState::Active) {
        VOX_LOGW(TAG, "Cannot send message: not active");
        return VOX_ERR_INVALID_STATE;
    }
    if (text.empty()) {
        return VOX_ERR_INVALID_ARG;
    }
    vox_err_t err = sendText(buildUserMessage(text));
    if (err == VOX_OK) {
        VOX_LOGI(TAG, "Sent user message: %s", text.c_str());
    }
    return err;
}

void SessionProtocol::setLocalSpeaking(bool speaking) {
    if (local_speaking_.exchange(speaking) == speaking) {
        return;
    }

    const BargeInPolicy& policy = config_.barge_in;
    if (speaking) {
        VOX_LOGD(TAG, "Barge-in: local speech started");
        if (on_playback_control_) {
            on_playback_control_(policy.duck_playback ? policy.duck_volume : 1.0f, true);
        }
    } else {
        VOX_LOGD(TAG, "Barge-in: local speech ended");
        // Restore gain and throw away whatever queued up while ducked
        if (on_playback_control_) {
            on_playback_control_(1.0f, true);
        }
    }
}

std::string SessionProtocol::conversationId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversation_id_;
}

int SessionProtocol::reconnectAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnect_attempts_;
}

bool SessionProtocol::reconnectPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnect_pending_;
}

void SessionProtocol::onTransportEvent(TransportEvent event, const std::string& payload) {
    switch (event) {
        case TransportEvent::Connected: {
            bool ok;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ok = sm_.transitionFrom(SessionState::Connecting, SessionState::Handshaking);
            }
            if (!ok) {
                VOX_LOGW(TAG, "Connected in unexpected state: %s",
                         GetSessionStateName(sm_.getState()));
                return;
            }
            if (sendText(buildInitiationMessage(config_.initiation)) == VOX_OK) {
                VOX_LOGI(TAG, "Sent conversation initiation");
            } else {
                VOX_LOGE(TAG, "Failed to send conversation initiation");
            }
            break;
        }

        case TransportEvent::Data:
            handleTextMessage(payload);
            break;

        case TransportEvent::Error: {
            VOX_LOGW(TAG, "Transport error: %s", payload.c_str());
            std::lock_guard<std::mutex> lock(mutex_);
            last_transport_error_ = payload;
            break;
        }

        case TransportEvent::Closed:
            VOX_LOGI(TAG, "Closed by server: %s", payload.empty() ? "-" : payload.c_str());
            handleLinkDown();
            break;

        case TransportEvent::Disconnected:
            handleLinkDown();
            break;

        default:
            break;
    }
}

void SessionProtocol::handleTextMessage(const std::string& text) {
    InboundMessage msg;
    if (parseInboundMessage(text.data(), text.size(), msg) != VOX_OK) {
        VOX_LOGW(TAG, "%s: skipping message (%u bytes)", vox_err_to_name(VOX_ERR_PROTOCOL),
                 (unsigned)text.size());
        return;
    }

    const SessionState state = sm_.getState();
    switch (msg.type) {
        case InboundType::Ping:
            if (state == SessionState::Handshaking || state == SessionState::Active) {
                (void)sendText(buildPongMessage(msg.event_id_json));
                VOX_LOGD(TAG, "Pong %s", msg.event_id_json.c_str());
            }
            break;

        case InboundType::InitiationMetadata: {
            if (msg.conversation_id.empty()) {
                VOX_LOGW(TAG, "%s: initiation metadata without conversation_id",
                         vox_err_to_name(VOX_ERR_PROTOCOL));
                break;
            }
            bool activated = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (sm_.getState() == SessionState::Handshaking) {
                    conversation_id_ = msg.conversation_id;
                    reached_active_ = true;
                    reconnect_attempts_ = 0;
                    activated = sm_.transitionTo(SessionState::Active);
                }
            }
            if (activated) {
                VOX_LOGI(TAG, "Conversation started, id=%s", msg.conversation_id.c_str());
            } else {
                VOX_LOGW(TAG, "Initiation metadata in state %s ignored",
                         GetSessionStateName(state));
            }
            break;
        }

        case InboundType::Audio: {
            if (state != SessionState::Active) {
                VOX_LOGD(TAG, "Audio before active, ignored");
                break;
            }
            if (local_speaking_.load() && config_.barge_in.drop_inbound_audio) {
                audio_dropped_.fetch_add(1);
                break;
            }
            if (msg.audio_base64.empty()) {
                break;
            }
            std::vector<uint8_t> pcm;
            if (base64Decode(msg.audio_base64, pcm) != VOX_OK) {
                VOX_LOGW(TAG, "%s: bad audio payload", vox_err_to_name(VOX_ERR_PROTOCOL));
                break;
            }
            audio_received_.fetch_add(1);
            if (on_audio_ && !pcm.empty()) {
                on_audio_(pcm.data(), pcm.size());
            }
            break;
        }

        case InboundType::UserTranscript:
            VOX_LOGI(TAG, "User: %s", msg.text.c_str());
            if (on_transcript_ && !msg.text.empty()) {
                on_transcript_(msg.text);
            }
            break;

        case InboundType::AgentResponse:
            VOX_LOGI(TAG, "Agent: %s", msg.text.c_str());
            if (on_agent_response_ && !msg.text.empty()) {
                on_agent_response_(msg.text);
            }
            break;

        default:
            VOX_LOGD(TAG, "Ignore message type=%s", msg.type_name.c_str());
            break;
    }
}

void SessionProtocol::handleLinkDown() {
    SessionState prev;
    bool user_initiated;
    std::string last_error;
    int64_t started_ms;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prev = sm_.getState();
        if (prev == SessionState::Disconnected) {
            return;
        }
        user_initiated = user_disconnect_ || prev == SessionState::Closing;
        (void)sm_.transitionTo(SessionState::Disconnected);
        conversation_id_.clear();
        last_error = last_transport_error_;
        started_ms = attempt_started_ms_;
    }

    if (user_initiated) {
        return;
    }

    if (prev == SessionState::Active) {
        VOX_LOGW(TAG, "Connection lost while active");
        bool scheduled;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            scheduled = scheduleReconnectLocked();
        }
        if (scheduled) {
            reportError(VOX_ERR_CONNECTION, false, "connection lost, reconnecting");
        } else {
            reportError(VOX_ERR_CONNECTION, true, "connection lost");
        }
        return;
    }

    // Lost during connect / handshake
    const bool timed_out = now() - started_ms >= config_.connection_timeout_ms;
    handleAttemptFailed(timed_out ? VOX_ERR_CONNECTION_TIMEOUT : VOX_ERR_CONNECTION,
                        last_error.empty() ? "connection closed during handshake" : last_error);
}

void SessionProtocol::handleAttemptFailed(vox_err_t code, const std::string& message) {
    bool reconnecting;
    bool scheduled = false;
    int attempts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (user_disconnect_) {
            return;
        }
        reconnecting = reached_active_;
        if (reconnecting) {
            scheduled = scheduleReconnectLocked();
        }
        attempts = reconnect_attempts_;
    }

    if (!reconnecting) {
        reportError(code, true, message);
    } else if (!scheduled) {
        reportError(VOX_ERR_CONNECTION, true,
                    "reconnect failed after " + std::to_string(attempts) + " attempts: " + message);
    } else {
        VOX_LOGW(TAG, "Reconnect attempt failed: %s", message.c_str());
    }
}

bool SessionProtocol::scheduleReconnectLocked() {
    if (reconnect_attempts_ >= config_.max_reconnect_attempts) {
        VOX_LOGE(TAG, "Reconnect attempts exhausted (%d)", config_.max_reconnect_attempts);
        return false;
    }
    reconnect_attempts_++;
    reconnect_pending_ = true;
    reconnect_at_ms_ = now() + config_.reconnect_delay_ms;
    VOX_LOGI(TAG, "Reconnect %d/%d in %dms", reconnect_attempts_,
             config_.max_reconnect_attempts, config_.reconnect_delay_ms);
    return true;
}

void SessionProtocol::reportError(vox_err_t code, bool fatal, const std::string& message) {
    if (fatal) {
        VOX_LOGE(TAG, "%s: %s", vox_err_to_name(code), message.c_str());
    } else {
        VOX_LOGW(TAG, "%s: %s", vox_err_to_name(code), message.c_str());
    }
    if (on_error_) {
        SessionError error;
        error.code = code;
        error.fatal = fatal;
        error.message = message;
        on_error_(error);
    }
}
