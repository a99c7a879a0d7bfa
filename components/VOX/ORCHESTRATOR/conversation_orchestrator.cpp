#include "conversation_orchestrator.h"

#include "sample_rate_converter.h"

#include <cstdio>

static const char *TAG = "Conversation";

ConversationOrchestrator::ConversationOrchestrator(SessionTransport &transport,
                                                   AudioCaptureDevice *mic,
                                                   AudioPlaybackDevice *speaker)
    : m_mic(mic), m_speaker(speaker), m_session(transport) {}

ConversationOrchestrator::~ConversationOrchestrator() {
  if (m_phase.load() != ConversationPhase::Idle) {
    cleanup();
  }
  m_session.setOnStateChange(nullptr);
  m_session.setOnUserTranscript(nullptr);
  m_session.setOnAgentResponse(nullptr);
  m_session.setOnError(nullptr);
}

vox_err_t ConversationOrchestrator::init(const OrchestratorConfig &cfg) {
  if (m_phase.load() != ConversationPhase::Idle) {
    return VOX_ERR_INVALID_STATE;
  }
  if (cfg.warmup_ms < 0 || cfg.end_grace_ms < 0 ||
      cfg.max_conversation_seconds < 0 || cfg.greeting_timeout_ms <= 0) {
    VOX_LOGE(TAG, "invalid timing: warmup=%d grace=%d max=%ds greeting=%d",
             cfg.warmup_ms, cfg.end_grace_ms, cfg.max_conversation_seconds,
             cfg.greeting_timeout_ms);
    return VOX_ERR_INVALID_ARG;
  }
  VOX_RETURN_ON_ERROR(m_pipeline.init(cfg.transcoder), TAG,
                      "transcoder config rejected");
  VOX_RETURN_ON_ERROR(m_session.init(cfg.session), TAG,
                      "session config rejected");

  m_cfg = cfg;
  m_events.setCapacity(cfg.event_queue_capacity);
  wireCallbacks();
  m_inited = true;
  VOX_LOGI(TAG, "Init: %s", m_session.url().c_str());
  return VOX_OK;
}

void ConversationOrchestrator::setTimeSource(VoxClock clock) {
  m_clock = clock;
  m_session.setTimeSource(std::move(clock));
}

void ConversationOrchestrator::wireCallbacks() {
  // capture domain -> session
  m_pipeline.setOnChunk([this](const uint8_t *pcm, size_t len) {
    return m_session.sendAudio(pcm, len);
  });
  m_pipeline.setOnSpeechChange(
      [this](bool speaking) { m_session.setLocalSpeaking(speaking); });

  // network domain -> playback
  m_session.setOnAudio([this](const uint8_t *pcm, size_t len) {
    vox_err_t err = m_pipeline.handleInboundPcm(pcm, len);
    if (err != VOX_OK) {
      VOX_LOGW(TAG, "inbound audio dropped: %s", vox_err_to_name(err));
    }
  });
  m_session.setOnPlaybackControl([this](float gain, bool flush) {
    m_pipeline.applyPlaybackControl(gain, flush);
  });

  // everything the caller sees goes through the queue
  m_session.setOnStateChange([this](SessionState oldState, SessionState newState) {
    ConversationEvent ev;
    ev.type = ConversationEventType::ConnectionStatus;
    ev.old_state = oldState;
    ev.new_state = newState;
    ev.text = GetSessionStateName(newState);
    m_events.push(std::move(ev));
  });
  m_session.setOnUserTranscript([this](const std::string &text) {
    ConversationEvent ev;
    ev.type = ConversationEventType::Transcript;
    ev.text = text;
    m_events.push(std::move(ev));
  });
  m_session.setOnAgentResponse([this](const std::string &text) {
    ConversationEvent ev;
    ev.type = ConversationEventType::AgentText;
    ev.text = text;
    m_events.push(std::move(ev));
  });
  m_session.setOnError([this](const SessionError &error) {
    pushError(error.code, error.fatal, error.message);
  });
}

void ConversationOrchestrator::setGreeting(const float *mono, size_t n,
                                           int sampleRate) {
  if (mono == nullptr || n == 0 || sampleRate <= 0) {
    m_greeting.clear();
    return;
  }
  m_greeting.assign(mono, mono + n);
  m_greetingRate = sampleRate;
}

vox_err_t ConversationOrchestrator::preparePipeline() {
  TranscoderConfig tc = m_cfg.transcoder;
  bool changed = false;
  if (m_mic->sampleRate() != tc.capture_rate_hz) {
    VOX_LOGI(TAG, "capture rate follows device: %d Hz", m_mic->sampleRate());
    tc.capture_rate_hz = m_mic->sampleRate();
    changed = true;
  }
  if (m_speaker != nullptr && m_speaker->isAvailable() &&
      m_speaker->sampleRate() != tc.playback.output_rate_hz) {
    VOX_LOGI(TAG, "output rate follows device: %d Hz", m_speaker->sampleRate());
    tc.playback.output_rate_hz = m_speaker->sampleRate();
    changed = true;
  }
  if (changed) {
    VOX_RETURN_ON_ERROR(m_pipeline.init(tc), TAG, "transcoder re-init failed");
    m_cfg.transcoder = tc;
  }
  m_pipeline.reset();
  return VOX_OK;
}

vox_err_t ConversationOrchestrator::beginConversation() {
  if (!m_inited) {
    return VOX_ERR_INVALID_STATE;
  }
  if (m_phase.load() != ConversationPhase::Idle) {
    VOX_LOGW(TAG, "conversation already in progress (%s)",
             GetConversationPhaseName(m_phase.load()));
    return VOX_ERR_INVALID_STATE;
  }
  if (m_mic == nullptr || !m_mic->isAvailable()) {
    VOX_LOGE(TAG, "No microphone device");
    pushError(VOX_ERR_DEVICE_UNAVAILABLE, true, "no microphone device");
    return VOX_ERR_DEVICE_UNAVAILABLE;
  }

  VOX_RETURN_ON_ERROR(preparePipeline(), TAG, "pipeline not ready");
  m_endReason = EndReason::None;

  if (m_speaker != nullptr && m_speaker->isAvailable()) {
    vox_err_t err = m_speaker->start([this](float *out, size_t frames, int ch) {
      m_pipeline.renderPlayback(out, frames, ch);
    });
    if (err != VOX_OK) {
      VOX_LOGW(TAG, "speaker start failed: %s, continuing without playback",
               vox_err_to_name(err));
    } else {
      m_speakerStarted = true;
    }
  } else {
    VOX_LOGW(TAG, "no playback device, agent audio will not be heard");
  }

  if (!m_greeting.empty() && m_speakerStarted) {
    m_greetingOut = SampleRateConverter::resample(
        m_greeting, m_greetingRate, m_pipeline.playback().outputRate());
    m_greetingPos = 0;
    feedGreeting();
    m_phaseDeadline = now() + m_cfg.greeting_timeout_ms;
    setPhase(ConversationPhase::Greeting);
    VOX_LOGI(TAG, "Greeting: %u ms",
             (unsigned)(m_greeting.size() * 1000 / (size_t)m_greetingRate));
    return VOX_OK;
  }

  startConnecting();
  return VOX_OK;
}

void ConversationOrchestrator::startConnecting() {
  setPhase(ConversationPhase::Connecting);
  vox_err_t err = m_session.connect();
  if (err != VOX_OK) {
    pushError(err, true, "connect failed");
    finishConversation(EndReason::Error);
  }
}

void ConversationOrchestrator::startCapture() {
  vox_err_t err = m_mic->start([this](const float *f, size_t n, int ch) {
    m_pipeline.pushCapture(f, n, ch);
  });
  if (err != VOX_OK) {
    pushError(err == VOX_FAIL ? VOX_ERR_DEVICE_UNAVAILABLE : err, true,
              "microphone start failed");
    finishConversation(EndReason::Error);
    return;
  }

  m_startedAt = now();
  m_lastPump = m_startedAt;
  setPhase(ConversationPhase::Active);

  std::string id = m_session.conversationId();
  VOX_LOGI(TAG, "Conversation started: %s", id.c_str());

  ConversationEvent ev;
  ev.type = ConversationEventType::Started;
  ev.text = std::move(id);
  m_events.push(std::move(ev));
}

vox_err_t ConversationOrchestrator::endConversation() {
  switch (m_phase.load()) {
  case ConversationPhase::Idle:
  case ConversationPhase::Ending:
    return VOX_OK;
  case ConversationPhase::Active:
    beginEnding(EndReason::User);
    return VOX_OK;
  default:
    // nothing captured yet
    finishConversation(EndReason::User);
    return VOX_OK;
  }
}

void ConversationOrchestrator::forceEndConversation() {
  if (m_phase.load() == ConversationPhase::Idle) {
    return;
  }
  EndReason reason =
      m_endReason != EndReason::None ? m_endReason : EndReason::User;
  if (m_mic != nullptr && m_mic->isRunning()) {
    m_mic->stop();
  }
  finishConversation(reason);
}

void ConversationOrchestrator::beginEnding(EndReason reason) {
  if (m_mic != nullptr && m_mic->isRunning()) {
    m_mic->stop();
  }
  int sent = m_pipeline.flush();
  VOX_LOGI(TAG, "Ending (%s): flushed %d chunk(s)", GetEndReasonName(reason),
           sent);
  m_endReason = reason;
  m_phaseDeadline = now() + m_cfg.end_grace_ms;
  setPhase(ConversationPhase::Ending);
}

void ConversationOrchestrator::finishConversation(EndReason reason) {
  cleanup();
  m_lastEndReason = reason;
  m_endReason = EndReason::None;
  setPhase(ConversationPhase::Idle);

  ConversationEvent ev;
  ev.type = ConversationEventType::Ended;
  ev.reason = reason;
  ev.text = GetEndReasonName(reason);
  m_events.push(std::move(ev));
  VOX_LOGI(TAG, "Conversation ended: %s (sent=%u chunks, %u wire samples)",
           GetEndReasonName(reason), (unsigned)m_pipeline.chunksSent(),
           (unsigned)m_pipeline.wireSamplesSent());
}

// Greeting may be longer than the playback buffer; top it up each tick
void ConversationOrchestrator::feedGreeting() {
  if (m_greetingPos < m_greetingOut.size()) {
    m_greetingPos += m_pipeline.playback().writeAvailable(
        m_greetingOut.data() + m_greetingPos,
        m_greetingOut.size() - m_greetingPos);
  }
}

void ConversationOrchestrator::releaseGreeting() {
  m_greetingOut.clear();
  m_greetingOut.shrink_to_fit();
  m_greetingPos = 0;
}

void ConversationOrchestrator::cleanup() {
  releaseGreeting();
  if (m_mic != nullptr && m_mic->isRunning()) {
    m_mic->stop();
  }
  m_session.disconnect();
  if (m_speakerStarted && m_speaker != nullptr) {
    m_speaker->stop();
    m_speakerStarted = false;
  }
  m_pipeline.reset();
}

void ConversationOrchestrator::tick() {
  if (!m_inited) {
    return;
  }
  m_session.tick();

  const int64_t t = now();
  switch (m_phase.load()) {
  case ConversationPhase::Greeting:
    feedGreeting();
    if (m_greetingPos >= m_greetingOut.size() &&
        m_pipeline.playbackAvailable() == 0) {
      VOX_LOGD(TAG, "greeting done");
      releaseGreeting();
      startConnecting();
    } else if (t >= m_phaseDeadline) {
      VOX_LOGW(TAG, "greeting timeout, skipping rest");
      releaseGreeting();
      m_pipeline.playback().clear();
      startConnecting();
    }
    break;
  case ConversationPhase::Connecting:
    if (m_session.isActive()) {
      m_phaseDeadline = t + m_cfg.warmup_ms;
      setPhase(ConversationPhase::Warmup);
    }
    break;
  case ConversationPhase::Warmup:
    if (!m_session.isActive()) {
      break; // lost during warmup; the session error decides
    }
    if (t >= m_phaseDeadline) {
      startCapture();
    }
    break;
  case ConversationPhase::Active:
    if (t - m_lastPump >= m_cfg.transcoder.chunk_ms) {
      m_lastPump = t;
      (void)m_pipeline.pumpOutbound();
    }
    if (m_cfg.max_conversation_seconds > 0 &&
        t - m_startedAt >= (int64_t)m_cfg.max_conversation_seconds * 1000) {
      pushError(VOX_ERR_SESSION_TIMEOUT, false,
                "conversation reached its maximum duration");
      beginEnding(EndReason::SessionTimeout);
    }
    break;
  case ConversationPhase::Ending:
    if (t >= m_phaseDeadline) {
      finishConversation(m_endReason);
    }
    break;
  case ConversationPhase::Idle:
  default:
    break;
  }

  drainEvents();
}

void ConversationOrchestrator::drainEvents() {
  ConversationEvent ev;
  while (m_events.pop(ev)) {
    handleEvent(ev);
    if (m_onEvent) {
      m_onEvent(ev);
    }
  }
}

void ConversationOrchestrator::handleEvent(const ConversationEvent &event) {
  if (event.type != ConversationEventType::Error || !event.fatal) {
    return;
  }
  switch (m_phase.load()) {
  case ConversationPhase::Idle:
    break;
  case ConversationPhase::Active:
  case ConversationPhase::Ending:
    // the link is gone, no point in a grace period
    finishConversation(event.code == VOX_ERR_CONNECTION ? EndReason::ConnectionLost
                                                        : EndReason::Error);
    break;
  default:
    finishConversation(EndReason::Error);
    break;
  }
}

void ConversationOrchestrator::pushError(vox_err_t code, bool fatal,
                                         const std::string &message) {
  ConversationEvent ev;
  ev.type = ConversationEventType::Error;
  ev.code = code;
  ev.fatal = fatal;
  ev.text = message;
  m_events.push(std::move(ev));
}

void ConversationOrchestrator::setPhase(ConversationPhase phase) {
  ConversationPhase old = m_phase.exchange(phase);
  if (old != phase) {
    VOX_LOGI(TAG, "Phase: %s -> %s", GetConversationPhaseName(old),
             GetConversationPhaseName(phase));
  }
}

vox_err_t ConversationOrchestrator::sendTextMessage(const std::string &text) {
  if (m_phase.load() != ConversationPhase::Active) {
    VOX_LOGW(TAG, "no active conversation");
    return VOX_ERR_INVALID_STATE;
  }
  return m_session.sendUserMessage(text);
}

bool ConversationOrchestrator::isReadyForConversation() const {
  return m_inited && m_phase.load() == ConversationPhase::Idle &&
         m_mic != nullptr && m_mic->isAvailable();
}

std::string ConversationOrchestrator::getStatus() const {
  const ConversationPhase phase = m_phase.load();
  std::string status = GetConversationPhaseName(phase);
  status += " | session=";
  status += GetSessionStateName(m_session.getState());

  if (phase == ConversationPhase::Idle) {
    if (!m_inited) {
      status += " | not initialized";
    } else if (m_mic == nullptr || !m_mic->isAvailable()) {
      status += " | no microphone";
    } else {
      status += " | ready";
    }
    return status;
  }

  std::string id = m_session.conversationId();
  if (!id.empty()) {
    status += " | id=" + id;
  }
  if (m_session.reconnectPending()) {
    char buf[48];
    snprintf(buf, sizeof(buf), " | reconnecting (%d)",
             m_session.reconnectAttempts());
    status += buf;
  }
  if (phase == ConversationPhase::Active && m_cfg.max_conversation_seconds > 0) {
    int64_t left = (int64_t)m_cfg.max_conversation_seconds -
                   (now() - m_startedAt) / 1000;
    char buf[32];
    snprintf(buf, sizeof(buf), " | %llds left",
             (long long)(left > 0 ? left : 0));
    status += buf;
  }
  return status;
}
