#include "voice_activity_detector.h"

#include <algorithm>
#include <cmath>

static const char *TAG = "VAD";

namespace {
constexpr float kAdaptiveStartMin = 0.0005f;
constexpr float kAdaptiveStopMin = 0.0004f;
constexpr float kSpeechBandLowHz = 300.0f;
constexpr float kSpeechBandHighHz = 3400.0f;
constexpr float kPi = 3.14159265358979f;

// One-pole low-pass coefficient; at or above Nyquist the filter passes through.
float onePoleAlpha(float cutoffHz, int sampleRate) {
  if (sampleRate <= 0 || cutoffHz >= (float)sampleRate * 0.5f) {
    return 1.0f;
  }
  return 1.0f - std::exp(-2.0f * kPi * cutoffHz / (float)sampleRate);
}
} // namespace

vox_err_t VoiceActivityDetector::init(const VadConfig &cfg) {
  if (cfg.sample_rate_hz <= 0 || cfg.frame_ms <= 0) {
    VOX_LOGE(TAG, "invalid rate=%d frame=%dms", cfg.sample_rate_hz,
             cfg.frame_ms);
    return VOX_ERR_INVALID_ARG;
  }
  if (cfg.min_speech_ms < 0 || cfg.hangover_ms < 0 || cfg.pre_roll_ms < 0 ||
      cfg.max_speech_ms <= 0 || cfg.cooldown_ms < 0) {
    VOX_LOGE(TAG, "negative durations in config");
    return VOX_ERR_INVALID_ARG;
  }
  if (cfg.mode == VadThresholdMode::Fixed && cfg.stop_level > cfg.start_level) {
    VOX_LOGE(TAG, "stop_level %.4f above start_level %.4f",
             (double)cfg.stop_level, (double)cfg.start_level);
    return VOX_ERR_INVALID_ARG;
  }

  m_cfg = cfg;
  m_frameSamples = std::max<size_t>(1, msToSamples(m_cfg.frame_ms));
  m_frame.assign(m_frameSamples, 0.0f);

  size_t historySamples = std::max(
      (size_t)m_cfg.sample_rate_hz * (size_t)std::max(1, m_cfg.buffer_seconds),
      msToSamples(m_cfg.max_speech_ms + m_cfg.pre_roll_ms + m_cfg.hangover_ms +
                  1000));
  m_history.reset(new RingBuffer<float>(historySamples));

  m_lowAlpha = onePoleAlpha(kSpeechBandLowHz, m_cfg.sample_rate_hz);
  m_upperAlpha = onePoleAlpha(kSpeechBandHighHz, m_cfg.sample_rate_hz);

  m_inited = true;
  reset();

  VOX_LOGI(TAG,
           "Init: rate=%d frame=%u mode=%s metric=%s preroll=%dms "
           "hangover=%dms min=%dms max=%dms",
           m_cfg.sample_rate_hz, (unsigned)m_frameSamples,
           m_cfg.mode == VadThresholdMode::Fixed ? "fixed" : "adaptive",
           m_cfg.metric == VadEnergyMetric::Rms ? "rms" : "speech-band",
           m_cfg.pre_roll_ms, m_cfg.hangover_ms, m_cfg.min_speech_ms,
           m_cfg.max_speech_ms);
  return VOX_OK;
}

vox_err_t VoiceActivityDetector::attach(const AudioCaptureDevice *device) {
  if (device == nullptr || !device->isAvailable()) {
    VOX_LOGE(TAG, "No microphone device");
    return VOX_ERR_DEVICE_UNAVAILABLE;
  }
  if (!m_inited) {
    return VOX_ERR_INVALID_STATE;
  }
  if (device->sampleRate() != m_cfg.sample_rate_hz) {
    VOX_LOGW(TAG, "device rate %d differs from detector rate %d",
             device->sampleRate(), m_cfg.sample_rate_hz);
  }
  return VOX_OK;
}

void VoiceActivityDetector::reset() {
  if (m_history) {
    m_history->reset();
  }
  m_frameFill = 0;
  m_state.store(VadState::Idle);
  m_processed.store(0);
  m_onset = 0;
  m_segmentStart = 0;
  m_lastLoud = 0;
  m_deadline = 0;
  m_cooldownUntil.store(0);
  m_sendInFlight.store(false);
  m_noiseFloor.store(m_cfg.initial_noise_floor);
  m_lastLevel.store(0.0f);
  m_speechBandRatio.store(0.0f);
  m_lowState = 0.0f;
  m_upperState = 0.0f;
  m_bandLowState = 0.0f;
}

size_t VoiceActivityDetector::msToSamples(int ms) const {
  if (ms <= 0) {
    return 0;
  }
  return (size_t)((int64_t)ms * m_cfg.sample_rate_hz / 1000);
}

void VoiceActivityDetector::process(const float *mono, size_t n) {
  if (!m_inited || mono == nullptr) {
    return;
  }
  while (n > 0) {
    size_t take = std::min(n, m_frameSamples - m_frameFill);
    std::copy(mono, mono + take, m_frame.begin() + m_frameFill);
    m_frameFill += take;
    mono += take;
    n -= take;
    if (m_frameFill == m_frameSamples) {
      stepFrame(m_frame.data(), m_frameSamples);
      m_frameFill = 0;
    }
  }
}

void VoiceActivityDetector::stepFrame(const float *frame, size_t n) {
  m_history->write(frame, n);
  const uint64_t now = m_processed.fetch_add(n) + n;
  const uint64_t frameStart = now - n;

  const float level = measure(frame, n);
  m_lastLevel.store(level);

  const bool cooling = m_sendInFlight.load() || now < m_cooldownUntil.load();
  const float floor = m_noiseFloor.load();

  bool startGate;
  bool stopGate;
  if (m_cfg.mode == VadThresholdMode::Fixed) {
    startGate = level >= m_cfg.start_level;
    stopGate = level >= m_cfg.stop_level;
  } else {
    startGate = level > std::max(floor * m_cfg.start_factor, kAdaptiveStartMin);
    stopGate = level > std::max(floor * m_cfg.stop_factor, kAdaptiveStopMin);
  }

  if (m_state.load() == VadState::Idle) {
    if (!cooling && startGate) {
      const uint64_t preRoll = msToSamples(m_cfg.pre_roll_ms);
      const uint64_t oldest = now - m_history->available();
      m_onset = frameStart;
      m_segmentStart = m_onset > preRoll ? m_onset - preRoll : 0;
      m_segmentStart = std::max(m_segmentStart, oldest);
      m_lastLoud = now;
      m_deadline = m_onset + msToSamples(m_cfg.max_speech_ms);
      m_state.store(VadState::Speaking);
      VOX_LOGD(TAG, "Speech start (level=%.4f floor=%.4f)", (double)level,
               (double)floor);
      if (m_onState) {
        m_onState(VadState::Speaking);
      }
      return;
    }
    // Noise floor tracks only while idle
    m_noiseFloor.store(floor + m_cfg.noise_floor_alpha * (level - floor));
    return;
  }

  if (stopGate) {
    m_lastLoud = now;
  }
  const bool hangoverDone = (now - m_lastLoud) >= msToSamples(m_cfg.hangover_ms);
  const bool hitMax = now >= m_deadline;
  if (hangoverDone || hitMax) {
    finishSegment(now, hitMax && !hangoverDone);
  }
}

void VoiceActivityDetector::finishSegment(uint64_t now, bool forced) {
  VadSegment seg;
  seg.start_sample = m_segmentStart;
  seg.pre_roll_samples = (size_t)(m_onset - m_segmentStart);
  seg.speech_samples = (size_t)(m_lastLoud - m_onset);
  seg.trailing_samples = (size_t)(now - m_lastLoud);
  seg.forced = forced;

  m_state.store(VadState::Idle);

  const size_t minSpeech = msToSamples(m_cfg.min_speech_ms);
  if (seg.speech_samples >= minSpeech) {
    VOX_LOGI(TAG, "Segment: speech=%ums total=%ums forced=%d",
             (unsigned)(seg.speech_samples * 1000 / m_cfg.sample_rate_hz),
             (unsigned)(seg.totalSamples() * 1000 / m_cfg.sample_rate_hz),
             forced ? 1 : 0);
    if (m_onSegment) {
      m_onSegment(seg);
    }
  } else {
    VOX_LOGD(TAG, "Discard short segment (%ums)",
             (unsigned)(seg.speech_samples * 1000 / m_cfg.sample_rate_hz));
  }

  if (m_onState) {
    m_onState(VadState::Idle);
  }
}

float VoiceActivityDetector::measure(const float *frame, size_t n) {
  if (m_cfg.metric == VadEnergyMetric::SpeechBand) {
    return measureSpeechBand(frame, n);
  }
  return computeRms(frame, n);
}

float VoiceActivityDetector::measureSpeechBand(const float *frame, size_t n) {
  double total = 0.0;
  double low = 0.0;
  double band = 0.0;
  double high = 0.0;

  for (size_t i = 0; i < n; i++) {
    const float x = frame[i];
    m_lowState += m_lowAlpha * (x - m_lowState);
    m_upperState += m_upperAlpha * (x - m_upperState);
    m_bandLowState += m_lowAlpha * (m_upperState - m_bandLowState);

    const float lowPart = m_lowState;
    const float highPart = x - m_upperState;
    const float bandPart = m_upperState - m_bandLowState;

    total += (double)x * x;
    low += (double)lowPart * lowPart;
    high += (double)highPart * highPart;
    band += (double)bandPart * bandPart;
  }

  if (n == 0 || total < 1e-10) {
    m_speechBandRatio.store(0.0f);
    return 0.0f;
  }

  const double ratio = band / total;
  m_speechBandRatio.store((float)ratio);

  double weighted = band * m_cfg.speech_band_weight +
                    low * m_cfg.low_freq_suppression +
                    high * m_cfg.high_freq_suppression;
  if (ratio < m_cfg.speech_band_threshold) {
    weighted *= 0.5;
  }
  return (float)std::sqrt(weighted / (double)n);
}

float VoiceActivityDetector::computeRms(const float *samples, size_t n) {
  if (samples == nullptr || n == 0) {
    return 0.0f;
  }
  double s = 0.0;
  for (size_t i = 0; i < n; i++) {
    s += (double)samples[i] * samples[i];
  }
  return (float)std::sqrt(s / (double)n);
}

void VoiceActivityDetector::beginSend() { m_sendInFlight.store(true); }

void VoiceActivityDetector::endSend() {
  m_cooldownUntil.store(m_processed.load() + msToSamples(m_cfg.cooldown_ms));
  m_sendInFlight.store(false);
}

bool VoiceActivityDetector::isCoolingDown() const {
  return m_sendInFlight.load() || m_processed.load() < m_cooldownUntil.load();
}

vox_err_t VoiceActivityDetector::copySegment(const VadSegment &segment,
                                             std::vector<float> &out) const {
  out.clear();
  if (!m_inited || !m_history) {
    return VOX_ERR_INVALID_STATE;
  }
  const size_t len = segment.totalSamples();
  if (len == 0) {
    return VOX_ERR_INVALID_ARG;
  }
  const uint64_t written = m_history->totalWritten();
  const uint64_t end = segment.start_sample + len;
  if (end > written) {
    return VOX_ERR_INVALID_ARG;
  }

  out.resize(len);
  size_t got = m_history->copyRecent(out.data(), len, (size_t)(written - end));
  if (got != len) {
    VOX_LOGW(TAG, "Segment no longer in history (start=%llu len=%u)",
             (unsigned long long)segment.start_sample, (unsigned)len);
    out.clear();
    return VOX_ERR_NOT_FOUND;
  }
  return VOX_OK;
}
