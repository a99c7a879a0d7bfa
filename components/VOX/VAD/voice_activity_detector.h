#pragma once

#include "audio_device.h"
#include "ring_buffer.h"
#include "vox_err.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

enum class VadState { Idle, Speaking };

inline const char *GetVadStateName(VadState state) {
  switch (state) {
  case VadState::Idle:
    return "Idle";
  case VadState::Speaking:
    return "Speaking";
  default:
    return "Invalid";
  }
}

/**
 * @brief 门限策略
 */
enum class VadThresholdMode {
  Fixed,    ///< startLevel / stopLevel 固定门限（带迟滞）
  Adaptive, ///< 噪声底 * startFactor / stopFactor
};

/**
 * @brief 每帧能量指标
 */
enum class VadEnergyMetric {
  Rms,        ///< 普通 RMS
  SpeechBand, ///< 300-3400 Hz 加权，抑制低频隆隆声与高频嘶声
};

struct VadConfig {
  int sample_rate_hz = 16000;
  int frame_ms = 20;

  VadThresholdMode mode = VadThresholdMode::Fixed;
  VadEnergyMetric metric = VadEnergyMetric::Rms;

  // Fixed gates; stop_level < start_level gives hysteresis
  float start_level = 0.020f;
  float stop_level = 0.012f;

  // Adaptive gates
  float start_factor = 3.0f;
  float stop_factor = 2.0f;
  float initial_noise_floor = 0.002f;
  float noise_floor_alpha = 0.02f;

  // Speech-band weighting
  float speech_band_weight = 2.0f;
  float low_freq_suppression = 0.4f;
  float high_freq_suppression = 0.6f;
  float speech_band_threshold = 0.5f;

  int pre_roll_ms = 200;
  int hangover_ms = 900;
  int min_speech_ms = 700;
  int max_speech_ms = 15000;
  int cooldown_ms = 1200;

  // History kept for segment extraction (raised to fit the longest segment)
  int buffer_seconds = 20;
};

/**
 * @brief 一段完整语音（绝对样本坐标）
 *
 * 音频范围 [start_sample, start_sample + totalSamples())，依次为预录、
 * 语音、尾部静音。
 */
struct VadSegment {
  uint64_t start_sample = 0;
  size_t pre_roll_samples = 0;
  size_t speech_samples = 0;
  size_t trailing_samples = 0;
  bool forced = false; ///< 达到 max_speech_ms 强制结束

  size_t totalSamples() const {
    return pre_roll_samples + speech_samples + trailing_samples;
  }
};

/**
 * @brief 逐帧语音活动检测（Idle / Speaking）
 *
 * @example
 *   VoiceActivityDetector vad;
 *   vad.init(cfg);
 *   vad.setOnSegment([&](const VadSegment& seg) {
 *       std::vector<float> pcm;
 *       vad.copySegment(seg, pcm);
 *   });
 *   vad.process(mono, n);   // 采集回调中调用
 */
class VoiceActivityDetector {
public:
  vox_err_t init(const VadConfig &cfg);

  /**
   * @brief 检查采集设备；无设备时立即返回 VOX_ERR_DEVICE_UNAVAILABLE
   */
  vox_err_t attach(const AudioCaptureDevice *device);

  /**
   * @brief 喂入单声道样本（任意长度，内部按帧切分）
   */
  void process(const float *mono, size_t n);

  /**
   * @brief 全部状态复位（噪声底、历史、冷却、发送标记）
   */
  void reset();

  VadState getState() const { return m_state.load(); }
  bool isSpeaking() const { return m_state.load() == VadState::Speaking; }

  float lastLevel() const { return m_lastLevel.load(); }
  float noiseFloor() const { return m_noiseFloor.load(); }
  float speechBandRatio() const { return m_speechBandRatio.load(); }
  uint64_t samplesProcessed() const { return m_processed.load(); }
  size_t frameSamples() const { return m_frameSamples; }
  const VadConfig &config() const { return m_cfg; }

  /**
   * @brief 语音段已交给上传；发送完成前不检测新语音段
   */
  void beginSend();

  /**
   * @brief 发送完成，开始冷却 cooldown_ms
   */
  void endSend();

  bool sendInFlight() const { return m_sendInFlight.load(); }
  bool isCoolingDown() const;

  /**
   * @brief 从历史中拷出语音段
   * @return VOX_ERR_NOT_FOUND 已被覆盖
   */
  vox_err_t copySegment(const VadSegment &segment,
                        std::vector<float> &out) const;

  using SegmentCallback = std::function<void(const VadSegment &segment)>;
  void setOnSegment(SegmentCallback cb) { m_onSegment = std::move(cb); }

  using StateCallback = std::function<void(VadState state)>;
  void setOnStateChange(StateCallback cb) { m_onState = std::move(cb); }

  static float computeRms(const float *samples, size_t n);

private:
  void stepFrame(const float *frame, size_t n);
  float measure(const float *frame, size_t n);
  float measureSpeechBand(const float *frame, size_t n);
  void finishSegment(uint64_t now, bool forced);
  size_t msToSamples(int ms) const;

  VadConfig m_cfg;
  bool m_inited = false;

  size_t m_frameSamples = 0;
  std::vector<float> m_frame;
  size_t m_frameFill = 0;
  std::unique_ptr<RingBuffer<float>> m_history;

  std::atomic<VadState> m_state{VadState::Idle};
  std::atomic<uint64_t> m_processed{0};
  uint64_t m_onset = 0;
  uint64_t m_segmentStart = 0;
  uint64_t m_lastLoud = 0;
  uint64_t m_deadline = 0;
  std::atomic<uint64_t> m_cooldownUntil{0};
  std::atomic<bool> m_sendInFlight{false};

  std::atomic<float> m_noiseFloor{0.0f};
  std::atomic<float> m_lastLevel{0.0f};
  std::atomic<float> m_speechBandRatio{0.0f};

  // single-pole band split state
  float m_lowState = 0.0f;
  float m_upperState = 0.0f;
  float m_bandLowState = 0.0f;
  float m_lowAlpha = 1.0f;
  float m_upperAlpha = 1.0f;

  SegmentCallback m_onSegment;
  StateCallback m_onState;
};
