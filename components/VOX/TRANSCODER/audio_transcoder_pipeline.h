#pragma once

#include "playback_stream.h"
#include "ring_buffer.h"
#include "voice_activity_detector.h"
#include "vox_err.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

/**
 * @brief 上行发送策略
 */
enum class CaptureMode {
  Continuous, ///< 一直按块发送
  VoiceGated, ///< 仅在 VAD 判为说话时发送（开始时补发预录）
};

struct TranscoderConfig {
  int capture_rate_hz = 44100;
  int wire_rate_hz = 16000; // 服务端固定 16 kHz PCM16 mono
  int chunk_ms = 250;       // 50 ~ 250
  int capture_buffer_seconds = 3;

  CaptureMode mode = CaptureMode::Continuous;
  bool detect_speech = true; // 打断检测（任何模式下 VAD 说话状态都驱动打断）
  VadConfig vad;             // sample_rate_hz 会被改成 capture_rate_hz

  PlaybackStreamConfig playback;
};

/**
 * @brief 实时转码管线
 *
 * 上行：采集(交织) -> 单声道 -> 采集环形缓冲 -> 固定块 -> 16 kHz -> PCM16 -> 发送回调
 * 下行：PCM16 -> float -> 输出采样率 -> PlaybackStream
 *
 * 三个时间域各自调用：采集线程 pushCapture()/pullLooping()，网络/主循环
 * pumpOutbound()/handleInboundPcm()，输出线程 renderPlayback()。
 * 上行热路径只使用 init() 中预分配的缓冲区。
 *
 * @example
 *   AudioTranscoderPipeline pipe;
 *   pipe.init(cfg);
 *   pipe.setOnChunk([&](const uint8_t* pcm, size_t len) {
 *       return session.sendAudio(pcm, len);
 *   });
 *   mic.start([&](const float* f, size_t n, int ch) { pipe.pushCapture(f, n, ch); });
 *   speaker.start([&](float* out, size_t n, int ch) { pipe.renderPlayback(out, n, ch); });
 *   // 每 chunk_ms 调用一次
 *   pipe.pumpOutbound();
 */
class AudioTranscoderPipeline {
public:
  vox_err_t init(const TranscoderConfig &cfg);

  // ---------- capture domain ----------

  /**
   * @brief 推入交织采集帧，多声道取平均
   */
  void pushCapture(const float *interleaved, size_t frames, int channels);

  /**
   * @brief 从设备提供的循环录音缓冲中读取新数据
   *
   * 读取区间 [上次位置, writePos)，回绕时分两段。
   * @return 本次读取的帧数
   */
  size_t pullLooping(const float *clip, size_t clipFrames, int channels,
                     size_t writePos);

  // ---------- network domain ----------

  /**
   * @brief 发出所有完整块
   * @return 发出的块数
   */
  int pumpOutbound();

  /**
   * @brief 发出所有完整块以及剩余的不完整块（结束会话时）
   */
  int flush();

  /**
   * @brief 收到的 16 kHz PCM16 音频进入播放缓冲
   */
  vox_err_t handleInboundPcm(const uint8_t *pcm, size_t len);

  /**
   * @brief 播放控制（打断时压低/恢复音量并清空积压）
   */
  void applyPlaybackControl(float gain, bool flushBuffer);

  // ---------- playback domain ----------

  void renderPlayback(float *interleaved, size_t frames, int channels) {
    m_playback.render(interleaved, frames, channels);
  }

  /**
   * @brief 清空全部缓冲并复位 VAD（不释放内存）
   */
  void reset();

  using ChunkCallback = std::function<vox_err_t(const uint8_t *pcm, size_t len)>;
  void setOnChunk(ChunkCallback cb) { m_onChunk = std::move(cb); }

  using SpeechCallback = std::function<void(bool speaking)>;
  void setOnSpeechChange(SpeechCallback cb) { m_onSpeech = std::move(cb); }

  size_t samplesPerChunk() const { return m_samplesPerChunk; }
  size_t captureAvailable() const { return m_capture ? m_capture->available() : 0; }
  size_t playbackAvailable() const { return m_playback.buffered(); }
  bool isSpeaking() const { return m_vad.isSpeaking(); }

  uint64_t chunksSent() const { return m_chunksSent.load(); }
  uint64_t wireSamplesSent() const { return m_wireSamplesSent.load(); }
  uint64_t chunksRejected() const { return m_chunksRejected.load(); }

  PlaybackStream &playback() { return m_playback; }
  VoiceActivityDetector &vad() { return m_vad; }
  const TranscoderConfig &config() const { return m_cfg; }

private:
  void sendChunk(size_t n);
  void downmixAndStore(const float *interleaved, size_t frames, int channels);

  TranscoderConfig m_cfg;
  bool m_inited = false;

  std::unique_ptr<RingBuffer<float>> m_capture;
  VoiceActivityDetector m_vad;
  PlaybackStream m_playback;

  size_t m_samplesPerChunk = 0;
  size_t m_preRollSamples = 0;
  size_t m_loopReadPos = 0;
  bool m_gateOpen = false;

  // pre-allocated scratch
  std::vector<float> m_mono;    // capture downmix
  std::vector<float> m_chunk;   // one capture-rate chunk
  std::vector<float> m_wire;    // resampled chunk
  std::vector<uint8_t> m_pcm;   // encoded chunk
  std::vector<float> m_drop;    // gated-mode discard

  // receive path scratch, grows to the largest inbound chunk
  std::vector<float> m_inFloat;
  std::vector<float> m_inResampled;

  std::atomic<uint64_t> m_chunksSent{0};
  std::atomic<uint64_t> m_wireSamplesSent{0};
  std::atomic<uint64_t> m_chunksRejected{0};

  ChunkCallback m_onChunk;
  SpeechCallback m_onSpeech;
};
