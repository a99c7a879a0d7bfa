#pragma once

#include "ring_buffer.h"
#include "vox_err.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

struct PlaybackStreamConfig {
  int output_rate_hz = 48000;
  int buffer_ms = 6000;  ///< 抖动缓冲容量
  int preroll_ms = 250;  ///< 开始（或欠载后恢复）播放前需要的缓冲量
  int max_wait_ms = 2000; ///< 预缓冲最长等待，超过后即使不足也开始播放
  size_t max_block_frames = 4096; ///< render 内部单次处理的帧数上限
};

/**
 * @brief 播放端抖动缓冲（单声道，输出采样率）
 *
 * 网络线程 write()，音频输出线程 render()。render 永不阻塞：
 * 未预缓冲完成或欠载时输出静音，欠载后重新等待 preroll_ms。
 */
class PlaybackStream {
public:
  vox_err_t init(const PlaybackStreamConfig &cfg);

  /**
   * @brief 写入单声道样本
   * @return 因溢出被丢弃的最旧样本数
   */
  size_t write(const float *mono, size_t n);

  /**
   * @brief 输出设备回调：填充 frames * channels 个交织样本，单声道复制到各声道
   */
  void render(float *interleaved, size_t frames, int channels);

  /**
   * @brief 只写入当前空闲空间能容纳的部分，不覆盖未播放的样本
   * @return 实际写入的样本数
   */
  size_t writeAvailable(const float *mono, size_t n);

  /**
   * @brief 丢弃缓冲内容并重新进入预缓冲（任意线程）
   *
   * 预缓冲状态只由 render() 所在线程修改，这里只置位请求。
   */
  void clear();

  void setGain(float gain) { m_gain.store(gain); }
  float gain() const { return m_gain.load(); }

  size_t buffered() const { return m_ring ? m_ring->available() : 0; }
  size_t capacity() const { return m_ring ? m_ring->capacity() : 0; }
  size_t freeSpace() const { return capacity() - buffered(); }
  bool isPrimed() const { return m_primed.load(); }
  uint64_t underruns() const { return m_underruns.load(); }
  int outputRate() const { return m_cfg.output_rate_hz; }
  size_t prerollSamples() const { return m_prerollSamples; }

private:
  PlaybackStreamConfig m_cfg;
  std::unique_ptr<RingBuffer<float>> m_ring;
  std::vector<float> m_mono;
  size_t m_prerollSamples = 0;
  size_t m_maxWaitSamples = 0;
  size_t m_waitedSamples = 0; // render thread only
  std::atomic<bool> m_primed{false};
  std::atomic<bool> m_resetRequested{false};
  std::atomic<float> m_gain{1.0f};
  std::atomic<uint64_t> m_underruns{0};
};
