#pragma once

#include "audio_device.h"
#include "pcm_codec.h"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct WavCaptureConfig {
  std::string path;
  int block_ms = 20;
  bool realtime = true;     ///< false: 不等待，尽快推完
  bool loop = false;
  int tail_silence_ms = 0;  ///< 文件结束后补的静音，让 VAD 能收尾
};

/**
 * @brief 以 WAV 文件充当麦克风
 *
 * start() 后在内部线程里按 block_ms 分块回调；文件读完（且不循环）后
 * 线程自行结束，isFinished() 变为 true。
 */
class WavFileCaptureDevice : public AudioCaptureDevice {
public:
  ~WavFileCaptureDevice() override;

  /**
   * @return VOX_ERR_NOT_FOUND 文件不存在；VOX_ERR_FORMAT 不是 PCM16 WAV
   */
  vox_err_t open(const WavCaptureConfig &cfg);

  /**
   * @brief 直接使用内存中的音频（交织）
   */
  vox_err_t openMemory(const WavAudio &audio, const WavCaptureConfig &cfg);

  bool isAvailable() const override { return m_audio.frames() > 0; }
  int sampleRate() const override { return m_audio.sample_rate; }
  int channels() const override { return m_audio.channels; }

  vox_err_t start(FrameCallback callback) override;
  void stop() override;
  bool isRunning() const override { return m_running.load(); }

  bool isFinished() const { return m_finished.load(); }
  size_t framesDelivered() const { return m_delivered.load(); }
  size_t totalFrames() const { return m_audio.frames(); }

private:
  void run(FrameCallback callback);

  WavCaptureConfig m_cfg;
  WavAudio m_audio;

  std::mutex m_lifecycle;
  std::thread m_thread;
  std::atomic<bool> m_running{false};
  std::atomic<bool> m_stopRequested{false};
  std::atomic<bool> m_finished{false};
  std::atomic<size_t> m_delivered{0};
};

struct WavPlaybackConfig {
  std::string path;         ///< stop() 时写出；为空则只保留在内存
  int sample_rate_hz = 48000;
  int channels = 2;
  int block_ms = 10;
  bool realtime = true;
};

/**
 * @brief 把输出设备的渲染结果写进 WAV 文件
 */
class WavFilePlaybackDevice : public AudioPlaybackDevice {
public:
  ~WavFilePlaybackDevice() override;

  vox_err_t init(const WavPlaybackConfig &cfg);

  bool isAvailable() const override { return m_inited; }
  int sampleRate() const override { return m_cfg.sample_rate_hz; }
  int channels() const override { return m_cfg.channels; }

  vox_err_t start(RenderCallback callback) override;

  /**
   * @brief 停止渲染线程并写出文件（写文件失败只记日志）
   */
  void stop() override;
  bool isRunning() const override { return m_running.load(); }

  /**
   * @brief 同步渲染若干块（不启动线程），离线使用
   */
  void renderBlocks(const RenderCallback &callback, size_t blocks);

  size_t framesRendered() const;
  std::vector<float> recorded() const;

  /**
   * @brief 把已录下的样本写成 WAV
   */
  vox_err_t save(const std::string &path) const;

private:
  void run(RenderCallback callback);
  void renderOne(const RenderCallback &callback);

  WavPlaybackConfig m_cfg;
  bool m_inited = false;
  size_t m_blockFrames = 0;
  std::vector<float> m_block;

  mutable std::mutex m_dataMutex;
  std::vector<float> m_recorded;

  std::mutex m_lifecycle;
  std::thread m_thread;
  std::atomic<bool> m_running{false};
};
