#pragma once

#include "vox_err.h"

#include <cstddef>
#include <functional>

/**
 * @brief 麦克风采集设备（外部协作方实现）
 *
 * 设备线程按自己的节奏回调交织 float 帧；回调内不得阻塞。
 */
class AudioCaptureDevice {
public:
  using FrameCallback =
      std::function<void(const float *interleaved, size_t frames, int channels)>;

  virtual ~AudioCaptureDevice() = default;

  /**
   * @brief 设备是否存在（不存在时会话不能开始）
   */
  virtual bool isAvailable() const = 0;
  virtual int sampleRate() const = 0;
  virtual int channels() const = 0;

  virtual vox_err_t start(FrameCallback callback) = 0;
  virtual void stop() = 0;
  virtual bool isRunning() const = 0;
};

/**
 * @brief 音频输出设备（外部协作方实现）
 *
 * 每个设备周期调用渲染回调，请求恰好 frames 帧 * channels 个交织样本。
 */
class AudioPlaybackDevice {
public:
  using RenderCallback =
      std::function<void(float *interleaved, size_t frames, int channels)>;

  virtual ~AudioPlaybackDevice() = default;

  virtual bool isAvailable() const = 0;
  virtual int sampleRate() const = 0;
  virtual int channels() const = 0;

  virtual vox_err_t start(RenderCallback callback) = 0;
  virtual void stop() = 0;
  virtual bool isRunning() const = 0;
};
