#pragma once

#include "audio_device.h"
#include "playback_stream.h"
#include "voice_activity_detector.h"
#include "vox_err.h"
#include "webhook_client.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

struct WebhookDialogConfig {
  int capture_rate_hz = 44100; ///< attach 设备后以设备采样率为准
  VadConfig vad;               ///< sample_rate_hz 会被改成采集采样率
  WebhookConfig webhook;
  PlaybackStreamConfig playback;
  int max_queued_utterances = 2;
};

/**
 * @brief 批量语音对话：VAD 切出一句话 -> WAV -> webhook -> 播放回复
 *
 * 采集线程调用 pushCapture()，上传和解码在内部 worker 线程完成，
 * 回复随播放进度分段写入播放缓冲（超过缓冲容量的回复也完整播放），
 * 由输出设备调用 renderPlayback() 取走。worker 在回复写完前保持占用。
 * 上传进行中不会切出新语音段；完成后进入冷却期。
 */
class WebhookDialog {
public:
  WebhookDialog() = default;
  ~WebhookDialog();

  WebhookDialog(const WebhookDialog &) = delete;
  WebhookDialog &operator=(const WebhookDialog &) = delete;

  vox_err_t init(const WebhookDialogConfig &cfg);

  /**
   * @brief 启动 worker，并在给定设备上开始采集
   *
   * @param mic 为空时只启动 worker，由调用方自行 pushCapture()
   * @return VOX_ERR_DEVICE_UNAVAILABLE 设备不存在
   */
  vox_err_t start(AudioCaptureDevice *mic);

  /**
   * @brief 停止采集和 worker（正在进行的上传会等其结束）
   */
  void stop();

  void pushCapture(const float *interleaved, size_t frames, int channels);

  void renderPlayback(float *interleaved, size_t frames, int channels) {
    m_playback.render(interleaved, frames, channels);
  }

  bool isRunning() const { return m_running.load(); }
  bool isBusy() const { return m_vad.sendInFlight(); }
  uint64_t turnsCompleted() const { return m_turnsOk.load(); }
  uint64_t turnsFailed() const { return m_turnsFailed.load(); }

  VoiceActivityDetector &vad() { return m_vad; }
  PlaybackStream &playback() { return m_playback; }

  /**
   * @brief 上传函数，默认走 WebhookClient::postWav
   */
  using Uploader =
      std::function<vox_err_t(const uint8_t *wav, size_t len, WebhookReply &reply)>;
  void setUploader(Uploader uploader) { m_uploader = std::move(uploader); }

  /**
   * @brief 每次收到回复后回调（含无法本地播放的 MP3 / 未知格式）
   */
  using ReplyCallback = std::function<void(const WebhookReply &reply, bool played)>;
  void setOnReply(ReplyCallback cb) { m_onReply = std::move(cb); }

  using TurnCallback = std::function<void(bool ok)>;
  void setOnTurnFinished(TurnCallback cb) { m_onTurn = std::move(cb); }

private:
  void onSegment(const VadSegment &segment);
  void workerLoop();
  void handleUtterance(const std::vector<float> &pcm);
  vox_err_t playWavReply(const WebhookReply &reply);

  WebhookDialogConfig m_cfg;
  bool m_inited = false;

  VoiceActivityDetector m_vad;
  PlaybackStream m_playback;
  WebhookClient m_client;
  Uploader m_uploader;

  AudioCaptureDevice *m_mic = nullptr;
  std::vector<float> m_mono; // capture downmix scratch

  std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<std::vector<float>> m_queue;
  std::thread m_worker;
  std::atomic<bool> m_running{false};

  std::atomic<uint64_t> m_turnsOk{0};
  std::atomic<uint64_t> m_turnsFailed{0};

  ReplyCallback m_onReply;
  TurnCallback m_onTurn;
};
