#include "webhook_dialog.h"

#include "pcm_codec.h"
#include "sample_rate_converter.h"

#include <algorithm>
#include <chrono>

namespace {
constexpr int kFeedPollMs = 10;
} // namespace

static const char *TAG = "WebhookDialog";

WebhookDialog::~WebhookDialog() { stop(); }

vox_err_t WebhookDialog::init(const WebhookDialogConfig &cfg) {
  if (m_running.load()) {
    return VOX_ERR_INVALID_STATE;
  }
  if (cfg.capture_rate_hz <= 0 || cfg.max_queued_utterances < 1) {
    VOX_LOGE(TAG, "invalid config: rate=%d queue=%d", cfg.capture_rate_hz,
             cfg.max_queued_utterances);
    return VOX_ERR_INVALID_ARG;
  }
  m_cfg = cfg;
  m_cfg.vad.sample_rate_hz = cfg.capture_rate_hz;

  VOX_RETURN_ON_ERROR(m_vad.init(m_cfg.vad), TAG, "vad init failed");
  VOX_RETURN_ON_ERROR(m_playback.init(m_cfg.playback), TAG,
                      "playback init failed");

  if (!m_cfg.webhook.url.empty()) {
    VOX_RETURN_ON_ERROR(m_client.init(m_cfg.webhook), TAG,
                        "webhook client init failed");
    m_uploader = [this](const uint8_t *wav, size_t len, WebhookReply &reply) {
      return m_client.postWav(wav, len, reply);
    };
  } else {
    VOX_LOGW(TAG, "no webhook url, an uploader must be installed");
  }

  m_vad.setOnSegment([this](const VadSegment &seg) { onSegment(seg); });
  m_mono.assign(2048, 0.0f);
  m_inited = true;
  return VOX_OK;
}

vox_err_t WebhookDialog::start(AudioCaptureDevice *mic) {
  if (!m_inited) {
    return VOX_ERR_INVALID_STATE;
  }
  if (m_running.load()) {
    VOX_LOGW(TAG, "already running");
    return VOX_OK;
  }
  if (!m_uploader) {
    VOX_LOGE(TAG, "no uploader");
    return VOX_ERR_INVALID_STATE;
  }

  if (mic != nullptr) {
    VOX_RETURN_ON_ERROR(m_vad.attach(mic), TAG, "microphone unavailable");
    if (mic->sampleRate() != m_cfg.vad.sample_rate_hz) {
      m_cfg.capture_rate_hz = mic->sampleRate();
      m_cfg.vad.sample_rate_hz = mic->sampleRate();
      VOX_RETURN_ON_ERROR(m_vad.init(m_cfg.vad), TAG,
                          "vad re-init at %d Hz failed", mic->sampleRate());
      m_vad.setOnSegment([this](const VadSegment &seg) { onSegment(seg); });
    }
  }

  m_vad.reset();
  m_playback.clear();
  m_running.store(true);
  m_worker = std::thread(&WebhookDialog::workerLoop, this);

  if (mic != nullptr) {
    vox_err_t err = mic->start([this](const float *f, size_t n, int ch) {
      pushCapture(f, n, ch);
    });
    if (err != VOX_OK) {
      VOX_LOGE(TAG, "mic start failed: %s", vox_err_to_name(err));
      stop();
      return err;
    }
    m_mic = mic;
  }

  VOX_LOGI(TAG, "listening (capture %d Hz)", m_cfg.vad.sample_rate_hz);
  return VOX_OK;
}

void WebhookDialog::stop() {
  if (!m_running.exchange(false)) {
    return;
  }
  if (m_mic != nullptr) {
    m_mic->stop();
    m_mic = nullptr;
  }
  m_cv.notify_all();
  if (m_worker.joinable()) {
    m_worker.join();
  }
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.clear();
  }
  VOX_LOGI(TAG, "stopped (ok=%u failed=%u)", (unsigned)m_turnsOk.load(),
           (unsigned)m_turnsFailed.load());
}

void WebhookDialog::pushCapture(const float *interleaved, size_t frames,
                                int channels) {
  if (!m_inited || !m_running.load() || interleaved == nullptr ||
      channels <= 0) {
    return;
  }
  while (frames > 0) {
    size_t n = std::min(frames, m_mono.size());
    const float inv = 1.0f / (float)channels;
    for (size_t i = 0; i < n; i++) {
      float sum = 0.0f;
      for (int c = 0; c < channels; c++) {
        sum += interleaved[i * (size_t)channels + c];
      }
      m_mono[i] = sum * inv;
    }
    m_vad.process(m_mono.data(), n);
    interleaved += n * (size_t)channels;
    frames -= n;
  }
}

// capture thread
void WebhookDialog::onSegment(const VadSegment &segment) {
  std::vector<float> pcm;
  vox_err_t err = m_vad.copySegment(segment, pcm);
  if (err != VOX_OK) {
    VOX_LOGW(TAG, "segment lost: %s", vox_err_to_name(err));
    return;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  if ((int)m_queue.size() >= m_cfg.max_queued_utterances) {
    VOX_LOGW(TAG, "upload queue full, drop utterance");
    return;
  }
  m_vad.beginSend();
  m_queue.push_back(std::move(pcm));
  m_cv.notify_one();
}

void WebhookDialog::workerLoop() {
  while (true) {
    std::vector<float> pcm;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_cv.wait(lock, [this] { return !m_running.load() || !m_queue.empty(); });
      if (!m_running.load()) {
        break;
      }
      pcm = std::move(m_queue.front());
      m_queue.pop_front();
    }
    handleUtterance(pcm);
  }
}

void WebhookDialog::handleUtterance(const std::vector<float> &pcm) {
  const int rate = m_cfg.vad.sample_rate_hz;
  std::vector<uint8_t> wav = WavCodec::encode(pcm.data(), pcm.size(), rate, 1);
  VOX_LOGI(TAG, "Upload wav: %u ms, %u bytes",
           (unsigned)(pcm.size() * 1000 / (size_t)rate), (unsigned)wav.size());

  WebhookReply reply;
  vox_err_t err = m_uploader(wav.data(), wav.size(), reply);
  bool ok = false;
  bool played = false;
  if (err != VOX_OK) {
    VOX_LOGW(TAG, "webhook failed: %s", vox_err_to_name(err));
  } else if (reply.format == ReplyFormat::Wav) {
    err = playWavReply(reply);
    played = err == VOX_OK;
    ok = played;
  } else {
    // No local MP3 decoder; the collaborator decides what to do with it
    VOX_LOGW(TAG, "reply not playable here (%s, %u bytes)",
             GetReplyFormatName(reply.format), (unsigned)reply.audio.size());
    ok = reply.format == ReplyFormat::Mp3;
  }

  if (err == VOX_OK && m_onReply) {
    m_onReply(reply, played);
  }

  (ok ? m_turnsOk : m_turnsFailed).fetch_add(1);
  m_vad.endSend();
  if (m_onTurn) {
    m_onTurn(ok);
  }
}

vox_err_t WebhookDialog::playWavReply(const WebhookReply &reply) {
  WavAudio audio;
  VOX_RETURN_ON_ERROR(WavCodec::decode(reply.audio, audio), TAG,
                      "bad wav reply");
  if (audio.frames() == 0) {
    VOX_LOGW(TAG, "wav reply has no samples");
    return VOX_ERR_FORMAT;
  }

  std::vector<float> mono;
  if (audio.channels == 1) {
    mono = std::move(audio.samples);
  } else {
    mono.resize(audio.frames());
    const float inv = 1.0f / (float)audio.channels;
    for (size_t i = 0; i < mono.size(); i++) {
      float sum = 0.0f;
      for (int c = 0; c < audio.channels; c++) {
        sum += audio.samples[i * (size_t)audio.channels + c];
      }
      mono[i] = sum * inv;
    }
  }

  std::vector<float> out = SampleRateConverter::resample(
      mono, audio.sample_rate, m_playback.outputRate());

  // A new reply replaces whatever is still queued
  m_playback.clear();
  VOX_LOGI(TAG, "Play reply: %u ms at %d Hz",
           (unsigned)(out.size() * 1000 / (size_t)m_playback.outputRate()),
           audio.sample_rate);

  // Feed as the output drains so replies longer than the buffer play whole
  size_t pos = 0;
  while (pos < out.size()) {
    pos += m_playback.writeAvailable(out.data() + pos, out.size() - pos);
    if (pos >= out.size()) {
      break;
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_cv.wait_for(lock, std::chrono::milliseconds(kFeedPollMs),
                      [this] { return !m_running.load(); })) {
      VOX_LOGW(TAG, "stopped with %u reply samples unplayed",
               (unsigned)(out.size() - pos));
      break;
    }
  }
  return VOX_OK;
}
