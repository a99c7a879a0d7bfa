#include "audio_transcoder_pipeline.h"

#include "pcm_codec.h"
#include "sample_rate_converter.h"

#include <algorithm>

static const char *TAG = "Transcoder";

namespace {
constexpr int kMinChunkMs = 50;
constexpr int kMaxChunkMs = 250;
constexpr size_t kDownmixBlock = 2048;
} // namespace

vox_err_t AudioTranscoderPipeline::init(const TranscoderConfig &cfg) {
  if (cfg.capture_rate_hz <= 0 || cfg.wire_rate_hz <= 0) {
    VOX_LOGE(TAG, "invalid rates capture=%d wire=%d", cfg.capture_rate_hz,
             cfg.wire_rate_hz);
    return VOX_ERR_INVALID_ARG;
  }
  if (cfg.chunk_ms < kMinChunkMs || cfg.chunk_ms > kMaxChunkMs) {
    VOX_LOGE(TAG, "chunk_ms=%d out of range [%d, %d]", cfg.chunk_ms,
             kMinChunkMs, kMaxChunkMs);
    return VOX_ERR_INVALID_ARG;
  }
  if (cfg.capture_buffer_seconds <= 0) {
    return VOX_ERR_INVALID_ARG;
  }

  m_cfg = cfg;
  m_cfg.vad.sample_rate_hz = cfg.capture_rate_hz;

  m_samplesPerChunk = (size_t)((int64_t)cfg.capture_rate_hz * cfg.chunk_ms / 1000);
  size_t captureCap = std::max((size_t)cfg.capture_rate_hz *
                                   (size_t)cfg.capture_buffer_seconds,
                               m_samplesPerChunk * 4);
  m_capture.reset(new RingBuffer<float>(captureCap));

  if (m_cfg.detect_speech || m_cfg.mode == CaptureMode::VoiceGated) {
    VOX_RETURN_ON_ERROR(m_vad.init(m_cfg.vad), TAG, "vad init failed");
    m_vad.setOnStateChange([this](VadState state) {
      VOX_LOGD(TAG, "local speech %s", GetVadStateName(state));
      if (m_onSpeech) {
        m_onSpeech(state == VadState::Speaking);
      }
    });
  }
  m_preRollSamples =
      (size_t)((int64_t)cfg.capture_rate_hz * std::max(0, m_cfg.vad.pre_roll_ms) / 1000);

  VOX_RETURN_ON_ERROR(m_playback.init(cfg.playback), TAG, "playback init failed");

  const size_t wireCap = SampleRateConverter::outputLength(
      m_samplesPerChunk, cfg.capture_rate_hz, cfg.wire_rate_hz);
  m_mono.assign(kDownmixBlock, 0.0f);
  m_chunk.assign(m_samplesPerChunk, 0.0f);
  m_wire.assign(wireCap + 1, 0.0f);
  m_pcm.assign(m_wire.size() * 2, 0);
  m_drop.assign(m_samplesPerChunk, 0.0f);

  m_loopReadPos = 0;
  m_gateOpen = false;
  m_chunksSent.store(0);
  m_wireSamplesSent.store(0);
  m_chunksRejected.store(0);
  m_inited = true;

  VOX_LOGI(TAG, "Init: capture=%dHz wire=%dHz chunk=%dms (%u samples) mode=%s",
           cfg.capture_rate_hz, cfg.wire_rate_hz, cfg.chunk_ms,
           (unsigned)m_samplesPerChunk,
           cfg.mode == CaptureMode::Continuous ? "continuous" : "voice-gated");
  return VOX_OK;
}

void AudioTranscoderPipeline::downmixAndStore(const float *interleaved,
                                              size_t frames, int channels) {
  const bool runVad = m_cfg.detect_speech || m_cfg.mode == CaptureMode::VoiceGated;
  while (frames > 0) {
    size_t n = std::min(frames, m_mono.size());
    if (channels == 1) {
      std::copy(interleaved, interleaved + n, m_mono.begin());
    } else {
      const float inv = 1.0f / (float)channels;
      for (size_t i = 0; i < n; i++) {
        float sum = 0.0f;
        const float *f = interleaved + i * (size_t)channels;
        for (int c = 0; c < channels; c++) {
          sum += f[c];
        }
        m_mono[i] = sum * inv;
      }
    }
    if (runVad) {
      m_vad.process(m_mono.data(), n);
    }
    m_capture->write(m_mono.data(), n);
    interleaved += n * (size_t)channels;
    frames -= n;
  }
}

void AudioTranscoderPipeline::pushCapture(const float *interleaved,
                                          size_t frames, int channels) {
  if (!m_inited || interleaved == nullptr || frames == 0 || channels <= 0) {
    return;
  }
  downmixAndStore(interleaved, frames, channels);
}

size_t AudioTranscoderPipeline::pullLooping(const float *clip,
                                            size_t clipFrames, int channels,
                                            size_t writePos) {
  if (!m_inited || clip == nullptr || clipFrames == 0 || channels <= 0) {
    return 0;
  }
  writePos %= clipFrames;
  if (m_loopReadPos >= clipFrames) {
    m_loopReadPos = 0;
  }
  if (writePos == m_loopReadPos) {
    return 0;
  }

  size_t total = 0;
  if (writePos > m_loopReadPos) {
    size_t n = writePos - m_loopReadPos;
    downmixAndStore(clip + m_loopReadPos * (size_t)channels, n, channels);
    total = n;
  } else {
    // wrapped: tail of the clip, then its head
    size_t tail = clipFrames - m_loopReadPos;
    downmixAndStore(clip + m_loopReadPos * (size_t)channels, tail, channels);
    if (writePos > 0) {
      downmixAndStore(clip, writePos, channels);
    }
    total = tail + writePos;
  }
  m_loopReadPos = writePos;
  return total;
}

void AudioTranscoderPipeline::sendChunk(size_t n) {
  size_t got = m_capture->read(m_chunk.data(), std::min(n, m_chunk.size()));
  if (got == 0) {
    return;
  }

  size_t written = 0;
  vox_err_t err = SampleRateConverter::resampleInto(
      m_chunk.data(), got, m_cfg.capture_rate_hz, m_cfg.wire_rate_hz,
      m_wire.data(), m_wire.size(), written);
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "resample failed: %s", vox_err_to_name(err));
    m_chunksRejected.fetch_add(1);
    return;
  }

  size_t bytes = PcmCodec::floatToPcm16Into(m_wire.data(), written,
                                            m_pcm.data(), m_pcm.size());
  if (!m_onChunk) {
    m_chunksRejected.fetch_add(1);
    return;
  }
  err = m_onChunk(m_pcm.data(), bytes);
  if (err != VOX_OK) {
    VOX_LOGD(TAG, "chunk not sent: %s", vox_err_to_name(err));
    m_chunksRejected.fetch_add(1);
    return;
  }
  m_chunksSent.fetch_add(1);
  m_wireSamplesSent.fetch_add(written);
}

int AudioTranscoderPipeline::pumpOutbound() {
  if (!m_inited) {
    return 0;
  }

  int sent = 0;
  if (m_cfg.mode == CaptureMode::VoiceGated) {
    const bool speaking = m_vad.isSpeaking();
    if (!speaking) {
      if (m_gateOpen) {
        // Gate just closed: the hangover tail still belongs to the utterance
        m_gateOpen = false;
        return flush();
      }
      // Keep only the pre-roll so the next onset starts slightly early
      size_t avail = m_capture->available();
      while (avail > m_preRollSamples) {
        size_t n = std::min(avail - m_preRollSamples, m_drop.size());
        size_t got = m_capture->read(m_drop.data(), n);
        if (got == 0) {
          break;
        }
        avail -= got;
      }
      return 0;
    }
    if (!m_gateOpen) {
      m_gateOpen = true;
      VOX_LOGD(TAG, "gate open, pre-roll %u samples",
               (unsigned)std::min(m_capture->available(), m_preRollSamples));
    }
  }

  while (m_capture->available() >= m_samplesPerChunk) {
    sendChunk(m_samplesPerChunk);
    sent++;
  }
  return sent;
}

int AudioTranscoderPipeline::flush() {
  if (!m_inited) {
    return 0;
  }
  int sent = 0;
  while (m_capture->available() >= m_samplesPerChunk) {
    sendChunk(m_samplesPerChunk);
    sent++;
  }
  size_t rest = m_capture->available();
  if (rest > 0) {
    sendChunk(rest);
    sent++;
  }
  return sent;
}

vox_err_t AudioTranscoderPipeline::handleInboundPcm(const uint8_t *pcm,
                                                    size_t len) {
  if (!m_inited) {
    return VOX_ERR_INVALID_STATE;
  }
  if (pcm == nullptr || len < 2) {
    return VOX_OK;
  }

  const size_t n = len / 2;
  if (m_inFloat.size() < n) {
    m_inFloat.resize(n);
  }
  size_t decoded = PcmCodec::pcm16ToFloatInto(pcm, len, m_inFloat.data(),
                                              m_inFloat.size());

  const int outRate = m_playback.outputRate();
  const size_t outLen =
      SampleRateConverter::outputLength(decoded, m_cfg.wire_rate_hz, outRate);
  if (m_inResampled.size() < outLen) {
    m_inResampled.resize(outLen);
  }
  size_t written = 0;
  VOX_RETURN_ON_ERROR(SampleRateConverter::resampleInto(
                          m_inFloat.data(), decoded, m_cfg.wire_rate_hz,
                          outRate, m_inResampled.data(), m_inResampled.size(),
                          written),
                      TAG, "inbound resample failed");

  m_playback.write(m_inResampled.data(), written);
  return VOX_OK;
}

void AudioTranscoderPipeline::applyPlaybackControl(float gain,
                                                   bool flushBuffer) {
  m_playback.setGain(gain);
  if (flushBuffer) {
    m_playback.clear();
  }
}

void AudioTranscoderPipeline::reset() {
  if (m_capture) {
    m_capture->clear();
  }
  m_playback.clear();
  m_playback.setGain(1.0f);
  if (m_cfg.detect_speech || m_cfg.mode == CaptureMode::VoiceGated) {
    m_vad.reset();
  }
  m_loopReadPos = 0;
  m_gateOpen = false;
}
