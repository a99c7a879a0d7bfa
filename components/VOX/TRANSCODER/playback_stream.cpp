#include "playback_stream.h"

#include <algorithm>

static const char *TAG = "Playback";

vox_err_t PlaybackStream::init(const PlaybackStreamConfig &cfg) {
  if (cfg.output_rate_hz <= 0 || cfg.buffer_ms <= 0 || cfg.preroll_ms < 0 ||
      cfg.max_block_frames == 0) {
    VOX_LOGE(TAG, "invalid config rate=%d buffer=%dms preroll=%dms",
             cfg.output_rate_hz, cfg.buffer_ms, cfg.preroll_ms);
    return VOX_ERR_INVALID_ARG;
  }
  m_cfg = cfg;

  size_t capacity = (size_t)((int64_t)cfg.output_rate_hz * cfg.buffer_ms / 1000);
  m_prerollSamples =
      std::max<size_t>(1, (size_t)((int64_t)cfg.output_rate_hz * cfg.preroll_ms / 1000));
  if (m_prerollSamples > capacity / 2) {
    m_prerollSamples = capacity / 2;
  }
  m_maxWaitSamples =
      (size_t)((int64_t)cfg.output_rate_hz * std::max(0, cfg.max_wait_ms) / 1000);

  m_ring.reset(new RingBuffer<float>(capacity));
  m_mono.assign(cfg.max_block_frames, 0.0f);
  m_primed.store(false);
  m_resetRequested.store(false);
  m_waitedSamples = 0;
  m_underruns.store(0);

  VOX_LOGI(TAG, "Init: rate=%d buffer=%u preroll=%u", cfg.output_rate_hz,
           (unsigned)capacity, (unsigned)m_prerollSamples);
  return VOX_OK;
}

size_t PlaybackStream::write(const float *mono, size_t n) {
  if (!m_ring) {
    return 0;
  }
  size_t dropped = m_ring->write(mono, n);
  if (dropped > 0) {
    VOX_LOGW(TAG, "jitter buffer overflow, dropped %u samples", (unsigned)dropped);
  }
  return dropped;
}

size_t PlaybackStream::writeAvailable(const float *mono, size_t n) {
  if (!m_ring || mono == nullptr) {
    return 0;
  }
  // Single writer, so the free space can only grow before the write
  size_t room = std::min(n, freeSpace());
  if (room > 0) {
    m_ring->write(mono, room);
  }
  return room;
}

void PlaybackStream::render(float *interleaved, size_t frames, int channels) {
  if (interleaved == nullptr || frames == 0 || channels <= 0) {
    return;
  }
  const size_t total = frames * (size_t)channels;
  if (!m_ring) {
    std::fill(interleaved, interleaved + total, 0.0f);
    return;
  }

  if (m_resetRequested.exchange(false)) {
    m_primed.store(false);
    m_waitedSamples = 0;
  }

  if (!m_primed.load()) {
    size_t avail = m_ring->available();
    if (avail >= m_prerollSamples) {
      m_primed.store(true);
      m_waitedSamples = 0;
    } else if (avail > 0) {
      // Don't wait forever on a short tail
      m_waitedSamples += frames;
      if (m_maxWaitSamples > 0 && m_waitedSamples >= m_maxWaitSamples) {
        m_primed.store(true);
        m_waitedSamples = 0;
      }
    }
    std::fill(interleaved, interleaved + total, 0.0f);
    return;
  }

  const float gain = m_gain.load();
  size_t done = 0;
  bool underrun = false;
  while (done < frames) {
    size_t want = std::min(frames - done, m_mono.size());
    size_t got = m_ring->readExact(m_mono.data(), want);
    if (got < want) {
      underrun = true;
    }
    float *out = interleaved + done * (size_t)channels;
    for (size_t i = 0; i < want; i++) {
      float s = m_mono[i] * gain;
      for (int c = 0; c < channels; c++) {
        *out++ = s;
      }
    }
    done += want;
    if (underrun) {
      std::fill(interleaved + done * (size_t)channels, interleaved + total, 0.0f);
      break;
    }
  }

  if (underrun) {
    m_primed.store(false);
    m_waitedSamples = 0;
    m_underruns.fetch_add(1);
    VOX_LOGV(TAG, "underrun, re-priming");
  }
}

void PlaybackStream::clear() {
  if (m_ring) {
    m_ring->clear();
  }
  m_primed.store(false);
  m_resetRequested.store(true);
}
