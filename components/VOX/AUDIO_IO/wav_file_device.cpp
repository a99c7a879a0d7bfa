#include "wav_file_device.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>

static const char *TAG = "WavDevice";

namespace {

vox_err_t readFile(const std::string &path, std::vector<uint8_t> &out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return VOX_ERR_NOT_FOUND;
  }
  out.assign(std::istreambuf_iterator<char>(in),
             std::istreambuf_iterator<char>());
  return in.bad() ? VOX_FAIL : VOX_OK;
}

vox_err_t writeFile(const std::string &path, const std::vector<uint8_t> &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return VOX_FAIL;
  }
  out.write(reinterpret_cast<const char *>(data.data()),
            (std::streamsize)data.size());
  return out.good() ? VOX_OK : VOX_FAIL;
}

} // namespace

// ---------------------------------------------------------------------------
// capture

WavFileCaptureDevice::~WavFileCaptureDevice() { stop(); }

vox_err_t WavFileCaptureDevice::open(const WavCaptureConfig &cfg) {
  std::vector<uint8_t> bytes;
  vox_err_t err = readFile(cfg.path, bytes);
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "cannot read %s", cfg.path.c_str());
    return err;
  }
  WavAudio audio;
  VOX_RETURN_ON_ERROR(WavCodec::decode(bytes, audio), TAG, "%s is not a PCM16 WAV",
                      cfg.path.c_str());
  VOX_LOGI(TAG, "Capture source %s: %d Hz, %d ch, %u ms", cfg.path.c_str(),
           audio.sample_rate, audio.channels,
           (unsigned)(audio.frames() * 1000 / (size_t)audio.sample_rate));
  return openMemory(audio, cfg);
}

vox_err_t WavFileCaptureDevice::openMemory(const WavAudio &audio,
                                           const WavCaptureConfig &cfg) {
  if (m_running.load()) {
    return VOX_ERR_INVALID_STATE;
  }
  if (audio.sample_rate <= 0 || audio.channels <= 0 || cfg.block_ms <= 0 ||
      cfg.tail_silence_ms < 0) {
    return VOX_ERR_INVALID_ARG;
  }
  m_cfg = cfg;
  m_audio = audio;
  m_finished.store(false);
  m_delivered.store(0);
  return VOX_OK;
}

vox_err_t WavFileCaptureDevice::start(FrameCallback callback) {
  std::lock_guard<std::mutex> lock(m_lifecycle);
  if (!isAvailable()) {
    return VOX_ERR_DEVICE_UNAVAILABLE;
  }
  if (!callback) {
    return VOX_ERR_INVALID_ARG;
  }
  if (m_running.load()) {
    return VOX_ERR_INVALID_STATE;
  }
  if (m_thread.joinable()) {
    m_thread.join(); // previous run finished on its own
  }
  m_stopRequested.store(false);
  m_finished.store(false);
  m_delivered.store(0);
  m_running.store(true);
  m_thread = std::thread(&WavFileCaptureDevice::run, this, std::move(callback));
  return VOX_OK;
}

void WavFileCaptureDevice::stop() {
  std::lock_guard<std::mutex> lock(m_lifecycle);
  m_stopRequested.store(true);
  if (m_thread.joinable()) {
    m_thread.join();
  }
  m_running.store(false);
}

void WavFileCaptureDevice::run(FrameCallback callback) {
  const int ch = m_audio.channels;
  const size_t block =
      std::max((size_t)1, (size_t)m_audio.sample_rate * (size_t)m_cfg.block_ms / 1000);
  const size_t total = m_audio.frames();
  size_t tail = (size_t)m_audio.sample_rate * (size_t)m_cfg.tail_silence_ms / 1000;
  std::vector<float> silence(block * (size_t)ch, 0.0f);

  auto next = std::chrono::steady_clock::now();
  size_t pos = 0;
  while (!m_stopRequested.load()) {
    if (pos >= total) {
      if (m_cfg.loop) {
        pos = 0;
      } else if (tail == 0) {
        break;
      }
    }

    size_t n = 0;
    if (pos < total) {
      n = std::min(block, total - pos);
      callback(m_audio.samples.data() + pos * (size_t)ch, n, ch);
      pos += n;
    } else {
      n = std::min(block, tail);
      callback(silence.data(), n, ch);
      tail -= n;
    }
    m_delivered.fetch_add(n);

    if (m_cfg.realtime) {
      next += std::chrono::microseconds((int64_t)n * 1000000 / m_audio.sample_rate);
      std::this_thread::sleep_until(next);
    }
  }

  if (!m_stopRequested.load()) {
    VOX_LOGI(TAG, "Capture source finished (%u frames)",
             (unsigned)m_delivered.load());
    m_finished.store(true);
  }
  m_running.store(false);
}

// ---------------------------------------------------------------------------
// playback

WavFilePlaybackDevice::~WavFilePlaybackDevice() { stop(); }

vox_err_t WavFilePlaybackDevice::init(const WavPlaybackConfig &cfg) {
  if (cfg.sample_rate_hz <= 0 || cfg.channels <= 0 || cfg.block_ms <= 0) {
    return VOX_ERR_INVALID_ARG;
  }
  if (m_running.load()) {
    return VOX_ERR_INVALID_STATE;
  }
  m_cfg = cfg;
  m_blockFrames = (size_t)cfg.sample_rate_hz * (size_t)cfg.block_ms / 1000;
  if (m_blockFrames == 0) {
    m_blockFrames = 1;
  }
  m_block.assign(m_blockFrames * (size_t)cfg.channels, 0.0f);
  {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    m_recorded.clear();
  }
  m_inited = true;
  return VOX_OK;
}

vox_err_t WavFilePlaybackDevice::start(RenderCallback callback) {
  std::lock_guard<std::mutex> lock(m_lifecycle);
  if (!m_inited) {
    return VOX_ERR_DEVICE_UNAVAILABLE;
  }
  if (!callback) {
    return VOX_ERR_INVALID_ARG;
  }
  if (m_running.load()) {
    return VOX_ERR_INVALID_STATE;
  }
  m_running.store(true);
  m_thread = std::thread(&WavFilePlaybackDevice::run, this, std::move(callback));
  return VOX_OK;
}

void WavFilePlaybackDevice::stop() {
  {
    std::lock_guard<std::mutex> lock(m_lifecycle);
    if (!m_running.exchange(false)) {
      return;
    }
    if (m_thread.joinable()) {
      m_thread.join();
    }
  }
  if (!m_cfg.path.empty()) {
    vox_err_t err = save(m_cfg.path);
    if (err != VOX_OK) {
      VOX_LOGE(TAG, "cannot write %s: %s", m_cfg.path.c_str(),
               vox_err_to_name(err));
    }
  }
}

void WavFilePlaybackDevice::renderOne(const RenderCallback &callback) {
  std::fill(m_block.begin(), m_block.end(), 0.0f);
  callback(m_block.data(), m_blockFrames, m_cfg.channels);
  std::lock_guard<std::mutex> lock(m_dataMutex);
  m_recorded.insert(m_recorded.end(), m_block.begin(), m_block.end());
}

void WavFilePlaybackDevice::renderBlocks(const RenderCallback &callback,
                                         size_t blocks) {
  if (!m_inited || !callback || m_running.load()) {
    return;
  }
  for (size_t i = 0; i < blocks; i++) {
    renderOne(callback);
  }
}

void WavFilePlaybackDevice::run(RenderCallback callback) {
  auto next = std::chrono::steady_clock::now();
  const auto period = std::chrono::milliseconds(m_cfg.block_ms);
  while (m_running.load()) {
    renderOne(callback);
    if (m_cfg.realtime) {
      next += period;
      std::this_thread::sleep_until(next);
    }
  }
}

size_t WavFilePlaybackDevice::framesRendered() const {
  std::lock_guard<std::mutex> lock(m_dataMutex);
  return m_recorded.size() / (size_t)std::max(1, m_cfg.channels);
}

std::vector<float> WavFilePlaybackDevice::recorded() const {
  std::lock_guard<std::mutex> lock(m_dataMutex);
  return m_recorded;
}

vox_err_t WavFilePlaybackDevice::save(const std::string &path) const {
  std::vector<uint8_t> wav;
  {
    std::lock_guard<std::mutex> lock(m_dataMutex);
    wav = WavCodec::encode(m_recorded.data(), m_recorded.size(),
                           m_cfg.sample_rate_hz, m_cfg.channels);
  }
  VOX_RETURN_ON_ERROR(writeFile(path, wav), TAG, "write failed");
  VOX_LOGI(TAG, "Wrote %s (%u frames)", path.c_str(),
           (unsigned)(wav.size() - WavCodec::kHeaderSize) / 2 /
               (unsigned)m_cfg.channels);
  return VOX_OK;
}
