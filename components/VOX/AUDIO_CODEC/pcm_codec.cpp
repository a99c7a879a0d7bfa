#include "pcm_codec.h"

#include <algorithm>
#include <cmath>
#include <cstring>

static const char *TAG = "PcmCodec";

namespace {
inline int16_t toPcm16(float f) {
  f = std::max(-1.0f, std::min(1.0f, f));
  return (int16_t)std::lround(f * 32767.0f);
}

inline uint16_t readLe16(const uint8_t *p) {
  return (uint16_t)(p[0] | (p[1] << 8));
}

inline uint32_t readLe32(const uint8_t *p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
         ((uint32_t)p[3] << 24);
}

inline uint8_t *writeLe16(uint8_t *p, uint16_t v) {
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
  return p + 2;
}

inline uint8_t *writeLe32(uint8_t *p, uint32_t v) {
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
  p[2] = (uint8_t)((v >> 16) & 0xFF);
  p[3] = (uint8_t)((v >> 24) & 0xFF);
  return p + 4;
}

inline uint8_t *writeTag(uint8_t *p, const char *tag) {
  memcpy(p, tag, 4);
  return p + 4;
}
} // namespace

std::vector<uint8_t> PcmCodec::floatToPcm16(const float *samples, size_t n) {
  std::vector<uint8_t> out(n * 2);
  floatToPcm16Into(samples, n, out.data(), out.size());
  return out;
}

size_t PcmCodec::floatToPcm16Into(const float *samples, size_t n, uint8_t *dst,
                                  size_t dstCapacity) {
  if (samples == nullptr || dst == nullptr || n == 0) {
    return 0;
  }
  if (dstCapacity < n * 2) {
    return 0;
  }
  size_t di = 0;
  for (size_t i = 0; i < n; i++) {
    uint16_t s = (uint16_t)toPcm16(samples[i]);
    dst[di++] = (uint8_t)(s & 0xFF);
    dst[di++] = (uint8_t)((s >> 8) & 0xFF);
  }
  return di;
}

std::vector<float> PcmCodec::pcm16ToFloat(const uint8_t *bytes, size_t len) {
  std::vector<float> out(len / 2);
  pcm16ToFloatInto(bytes, len, out.data(), out.size());
  return out;
}

size_t PcmCodec::pcm16ToFloatInto(const uint8_t *bytes, size_t len, float *dst,
                                  size_t dstCapacity) {
  size_t n = len / 2;
  if (bytes == nullptr || dst == nullptr || n == 0 || dstCapacity < n) {
    return 0;
  }
  for (size_t i = 0; i < n; i++) {
    int16_t s = (int16_t)readLe16(bytes + i * 2);
    dst[i] = (float)s / 32768.0f;
  }
  return n;
}

std::vector<uint8_t> WavCodec::encode(const float *samples, size_t n,
                                      int sampleRate, int channels) {
  std::vector<uint8_t> out;
  if (sampleRate <= 0 || channels <= 0) {
    VOX_LOGW(TAG, "encode: invalid rate=%d channels=%d", sampleRate, channels);
    return out;
  }
  if (samples == nullptr) {
    n = 0;
  }

  const uint16_t numChannels = (uint16_t)channels;
  const uint16_t bitsPerSample = 16;
  const uint16_t blockAlign = numChannels * (bitsPerSample / 8);
  const uint32_t dataBytes = (uint32_t)(n * sizeof(int16_t));

  out.resize(kHeaderSize + dataBytes);
  uint8_t *p = out.data();
  p = writeTag(p, "RIFF");
  p = writeLe32(p, 36 + dataBytes);
  p = writeTag(p, "WAVE");
  p = writeTag(p, "fmt ");
  p = writeLe32(p, 16);
  p = writeLe16(p, 1); // PCM
  p = writeLe16(p, numChannels);
  p = writeLe32(p, (uint32_t)sampleRate);
  p = writeLe32(p, (uint32_t)sampleRate * blockAlign);
  p = writeLe16(p, blockAlign);
  p = writeLe16(p, bitsPerSample);
  p = writeTag(p, "data");
  p = writeLe32(p, dataBytes);

  if (n > 0) {
    PcmCodec::floatToPcm16Into(samples, n, p, dataBytes);
  }
  return out;
}

vox_err_t WavCodec::decode(const uint8_t *data, size_t len, WavAudio &out) {
  out = WavAudio{};
  if (data == nullptr || len < 12) {
    VOX_LOGW(TAG, "decode: too short (%u bytes)", (unsigned)len);
    return VOX_ERR_FORMAT;
  }
  if (memcmp(data, "RIFF", 4) != 0 || memcmp(data + 8, "WAVE", 4) != 0) {
    VOX_LOGW(TAG, "decode: missing RIFF/WAVE magic");
    return VOX_ERR_FORMAT;
  }

  bool haveFmt = false;
  uint16_t audioFormat = 0;
  uint16_t channels = 0;
  uint32_t sampleRate = 0;
  uint16_t bits = 0;

  size_t pos = 12;
  while (pos + 8 <= len) {
    const uint8_t *id = data + pos;
    uint32_t size = readLe32(data + pos + 4);
    size_t body = pos + 8;
    size_t avail = len - body;

    if (memcmp(id, "fmt ", 4) == 0) {
      if (size < 16 || avail < 16) {
        VOX_LOGW(TAG, "decode: short fmt chunk (%u)", (unsigned)size);
        return VOX_ERR_FORMAT;
      }
      audioFormat = readLe16(data + body);
      channels = readLe16(data + body + 2);
      sampleRate = readLe32(data + body + 4);
      bits = readLe16(data + body + 14);
      haveFmt = true;

      if (audioFormat != 1) {
        VOX_LOGW(TAG, "decode: unsupported audioFormat=%u",
                 (unsigned)audioFormat);
        return VOX_ERR_FORMAT;
      }
      if (bits != 16) {
        VOX_LOGW(TAG, "decode: unsupported bitsPerSample=%u", (unsigned)bits);
        return VOX_ERR_FORMAT;
      }
      if (channels == 0 || sampleRate == 0) {
        VOX_LOGW(TAG, "decode: channels=%u rate=%u", (unsigned)channels,
                 (unsigned)sampleRate);
        return VOX_ERR_FORMAT;
      }
    } else if (memcmp(id, "data", 4) == 0) {
      if (!haveFmt) {
        VOX_LOGW(TAG, "decode: data chunk before fmt");
        return VOX_ERR_FORMAT;
      }
      // Streaming writers leave the size at 0xFFFFFFFF; take what is there.
      size_t dataLen = std::min((size_t)size, avail);
      size_t frameBytes = (size_t)channels * 2;
      dataLen -= dataLen % frameBytes;

      out.samples = PcmCodec::pcm16ToFloat(data + body, dataLen);
      out.sample_rate = (int)sampleRate;
      out.channels = (int)channels;
      return VOX_OK;
    } else {
      VOX_LOGD(TAG, "decode: skip chunk '%.4s' (%u bytes)",
               reinterpret_cast<const char *>(id), (unsigned)size);
    }

    // Chunks are word aligned
    size_t next = body + (size_t)size + (size & 1u);
    if (next <= pos || next > len) {
      break;
    }
    pos = next;
  }

  VOX_LOGW(TAG, "decode: %s chunk missing", haveFmt ? "data" : "fmt");
  return VOX_ERR_FORMAT;
}
