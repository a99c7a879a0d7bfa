#pragma once

#include "vox_err.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @brief float [-1, 1] 与 16-bit little-endian PCM 互转
 *
 * 编码：钳位到 [-1, 1]，乘 32767 后四舍五入；解码：除以 32768。
 */
class PcmCodec {
public:
  static std::vector<uint8_t> floatToPcm16(const float *samples, size_t n);

  /**
   * @brief 编码到调用方缓冲区
   * @return 写入字节数；dstCapacity 不足 2 * n 时返回 0
   */
  static size_t floatToPcm16Into(const float *samples, size_t n, uint8_t *dst,
                                 size_t dstCapacity);

  /**
   * @brief 解码；末尾不成对的单字节被忽略
   */
  static std::vector<float> pcm16ToFloat(const uint8_t *bytes, size_t len);

  /**
   * @return 解码样本数；dstCapacity 不足时返回 0
   */
  static size_t pcm16ToFloatInto(const uint8_t *bytes, size_t len, float *dst,
                                 size_t dstCapacity);
};

/**
 * @brief 解码后的 WAV（交织样本）
 */
struct WavAudio {
  std::vector<float> samples;
  int sample_rate = 0;
  int channels = 0;

  size_t frames() const {
    return channels > 0 ? samples.size() / (size_t)channels : 0;
  }
};

/**
 * @brief RIFF/WAVE 16-bit PCM 容器
 */
class WavCodec {
public:
  static constexpr size_t kHeaderSize = 44;

  /**
   * @brief 生成 44 字节标准头 + PCM16 数据
   * @param samples 交织样本，长度应为 channels 的整数倍
   */
  static std::vector<uint8_t> encode(const float *samples, size_t n,
                                     int sampleRate, int channels);

  static std::vector<uint8_t> encode(const WavAudio &audio) {
    return encode(audio.samples.data(), audio.samples.size(),
                  audio.sample_rate, audio.channels);
  }

  /**
   * @brief 按块遍历解析；未知块按大小跳过
   *
   * @return VOX_ERR_FORMAT 缺少 RIFF/WAVE 标识、audioFormat != 1、
   *         bitsPerSample != 16，或缺少 fmt/data 块
   */
  static vox_err_t decode(const uint8_t *data, size_t len, WavAudio &out);

  static vox_err_t decode(const std::vector<uint8_t> &bytes, WavAudio &out) {
    return decode(bytes.data(), bytes.size(), out);
  }
};
