#pragma once

#include "vox_err.h"

#include <cstddef>
#include <vector>

/**
 * @brief 线性插值重采样
 *
 * ratio = outRate / inRate，输出长度 ceil(n * ratio)，第 i 个输出取源位置
 * i / ratio 处两个相邻样本的线性插值（上界钳到 n - 1）。适合 20-250 ms
 * 的语音块。
 */
class SampleRateConverter {
public:
  /**
   * @brief 输出样本数；参数非法时返回 0
   */
  static size_t outputLength(size_t inputLength, int inputRate,
                             int outputRate);

  /**
   * @brief 重采样并返回新数组（接收路径使用）
   */
  static std::vector<float> resample(const float *input, size_t inputLength,
                                     int inputRate, int outputRate);

  static std::vector<float> resample(const std::vector<float> &input,
                                     int inputRate, int outputRate) {
    return resample(input.data(), input.size(), inputRate, outputRate);
  }

  /**
   * @brief 写入调用方提供的缓冲区，不分配内存（发送热路径使用）
   *
   * @param written 实际写入的样本数
   * @return VOX_ERR_INVALID_SIZE 目标缓冲区不足
   */
  static vox_err_t resampleInto(const float *input, size_t inputLength,
                                int inputRate, int outputRate, float *dst,
                                size_t dstCapacity, size_t &written);
};
