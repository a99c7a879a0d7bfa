#include "sample_rate_converter.h"

#include <algorithm>
#include <cstdint>

static const char *TAG = "Resampler";

namespace {
void interpolate(const float *input, size_t inputLength, double ratio,
                 float *dst, size_t outLen) {
  const size_t last = inputLength - 1;
  for (size_t i = 0; i < outLen; i++) {
    double srcPos = (double)i / ratio;
    size_t i0 = std::min((size_t)srcPos, last);
    size_t i1 = std::min(i0 + 1, last);
    double t = srcPos - (double)i0;
    dst[i] = (float)((1.0 - t) * input[i0] + t * input[i1]);
  }
}
} // namespace

size_t SampleRateConverter::outputLength(size_t inputLength, int inputRate,
                                         int outputRate) {
  if (inputRate <= 0 || outputRate <= 0) {
    return 0;
  }
  if (inputRate == outputRate) {
    return inputLength;
  }
  // ceil(n * out / in) in integers so exact ratios stay exact
  uint64_t num = (uint64_t)inputLength * (uint64_t)outputRate;
  return (size_t)((num + (uint64_t)inputRate - 1) / (uint64_t)inputRate);
}

std::vector<float> SampleRateConverter::resample(const float *input,
                                                 size_t inputLength,
                                                 int inputRate,
                                                 int outputRate) {
  std::vector<float> out;
  if (input == nullptr || inputLength == 0) {
    VOX_LOGD(TAG, "empty input, nothing to resample");
    return out;
  }
  if (inputRate <= 0 || outputRate <= 0) {
    VOX_LOGW(TAG, "invalid rates %d -> %d", inputRate, outputRate);
    return out;
  }
  if (inputRate == outputRate) {
    out.assign(input, input + inputLength);
    return out;
  }

  out.resize(outputLength(inputLength, inputRate, outputRate));
  interpolate(input, inputLength, (double)outputRate / (double)inputRate,
              out.data(), out.size());
  return out;
}

vox_err_t SampleRateConverter::resampleInto(const float *input,
                                            size_t inputLength, int inputRate,
                                            int outputRate, float *dst,
                                            size_t dstCapacity,
                                            size_t &written) {
  written = 0;
  if (inputRate <= 0 || outputRate <= 0) {
    return VOX_ERR_INVALID_ARG;
  }
  if (input == nullptr || inputLength == 0) {
    return VOX_OK;
  }
  if (dst == nullptr) {
    return VOX_ERR_INVALID_ARG;
  }

  size_t outLen = outputLength(inputLength, inputRate, outputRate);
  if (outLen > dstCapacity) {
    VOX_LOGW(TAG, "dst too small: need=%u cap=%u", (unsigned)outLen,
             (unsigned)dstCapacity);
    return VOX_ERR_INVALID_SIZE;
  }

  if (inputRate == outputRate) {
    std::copy(input, input + inputLength, dst);
  } else {
    interpolate(input, inputLength, (double)outputRate / (double)inputRate,
                dst, outLen);
  }
  written = outLen;
  return VOX_OK;
}
