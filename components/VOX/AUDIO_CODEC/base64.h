#pragma once

#include "vox_err.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief 标准 base64（RFC 4648，带填充），用于音频块在 JSON 中传输
 */
std::string base64Encode(const uint8_t *data, size_t len);

/**
 * @brief 解码；忽略首尾空白
 * @return VOX_ERR_FORMAT 长度不是 4 的倍数或含非法字符
 */
vox_err_t base64Decode(const char *text, size_t len, std::vector<uint8_t> &out);

inline vox_err_t base64Decode(const std::string &text,
                              std::vector<uint8_t> &out) {
  return base64Decode(text.data(), text.size(), out);
}
