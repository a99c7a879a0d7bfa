#pragma once

#include "vox_log.h"

#include <cstdint>

/**
 * @brief 错误码类型
 *
 * 0 表示成功，其余为失败。通用错误码沿用 esp_err_t 的数值与语义，
 * 语音会话相关的错误码从 VOX_ERR_DOMAIN_BASE 开始。
 */
typedef int32_t vox_err_t;

#define VOX_OK 0
#define VOX_FAIL -1

#define VOX_ERR_NO_MEM 0x101
#define VOX_ERR_INVALID_ARG 0x102
#define VOX_ERR_INVALID_STATE 0x103
#define VOX_ERR_INVALID_SIZE 0x104
#define VOX_ERR_NOT_FOUND 0x105
#define VOX_ERR_NOT_SUPPORTED 0x106
#define VOX_ERR_TIMEOUT 0x107

#define VOX_ERR_DOMAIN_BASE 0x8000
#define VOX_ERR_DEVICE_UNAVAILABLE (VOX_ERR_DOMAIN_BASE + 1) ///< 无采集/播放设备
#define VOX_ERR_FORMAT (VOX_ERR_DOMAIN_BASE + 2)             ///< WAV/PCM 数据格式错误
#define VOX_ERR_CONNECTION_TIMEOUT (VOX_ERR_DOMAIN_BASE + 3) ///< 连接/握手超时
#define VOX_ERR_CONNECTION (VOX_ERR_DOMAIN_BASE + 4)         ///< 传输层失败
#define VOX_ERR_PROTOCOL (VOX_ERR_DOMAIN_BASE + 5)           ///< 无法解析或不符合预期的消息
#define VOX_ERR_SESSION_TIMEOUT (VOX_ERR_DOMAIN_BASE + 6)    ///< 会话超过最大时长

/**
 * @brief 返回错误码名称，例如 "VOX_ERR_FORMAT"
 */
const char *vox_err_to_name(vox_err_t code);

/**
 * @brief 出错时打印日志并返回错误码
 */
#define VOX_RETURN_ON_ERROR(x, log_tag, format, ...)                           \
  do {                                                                         \
    vox_err_t err_rc_ = (x);                                                   \
    if (err_rc_ != VOX_OK) {                                                   \
      VOX_LOGE(log_tag, "%s(%d): " format, __FUNCTION__, __LINE__,             \
               ##__VA_ARGS__);                                                 \
      return err_rc_;                                                          \
    }                                                                          \
  } while (0)
