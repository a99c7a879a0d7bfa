#pragma once

#include <cstdint>

/**
 * @brief 日志等级
 */
typedef enum {
  VOX_LOG_NONE = 0,
  VOX_LOG_ERROR,
  VOX_LOG_WARN,
  VOX_LOG_INFO,
  VOX_LOG_DEBUG,
  VOX_LOG_VERBOSE
} vox_log_level_t;

// Compile-time ceiling; calls above it compile to nothing.
#ifndef VOX_LOG_MAXIMUM_LEVEL
#define VOX_LOG_MAXIMUM_LEVEL VOX_LOG_DEBUG
#endif

/**
 * @brief 设置日志等级
 *
 * @param tag "*" 表示全局默认等级，否则只影响该 tag
 */
void vox_log_level_set(const char *tag, vox_log_level_t level);

vox_log_level_t vox_log_level_get(const char *tag);

/**
 * @brief 输出一行日志: "I (12345) Tag: message"
 */
void vox_log_write(vox_log_level_t level, const char *tag, const char *format,
                   ...) __attribute__((format(printf, 3, 4)));

/**
 * @brief 自进程启动以来的毫秒数（日志时间戳）
 */
uint32_t vox_log_timestamp();

#define VOX_LOG_LEVEL(level, tag, format, ...)                                 \
  do {                                                                         \
    if ((level) <= VOX_LOG_MAXIMUM_LEVEL) {                                    \
      vox_log_write(level, tag, format, ##__VA_ARGS__);                        \
    }                                                                          \
  } while (0)

#define VOX_LOGE(tag, format, ...)                                             \
  VOX_LOG_LEVEL(VOX_LOG_ERROR, tag, format, ##__VA_ARGS__)
#define VOX_LOGW(tag, format, ...)                                             \
  VOX_LOG_LEVEL(VOX_LOG_WARN, tag, format, ##__VA_ARGS__)
#define VOX_LOGI(tag, format, ...)                                             \
  VOX_LOG_LEVEL(VOX_LOG_INFO, tag, format, ##__VA_ARGS__)
#define VOX_LOGD(tag, format, ...)                                             \
  VOX_LOG_LEVEL(VOX_LOG_DEBUG, tag, format, ##__VA_ARGS__)
#define VOX_LOGV(tag, format, ...)                                             \
  VOX_LOG_LEVEL(VOX_LOG_VERBOSE, tag, format, ##__VA_ARGS__)
