#pragma once

#include <cstdint>
#include <functional>

/**
 * @brief 单调时钟，毫秒
 */
int64_t vox_time_ms();

/**
 * @brief 阻塞当前线程 ms 毫秒
 */
void vox_delay_ms(uint32_t ms);

/**
 * @brief 可替换的时钟源（测试中用手动时钟驱动超时逻辑）
 */
using VoxClock = std::function<int64_t()>;

inline VoxClock vox_default_clock() { return &vox_time_ms; }
