#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

/**
 * @brief 固定容量环形缓冲区（满时覆盖最旧数据）
 *
 * 采集暂存和播放抖动缓冲共用。写入永不阻塞、永不失败；构造后不再分配内存。
 * 一个生产者线程与一个消费者线程可直接并发调用，无需外部加锁。
 *
 * @example
 *   RingBuffer<float> rb(16000);
 *   rb.write(samples, n);
 *   float block[256];
 *   rb.readExact(block, 256); // 不足部分补 0
 */
template <typename T> class RingBuffer {
public:
  explicit RingBuffer(size_t capacity)
      : buf_(capacity > 0 ? capacity : 1), capacity_(buf_.size()) {}

  RingBuffer(const RingBuffer &) = delete;
  RingBuffer &operator=(const RingBuffer &) = delete;

  /**
   * @brief 写入 n 个元素；空间不足时先丢弃最旧的未读数据
   * @return 被丢弃的元素个数
   */
  size_t write(const T *src, size_t n) {
    if (src == nullptr || n == 0) {
      return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    total_written_ += n;

    size_t dropped = 0;
    if (n >= capacity_) {
      // Only the newest capacity_ elements survive
      dropped = count_ + (n - capacity_);
      src += n - capacity_;
      n = capacity_;
      read_ = 0;
      write_ = 0;
      count_ = 0;
    } else if (count_ + n > capacity_) {
      size_t over = count_ + n - capacity_;
      read_ = (read_ + over) % capacity_;
      count_ -= over;
      dropped = over;
    }

    size_t first = std::min(n, capacity_ - write_);
    std::copy(src, src + first, buf_.begin() + write_);
    std::copy(src + first, src + n, buf_.begin());
    write_ = (write_ + n) % capacity_;
    count_ += n;
    return dropped;
  }

  /**
   * @brief 读出最多 maxCount 个元素
   * @return 实际读出的个数
   */
  size_t read(T *dst, size_t maxCount) {
    if (dst == nullptr || maxCount == 0) {
      return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(maxCount, count_);
    size_t first = std::min(n, capacity_ - read_);
    std::copy(buf_.begin() + read_, buf_.begin() + read_ + first, dst);
    std::copy(buf_.begin(), buf_.begin() + (n - first), dst + first);
    read_ = (read_ + n) % capacity_;
    count_ -= n;
    return n;
  }

  /**
   * @brief 读出恰好 count 个元素，不足部分填充 T{}（播放端按静音处理）
   * @return 实际有效的个数
   */
  size_t readExact(T *dst, size_t count) {
    size_t got = read(dst, count);
    if (dst != nullptr && got < count) {
      std::fill(dst + got, dst + count, T{});
    }
    return got;
  }

  /**
   * @brief 拷贝历史数据但不消费
   *
   * 拷贝以“最新元素之前 offsetFromNewest 个”为结尾的 count 个元素。
   * @return 拷贝个数；请求超出缓冲区现有数据时返回 0
   */
  size_t copyRecent(T *dst, size_t count, size_t offsetFromNewest) const {
    if (dst == nullptr || count == 0) {
      return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (count + offsetFromNewest > count_) {
      return 0;
    }
    size_t start =
        (write_ + capacity_ * 2 - offsetFromNewest - count) % capacity_;
    size_t first = std::min(count, capacity_ - start);
    std::copy(buf_.begin() + start, buf_.begin() + start + first, dst);
    std::copy(buf_.begin(), buf_.begin() + (count - first), dst + first);
    return count;
  }

  size_t available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
  }

  bool empty() const { return available() == 0; }

  size_t capacity() const { return capacity_; }

  /**
   * @brief 自构造（或上次 reset）以来写入的总元素数，单调递增
   */
  uint64_t totalWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_written_;
  }

  /**
   * @brief 丢弃未读数据（不释放内存）
   */
  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    read_ = 0;
    write_ = 0;
    count_ = 0;
  }

  /**
   * @brief clear() 并把 totalWritten 归零
   */
  void reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    read_ = 0;
    write_ = 0;
    count_ = 0;
    total_written_ = 0;
  }

private:
  std::vector<T> buf_;
  const size_t capacity_;
  size_t read_ = 0;
  size_t write_ = 0;
  size_t count_ = 0;
  uint64_t total_written_ = 0;
  mutable std::mutex mutex_;
};
