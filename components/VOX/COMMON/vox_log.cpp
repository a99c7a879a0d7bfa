#include "vox_log.h"

#include <unistd.h>

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <map>
#include <mutex>
#include <string>

namespace {
std::mutex s_logMutex;
vox_log_level_t s_defaultLevel = VOX_LOG_INFO;
std::map<std::string, vox_log_level_t> s_tagLevels;

const auto s_start = std::chrono::steady_clock::now();

char levelLetter(vox_log_level_t level) {
  switch (level) {
  case VOX_LOG_ERROR:
    return 'E';
  case VOX_LOG_WARN:
    return 'W';
  case VOX_LOG_INFO:
    return 'I';
  case VOX_LOG_DEBUG:
    return 'D';
  case VOX_LOG_VERBOSE:
    return 'V';
  default:
    return '?';
  }
}

const char *levelColor(vox_log_level_t level) {
  switch (level) {
  case VOX_LOG_ERROR:
    return "\033[0;31m";
  case VOX_LOG_WARN:
    return "\033[0;33m";
  case VOX_LOG_INFO:
    return "\033[0;32m";
  default:
    return "";
  }
}

vox_log_level_t levelForLocked(const char *tag) {
  if (tag != nullptr && !s_tagLevels.empty()) {
    auto it = s_tagLevels.find(tag);
    if (it != s_tagLevels.end()) {
      return it->second;
    }
  }
  return s_defaultLevel;
}
} // namespace

void vox_log_level_set(const char *tag, vox_log_level_t level) {
  std::lock_guard<std::mutex> lock(s_logMutex);
  if (tag == nullptr || strcmp(tag, "*") == 0) {
    s_defaultLevel = level;
    s_tagLevels.clear();
    return;
  }
  s_tagLevels[tag] = level;
}

vox_log_level_t vox_log_level_get(const char *tag) {
  std::lock_guard<std::mutex> lock(s_logMutex);
  return levelForLocked(tag);
}

uint32_t vox_log_timestamp() {
  auto elapsed = std::chrono::steady_clock::now() - s_start;
  return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
      .count();
}

void vox_log_write(vox_log_level_t level, const char *tag, const char *format,
                   ...) {
  std::lock_guard<std::mutex> lock(s_logMutex);
  if (level == VOX_LOG_NONE || level > levelForLocked(tag)) {
    return;
  }

  // Colour only when stderr is a terminal
  static const bool useColor = isatty(fileno(stderr)) != 0;
  const char *color = useColor ? levelColor(level) : "";
  const char *reset = (useColor && color[0] != '\0') ? "\033[0m" : "";

  fprintf(stderr, "%s%c (%u) %s: ", color, levelLetter(level),
          (unsigned)vox_log_timestamp(), tag ? tag : "");
  va_list args;
  va_start(args, format);
  vfprintf(stderr, format, args);
  va_end(args);
  fprintf(stderr, "%s\n", reset);
}
