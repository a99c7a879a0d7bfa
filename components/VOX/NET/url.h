#pragma once

#include "vox_err.h"

#include <string>

/**
 * @brief 拆分后的 URL（ws / wss / http / https）
 */
struct ParsedUrl {
  std::string scheme; ///< 小写
  std::string host;
  std::string port;   ///< 未写端口时按 scheme 取 80 / 443
  std::string target; ///< 路径 + 查询串，至少为 "/"
  bool secure = false;

  /**
   * @brief HTTP Host / WebSocket 握手用的主机名，非默认端口时带上端口
   */
  std::string hostHeader() const;
};

/**
 * @return VOX_ERR_INVALID_ARG 缺少 scheme/host，或 scheme 不支持
 */
vox_err_t parseUrl(const std::string &url, ParsedUrl &out);

/**
 * @brief 百分号编码（RFC 3986 unreserved 之外的字节）
 */
std::string urlEncode(const std::string &value);

/**
 * @brief 追加查询参数，自动选择 '?' 或 '&'
 */
std::string appendQueryParam(const std::string &url, const std::string &key,
                             const std::string &value);
