#include "base64.h"

#include <openssl/evp.h>

#include <cctype>

static const char *TAG = "Base64";

std::string base64Encode(const uint8_t *data, size_t len) {
  if (data == nullptr || len == 0) {
    return std::string();
  }
  std::string out(4 * ((len + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data,
                          (int)len);
  out.resize(n > 0 ? (size_t)n : 0);
  return out;
}

vox_err_t base64Decode(const char *text, size_t len, std::vector<uint8_t> &out) {
  out.clear();
  if (text == nullptr) {
    return VOX_ERR_INVALID_ARG;
  }
  while (len > 0 && std::isspace((unsigned char)*text)) {
    text++;
    len--;
  }
  while (len > 0 && std::isspace((unsigned char)text[len - 1])) {
    len--;
  }
  if (len == 0) {
    return VOX_OK;
  }
  if (len % 4 != 0) {
    VOX_LOGW(TAG, "length %u is not a multiple of 4", (unsigned)len);
    return VOX_ERR_FORMAT;
  }

  out.resize(len / 4 * 3);
  int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(text),
                          (int)len);
  if (n < 0) {
    VOX_LOGW(TAG, "invalid base64 input");
    out.clear();
    return VOX_ERR_FORMAT;
  }
  // EVP_DecodeBlock keeps the bytes produced by '=' padding
  size_t pad = 0;
  if (text[len - 1] == '=') {
    pad++;
    if (text[len - 2] == '=') {
      pad++;
    }
  }
  out.resize((size_t)n - pad);
  return VOX_OK;
}
