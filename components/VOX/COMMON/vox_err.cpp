#include "vox_err.h"

namespace {
struct ErrName {
  vox_err_t code;
  const char *name;
};

#define ERR_TBL_IT(err) {err, #err}

const ErrName kErrNames[] = {
    ERR_TBL_IT(VOX_OK),
    ERR_TBL_IT(VOX_FAIL),
    ERR_TBL_IT(VOX_ERR_NO_MEM),
    ERR_TBL_IT(VOX_ERR_INVALID_ARG),
    ERR_TBL_IT(VOX_ERR_INVALID_STATE),
    ERR_TBL_IT(VOX_ERR_INVALID_SIZE),
    ERR_TBL_IT(VOX_ERR_NOT_FOUND),
    ERR_TBL_IT(VOX_ERR_NOT_SUPPORTED),
    ERR_TBL_IT(VOX_ERR_TIMEOUT),
    ERR_TBL_IT(VOX_ERR_DEVICE_UNAVAILABLE),
    ERR_TBL_IT(VOX_ERR_FORMAT),
    ERR_TBL_IT(VOX_ERR_CONNECTION_TIMEOUT),
    ERR_TBL_IT(VOX_ERR_CONNECTION),
    ERR_TBL_IT(VOX_ERR_PROTOCOL),
    ERR_TBL_IT(VOX_ERR_SESSION_TIMEOUT),
};

#undef ERR_TBL_IT
} // namespace

const char *vox_err_to_name(vox_err_t code) {
  for (const auto &e : kErrNames) {
    if (e.code == code) {
      return e.name;
    }
  }
  return "UNKNOWN ERROR";
}
