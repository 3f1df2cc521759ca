// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "safe_strerror.hpp"

#include <cstring>

namespace itemsim {

std::string safe_strerror(int err_code) {
    char msg[256];
#if defined(_WIN32)
    if (strerror_s(msg, sizeof(msg), err_code) != 0) {
        (void)strncpy_s(msg, "Unknown error", _TRUNCATE);
    }
    return {msg};
#elif defined(__GLIBC__) && defined(_GNU_SOURCE)
    // GNU variant may return a pointer to a static string instead of filling msg
    return {strerror_r(err_code, msg, sizeof(msg))};
#else
    if (strerror_r(err_code, msg, sizeof(msg))) {
        (void)strncpy(msg, "Unknown error", sizeof(msg));
    }
    msg[sizeof(msg) - 1] = '\0';
    return {msg};
#endif
}

}  // namespace itemsim
