// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <cstdio>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#if !defined(ENABLE_VIRTUAL_TERMINAL_PROCESSING)
#define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
#endif
#else
#include <unistd.h>
#endif

namespace itemsim {

void init_terminal() {
#if defined(_WIN32)
    SetConsoleOutputCP(CP_UTF8);
    HANDLE output_handle = GetStdHandle(STD_ERROR_HANDLE);
    if (output_handle != INVALID_HANDLE_VALUE) {
        DWORD mode = 0;
        if (GetConsoleMode(output_handle, &mode)) {
            SetConsoleMode(output_handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
        }
    }
#endif
}

bool is_terminal(int fd) {
#if defined(_WIN32)
    return _isatty(fd);
#else
    return isatty(fd);
#endif
}

bool is_terminal_stdout() {
#if defined(_WIN32)
    return is_terminal(_fileno(stdout));
#else
    return is_terminal(fileno(stdout));
#endif
}

bool is_terminal_stderr() {
#if defined(_WIN32)
    return is_terminal(_fileno(stderr));
#else
    return is_terminal(fileno(stderr));
#endif
}

}  // namespace itemsim
