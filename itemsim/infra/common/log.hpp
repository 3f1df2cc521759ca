// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace itemsim::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. run banner)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which aborts the current run
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations (stage progress)
    kDebug,     // Debug information (e.g. filtered users)
    kTrace      // Trace of spilled sort runs and per round details
};

//! \brief Holds logging configuration
struct Settings {
    bool log_std_out{false};  // Whether console logging goes to std::cout or std::cerr (default)
    bool log_utc{true};       // Whether timestamps should be in UTC or imbue local timezone
    bool log_nocolor{false};  // Whether to disable colorized output
    bool log_threads{false};  // Whether to print thread names in log lines (e.g. round workers)
    Level log_verbosity{Level::kInfo};
    std::string log_file;  // Tee log lines to this file, always without colors
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process or in tests
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }

  protected:
    //! Message padded to a fixed column followed by key=value pairs
    void append(std::string_view msg, const Args& args);
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace itemsim::log

#define ITEMSIM_LOGBUFFER(level_, ...)           \
    if (!itemsim::log::test_verbosity(level_)) { \
    } else                                       \
        itemsim::log::LogBuffer<level_>(__VA_ARGS__)

#define ITEMSIM_TRACE_M(...) ITEMSIM_LOGBUFFER(itemsim::log::Level::kTrace, __VA_ARGS__)
#define ITEMSIM_DEBUG_M(...) ITEMSIM_LOGBUFFER(itemsim::log::Level::kDebug, __VA_ARGS__)
#define ITEMSIM_INFO_M(...) ITEMSIM_LOGBUFFER(itemsim::log::Level::kInfo, __VA_ARGS__)
