// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <cocoon/infra/common/terminal.hpp>

namespace cocoon::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Untagged line, always printed
    kCritical,  // Worker faults
    kError,     // Failed tool runs
    kWarning,   // Recoverable anomalies (e.g. missing endorsement, ignored notification)
    kInfo,      // Worker lifecycle
    kDebug,     // Per-slot pipeline progress and operation rejections
    kTrace      // Per-block execution summaries
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread ids in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Tee all log lines to this file, without colors
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
//! \note This function is not thread safe as it's meant to be used in tests
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
//! \remarks Some logging operations may implement computations which would be completely wasted if the outcome is not
//! printed
bool test_verbosity(Level level);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    // Accumulators
    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    void append(const Args& args) {
        append("", args);
    }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(41) << std::setfill(' ') << msg;
        bool left{true};
        for (const auto& arg : args) {
            ss_ << (left ? kColorGreen : kColorWhite) << arg << kColorReset << (left ? "=" : " ") << kColorReset;
            left = !left;
        }
    }
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

using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;

}  // namespace cocoon::log

#define COCOON_LOGBUFFER(level_, ...)           \
    if (!cocoon::log::test_verbosity(level_)) { \
    } else                                      \
        cocoon::log::LogBuffer<level_>(__VA_ARGS__)

#define COCOON_TRACE_M(...) COCOON_LOGBUFFER(cocoon::log::Level::kTrace, __VA_ARGS__)
#define COCOON_DEBUG_M(...) COCOON_LOGBUFFER(cocoon::log::Level::kDebug, __VA_ARGS__)
#define COCOON_INFO_M(...) COCOON_LOGBUFFER(cocoon::log::Level::kInfo, __VA_ARGS__)
#define COCOON_WARN_M(...) COCOON_LOGBUFFER(cocoon::log::Level::kWarning, __VA_ARGS__)
#define COCOON_ERROR_M(...) COCOON_LOGBUFFER(cocoon::log::Level::kError, __VA_ARGS__)
#define COCOON_CRIT_M(...) COCOON_LOGBUFFER(cocoon::log::Level::kCritical, __VA_ARGS__)

#define COCOON_TRACE COCOON_TRACE_M()
#define COCOON_DEBUG COCOON_DEBUG_M()
#define COCOON_CRIT COCOON_CRIT_M()
