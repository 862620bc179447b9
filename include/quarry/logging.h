/**
 * Compile-time tagged logging for Quarry
 *
 * Every translation unit declares the components it logs for:
 *
 *   QUARRY_LOG_TAG(LogScanner);
 *   QUARRY_LOG_INFO(LogScanner) << "Scanning log file " << path;
 *   QUARRY_LOG_WARN(FileSystemView) << "Falling back to full rebuild";
 *
 * Statements compile to nothing unless QUARRY_ENABLE_DEBUG_LOGGING is set
 * (cmake -DQUARRY_ENABLE_DEBUG_LOGGING=ON). QUARRY_MIN_LOG_LEVEL drops
 * everything below the given level at compile time (2 = INFO).
 */

#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace quarry {
namespace logging {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

struct LogTag {
    const char* name;
    LogLevel min_level;

    constexpr LogTag(const char* n, LogLevel level = LogLevel::DEBUG)
        : name(n), min_level(level) {}
};

#ifndef QUARRY_MIN_LOG_LEVEL
#define QUARRY_MIN_LOG_LEVEL 2
#endif

constexpr LogLevel kGlobalMinLevel = static_cast<LogLevel>(QUARRY_MIN_LOG_LEVEL);

// Single sink shared by all components.
class LogOutput {
public:
    static LogOutput& Instance() {
        static LogOutput instance;
        return instance;
    }

    void Write(const LogTag& tag, LogLevel level, const std::string& message) {
        if (!ShouldLog(tag, level)) return;

        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[" << LevelToString(level) << "] "
                  << "[" << tag.name << "] "
                  << message << "\n";
    }

    bool ShouldLog(const LogTag& tag, LogLevel level) const {
        if (level < kGlobalMinLevel) return false;
        if (level < tag.min_level) return false;
        if (level < runtime_level_) return false;
        return enabled_;
    }

    void SetEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = enabled;
    }

    // Raise the threshold at runtime; cannot go below the compile-time level.
    void SetLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        runtime_level_ = level;
    }

private:
    LogOutput() : enabled_(true), runtime_level_(LogLevel::TRACE) {}

    static const char* LevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "?????";
        }
    }

    std::mutex mutex_;
    bool enabled_;
    LogLevel runtime_level_;
};

#ifdef QUARRY_ENABLE_DEBUG_LOGGING

template<LogLevel Level>
class LogStream {
public:
    LogStream(const LogTag& tag) : tag_(tag), enabled_(false) {
        if constexpr (Level >= kGlobalMinLevel) {
            enabled_ = LogOutput::Instance().ShouldLog(tag, Level);
        }
    }

    ~LogStream() {
        if (enabled_) {
            LogOutput::Instance().Write(tag_, Level, oss_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            oss_ << value;
        }
        return *this;
    }

private:
    const LogTag& tag_;
    bool enabled_;
    std::ostringstream oss_;
};

#else

template<LogLevel Level>
class LogStream {
public:
    LogStream(const LogTag&) {}

    template<typename T>
    LogStream& operator<<(const T&) {
        return *this;
    }
};

#endif // QUARRY_ENABLE_DEBUG_LOGGING

} // namespace logging
} // namespace quarry

#define QUARRY_LOG_TAG(name) \
    static constexpr ::quarry::logging::LogTag name##Tag(#name)

#define QUARRY_LOG_TAG_LEVEL(name, level) \
    static constexpr ::quarry::logging::LogTag name##Tag(#name, ::quarry::logging::LogLevel::level)

#define QUARRY_LOG_TRACE(component) \
    ::quarry::logging::LogStream<::quarry::logging::LogLevel::TRACE>(component##Tag)

#define QUARRY_LOG_DEBUG(component) \
    ::quarry::logging::LogStream<::quarry::logging::LogLevel::DEBUG>(component##Tag)

#define QUARRY_LOG_INFO(component) \
    ::quarry::logging::LogStream<::quarry::logging::LogLevel::INFO>(component##Tag)

#define QUARRY_LOG_WARN(component) \
    ::quarry::logging::LogStream<::quarry::logging::LogLevel::WARN>(component##Tag)

#define QUARRY_LOG_ERROR(component) \
    ::quarry::logging::LogStream<::quarry::logging::LogLevel::ERROR>(component##Tag)

#define QUARRY_LOG_FATAL(component) \
    ::quarry::logging::LogStream<::quarry::logging::LogLevel::FATAL>(component##Tag)
