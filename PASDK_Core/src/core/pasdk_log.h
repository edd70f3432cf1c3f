// ==============================
// PASDK - Shared Logging
// ==============================
// Provides PASDK_LOG_INFO, PASDK_LOG_WARN, PASDK_LOG_ERROR (always on) and
// PASDK_LOG_DEBUG, PASDK_LOG_TRACE (debug builds only) across all
// translation units.
//
// Implementation: header-only with inline statics. Messages go to the log
// file (once pasdk_log_open() has been called), to stderr when console
// output is enabled, and to an optional sink installed by the host.

#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <exception>
#include <ctime>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

// ========== Debug/Release Logging Macros ==========

#ifdef PASDK_DEBUG
    #define PASDK_LOG_DEBUG(fmt, ...) pasdk_log_message(PASDK::LogLevel::Debug, fmt, ##__VA_ARGS__)
    #define PASDK_LOG_TRACE(fmt, ...) pasdk_log_message(PASDK::LogLevel::Trace, fmt, ##__VA_ARGS__)
#else
    #define PASDK_LOG_DEBUG(fmt, ...) ((void)0)
    #define PASDK_LOG_TRACE(fmt, ...) ((void)0)
#endif

#define PASDK_LOG_ERROR(fmt, ...) pasdk_log_message(PASDK::LogLevel::Error, fmt, ##__VA_ARGS__)
#define PASDK_LOG_WARN(fmt, ...)  pasdk_log_message(PASDK::LogLevel::Warn, fmt, ##__VA_ARGS__)
#define PASDK_LOG_INFO(fmt, ...)  pasdk_log_message(PASDK::LogLevel::Info, fmt, ##__VA_ARGS__)

namespace PASDK {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

inline const char* to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    default:              return "?";
    }
}

using LogSink = std::function<void(LogLevel, const std::string&)>;

} // namespace PASDK

// ========== Implementation ==========

namespace pasdk_log_detail {

inline FILE*& log_file() { static FILE* f = nullptr; return f; }
inline bool& console_enabled() { static bool v = true; return v; }
inline std::mutex& log_mutex() { static std::mutex m; return m; }
inline PASDK::LogSink& log_sink() { static PASDK::LogSink s; return s; }

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    snprintf(buf, sizeof(buf), "[%02d:%02d:%02d.%03d] ",
             tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

} // namespace pasdk_log_detail

/// Open (or switch) the log file. Parent directories are created.
/// Returns false if the file could not be opened; logging continues
/// to the console and the sink.
inline bool pasdk_log_open(const std::string& path) {
    std::lock_guard<std::mutex> lock(pasdk_log_detail::log_mutex());
    FILE*& f = pasdk_log_detail::log_file();
    if (f) {
        fclose(f);
        f = nullptr;
    }
    if (path.empty()) return true;

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    f = fopen(path.c_str(), "a");
    return f != nullptr;
}

inline void pasdk_log_close() {
    std::lock_guard<std::mutex> lock(pasdk_log_detail::log_mutex());
    FILE*& f = pasdk_log_detail::log_file();
    if (f) {
        fclose(f);
        f = nullptr;
    }
}

inline void pasdk_log_set_console(bool enabled) {
    std::lock_guard<std::mutex> lock(pasdk_log_detail::log_mutex());
    pasdk_log_detail::console_enabled() = enabled;
}

/// Install a sink that receives every formatted message. Pass an empty
/// function to remove it.
inline void pasdk_log_set_sink(PASDK::LogSink sink) {
    std::lock_guard<std::mutex> lock(pasdk_log_detail::log_mutex());
    pasdk_log_detail::log_sink() = std::move(sink);
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
inline void pasdk_log_message(PASDK::LogLevel level, const char* format, ...) {
    char body[2048];
    va_list args;
    va_start(args, format);
    vsnprintf(body, sizeof(body), format, args);
    va_end(args);

    std::string line = pasdk_log_detail::timestamp();
    line += "[";
    line += PASDK::to_string(level);
    line += "] ";
    line += body;

    PASDK::LogSink sink;
    {
        std::lock_guard<std::mutex> lock(pasdk_log_detail::log_mutex());

        if (FILE* f = pasdk_log_detail::log_file()) {
            fprintf(f, "%s\n", line.c_str());
            fflush(f);
        }

        if (pasdk_log_detail::console_enabled()) {
            fprintf(stderr, "%s\n", line.c_str());
        }

        sink = pasdk_log_detail::log_sink();
    }

    // The sink runs unlocked so it may log itself. Its failures never reach
    // the caller, which may be a noexcept hook path.
    if (sink) {
        try {
            sink(level, body);
        } catch (const std::exception& e) {
            fprintf(stderr, "[PASDK] log sink threw: %s\n", e.what());
        } catch (...) {
            fprintf(stderr, "[PASDK] log sink threw a non-standard exception\n");
        }
    }
}
