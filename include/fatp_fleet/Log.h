#pragma once

/**
 * @file Log.h
 * @brief Leveled printf-style logger with a Signal-based sink.
 */

// FAT-P components used:
// - Signal: Log sink fan-out (tests and embedders connect their own writers)
//
// Every message that passes the level gate is formatted once and emitted on
// onMessage. The built-in stderr writer is just the default listener's
// behavior; setStderrEnabled(false) silences it without disconnecting
// anyone else.
//
// The FATP_FLEET_LOG_* macros drop calls below FATP_FLEET_MIN_LOG_LEVEL at
// compile time, so Debug logging in per-tick paths costs nothing in builds
// that raise the floor.

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string_view>

#include <fat_p/Signal.h>

#ifndef FATP_FLEET_MIN_LOG_LEVEL
#define FATP_FLEET_MIN_LOG_LEVEL 0
#endif

namespace fatp_fleet
{

enum class LogLevel : uint8_t
{
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    Off   = 4
};

[[nodiscard]] constexpr std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
    }
    return "?";
}

/**
 * @brief Leveled logger.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class Logger
{
public:
    static constexpr std::size_t kMaxMessageLength = 512;

    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /// @brief Fired for every message at or above the current level.
    fat_p::Signal<void(LogLevel, std::string_view)> onMessage;

    void setLevel(LogLevel level) noexcept { mLevel = level; }
    [[nodiscard]] LogLevel level() const noexcept { return mLevel; }

    void setStderrEnabled(bool enabled) noexcept { mStderr = enabled; }
    [[nodiscard]] bool stderrEnabled() const noexcept { return mStderr; }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept
    {
        return level != LogLevel::Off &&
               static_cast<uint8_t>(level) >= static_cast<uint8_t>(mLevel);
    }

#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    void log(LogLevel level, const char* fmt, ...)
    {
        if (!enabled(level))
        {
            return;
        }

        char buffer[kMaxMessageLength];
        va_list args;
        va_start(args, fmt);
        const int written = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        if (written < 0)
        {
            return;
        }

        const std::size_t length =
            static_cast<std::size_t>(written) < sizeof(buffer)
                ? static_cast<std::size_t>(written)
                : sizeof(buffer) - 1;
        const std::string_view text(buffer, length);

        if (mStderr)
        {
            std::fprintf(stderr, "[fleet %s] %.*s\n",
                         toString(level).data(),
                         static_cast<int>(text.size()), text.data());
        }

        if (onMessage.slotCount() > 0)
        {
            onMessage.emit(level, text);
        }
    }

private:
    LogLevel mLevel = LogLevel::Info;
    bool mStderr = true;
};

/// @brief Process-wide logger used by every fleet module.
inline Logger& defaultLogger()
{
    static Logger logger;
    return logger;
}

} // namespace fatp_fleet

#define FATP_FLEET_LOG_AT(lvl, ...)                                          \
    do                                                                       \
    {                                                                        \
        if (static_cast<int>(lvl) >= FATP_FLEET_MIN_LOG_LEVEL)               \
        {                                                                    \
            ::fatp_fleet::defaultLogger().log(lvl, __VA_ARGS__);             \
        }                                                                    \
    } while (0)

#define FATP_FLEET_LOG_DEBUG(...) FATP_FLEET_LOG_AT(::fatp_fleet::LogLevel::Debug, __VA_ARGS__)
#define FATP_FLEET_LOG_INFO(...)  FATP_FLEET_LOG_AT(::fatp_fleet::LogLevel::Info, __VA_ARGS__)
#define FATP_FLEET_LOG_WARN(...)  FATP_FLEET_LOG_AT(::fatp_fleet::LogLevel::Warn, __VA_ARGS__)
#define FATP_FLEET_LOG_ERROR(...) FATP_FLEET_LOG_AT(::fatp_fleet::LogLevel::Error, __VA_ARGS__)
