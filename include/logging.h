// logging.h - Logging utilities for SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <string>
#include <memory>
#include <vector>
#include <mutex>
#include <atomic>
#include <cstdio>
#include <stdexcept>

namespace sebridge
{
namespace se
{

/// @brief Log levels
enum class LogLevel : int
{
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// @brief Log targets
enum class LogTarget : int
{
    None = 0,
    Console = 1,
    File = 2,
    Syslog = 4
};

inline LogTarget operator|(LogTarget lhs, LogTarget rhs)
{
    return static_cast<LogTarget>(static_cast<int>(lhs) | static_cast<int>(rhs));
}

inline bool HasTarget(LogTarget targets, LogTarget target)
{
    return (static_cast<int>(targets) & static_cast<int>(target)) != 0;
}

/// @brief Log configuration
struct LogConfig
{
    LogLevel level{LogLevel::Warning};
    LogTarget targets{LogTarget::Console};
    std::string logFilePath;
    std::string syslogIdent{"sebridge-se-driver"};
    bool enableTimestamps{true};
    bool enableThreadId{true};
    bool enableProcessId{false};
};

/// @brief Logger interface
class Logger
{
public:
    /// @brief Virtual destructor
    virtual ~Logger() = default;

    /// @brief Write log message
    /// @param level Log level
    /// @param message Fully formatted log line
    virtual void Write(LogLevel level, const std::string& message) = 0;

    /// @brief Flush pending log messages
    virtual void Flush() = 0;
};

/// @brief Log manager
class LogManager
{
public:
    /// @brief Get singleton instance
    /// @return Reference to singleton instance
    static LogManager& GetInstance();

    /// @brief Initialize logging
    /// @param config Log configuration
    /// @return true on success, false if already initialized or a target failed
    bool Initialize(const LogConfig& config = LogConfig{});

    /// @brief Write log message
    /// @param level Log level
    /// @param message Log message
    /// @param function Function name (optional)
    /// @param file File name (optional)
    /// @param line Line number (optional)
    void Log(LogLevel level, const std::string& message,
             const std::string& function = "",
             const std::string& file = "",
             int line = 0);

    /// @brief Write formatted log message
    /// @param level Log level
    /// @param format printf-style format string
    /// @param args Format arguments
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args)
    {
        if (!IsEnabled(level))
        {
            return;
        }

        try
        {
            Log(level, FormatString(format, std::forward<Args>(args)...));
        }
        catch (const std::exception& e)
        {
            Log(LogLevel::Error, std::string("Log formatting failed: ") + format + " (" + e.what() + ")");
        }
    }

    /// @brief Check if log level is enabled
    /// @param level Log level to check
    /// @return true if enabled, false otherwise
    bool IsEnabled(LogLevel level) const;

    /// @brief Set log level
    /// @param level New log level
    void SetLogLevel(LogLevel level);

    /// @brief Get current log level
    /// @return Current log level
    LogLevel GetLogLevel() const;

    /// @brief Replace all loggers with a single one
    /// @param logger Logger receiving every message
    void SetLogger(std::unique_ptr<Logger> logger);

    /// @brief Flush all loggers
    void Flush();

private:
    LogManager() = default;
    ~LogManager() = default;

    // Disable copy and move
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;
    LogManager(LogManager&&) = delete;
    LogManager& operator=(LogManager&&) = delete;

    /// @brief Create loggers based on configuration
    /// @param config Log configuration
    /// @return true on success, false on failure
    bool CreateLoggers(const LogConfig& config);

    /// @brief Format log message with metadata
    std::string FormatMessage(LogLevel level, const std::string& message,
                              const std::string& function,
                              const std::string& file,
                              int line) const;

    /// @brief Format string with arguments
    template<typename... Args>
    static std::string FormatString(const char* format, Args&&... args)
    {
        if constexpr (sizeof...(args) == 0)
        {
            return format;
        }
        else
        {
            int size = std::snprintf(nullptr, 0, format, args...);
            if (size < 0)
            {
                throw std::runtime_error("invalid log format");
            }

            std::vector<char> buffer(static_cast<size_t>(size) + 1);
            std::snprintf(buffer.data(), buffer.size(), format, args...);
            return std::string(buffer.data(), static_cast<size_t>(size));
        }
    }

private:
    mutable std::mutex m_mutex;
    std::atomic<bool> m_initialized{false};
    LogConfig m_config;
    std::vector<std::unique_ptr<Logger>> m_loggers;
    std::atomic<LogLevel> m_currentLevel{LogLevel::Warning};
};

/// @brief Parse a level name such as "info" or "DEBUG"
/// @param name Level name
/// @param level Parsed level
/// @return true if the name is recognized
bool ParseLogLevel(const std::string& name, LogLevel& level);

/// @brief Initialize logging system
/// @param config Log configuration
/// @return true if this call initialized logging
bool InitializeLogging(const LogConfig& config = LogConfig{});

// Logging macros
#define LogDebug(message, ...) \
    sebridge::se::LogManager::GetInstance().LogFormat( \
        sebridge::se::LogLevel::Debug, message, ##__VA_ARGS__)

#define LogInfo(message, ...) \
    sebridge::se::LogManager::GetInstance().LogFormat( \
        sebridge::se::LogLevel::Info, message, ##__VA_ARGS__)

#define LogWarning(message, ...) \
    sebridge::se::LogManager::GetInstance().LogFormat( \
        sebridge::se::LogLevel::Warning, message, ##__VA_ARGS__)

#define LogError(message, ...) \
    sebridge::se::LogManager::GetInstance().LogFormat( \
        sebridge::se::LogLevel::Error, message, ##__VA_ARGS__)

#define LogCritical(message, ...) \
    sebridge::se::LogManager::GetInstance().LogFormat( \
        sebridge::se::LogLevel::Critical, message, ##__VA_ARGS__)

// Function entry/exit logging for debugging
#ifdef SEBRIDGE_DEBUG_LOGGING
#define LogFunctionEntry() \
    LogDebug("Entering function: %s", __FUNCTION__)

#define LogFunctionExitWithStatus(status) \
    LogDebug("Exiting function: %s with status: %d", __FUNCTION__, static_cast<int>(status))
#else
#define LogFunctionEntry() do {} while(0)
#define LogFunctionExitWithStatus(status) do {} while(0)
#endif

} // namespace se
} // namespace sebridge
