// logging.cpp - Logging implementation for SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "logging.h"

#include <syslog.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace sebridge
{
namespace se
{

namespace
{

const char* GetLogLevelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Trace:    return "TRACE";
    case LogLevel::Debug:    return "DEBUG";
    case LogLevel::Info:     return "INFO";
    case LogLevel::Warning:  return "WARN";
    case LogLevel::Error:    return "ERROR";
    case LogLevel::Critical: return "CRIT";
    default:                 return "OFF";
    }
}

class ConsoleLogger : public Logger
{
public:
    void Write(LogLevel /*level*/, const std::string& message) override
    {
        std::cerr << message << '\n';
    }

    void Flush() override
    {
        std::cerr.flush();
    }
};

class FileLogger : public Logger
{
public:
    explicit FileLogger(const std::string& path)
        : m_stream(path, std::ios::out | std::ios::app)
    {
    }

    bool IsOpen() const { return m_stream.is_open(); }

    void Write(LogLevel /*level*/, const std::string& message) override
    {
        m_stream << message << '\n';
    }

    void Flush() override
    {
        m_stream.flush();
    }

private:
    std::ofstream m_stream;
};

class SyslogLogger : public Logger
{
public:
    explicit SyslogLogger(const std::string& ident)
        : m_ident(ident)
    {
        openlog(m_ident.c_str(), LOG_PID, LOG_USER);
    }

    ~SyslogLogger() override
    {
        closelog();
    }

    void Write(LogLevel level, const std::string& message) override
    {
        syslog(ToPriority(level), "%s", message.c_str());
    }

    void Flush() override {}

private:
    static int ToPriority(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::Trace:
        case LogLevel::Debug:    return LOG_DEBUG;
        case LogLevel::Info:     return LOG_INFO;
        case LogLevel::Warning:  return LOG_WARNING;
        case LogLevel::Error:    return LOG_ERR;
        default:                 return LOG_CRIT;
        }
    }

    // openlog keeps the pointer, the string must outlive the logger
    std::string m_ident;
};

} // namespace

LogManager& LogManager::GetInstance()
{
    static LogManager instance;
    return instance;
}

bool LogManager::Initialize(const LogConfig& config)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_initialized.load())
    {
        return false;
    }

    m_config = config;
    m_currentLevel = config.level;

    bool created = CreateLoggers(config);
    m_initialized = true;
    return created;
}

void LogManager::Log(LogLevel level, const std::string& message,
                     const std::string& function,
                     const std::string& file,
                     int line)
{
    if (!IsEnabled(level))
    {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    // Messages logged before Initialize still reach stderr
    if (m_loggers.empty())
    {
        if (!m_initialized.load())
        {
            std::cerr << FormatMessage(level, message, function, file, line) << '\n';
        }
        return;
    }

    std::string formatted = FormatMessage(level, message, function, file, line);
    for (auto& logger : m_loggers)
    {
        logger->Write(level, formatted);
    }
}

bool LogManager::IsEnabled(LogLevel level) const
{
    LogLevel current = m_currentLevel.load();
    return current != LogLevel::Off && level >= current;
}

void LogManager::SetLogLevel(LogLevel level)
{
    m_currentLevel = level;
}

LogLevel LogManager::GetLogLevel() const
{
    return m_currentLevel.load();
}

void LogManager::SetLogger(std::unique_ptr<Logger> logger)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loggers.clear();
    if (logger)
    {
        m_loggers.push_back(std::move(logger));
    }
}

void LogManager::Flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& logger : m_loggers)
    {
        logger->Flush();
    }
}

bool LogManager::CreateLoggers(const LogConfig& config)
{
    // Called with m_mutex held
    bool ok = true;
    m_loggers.clear();

    if (HasTarget(config.targets, LogTarget::Console))
    {
        m_loggers.push_back(std::make_unique<ConsoleLogger>());
    }

    if (HasTarget(config.targets, LogTarget::File) && !config.logFilePath.empty())
    {
        auto fileLogger = std::make_unique<FileLogger>(config.logFilePath);
        if (fileLogger->IsOpen())
        {
            m_loggers.push_back(std::move(fileLogger));
        }
        else
        {
            std::cerr << "sebridge: cannot open log file " << config.logFilePath << '\n';
            ok = false;
        }
    }

    if (HasTarget(config.targets, LogTarget::Syslog))
    {
        m_loggers.push_back(std::make_unique<SyslogLogger>(config.syslogIdent));
    }

    return ok;
}

std::string LogManager::FormatMessage(LogLevel level, const std::string& message,
                                      const std::string& function,
                                      const std::string& file,
                                      int line) const
{
    std::ostringstream out;

    if (m_config.enableTimestamps)
    {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << millis << "Z ";
    }

    out << '[' << GetLogLevelName(level) << "] ";

    if (m_config.enableProcessId)
    {
        out << "[pid " << ::getpid() << "] ";
    }

    if (m_config.enableThreadId)
    {
        out << "[tid " << std::this_thread::get_id() << "] ";
    }

    if (!function.empty())
    {
        out << function;
        if (!file.empty())
        {
            out << " (" << file << ':' << line << ')';
        }
        out << ": ";
    }

    out << message;
    return out.str();
}

bool ParseLogLevel(const std::string& name, LogLevel& level)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")                           { level = LogLevel::Trace; }
    else if (lower == "debug")                      { level = LogLevel::Debug; }
    else if (lower == "info")                       { level = LogLevel::Info; }
    else if (lower == "warn" || lower == "warning") { level = LogLevel::Warning; }
    else if (lower == "error")                      { level = LogLevel::Error; }
    else if (lower == "critical")                   { level = LogLevel::Critical; }
    else if (lower == "off")                        { level = LogLevel::Off; }
    else
    {
        return false;
    }
    return true;
}

bool InitializeLogging(const LogConfig& config)
{
    return LogManager::GetInstance().Initialize(config);
}

} // namespace se
} // namespace sebridge
