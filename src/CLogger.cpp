/*-------------------------------------------------------------------------
 *
 * CLogger.cpp
 *		  Logging system implementation for DocBucket
 *
 * Writes formatted messages to the console and, optionally, to an
 * append-mode log file.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CLogger.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CLogger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace DocBucket
{

/*
 * CLogger constructor
 *		Initialize logger with configuration
 */
CLogger::CLogger(const CBucketConfig& config)
    : component_(config.componentName), logFile_(config.logFile),
      consoleOutput_(config.logToConsole), fileOutput_(!config.logFile.empty()),
      colorOutput_(isatty(STDERR_FILENO) != 0),
      timestampFormat_("%Y-%m-%d %H:%M:%S"),
      logLevel_(parseLogLevel(config.logLevel)), initialized_(false)
{
}

/*
 * CLogger destructor
 *		Clean up open file streams
 */
CLogger::~CLogger()
{
    if (fileStream_ && fileStream_->is_open())
        fileStream_->close();
}

/*
 * log
 *		Main logging function - write message if level is sufficient
 */
void CLogger::log(CLogLevel level, const std::string& message)
{
    if (!shouldLog(level))
        return;

    std::lock_guard<std::mutex> lock(logMutex_);

    if (consoleOutput_)
        writeToConsole(formatMessage(level, message, colorOutput_));

    if (fileOutput_ && fileStream_ && fileStream_->is_open())
        writeToFile(formatMessage(level, message, false));
}

/*
 * setLogLevel
 *		Set minimum log level for output
 */
void CLogger::setLogLevel(CLogLevel level)
{
    logLevel_ = level;
}

/*
 * getLogLevel
 *		Return current log level
 */
CLogLevel CLogger::getLogLevel() const noexcept
{
    return logLevel_;
}

/*
 * initialize
 *		Open the log file and prepare logger for use
 */
std::error_code CLogger::initialize()
{
    if (initialized_)
        return std::error_code();

    if (fileOutput_ && !logFile_.empty())
    {
        fileStream_ = std::make_unique<std::ofstream>(logFile_, std::ios::app);
        if (!fileStream_->is_open())
            return std::make_error_code(std::errc::io_error);
    }

    initialized_ = true;
    return std::error_code();
}

/*
 * shutdown
 *		Close file streams and clean up resources
 */
void CLogger::shutdown() noexcept
{
    if (fileStream_ && fileStream_->is_open())
        fileStream_->close();
    initialized_ = false;
}

/*
 * setLogFile
 *		Set main log file path, takes effect on the next initialize()
 */
void CLogger::setLogFile(const std::string& filename)
{
    logFile_ = filename;
    fileOutput_ = !filename.empty();
}

/*
 * enableConsoleOutput
 *		Enable or disable console output
 */
void CLogger::enableConsoleOutput(bool enable)
{
    consoleOutput_ = enable;
}

/*
 * parseLogLevel
 *		Map a configured level name onto CLogLevel
 */
CLogLevel CLogger::parseLogLevel(const std::string& name,
                                 CLogLevel defaultLevel)
{
    std::string upper = name;

    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "TRACE")
        return CLogLevel::TRACE;
    if (upper == "DEBUG")
        return CLogLevel::DEBUG;
    if (upper == "INFO")
        return CLogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return CLogLevel::WARN;
    if (upper == "ERROR")
        return CLogLevel::ERROR;
    if (upper == "FATAL")
        return CLogLevel::FATAL;
    return defaultLevel;
}

/*
 * writeToConsole
 *		Write formatted message to console
 */
void CLogger::writeToConsole(const std::string& message)
{
    std::cerr << message << std::endl;
}

/*
 * writeToFile
 *		Write formatted message to log file
 */
void CLogger::writeToFile(const std::string& message)
{
    *fileStream_ << message << std::endl;
    fileStream_->flush();
}

/*
 * formatMessage
 *		Format log message with timestamp, level, and metadata
 */
std::string CLogger::formatMessage(CLogLevel level, const std::string& message,
                                   bool withColor) const
{
    std::stringstream ss;
    int pid = static_cast<int>(getpid());
    const char* user = getenv("USER");
    std::string username = user ? user : "unknown";
    std::string component = component_.empty() ? "docbucket" : component_;

    /* ANSI color codes */
    const char* green = "\033[32m";
    const char* red = "\033[31m";
    const char* yellow = "\033[33m";
    const char* blue = "\033[34m";
    const char* reset = "\033[0m";

    std::string symbol;
    const char* color = reset;

    if (level == CLogLevel::ERROR || level == CLogLevel::FATAL)
    {
        symbol = "\u2717"; /* ✗ */
        color = red;
    }
    else if (level == CLogLevel::WARN)
    {
        symbol = "!";
        color = yellow;
    }
    else if (level == CLogLevel::INFO)
    {
        symbol = "\u2713"; /* ✓ */
        color = green;
    }
    else
    {
        symbol = "\u2139"; /* ℹ */
        color = blue;
    }

    if (withColor)
        ss << color;
    ss << symbol << " - " << pid << "  " << username << " " << getTimestamp()
       << " " << getLevelString(level) << " ";

    /* Only add component if not already present at start of message */
    if (message.rfind(component + ": ", 0) != 0)
        ss << component << ": ";
    ss << message;
    if (withColor)
        ss << reset;
    return ss.str();
}

/*
 * getLevelString
 *		Convert log level enum to string representation
 */
std::string CLogger::getLevelString(CLogLevel level) const
{
    return logLevelName(level);
}

/*
 * getTimestamp
 *		Generate formatted timestamp string
 */
std::string CLogger::getTimestamp() const
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    std::stringstream ss;

    localtime_r(&time_t, &tm);
    ss << std::put_time(&tm, timestampFormat_.c_str());
    return ss.str();
}

/*
 * shouldLog
 *		Check if message should be logged based on level
 */
bool CLogger::shouldLog(CLogLevel level) const noexcept
{
    return isEnabled(level);
}

} /* namespace DocBucket */
