/*-------------------------------------------------------------------------
 *
 * CLogger.hpp
 *      Logging system implementation for DocBucket.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once
#include "CBucketConfig.hpp"
#include "IInterfaces.hpp"

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace DocBucket
{

class CLogger : public ILogger
{
  public:
    explicit CLogger(const CBucketConfig& config);
    virtual ~CLogger();
    void log(CLogLevel level, const std::string& message) override;
    void setLogLevel(CLogLevel level) override;
    CLogLevel getLogLevel() const noexcept override;
    std::error_code initialize() override;
    void shutdown() noexcept override;
    void setLogFile(const std::string& filename);
    void enableConsoleOutput(bool enable);

    static CLogLevel parseLogLevel(const std::string& name,
                                   CLogLevel defaultLevel = CLogLevel::INFO);

  private:
    std::string component_;
    std::string logFile_;
    bool consoleOutput_;
    bool fileOutput_;
    bool colorOutput_;
    std::string timestampFormat_;
    std::atomic<CLogLevel> logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
    std::mutex logMutex_;
    std::atomic<bool> initialized_;
    void writeToConsole(const std::string& message);
    void writeToFile(const std::string& message);
    std::string formatMessage(CLogLevel level, const std::string& message,
                              bool withColor) const;
    std::string getLevelString(CLogLevel level) const;
    std::string getTimestamp() const;
    bool shouldLog(CLogLevel level) const noexcept;
};

} /* namespace DocBucket */
