/*-------------------------------------------------------------------------
 *
 * CLogMacros.hpp
 *      Logging macros for components holding a logger_ member
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "IInterfaces.hpp"

/* logger_ may be null; the message is only built when it will be written */
#define DOCBUCKET_LOG(loglevel, ...)                                           \
    do                                                                         \
    {                                                                          \
        if (logger_ && logger_->isEnabled(loglevel))                           \
            logger_->log((loglevel), __VA_ARGS__);                             \
    } while (0)

/* Per-chunk traffic */
#define trace_log(...) DOCBUCKET_LOG(CLogLevel::TRACE, __VA_ARGS__)
#define debug_log(...) DOCBUCKET_LOG(CLogLevel::DEBUG, __VA_ARGS__)
#define info_log(...) DOCBUCKET_LOG(CLogLevel::INFO, __VA_ARGS__)
#define warn_log(...) DOCBUCKET_LOG(CLogLevel::WARN, __VA_ARGS__)
#define error_log(...) DOCBUCKET_LOG(CLogLevel::ERROR, __VA_ARGS__)
