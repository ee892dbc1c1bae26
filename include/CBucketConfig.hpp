/*-------------------------------------------------------------------------
 *
 * CBucketConfig.hpp
 *      Bucket, backend and logging configuration for DocBucket.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>

namespace DocBucket
{

class CConfig;

enum class CBackendType : uint8_t
{
    Memory = 0,
    PostgreSQL = 1,
    MongoDB = 2
};

struct CBucketConfig
{
    std::string componentName;

    /* bucket */
    std::string bucketName;
    int32_t chunkSizeBytes;
    bool disableMD5;

    /* backend */
    CBackendType backend;

    std::string pgHost;
    std::string pgPort;
    std::string pgDatabase;
    std::string pgUser;
    std::string pgPassword;
    std::chrono::milliseconds pgTimeout;

    std::string mongoUri;
    std::string mongoDatabase;
    std::string mongoReadPreference;
    int32_t mongoWriteConcernW;
    int64_t mongoMaxTimeMS;

    /* logging */
    std::string logLevel;
    std::string logFile;
    bool logToConsole;

    CBucketConfig()
        : componentName("docbucket"), bucketName("fs"),
          chunkSizeBytes(255 * 1024), disableMD5(false),
          backend(CBackendType::Memory), pgHost("localhost"), pgPort("5432"),
          pgDatabase("docbucket"), pgUser("docbucket"), pgPassword(""),
          pgTimeout(30000), mongoUri("mongodb://localhost:27017"),
          mongoDatabase("docbucket"), mongoReadPreference("primary"),
          mongoWriteConcernW(1), mongoMaxTimeMS(0), logLevel("INFO"),
          logFile(""), logToConsole(true)
    {
    }

    void setDefaults();
    std::error_code loadFromConfig(const CConfig& loader);
    bool validate() const;
};

std::string backendTypeName(CBackendType type);
bool parseBackendType(const std::string& name, CBackendType& type);

} /* namespace DocBucket */
