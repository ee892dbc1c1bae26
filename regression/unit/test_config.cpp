/*-------------------------------------------------------------------------
 *
 * test_config.cpp
 *      Configuration loading, bucket settings and the file logger.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CBucketConfig.hpp"
#include "CConfig.hpp"
#include "CLogger.hpp"
#include "database/CDatabaseFactory.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace DocBucket
{
namespace Regression
{

class ConfigTest : public ::testing::Test
{
  protected:
    std::filesystem::path directory;

    void SetUp() override
    {
        directory = std::filesystem::temp_directory_path() /
                    ("docbucket_config_" + std::to_string(getpid()) + "_" +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(directory);
    }

    void TearDown() override
    {
        std::error_code ignored;
        std::filesystem::remove_all(directory, ignored);
    }

    std::string writeFile(const std::string& name, const std::string& content)
    {
        std::filesystem::path path = directory / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
};

TEST_F(ConfigTest, JsonIsFlattenedToDottedKeys)
{
    CConfig loader;

    ASSERT_FALSE(loader.loadFromJson(R"({"bucket": {"name": "photos", "chunk_size": 1024},
                                         "backend": {"type": "postgresql"}})"));
    ASSERT_TRUE(loader.has("bucket.name"));
    EXPECT_EQ(std::get<std::string>(*loader.get("bucket.name")), "photos");
    EXPECT_EQ(std::get<int>(*loader.get("bucket.chunk_size")), 1024);
    EXPECT_FALSE(loader.has("bucket"));

    auto entry = loader.getEntry("bucket.name");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->source, ConfigSource::FILE);

    loader.set("bucket.name", std::string("override"));
    EXPECT_EQ(loader.getEntry("bucket.name")->source, ConfigSource::RUNTIME);
    EXPECT_EQ(std::get<std::string>(*loader.get("bucket.name")), "override");
}

TEST_F(ConfigTest, YamlScalarsKeepTheirTypes)
{
    CConfig loader;

    ASSERT_FALSE(loader.loadFromYaml("bucket:\n"
                                     "  disable_md5: true\n"
                                     "  chunk_size: 4096\n"
                                     "mongodb:\n"
                                     "  uri: mongodb://db:27017\n"));
    EXPECT_EQ(std::get<bool>(*loader.get("bucket.disable_md5")), true);
    EXPECT_EQ(std::get<int>(*loader.get("bucket.chunk_size")), 4096);
    EXPECT_EQ(std::get<std::string>(*loader.get("mongodb.uri")), "mongodb://db:27017");
}

TEST_F(ConfigTest, IniSectionsPrefixKeys)
{
    CConfig loader;

    ASSERT_FALSE(loader.loadFromIni("; comment\n"
                                    "[postgresql]\n"
                                    "host = pg.internal\n"
                                    "port=6432\n"));
    ASSERT_TRUE(loader.has("postgresql.host"));
    EXPECT_EQ(std::get<std::string>(*loader.get("postgresql.host")), "pg.internal");
    EXPECT_TRUE(loader.has("postgresql.port"));
}

TEST_F(ConfigTest, MalformedContentIsRejected)
{
    CConfig loader;

    EXPECT_TRUE(loader.loadFromJson("{\"bucket\": "));
    EXPECT_TRUE(loader.loadFromJson(""));
    EXPECT_TRUE(loader.loadFromYaml("key: [unclosed"));
}

TEST_F(ConfigTest, FileExtensionSelectsTheFormat)
{
    CConfig loader;

    std::string yaml = writeFile("settings.yaml", "logging:\n  level: debug\n");
    ASSERT_FALSE(loader.loadFromFile(yaml));
    EXPECT_EQ(std::get<std::string>(*loader.get("logging.level")), "debug");

    EXPECT_EQ(loader.loadFromFile((directory / "absent.json").string()),
              std::make_error_code(std::errc::no_such_file_or_directory));
    EXPECT_TRUE(loader.loadFromFile(writeFile("settings.txt", "x")));
}

TEST_F(ConfigTest, BucketConfigReadsEverySection)
{
    CConfig loader;
    CBucketConfig config;

    ASSERT_FALSE(loader.loadFromJson(R"({
        "bucket": {"name": "media", "chunk_size": 65536, "disable_md5": true},
        "backend": {"type": "mongo"},
        "postgresql": {"host": "pg", "port": 6432, "timeout": 5},
        "mongodb": {"uri": "mongodb://m:1", "database": "files",
                    "read_preference": "secondaryPreferred",
                    "write_concern_w": 2, "max_time_ms": 1500},
        "logging": {"level": "warn", "file": "/tmp/docbucket.log", "console": false}
    })"));
    ASSERT_FALSE(config.loadFromConfig(loader));

    EXPECT_EQ(config.bucketName, "media");
    EXPECT_EQ(config.chunkSizeBytes, 65536);
    EXPECT_TRUE(config.disableMD5);
    EXPECT_EQ(config.backend, CBackendType::MongoDB);
    EXPECT_EQ(config.pgHost, "pg");
    EXPECT_EQ(config.pgPort, "6432");
    EXPECT_EQ(config.pgTimeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.mongoUri, "mongodb://m:1");
    EXPECT_EQ(config.mongoDatabase, "files");
    EXPECT_EQ(config.mongoReadPreference, "secondaryPreferred");
    EXPECT_EQ(config.mongoWriteConcernW, 2);
    EXPECT_EQ(config.mongoMaxTimeMS, 1500);
    EXPECT_EQ(config.logLevel, "warn");
    EXPECT_EQ(config.logFile, "/tmp/docbucket.log");
    EXPECT_FALSE(config.logToConsole);

    CCollectionOptions options = CDatabaseFactory::collectionOptions(config);
    EXPECT_EQ(options.readPreference, "secondaryPreferred");
    EXPECT_EQ(options.writeConcernW, 2);
    EXPECT_EQ(options.maxTimeMS, 1500);
}

TEST_F(ConfigTest, MissingKeysKeepDefaults)
{
    CConfig loader;
    CBucketConfig config;

    ASSERT_FALSE(loader.loadFromJson(R"({"bucket": {"name": "only"}})"));
    ASSERT_FALSE(config.loadFromConfig(loader));
    EXPECT_EQ(config.bucketName, "only");
    EXPECT_EQ(config.chunkSizeBytes, 255 * 1024);
    EXPECT_EQ(config.backend, CBackendType::Memory);
    EXPECT_EQ(config.pgTimeout, std::chrono::milliseconds(30000));
}

TEST_F(ConfigTest, InvalidSettingsAreRejected)
{
    CConfig badBackend;
    CBucketConfig config;
    ASSERT_FALSE(badBackend.loadFromJson(R"({"backend": {"type": "sqlite"}})"));
    EXPECT_EQ(config.loadFromConfig(badBackend),
              std::make_error_code(std::errc::invalid_argument));

    CConfig badChunk;
    CBucketConfig other;
    ASSERT_FALSE(badChunk.loadFromJson(R"({"bucket": {"chunk_size": 0}})"));
    EXPECT_TRUE(other.loadFromConfig(badChunk));
}

TEST_F(ConfigTest, BackendNamesParse)
{
    CBackendType type = CBackendType::Memory;

    EXPECT_TRUE(parseBackendType("PG", type));
    EXPECT_EQ(type, CBackendType::PostgreSQL);
    EXPECT_TRUE(parseBackendType("MongoDB", type));
    EXPECT_EQ(type, CBackendType::MongoDB);
    EXPECT_FALSE(parseBackendType("redis", type));
    EXPECT_EQ(backendTypeName(CBackendType::PostgreSQL), "postgresql");
}

TEST_F(ConfigTest, LoggerWritesAtOrAboveItsLevel)
{
    CBucketConfig config;
    config.logFile = (directory / "docbucket.log").string();
    config.logToConsole = false;
    config.logLevel = "INFO";

    CLogger logger(config);
    ASSERT_FALSE(logger.initialize());
    logger.log(CLogLevel::DEBUG, "hidden detail");
    logger.log(CLogLevel::WARN, "visible warning");
    logger.shutdown();

    std::ifstream in(config.logFile);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str().find("hidden detail"), std::string::npos);
    EXPECT_NE(content.str().find("WARN docbucket: visible warning"), std::string::npos);
}

TEST_F(ConfigTest, LogLevelNamesParse)
{
    EXPECT_EQ(CLogger::parseLogLevel("debug"), CLogLevel::DEBUG);
    EXPECT_EQ(CLogger::parseLogLevel("Warning"), CLogLevel::WARN);
    EXPECT_EQ(CLogger::parseLogLevel("nonsense", CLogLevel::ERROR), CLogLevel::ERROR);
    EXPECT_STREQ(logLevelName(CLogLevel::WARN), "WARN");

    CBucketConfig config;
    config.logToConsole = false;
    config.logLevel = "warn";
    CLogger logger(config);
    EXPECT_FALSE(logger.isEnabled(CLogLevel::DEBUG));
    EXPECT_TRUE(logger.isEnabled(CLogLevel::ERROR));
}

} /* namespace Regression */
} /* namespace DocBucket */
