/*-------------------------------------------------------------------------
 *
 * main.cpp
 *		  Main entry point for the docbucket command line tool
 *
 * Loads the configuration, connects the configured backend and runs one
 * bucket command.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/main.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CBucketConfig.hpp"
#include "CCommandLine.hpp"
#include "CConfig.hpp"
#include "CLogger.hpp"
#include "bucket/CBucket.hpp"
#include "database/CDatabaseFactory.hpp"

#include <iostream>
#include <string>

using namespace DocBucket;

#define DOCBUCKET_VERSION "1.0.0"

int
main(int argc, char **argv)
{
	CCommandLineOptions			options;
	std::string					error;
	DocBucket::CConfig			loader;
	CBucketConfig				config;
	std::error_code				err;
	std::shared_ptr<CLogger>	loggerPtr;

	if (!parseCommandLine(argc, argv, options, error))
	{
		std::cerr << "docbucket: " << error << std::endl;
		std::cerr << "Use --help for usage information.\n";
		return 2;
	}

	if (options.action == CCliAction::Help)
	{
		printUsage(std::cout, argv[0]);
		return 0;
	}
	if (options.action == CCliAction::Version)
	{
		std::cout << "docbucket version " DOCBUCKET_VERSION "\n";
		std::cout << "Chunked binary object storage\n";
		return 0;
	}

	try
	{
		config.setDefaults();
		loggerPtr = std::make_shared<CLogger>(config);
		loader.setLogger(loggerPtr);

		if (!options.configFile.empty())
		{
			err = loader.loadFromFile(options.configFile);
			if (err)
			{
				std::cerr << "Failed to load config file: " << options.configFile
						  << ", error=" << err.message() << std::endl;
				return 1;
			}

			err = config.loadFromConfig(loader);
			if (err)
			{
				std::cerr << "Invalid configuration in " << options.configFile
						  << ": " << err.message() << std::endl;
				return 1;
			}
		}
		if (options.verbose)
			config.logLevel = "DEBUG";

		loggerPtr->setLogLevel(CLogger::parseLogLevel(config.logLevel));
		loggerPtr->enableConsoleOutput(config.logToConsole);
		loggerPtr->setLogFile(config.logFile);
		err = loggerPtr->initialize();
		if (err)
		{
			std::cerr << "Failed to open log file " << config.logFile << ": "
					  << err.message() << std::endl;
			return 1;
		}

		std::shared_ptr<IDatabase> database =
			CDatabaseFactory::create(config, loggerPtr);
		auto connected = database->connect();
		if (!connected)
		{
			loggerPtr->log(CLogLevel::ERROR,
						   "Unable to connect to " + database->getConnectionInfo() +
						   ": " + connected.error().message);
			return 1;
		}

		CBucketOptions bucketOptions;
		bucketOptions.bucketName = config.bucketName;
		bucketOptions.chunkSizeBytes = config.chunkSizeBytes;
		bucketOptions.disableMD5 = config.disableMD5;
		bucketOptions.collectionOptions = CDatabaseFactory::collectionOptions(config);

		CBucket bucket(database, bucketOptions, loggerPtr);
		loggerPtr->log(CLogLevel::DEBUG,
					   "running " + options.command + " on bucket " +
					   config.bucketName + " (" + backendTypeName(config.backend) +
					   ")");

		int status = runCommand(options, bucket, std::cout, std::cerr);

		database->disconnect();
		loggerPtr->shutdown();
		return status;
	}
	catch (const std::exception& e)
	{
		std::cerr << "Fatal error: " << e.what() << std::endl;
		return 1;
	}
}
