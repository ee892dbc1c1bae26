/*-------------------------------------------------------------------------
 *
 * CCommandLine.hpp
 *      docbucket command line parsing and command execution.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CTypes.hpp"
#include "bucket/CBucket.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace DocBucket
{

enum class CCliAction : uint8_t
{
	Run = 0,
	Help = 1,
	Version = 2
};

struct CCommandLineOptions
{
	CCliAction action;
	std::string configFile;
	bool verbose;

	std::string command;
	StringVector arguments;

	/* put */
	std::optional<std::string> name;
	std::optional<int32_t> chunkSize;
	std::optional<std::string> metadataJson;
	std::optional<std::string> contentType;

	CCommandLineOptions() : action(CCliAction::Run), verbose(false)
	{
	}
};

/* False with a message in error when argv is not understood */
bool parseCommandLine(int argc, const char* const* argv,
					  CCommandLineOptions& options, std::string& error);

void printUsage(std::ostream& out, const std::string& program);

/*
 * Executes options.command against bucket.  Data goes to out, diagnostics
 * to err; returns the process exit status.
 */
int runCommand(const CCommandLineOptions& options, CBucket& bucket,
			   std::ostream& out, std::ostream& err);

} /* namespace DocBucket */
