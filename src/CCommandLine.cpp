/*-------------------------------------------------------------------------
 *
 * CCommandLine.cpp
 *		  docbucket command line parsing and command execution
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CCommandLine.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CCommandLine.hpp"

#include <fstream>
#include <iostream>

namespace DocBucket
{

namespace
{

const char* const kCommands[] = {"put", "get", "rm", "ls", "drop",
								 "ensure-indexes"};

bool
knownCommand(const std::string& name)
{
	for (const char* command : kCommands)
	{
		if (name == command)
			return true;
	}
	return false;
}

bool
parseChunkSize(const std::string& text, int32_t& value)
{
	size_t used = 0;
	long long parsed = 0;

	try
	{
		parsed = std::stoll(text, &used);
	}
	catch (const std::exception&)
	{
		return false;
	}
	if (used != text.size() || parsed <= 0 || parsed > INT32_MAX)
		return false;
	value = static_cast<int32_t>(parsed);
	return true;
}

int
reportFailure(std::ostream& err, const std::string& what,
			  const CBucketError& error)
{
	err << "docbucket: " << what << ": " << error.message() << std::endl;
	return 1;
}

/* Basename of a path, used as the default stored filename */
std::string
baseName(const std::string& path)
{
	size_t slash = path.find_last_of('/');
	return slash == std::string::npos ? path : path.substr(slash + 1);
}

int
commandPut(const CCommandLineOptions& options, CBucket& bucket,
		   std::ostream& out, std::ostream& err)
{
	const std::string& path = options.arguments[0];
	CUploadOptions upload;

	upload.chunkSizeBytes = options.chunkSize;
	upload.contentType = options.contentType;
	if (options.metadataJson)
	{
		std::string parseError;
		upload.metadata = CBsonDocument::fromJson(*options.metadataJson, &parseError);
		if (!upload.metadata)
		{
			err << "docbucket: invalid --metadata: " << parseError << std::endl;
			return 2;
		}
	}

	std::string filename = options.name.value_or(path == "-" ? "stdin" : baseName(path));
	std::ifstream file;
	std::istream* input = &std::cin;
	if (path != "-")
	{
		file.open(path, std::ios::binary);
		if (!file)
		{
			err << "docbucket: cannot open " << path << std::endl;
			return 1;
		}
		input = &file;
	}

	auto stored = bucket.uploadFromStream(filename, *input, upload);
	if (!stored)
		return reportFailure(err, "put " + path, stored.error());

	out << stored->toString() << std::endl;
	return 0;
}

int
commandGet(const CCommandLineOptions& options, CBucket& bucket,
		   std::ostream& out, std::ostream& err)
{
	CDocumentId id = CDocumentId::parse(options.arguments[0]);
	std::string target = options.arguments.size() > 1 ? options.arguments[1] : "-";

	/* Resolve the file before touching the output */
	auto stream = bucket.openDownloadStream(id);
	if (!stream)
		return reportFailure(err, "get " + id.toString(), stream.error());

	if (target == "-")
	{
		COstreamSink sink(out);
		auto written = (*stream)->writeTo(sink);
		if (!written)
			return reportFailure(err, "get " + id.toString(), written.error());
		if (!out.flush())
		{
			err << "docbucket: cannot write standard output" << std::endl;
			return 1;
		}
		return 0;
	}

	std::ofstream output(target, std::ios::binary | std::ios::trunc);
	if (!output)
	{
		err << "docbucket: cannot create " << target << std::endl;
		return 1;
	}

	COstreamSink sink(output);
	auto written = (*stream)->writeTo(sink);
	if (!written)
		return reportFailure(err, "get " + id.toString(), written.error());

	output.close();
	if (!output)
	{
		err << "docbucket: cannot write " << target << std::endl;
		return 1;
	}
	return 0;
}

int
commandRm(const CCommandLineOptions& options, CBucket& bucket,
		  std::ostream& /* out */, std::ostream& err)
{
	CDocumentId id = CDocumentId::parse(options.arguments[0]);

	auto deleted = bucket.deleteFile(id);
	if (!deleted)
		return reportFailure(err, "rm " + id.toString(), deleted.error());
	return 0;
}

int
commandLs(const CCommandLineOptions& options, CBucket& bucket,
		  std::ostream& out, std::ostream& err)
{
	CBsonDocument filter;
	CFindOptions findOptions;

	if (!options.arguments.empty())
	{
		std::string parseError;
		auto parsed = CBsonDocument::fromJson(options.arguments[0], &parseError);
		if (!parsed)
		{
			err << "docbucket: invalid filter: " << parseError << std::endl;
			return 2;
		}
		filter = std::move(*parsed);
	}
	findOptions.sort.appendInt32("uploadDate", 1);

	auto cursor = bucket.find(filter, findOptions);
	if (!cursor)
		return reportFailure(err, "ls", cursor.error());

	while (true)
	{
		auto file = cursor->next();
		if (!file)
			return reportFailure(err, "ls", file.error());
		if (!*file)
			break;

		out << (*file)->id.toString() << '\t' << (*file)->length << '\t'
			<< (*file)->uploadDate << '\t' << (*file)->md5.value_or("-") << '\t'
			<< (*file)->filename << '\n';
	}
	out.flush();
	return 0;
}

int
commandDrop(CBucket& bucket, std::ostream& err)
{
	auto dropped = bucket.drop();
	if (!dropped)
		return reportFailure(err, "drop", dropped.error());
	return 0;
}

int
commandEnsureIndexes(CBucket& bucket, std::ostream& err)
{
	auto ensured = bucket.ensureIndexes();
	if (!ensured)
		return reportFailure(err, "ensure-indexes", ensured.error());
	return 0;
}

} /* anonymous namespace */

bool
parseCommandLine(int argc, const char* const* argv,
				 CCommandLineOptions& options, std::string& error)
{
	std::string arg;

	options = CCommandLineOptions();
	for (int i = 1; i < argc; ++i)
	{
		arg = argv[i];
		bool hasValue = i + 1 < argc;

		if (arg == "-h" || arg == "--help")
		{
			options.action = CCliAction::Help;
			return true;
		}
		else if (arg == "--version")
		{
			options.action = CCliAction::Version;
			return true;
		}
		else if (arg == "-v" || arg == "--verbose")
		{
			options.verbose = true;
		}
		else if ((arg == "-c" || arg == "--config") && hasValue)
		{
			options.configFile = argv[++i];
		}
		else if (arg == "--name" && hasValue)
		{
			options.name = std::string(argv[++i]);
		}
		else if (arg == "--chunk-size" && hasValue)
		{
			int32_t value = 0;
			if (!parseChunkSize(argv[++i], value))
			{
				error = "--chunk-size needs a positive integer, got " +
						std::string(argv[i]);
				return false;
			}
			options.chunkSize = value;
		}
		else if (arg == "--metadata" && hasValue)
		{
			options.metadataJson = std::string(argv[++i]);
		}
		else if (arg == "--content-type" && hasValue)
		{
			options.contentType = std::string(argv[++i]);
		}
		else if (arg.size() > 1 && arg[0] == '-')
		{
			error = "unknown or incomplete option: " + arg;
			return false;
		}
		else if (options.command.empty())
		{
			options.command = arg;
		}
		else
		{
			options.arguments.push_back(arg);
		}
	}

	if (options.command.empty())
	{
		error = "no command given";
		return false;
	}
	if (!knownCommand(options.command))
	{
		error = "unknown command: " + options.command;
		return false;
	}

	size_t required = 0;
	size_t allowed = 0;
	if (options.command == "put" || options.command == "rm")
		required = allowed = 1;
	else if (options.command == "get")
	{
		required = 1;
		allowed = 2;
	}
	else if (options.command == "ls")
		allowed = 1;

	if (options.arguments.size() < required || options.arguments.size() > allowed)
	{
		error = "wrong number of arguments for " + options.command;
		return false;
	}

	bool putOnly = options.name || options.chunkSize || options.metadataJson ||
				   options.contentType;
	if (putOnly && options.command != "put")
	{
		error = "--name, --chunk-size, --metadata and --content-type apply to put only";
		return false;
	}
	return true;
}

void
printUsage(std::ostream& out, const std::string& program)
{
	out << "DocBucket - chunked binary object storage over document collections\n";
	out << "Usage: " << program << " [OPTIONS] <command> [ARGS]\n\n";
	out << "Options:\n";
	out << "  -c, --config <file>    Configuration file "
		   "(supports .conf, .ini, .json, .yaml, .yml)\n";
	out << "  -v, --verbose          Log at DEBUG level\n";
	out << "  -h, --help             Show this help message\n";
	out << "      --version          Show version information\n\n";
	out << "Commands:\n";
	out << "  put <path|-> [--name N] [--chunk-size N] [--metadata JSON]\n";
	out << "                         [--content-type T]  Store a file, print its id\n";
	out << "  get <id> [output|-]    Write a stored file to output or stdout\n";
	out << "  rm <id>                Delete a stored file and its chunks\n";
	out << "  ls [filter-json]       List stored files\n";
	out << "  drop                   Remove the whole bucket\n";
	out << "  ensure-indexes         Create the bucket indexes\n\n";
	out << "Ids of 24 hex digits are read as ObjectIds, anything else as a string.\n";
}

int
runCommand(const CCommandLineOptions& options, CBucket& bucket,
		   std::ostream& out, std::ostream& err)
{
	if (options.command == "put")
		return commandPut(options, bucket, out, err);
	if (options.command == "get")
		return commandGet(options, bucket, out, err);
	if (options.command == "rm")
		return commandRm(options, bucket, out, err);
	if (options.command == "ls")
		return commandLs(options, bucket, out, err);
	if (options.command == "drop")
		return commandDrop(bucket, err);
	if (options.command == "ensure-indexes")
		return commandEnsureIndexes(bucket, err);

	err << "docbucket: unknown command: " << options.command << std::endl;
	return 2;
}

} /* namespace DocBucket */
