/*-------------------------------------------------------------------------
 *
 * main.cpp
 *		  Main entry point for the bsonwalk tool
 *
 * Parses options, loads configuration, installs the logger and runs one
 * command over a file of BSON documents.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/main.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CConfig.hpp"
#include "CLogRegistry.hpp"
#include "CLogger.hpp"
#include "CWalkConfig.hpp"
#include "CWalkTool.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace BsonWalk;

static void
usage(const char *progname)
{
	std::cout << "bsonwalk - BSON document inspection tool\n";
	std::cout << "Usage: " << progname << " [OPTIONS] <command> <file> [ARGS]\n\n";
	std::cout << "Commands:\n";
	std::cout << "  dump <file>                        Print each document as extended JSON\n";
	std::cout << "  keys <file>                        Print the top level keys of each document\n";
	std::cout << "  get <file> <key>                   Print the first value named key\n";
	std::cout << "  slice <file> <start> <end> <out>   Write elements [start, end) to out\n";
	std::cout << "                                     (end may be \"end\")\n";
	std::cout << "  set <file> <key> <value>           Overwrite an int32, int64, double,\n";
	std::cout << "                                     bool or date value in place\n\n";
	std::cout << "Options:\n";
	std::cout << "  -c, --config <file>    Configuration file "
				 "(supports .conf, .ini, .json, .yaml, .yml)\n";
	std::cout << "  -h, --help             Show this help message\n";
	std::cout << "  -v, --version          Show version information\n";
}

static int
runCommand(CWalkTool& tool, const std::vector<std::string>& args)
{
	const std::string& command = args[0];
	size_t		nargs = args.size() - 1;

	if (command == "dump" && nargs == 1)
		return tool.dump(args[1]);
	if (command == "keys" && nargs == 1)
		return tool.keys(args[1]);
	if (command == "get" && nargs == 2)
		return tool.get(args[1], args[2]);
	if (command == "slice" && nargs == 4)
		return tool.slice(args[1], args[2], args[3], args[4]);
	if (command == "set" && nargs == 3)
		return tool.set(args[1], args[2], args[3]);

	std::cerr << "Unknown command or wrong arguments: " << command << std::endl;
	std::cerr << "Use --help for usage information.\n";
	return 2;
}

int
main(int argc, char **argv)
{
	CConfig		loader;
	CWalkConfig config;
	std::string configFile;
	std::vector<std::string> args;
	std::string arg;
	std::error_code err;
	std::shared_ptr<CLogger> loggerPtr;
	int			rc;

	for (int i = 1; i < argc; ++i)
	{
		arg = argv[i];

		if (!args.empty())
		{
			args.push_back(arg);
		}
		else if (arg == "-h" || arg == "--help")
		{
			usage(argv[0]);
			return 0;
		}
		else if (arg == "-v" || arg == "--version")
		{
			std::cout << "bsonwalk version 1.0.0\n";
			return 0;
		}
		else if ((arg == "-c" || arg == "--config") && i + 1 < argc)
		{
			configFile = argv[i + 1];
			++i;
		}
		else if (!arg.empty() && arg[0] == '-')
		{
			std::cerr << "Unknown option: " << arg << std::endl;
			std::cerr << "Use --help for usage information.\n";
			return 2;
		}
		else
		{
			args.push_back(arg);
		}
	}

	if (args.empty())
	{
		usage(argv[0]);
		return 2;
	}

	config.setDefaults();
	if (!configFile.empty())
	{
		config.configFile = configFile;
		err = loader.loadFromFile(configFile);
		if (err)
		{
			std::cerr << "Failed to load config file: " << configFile
					  << ", error=" << err.message() << std::endl;
			return 1;
		}
		err = config.loadFromConfig(loader);
		if (err)
		{
			std::cerr << "Invalid configuration in " << configFile
					  << ": " << err.message() << std::endl;
			return 1;
		}
	}

	loggerPtr = std::make_shared<CLogger>(config);
	err = loggerPtr->initialize();
	if (err)
	{
		std::cerr << "Failed to open log file " << config.logFile << ": "
				  << err.message() << std::endl;
		return 1;
	}
	CLogRegistry::set(loggerPtr);

	CWalkTool	tool(config, std::cout, std::cerr);
	rc = runCommand(tool, args);

	CLogRegistry::reset();
	loggerPtr->shutdown();
	return rc;
}
