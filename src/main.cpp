// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

/**
 * @file main.cpp
 * @brief Book server command-line entry point
 *
 * Parses the command line, loads configuration and runs one book
 * operation against the configured database.
 */

#include <kcenon/book_server/core/error_codes.h>
#include <kcenon/book_server/model/book.h>
#include <kcenon/book_server/server_app.h>
#include <kcenon/book_server/service/book_service.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_CONFIG = "book_server.conf";

void print_usage(const char* program_name)
{
	std::cout << "Book Server v" << VERSION << "\n\n";
	std::cout << "Usage: " << program_name << " [options] <command> [arguments]\n\n";
	std::cout << "Options:\n";
	std::cout << "  -c, --config <file>  Path to configuration file (default: " << DEFAULT_CONFIG
			  << ")\n";
	std::cout << "  -h, --help           Show this help message\n";
	std::cout << "  -v, --version        Show version information\n";
	std::cout << "\n";
	std::cout << "Commands:\n";
	std::cout << "  init\n";
	std::cout << "  create --title <t> --author <a> --price <p> [--publication <p>]\n";
	std::cout << "  get <uid>\n";
	std::cout << "  list [--skip <n>] [--limit <n>]\n";
	std::cout << "  update <uid> [--title <t>] [--author <a>] [--price <p>]\n";
	std::cout << "               [--publication <p> | --clear-publication]\n";
	std::cout << "  delete <uid>\n";
	std::cout << "\n";
	std::cout << "Configuration file format (key=value):\n";
	std::cout << "  database.url=sqlite:///books.db\n";
	std::cout << "  database.pool_size=5\n";
	std::cout << "  logging.level=info\n";
	std::cout << "\n";
	std::cout << "Environment overrides: DATABASE_URL, DB_POOL_SIZE, DB_MAX_OVERFLOW, DB_ECHO, "
				 "LOG_LEVEL\n";
}

void print_version()
{
	std::cout << "Book Server v" << VERSION << "\n";
	std::cout << "Part of the kcenon unified system\n";
}

std::optional<double> parse_price(const std::string& text)
{
	if (text.empty())
	{
		return std::nullopt;
	}
	errno = 0;
	char* end = nullptr;
	double value = std::strtod(text.c_str(), &end);
	if (errno != 0 || end != text.c_str() + text.size())
	{
		return std::nullopt;
	}
	return value;
}

std::optional<int64_t> parse_integer(const std::string& text)
{
	if (text.empty())
	{
		return std::nullopt;
	}
	errno = 0;
	char* end = nullptr;
	long long value = std::strtoll(text.c_str(), &end, 10);
	if (errno != 0 || end != text.c_str() + text.size())
	{
		return std::nullopt;
	}
	return static_cast<int64_t>(value);
}

std::string format_book(const book_server::model::book& record)
{
	std::ostringstream oss;
	oss << record.uid << " | " << record.title << " | " << record.author << " | "
		<< record.publication.value_or("-") << " | " << std::fixed << std::setprecision(2)
		<< record.price << " | " << book_server::model::to_iso8601(record.created_at) << " | "
		<< book_server::model::to_iso8601(record.updated_at);
	return oss.str();
}

int report_error(const kcenon::common::error_info& error)
{
	std::cerr << book_server::to_string(book_server::get_error_kind(error)) << ": "
			  << error.message << "\n";
	return 1;
}

int usage_error(const std::string& message)
{
	std::cerr << message << "\n";
	std::cerr << "Use --help for usage information.\n";
	return 2;
}

/**
 * Field options shared by create and update. Returns an error message, or
 * an empty string once every argument is consumed.
 */
std::string parse_fields(const std::vector<std::string>& args,
						 size_t first,
						 std::optional<std::string>& title,
						 std::optional<std::string>& author,
						 std::optional<std::optional<std::string>>& publication,
						 std::optional<double>& price)
{
	for (size_t i = first; i < args.size(); ++i)
	{
		const auto& arg = args[i];
		if (arg == "--clear-publication")
		{
			publication = std::optional<std::string>(std::nullopt);
			continue;
		}
		if (i + 1 >= args.size())
		{
			return "Missing value for " + arg;
		}
		const auto& value = args[++i];
		if (arg == "--title")
		{
			title = value;
		}
		else if (arg == "--author")
		{
			author = value;
		}
		else if (arg == "--publication")
		{
			publication = std::optional<std::string>(value);
		}
		else if (arg == "--price")
		{
			price = parse_price(value);
			if (!price)
			{
				return "Invalid price: " + value;
			}
		}
		else
		{
			return "Unknown argument: " + arg;
		}
	}
	return {};
}

int run_command(book_server::service::book_service& books, const std::vector<std::string>& args)
{
	const auto& command = args.front();

	if (command == "init")
	{
		std::cout << "Schema ready\n";
		return 0;
	}

	if (command == "create")
	{
		book_server::model::book_create request;
		std::optional<std::optional<std::string>> publication;
		auto error = parse_fields(args, 1, request.title, request.author, publication,
								  request.price);
		if (!error.empty())
		{
			return usage_error(error);
		}
		if (publication)
		{
			request.publication = *publication;
		}

		auto created = books.create_book(request);
		if (created.is_err())
		{
			return report_error(created.error());
		}
		std::cout << format_book(created.value()) << "\n";
		return 0;
	}

	if (command == "get" || command == "delete")
	{
		if (args.size() != 2)
		{
			return usage_error(command + " requires exactly one uid");
		}
		if (command == "get")
		{
			auto found = books.get_book(args[1]);
			if (found.is_err())
			{
				return report_error(found.error());
			}
			std::cout << format_book(found.value()) << "\n";
			return 0;
		}

		auto deleted = books.delete_book(args[1]);
		if (deleted.is_err())
		{
			return report_error(deleted.error());
		}
		std::cout << "Deleted " << args[1] << "\n";
		return 0;
	}

	if (command == "list")
	{
		int64_t skip = 0;
		std::optional<int64_t> limit;
		for (size_t i = 1; i < args.size(); i += 2)
		{
			if (i + 1 >= args.size())
			{
				return usage_error("Missing value for " + args[i]);
			}
			auto value = parse_integer(args[i + 1]);
			if (!value)
			{
				return usage_error("Invalid number: " + args[i + 1]);
			}
			if (args[i] == "--skip")
			{
				skip = *value;
			}
			else if (args[i] == "--limit")
			{
				limit = *value;
			}
			else
			{
				return usage_error("Unknown argument: " + args[i]);
			}
		}

		auto page = books.list_books(skip, limit);
		if (page.is_err())
		{
			return report_error(page.error());
		}
		for (const auto& record : page.value().books)
		{
			std::cout << format_book(record) << "\n";
		}
		std::cout << "# " << page.value().books.size() << " of " << page.value().total_count
				  << " (skip " << page.value().skip << ", limit " << page.value().limit << ")\n";
		return 0;
	}

	if (command == "update")
	{
		if (args.size() < 2)
		{
			return usage_error("update requires a uid");
		}
		book_server::model::book_update request;
		auto error = parse_fields(args, 2, request.title, request.author, request.publication,
								  request.price);
		if (!error.empty())
		{
			return usage_error(error);
		}

		auto updated = books.update_book(args[1], request);
		if (updated.is_err())
		{
			return report_error(updated.error());
		}
		std::cout << format_book(updated.value()) << "\n";
		return 0;
	}

	return usage_error("Unknown command: " + command);
}

} // namespace

int main(int argc, char* argv[])
{
	std::string config_path = DEFAULT_CONFIG;
	bool explicit_config = false;
	std::vector<std::string> command;

	// Parse command-line arguments
	for (int i = 1; i < argc; ++i)
	{
		if (!command.empty())
		{
			command.emplace_back(argv[i]);
			continue;
		}
		if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0)
		{
			print_usage(argv[0]);
			return 0;
		}
		if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0)
		{
			print_version();
			return 0;
		}
		if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0)
			&& i + 1 < argc)
		{
			config_path = argv[++i];
			explicit_config = true;
			continue;
		}
		if (argv[i][0] == '-')
		{
			std::cerr << "Unknown option: " << argv[i] << "\n";
			std::cerr << "Use --help for usage information.\n";
			return 2;
		}
		command.emplace_back(argv[i]);
	}

	if (command.empty())
	{
		print_usage(argv[0]);
		return 2;
	}

	// Try to load config file, fall back to defaults if not found
	book_server::server_config config;
	auto loaded = book_server::server_config::load_from_file(config_path);
	if (loaded)
	{
		config = *loaded;
	}
	else if (explicit_config)
	{
		std::cerr << "Failed to load configuration from: " << config_path << "\n";
		return 1;
	}
	else
	{
		config = book_server::server_config::default_config();
	}

	for (const auto& error : config.apply_environment())
	{
		std::cerr << "Warning: " << error << "\n";
	}

	// Log lines go to stderr so that stdout carries only command output
	book_server::server_app app(&std::cerr);
	auto init_result = app.initialize(config);
	if (init_result.is_err())
	{
		std::cerr << "Failed to initialize server: " << init_result.error().message << "\n";
		return 1;
	}

	int exit_code = run_command(app.books(), command);
	app.shutdown();
	return exit_code;
}
