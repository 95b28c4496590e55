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

#include <kcenon/book_server/core/server_config.h>

#include <kcenon/book_server/logging/console_logger.h>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <utility>

namespace book_server
{

namespace
{

void trim(std::string& s)
{
	s.erase(0, s.find_first_not_of(" \t\r\n"));
	s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::optional<uint32_t> parse_unsigned(const std::string& value)
{
	uint64_t parsed = 0;
	const char* first = value.data();
	const char* last = value.data() + value.size();
	auto [ptr, ec] = std::from_chars(first, last, parsed);
	if (value.empty() || ec != std::errc() || ptr != last
		|| parsed > std::numeric_limits<uint32_t>::max())
	{
		return std::nullopt;
	}
	return static_cast<uint32_t>(parsed);
}

std::optional<bool> parse_bool(const std::string& value)
{
	if (value == "true" || value == "1" || value == "yes" || value == "on")
	{
		return true;
	}
	if (value == "false" || value == "0" || value == "no" || value == "off")
	{
		return false;
	}
	return std::nullopt;
}

std::optional<std::string> process_environment(const std::string& name)
{
	const char* value = std::getenv(name.c_str());
	if (!value)
	{
		return std::nullopt;
	}
	return std::string(value);
}

/**
 * Assigns one key. Returns false when the value is malformed for the key;
 * unknown keys are ignored.
 */
bool apply_setting(server_config& config, const std::string& key, const std::string& value)
{
	auto set_unsigned = [&value](uint32_t& target)
	{
		auto parsed = parse_unsigned(value);
		if (parsed)
		{
			target = *parsed;
		}
		return parsed.has_value();
	};
	auto set_bool = [&value](bool& target)
	{
		auto parsed = parse_bool(value);
		if (parsed)
		{
			target = *parsed;
		}
		return parsed.has_value();
	};

	if (key == "name")
	{
		config.name = value;
	}
	else if (key == "database.url")
	{
		config.database.url = value;
	}
	else if (key == "database.pool_size")
	{
		return set_unsigned(config.database.pool_size);
	}
	else if (key == "database.max_overflow")
	{
		return set_unsigned(config.database.max_overflow);
	}
	else if (key == "database.echo")
	{
		return set_bool(config.database.echo);
	}
	else if (key == "database.acquire_timeout_ms")
	{
		return set_unsigned(config.database.acquire_timeout_ms);
	}
	else if (key == "database.busy_timeout_ms")
	{
		return set_unsigned(config.database.busy_timeout_ms);
	}
	else if (key == "database.pre_ping")
	{
		return set_bool(config.database.pre_ping);
	}
	else if (key == "database.recycle_seconds")
	{
		return set_unsigned(config.database.recycle_seconds);
	}
	else if (key == "service.default_page_size")
	{
		return set_unsigned(config.service.default_page_size);
	}
	else if (key == "service.max_page_size")
	{
		return set_unsigned(config.service.max_page_size);
	}
	else if (key == "logging.level")
	{
		config.logging.level = value;
	}
	return true;
}

} // namespace

std::optional<server_config> server_config::load_from_file(const std::string& path)
{
	if (!std::filesystem::exists(path))
	{
		// Error will be logged by caller with appropriate context
		return std::nullopt;
	}

	std::ifstream file(path);
	if (!file.is_open())
	{
		return std::nullopt;
	}

	server_config config = default_config();

	std::string line;
	while (std::getline(file, line))
	{
		trim(line);
		if (line.empty() || line[0] == '#')
		{
			continue;
		}

		auto delimiter_pos = line.find('=');
		if (delimiter_pos == std::string::npos)
		{
			continue;
		}

		std::string key = line.substr(0, delimiter_pos);
		std::string value = line.substr(delimiter_pos + 1);
		trim(key);
		trim(value);

		if (!apply_setting(config, key, value))
		{
			return std::nullopt;
		}
	}

	return config;
}

server_config server_config::default_config()
{
	server_config config;
	// All defaults are set in the struct definition
	return config;
}

std::vector<std::string> server_config::apply_environment(const environment_lookup& lookup)
{
	static const std::pair<const char*, const char*> overrides[] = {
		{ "DATABASE_URL", "database.url" },
		{ "DB_POOL_SIZE", "database.pool_size" },
		{ "DB_MAX_OVERFLOW", "database.max_overflow" },
		{ "DB_ECHO", "database.echo" },
		{ "LOG_LEVEL", "logging.level" },
	};

	std::vector<std::string> errors;
	for (const auto& [variable, key] : overrides)
	{
		auto value = lookup ? lookup(variable) : process_environment(variable);
		if (!value)
		{
			continue;
		}
		trim(*value);
		if (!apply_setting(*this, key, *value))
		{
			errors.push_back(std::string("Invalid value for ") + variable + ": " + *value);
		}
	}
	return errors;
}

bool server_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> server_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (name.empty())
	{
		errors.push_back("Server name cannot be empty");
	}

	if (database.url.empty())
	{
		errors.push_back("Database URL cannot be empty");
	}

	if (database.pool_size == 0)
	{
		errors.push_back("Pool size must be greater than 0");
	}

	if (service.default_page_size == 0)
	{
		errors.push_back("Default page size must be greater than 0");
	}

	if (service.max_page_size == 0)
	{
		errors.push_back("Maximum page size must be greater than 0");
	}
	else if (service.default_page_size > service.max_page_size)
	{
		errors.push_back("Default page size cannot exceed maximum page size");
	}

	if (!book_server::logging::parse_log_level(logging.level))
	{
		errors.push_back("Invalid log level: " + logging.level
						 + " (valid: debug, info, warn, error)");
	}

	return errors;
}

} // namespace book_server
