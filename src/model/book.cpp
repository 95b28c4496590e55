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

#include <kcenon/book_server/model/book.h>

#include <kcenon/book_server/core/error_codes.h>

#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace book_server::model
{

namespace
{

constexpr const char* module_name = "book_validation";

constexpr const char* whitespace = " \t\r\n\v\f";

std::string trim(const std::string& value)
{
	const auto first = value.find_first_not_of(whitespace);
	if (first == std::string::npos)
	{
		return {};
	}
	const auto last = value.find_last_not_of(whitespace);
	return value.substr(first, last - first + 1);
}

/**
 * Counts the code points of a UTF-8 string.
 * Returns std::nullopt for malformed, overlong or surrogate sequences.
 */
std::optional<std::size_t> utf8_length(const std::string& value)
{
	std::size_t count = 0;
	std::size_t i = 0;
	while (i < value.size())
	{
		const auto lead = static_cast<unsigned char>(value[i]);
		std::size_t extra = 0;
		uint32_t code_point = 0;
		uint32_t minimum = 0;

		if (lead < 0x80)
		{
			code_point = lead;
		}
		else if ((lead & 0xE0) == 0xC0)
		{
			extra = 1;
			code_point = lead & 0x1F;
			minimum = 0x80;
		}
		else if ((lead & 0xF0) == 0xE0)
		{
			extra = 2;
			code_point = lead & 0x0F;
			minimum = 0x800;
		}
		else if ((lead & 0xF8) == 0xF0)
		{
			extra = 3;
			code_point = lead & 0x07;
			minimum = 0x10000;
		}
		else
		{
			return std::nullopt;
		}

		if (value.size() - i <= extra)
		{
			return std::nullopt;
		}
		for (std::size_t k = 1; k <= extra; ++k)
		{
			const auto next = static_cast<unsigned char>(value[i + k]);
			if ((next & 0xC0) != 0x80)
			{
				return std::nullopt;
			}
			code_point = (code_point << 6) | (next & 0x3F);
		}

		if (code_point < minimum || code_point > 0x10FFFF
			|| (code_point >= 0xD800 && code_point <= 0xDFFF))
		{
			return std::nullopt;
		}

		i += extra + 1;
		++count;
	}
	return count;
}

bool has_control_character(const std::string& value)
{
	for (char c : value)
	{
		const auto byte = static_cast<unsigned char>(c);
		if (byte < 0x20 || byte == 0x7F)
		{
			return true;
		}
	}
	return false;
}

/**
 * Trims a text field and checks it against [1, max_length] code points.
 * Records a violation and returns an empty string on failure.
 */
std::string check_text(const std::string& field,
					   const std::string& value,
					   std::size_t max_length,
					   std::vector<std::string>& errors)
{
	auto trimmed = trim(value);
	if (trimmed.empty())
	{
		errors.push_back(field + " cannot be empty or whitespace only");
	}
	else if (has_control_character(trimmed))
	{
		errors.push_back(field + " contains control characters");
	}
	else
	{
		const auto length = utf8_length(trimmed);
		if (!length)
		{
			errors.push_back(field + " is not valid UTF-8");
		}
		else if (*length > max_length)
		{
			errors.push_back(field + " exceeds " + std::to_string(max_length) + " characters");
		}
	}
	return trimmed;
}

void check_price(double price, std::vector<std::string>& errors)
{
	if (!std::isfinite(price))
	{
		errors.push_back("price must be a finite number");
	}
	else if (price < 0.0)
	{
		errors.push_back("price must be greater than or equal to 0");
	}
}

kcenon::common::error_info to_validation_error(const std::vector<std::string>& errors)
{
	std::string message = "Invalid book: ";
	for (std::size_t i = 0; i < errors.size(); ++i)
	{
		if (i > 0)
		{
			message += "; ";
		}
		message += errors[i];
	}
	return make_error(error_kind::validation_error, std::move(message), module_name);
}

} // namespace

kcenon::common::Result<book_fields> validate(const book_create& request)
{
	std::vector<std::string> errors;
	book_fields fields;

	if (!request.title)
	{
		errors.push_back("title is required");
	}
	else
	{
		fields.title = check_text("title", *request.title, max_title_length, errors);
	}

	if (!request.author)
	{
		errors.push_back("author is required");
	}
	else
	{
		fields.author = check_text("author", *request.author, max_author_length, errors);
	}

	if (request.publication)
	{
		fields.publication = check_text("publication", *request.publication,
										max_publication_length, errors);
	}

	if (!request.price)
	{
		errors.push_back("price is required");
	}
	else
	{
		check_price(*request.price, errors);
		fields.price = *request.price;
	}

	if (!errors.empty())
	{
		return to_validation_error(errors);
	}
	return fields;
}

kcenon::common::Result<book_update> validate(const book_update& request)
{
	std::vector<std::string> errors;
	book_update normalized;

	if (request.title)
	{
		normalized.title = check_text("title", *request.title, max_title_length, errors);
	}

	if (request.author)
	{
		normalized.author = check_text("author", *request.author, max_author_length, errors);
	}

	if (request.publication)
	{
		if (*request.publication)
		{
			normalized.publication = std::optional<std::string>(check_text(
				"publication", **request.publication, max_publication_length, errors));
		}
		else
		{
			// Explicit clear, kept distinct from "absent"
			normalized.publication = std::optional<std::string>(std::nullopt);
		}
	}

	if (request.price)
	{
		check_price(*request.price, errors);
		normalized.price = request.price;
	}

	if (!errors.empty())
	{
		return to_validation_error(errors);
	}
	return normalized;
}

timestamp now()
{
	return std::chrono::time_point_cast<std::chrono::microseconds>(
		std::chrono::system_clock::now());
}

int64_t to_microseconds(timestamp value) noexcept
{
	return static_cast<int64_t>(value.time_since_epoch().count());
}

timestamp from_microseconds(int64_t value) noexcept
{
	return timestamp(std::chrono::microseconds(value));
}

std::string to_iso8601(timestamp value)
{
	const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(value);
	auto micros = (value - seconds).count();
	auto time_t_value = std::chrono::system_clock::to_time_t(seconds);
	if (micros < 0)
	{
		// Pre-epoch instants truncate toward zero
		micros += 1000000;
		time_t_value -= 1;
	}

	std::tm utc{};
#ifdef _WIN32
	gmtime_s(&utc, &time_t_value);
#else
	gmtime_r(&time_t_value, &utc);
#endif

	std::ostringstream oss;
	oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
	oss << "." << std::setfill('0') << std::setw(6) << micros << "Z";
	return oss.str();
}

} // namespace book_server::model
