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

#include <kcenon/book_server/model/uid_generator.h>

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace book_server::model
{

std::string generate_book_uid()
{
	thread_local std::random_device rd;
	thread_local std::mt19937_64 gen(rd());
	std::uniform_int_distribution<uint64_t> dis;

	auto high = dis(gen);
	auto low = dis(gen);

	// RFC 4122: version nibble 4, variant bits 10
	high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
	low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

	std::ostringstream ss;
	ss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
	const auto hex = ss.str();

	std::string uid;
	uid.reserve(36);
	uid.append(hex, 0, 8).append("-");
	uid.append(hex, 8, 4).append("-");
	uid.append(hex, 12, 4).append("-");
	uid.append(hex, 16, 4).append("-");
	uid.append(hex, 20, 12);
	return uid;
}

std::optional<std::string> normalize_uid(std::string_view uid)
{
	if (uid.size() != 36)
	{
		return std::nullopt;
	}

	std::string normalized;
	normalized.reserve(uid.size());

	for (std::size_t i = 0; i < uid.size(); ++i)
	{
		const auto c = static_cast<unsigned char>(uid[i]);
		if (i == 8 || i == 13 || i == 18 || i == 23)
		{
			if (c != '-')
			{
				return std::nullopt;
			}
			normalized.push_back('-');
			continue;
		}
		if (!std::isxdigit(c))
		{
			return std::nullopt;
		}
		normalized.push_back(static_cast<char>(std::tolower(c)));
	}

	return normalized;
}

} // namespace book_server::model
