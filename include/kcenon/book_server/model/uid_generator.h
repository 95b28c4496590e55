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
 * @file uid_generator.h
 * @brief Book identifier generation and parsing
 *
 * Book uids are random (version 4) UUIDs in canonical lowercase text form.
 *
 * Properties:
 * - 122 random bits per uid, seeded from std::random_device
 * - Thread-safe with thread-local RNG state
 * - Collision probability negligible for any realistic table size
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace book_server::model
{

/**
 * @brief Generate a fresh book uid
 *
 * Thread Safety:
 * - This function is thread-safe
 * - Uses thread-local RNG, no locking between threads
 *
 * @return A 36-character lowercase UUID v4 string
 *
 * Example:
 * @code
 * auto uid = generate_book_uid();
 * // uid == "3f2b8c1e-9a4d-4f6b-8e2a-1c5d7e9f0a3b"
 * @endcode
 */
[[nodiscard]] std::string generate_book_uid();

/**
 * @brief Parse a caller-supplied uid into canonical form
 * @param uid Candidate uid in 8-4-4-4-12 hexadecimal layout, any case
 * @return Lowercase uid, or std::nullopt if the text is not a UUID
 */
[[nodiscard]] std::optional<std::string> normalize_uid(std::string_view uid);

} // namespace book_server::model
