/* utils.hpp - string and hashing helpers shared by the detectors and sources.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>

[[nodiscard]] std::string collapse_whitespace(std::string_view input);
[[nodiscard]] std::string trim_string(const std::string& str);
[[nodiscard]] std::string rtrim_string(const std::string& str);
[[nodiscard]] std::string remove_soft_hyphens(std::string_view input);
[[nodiscard]] std::string convert_to_utf8(const std::string& input);
[[nodiscard]] std::string to_lower_ascii(std::string_view input);
[[nodiscard]] std::string to_title_case(std::string_view input);
[[nodiscard]] std::vector<std::string> split_lines(const std::string& text);
[[nodiscard]] std::string join_strings(const std::vector<std::string>& parts, std::string_view separator);
[[nodiscard]] size_t count_words(std::string_view text) noexcept;
[[nodiscard]] bool has_ascii_letter(std::string_view text) noexcept;
// True when text has an uppercase letter and no lowercase one, in any script.
[[nodiscard]] bool is_upper_line(std::string_view text);
// Switches LC_CTYPE to a UTF-8 locale so letter case maps beyond ASCII.
bool use_unicode_ctype();
[[nodiscard]] std::string normalize_page_text(std::string_view text);
// Lowercase hex SHA-1 digest of data. Throws outliner_error if hashing fails.
[[nodiscard]] std::string sha1_hex(std::string_view data);
