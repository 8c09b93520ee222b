/* utils.cpp - miscellaneous string and hashing helpers.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include "outliner_error.hpp"
#include <cctype>
#include <clocale>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <mbedtls/sha1.h>
#include <mbedtls/version.h>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <wx/strconv.h>
#include <wx/string.h>
#include <wx/wxcrt.h>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;

int sha1_compute(const unsigned char* data, size_t len, unsigned char out[20]) {
#if defined(MBEDTLS_VERSION_NUMBER)
#if MBEDTLS_VERSION_NUMBER >= 0x03000000
	return mbedtls_sha1(data, len, out);
#else
	return mbedtls_sha1_ret(data, len, out);
#endif
#else
	return -1;
#endif
}

bool is_nbsp_at(std::string_view input, size_t i) noexcept {
	return i + 1 < input.size() && static_cast<unsigned char>(input[i]) == UTF8_NBSP_FIRST && static_cast<unsigned char>(input[i + 1]) == UTF8_NBSP_SECOND;
}

bool is_ascii_alpha(char ch) noexcept {
	return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
}
} // namespace

std::string collapse_whitespace(std::string_view input) {
	auto result = std::ostringstream{};
	bool prev_was_space = false;
	for (size_t i = 0; i < input.size(); ++i) {
		const auto ch = static_cast<unsigned char>(input[i]);
		const bool is_nbsp = is_nbsp_at(input, i);
		if ((std::isspace(ch) != 0) || is_nbsp) {
			if (!prev_was_space) {
				result << ' ';
				prev_was_space = true;
			}
			if (is_nbsp) {
				++i; // Skip the second byte of the UTF-8 sequence.
			}
		} else {
			result << input[i];
			prev_was_space = false;
		}
	}
	return result.str();
}

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	auto is_nbsp = [&](std::string::const_iterator it) -> bool {
		return it != str.end() && std::next(it) != str.end() && static_cast<unsigned char>(*it) == UTF8_NBSP_FIRST && static_cast<unsigned char>(*std::next(it)) == UTF8_NBSP_SECOND;
	};
	while (start != end && ((std::isspace(static_cast<unsigned char>(*start)) != 0) || is_nbsp(start))) {
		if (is_nbsp(start)) {
			start += 2;
		} else {
			++start;
		}
	}
	while (start != end) {
		auto prev = std::prev(end);
		if (std::isspace(static_cast<unsigned char>(*prev)) != 0) {
			end = prev;
		} else if (prev != start && std::prev(prev) != start && is_nbsp(std::prev(prev))) {
			end = std::prev(prev);
		} else {
			break;
		}
	}
	return {start, end};
}

std::string rtrim_string(const std::string& str) {
	size_t end = str.size();
	while (end > 0 && std::isspace(static_cast<unsigned char>(str[end - 1])) != 0) {
		--end;
	}
	return str.substr(0, end);
}

std::string remove_soft_hyphens(std::string_view input) {
	std::string result(input);
	const std::string sh = "\xC2\xAD";
	size_t pos = 0;
	while ((pos = result.find(sh, pos)) != std::string::npos) {
		result.erase(pos, sh.size());
	}
	return result;
}

std::string convert_to_utf8(const std::string& input) {
	if (input.empty()) {
		return input;
	}
	const auto* data = reinterpret_cast<const unsigned char*>(input.data());
	const size_t len = input.length();
	auto try_convert = [&](size_t bom_size, wxMBConv& conv) -> std::optional<std::string> {
		const wxString content(input.data() + bom_size, conv, len - bom_size);
		if (!content.empty()) {
			return std::string(content.ToUTF8());
		}
		return std::nullopt;
	};
	if (len >= 4 && data[0] == 0xFF && data[1] == 0xFE && data[2] == 0x00 && data[3] == 0x00) {
		wxMBConvUTF32LE conv;
		if (auto result = try_convert(4, conv)) {
			return *result;
		}
	}
	if (len >= 4 && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0xFE && data[3] == 0xFF) {
		wxMBConvUTF32BE conv;
		if (auto result = try_convert(4, conv)) {
			return *result;
		}
	}
	if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
		return input.substr(3);
	}
	if (len >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
		wxMBConvUTF16LE conv;
		if (auto result = try_convert(2, conv)) {
			return *result;
		}
	}
	if (len >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
		wxMBConvUTF16BE conv;
		if (auto result = try_convert(2, conv)) {
			return *result;
		}
	}
	const wxString as_utf8 = wxString::FromUTF8(input.data(), len);
	if (!as_utf8.empty()) {
		return input;
	}
	const wxString as_latin1(input.data(), wxConvISO8859_1, len);
	if (!as_latin1.empty()) {
		return std::string(as_latin1.ToUTF8());
	}
	return input;
}

std::string to_lower_ascii(std::string_view input) {
	std::string result(input);
	for (auto& ch : result) {
		ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
	}
	return result;
}

std::string to_title_case(std::string_view input) {
	const wxString wide = wxString::FromUTF8(input.data(), input.size());
	if (!wide.empty() || input.empty()) {
		wxString titled;
		titled.reserve(wide.length());
		bool prev_cased = false;
		for (const wxUniChar ch : wide) {
			if (wxIsalpha(ch)) {
				titled += prev_cased ? wxTolower(ch) : wxToupper(ch);
				prev_cased = true;
			} else {
				titled += ch;
				prev_cased = false;
			}
		}
		return std::string(titled.ToUTF8());
	}
	// Not valid UTF-8, so only ASCII letters can be mapped safely.
	std::string result;
	result.reserve(input.size());
	bool prev_cased = false;
	for (const char ch : input) {
		if (is_ascii_alpha(ch)) {
			const auto uch = static_cast<unsigned char>(ch);
			result.push_back(static_cast<char>(prev_cased ? std::tolower(uch) : std::toupper(uch)));
			prev_cased = true;
		} else {
			result.push_back(ch);
			prev_cased = false;
		}
	}
	return result;
}

std::vector<std::string> split_lines(const std::string& text) {
	std::vector<std::string> lines;
	std::string current;
	for (size_t i = 0; i < text.size(); ++i) {
		const char ch = text[i];
		if (ch == '\r' || ch == '\n' || ch == '\f' || ch == '\v') {
			lines.push_back(std::move(current));
			current.clear();
			if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
				++i;
			}
		} else {
			current.push_back(ch);
		}
	}
	if (!current.empty()) {
		lines.push_back(std::move(current));
	}
	return lines;
}

std::string join_strings(const std::vector<std::string>& parts, std::string_view separator) {
	std::string result;
	for (size_t i = 0; i < parts.size(); ++i) {
		if (i > 0) {
			result.append(separator);
		}
		result.append(parts[i]);
	}
	return result;
}

size_t count_words(std::string_view text) noexcept {
	size_t count = 0;
	bool in_word = false;
	for (const char ch : text) {
		if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
			in_word = false;
		} else if (!in_word) {
			in_word = true;
			++count;
		}
	}
	return count;
}

bool has_ascii_letter(std::string_view text) noexcept {
	for (const char ch : text) {
		if (is_ascii_alpha(ch)) {
			return true;
		}
	}
	return false;
}

bool is_upper_line(std::string_view text) {
	bool has_upper = false;
	const wxString wide = wxString::FromUTF8(text.data(), text.size());
	if (!wide.empty()) {
		for (const wxUniChar ch : wide) {
			if (wxIslower(ch)) {
				return false;
			}
			if (wxIsupper(ch)) {
				has_upper = true;
			}
		}
		return has_upper;
	}
	for (const char ch : text) {
		if (ch >= 'a' && ch <= 'z') {
			return false;
		}
		if (ch >= 'A' && ch <= 'Z') {
			has_upper = true;
		}
	}
	return has_upper;
}

bool use_unicode_ctype() {
	for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
		if (std::setlocale(LC_CTYPE, name) != nullptr) {
			return true;
		}
	}
	return false;
}

std::string normalize_page_text(std::string_view text) {
	std::string unified;
	unified.reserve(text.size());
	for (size_t i = 0; i < text.size(); ++i) {
		if (is_nbsp_at(text, i)) {
			unified.push_back(' ');
			++i;
		} else if (text[i] == '\r') {
			if (i + 1 >= text.size() || text[i + 1] != '\n') {
				unified.push_back('\n');
			}
		} else {
			unified.push_back(text[i]);
		}
	}
	// Drop spaces and tabs that run up to a line break.
	std::string result;
	result.reserve(unified.size());
	size_t pending_start = std::string::npos;
	for (size_t i = 0; i < unified.size(); ++i) {
		const char ch = unified[i];
		if (ch == ' ' || ch == '\t') {
			if (pending_start == std::string::npos) {
				pending_start = i;
			}
			continue;
		}
		if (pending_start != std::string::npos) {
			if (ch != '\n') {
				result.append(unified, pending_start, i - pending_start);
			}
			pending_start = std::string::npos;
		}
		result.push_back(ch);
	}
	if (pending_start != std::string::npos) {
		result.append(unified, pending_start, std::string::npos);
	}
	return result;
}

std::string sha1_hex(std::string_view data) {
	unsigned char digest[20]{};
	const int status = sha1_compute(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
	if (status != 0) {
		throw outliner_error(wxString::Format("SHA-1 computation failed (status %d)", status), error_code::hash_failed);
	}
	static constexpr char hex[] = "0123456789abcdef";
	std::string out;
	out.reserve(sizeof(digest) * 2);
	for (const unsigned char byte : digest) {
		out.push_back(hex[(byte >> 4) & 0xF]);
		out.push_back(hex[byte & 0xF]);
	}
	return out;
}
