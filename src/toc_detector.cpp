/* toc_detector.cpp - finds table of contents pages and parses their entries.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "toc_detector.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace {
const std::regex& trailing_page_pattern() {
	static const std::regex rx(R"(\b(\d{1,4})\s*$)");
	return rx;
}

const std::regex& wide_gap_pattern() {
	static const std::regex rx(R"(\s{3,}\d{1,4}\s*$)");
	return rx;
}

const std::regex& numbered_line_pattern() {
	static const std::regex rx(R"(^(\d+(\.\d+){0,4}|[A-Z])[\.\)]?\s+\S+)");
	return rx;
}

const std::regex& numbering_prefix_pattern() {
	static const std::regex rx(R"(^(\d+(?:\.\d+){0,6}|[A-Z])[\.\)]?\s+(.*)$)");
	return rx;
}

std::string strip_trailing_leaders(const std::string& text) {
	size_t end = text.size();
	while (end > 0 && (text[end - 1] == '.' || text[end - 1] == ' ')) {
		--end;
	}
	std::string result = trim_string(text.substr(0, end));
	// A run of two or more dots can survive behind other leader punctuation.
	size_t dots = 0;
	while (dots < result.size() && result[result.size() - 1 - dots] == '.') {
		++dots;
	}
	if (dots >= 2) {
		result.erase(result.size() - dots);
	}
	return trim_string(result);
}

std::optional<outline_entry> parse_toc_line(const std::string& line) {
	if (!looks_like_toc_line(line)) {
		return std::nullopt;
	}
	std::smatch page_match;
	if (!std::regex_search(line, page_match, trailing_page_pattern())) {
		return std::nullopt;
	}
	const int page = std::stoi(page_match.str(1));
	if (page < 1) {
		return std::nullopt;
	}
	const std::string title_part = strip_trailing_leaders(line.substr(0, static_cast<size_t>(page_match.position(0))));
	outline_entry entry;
	entry.page = page;
	std::smatch number_match;
	if (std::regex_match(title_part, number_match, numbering_prefix_pattern())) {
		const std::string number = number_match.str(1);
		entry.title = trim_string(number_match.str(2));
		entry.level = std::isdigit(static_cast<unsigned char>(number.front())) != 0 ? static_cast<int>(std::count(number.begin(), number.end(), '.')) + 1 : 1;
	} else {
		entry.title = title_part;
		entry.level = 1;
	}
	if (entry.title.empty()) {
		return std::nullopt;
	}
	return entry;
}
} // namespace

std::vector<int> find_toc_pages(const std::vector<std::string>& pages, int max_pages) {
	std::vector<int> result;
	const int limit = std::min(static_cast<int>(pages.size()), max_pages);
	for (int i = 0; i < limit; ++i) {
		const std::string lowered = to_lower_ascii(pages[static_cast<size_t>(i)]);
		const bool has_marker = std::any_of(TOC_KEYWORDS.begin(), TOC_KEYWORDS.end(), [&lowered](std::string_view keyword) {
			return lowered.find(keyword) != std::string::npos;
		});
		if (has_marker) {
			result.push_back(i);
		}
	}
	return result;
}

bool looks_like_toc_line(std::string_view line) {
	const std::string s = trim_string(std::string(line));
	if (s.size() < MIN_TOC_LINE_LENGTH) {
		return false;
	}
	if (!std::regex_search(s, trailing_page_pattern())) {
		return false;
	}
	if (!has_ascii_letter(s)) {
		return false;
	}
	if (s.find("...") != std::string::npos || std::regex_search(s, wide_gap_pattern())) {
		return true;
	}
	return std::regex_search(s, numbered_line_pattern());
}

std::vector<outline_entry> parse_toc_entries(const std::vector<std::string>& pages, const std::vector<int>& toc_pages) {
	std::vector<outline_entry> entries;
	std::set<std::tuple<int, std::string, int>> seen;
	for (const int page_index : toc_pages) {
		if (page_index < 0 || page_index >= static_cast<int>(pages.size())) {
			continue;
		}
		for (const auto& raw_line : split_lines(pages[static_cast<size_t>(page_index)])) {
			auto entry = parse_toc_line(trim_string(raw_line));
			if (!entry) {
				continue;
			}
			if (!seen.emplace(entry->level, to_lower_ascii(entry->title), entry->page).second) {
				continue;
			}
			entries.push_back(std::move(*entry));
		}
	}
	std::sort(entries.begin(), entries.end());
	return entries;
}
