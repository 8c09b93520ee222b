/* heading_detector.cpp - detects heading-like lines when a document has no outline or contents page.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "heading_detector.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <algorithm>
#include <regex>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace {
// Letters, digits, a little punctuation, and the typographic apostrophe.
const std::string TITLE_CHARS = "(?:[A-Za-z0-9&,\\-:'()/ ]|\xE2\x80\x99)";

const std::regex& numbered_heading_pattern() {
	static const std::regex rx("^(\\d+(?:\\.\\d+){0,5})\\s+([A-Z]" + TITLE_CHARS + "+)$");
	return rx;
}

const std::regex& proper_case_pattern() {
	static const std::regex rx("^[A-Z]" + TITLE_CHARS + "+$");
	return rx;
}

const std::regex& caption_pattern() {
	static const std::regex rx(R"(^(figure|table)\s+\d+)");
	return rx;
}

size_t utf8_length(std::string_view text) noexcept {
	return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
		return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
	}));
}

int count_clause_punctuation(std::string_view text) noexcept {
	return static_cast<int>(std::count_if(text.begin(), text.end(), [](char ch) {
		return ch == ',' || ch == ';' || ch == ':';
	}));
}
} // namespace

std::optional<heading_match> classify_heading_line(std::string_view line) {
	const std::string s = trim_string(collapse_whitespace(line));
	const size_t length = utf8_length(s);
	if (length < MIN_HEADING_LENGTH || length > MAX_HEADING_LENGTH) {
		return std::nullopt;
	}
	std::smatch m;
	if (std::regex_match(s, m, numbered_heading_pattern())) {
		const std::string number = m.str(1);
		const int level = static_cast<int>(std::count(number.begin(), number.end(), '.')) + 1;
		return heading_match{heading_kind::numbered, level, trim_string(m.str(2))};
	}
	if (is_upper_line(s) && length <= MAX_CAPS_HEADING_LENGTH) {
		return heading_match{heading_kind::all_caps, 1, to_title_case(s)};
	}
	if (s.back() == '.') {
		return std::nullopt;
	}
	if (count_words(s) < 2 || !std::regex_match(s, proper_case_pattern())) {
		return std::nullopt;
	}
	if (count_clause_punctuation(s) > MAX_HEADING_PUNCTUATION) {
		return std::nullopt;
	}
	if (std::regex_search(to_lower_ascii(s), caption_pattern())) {
		return std::nullopt;
	}
	return heading_match{heading_kind::proper_case, 1, s};
}

std::vector<outline_entry> detect_headings(const std::vector<std::string>& pages) {
	std::vector<outline_entry> headings;
	std::set<std::tuple<int, std::string, int>> seen;
	for (size_t i = 0; i < pages.size(); ++i) {
		const int page_no = static_cast<int>(i) + 1;
		for (const auto& line : split_lines(pages[i])) {
			auto match = classify_heading_line(line);
			if (!match) {
				continue;
			}
			if (!seen.emplace(match->level, to_lower_ascii(match->title), page_no).second) {
				continue;
			}
			headings.push_back(outline_entry{match->level, std::move(match->title), page_no});
		}
	}
	std::sort(headings.begin(), headings.end());
	return headings;
}
