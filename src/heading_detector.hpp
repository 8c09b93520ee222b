/* heading_detector.hpp - fallback heading detection over body text.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "outline.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class heading_kind {
	numbered,
	all_caps,
	proper_case,
};

struct heading_match {
	heading_kind kind;
	int level;
	std::string title;
};

// Classifies one line against the numbered, all-caps and proper-case grammars, in that order.
[[nodiscard]] std::optional<heading_match> classify_heading_line(std::string_view line);
[[nodiscard]] std::vector<outline_entry> detect_headings(const std::vector<std::string>& pages);
