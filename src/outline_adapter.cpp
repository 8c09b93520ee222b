/* outline_adapter.cpp - passes embedded bookmarks through after a shape check.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "outline_adapter.hpp"
#include "utils.hpp"
#include <string>
#include <vector>

std::optional<std::vector<outline_entry>> adapt_outline(const std::optional<std::vector<outline_entry>>& bookmarks) {
	if (!bookmarks || bookmarks->empty()) {
		return std::nullopt;
	}
	std::vector<outline_entry> entries;
	entries.reserve(bookmarks->size());
	for (const auto& bookmark : *bookmarks) {
		std::string title = trim_string(bookmark.title);
		if (title.empty() || bookmark.level < 1 || bookmark.page < 1) {
			continue;
		}
		entries.push_back(outline_entry{bookmark.level, std::move(title), bookmark.page});
	}
	if (entries.empty()) {
		return std::nullopt;
	}
	return entries;
}
