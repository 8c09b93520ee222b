/* toc_detector.hpp - table of contents page location and entry parsing.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "outline.hpp"
#include <string>
#include <string_view>
#include <vector>

// 0-based indices of pages in the first max_pages whose text mentions a contents marker.
[[nodiscard]] std::vector<int> find_toc_pages(const std::vector<std::string>& pages, int max_pages);
[[nodiscard]] bool looks_like_toc_line(std::string_view line);
// Entries from dot-leader or wide-gap lines on the given pages, sorted into document order.
[[nodiscard]] std::vector<outline_entry> parse_toc_entries(const std::vector<std::string>& pages, const std::vector<int>& toc_pages);
