/* report_parser.hpp - the document structure pipeline.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include "outline.hpp"
#include "strategy_selector.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <wx/string.h>

struct parse_options {
	strategy mode{strategy::auto_detect};
	int max_toc_pages{DEFAULT_MAX_TOC_PAGES};
};

struct parse_result {
	wxString source_path;
	wxString title;
	strategy strategy_used{strategy::auto_detect};
	int page_count{0};
	std::vector<std::string> pages_text;
	std::unique_ptr<outline_node> tree;
	std::vector<section> sections;
	std::string tree_markdown;

	parse_result() = default;
	~parse_result() = default;
	parse_result(const parse_result&) = delete;
	parse_result& operator=(const parse_result&) = delete;
	parse_result(parse_result&&) = default;
	parse_result& operator=(parse_result&&) = default;
};

// Select entries, build and finalize the tree, then flatten it into sections.
// Throws outliner_error(invalid_input) for an empty page list and
// outliner_error(no_structure_detected) when no strategy yields entries.
[[nodiscard]] parse_result parse_pages(std::vector<std::string> pages, const std::optional<std::vector<outline_entry>>& bookmarks, const parse_options& options = {});
[[nodiscard]] parse_result parse_file(const wxString& path, const parse_options& options = {});
