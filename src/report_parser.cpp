/* report_parser.cpp - runs strategy selection, tree construction and flattening for one document.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "report_parser.hpp"
#include "outliner_error.hpp"
#include "page_source.hpp"
#include <utility>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/translation.h>

parse_result parse_pages(std::vector<std::string> pages, const std::optional<std::vector<outline_entry>>& bookmarks, const parse_options& options) {
	if (pages.empty()) {
		throw outliner_error(_("Document has no pages"), error_code::invalid_input);
	}
	parse_result result;
	result.page_count = static_cast<int>(pages.size());
	auto outcome = select_entries(pages, bookmarks, options.mode, options.max_toc_pages);
	wxLogVerbose("Using strategy '%s' with %d entries", strategy_name(outcome.strategy_used), static_cast<int>(outcome.entries.size()));
	result.strategy_used = outcome.strategy_used;
	result.tree = build_tree(outcome.entries);
	finalize_tree(*result.tree, result.page_count);
	result.sections = flatten_sections(*result.tree, pages);
	result.tree_markdown = render_markdown(*result.tree);
	result.pages_text = std::move(pages);
	return result;
}

parse_result parse_file(const wxString& path, const parse_options& options) {
	if (!wxFileName::FileExists(path)) {
		throw outliner_error(_("File not found"), path, error_code::load_failed);
	}
	const page_source* source = find_page_source_by_extension(wxFileName(path).GetExt());
	if (source == nullptr) {
		throw outliner_error(wxString::Format(_("Unsupported file type (supported: %s)"), get_supported_extensions()), path, error_code::unsupported_format);
	}
	wxLogVerbose("Reading %s as %s", path, source->name());
	loaded_document doc = source->load(path);
	wxLogVerbose("Extracted %d pages of text", static_cast<int>(doc.pages.size()));
	try {
		parse_result result = parse_pages(std::move(doc.pages), doc.bookmarks, options);
		result.source_path = path;
		result.title = doc.title;
		return result;
	} catch (const outliner_error& e) {
		if (!e.get_file_path().IsEmpty()) {
			throw;
		}
		throw outliner_error(e.get_message(), path, e.get_code());
	}
}
