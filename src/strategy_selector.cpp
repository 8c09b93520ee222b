/* strategy_selector.cpp - strategy selection for outline detection.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "strategy_selector.hpp"
#include "heading_detector.hpp"
#include "outline_adapter.hpp"
#include "outliner_error.hpp"
#include "toc_detector.hpp"
#include <array>
#include <limits>
#include <utility>
#include <vector>
#include <wx/log.h>
#include <wx/translation.h>

namespace {
std::optional<entry_list> non_empty(entry_list entries) {
	if (entries.empty()) {
		return std::nullopt;
	}
	return entries;
}
} // namespace

strategy parse_strategy(const wxString& name) {
	const wxString normalized = name.Lower().Trim().Trim(false);
	if (normalized == "auto") {
		return strategy::auto_detect;
	}
	if (normalized == "outline") {
		return strategy::outline;
	}
	if (normalized == "toc") {
		return strategy::toc;
	}
	if (normalized == "headings") {
		return strategy::headings;
	}
	throw outliner_error(wxString::Format(_("Unknown strategy '%s' (expected auto, outline, toc or headings)"), name), error_code::invalid_input);
}

int checked_toc_window(long pages) {
	if (pages < 1 || pages > std::numeric_limits<int>::max()) {
		throw outliner_error(wxString::Format(_("Invalid contents search window: %ld"), pages), error_code::invalid_input);
	}
	return static_cast<int>(pages);
}

wxString strategy_name(strategy value) {
	switch (value) {
		case strategy::auto_detect:
			return "auto";
		case strategy::outline:
			return "outline";
		case strategy::toc:
			return "toc";
		case strategy::headings:
			return "headings";
	}
	return "auto";
}

entry_detectors make_default_detectors(const std::vector<std::string>& pages, const std::optional<entry_list>& bookmarks, int max_toc_pages) {
	entry_detectors detectors;
	detectors.outline = [&bookmarks]() {
		return adapt_outline(bookmarks);
	};
	detectors.toc = [&pages, max_toc_pages]() -> std::optional<entry_list> {
		const auto toc_pages = find_toc_pages(pages, max_toc_pages);
		if (toc_pages.empty()) {
			wxLogVerbose("No contents page in the first %d pages", max_toc_pages);
			return std::nullopt;
		}
		wxLogVerbose("Contents marker found on %d page(s)", static_cast<int>(toc_pages.size()));
		return non_empty(parse_toc_entries(pages, toc_pages));
	};
	detectors.headings = [&pages]() {
		return non_empty(detect_headings(pages));
	};
	return detectors;
}

selection_outcome select_entries(const entry_detectors& detectors, strategy mode) {
	const std::array<std::pair<strategy, const entry_detector*>, 3> order{{
		{strategy::outline, &detectors.outline},
		{strategy::toc, &detectors.toc},
		{strategy::headings, &detectors.headings},
	}};
	for (const auto& [candidate, detector] : order) {
		if (mode != strategy::auto_detect && mode != candidate) {
			continue;
		}
		if (!*detector) {
			continue;
		}
		auto entries = (*detector)();
		if (entries && !entries->empty()) {
			return selection_outcome{candidate, std::move(*entries)};
		}
		wxLogVerbose("Strategy '%s' found no entries", strategy_name(candidate));
	}
	throw outliner_error(_("No outline, contents page or headings detected"), error_code::no_structure_detected);
}

selection_outcome select_entries(const std::vector<std::string>& pages, const std::optional<entry_list>& bookmarks, strategy mode, int max_toc_pages) {
	return select_entries(make_default_detectors(pages, bookmarks, max_toc_pages), mode);
}
