/* strategy_selector.hpp - chooses which outline detection strategy supplies the entries.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "outline.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <wx/string.h>

enum class strategy {
	auto_detect,
	outline,
	toc,
	headings,
};

// Throws outliner_error(invalid_input) for anything but auto, outline, toc or headings.
[[nodiscard]] strategy parse_strategy(const wxString& name);
[[nodiscard]] wxString strategy_name(strategy value);
// Throws outliner_error(invalid_input) unless 1 <= pages <= INT_MAX.
[[nodiscard]] int checked_toc_window(long pages);

using entry_list = std::vector<outline_entry>;
using entry_detector = std::function<std::optional<entry_list>()>;

// One detector per concrete strategy; each returns nothing to abstain.
struct entry_detectors {
	entry_detector outline;
	entry_detector toc;
	entry_detector headings;
};

struct selection_outcome {
	strategy strategy_used;
	entry_list entries;
};

[[nodiscard]] entry_detectors make_default_detectors(const std::vector<std::string>& pages, const std::optional<entry_list>& bookmarks, int max_toc_pages);
// Runs the detectors allowed by mode in priority order; the first non-empty result wins.
// Throws outliner_error(no_structure_detected) when all of them abstain.
[[nodiscard]] selection_outcome select_entries(const entry_detectors& detectors, strategy mode);
[[nodiscard]] selection_outcome select_entries(const std::vector<std::string>& pages, const std::optional<entry_list>& bookmarks, strategy mode, int max_toc_pages);
