/* page_source.hpp - base page source interface.
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
#include <span>
#include <string>
#include <vector>
#include <wx/string.h>

// Per-page plain text (index 0 is page 1) plus the embedded bookmarks, if any.
struct loaded_document {
	wxString title;
	std::vector<std::string> pages;
	std::optional<std::vector<outline_entry>> bookmarks;
};

class page_source {
public:
	virtual ~page_source() = default;
	[[nodiscard]] virtual wxString name() const = 0;
	[[nodiscard]] virtual std::span<const wxString> extensions() const = 0;
	[[nodiscard]] virtual loaded_document load(const wxString& path) const = 0;
};

class page_source_registry {
public:
	[[nodiscard]] static std::span<const page_source* const> get_all();
};

[[nodiscard]] const page_source* find_page_source_by_extension(const wxString& extension);
[[nodiscard]] wxString get_supported_extensions();
