/* page_source.cpp - registry of the formats pages can be loaded from.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "page_source.hpp"
#include "pdf_source.hpp"
#include "text_source.hpp"
#include <vector>

namespace {
const std::vector<const page_source*>& get_sources() {
	static const pdf_source pdf{};
	static const text_source text{};
	static const std::vector<const page_source*> sources{&pdf, &text};
	return sources;
}
} // namespace

std::span<const page_source* const> page_source_registry::get_all() {
	return get_sources();
}

const page_source* find_page_source_by_extension(const wxString& extension) {
	if (extension.IsEmpty()) {
		return nullptr;
	}
	const wxString normalized = extension.Lower();
	for (const page_source* source : page_source_registry::get_all()) {
		for (const auto& ext : source->extensions()) {
			if (ext.Lower() == normalized) {
				return source;
			}
		}
	}
	return nullptr;
}

wxString get_supported_extensions() {
	wxString result;
	for (const page_source* source : page_source_registry::get_all()) {
		for (const auto& ext : source->extensions()) {
			if (!result.IsEmpty()) {
				result += ", ";
			}
			result += ext;
		}
	}
	return result;
}
