/* text_source.cpp - loads pages from form-feed separated text files.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "text_source.hpp"
#include "outliner_error.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <wx/filename.h>
#include <wx/stream.h>
#include <wx/string.h>
#include <wx/translation.h>
#include <wx/wfstream.h>

loaded_document text_source::load(const wxString& path) const {
	wxFileInputStream file_stream(path);
	if (!file_stream.IsOk()) {
		throw outliner_error(_("Failed to open text file"), path, error_code::load_failed);
	}
	wxBufferedInputStream bs(file_stream);
	const size_t file_size = bs.GetSize();
	if (file_size == 0) {
		throw outliner_error(_("Text file is empty"), path, error_code::load_failed);
	}
	std::vector<char> buffer(file_size);
	bs.Read(buffer.data(), file_size);
	if (bs.LastRead() != file_size) {
		throw outliner_error(_("Failed to read text file"), path, error_code::load_failed);
	}
	const std::string utf8_content = convert_to_utf8(std::string(buffer.data(), file_size));
	loaded_document doc;
	doc.title = wxFileName(path).GetName();
	doc.pages = split_pages(remove_soft_hyphens(utf8_content));
	return doc;
}

std::vector<std::string> text_source::split_pages(const std::string& content) {
	std::vector<std::string> pages;
	size_t start = 0;
	while (true) {
		const size_t pos = content.find('\f', start);
		const std::string page = normalize_page_text(content.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
		if (pos == std::string::npos) {
			// A trailing form feed does not open another page.
			if (!page.empty() || pages.empty()) {
				pages.push_back(page);
			}
			break;
		}
		pages.push_back(page);
		start = pos + 1;
	}
	return pages;
}
