/* constants.hpp - shared constants.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <array>
#include <string_view>
#include <wx/string.h>

inline const wxString APP_NAME = "Outliner";
inline const wxString APP_VERSION = "0.3";
inline const wxString APP_COPYRIGHT = "Copyright (C) 2025 Quin Gillespie. All rights reserved.";
inline constexpr int CONFIG_VERSION_CURRENT = 1;

inline constexpr int DEFAULT_MAX_TOC_PAGES = 8;
inline const wxString DEFAULT_OUTPUT_DIR = "outputs/report";
inline const wxString DEFAULT_STRATEGY = "auto";

// Serialized title of the synthetic root node.
inline constexpr std::string_view ROOT_TITLE = "ROOT";
inline constexpr std::string_view PATH_SEPARATOR = " > ";
inline constexpr size_t SECTION_ID_LENGTH = 12;

inline constexpr std::array<std::string_view, 2> TOC_KEYWORDS = {"table of contents", "contents"};

inline constexpr size_t MIN_HEADING_LENGTH = 6;
inline constexpr size_t MAX_HEADING_LENGTH = 120;
inline constexpr size_t MAX_CAPS_HEADING_LENGTH = 60;
inline constexpr size_t MIN_TOC_LINE_LENGTH = 6;
inline constexpr int MAX_HEADING_PUNCTUATION = 2;

inline constexpr size_t ENTRY_PREVIEW_ROWS = 12;
