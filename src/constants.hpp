/* constants.hpp - contains app-wide constants.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <array>
#include <cstddef>
#include <string_view>
#include <wx/string.h>

inline const wxString APP_NAME = "Slidesmith";
inline const wxString APP_VERSION = "0.3";
inline const wxString CONFIG_FILE_NAME = "slidesmith.ini";

inline constexpr int MAX_CHAPTER_POINTS = 4;

// Layout type names, indexed by point count - 1.
inline constexpr std::array<std::string_view, MAX_CHAPTER_POINTS> LAYOUT_NAMES{"one_point", "two_points", "three_points", "four_points"};

// Template slide order expected by the deck generator.
inline constexpr std::size_t COVER_TEMPLATE_INDEX = 0;
inline constexpr std::size_t CATALOG_TEMPLATE_INDEX = 1;
inline constexpr std::size_t TEMPLATE_SLIDE_COUNT = 5;

inline constexpr const char* NS_PACKAGE_RELATIONSHIPS = "http://schemas.openxmlformats.org/package/2006/relationships";

inline constexpr const char* REL_TYPE_OFFICE_DOCUMENT = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
inline constexpr const char* REL_TYPE_SLIDE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slide";
inline constexpr const char* REL_TYPE_SLIDE_LAYOUT = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slideLayout";
inline constexpr const char* REL_TYPE_SLIDE_MASTER = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slideMaster";
inline constexpr const char* REL_TYPE_NOTES_SLIDE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/notesSlide";
inline constexpr const char* REL_TYPE_IMAGE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";

inline constexpr const char* CONTENT_TYPE_SLIDE = "application/vnd.openxmlformats-officedocument.presentationml.slide+xml";
