/* markdown_parser.hpp - line-oriented Markdown parser header file.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <wx/string.h>

class markdown_parser {
public:
	markdown_parser() = default;
	~markdown_parser() = default;
	markdown_parser(const markdown_parser&) = delete;
	markdown_parser& operator=(const markdown_parser&) = delete;
	markdown_parser(markdown_parser&&) = delete;
	markdown_parser& operator=(markdown_parser&&) = delete;

	[[nodiscard]] std::unique_ptr<markdown_document> load(const wxString& path) const;
	[[nodiscard]] std::unique_ptr<markdown_document> parse(std::string_view text) const;

	// Builds the heading for a two-line Setext pair. Only levels 1 and 2 exist.
	static element_id make_setext_heading(element_tree& tree, const std::string& line, const std::string& underline, int level);
};
