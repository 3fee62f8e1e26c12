/* document.hpp - parsed Markdown document interface header file.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "element.hpp"
#include <string>
#include <vector>
#include <wx/string.h>

struct markdown_document {
	wxString file_name;
	element_tree tree;
	element_id main{null_element};

	markdown_document() = default;
	~markdown_document() = default;
	markdown_document(const markdown_document&) = delete;
	markdown_document& operator=(const markdown_document&) = delete;
	markdown_document(markdown_document&&) = default;
	markdown_document& operator=(markdown_document&&) = default;

	[[nodiscard]] element_id root() const noexcept {
		return element_tree::root();
	}

	[[nodiscard]] const heading* main_heading() const noexcept {
		return tree.get_if<heading>(main);
	}

	[[nodiscard]] std::string title() const;
	[[nodiscard]] std::vector<element_id> headings(int level) const;
	[[nodiscard]] std::vector<element_id> chapters() const;
	[[nodiscard]] std::string text(bool strip = false) const;
};
