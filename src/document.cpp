/* document.cpp - queries over a parsed Markdown document.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "document.hpp"
#include <string>
#include <vector>

std::string markdown_document::title() const {
	const heading* h = main_heading();
	return h != nullptr ? h->text : std::string{};
}

std::vector<element_id> markdown_document::headings(int level) const {
	std::vector<element_id> result;
	for (const element_id id : tree.descendants(root())) {
		const heading* h = tree.get_if<heading>(id);
		if (h != nullptr && h->level == level) {
			result.push_back(id);
		}
	}
	return result;
}

// Chapters are the level-2 headings below the main heading, in document order.
std::vector<element_id> markdown_document::chapters() const {
	std::vector<element_id> result;
	if (main == null_element) {
		return result;
	}
	for (const element_id id : tree.descendants(main)) {
		const heading* h = tree.get_if<heading>(id);
		if (h != nullptr && h->level == 2) {
			result.push_back(id);
		}
	}
	return result;
}

std::string markdown_document::text(bool strip) const {
	return tree.get_text(root(), "\n", strip);
}
