/* deck_generator.cpp - assembles a full deck from a Markdown document and a template.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "deck_generator.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <wx/log.h>
#include <wx/translation.h>

chapter_content make_chapter_content(const markdown_document& doc, element_id chapter) {
	chapter_content content;
	content.title = doc.tree.at(chapter).element_text();
	for (const element_id child : doc.tree.children(chapter)) {
		content.point_titles.push_back(doc.tree.at(child).element_text());
		content.point_texts.push_back(doc.tree.get_text(child, "\n", true));
	}
	return content;
}

void deck_generator::generate(presentation& deck, const markdown_document& doc, std::size_t cover_index, std::size_t catalog_index) {
	if (doc.headings(1).empty()) {
		throw document_exception(_("The document needs at least one level 1 heading"));
	}
	if (doc.main_heading() == nullptr) {
		throw document_exception(_("The document has no main heading"));
	}
	const auto chapters = doc.chapters();
	if (chapters.empty()) {
		throw document_exception(_("The document needs at least one level 2 heading"));
	}
	if (deck.slide_count() < TEMPLATE_SLIDE_COUNT || catalog_index + 4 > deck.slide_count()) {
		throw template_exception(wxString::Format(_("The template needs %d slides but has %d"), static_cast<int>(TEMPLATE_SLIDE_COUNT), static_cast<int>(deck.slide_count())));
	}
	std::vector<chapter_content> contents;
	std::vector<std::string> titles;
	for (const element_id chapter : chapters) {
		chapter_content content = make_chapter_content(doc, chapter);
		const std::size_t points = content.point_titles.size();
		if (points == 0 || points > static_cast<std::size_t>(MAX_CHAPTER_POINTS)) {
			throw generation_exception(wxString::Format(_("Chapter '%s' has %d points; layouts exist for 1 to %d"), wxString::FromUTF8(content.title), static_cast<int>(points), MAX_CHAPTER_POINTS));
		}
		titles.push_back(content.title);
		contents.push_back(std::move(content));
	}
	page_builder pages(deck, catalog, settings, state);
	pages.cover_page(cover_index, doc.title());
	const std::size_t catalog_last = pages.catalog_page(catalog_index, titles);
	const std::size_t home_template = catalog_last + 1;
	const std::size_t content_template = home_template + 1;
	const std::size_t end_template = content_template + 1;
	std::size_t next_index = end_template + 1;
	for (std::size_t i = 0; i < contents.size(); ++i) {
		pages.chapter_home_page(home_template, contents[i].title, static_cast<int>(i + 1), next_index++);
		pages.chapter_content_page(content_template, contents[i], next_index++);
	}
	pages.end_page(end_template, next_index);
	std::vector<std::size_t> templates{home_template, content_template, end_template};
	std::ranges::sort(templates, std::greater<>());
	for (const std::size_t index : templates) {
		deck.remove_slide(index);
	}
	wxLogMessage(_("Generated %d slides for %d chapters"), static_cast<int>(deck.slide_count()), static_cast<int>(chapters.size()));
}
