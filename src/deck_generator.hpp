/* deck_generator.hpp - assembles a full deck from a Markdown document and a template.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include "document.hpp"
#include "layout_catalog.hpp"
#include "presentation.hpp"
#include "slide_pages.hpp"
#include "synthesis_session.hpp"
#include <cstddef>

// Title and per-point texts of one level-2 heading.
[[nodiscard]] chapter_content make_chapter_content(const markdown_document& doc, element_id chapter);

class deck_generator {
public:
	deck_generator(const layout_catalog& styles, const synthesis_settings& options) : catalog{styles}, settings{options}, state{options.random_seed} {
	}

	// Rewrites the template in place: cover, catalog, a home and content slide per chapter, end.
	// The chapter home, chapter content and end templates are removed afterwards.
	void generate(presentation& deck, const markdown_document& doc, std::size_t cover_index = COVER_TEMPLATE_INDEX, std::size_t catalog_index = CATALOG_TEMPLATE_INDEX);

	[[nodiscard]] synthesis_session& session() noexcept {
		return state;
	}

private:
	const layout_catalog& catalog;
	synthesis_settings settings;
	synthesis_session state;
};
