/* slide_pages.hpp - builds each kind of generated slide from its template slide.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "layout_catalog.hpp"
#include "presentation.hpp"
#include "synthesis_session.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct chapter_content {
	std::string title;
	// One entry per direct child of the chapter heading.
	std::vector<std::string> point_titles;
	std::vector<std::string> point_texts;
};

enum class catalog_direction {
	horizontal,
	vertical,
	undefined
};

// One numbered entry found on a catalog template slide.
struct catalog_item {
	shape number;
	shape label;
	std::optional<shape> background;
};

class page_builder {
public:
	page_builder(presentation& target, const layout_catalog& styles, const synthesis_settings& options, synthesis_session& state) : deck{target}, catalog{styles}, settings{options}, session{state} {
	}

	void cover_page(std::size_t template_index, const std::string& title);
	// Fills the catalog slide, spilling onto copies placed right after it. Returns the index of the last catalog slide.
	std::size_t catalog_page(std::size_t template_index, const std::vector<std::string>& chapter_titles, int begin_number = 1);
	void chapter_home_page(std::size_t template_index, const std::string& title, int chapter_number, std::size_t target_index);
	void chapter_content_page(std::size_t template_index, const chapter_content& chapter, std::size_t target_index);
	void end_page(std::size_t template_index, std::size_t target_index, const std::optional<std::string>& text = std::nullopt);

	[[nodiscard]] std::vector<catalog_item> find_catalog_items(const slide& catalog_slide) const;

private:
	presentation& deck;
	const layout_catalog& catalog;
	const synthesis_settings& settings;
	synthesis_session& session;

	void place_style(slide& target, const style& chosen, const chapter_content& chapter);
};

[[nodiscard]] catalog_direction detect_catalog_direction(const std::vector<location>& numbers);
