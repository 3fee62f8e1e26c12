/* slide_pages.cpp - builds each kind of generated slide from its template slide.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "slide_pages.hpp"
#include "constants.hpp"
#include "exceptions.hpp"
#include "shape_xml.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/translation.h>

namespace {
struct catalog_candidate {
	shape handle;
	location loc;
	std::string text;
	bool has_text{false};
	bool claimed{false};
};

double corner_distance(const location& a, const location& b) {
	const auto dx = static_cast<double>(a.x - b.x);
	const auto dy = static_cast<double>(a.y - b.y);
	return std::sqrt((dx * dx) + (dy * dy));
}

std::int64_t overlap(std::int64_t start_a, std::int64_t length_a, std::int64_t start_b, std::int64_t length_b) {
	return std::min(start_a + length_a, start_b + length_b) - std::max(start_a, start_b);
}

bool looks_like_chapter_number(const std::string& text) {
	if (text.size() > 1 && text.front() == '0' && is_all_digits(std::string_view(text).substr(1))) {
		return true;
	}
	if (to_lower(text).starts_with("part")) {
		return true;
	}
	return text.size() > 1 && text.back() == '.' && is_all_digits(std::string_view(text).substr(0, text.size() - 1));
}

std::optional<shape> title_placeholder(const slide& page) {
	return page.find_placeholder({"title", "ctrTitle"});
}

wxString describe(const catalog_candidate& c) {
	return wxString::Format("'%s' text '%s' at (%lld, %lld) size %lldx%lld", wxString::FromUTF8(c.handle.name()), wxString::FromUTF8(c.text), static_cast<long long>(c.loc.x), static_cast<long long>(c.loc.y), static_cast<long long>(c.loc.width), static_cast<long long>(c.loc.height));
}
} // namespace

catalog_direction detect_catalog_direction(const std::vector<location>& numbers) {
	if (numbers.size() < 2) {
		return catalog_direction::undefined;
	}
	std::vector<location> sorted = numbers;
	std::ranges::sort(sorted, [](const location& a, const location& b) {
		return a.x != b.x ? a.x < b.x : a.y < b.y;
	});
	double horizontal = 0;
	double vertical = 0;
	for (std::size_t i = 0; i + 1 < sorted.size(); ++i) {
		horizontal += std::abs(static_cast<double>(sorted[i + 1].x - sorted[i].x));
		vertical += std::abs(static_cast<double>(sorted[i + 1].y - sorted[i].y));
	}
	const auto steps = static_cast<double>(sorted.size() - 1);
	return horizontal / steps > vertical / steps ? catalog_direction::horizontal : catalog_direction::vertical;
}

std::vector<catalog_item> page_builder::find_catalog_items(const slide& catalog_slide) const {
	std::vector<catalog_candidate> candidates;
	for (const auto& current : catalog_slide.shapes()) {
		if (current.is_placeholder()) {
			continue;
		}
		const bool has_text = current.has_text_frame();
		candidates.push_back({current, current.geometry(), has_text ? trim_string(current.text()) : std::string{}, has_text});
	}
	struct number_entry {
		std::size_t index;
		int value;
	};
	std::vector<number_entry> numbers;
	for (std::size_t i = 0; i < candidates.size(); ++i) {
		const auto& c = candidates[i];
		if (!c.has_text || c.text.empty() || static_cast<int>(c.text.size()) > settings.max_catalog_number_length) {
			continue;
		}
		std::string digits = c.text;
		if (digits.size() > 1 && digits.back() == '.') {
			digits.pop_back();
		}
		if (!is_all_digits(digits)) {
			continue;
		}
		const int value = std::stoi(digits);
		if (value > settings.max_catalog_number) {
			continue;
		}
		numbers.push_back({i, value});
	}
	if (numbers.empty()) {
		throw template_exception(_("Catalog slide has no chapter numbers"));
	}
	std::ranges::stable_sort(numbers, [](const number_entry& a, const number_entry& b) {
		return a.value < b.value;
	});
	std::vector<location> number_locations;
	for (const auto& n : numbers) {
		candidates[n.index].claimed = true;
		number_locations.push_back(candidates[n.index].loc);
	}
	const catalog_direction direction = detect_catalog_direction(number_locations);
	wxLogDebug("Catalog has %d numbers, direction %d", static_cast<int>(numbers.size()), static_cast<int>(direction));
	std::vector<catalog_item> items;
	std::vector<std::size_t> item_numbers;
	for (const auto& n : numbers) {
		const location& number_loc = candidates[n.index].loc;
		double min_distance = std::numeric_limits<double>::infinity();
		std::optional<std::size_t> closest;
		for (std::size_t i = 0; i < candidates.size(); ++i) {
			const auto& c = candidates[i];
			if (c.claimed || !c.has_text) {
				continue;
			}
			const double distance = corner_distance(number_loc, c.loc);
			bool eligible = true;
			switch (direction) {
				case catalog_direction::horizontal:
					eligible = c.loc.y > number_loc.y && overlap(number_loc.x, number_loc.width, c.loc.x, c.loc.width) > 0;
					break;
				case catalog_direction::vertical:
					eligible = c.loc.x > number_loc.x && overlap(number_loc.y, number_loc.height, c.loc.y, c.loc.height) > 0;
					break;
				case catalog_direction::undefined:
					break;
			}
			if (eligible && distance < min_distance) {
				min_distance = distance;
				closest = i;
			}
		}
		if (!closest) {
			throw template_exception(wxString::Format(_("Catalog number %s has no matching title shape"), describe(candidates[n.index])));
		}
		candidates[*closest].claimed = true;
		items.push_back({candidates[n.index].handle, candidates[*closest].handle, std::nullopt});
		item_numbers.push_back(n.index);
	}
	const auto unclaimed = std::ranges::count_if(candidates, [](const catalog_candidate& c) { return !c.claimed; });
	if (static_cast<std::size_t>(unclaimed) >= items.size()) {
		for (std::size_t item = 0; item < items.size(); ++item) {
			const location& number_loc = candidates[item_numbers[item]].loc;
			double min_distance = std::numeric_limits<double>::infinity();
			std::optional<std::size_t> background;
			for (std::size_t i = 0; i < candidates.size(); ++i) {
				if (candidates[i].claimed) {
					continue;
				}
				const double distance = corner_distance(number_loc, candidates[i].loc);
				if (distance < min_distance) {
					min_distance = distance;
					if (min_distance < static_cast<double>(candidates[i].loc.height) * settings.background_tolerance) {
						background = i;
					}
				}
			}
			if (background) {
				candidates[*background].claimed = true;
				items[item].background = candidates[*background].handle;
			}
		}
	}
	return items;
}

void page_builder::cover_page(std::size_t template_index, const std::string& title) {
	const slide page = deck.get_slide(template_index);
	auto placeholder = title_placeholder(page);
	if (!placeholder) {
		throw template_exception(wxString::Format(_("No title placeholder on cover slide %d"), static_cast<int>(template_index + 1)));
	}
	placeholder->set_text(trim_string(title).empty() ? settings.cover_fallback_title : title);
	placeholder->set_word_wrap(false);
}

std::size_t page_builder::catalog_page(std::size_t template_index, const std::vector<std::string>& chapter_titles, int begin_number) {
	if (chapter_titles.empty()) {
		throw generation_exception(_("The catalog needs at least one chapter"));
	}
	slide page = deck.get_slide(template_index);
	const auto items = find_catalog_items(page);
	if (items.size() < chapter_titles.size()) {
		// Copy before filling so the overflow page starts from the pristine template.
		deck.duplicate_slide(template_index);
		deck.move_slide(deck.slide_count() - 1, template_index + 1);
	}
	for (std::size_t i = chapter_titles.size(); i < items.size(); ++i) {
		page.remove_shape(items[i].number);
		page.remove_shape(items[i].label);
		if (items[i].background) {
			page.remove_shape(*items[i].background);
		}
	}
	const std::size_t filled = std::min(items.size(), chapter_titles.size());
	for (std::size_t i = 0; i < filled; ++i) {
		shape label = items[i].label;
		shape number = items[i].number;
		label.set_text(chapter_titles[i]);
		number.set_text(zero_pad(begin_number + static_cast<int>(i)));
	}
	wxLogDebug("Catalog slide %d holds chapters %d to %d", static_cast<int>(template_index + 1), begin_number, begin_number + static_cast<int>(filled) - 1);
	if (filled < chapter_titles.size()) {
		const std::vector<std::string> rest(chapter_titles.begin() + static_cast<std::ptrdiff_t>(filled), chapter_titles.end());
		return catalog_page(template_index + 1, rest, begin_number + static_cast<int>(filled));
	}
	return template_index;
}

void page_builder::chapter_home_page(std::size_t template_index, const std::string& title, int chapter_number, std::size_t target_index) {
	slide page = deck.duplicate_slide(template_index);
	auto title_shape = title_placeholder(page);
	if (!title_shape) {
		throw template_exception(wxString::Format(_("No title placeholder on chapter home slide %d"), static_cast<int>(template_index + 1)));
	}
	title_shape->set_text(title);
	title_shape->set_word_wrap(false);
	const std::int64_t title_top = title_shape->geometry().y;
	std::optional<shape> index_shape;
	std::int64_t min_distance = std::numeric_limits<std::int64_t>::max();
	for (const auto& current : page.shapes()) {
		if (current == *title_shape || !current.has_text_frame()) {
			continue;
		}
		const std::int64_t top = current.geometry().y;
		if (top >= title_top || title_top - top >= min_distance) {
			continue;
		}
		index_shape = current;
		if (looks_like_chapter_number(trim_string(current.text()))) {
			break;
		}
		min_distance = title_top - top;
	}
	if (index_shape) {
		index_shape->set_text(session.format_chapter_number(chapter_number));
	} else {
		wxLogDebug("Chapter home slide has no index shape above its title");
	}
	deck.move_slide(deck.slide_count() - 1, target_index);
}

void page_builder::chapter_content_page(std::size_t template_index, const chapter_content& chapter, std::size_t target_index) {
	const std::size_t points = chapter.point_titles.size();
	if (points == 0 || points > static_cast<std::size_t>(MAX_CHAPTER_POINTS)) {
		throw generation_exception(wxString::Format(_("Chapter '%s' has %d points; layouts exist for 1 to %d"), wxString::FromUTF8(chapter.title), static_cast<int>(points), MAX_CHAPTER_POINTS));
	}
	const std::string layout_name(LAYOUT_NAMES[points - 1]);
	const style* chosen = catalog.get_random_style(layout_name, session.rng());
	if (chosen == nullptr) {
		throw generation_exception(wxString::Format(_("Catalog has no style for layout %s"), wxString::FromUTF8(layout_name)));
	}
	wxLogDebug("Chapter '%s' uses %s/%s", wxString::FromUTF8(chapter.title), wxString::FromUTF8(layout_name), wxString::FromUTF8(chosen->name));
	// Nothing is added to the deck until the style is known to fit.
	for (const auto& [name, data] : chosen->by_zorder()) {
		switch (data->type) {
			case content_type::content:
			case content_type::title:
				if (data->locations.size() != points) {
					throw generation_exception(wxString::Format(_("Shape %s of style %s has %d locations for %d points"), wxString::FromUTF8(name), wxString::FromUTF8(chosen->name), static_cast<int>(data->locations.size()), static_cast<int>(points)));
				}
				[[fallthrough]];
			case content_type::number:
			case content_type::none:
				if (!data->xml) {
					throw generation_exception(wxString::Format(_("Shape %s of style %s has no XML"), wxString::FromUTF8(name), wxString::FromUTF8(chosen->name)));
				}
				break;
			case content_type::picture:
				if (!data->path) {
					throw generation_exception(wxString::Format(_("Picture %s of style %s has no path"), wxString::FromUTF8(name), wxString::FromUTF8(chosen->name)));
				}
				break;
		}
	}
	slide page = deck.duplicate_slide(template_index);
	if (auto title_shape = title_placeholder(page)) {
		title_shape->set_text(chapter.title);
		title_shape->set_word_wrap(false);
	} else {
		wxLogWarning(_("Chapter content slide %d has no title placeholder"), static_cast<int>(template_index + 1));
	}
	place_style(page, *chosen, chapter);
	deck.move_slide(deck.slide_count() - 1, target_index);
}

void page_builder::place_style(slide& target, const style& chosen, const chapter_content& chapter) {
	for (const auto& [name, data] : chosen.by_zorder()) {
		for (std::size_t i = 0; i < data->locations.size(); ++i) {
			const location& loc = data->locations[i];
			const unsigned int id = target.next_shape_id();
			switch (data->type) {
				case content_type::content:
				case content_type::title: {
					const std::string& text = data->type == content_type::content ? chapter.point_texts[i] : chapter.point_titles[i];
					shape added = target.insert_shape_xml(modify_shape_xml(*data->xml, id, name, text), loc);
					added.set_vertical_anchor("t");
					added.set_alignment("just");
					break;
				}
				case content_type::number:
					target.insert_shape_xml(modify_shape_xml(*data->xml, id, name, zero_pad(static_cast<int>(i) + 1)), loc);
					break;
				case content_type::picture: {
					const wxString literal = wxString::FromUTF8(*data->path);
					const wxString path = is_image_path(*data->path) ? literal : session.pick_picture(literal);
					const auto image = read_file(path);
					if (!image) {
						throw generation_exception(wxString::Format(_("Cannot read picture %s"), path));
					}
					const std::string part = deck.add_media(*image, wxFileName(path).GetExt().utf8_string());
					target.add_picture(part, loc, id, name);
					break;
				}
				case content_type::none:
					target.insert_shape_xml(modify_shape_xml(*data->xml, id, name, std::nullopt), loc);
					break;
			}
			wxLogDebug("Placed %s at (%lld, %lld)", wxString::FromUTF8(name), static_cast<long long>(loc.x), static_cast<long long>(loc.y));
		}
	}
}

void page_builder::end_page(std::size_t template_index, std::size_t target_index, const std::optional<std::string>& text) {
	slide page = deck.duplicate_slide(template_index);
	auto placeholder = title_placeholder(page);
	if (!placeholder) {
		throw template_exception(wxString::Format(_("No title placeholder on end slide %d"), static_cast<int>(template_index + 1)));
	}
	placeholder->set_text(text.value_or(settings.end_page_text));
	placeholder->set_word_wrap(false);
	deck.move_slide(deck.slide_count() - 1, target_index);
}
