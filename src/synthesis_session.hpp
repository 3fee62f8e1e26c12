/* synthesis_session.hpp - tunable thresholds and per-run state of deck synthesis.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <wx/string.h>

// Geometric heuristics are tuned by hand against real templates. None of them is a guarantee.
struct synthesis_settings {
	// Catalog number shapes: at most this many characters and this value.
	int max_catalog_number_length{3};
	int max_catalog_number{49};
	// A background belongs to a catalog number closer than its height times this.
	double background_tolerance{1.5};
	// Text shapes smaller than the largest by more than this area (EMU squared) are titles or numbers.
	std::int64_t area_slack{10000};
	wxString picture_dir{"components/picture"};
	std::string cover_fallback_title{"Presentation Title"};
	std::string end_page_text{"Thank you!"};
	// 0 seeds from the system.
	unsigned int random_seed{0};
};

enum class chapter_number_style {
	digits,
	part_digits,
	part_words
};

class synthesis_session {
public:
	explicit synthesis_session(unsigned int seed = 0);

	[[nodiscard]] std::mt19937& rng() noexcept {
		return engine;
	}

	// Chosen on first use, then the same for every chapter of the run.
	[[nodiscard]] chapter_number_style number_style();
	[[nodiscard]] std::string format_chapter_number(int number);
	// Random image from a directory, avoiding repeats until the directory is used up.
	[[nodiscard]] wxString pick_picture(const wxString& directory);

private:
	std::mt19937 engine;
	std::optional<chapter_number_style> selected_style;
	std::map<wxString, std::set<wxString>> used_pictures;
};
