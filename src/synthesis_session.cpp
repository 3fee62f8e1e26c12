/* synthesis_session.cpp - tunable thresholds and per-run state of deck synthesis.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "synthesis_session.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <vector>
#include <wx/arrstr.h>
#include <wx/dir.h>
#include <wx/log.h>
#include <wx/translation.h>

synthesis_session::synthesis_session(unsigned int seed) : engine{seed != 0 ? seed : std::random_device{}()} {
}

chapter_number_style synthesis_session::number_style() {
	if (!selected_style) {
		std::uniform_int_distribution<int> pick(0, 2);
		selected_style = static_cast<chapter_number_style>(pick(engine));
		wxLogDebug("Chapter numbers use style %d", static_cast<int>(*selected_style));
	}
	return *selected_style;
}

std::string synthesis_session::format_chapter_number(int number) {
	switch (number_style()) {
		case chapter_number_style::digits:
			return zero_pad(number);
		case chapter_number_style::part_digits:
			return "PART " + zero_pad(number);
		case chapter_number_style::part_words: {
			std::string words = number_to_words(number);
			std::transform(words.begin(), words.end(), words.begin(), [](unsigned char ch) {
				return static_cast<char>(std::toupper(ch));
			});
			return "PART " + words;
		}
	}
	return zero_pad(number);
}

wxString synthesis_session::pick_picture(const wxString& directory) {
	wxArrayString found;
	if (wxDir::Exists(directory)) {
		wxDir::GetAllFiles(directory, &found, wxEmptyString, wxDIR_FILES);
	}
	std::vector<wxString> pictures;
	for (const auto& file : found) {
		if (is_image_path(file.utf8_string())) {
			pictures.push_back(file);
		}
	}
	if (pictures.empty()) {
		throw generation_exception(wxString::Format(_("No pictures found in %s"), directory));
	}
	std::sort(pictures.begin(), pictures.end());
	auto& used = used_pictures[directory];
	std::vector<wxString> available;
	std::copy_if(pictures.begin(), pictures.end(), std::back_inserter(available), [&](const wxString& p) {
		return !used.contains(p);
	});
	if (available.empty()) {
		used.clear();
		available = pictures;
	}
	std::uniform_int_distribution<std::size_t> pick(0, available.size() - 1);
	const wxString chosen = available[pick(engine)];
	used.insert(chosen);
	return chosen;
}
