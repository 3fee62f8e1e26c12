/* style_extractor.cpp - turns an example slide into a new catalog style.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "style_extractor.hpp"
#include "exceptions.hpp"
#include "shape_xml.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/translation.h>

namespace {
struct extracted_shape {
	std::string key;
	cshape data;
	bool merged{false};
};
} // namespace

const style& style_extractor::add_style_from_slide(const slide& source, const std::string& layout_name, const std::string& style_name) {
	layout_type* layout = catalog.find_layout(layout_name);
	if (layout == nullptr) {
		throw catalog_exception(wxString::Format(_("Layout %s not found"), wxString::FromUTF8(layout_name)), catalog_error_code::not_found);
	}
	if (layout->styles.contains(style_name)) {
		throw catalog_exception(wxString::Format(_("Style %s already exists in layout %s"), wxString::FromUTF8(style_name), wxString::FromUTF8(layout_name)), catalog_error_code::already_exists);
	}
	std::vector<extracted_shape> extracted;
	std::int64_t max_area = 0;
	const auto shapes = source.shapes();
	for (std::size_t i = 0; i < shapes.size(); ++i) {
		const shape& current = shapes[i];
		if (current.is_placeholder()) {
			continue;
		}
		const int zorder = static_cast<int>(i);
		const std::string key = current.name() + "_" + std::to_string(i);
		cshape data;
		data.zorder = zorder;
		data.locations.push_back(current.geometry());
		if (current.kind() == shape_kind::picture) {
			if (!wxFileName::DirExists(settings.picture_dir) && !wxFileName::Mkdir(settings.picture_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
				throw generation_exception(wxString::Format(_("Cannot create picture directory %s"), settings.picture_dir));
			}
			const wxString path = wxFileName(settings.picture_dir, wxString::FromUTF8(key) + ".png").GetFullPath();
			if (!write_file(path, source.image_blob(current))) {
				throw generation_exception(wxString::Format(_("Failed to write picture %s"), path));
			}
			data.type = content_type::picture;
			data.path = path.utf8_string();
		} else if (current.has_text_frame()) {
			data.xml = remove_cust_data_list(current.xml());
			max_area = std::max(max_area, data.locations.front().area());
			data.type = trim_string(current.text()).empty() ? content_type::none : content_type::content;
		} else {
			data.xml = remove_cust_data_list(current.xml());
		}
		wxLogDebug("Extracted %s as %s", wxString::FromUTF8(key), wxString::FromUTF8(std::string(content_type_name(data.type))));
		extracted.push_back({key, std::move(data)});
	}
	// The largest text shape is taken as the body; noticeably smaller ones are titles or numbers.
	for (auto& item : extracted) {
		if (item.data.type != content_type::content || !item.data.xml) {
			continue;
		}
		if (item.data.locations.front().area() < max_area - settings.area_slack) {
			const std::string text = text_from_xml(*item.data.xml);
			item.data.type = !text.empty() && is_all_digits(text) ? content_type::number : content_type::title;
		}
	}
	for (auto& item : extracted) {
		if (item.merged || !item.data.xml) {
			continue;
		}
		for (auto& other : extracted) {
			if (&other == &item || other.merged || !other.data.xml) {
				continue;
			}
			if (are_same_shape(*item.data.xml, *other.data.xml)) {
				item.data.locations.insert(item.data.locations.end(), other.data.locations.begin(), other.data.locations.end());
				other.data.xml.reset();
				other.merged = true;
			}
		}
	}
	style result{style_name, {}};
	for (auto& item : extracted) {
		if (!item.merged) {
			result.shapes.emplace(item.key, std::move(item.data));
		}
	}
	const std::size_t shape_count = result.shapes.size();
	const style& added = layout->styles.emplace(style_name, std::move(result)).first->second;
	wxLogMessage(_("Added style '%s' to layout '%s' with %d shapes"), wxString::FromUTF8(style_name), wxString::FromUTF8(layout_name), static_cast<int>(shape_count));
	return added;
}
