/* layout_catalog.cpp - registry of layouts, their styles and the shapes each style places.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "layout_catalog.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <wx/log.h>
#include <wx/translation.h>

using nlohmann::json;

namespace {
constexpr int json_indent = 4;

std::optional<std::string> optional_string(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || it->is_null()) {
		return std::nullopt;
	}
	return it->get<std::string>();
}

json optional_to_json(const std::optional<std::string>& value) {
	return value ? json(*value) : json(nullptr);
}

cshape shape_from_json(const std::string& shape_name, const json& j) {
	if (!j.is_object()) {
		throw catalog_exception(wxString::Format(_("Shape %s is not an object"), wxString::FromUTF8(shape_name)), catalog_error_code::malformed);
	}
	cshape result;
	result.xml = optional_string(j, "xml");
	result.zorder = j.value("zorder", 0);
	result.path = optional_string(j, "path");
	if (const auto name = optional_string(j, "content_type")) {
		if (const auto parsed = parse_content_type(*name)) {
			result.type = *parsed;
		} else {
			wxLogWarning(_("Unknown content type %s on shape %s"), wxString::FromUTF8(*name), wxString::FromUTF8(shape_name));
		}
	}
	if (const auto it = j.find("location"); it != j.end() && it->is_array()) {
		for (const auto& loc : *it) {
			result.locations.push_back({
				loc.value("x", std::int64_t{0}),
				loc.value("y", std::int64_t{0}),
				loc.value("width", std::int64_t{0}),
				loc.value("height", std::int64_t{0}),
			});
		}
	}
	return result;
}

json shape_to_json(const cshape& shape_data) {
	json locations = json::array();
	for (const auto& loc : shape_data.locations) {
		locations.push_back({{"x", loc.x}, {"y", loc.y}, {"width", loc.width}, {"height", loc.height}});
	}
	const std::string_view type_name = content_type_name(shape_data.type);
	return {
		{"xml", optional_to_json(shape_data.xml)},
		{"zorder", shape_data.zorder},
		{"content_type", type_name.empty() ? json(nullptr) : json(std::string(type_name))},
		{"path", optional_to_json(shape_data.path)},
		{"location", std::move(locations)},
	};
}

void require_object(const json& j, const wxString& what) {
	if (!j.is_object()) {
		throw catalog_exception(wxString::Format(_("%s is not an object"), what), catalog_error_code::malformed);
	}
}
} // namespace

std::string_view content_type_name(content_type type) noexcept {
	switch (type) {
		case content_type::none:
			return {};
		case content_type::content:
			return "content";
		case content_type::picture:
			return "picture";
		case content_type::number:
			return "number";
		case content_type::title:
			return "title";
	}
	return {};
}

std::optional<content_type> parse_content_type(std::string_view name) {
	if (name == "content") {
		return content_type::content;
	}
	if (name == "picture") {
		return content_type::picture;
	}
	if (name == "number") {
		return content_type::number;
	}
	if (name == "title") {
		return content_type::title;
	}
	return std::nullopt;
}

std::vector<std::pair<std::string, const cshape*>> style::by_zorder() const {
	std::vector<std::pair<std::string, const cshape*>> ordered;
	ordered.reserve(shapes.size());
	for (const auto& [shape_name, shape_data] : shapes) {
		ordered.emplace_back(shape_name, &shape_data);
	}
	std::ranges::stable_sort(ordered, [](const auto& a, const auto& b) {
		return a.second->zorder < b.second->zorder;
	});
	return ordered;
}

const style* layout_type::find_style(std::string_view style_name) const {
	const auto it = styles.find(std::string(style_name));
	return it == styles.end() ? nullptr : &it->second;
}

std::vector<std::string> layout_type::style_names() const {
	std::vector<std::string> names;
	names.reserve(styles.size());
	for (const auto& [style_name, data] : styles) {
		names.push_back(style_name);
	}
	return names;
}

layout_catalog::layout_catalog(const wxString& path) {
	load(path);
}

void layout_catalog::load(const wxString& path) {
	const auto text = read_file(path);
	if (!text) {
		throw catalog_exception(wxString::Format(_("Failed to read catalog %s"), path), catalog_error_code::not_found);
	}
	from_json(*text);
	wxLogDebug("Loaded catalog %s with %d layouts", path, static_cast<int>(layouts.size()));
}

void layout_catalog::reload(const wxString& path) {
	load(path);
	wxLogMessage(_("Reloaded catalog from %s"), path);
}

void layout_catalog::from_json(const std::string& text) {
	const json j = json::parse(text, nullptr, false);
	if (j.is_discarded()) {
		throw catalog_exception(_("Catalog file is not valid JSON"), catalog_error_code::malformed);
	}
	require_object(j, _("Catalog"));
	std::map<std::string, layout_type, std::less<>> loaded;
	try {
		for (const auto& [layout_name, layout_data] : j.items()) {
			require_object(layout_data, wxString::FromUTF8(layout_name));
			layout_type layout{layout_name, {}};
			for (const auto& [style_name, style_data] : layout_data.items()) {
				require_object(style_data, wxString::FromUTF8(style_name));
				style entry{style_name, {}};
				for (const auto& [shape_name, shape_data] : style_data.items()) {
					entry.shapes.emplace(shape_name, shape_from_json(shape_name, shape_data));
				}
				layout.styles.emplace(style_name, std::move(entry));
			}
			loaded.emplace(layout_name, std::move(layout));
		}
	} catch (const json::exception& e) {
		throw catalog_exception(wxString::Format(_("Malformed catalog: %s"), wxString::FromUTF8(e.what())), catalog_error_code::malformed);
	}
	layouts = std::move(loaded);
}

std::string layout_catalog::to_json() const {
	json j = json::object();
	for (const auto& [layout_name, layout] : layouts) {
		json layout_data = json::object();
		for (const auto& [style_name, entry] : layout.styles) {
			json style_data = json::object();
			for (const auto& [shape_name, shape_data] : entry.shapes) {
				style_data[shape_name] = shape_to_json(shape_data);
			}
			layout_data[style_name] = std::move(style_data);
		}
		j[layout_name] = std::move(layout_data);
	}
	return j.dump(json_indent);
}

void layout_catalog::save(const wxString& path) const {
	if (!write_file(path, to_json())) {
		throw catalog_exception(wxString::Format(_("Failed to write catalog %s"), path));
	}
}

layout_type* layout_catalog::find_layout(std::string_view name) {
	const auto it = layouts.find(name);
	return it == layouts.end() ? nullptr : &it->second;
}

const layout_type* layout_catalog::find_layout(std::string_view name) const {
	const auto it = layouts.find(name);
	return it == layouts.end() ? nullptr : &it->second;
}

layout_type& layout_catalog::get_layout(std::string_view name) {
	if (layout_type* layout = find_layout(name)) {
		return *layout;
	}
	throw catalog_exception(wxString::Format(_("Layout %s not found"), wxString::FromUTF8(std::string(name))), catalog_error_code::not_found);
}

const layout_type& layout_catalog::get_layout(std::string_view name) const {
	if (const layout_type* layout = find_layout(name)) {
		return *layout;
	}
	throw catalog_exception(wxString::Format(_("Layout %s not found"), wxString::FromUTF8(std::string(name))), catalog_error_code::not_found);
}

const style* layout_catalog::get_random_style(std::string_view layout_name, std::mt19937& rng) const {
	const layout_type* layout = find_layout(layout_name);
	if (layout == nullptr || layout->styles.empty()) {
		return nullptr;
	}
	std::uniform_int_distribution<std::size_t> pick(0, layout->styles.size() - 1);
	auto it = layout->styles.begin();
	std::advance(it, static_cast<std::ptrdiff_t>(pick(rng)));
	return &it->second;
}

layout_type& layout_catalog::add_layout(const std::string& name) {
	if (layouts.contains(name)) {
		throw catalog_exception(wxString::Format(_("Layout %s already exists"), wxString::FromUTF8(name)), catalog_error_code::already_exists);
	}
	return layouts.emplace(name, layout_type{name, {}}).first->second;
}

std::vector<std::string> layout_catalog::layout_names() const {
	std::vector<std::string> names;
	names.reserve(layouts.size());
	for (const auto& [name, layout] : layouts) {
		names.push_back(name);
	}
	return names;
}
