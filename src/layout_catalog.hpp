/* layout_catalog.hpp - registry of layouts, their styles and the shapes each style places.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "shape.hpp"
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/string.h>

enum class content_type {
	none,
	content,
	picture,
	number,
	title
};

// Name used in the catalog file; none has no name and is stored as null.
[[nodiscard]] std::string_view content_type_name(content_type type) noexcept;
[[nodiscard]] std::optional<content_type> parse_content_type(std::string_view name);

struct cshape {
	std::optional<std::string> xml;
	int zorder{0};
	content_type type{content_type::none};
	std::optional<std::string> path;
	// Every position this shape recurs at, in placement order.
	std::vector<location> locations;

	bool operator==(const cshape&) const = default;
};

struct style {
	std::string name;
	std::map<std::string, cshape> shapes;

	// Shapes in paint order. Ties keep name order.
	[[nodiscard]] std::vector<std::pair<std::string, const cshape*>> by_zorder() const;

	bool operator==(const style&) const = default;
};

struct layout_type {
	std::string name;
	std::map<std::string, style> styles;

	[[nodiscard]] const style* find_style(std::string_view style_name) const;
	[[nodiscard]] std::vector<std::string> style_names() const;

	bool operator==(const layout_type&) const = default;
};

class layout_catalog {
public:
	layout_catalog() = default;
	explicit layout_catalog(const wxString& path);

	void load(const wxString& path);
	void save(const wxString& path) const;
	// Replaces the loaded catalog with the file's. The old one stays if the file is bad.
	void reload(const wxString& path);
	void from_json(const std::string& text);
	[[nodiscard]] std::string to_json() const;

	[[nodiscard]] layout_type* find_layout(std::string_view name);
	[[nodiscard]] const layout_type* find_layout(std::string_view name) const;
	[[nodiscard]] layout_type& get_layout(std::string_view name);
	[[nodiscard]] const layout_type& get_layout(std::string_view name) const;
	[[nodiscard]] const style* get_random_style(std::string_view layout_name, std::mt19937& rng) const;
	layout_type& add_layout(const std::string& name);
	[[nodiscard]] std::vector<std::string> layout_names() const;

	[[nodiscard]] bool empty() const noexcept {
		return layouts.empty();
	}

	bool operator==(const layout_catalog&) const = default;

private:
	std::map<std::string, layout_type, std::less<>> layouts;
};
