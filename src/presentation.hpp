/* presentation.hpp - in-memory PPTX package: parts, relationships, slides.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "shape.hpp"
#include <cstddef>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <pugixml.hpp>
#include <wx/string.h>

struct relationship {
	std::string id;
	std::string type;
	std::string target;
	bool external{false};
};

// Relationships of one source part. The package itself is the empty source.
class relationship_set {
public:
	relationship_set() = default;
	explicit relationship_set(std::string source) : source_part{std::move(source)} {
	}

	static relationship_set parse(const std::string& source, const std::string& xml);
	[[nodiscard]] std::string to_xml() const;

	[[nodiscard]] const std::string& source() const noexcept {
		return source_part;
	}

	[[nodiscard]] const std::vector<relationship>& items() const noexcept {
		return rels;
	}

	[[nodiscard]] bool empty() const noexcept {
		return rels.empty();
	}

	[[nodiscard]] const relationship* find(std::string_view id) const;
	[[nodiscard]] const relationship* find_by_type(std::string_view type) const;
	// Part name a relationship points at, or "" for external or unknown ids.
	[[nodiscard]] std::string target_part(std::string_view id) const;
	[[nodiscard]] std::string target_part(const relationship& rel) const;
	std::string add(const std::string& type, const std::string& part_name);
	// Keeps the relationship id as given.
	void insert(relationship rel);
	void remove(std::string_view id);
	[[nodiscard]] std::string next_id() const;

private:
	std::string source_part;
	std::vector<relationship> rels;
};

[[nodiscard]] std::string rels_part_name(std::string_view source_part);

class slide;

class presentation {
public:
	presentation() = default;
	~presentation() = default;
	presentation(const presentation&) = delete;
	presentation& operator=(const presentation&) = delete;
	presentation(presentation&&) = delete;
	presentation& operator=(presentation&&) = delete;

	static std::unique_ptr<presentation> load(const wxString& path);
	// Builds a package from part name to raw content.
	static std::unique_ptr<presentation> from_parts(const std::map<std::string, std::string>& parts);
	[[nodiscard]] std::map<std::string, std::string> to_parts() const;
	void save(const wxString& path) const;

	[[nodiscard]] std::size_t slide_count() const;
	[[nodiscard]] slide get_slide(std::size_t index);
	[[nodiscard]] std::vector<slide> slides();
	[[nodiscard]] std::optional<std::size_t> index_of(const slide& target) const;
	// New slide carrying empty copies of the layout's placeholders, appended at the end.
	slide add_slide(const std::string& layout_part);
	// Deep copy of a slide without notes, tags or customer data, appended at the end.
	slide duplicate_slide(std::size_t index);
	void move_slide(std::size_t from, std::size_t to);
	void remove_slide(std::size_t index);
	// Stores an image as ppt/media/imageN.ext and returns the part name.
	std::string add_media(const std::string& data, std::string_view extension);

	[[nodiscard]] bool has_part(const std::string& name) const;
	[[nodiscard]] std::string part_data(const std::string& name) const;
	[[nodiscard]] pugi::xml_document& xml_part(const std::string& name);
	[[nodiscard]] const pugi::xml_document& xml_part(const std::string& name) const;
	relationship_set& relationships(const std::string& source_part);
	[[nodiscard]] const relationship_set* find_relationships(const std::string& source_part) const;

	[[nodiscard]] const std::string& main_part() const noexcept {
		return presentation_part;
	}

	[[nodiscard]] std::vector<std::string> layout_parts() const;
	[[nodiscard]] std::string layout_of(const std::string& slide_part) const;
	[[nodiscard]] std::optional<location> inherited_geometry(const std::string& slide_part, const std::string& placeholder_type, std::optional<unsigned int> placeholder_idx) const;

private:
	std::map<std::string, std::string> binary_parts;
	std::map<std::string, std::unique_ptr<pugi::xml_document>> xml_parts;
	std::map<std::string, relationship_set> rel_sets;
	std::string presentation_part;

	void store_part(const std::string& name, const std::string& data);
	void resolve_main_part();
	[[nodiscard]] pugi::xml_node slide_id_list() const;
	[[nodiscard]] std::vector<pugi::xml_node> slide_ids() const;
	[[nodiscard]] std::string slide_part_at(std::size_t index) const;
	[[nodiscard]] std::string next_part_name(const std::string& prefix, std::string_view extension) const;
	slide register_slide(const std::string& part_name, std::unique_ptr<pugi::xml_document> doc);
	void add_override(const std::string& part_name, const char* content_type);
	void remove_override(const std::string& part_name);
	void ensure_default(std::string_view extension, const std::string& content_type);
	void drop_part(const std::string& name);
};

class slide {
public:
	slide(presentation* pres, std::string name) : owner{pres}, part{std::move(name)} {
	}

	[[nodiscard]] const std::string& part_name() const noexcept {
		return part;
	}

	[[nodiscard]] presentation& package() const noexcept {
		return *owner;
	}

	[[nodiscard]] pugi::xml_node shape_tree() const;
	// Top-level shapes in paint order.
	[[nodiscard]] std::vector<shape> shapes() const;
	[[nodiscard]] std::vector<shape> placeholders() const;
	[[nodiscard]] std::optional<shape> find_placeholder(std::initializer_list<std::string_view> types) const;
	[[nodiscard]] unsigned int next_shape_id() const;
	// Parses a shape fragment and inserts it before p:extLst.
	shape insert_shape_xml(const std::string& xml, const std::optional<location>& loc = std::nullopt);
	void remove_shape(const shape& target);
	shape add_picture(const std::string& image_part, const location& loc, unsigned int id, const std::string& name);
	[[nodiscard]] std::string image_blob(const shape& picture) const;
	[[nodiscard]] std::string layout_part() const;

	bool operator==(const slide& other) const noexcept {
		return owner == other.owner && part == other.part;
	}

private:
	presentation* owner;
	std::string part;
};
