/* shape.hpp - handle over one shape element of a slide.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <pugixml.hpp>

class presentation;

// A rectangle in EMU.
struct location {
	std::int64_t x{0};
	std::int64_t y{0};
	std::int64_t width{0};
	std::int64_t height{0};

	bool operator==(const location&) const = default;

	[[nodiscard]] std::int64_t area() const noexcept {
		return width * height;
	}
};

enum class shape_kind {
	autoshape,
	picture,
	group,
	graphic_frame,
	connector,
	other
};

class shape {
public:
	shape(pugi::xml_node node, const presentation* pres, std::string part) : element_node{node}, owner{pres}, slide_part{std::move(part)} {
	}

	[[nodiscard]] pugi::xml_node node() const noexcept {
		return element_node;
	}

	[[nodiscard]] const std::string& part_name() const noexcept {
		return slide_part;
	}

	[[nodiscard]] unsigned int id() const;
	[[nodiscard]] std::string name() const;
	void set_identity(unsigned int id, const std::string& name);
	[[nodiscard]] shape_kind kind() const;
	[[nodiscard]] bool is_placeholder() const;
	// OOXML placeholder type, "obj" when the placeholder does not name one.
	[[nodiscard]] std::string placeholder_type() const;
	[[nodiscard]] std::optional<unsigned int> placeholder_idx() const;
	[[nodiscard]] bool has_text_frame() const;
	[[nodiscard]] std::string text() const;
	// Own a:xfrm, else the matching layout or master placeholder's.
	[[nodiscard]] location geometry() const;
	void set_geometry(const location& loc);
	void set_text(const std::string& text);
	void set_word_wrap(bool wrap);
	void set_vertical_anchor(const char* anchor);
	void set_alignment(const char* alignment);
	// Standalone fragment carrying the slide's namespace declarations.
	[[nodiscard]] std::string xml() const;

	bool operator==(const shape& other) const noexcept {
		return element_node == other.element_node;
	}

private:
	pugi::xml_node element_node;
	const presentation* owner;
	std::string slide_part;

	[[nodiscard]] pugi::xml_node non_visual_props() const;
	[[nodiscard]] pugi::xml_node tx_body() const;
	[[nodiscard]] pugi::xml_node xfrm() const;
	pugi::xml_node ensure_xfrm();
	pugi::xml_node ensure_body_pr();
};

// Reads a:off and a:ext from a transform element.
[[nodiscard]] std::optional<location> read_xfrm(pugi::xml_node xfrm);
// Transform element of a shape-tree child, whichever flavor it uses.
[[nodiscard]] pugi::xml_node shape_xfrm(pugi::xml_node shape_node);
[[nodiscard]] bool is_shape_element(pugi::xml_node node);
