/* shape.cpp - handle over one shape element of a slide.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "shape.hpp"
#include "presentation.hpp"
#include "shape_xml.hpp"
#include <cstring>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <pugixml.hpp>

namespace {
pugi::xml_node document_root_of(pugi::xml_node node) {
	for (pugi::xml_node child : node.root().children()) {
		if (child.type() == pugi::node_element) {
			return child;
		}
	}
	return {};
}

std::vector<std::string> split_text_lines(const std::string& text) {
	std::vector<std::string> lines;
	std::istringstream iss(text);
	std::string line;
	while (std::getline(iss, line)) {
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		lines.push_back(line);
	}
	if (lines.empty()) {
		lines.emplace_back();
	}
	return lines;
}

pugi::xml_node ensure_child(pugi::xml_node parent, const char* name, const char* qname, bool prepend = false) {
	if (pugi::xml_node existing = find_child(parent, name)) {
		return existing;
	}
	return prepend ? parent.prepend_child(qname) : parent.append_child(qname);
}
} // namespace

std::optional<location> read_xfrm(pugi::xml_node xfrm) {
	if (!xfrm) {
		return std::nullopt;
	}
	const pugi::xml_node off = find_child(xfrm, "off");
	const pugi::xml_node ext = find_child(xfrm, "ext");
	if (!off || !ext) {
		return std::nullopt;
	}
	return location{
		off.attribute("x").as_llong(),
		off.attribute("y").as_llong(),
		ext.attribute("cx").as_llong(),
		ext.attribute("cy").as_llong(),
	};
}

pugi::xml_node shape_xfrm(pugi::xml_node shape_node) {
	const std::string name = local_name(shape_node.name());
	if (name == "graphicFrame") {
		return find_child(shape_node, "xfrm");
	}
	const pugi::xml_node props = find_child(shape_node, name == "grpSp" ? "grpSpPr" : "spPr");
	return props ? find_child(props, "xfrm") : pugi::xml_node{};
}

bool is_shape_element(pugi::xml_node node) {
	if (node.type() != pugi::node_element) {
		return false;
	}
	const std::string name = local_name(node.name());
	return name == "sp" || name == "pic" || name == "grpSp" || name == "graphicFrame" || name == "cxnSp" || name == "contentPart";
}

pugi::xml_node shape::non_visual_props() const {
	for (pugi::xml_node child : element_node.children()) {
		if (local_name(child.name()).starts_with("nv")) {
			return child;
		}
	}
	return {};
}

unsigned int shape::id() const {
	return find_child(non_visual_props(), "cNvPr").attribute("id").as_uint();
}

std::string shape::name() const {
	return find_child(non_visual_props(), "cNvPr").attribute("name").as_string();
}

void shape::set_identity(unsigned int id, const std::string& name) {
	pugi::xml_node cnvpr = find_child(non_visual_props(), "cNvPr");
	if (!cnvpr) {
		return;
	}
	set_attribute(cnvpr, "id", id);
	set_attribute(cnvpr, "name", name.c_str());
}

shape_kind shape::kind() const {
	const std::string name = local_name(element_node.name());
	if (name == "sp") {
		return shape_kind::autoshape;
	}
	if (name == "pic") {
		return shape_kind::picture;
	}
	if (name == "grpSp") {
		return shape_kind::group;
	}
	if (name == "graphicFrame") {
		return shape_kind::graphic_frame;
	}
	if (name == "cxnSp") {
		return shape_kind::connector;
	}
	return shape_kind::other;
}

bool shape::is_placeholder() const {
	const pugi::xml_node nv_pr = find_child(non_visual_props(), "nvPr");
	return find_child(nv_pr, "ph") != nullptr;
}

std::string shape::placeholder_type() const {
	const pugi::xml_node ph = find_child(find_child(non_visual_props(), "nvPr"), "ph");
	if (!ph) {
		return {};
	}
	return ph.attribute("type").as_string("obj");
}

std::optional<unsigned int> shape::placeholder_idx() const {
	const pugi::xml_node ph = find_child(find_child(non_visual_props(), "nvPr"), "ph");
	if (!ph || !ph.attribute("idx")) {
		return std::nullopt;
	}
	return ph.attribute("idx").as_uint();
}

pugi::xml_node shape::tx_body() const {
	return find_child(element_node, "txBody");
}

bool shape::has_text_frame() const {
	return tx_body() != nullptr;
}

std::string shape::text() const {
	std::string result;
	bool first = true;
	for (pugi::xml_node paragraph : tx_body().children()) {
		if (local_name(paragraph.name()) != "p") {
			continue;
		}
		if (!first) {
			result += '\n';
		}
		result += paragraph_text(paragraph);
		first = false;
	}
	return result;
}

pugi::xml_node shape::xfrm() const {
	return shape_xfrm(element_node);
}

location shape::geometry() const {
	if (const auto own = read_xfrm(xfrm())) {
		return *own;
	}
	if (owner != nullptr && is_placeholder()) {
		if (const auto inherited = owner->inherited_geometry(slide_part, placeholder_type(), placeholder_idx())) {
			return *inherited;
		}
	}
	return {};
}

pugi::xml_node shape::ensure_xfrm() {
	if (pugi::xml_node existing = xfrm()) {
		return existing;
	}
	const std::string name = local_name(element_node.name());
	if (name == "graphicFrame") {
		pugi::xml_node nv = non_visual_props();
		return element_node.insert_child_after("p:xfrm", nv);
	}
	const char* props_name = name == "grpSp" ? "grpSpPr" : "spPr";
	pugi::xml_node props = find_child(element_node, props_name);
	if (!props) {
		props = element_node.insert_child_after((std::string{"p:"} + props_name).c_str(), non_visual_props());
	}
	return props.prepend_child("a:xfrm");
}

void shape::set_geometry(const location& loc) {
	pugi::xml_node transform = ensure_xfrm();
	pugi::xml_node off = ensure_child(transform, "off", "a:off", true);
	set_attribute(off, "x", static_cast<long long>(loc.x));
	set_attribute(off, "y", static_cast<long long>(loc.y));
	pugi::xml_node ext = find_child(transform, "ext");
	if (!ext) {
		ext = transform.insert_child_after("a:ext", off);
	}
	set_attribute(ext, "cx", static_cast<long long>(loc.width));
	set_attribute(ext, "cy", static_cast<long long>(loc.height));
	if (local_name(element_node.name()) == "grpSp") {
		// A group without child offsets would rescale its members.
		if (!find_child(transform, "chOff")) {
			pugi::xml_node ch_off = transform.append_child("a:chOff");
			ch_off.append_attribute("x").set_value(static_cast<long long>(loc.x));
			ch_off.append_attribute("y").set_value(static_cast<long long>(loc.y));
			pugi::xml_node ch_ext = transform.append_child("a:chExt");
			ch_ext.append_attribute("cx").set_value(static_cast<long long>(loc.width));
			ch_ext.append_attribute("cy").set_value(static_cast<long long>(loc.height));
		}
	}
}

void shape::set_text(const std::string& text) {
	pugi::xml_node body = tx_body();
	if (!body) {
		if (kind() != shape_kind::autoshape) {
			return;
		}
		body = element_node.append_child("p:txBody");
		body.append_child("a:bodyPr");
		body.append_child("a:lstStyle");
		body.append_child("a:p");
	}
	std::vector<pugi::xml_node> paragraphs;
	for (pugi::xml_node child : body.children()) {
		if (local_name(child.name()) == "p") {
			paragraphs.push_back(child);
		}
	}
	if (paragraphs.empty()) {
		paragraphs.push_back(body.append_child("a:p"));
	}
	pugi::xml_node first = paragraphs.front();
	for (std::size_t i = 1; i < paragraphs.size(); ++i) {
		body.remove_child(paragraphs[i]);
	}
	if (is_placeholder()) {
		const auto lines = split_text_lines(text);
		if (pugi::xml_node run = runs_merge(first)) {
			write_run_text(run, lines.front());
		} else {
			fill_paragraph(first, lines.front());
		}
		pugi::xml_node last = first;
		for (std::size_t i = 1; i < lines.size(); ++i) {
			pugi::xml_node next = body.insert_copy_after(first, last);
			pugi::xml_node run = find_child(next, "r");
			find_child(run, "t").text().set(lines[i].c_str());
			last = next;
		}
		return;
	}
	if (pugi::xml_node run = runs_merge(first)) {
		write_run_text(run, text);
	} else {
		fill_paragraph(first, text);
	}
}

pugi::xml_node shape::ensure_body_pr() {
	pugi::xml_node body = tx_body();
	if (!body) {
		return {};
	}
	return ensure_child(body, "bodyPr", "a:bodyPr", true);
}

void shape::set_word_wrap(bool wrap) {
	if (pugi::xml_node body_pr = ensure_body_pr()) {
		set_attribute(body_pr, "wrap", wrap ? "square" : "none");
	}
}

void shape::set_vertical_anchor(const char* anchor) {
	if (pugi::xml_node body_pr = ensure_body_pr()) {
		set_attribute(body_pr, "anchor", anchor);
	}
}

void shape::set_alignment(const char* alignment) {
	for (pugi::xml_node paragraph : tx_body().children()) {
		if (local_name(paragraph.name()) != "p") {
			continue;
		}
		pugi::xml_node ppr = ensure_child(paragraph, "pPr", "a:pPr", true);
		set_attribute(ppr, "algn", alignment);
	}
}

std::string shape::xml() const {
	pugi::xml_document doc;
	pugi::xml_node copy = doc.append_copy(element_node);
	const pugi::xml_node slide_root = document_root_of(element_node);
	for (pugi::xml_attribute attr : slide_root.attributes()) {
		if (std::strncmp(attr.name(), "xmlns", 5) == 0 && !copy.attribute(attr.name())) {
			copy.append_attribute(attr.name()).set_value(attr.value());
		}
	}
	return node_to_string(copy);
}
