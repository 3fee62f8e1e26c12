/* element.cpp - insertion, extraction and traversal over the element arena.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "element.hpp"
#include "utils.hpp"
#include <algorithm>
#include <regex>
#include <stdexcept>

namespace {
const std::regex bullet_marker_re(R"(^\s*[-*+]\s+)");
const std::regex ordered_marker_re(R"(^\s*\d+[.)]\s+)");

const char* type_name(element_type type) {
	switch (type) {
		case element_type::document:
			return "Document";
		case element_type::heading:
			return "Heading";
		case element_type::paragraph:
			return "Paragraph";
		case element_type::code_block:
			return "CodeBlock";
		case element_type::table:
			return "Table";
		case element_type::picture:
			return "Picture";
		case element_type::none:
			break;
	}
	return "Element";
}
} // namespace

std::string element::own_string(bool strip) const {
	return strip ? trim_string(element_text()) : element_text();
}

std::string heading::element_text_source() const {
	if (source) {
		return *source;
	}
	return std::string(static_cast<std::size_t>(level), '#') + " " + text;
}

void heading::reset_payload() {
	level = 0;
	text.clear();
	source.reset();
}

std::string paragraph::own_string(bool strip) const {
	if (!strip) {
		return text;
	}
	std::string result = std::regex_replace(text, bullet_marker_re, "", std::regex_constants::format_first_only);
	result = std::regex_replace(result, ordered_marker_re, "", std::regex_constants::format_first_only);
	return trim_string(result);
}

std::string code_block::element_text_source() const {
	return "```" + language + "\n" + code + "\n```";
}

// Stripped text is the bare code; otherwise the fenced form is kept.
std::string code_block::own_string(bool strip) const {
	return strip ? trim_string(code) : element_text_source();
}

void code_block::reset_payload() {
	code.clear();
	language.clear();
}

void table::reset_payload() {
	headers.clear();
	text.clear();
	row_count = 0;
	column_count = 0;
}

std::string picture::element_text() const {
	std::string result = "![" + alt_text.value_or("") + "](" + src;
	if (title) {
		result += " \"" + *title + "\"";
	}
	return result + ")";
}

void picture::reset_payload() {
	src.clear();
	alt_text.reset();
	title.reset();
}

element_tree::element_tree() {
	create<document_root>();
}

element& element_tree::at(element_id id) {
	if (!is_valid(id)) {
		throw std::out_of_range("element id out of range");
	}
	return *nodes[id];
}

const element& element_tree::at(element_id id) const {
	if (!is_valid(id)) {
		throw std::out_of_range("element id out of range");
	}
	return *nodes[id];
}

void element_tree::setup(element_id node, element_id parent, element_id previous_element, element_id next_element, element_id previous_sibling, element_id next_sibling) {
	element& self = at(node);
	self.parent = parent;
	self.previous_element = previous_element;
	if (element* prev = ptr(previous_element)) {
		prev->next_element = node;
	}
	self.next_element = next_element;
	if (element* next = ptr(next_element)) {
		next->previous_element = node;
	}
	self.next_sibling = next_sibling;
	if (element* next = ptr(next_sibling)) {
		next->previous_sibling = node;
	}
	if (previous_sibling == null_element && parent != null_element && !at(parent).contents.empty()) {
		previous_sibling = at(parent).contents.back();
	}
	self.previous_sibling = previous_sibling;
	if (element* prev = ptr(previous_sibling)) {
		prev->next_sibling = node;
	}
}

void element_tree::check_insertable(element_id parent, element_id node) const {
	if (node == null_element || !is_valid(node)) {
		throw std::invalid_argument("Cannot insert a null element");
	}
	if (!is_valid(parent)) {
		throw std::invalid_argument("Cannot insert into a null element");
	}
	if (node == parent) {
		throw std::invalid_argument("Cannot insert an element into itself");
	}
	if (node == root()) {
		throw std::invalid_argument("Cannot insert the document root");
	}
	if (nodes[node]->decomposed || nodes[parent]->decomposed) {
		throw std::invalid_argument("Cannot insert a decomposed element");
	}
	for (element_id p = nodes[parent]->parent; p != null_element; p = nodes[p]->parent) {
		if (p == node) {
			throw std::invalid_argument("Cannot insert an element into its own descendant");
		}
	}
}

element_id element_tree::insert_one(element_id parent, std::size_t position, element_id node) {
	check_insertable(parent, node);
	element& self = *nodes[parent];
	element& child = *nodes[node];
	position = std::min(position, self.contents.size());
	if (child.parent != null_element) {
		if (child.parent == parent) {
			const auto current = index(parent, node);
			if (current && *current < position) {
				--position;
			} else if (current && *current == position) {
				return node;
			}
		}
		extract(node);
	}
	child.parent = parent;
	if (position == 0) {
		child.previous_sibling = null_element;
		child.previous_element = parent;
	} else {
		const element_id previous_child = self.contents[position - 1];
		child.previous_sibling = previous_child;
		nodes[previous_child]->next_sibling = node;
		child.previous_element = last_descendant(previous_child, false);
	}
	if (element* prev = ptr(child.previous_element)) {
		prev->next_element = node;
	}
	const element_id last_id = last_descendant(node, false, true);
	element& last = *nodes[last_id];
	if (position >= self.contents.size()) {
		child.next_sibling = null_element;
		element_id following = null_element;
		for (element_id p = parent; p != null_element && following == null_element; p = nodes[p]->parent) {
			following = nodes[p]->next_sibling;
		}
		last.next_element = following;
	} else {
		const element_id next_child = self.contents[position];
		child.next_sibling = next_child;
		nodes[next_child]->previous_sibling = node;
		last.next_element = next_child;
	}
	if (element* next = ptr(last.next_element)) {
		next->previous_element = last_id;
	}
	self.contents.insert(self.contents.begin() + static_cast<std::ptrdiff_t>(position), node);
	return node;
}

std::vector<element_id> element_tree::insert(element_id parent, std::size_t position, element_id node) {
	return {insert_one(parent, position, node)};
}

std::vector<element_id> element_tree::insert(element_id parent, std::size_t position, std::initializer_list<element_id> new_nodes) {
	return insert(parent, position, std::vector<element_id>(new_nodes));
}

std::vector<element_id> element_tree::insert(element_id parent, std::size_t position, const std::vector<element_id>& new_nodes) {
	std::vector<element_id> inserted;
	inserted.reserve(new_nodes.size());
	for (const element_id node : new_nodes) {
		inserted.push_back(insert_one(parent, position, node));
		++position;
	}
	return inserted;
}

std::vector<element_id> element_tree::insert_document(element_id parent, std::size_t position, element_tree&& other) {
	if (!is_valid(parent)) {
		throw std::invalid_argument("Cannot insert into a null element");
	}
	std::vector<element_id> remap(other.nodes.size(), null_element);
	for (element_id old_id = 1; old_id < other.nodes.size(); ++old_id) {
		if (!other.nodes[old_id]->decomposed) {
			remap[old_id] = nodes.size() + old_id - 1;
		}
	}
	auto translate = [&remap](element_id id) {
		return id == null_element || id == root() || id >= remap.size() ? null_element : remap[id];
	};
	const std::vector<element_id> top_level = other.nodes[root()]->contents;
	for (element_id old_id = 1; old_id < other.nodes.size(); ++old_id) {
		std::unique_ptr<element> node = std::move(other.nodes[old_id]);
		if (node->decomposed) {
			nodes.push_back(std::move(node));
			continue;
		}
		node->parent = translate(node->parent);
		node->previous_element = translate(node->previous_element);
		node->next_element = translate(node->next_element);
		node->previous_sibling = translate(node->previous_sibling);
		node->next_sibling = translate(node->next_sibling);
		for (auto& child : node->contents) {
			child = translate(child);
		}
		nodes.push_back(std::move(node));
	}
	std::vector<element_id> spliced;
	spliced.reserve(top_level.size());
	for (const element_id old_id : top_level) {
		const element_id id = remap[old_id];
		element& node = *nodes[id];
		node.parent = null_element;
		node.previous_sibling = null_element;
		node.next_sibling = null_element;
		node.previous_element = null_element;
		nodes[last_descendant(id, false, true)]->next_element = null_element;
		spliced.push_back(id);
	}
	other = element_tree{};
	return insert(parent, position, spliced);
}

element_id element_tree::append(element_id parent, element_id node) {
	return insert_one(parent, at(parent).contents.size(), node);
}

element_id element_tree::extract(element_id node) {
	element& self = at(node);
	if (self.parent != null_element) {
		auto& siblings = nodes[self.parent]->contents;
		siblings.erase(std::remove(siblings.begin(), siblings.end(), node), siblings.end());
	}
	const element_id last_child = last_descendant(node);
	const element_id next_element = nodes[last_child]->next_element;
	if (self.previous_element != null_element && self.previous_element != next_element) {
		nodes[self.previous_element]->next_element = next_element;
	}
	if (next_element != null_element && next_element != self.previous_element) {
		nodes[next_element]->previous_element = self.previous_element;
	}
	self.previous_element = null_element;
	nodes[last_child]->next_element = null_element;
	self.parent = null_element;
	if (self.previous_sibling != null_element && self.previous_sibling != self.next_sibling) {
		nodes[self.previous_sibling]->next_sibling = self.next_sibling;
	}
	if (self.next_sibling != null_element && self.next_sibling != self.previous_sibling) {
		nodes[self.next_sibling]->previous_sibling = self.previous_sibling;
	}
	self.previous_sibling = null_element;
	self.next_sibling = null_element;
	return node;
}

void element_tree::decompose(element_id node) {
	if (node == root()) {
		throw std::invalid_argument("Cannot decompose the document root");
	}
	extract(node);
	element_id current = node;
	while (current != null_element) {
		element& e = *nodes[current];
		const element_id next_up = e.next_element;
		e.parent = null_element;
		e.previous_element = null_element;
		e.next_element = null_element;
		e.previous_sibling = null_element;
		e.next_sibling = null_element;
		e.contents.clear();
		e.reset_payload();
		e.decomposed = true;
		current = next_up;
	}
}

void element_tree::clear(element_id node, bool decompose_children) {
	const std::vector<element_id> snapshot = at(node).contents;
	for (const element_id child : snapshot) {
		if (decompose_children) {
			decompose(child);
		} else {
			extract(child);
		}
	}
}

std::optional<std::size_t> element_tree::index(element_id parent, element_id child) const noexcept {
	if (!is_valid(parent)) {
		return std::nullopt;
	}
	const auto& contents = nodes[parent]->contents;
	const auto it = std::find(contents.begin(), contents.end(), child);
	if (it == contents.end()) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(it - contents.begin());
}

bool element_tree::is_decomposed(element_id node) const noexcept {
	return is_valid(node) && nodes[node]->decomposed;
}

element_id element_tree::last_descendant(element_id node, bool is_initialized, bool accept_self) const noexcept {
	if (!is_valid(node)) {
		return null_element;
	}
	element_id last_child = node;
	if (is_initialized && nodes[node]->next_sibling != null_element) {
		last_child = nodes[nodes[node]->next_sibling]->previous_element;
	} else {
		while (!nodes[last_child]->contents.empty()) {
			last_child = nodes[last_child]->contents.back();
		}
	}
	if (!accept_self && last_child == node) {
		return null_element;
	}
	return last_child;
}

std::vector<element_id> element_tree::children(element_id node) const {
	if (!is_valid(node)) {
		return {};
	}
	return nodes[node]->contents;
}

std::vector<element_id> element_tree::descendants(element_id node) const {
	std::vector<element_id> result;
	if (!is_valid(node) || nodes[node]->contents.empty()) {
		return result;
	}
	const element_id stop = nodes[last_descendant(node)]->next_element;
	for (element_id current = nodes[node]->contents.front(); current != stop && current != null_element; current = nodes[current]->next_element) {
		result.push_back(current);
	}
	return result;
}

std::vector<element_id> element_tree::next_siblings(element_id node) const {
	std::vector<element_id> result;
	if (!is_valid(node)) {
		return result;
	}
	for (element_id i = nodes[node]->next_sibling; i != null_element; i = nodes[i]->next_sibling) {
		result.push_back(i);
	}
	return result;
}

std::vector<element_id> element_tree::previous_siblings(element_id node) const {
	std::vector<element_id> result;
	if (!is_valid(node)) {
		return result;
	}
	for (element_id i = nodes[node]->previous_sibling; i != null_element; i = nodes[i]->previous_sibling) {
		result.push_back(i);
	}
	return result;
}

std::vector<element_id> element_tree::next_elements(element_id node) const {
	std::vector<element_id> result;
	if (!is_valid(node)) {
		return result;
	}
	for (element_id i = nodes[node]->next_element; i != null_element; i = nodes[i]->next_element) {
		result.push_back(i);
	}
	return result;
}

std::vector<element_id> element_tree::previous_elements(element_id node) const {
	std::vector<element_id> result;
	if (!is_valid(node)) {
		return result;
	}
	for (element_id i = nodes[node]->previous_element; i != null_element; i = nodes[i]->previous_element) {
		result.push_back(i);
	}
	return result;
}

std::vector<element_id> element_tree::parents(element_id node) const {
	std::vector<element_id> result;
	if (!is_valid(node)) {
		return result;
	}
	for (element_id i = nodes[node]->parent; i != null_element; i = nodes[i]->parent) {
		result.push_back(i);
	}
	return result;
}

std::vector<std::string> element_tree::all_strings(element_id node, bool strip, element_type types) const {
	const element& self = at(node);
	std::vector<std::string> result;
	if (!self.is_container()) {
		if (types != element_type::none) {
			throw std::invalid_argument(std::string(type_name(self.type())) + " does not support type filters");
		}
		result.push_back(self.own_string(strip));
		return result;
	}
	for (const element_id id : descendants(node)) {
		const element& descendant = *nodes[id];
		if (!matches_type(types, descendant.type())) {
			continue;
		}
		std::string text;
		if (descendant.type() == element_type::heading) {
			text = strip ? descendant.element_text() : descendant.element_text_source();
		} else {
			text = descendant.own_string(strip);
		}
		if (!text.empty()) {
			result.push_back(std::move(text));
		}
	}
	return result;
}

std::string element_tree::get_text(element_id node, std::string_view separator, bool strip, element_type types) const {
	const auto strings = all_strings(node, strip, types);
	std::string result;
	for (std::size_t i = 0; i < strings.size(); ++i) {
		if (i > 0) {
			result += separator;
		}
		result += strings[i];
	}
	return result;
}
