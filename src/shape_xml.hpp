/* shape_xml.hpp - DrawingML fragment helpers shared by extraction and synthesis.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <pugixml.hpp>

inline constexpr unsigned int xml_parse_options = pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata;

template <typename T>
void set_attribute(pugi::xml_node node, const char* name, T value) {
	pugi::xml_attribute attr = node.attribute(name);
	if (!attr) {
		attr = node.append_attribute(name);
	}
	attr.set_value(value);
}

[[nodiscard]] std::string local_name(const char* qname);
[[nodiscard]] pugi::xml_node find_child(pugi::xml_node parent, std::string_view name);
[[nodiscard]] pugi::xml_node find_descendant(pugi::xml_node root, std::string_view name);
[[nodiscard]] std::vector<pugi::xml_node> find_descendants(pugi::xml_node root, std::string_view name);
[[nodiscard]] std::string node_to_string(pugi::xml_node node);
[[nodiscard]] bool load_fragment(pugi::xml_document& doc, std::string_view xml);

void strip_cust_data(pugi::xml_node root);
[[nodiscard]] std::string remove_cust_data_list(const std::string& xml);
[[nodiscard]] std::string text_from_xml(const std::string& xml);
[[nodiscard]] std::string paragraph_text(pugi::xml_node paragraph);

// Writes text into a run, breaking lines with a:br and continuation runs. Returns the last run.
pugi::xml_node write_run_text(pugi::xml_node run, const std::string& text);
// Collapses a paragraph's runs (and fields) into the longest one, which then holds all the text.
pugi::xml_node runs_merge(pugi::xml_node paragraph);
// Gives an empty paragraph a run styled from its a:endParaRPr.
void fill_paragraph(pugi::xml_node paragraph, const std::string& text);
[[nodiscard]] std::string convert_paragraph_xml(const std::string& paragraph_xml, const std::string& text);

// Rewrites identity and, when text is given, the first run, keeping its a:rPr.
[[nodiscard]] std::string modify_shape_xml(const std::string& xml, unsigned int id, const std::string& name, const std::optional<std::string>& text);
// Same shape kind: equal once position, identity and run text are neutralized.
[[nodiscard]] bool are_same_shape(const std::string& xml1, const std::string& xml2);
