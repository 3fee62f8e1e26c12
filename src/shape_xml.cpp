/* shape_xml.cpp - DrawingML fragment helpers shared by extraction and synthesis.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "shape_xml.hpp"
#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <wx/log.h>
#include <pugixml.hpp>

namespace {
constexpr const char* placeholder_text = "placeholder_text";

void collect_descendants(pugi::xml_node node, std::string_view name, std::vector<pugi::xml_node>& out, bool first_only) {
	for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		if (local_name(child.name()) == name) {
			out.push_back(child);
			if (first_only) {
				return;
			}
		}
		collect_descendants(child, name, out, first_only);
		if (first_only && !out.empty()) {
			return;
		}
	}
}

// Prefix used for DrawingML elements in this fragment, "a" unless the document says otherwise.
std::string drawing_prefix(pugi::xml_node node) {
	const std::string qname = node.name();
	const auto pos = qname.find(':');
	return pos == std::string::npos ? std::string{"a"} : qname.substr(0, pos);
}

std::string qualified(pugi::xml_node like, const char* name) {
	return drawing_prefix(like) + ":" + name;
}

std::vector<std::string> split_lines(const std::string& text) {
	std::vector<std::string> lines;
	std::string line;
	std::istringstream iss(text);
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

void remove_children_named(pugi::xml_node parent, std::initializer_list<std::string_view> names) {
	for (pugi::xml_node child = parent.first_child(); child;) {
		pugi::xml_node next = child.next_sibling();
		const std::string name = local_name(child.name());
		if (std::find(names.begin(), names.end(), name) != names.end()) {
			parent.remove_child(child);
		}
		child = next;
	}
}
} // namespace

std::string local_name(const char* qname) {
	if (qname == nullptr) {
		return {};
	}
	const char* colon = std::strchr(qname, ':');
	return colon == nullptr ? std::string(qname) : std::string(colon + 1);
}

pugi::xml_node find_child(pugi::xml_node parent, std::string_view name) {
	for (pugi::xml_node child : parent.children()) {
		if (child.type() == pugi::node_element && local_name(child.name()) == name) {
			return child;
		}
	}
	return {};
}

pugi::xml_node find_descendant(pugi::xml_node root, std::string_view name) {
	std::vector<pugi::xml_node> found;
	collect_descendants(root, name, found, true);
	return found.empty() ? pugi::xml_node{} : found.front();
}

std::vector<pugi::xml_node> find_descendants(pugi::xml_node root, std::string_view name) {
	std::vector<pugi::xml_node> found;
	collect_descendants(root, name, found, false);
	return found;
}

std::string node_to_string(pugi::xml_node node) {
	std::ostringstream oss;
	node.print(oss, "", pugi::format_raw);
	return oss.str();
}

bool load_fragment(pugi::xml_document& doc, std::string_view xml) {
	const pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size(), xml_parse_options);
	if (!result) {
		wxLogDebug("XML fragment rejected: %s", result.description());
		return false;
	}
	return doc.document_element() != nullptr;
}

void strip_cust_data(pugi::xml_node root) {
	for (pugi::xml_node node : find_descendants(root, "custDataLst")) {
		node.parent().remove_child(node);
	}
}

std::string remove_cust_data_list(const std::string& xml) {
	pugi::xml_document doc;
	if (!load_fragment(doc, xml)) {
		return xml;
	}
	strip_cust_data(doc.document_element());
	return node_to_string(doc.document_element());
}

std::string text_from_xml(const std::string& xml) {
	pugi::xml_document doc;
	if (!load_fragment(doc, xml)) {
		return {};
	}
	std::string text;
	for (pugi::xml_node t : find_descendants(doc.document_element(), "t")) {
		text += t.text().as_string();
	}
	return text;
}

std::string paragraph_text(pugi::xml_node paragraph) {
	std::string text;
	for (pugi::xml_node child : paragraph.children()) {
		const std::string name = local_name(child.name());
		if (name == "r" || name == "fld") {
			text += find_child(child, "t").text().as_string();
		} else if (name == "br") {
			text += '\n';
		}
	}
	return text;
}

pugi::xml_node write_run_text(pugi::xml_node run, const std::string& text) {
	const auto lines = split_lines(text);
	pugi::xml_node rpr = find_child(run, "rPr");
	remove_children_named(run, {"t"});
	run.append_child(qualified(run, "t").c_str()).text().set(lines.front().c_str());
	pugi::xml_node last = run;
	for (std::size_t i = 1; i < lines.size(); ++i) {
		pugi::xml_node paragraph = last.parent();
		pugi::xml_node br = paragraph.insert_child_after(qualified(run, "br").c_str(), last);
		if (rpr) {
			br.append_copy(rpr);
		}
		pugi::xml_node next = paragraph.insert_child_after(qualified(run, "r").c_str(), br);
		if (rpr) {
			next.append_copy(rpr);
		}
		next.append_child(qualified(run, "t").c_str()).text().set(lines[i].c_str());
		last = next;
	}
	return last;
}

pugi::xml_node runs_merge(pugi::xml_node paragraph) {
	std::vector<pugi::xml_node> runs;
	for (pugi::xml_node child : paragraph.children()) {
		if (local_name(child.name()) == "r") {
			runs.push_back(child);
		}
	}
	if (runs.empty()) {
		for (pugi::xml_node child : paragraph.children()) {
			if (local_name(child.name()) == "fld") {
				child.set_name(qualified(child, "r").c_str());
				child.remove_attribute("id");
				child.remove_attribute("type");
				remove_children_named(child, {"pPr"});
				runs.push_back(child);
			}
		}
	}
	if (runs.empty()) {
		return {};
	}
	if (runs.size() == 1) {
		return runs.front();
	}
	const std::string full_text = paragraph_text(paragraph);
	const auto longest = std::max_element(runs.begin(), runs.end(), [](pugi::xml_node a, pugi::xml_node b) {
		return std::strlen(find_child(a, "t").text().as_string()) < std::strlen(find_child(b, "t").text().as_string());
	});
	pugi::xml_node keep = *longest;
	for (pugi::xml_node run : runs) {
		if (run != keep) {
			paragraph.remove_child(run);
		}
	}
	remove_children_named(paragraph, {"br"});
	write_run_text(keep, full_text);
	return keep;
}

void fill_paragraph(pugi::xml_node paragraph, const std::string& text) {
	remove_children_named(paragraph, {"r", "br", "fld"});
	pugi::xml_node end_rpr = find_child(paragraph, "endParaRPr");
	pugi::xml_node ppr = find_child(paragraph, "pPr");
	pugi::xml_node run = ppr ? paragraph.insert_child_after(qualified(paragraph, "r").c_str(), ppr) : paragraph.prepend_child(qualified(paragraph, "r").c_str());
	if (end_rpr) {
		pugi::xml_node rpr = run.append_child(qualified(paragraph, "rPr").c_str());
		for (pugi::xml_attribute attr : end_rpr.attributes()) {
			rpr.append_attribute(attr.name()).set_value(attr.value());
		}
		for (pugi::xml_node child : end_rpr.children()) {
			rpr.append_copy(child);
		}
		paragraph.remove_child(end_rpr);
	}
	write_run_text(run, text);
}

std::string convert_paragraph_xml(const std::string& paragraph_xml, const std::string& text) {
	pugi::xml_document doc;
	if (!load_fragment(doc, paragraph_xml)) {
		return paragraph_xml;
	}
	pugi::xml_node root = doc.document_element();
	pugi::xml_node paragraph = local_name(root.name()) == "p" ? root : find_descendant(root, "p");
	if (paragraph) {
		fill_paragraph(paragraph, text);
	}
	return node_to_string(root);
}

std::string modify_shape_xml(const std::string& xml, unsigned int id, const std::string& name, const std::optional<std::string>& text) {
	pugi::xml_document doc;
	if (!load_fragment(doc, xml)) {
		return xml;
	}
	pugi::xml_node root = doc.document_element();
	if (pugi::xml_node cnvpr = find_descendant(root, "cNvPr")) {
		set_attribute(cnvpr, "id", id);
		set_attribute(cnvpr, "name", name.c_str());
	}
	if (!text) {
		return node_to_string(root);
	}
	pugi::xml_node t = find_descendant(root, "t");
	if (t && local_name(t.parent().name()) == "r") {
		pugi::xml_node old_run = t.parent();
		pugi::xml_node paragraph = old_run.parent();
		pugi::xml_node new_run = paragraph.insert_child_before(old_run.name(), old_run);
		if (pugi::xml_node rpr = find_child(old_run, "rPr")) {
			new_run.append_copy(rpr);
		}
		paragraph.remove_child(old_run);
		write_run_text(new_run, *text);
	} else if (pugi::xml_node tx_body = find_descendant(root, "txBody")) {
		if (pugi::xml_node paragraph = find_child(tx_body, "p")) {
			fill_paragraph(paragraph, *text);
		}
	}
	return node_to_string(root);
}

bool are_same_shape(const std::string& xml1, const std::string& xml2) {
	auto normalize = [](const std::string& xml) -> std::optional<std::string> {
		pugi::xml_document doc;
		if (!load_fragment(doc, xml)) {
			return std::nullopt;
		}
		pugi::xml_node root = doc.document_element();
		if (pugi::xml_node xfrm = find_descendant(root, "xfrm")) {
			xfrm.parent().remove_child(xfrm);
		}
		if (pugi::xml_node cnvpr = find_descendant(root, "cNvPr")) {
			cnvpr.remove_attribute("id");
			cnvpr.remove_attribute("name");
			cnvpr.append_attribute("id").set_value(1);
			cnvpr.append_attribute("name").set_value("temp");
		}
		for (pugi::xml_node t : find_descendants(root, "t")) {
			t.text().set(placeholder_text);
		}
		return node_to_string(root);
	};
	const auto first = normalize(xml1);
	const auto second = normalize(xml2);
	if (!first || !second) {
		wxLogDebug("Shape comparison skipped: unparseable XML");
		return false;
	}
	return *first == *second;
}
