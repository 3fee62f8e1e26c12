/* presentation.cpp - in-memory PPTX package: parts, relationships, slides.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "presentation.hpp"
#include "constants.hpp"
#include "exceptions.hpp"
#include "shape_xml.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <numeric>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <wx/log.h>
#include <wx/translation.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace {
constexpr const char* content_types_part = "[Content_Types].xml";
constexpr const char* rel_type_tags = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/tags";
constexpr const char* ns_content_types = "http://schemas.openxmlformats.org/package/2006/content-types";
constexpr unsigned int first_slide_id = 256;

std::string serialize(const pugi::xml_document& doc) {
	std::ostringstream oss;
	doc.save(oss, "", pugi::format_raw);
	return oss.str();
}

std::string source_of_rels(const std::string& rels_name) {
	const auto marker = rels_name.rfind("_rels/");
	if (marker == std::string::npos || !rels_name.ends_with(".rels")) {
		return {};
	}
	std::string dir = rels_name.substr(0, marker);
	if (!dir.empty() && dir.back() == '/') {
		dir.pop_back();
	}
	const std::string base = rels_name.substr(marker + 6, rels_name.size() - marker - 6 - 5);
	return dir.empty() ? base : dir + "/" + base;
}

int part_number(const std::string& s) {
	constexpr int decimal_base = 10;
	auto start_it = s.rfind('/') == std::string::npos ? s.begin() : s.begin() + static_cast<std::string::difference_type>(s.rfind('/'));
	auto digits_view = std::ranges::subrange(start_it, s.end()) | std::views::filter([](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
	return std::accumulate(digits_view.begin(), digits_view.end(), 0, [](int acc, char c) { return (acc * decimal_base) + (c - '0'); });
}

// r:id, whatever prefix the document bound the relationships namespace to.
pugi::xml_attribute relationship_attribute(pugi::xml_node node, std::string_view local) {
	for (pugi::xml_attribute attr : node.attributes()) {
		const char* colon = std::strchr(attr.name(), ':');
		if (colon != nullptr && std::strncmp(attr.name(), "xmlns", 5) != 0 && local == colon + 1) {
			return attr;
		}
	}
	return {};
}

std::string image_content_type(std::string_view extension) {
	const std::string ext = to_lower(extension);
	if (ext == "png") {
		return "image/png";
	}
	if (ext == "jpg" || ext == "jpeg") {
		return "image/jpeg";
	}
	if (ext == "gif") {
		return "image/gif";
	}
	if (ext == "bmp") {
		return "image/bmp";
	}
	if (ext == "tif" || ext == "tiff") {
		return "image/tiff";
	}
	if (ext == "webp") {
		return "image/webp";
	}
	return "application/octet-stream";
}

pugi::xml_node content_types_root(pugi::xml_document& doc) {
	pugi::xml_node root = doc.document_element();
	if (!root) {
		root = doc.append_child("Types");
		root.append_attribute("xmlns").set_value(ns_content_types);
	}
	return root;
}

constexpr const char* empty_slide_xml =
	"<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
	"<p:sld xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
	"xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\" "
	"xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\">"
	"<p:cSld><p:spTree><p:nvGrpSpPr><p:cNvPr id=\"1\" name=\"\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
	"<p:grpSpPr/></p:spTree></p:cSld><p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr></p:sld>";
} // namespace

std::string rels_part_name(std::string_view source_part) {
	const std::string dir = part_directory(source_part);
	const auto slash = source_part.rfind('/');
	const std::string base(slash == std::string_view::npos ? source_part : source_part.substr(slash + 1));
	return (dir.empty() ? std::string{} : dir + "/") + "_rels/" + base + ".rels";
}

relationship_set relationship_set::parse(const std::string& source, const std::string& xml) {
	relationship_set result(source);
	pugi::xml_document doc;
	if (!doc.load_buffer(xml.data(), xml.size(), xml_parse_options)) {
		wxLogWarning(_("Ignoring unreadable relationships of %s"), wxString::FromUTF8(source));
		return result;
	}
	for (pugi::xml_node rel : doc.child("Relationships").children("Relationship")) {
		result.rels.push_back({
			rel.attribute("Id").as_string(),
			rel.attribute("Type").as_string(),
			rel.attribute("Target").as_string(),
			std::strcmp(rel.attribute("TargetMode").as_string(), "External") == 0,
		});
	}
	return result;
}

std::string relationship_set::to_xml() const {
	pugi::xml_document doc;
	pugi::xml_node decl = doc.append_child(pugi::node_declaration);
	decl.append_attribute("version").set_value("1.0");
	decl.append_attribute("encoding").set_value("UTF-8");
	decl.append_attribute("standalone").set_value("yes");
	pugi::xml_node root = doc.append_child("Relationships");
	root.append_attribute("xmlns").set_value(NS_PACKAGE_RELATIONSHIPS);
	for (const auto& rel : rels) {
		pugi::xml_node node = root.append_child("Relationship");
		node.append_attribute("Id").set_value(rel.id.c_str());
		node.append_attribute("Type").set_value(rel.type.c_str());
		node.append_attribute("Target").set_value(rel.target.c_str());
		if (rel.external) {
			node.append_attribute("TargetMode").set_value("External");
		}
	}
	return serialize(doc);
}

const relationship* relationship_set::find(std::string_view id) const {
	const auto it = std::ranges::find_if(rels, [&](const relationship& rel) { return rel.id == id; });
	return it == rels.end() ? nullptr : &*it;
}

const relationship* relationship_set::find_by_type(std::string_view type) const {
	const auto it = std::ranges::find_if(rels, [&](const relationship& rel) { return rel.type == type; });
	return it == rels.end() ? nullptr : &*it;
}

std::string relationship_set::target_part(const relationship& rel) const {
	if (rel.external) {
		return {};
	}
	return resolve_part_path(part_directory(source_part), rel.target);
}

std::string relationship_set::target_part(std::string_view id) const {
	const relationship* rel = find(id);
	return rel == nullptr ? std::string{} : target_part(*rel);
}

std::string relationship_set::add(const std::string& type, const std::string& part_name) {
	for (const auto& rel : rels) {
		if (rel.type == type && !rel.external && target_part(rel) == part_name) {
			return rel.id;
		}
	}
	const std::string target = source_part.empty() ? part_name : relative_part_path(source_part, part_name);
	std::string id = next_id();
	rels.push_back({id, type, target, false});
	return id;
}

void relationship_set::insert(relationship rel) {
	if (find(rel.id) != nullptr) {
		throw std::invalid_argument("duplicate relationship id " + rel.id);
	}
	rels.push_back(std::move(rel));
}

void relationship_set::remove(std::string_view id) {
	std::erase_if(rels, [&](const relationship& rel) { return rel.id == id; });
}

std::string relationship_set::next_id() const {
	int highest = 0;
	for (const auto& rel : rels) {
		if (rel.id.starts_with("rId") && rel.id.size() > 3 && is_all_digits(std::string_view(rel.id).substr(3))) {
			highest = std::max(highest, std::stoi(rel.id.substr(3)));
		}
	}
	return "rId" + std::to_string(highest + 1);
}

std::unique_ptr<presentation> presentation::load(const wxString& path) {
	wxFileInputStream fp(path);
	if (!fp.IsOk()) {
		throw parser_exception(_("Failed to open presentation"), path);
	}
	wxZipInputStream zip(fp);
	if (!zip.IsOk()) {
		throw parser_exception(_("Presentation is not a zip package"), path);
	}
	std::map<std::string, std::string> parts;
	std::unique_ptr<wxZipEntry> entry;
	while ((entry.reset(zip.GetNextEntry())), entry != nullptr) {
		if (entry->IsDir()) {
			continue;
		}
		const std::string name = entry->GetInternalName().utf8_string();
		parts[name] = read_zip_entry(zip);
	}
	try {
		return from_parts(parts);
	} catch (const parser_exception& e) {
		throw parser_exception(e.get_message(), path, e.get_severity());
	}
}

std::unique_ptr<presentation> presentation::from_parts(const std::map<std::string, std::string>& parts) {
	auto pres = std::make_unique<presentation>();
	for (const auto& [name, data] : parts) {
		pres->store_part(name, data);
	}
	pres->resolve_main_part();
	wxLogDebug("Loaded package with %d parts and %d slides", static_cast<int>(parts.size()), static_cast<int>(pres->slide_count()));
	return pres;
}

void presentation::store_part(const std::string& name, const std::string& data) {
	if (name.ends_with(".rels")) {
		const std::string source = source_of_rels(name);
		rel_sets[source] = relationship_set::parse(source, data);
		return;
	}
	if (name.ends_with(".xml")) {
		auto doc = std::make_unique<pugi::xml_document>();
		if (doc->load_buffer(data.data(), data.size(), xml_parse_options)) {
			xml_parts[name] = std::move(doc);
			return;
		}
		wxLogWarning(_("Keeping unparseable part %s as raw data"), wxString::FromUTF8(name));
	}
	binary_parts[name] = data;
}

void presentation::resolve_main_part() {
	const relationship_set* package_rels = find_relationships("");
	const relationship* main = package_rels == nullptr ? nullptr : package_rels->find_by_type(REL_TYPE_OFFICE_DOCUMENT);
	if (main == nullptr) {
		throw parser_exception(_("Package has no main document"), wxEmptyString);
	}
	presentation_part = package_rels->target_part(*main);
	if (!xml_parts.contains(presentation_part)) {
		throw parser_exception(wxString::Format(_("Presentation part %s is missing"), wxString::FromUTF8(presentation_part)), wxEmptyString);
	}
}

std::map<std::string, std::string> presentation::to_parts() const {
	std::map<std::string, std::string> parts = binary_parts;
	for (const auto& [name, doc] : xml_parts) {
		parts[name] = serialize(*doc);
	}
	for (const auto& [source, rels] : rel_sets) {
		if (!rels.empty()) {
			parts[rels_part_name(source)] = rels.to_xml();
		}
	}
	return parts;
}

void presentation::save(const wxString& path) const {
	wxFileOutputStream out(path);
	if (!out.IsOk()) {
		throw generation_exception(wxString::Format(_("Failed to create %s"), path));
	}
	wxZipOutputStream zip(out);
	const auto parts = to_parts();
	auto write_entry = [&](const std::string& name, const std::string& data) {
		zip.PutNextEntry(wxString::FromUTF8(name));
		zip.Write(data.data(), data.size());
	};
	// Readers expect the content types first.
	if (const auto it = parts.find(content_types_part); it != parts.end()) {
		write_entry(it->first, it->second);
	}
	for (const auto& [name, data] : parts) {
		if (name != content_types_part) {
			write_entry(name, data);
		}
	}
	if (!zip.Close() || !out.Close()) {
		throw generation_exception(wxString::Format(_("Failed to write %s"), path));
	}
	wxLogMessage(_("Wrote %d slides to %s"), static_cast<int>(slide_count()), path);
}

bool presentation::has_part(const std::string& name) const {
	return binary_parts.contains(name) || xml_parts.contains(name);
}

std::string presentation::part_data(const std::string& name) const {
	if (const auto it = binary_parts.find(name); it != binary_parts.end()) {
		return it->second;
	}
	return serialize(xml_part(name));
}

pugi::xml_document& presentation::xml_part(const std::string& name) {
	const auto it = xml_parts.find(name);
	if (it == xml_parts.end()) {
		throw template_exception(wxString::Format(_("Package part %s is missing"), wxString::FromUTF8(name)));
	}
	return *it->second;
}

const pugi::xml_document& presentation::xml_part(const std::string& name) const {
	const auto it = xml_parts.find(name);
	if (it == xml_parts.end()) {
		throw template_exception(wxString::Format(_("Package part %s is missing"), wxString::FromUTF8(name)));
	}
	return *it->second;
}

relationship_set& presentation::relationships(const std::string& source_part) {
	auto it = rel_sets.find(source_part);
	if (it == rel_sets.end()) {
		it = rel_sets.emplace(source_part, relationship_set(source_part)).first;
	}
	return it->second;
}

const relationship_set* presentation::find_relationships(const std::string& source_part) const {
	const auto it = rel_sets.find(source_part);
	return it == rel_sets.end() ? nullptr : &it->second;
}

pugi::xml_node presentation::slide_id_list() const {
	return find_child(xml_part(presentation_part).document_element(), "sldIdLst");
}

std::vector<pugi::xml_node> presentation::slide_ids() const {
	std::vector<pugi::xml_node> ids;
	for (pugi::xml_node child : slide_id_list().children()) {
		if (local_name(child.name()) == "sldId") {
			ids.push_back(child);
		}
	}
	return ids;
}

std::string presentation::slide_part_at(std::size_t index) const {
	const auto ids = slide_ids();
	if (index >= ids.size()) {
		throw std::out_of_range("slide index " + std::to_string(index) + " out of range");
	}
	const relationship_set* rels = find_relationships(presentation_part);
	if (rels == nullptr) {
		return {};
	}
	return rels->target_part(relationship_attribute(ids[index], "id").as_string());
}

std::size_t presentation::slide_count() const {
	return slide_ids().size();
}

slide presentation::get_slide(std::size_t index) {
	return slide(this, slide_part_at(index));
}

std::vector<slide> presentation::slides() {
	std::vector<slide> result;
	const std::size_t count = slide_count();
	result.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		result.push_back(get_slide(i));
	}
	return result;
}

std::optional<std::size_t> presentation::index_of(const slide& target) const {
	const std::size_t count = slide_count();
	for (std::size_t i = 0; i < count; ++i) {
		if (slide_part_at(i) == target.part_name()) {
			return i;
		}
	}
	return std::nullopt;
}

std::string presentation::next_part_name(const std::string& prefix, std::string_view extension) const {
	int highest = 0;
	// Numbers are shared across extensions, so image1.png and image1.jpg never coexist.
	auto consider = [&](const std::string& name) {
		if (name.starts_with(prefix)) {
			const std::string rest = name.substr(prefix.size());
			const std::string middle = rest.substr(0, rest.find('.'));
			if (!middle.empty() && is_all_digits(middle)) {
				highest = std::max(highest, std::stoi(middle));
			}
		}
	};
	for (const auto& [name, doc] : xml_parts) {
		consider(name);
	}
	for (const auto& [name, data] : binary_parts) {
		consider(name);
	}
	return prefix + std::to_string(highest + 1) + std::string(extension);
}

void presentation::add_override(const std::string& part_name, const char* content_type) {
	auto& slot = xml_parts[content_types_part];
	if (!slot) {
		slot = std::make_unique<pugi::xml_document>();
	}
	pugi::xml_node types = content_types_root(*slot);
	const std::string key = "/" + part_name;
	if (types.find_child_by_attribute("Override", "PartName", key.c_str())) {
		return;
	}
	pugi::xml_node node = types.append_child("Override");
	node.append_attribute("PartName").set_value(key.c_str());
	node.append_attribute("ContentType").set_value(content_type);
}

void presentation::remove_override(const std::string& part_name) {
	const auto it = xml_parts.find(content_types_part);
	if (it == xml_parts.end()) {
		return;
	}
	pugi::xml_node types = it->second->document_element();
	const std::string key = "/" + part_name;
	if (pugi::xml_node node = types.find_child_by_attribute("Override", "PartName", key.c_str())) {
		types.remove_child(node);
	}
}

void presentation::ensure_default(std::string_view extension, const std::string& content_type) {
	auto& slot = xml_parts[content_types_part];
	if (!slot) {
		slot = std::make_unique<pugi::xml_document>();
	}
	pugi::xml_node types = content_types_root(*slot);
	const std::string ext = to_lower(extension);
	for (pugi::xml_node node : types.children("Default")) {
		if (to_lower(node.attribute("Extension").as_string()) == ext) {
			return;
		}
	}
	pugi::xml_node node = types.prepend_child("Default");
	node.append_attribute("Extension").set_value(ext.c_str());
	node.append_attribute("ContentType").set_value(content_type.c_str());
}

void presentation::drop_part(const std::string& name) {
	xml_parts.erase(name);
	binary_parts.erase(name);
	rel_sets.erase(name);
	remove_override(name);
}

slide presentation::register_slide(const std::string& part_name, std::unique_ptr<pugi::xml_document> doc) {
	xml_parts[part_name] = std::move(doc);
	add_override(part_name, CONTENT_TYPE_SLIDE);
	const std::string rel_id = relationships(presentation_part).add(REL_TYPE_SLIDE, part_name);
	pugi::xml_node root = xml_part(presentation_part).document_element();
	pugi::xml_node list = slide_id_list();
	if (!list) {
		pugi::xml_node masters = find_child(root, "sldMasterIdLst");
		list = masters ? root.insert_child_after("p:sldIdLst", masters) : root.prepend_child("p:sldIdLst");
	}
	unsigned int next_id = first_slide_id;
	for (pugi::xml_node id : slide_ids()) {
		next_id = std::max(next_id, id.attribute("id").as_uint() + 1);
	}
	pugi::xml_node entry = list.append_child("p:sldId");
	entry.append_attribute("id").set_value(next_id);
	entry.append_attribute("r:id").set_value(rel_id.c_str());
	return slide(this, part_name);
}

slide presentation::add_slide(const std::string& layout_part) {
	const pugi::xml_document& layout = xml_part(layout_part);
	auto doc = std::make_unique<pugi::xml_document>();
	if (!doc->load_string(empty_slide_xml, xml_parse_options)) {
		throw generation_exception(_("Failed to build an empty slide"));
	}
	pugi::xml_node tree = find_descendant(doc->document_element(), "spTree");
	const pugi::xml_node layout_tree = find_descendant(layout.document_element(), "spTree");
	for (pugi::xml_node child : layout_tree.children()) {
		if (local_name(child.name()) != "sp") {
			continue;
		}
		const pugi::xml_node nv_sp_pr = find_child(child, "nvSpPr");
		if (!find_child(find_child(nv_sp_pr, "nvPr"), "ph")) {
			continue;
		}
		pugi::xml_node placeholder = tree.append_child("p:sp");
		placeholder.append_copy(nv_sp_pr);
		placeholder.append_child("p:spPr");
		if (find_child(child, "txBody")) {
			pugi::xml_node body = placeholder.append_child("p:txBody");
			body.append_child("a:bodyPr");
			body.append_child("a:lstStyle");
			body.append_child("a:p");
		}
	}
	const std::string part_name = next_part_name("ppt/slides/slide", ".xml");
	relationships(part_name).add(REL_TYPE_SLIDE_LAYOUT, layout_part);
	return register_slide(part_name, std::move(doc));
}

slide presentation::duplicate_slide(std::size_t index) {
	const std::string source = slide_part_at(index);
	auto doc = std::make_unique<pugi::xml_document>();
	for (pugi::xml_node child : xml_part(source).children()) {
		doc->append_copy(child);
	}
	strip_cust_data(doc->document_element());
	const std::string part_name = next_part_name("ppt/slides/slide", ".xml");
	relationship_set& copy_rels = relationships(part_name);
	if (const relationship_set* source_rels = find_relationships(source)) {
		for (const auto& rel : source_rels->items()) {
			if (rel.type == REL_TYPE_NOTES_SLIDE || rel.type == rel_type_tags) {
				continue;
			}
			copy_rels.insert(rel);
		}
	}
	wxLogDebug("Duplicated %s as %s", wxString::FromUTF8(source), wxString::FromUTF8(part_name));
	return register_slide(part_name, std::move(doc));
}

void presentation::move_slide(std::size_t from, std::size_t to) {
	auto ids = slide_ids();
	if (from >= ids.size() || to >= ids.size()) {
		throw std::out_of_range("slide move out of range");
	}
	if (from == to) {
		return;
	}
	pugi::xml_node list = slide_id_list();
	pugi::xml_node moving = ids[from];
	ids.erase(ids.begin() + static_cast<std::ptrdiff_t>(from));
	if (to >= ids.size()) {
		list.append_move(moving);
	} else {
		list.insert_move_before(moving, ids[to]);
	}
}

void presentation::remove_slide(std::size_t index) {
	const auto ids = slide_ids();
	if (index >= ids.size()) {
		throw std::out_of_range("slide index " + std::to_string(index) + " out of range");
	}
	const std::string rel_id = relationship_attribute(ids[index], "id").as_string();
	const std::string part_name = slide_part_at(index);
	slide_id_list().remove_child(ids[index]);
	relationships(presentation_part).remove(rel_id);
	if (const relationship_set* rels = find_relationships(part_name)) {
		if (const relationship* notes = rels->find_by_type(REL_TYPE_NOTES_SLIDE)) {
			drop_part(rels->target_part(*notes));
		}
	}
	drop_part(part_name);
}

std::string presentation::add_media(const std::string& data, std::string_view extension) {
	std::string ext(extension);
	if (!ext.empty() && ext.front() == '.') {
		ext.erase(0, 1);
	}
	ext = to_lower(ext);
	const std::string part_name = next_part_name("ppt/media/image", "." + ext);
	binary_parts[part_name] = data;
	ensure_default(ext, image_content_type(ext));
	return part_name;
}

std::vector<std::string> presentation::layout_parts() const {
	std::vector<std::string> layouts;
	for (const auto& [name, doc] : xml_parts) {
		if (name.starts_with("ppt/slideLayouts/slideLayout") && name.ends_with(".xml")) {
			layouts.push_back(name);
		}
	}
	std::ranges::sort(layouts, [](const std::string& a, const std::string& b) {
		return part_number(a) < part_number(b);
	});
	return layouts;
}

std::string presentation::layout_of(const std::string& slide_part) const {
	const relationship_set* rels = find_relationships(slide_part);
	if (rels == nullptr) {
		return {};
	}
	const relationship* layout = rels->find_by_type(REL_TYPE_SLIDE_LAYOUT);
	return layout == nullptr ? std::string{} : rels->target_part(*layout);
}

std::optional<location> presentation::inherited_geometry(const std::string& slide_part, const std::string& placeholder_type, std::optional<unsigned int> placeholder_idx) const {
	auto search = [&](const std::string& part, auto&& matches) -> std::optional<location> {
		if (!xml_parts.contains(part)) {
			return std::nullopt;
		}
		const pugi::xml_node tree = find_descendant(xml_part(part).document_element(), "spTree");
		for (pugi::xml_node child : tree.children()) {
			if (!is_shape_element(child)) {
				continue;
			}
			const shape candidate(child, nullptr, part);
			if (candidate.is_placeholder() && matches(candidate)) {
				if (auto loc = read_xfrm(shape_xfrm(child))) {
					return loc;
				}
			}
		}
		return std::nullopt;
	};
	const std::string layout = layout_of(slide_part);
	if (layout.empty()) {
		return std::nullopt;
	}
	if (placeholder_idx) {
		if (auto loc = search(layout, [&](const shape& c) { return c.placeholder_idx() == placeholder_idx; })) {
			return loc;
		}
	}
	if (auto loc = search(layout, [&](const shape& c) { return c.placeholder_type() == placeholder_type; })) {
		return loc;
	}
	const relationship_set* layout_rels = find_relationships(layout);
	const relationship* master = layout_rels == nullptr ? nullptr : layout_rels->find_by_type(REL_TYPE_SLIDE_MASTER);
	if (master == nullptr) {
		return std::nullopt;
	}
	std::string master_type = placeholder_type;
	if (master_type == "ctrTitle") {
		master_type = "title";
	} else if (master_type == "subTitle" || master_type == "obj") {
		master_type = "body";
	}
	return search(layout_rels->target_part(*master), [&](const shape& c) { return c.placeholder_type() == master_type; });
}

pugi::xml_node slide::shape_tree() const {
	const pugi::xml_node root = owner->xml_part(part).document_element();
	return find_child(find_child(root, "cSld"), "spTree");
}

std::vector<shape> slide::shapes() const {
	std::vector<shape> result;
	for (pugi::xml_node child : shape_tree().children()) {
		if (is_shape_element(child)) {
			result.emplace_back(child, owner, part);
		}
	}
	return result;
}

std::vector<shape> slide::placeholders() const {
	std::vector<shape> result;
	for (auto& candidate : shapes()) {
		if (candidate.is_placeholder()) {
			result.push_back(std::move(candidate));
		}
	}
	return result;
}

std::optional<shape> slide::find_placeholder(std::initializer_list<std::string_view> types) const {
	for (auto& candidate : placeholders()) {
		const std::string type = candidate.placeholder_type();
		if (std::ranges::find(types, std::string_view(type)) != types.end()) {
			return candidate;
		}
	}
	return std::nullopt;
}

unsigned int slide::next_shape_id() const {
	unsigned int highest = 0;
	for (pugi::xml_node cnvpr : find_descendants(owner->xml_part(part).document_element(), "cNvPr")) {
		highest = std::max(highest, cnvpr.attribute("id").as_uint());
	}
	return highest + 1;
}

shape slide::insert_shape_xml(const std::string& xml, const std::optional<location>& loc) {
	pugi::xml_document fragment;
	if (!load_fragment(fragment, xml)) {
		throw generation_exception(_("Shape XML could not be parsed"));
	}
	pugi::xml_node source = fragment.document_element();
	const pugi::xml_node slide_root = owner->xml_part(part).document_element();
	for (pugi::xml_attribute attr = source.first_attribute(); attr;) {
		pugi::xml_attribute next = attr.next_attribute();
		if (std::strncmp(attr.name(), "xmlns", 5) == 0 && std::strcmp(slide_root.attribute(attr.name()).as_string(), attr.value()) == 0) {
			source.remove_attribute(attr);
		}
		attr = next;
	}
	pugi::xml_node tree = shape_tree();
	const pugi::xml_node ext_list = find_child(tree, "extLst");
	pugi::xml_node inserted = ext_list ? tree.insert_copy_before(source, ext_list) : tree.append_copy(source);
	shape result(inserted, owner, part);
	if (loc) {
		result.set_geometry(*loc);
	}
	return result;
}

void slide::remove_shape(const shape& target) {
	pugi::xml_node node = target.node();
	node.parent().remove_child(node);
}

shape slide::add_picture(const std::string& image_part, const location& loc, unsigned int id, const std::string& name) {
	const std::string rel_id = owner->relationships(part).add(REL_TYPE_IMAGE, image_part);
	pugi::xml_node tree = shape_tree();
	const pugi::xml_node ext_list = find_child(tree, "extLst");
	pugi::xml_node pic = ext_list ? tree.insert_child_before("p:pic", ext_list) : tree.append_child("p:pic");
	pugi::xml_node nv = pic.append_child("p:nvPicPr");
	pugi::xml_node cnvpr = nv.append_child("p:cNvPr");
	cnvpr.append_attribute("id").set_value(id);
	cnvpr.append_attribute("name").set_value(name.c_str());
	cnvpr.append_attribute("descr").set_value("");
	nv.append_child("p:cNvPicPr").append_child("a:picLocks").append_attribute("noChangeAspect").set_value(1);
	nv.append_child("p:nvPr");
	pugi::xml_node fill = pic.append_child("p:blipFill");
	fill.append_child("a:blip").append_attribute("r:embed").set_value(rel_id.c_str());
	fill.append_child("a:stretch").append_child("a:fillRect");
	pugi::xml_node props = pic.append_child("p:spPr");
	pugi::xml_node geom = props.append_child("a:prstGeom");
	geom.append_attribute("prst").set_value("rect");
	geom.append_child("a:avLst");
	shape result(pic, owner, part);
	result.set_geometry(loc);
	return result;
}

std::string slide::image_blob(const shape& picture) const {
	const pugi::xml_node blip = find_descendant(picture.node(), "blip");
	const std::string rel_id = relationship_attribute(blip, "embed").as_string();
	const relationship_set* rels = owner->find_relationships(part);
	const std::string target = rels == nullptr ? std::string{} : rels->target_part(rel_id);
	if (target.empty() || !owner->has_part(target)) {
		throw template_exception(wxString::Format(_("Picture %s has no embedded image"), wxString::FromUTF8(picture.name())));
	}
	return owner->part_data(target);
}

std::string slide::layout_part() const {
	return owner->layout_of(part);
}
