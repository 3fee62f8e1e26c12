/* markdown_parser.cpp - builds the element tree from Markdown in a single pass over its lines.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "markdown_parser.hpp"
#include "document.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <memory>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stream.h>
#include <wx/string.h>
#include <wx/translation.h>
#include <wx/wfstream.h>

namespace {
const std::regex fence_open_re(R"(^\s*```(\w+)?)");
const std::regex atx_heading_re(R"(^(#{1,6})\s+(.+?)(?:\s+#+)?\s*$)");
const std::regex setext_level1_re(R"(^=+\s*$)");
const std::regex setext_level2_re(R"(^-+\s*$)");
const std::regex bullet_item_re(R"(^\s*[-*+]\s+(.*)$)");
const std::regex ordered_item_re(R"(^\s*\d+[.)]\s+(.*)$)");
const std::regex separator_cell_re(R"(^\s*:?-+:?\s*$)");
const std::regex image_re(R"(^\s*!\[([^\]]*)\]\(\s*([^\s)]+)(?:\s+\"([^\"]*)\")?\s*\)\s*$)");
const std::regex html_table_open_re(R"(<table)", std::regex::icase);
const std::regex html_table_close_re(R"(</table>)", std::regex::icase);
const std::regex html_thead_re(R"(<thead[^>]*>([\s\S]*?)</thead>)", std::regex::icase);
const std::regex html_tbody_re(R"(<tbody[^>]*>([\s\S]*?)</tbody>)", std::regex::icase);
const std::regex html_th_re(R"(<th[^>]*>([\s\S]*?)</th>)", std::regex::icase);
const std::regex html_tr_re(R"(<tr[^>]*>([\s\S]*?)</tr>)", std::regex::icase);
const std::regex html_td_re(R"(<td[^>]*>([\s\S]*?)</td>)", std::regex::icase);
const std::regex html_tag_re(R"(<[^>]*>)");

bool is_blank(const std::string& line) {
	return std::all_of(line.begin(), line.end(), [](unsigned char ch) {
		return std::isspace(ch) != 0;
	});
}

bool starts_with_pipe(const std::string& line) {
	const std::string trimmed = trim_string(line);
	return !trimmed.empty() && trimmed.front() == '|';
}

bool is_pipe_row(const std::string& line) {
	const std::string trimmed = trim_string(line);
	return trimmed.size() >= 2 && trimmed.front() == '|' && trimmed.back() == '|';
}

std::vector<std::string> split_pipe_cells(const std::string& line) {
	std::string trimmed = trim_string(line);
	if (!trimmed.empty() && trimmed.front() == '|') {
		trimmed.erase(0, 1);
	}
	if (!trimmed.empty() && trimmed.back() == '|') {
		trimmed.pop_back();
	}
	std::vector<std::string> cells;
	std::string cell;
	std::istringstream iss(trimmed);
	while (std::getline(iss, cell, '|')) {
		cells.push_back(trim_string(cell));
	}
	return cells;
}

bool is_separator_row(const std::string& line) {
	if (!is_pipe_row(line)) {
		return false;
	}
	const auto cells = split_pipe_cells(line);
	if (cells.empty()) {
		return false;
	}
	return std::all_of(cells.begin(), cells.end(), [](const std::string& cell) {
		return std::regex_match(cell, separator_cell_re);
	});
}

bool is_fence(const std::string& line) {
	const std::string trimmed = trim_string(line);
	return trimmed.rfind("```", 0) == 0;
}

// Only plain text lines can carry a Setext underline.
bool is_setext_candidate(const std::string& line) {
	return !std::regex_match(line, atx_heading_re) && !starts_with_pipe(line) && !is_fence(line) && !std::regex_match(line, bullet_item_re) && !std::regex_match(line, ordered_item_re);
}

std::string strip_tags(const std::string& html) {
	return trim_string(std::regex_replace(html, html_tag_re, ""));
}

std::size_t count_matches(const std::string& text, const std::regex& re) {
	return static_cast<std::size_t>(std::distance(std::sregex_iterator(text.begin(), text.end(), re), std::sregex_iterator()));
}

std::vector<std::string> split_lines(std::string_view text) {
	std::vector<std::string> lines;
	std::string current;
	for (const char ch : text) {
		if (ch == '\n') {
			if (!current.empty() && current.back() == '\r') {
				current.pop_back();
			}
			lines.push_back(std::move(current));
			current.clear();
		} else {
			current.push_back(ch);
		}
	}
	if (!current.empty()) {
		if (current.back() == '\r') {
			current.pop_back();
		}
		lines.push_back(std::move(current));
	}
	return lines;
}

class parse_state {
public:
	explicit parse_state(markdown_document& d) : doc{d}, tree{d.tree}, previous_heading{d.root()} {
	}

	void run(const std::vector<std::string>& lines) {
		std::size_t i = 0;
		while (i < lines.size()) {
			if (jump_to_next) {
				jump_to_next = false;
				++i;
				continue;
			}
			const std::string& line = lines[i];
			const std::string* next = i + 1 < lines.size() ? &lines[i + 1] : nullptr;
			if (in_code_block) {
				if (is_fence(line)) {
					close_code_block();
				} else {
					code_lines.push_back(line);
				}
				++i;
				continue;
			}
			if (in_table_block) {
				if (!continue_table(line, next)) {
					continue;
				}
				++i;
				continue;
			}
			dispatch(line, next, i + 2 < lines.size() ? &lines[i + 2] : nullptr);
			++i;
		}
		if (in_code_block) {
			close_code_block();
		}
		if (in_table_block) {
			close_table();
		}
	}

private:
	markdown_document& doc;
	element_tree& tree;
	element_id previous_heading;
	bool jump_to_next{false};
	bool in_code_block{false};
	bool in_table_block{false};
	table_kind table_type{table_kind::markdown};
	std::string code_language;
	std::vector<std::string> code_lines;
	std::vector<std::string> table_lines;

	void dispatch(const std::string& line, const std::string* next, const std::string* after_next) {
		if (try_code_fence(line)) {
			return;
		}
		if (try_heading(line, next)) {
			return;
		}
		if (try_list_item(line)) {
			return;
		}
		if (try_table_start(line, next, after_next)) {
			return;
		}
		if (try_image(line)) {
			return;
		}
		if (!is_blank(line)) {
			tree.append(previous_heading, tree.create<paragraph>(trim_string(line)));
		}
	}

	bool try_code_fence(const std::string& line) {
		std::smatch match;
		if (!std::regex_search(line, match, fence_open_re)) {
			return false;
		}
		in_code_block = true;
		code_language = match[1].matched ? match[1].str() : std::string{};
		code_lines.clear();
		return true;
	}

	bool try_heading(const std::string& line, const std::string* next) {
		if (next != nullptr && !is_blank(line) && !is_blank(*next) && is_setext_candidate(line)) {
			int level = 0;
			if (std::regex_match(*next, setext_level1_re)) {
				level = 1;
			} else if (std::regex_match(*next, setext_level2_re)) {
				level = 2;
			}
			if (level != 0) {
				place_heading(markdown_parser::make_setext_heading(tree, line, *next, level));
				jump_to_next = true;
				return true;
			}
		}
		std::smatch match;
		if (!std::regex_match(line, match, atx_heading_re)) {
			return false;
		}
		const int level = static_cast<int>(match[1].length());
		place_heading(tree.create<heading>(level, trim_string(match[2].str())));
		return true;
	}

	// Walks up from the cursor until the new heading nests under something shallower.
	void place_heading(element_id id) {
		const int level = tree.get_if<heading>(id)->level;
		element_id cursor = previous_heading;
		while (cursor != doc.root()) {
			const heading* h = tree.get_if<heading>(cursor);
			if (h == nullptr || h->level < level) {
				break;
			}
			cursor = tree.at(cursor).parent;
		}
		tree.append(cursor, id);
		if (level == 1 && doc.main == null_element) {
			doc.main = id;
		}
		previous_heading = id;
	}

	bool try_list_item(const std::string& line) {
		std::smatch match;
		if (!std::regex_match(line, match, bullet_item_re) && !std::regex_match(line, match, ordered_item_re)) {
			return false;
		}
		tree.append(previous_heading, tree.create<paragraph>(trim_string(match[1].str())));
		return true;
	}

	bool try_table_start(const std::string& line, const std::string* next, const std::string* after_next) {
		if (is_pipe_row(line) && next != nullptr && is_separator_row(*next)) {
			in_table_block = true;
			table_type = table_kind::markdown;
			table_lines = {line};
			jump_to_next = true;
			if (after_next == nullptr || !starts_with_pipe(*after_next)) {
				close_table();
			}
			return true;
		}
		if (std::regex_search(line, html_table_open_re)) {
			in_table_block = true;
			table_type = table_kind::html;
			table_lines = {line};
			if (std::regex_search(line, html_table_close_re)) {
				close_table();
			}
			return true;
		}
		return false;
	}

	// Returns false when the line ends the table without being consumed.
	bool continue_table(const std::string& line, const std::string* next) {
		if (table_type == table_kind::html) {
			table_lines.push_back(line);
			if (std::regex_search(line, html_table_close_re)) {
				close_table();
			}
			return true;
		}
		if (is_blank(line) || !starts_with_pipe(line)) {
			close_table();
			return false;
		}
		table_lines.push_back(line);
		if (next == nullptr || !starts_with_pipe(*next)) {
			close_table();
		}
		return true;
	}

	bool try_image(const std::string& line) {
		std::smatch match;
		if (!std::regex_match(line, match, image_re)) {
			return false;
		}
		std::optional<std::string> alt;
		if (match[1].length() > 0) {
			alt = match[1].str();
		}
		std::optional<std::string> title;
		if (match[3].matched) {
			title = match[3].str();
		}
		tree.append(previous_heading, tree.create<picture>(match[2].str(), alt, title));
		return true;
	}

	void close_code_block() {
		std::string code;
		for (std::size_t i = 0; i < code_lines.size(); ++i) {
			if (i > 0) {
				code += '\n';
			}
			code += code_lines[i];
		}
		tree.append(previous_heading, tree.create<code_block>(std::move(code), code_language));
		in_code_block = false;
		code_lines.clear();
		code_language.clear();
	}

	void close_table() {
		std::string text;
		for (std::size_t i = 0; i < table_lines.size(); ++i) {
			if (i > 0) {
				text += '\n';
			}
			text += table_lines[i];
		}
		const element_id id = table_type == table_kind::markdown ? build_pipe_table(text) : build_html_table(text);
		tree.append(previous_heading, id);
		in_table_block = false;
		table_lines.clear();
	}

	element_id build_pipe_table(const std::string& text) {
		auto headers = split_pipe_cells(table_lines.front());
		const element_id id = tree.create<table>(headers, text, table_kind::markdown);
		table* t = tree.get_if<table>(id);
		t->row_count = table_lines.size() - 1;
		t->column_count = headers.size();
		return id;
	}

	// Regex extraction only; malformed or nested markup yields partial results.
	element_id build_html_table(const std::string& text) {
		std::vector<std::string> headers;
		std::smatch section;
		const std::string header_scope = std::regex_search(text, section, html_thead_re) ? section[1].str() : text;
		for (std::sregex_iterator it(header_scope.begin(), header_scope.end(), html_th_re), end; it != end; ++it) {
			headers.push_back(strip_tags((*it)[1].str()));
		}
		const std::string body_scope = std::regex_search(text, section, html_tbody_re) ? section[1].str() : text;
		std::size_t rows = 0;
		std::size_t columns = headers.size();
		for (std::sregex_iterator it(body_scope.begin(), body_scope.end(), html_tr_re), end; it != end; ++it) {
			const std::string row = (*it)[1].str();
			const std::size_t cells = count_matches(row, html_td_re);
			if (cells == 0) {
				continue;
			}
			++rows;
			columns = std::max(columns, cells);
		}
		const element_id id = tree.create<table>(std::move(headers), text, table_kind::html);
		table* t = tree.get_if<table>(id);
		t->row_count = rows;
		t->column_count = columns;
		return id;
	}
};
} // namespace

std::unique_ptr<markdown_document> markdown_parser::load(const wxString& path) const {
	wxFileInputStream file_stream(path);
	if (!file_stream.IsOk()) {
		throw parser_exception(_("Failed to open Markdown file"), path);
	}
	wxBufferedInputStream bs(file_stream);
	const size_t file_size = bs.GetSize();
	std::vector<char> buffer(file_size);
	if (file_size > 0) {
		bs.Read(buffer.data(), file_size);
		if (bs.LastRead() != file_size) {
			throw parser_exception(_("Failed to read Markdown file"), path);
		}
	}
	auto doc = parse(convert_to_utf8(std::string(buffer.data(), buffer.size())));
	doc->file_name = wxFileName(path).GetName();
	return doc;
}

std::unique_ptr<markdown_document> markdown_parser::parse(std::string_view text) const {
	auto doc = std::make_unique<markdown_document>();
	parse_state state(*doc);
	state.run(split_lines(text));
	wxLogDebug("Parsed Markdown into %d elements", static_cast<int>(doc->tree.descendants(doc->root()).size()));
	return doc;
}

element_id markdown_parser::make_setext_heading(element_tree& tree, const std::string& line, const std::string& underline, int level) {
	if (level != 1 && level != 2) {
		throw std::logic_error("Setext headings only have levels 1 and 2");
	}
	return tree.create<heading>(level, trim_string(line), line + "\n" + underline);
}
