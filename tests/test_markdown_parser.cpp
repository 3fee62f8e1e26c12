/* test_markdown_parser.cpp - tests for the line-oriented Markdown parser.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "document.hpp"
#include "exceptions.hpp"
#include "markdown_parser.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <wx/log.h>

namespace {
std::vector<std::string> child_texts(const markdown_document& doc, element_id node) {
	std::vector<std::string> texts;
	for (const element_id child : doc.tree.children(node)) {
		texts.push_back(doc.tree.at(child).element_text());
	}
	return texts;
}

template <typename T>
const T* only_child(const markdown_document& doc, element_id node) {
	const auto children = doc.tree.children(node);
	return children.size() == 1 ? doc.tree.get_if<T>(children.front()) : nullptr;
}
} // namespace

TEST(MarkdownParserTest, HeadingsNestByLevel) {
	const markdown_parser parser;
	const auto doc = parser.parse("# A\n## B\n### C\n## D\n# E\n");
	ASSERT_NE(doc->main_heading(), nullptr);
	EXPECT_EQ(doc->title(), "A");
	EXPECT_EQ(child_texts(*doc, doc->root()), (std::vector<std::string>{"A", "E"}));
	EXPECT_EQ(child_texts(*doc, doc->main), (std::vector<std::string>{"B", "D"}));
	const element_id b = doc->tree.children(doc->main).front();
	EXPECT_EQ(child_texts(*doc, b), (std::vector<std::string>{"C"}));
	EXPECT_EQ(doc->headings(2).size(), 2U);
	EXPECT_EQ(doc->chapters().size(), 2U);
}

TEST(MarkdownParserTest, SkippedLevelsStillNest) {
	const markdown_parser parser;
	const auto doc = parser.parse("# A\n### Deep\n## Shallow\n");
	EXPECT_EQ(child_texts(*doc, doc->main), (std::vector<std::string>{"Deep", "Shallow"}));
}

TEST(MarkdownParserTest, SetextAndAtxProduceSameOutline) {
	const markdown_parser parser;
	const auto setext = parser.parse("Title\n=====\n\nSub\n---\ntext\n");
	const auto atx = parser.parse("# Title\n\n## Sub\ntext\n");
	EXPECT_EQ(setext->title(), atx->title());
	EXPECT_EQ(setext->chapters().size(), 1U);
	EXPECT_EQ(setext->text(true), atx->text(true));
	EXPECT_EQ(setext->text(true), "Title\nSub\ntext");
	// Unstripped text keeps each heading's original markup.
	EXPECT_EQ(setext->text(), "Title\n=====\nSub\n---\ntext");
	EXPECT_EQ(atx->text(), "# Title\n## Sub\ntext");
}

TEST(MarkdownParserTest, SetextNeedsPlainTextLine) {
	const markdown_parser parser;
	const auto doc = parser.parse("- item\n---\n");
	EXPECT_EQ(doc->main, null_element);
	EXPECT_TRUE(doc->headings(2).empty());
}

TEST(MarkdownParserTest, MakeSetextHeadingRejectsDeepLevels) {
	element_tree tree;
	EXPECT_THROW(markdown_parser::make_setext_heading(tree, "x", "===", 3), std::logic_error);
	const element_id id = markdown_parser::make_setext_heading(tree, " Title ", "===", 1);
	EXPECT_EQ(tree.get_if<heading>(id)->text, "Title");
	EXPECT_EQ(tree.at(id).element_text_source(), " Title \n===");
}

TEST(MarkdownParserTest, ListItemsBecomeParagraphs) {
	const markdown_parser parser;
	const auto doc = parser.parse("# T\n- one\n* two\n+ three\n1. four\n2) five\n");
	EXPECT_EQ(child_texts(*doc, doc->main), (std::vector<std::string>{"one", "two", "three", "four", "five"}));
}

TEST(MarkdownParserTest, FencedCodeBlockIsOpaque) {
	const markdown_parser parser;
	const auto doc = parser.parse("# T\n```cpp\n# not a heading\nint x;\n```\nafter\n");
	const auto children = doc->tree.children(doc->main);
	ASSERT_EQ(children.size(), 2U);
	const auto* code = doc->tree.get_if<code_block>(children[0]);
	ASSERT_NE(code, nullptr);
	EXPECT_EQ(code->language, "cpp");
	EXPECT_EQ(code->code, "# not a heading\nint x;");
	EXPECT_EQ(doc->headings(1).size(), 1U);
}

TEST(MarkdownParserTest, UnterminatedFenceRunsToEnd) {
	const markdown_parser parser;
	const auto doc = parser.parse("```\nline one\nline two");
	const auto* code = only_child<code_block>(*doc, doc->root());
	ASSERT_NE(code, nullptr);
	EXPECT_EQ(code->code, "line one\nline two");
	EXPECT_TRUE(code->language.empty());
}

TEST(MarkdownParserTest, PipeTableNeedsSeparatorRow) {
	const markdown_parser parser;
	const auto doc = parser.parse("| a | b |\n|---|:-:|\n| 1 | 2 |\n| 3 | 4 |\nafter\n");
	const auto children = doc->tree.children(doc->root());
	ASSERT_EQ(children.size(), 2U);
	const auto* t = doc->tree.get_if<table>(children[0]);
	ASSERT_NE(t, nullptr);
	EXPECT_EQ(t->kind, table_kind::markdown);
	EXPECT_EQ(t->headers, (std::vector<std::string>{"a", "b"}));
	EXPECT_EQ(t->row_count, 2U);
	EXPECT_EQ(t->column_count, 2U);
	EXPECT_EQ(doc->tree.at(children[1]).element_text(), "after");
}

TEST(MarkdownParserTest, PipeRowWithoutSeparatorIsParagraph) {
	const markdown_parser parser;
	const auto doc = parser.parse("| a | b |\nplain\n");
	const auto children = doc->tree.children(doc->root());
	ASSERT_EQ(children.size(), 2U);
	EXPECT_NE(doc->tree.get_if<paragraph>(children[0]), nullptr);
	EXPECT_EQ(doc->tree.at(children[0]).element_text(), "| a | b |");
}

TEST(MarkdownParserTest, HeaderOnlyTableHasNoRows) {
	const markdown_parser parser;
	const auto doc = parser.parse("| a |\n|---|\n\ntext\n");
	const auto children = doc->tree.children(doc->root());
	ASSERT_EQ(children.size(), 2U);
	const auto* t = doc->tree.get_if<table>(children[0]);
	ASSERT_NE(t, nullptr);
	EXPECT_EQ(t->row_count, 0U);
	EXPECT_EQ(t->column_count, 1U);
}

TEST(MarkdownParserTest, BlankLineEndsPipeTable) {
	const markdown_parser parser;
	const auto doc = parser.parse("| a |\n|---|\n| 1 |\n\n| 2 |\n");
	const auto children = doc->tree.children(doc->root());
	ASSERT_EQ(children.size(), 2U);
	EXPECT_EQ(doc->tree.get_if<table>(children[0])->row_count, 1U);
	EXPECT_NE(doc->tree.get_if<paragraph>(children[1]), nullptr);
}

TEST(MarkdownParserTest, HtmlTableIsCollected) {
	const markdown_parser parser;
	const auto doc = parser.parse("<table>\n<thead><tr><th>X</th><th>Y</th></tr></thead>\n<tbody><tr><td>1</td><td>2</td></tr>\n<tr><td>3</td><td>4</td></tr></tbody>\n</table>\nafter\n");
	const auto children = doc->tree.children(doc->root());
	ASSERT_EQ(children.size(), 2U);
	const auto* t = doc->tree.get_if<table>(children[0]);
	ASSERT_NE(t, nullptr);
	EXPECT_EQ(t->kind, table_kind::html);
	EXPECT_EQ(t->headers, (std::vector<std::string>{"X", "Y"}));
	EXPECT_EQ(t->row_count, 2U);
	EXPECT_EQ(t->column_count, 2U);
}

TEST(MarkdownParserTest, ImageLineBecomesPicture) {
	const markdown_parser parser;
	const auto doc = parser.parse("![A cat](images/cat.png \"Cat\")\n![](plain.jpg)\n");
	const auto children = doc->tree.children(doc->root());
	ASSERT_EQ(children.size(), 2U);
	const auto* first = doc->tree.get_if<picture>(children[0]);
	ASSERT_NE(first, nullptr);
	EXPECT_EQ(first->src, "images/cat.png");
	EXPECT_EQ(first->alt_text, "A cat");
	EXPECT_EQ(first->title, "Cat");
	const auto* second = doc->tree.get_if<picture>(children[1]);
	ASSERT_NE(second, nullptr);
	EXPECT_FALSE(second->alt_text.has_value());
	EXPECT_EQ(second->element_text(), "![](plain.jpg)");
}

TEST(MarkdownParserTest, WindowsLineEndings) {
	const markdown_parser parser;
	const auto doc = parser.parse("# Title\r\n## One\r\ntext\r\n");
	EXPECT_EQ(doc->title(), "Title");
	EXPECT_EQ(doc->text(true), "Title\nOne\ntext");
}

TEST(MarkdownParserTest, EmptyInputGivesEmptyDocument) {
	const markdown_parser parser;
	const auto doc = parser.parse("");
	EXPECT_TRUE(doc->tree.children(doc->root()).empty());
	EXPECT_EQ(doc->main_heading(), nullptr);
	EXPECT_TRUE(doc->chapters().empty());
}

TEST(MarkdownParserTest, MissingFileThrows) {
	wxLogNull no_log;
	const markdown_parser parser;
	EXPECT_THROW((void)parser.load("/nonexistent/slidesmith/input.md"), parser_exception);
}
