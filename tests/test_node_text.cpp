/* test_node_text.cpp - tests for text gathering over element subtrees.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "deck_generator.hpp"
#include "document.hpp"
#include "element.hpp"
#include "markdown_parser.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

TEST(NodeTextTest, StrippedParagraphDropsListMarker) {
	const paragraph bullet("- item ");
	EXPECT_EQ(bullet.own_string(true), "item");
	EXPECT_EQ(bullet.own_string(false), "- item ");
	const paragraph ordered("3. third");
	EXPECT_EQ(ordered.own_string(true), "third");
}

TEST(NodeTextTest, CodeBlockKeepsFenceUnlessStripped) {
	const code_block code("x = 1", "py");
	EXPECT_EQ(code.own_string(false), "```py\nx = 1\n```");
	EXPECT_EQ(code.own_string(true), "x = 1");
}

TEST(NodeTextTest, SeparatorAndTypeFilter) {
	const markdown_parser parser;
	const auto doc = parser.parse("# Deck\n## One\nalpha\n```\ncode\n```\n## Two\nbeta\n");
	EXPECT_EQ(doc->tree.get_text(doc->main, " | ", true), "One | alpha | code | Two | beta");
	EXPECT_EQ(doc->tree.get_text(doc->main, ",", true, element_type::heading), "One,Two");
	EXPECT_EQ(doc->tree.get_text(doc->main, ",", true, element_type::paragraph | element_type::code_block), "alpha,code,beta");
}

TEST(NodeTextTest, LeafRejectsTypeFilter) {
	const markdown_parser parser;
	const auto doc = parser.parse("# Deck\ntext\n");
	const element_id leaf = doc->tree.children(doc->main).front();
	EXPECT_EQ(doc->tree.get_text(leaf), "text");
	EXPECT_THROW((void)doc->tree.get_text(leaf, "\n", false, element_type::paragraph), std::invalid_argument);
}

TEST(NodeTextTest, ChapterContentCollectsPoints) {
	const markdown_parser parser;
	const auto doc = parser.parse("# Deck\n## Plans\n### First\n- do this\n- then that\n### Second\nwrap up\n");
	const auto chapters = doc->chapters();
	ASSERT_EQ(chapters.size(), 1U);
	const chapter_content content = make_chapter_content(*doc, chapters.front());
	EXPECT_EQ(content.title, "Plans");
	EXPECT_EQ(content.point_titles, (std::vector<std::string>{"First", "Second"}));
	EXPECT_EQ(content.point_texts, (std::vector<std::string>{"do this\nthen that", "wrap up"}));
}

TEST(NodeTextTest, ParagraphPointIsItsOwnText) {
	const markdown_parser parser;
	const auto doc = parser.parse("# Deck\n## Short\n- only point\n");
	const chapter_content content = make_chapter_content(*doc, doc->chapters().front());
	EXPECT_EQ(content.point_titles, (std::vector<std::string>{"only point"}));
	EXPECT_EQ(content.point_texts, (std::vector<std::string>{"only point"}));
}
