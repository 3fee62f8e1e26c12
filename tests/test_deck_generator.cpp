/* test_deck_generator.cpp - tests for whole-deck generation from Markdown.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "deck_generator.hpp"
#include "exceptions.hpp"
#include "markdown_parser.hpp"
#include "test_template.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include <wx/filefn.h>
#include <wx/filename.h>

using namespace testing_support;

namespace {
constexpr const char* five_chapters = "# Deck\n\n"
									  "## One\n\n### Alpha\n\nalpha text\n\n### Beta\n\nbeta text\n\n"
									  "## Two\n\n### Gamma\n\ngamma text\n\n"
									  "## Three\n\n### Delta\n\n"
									  "## Four\n\n### Epsilon\n\n"
									  "## Five\n\n### Zeta\n";

std::vector<std::string> texts_named(const slide& page, const std::string& prefix) {
	std::vector<std::string> result;
	for (const auto& current : page.shapes()) {
		if (current.name().starts_with(prefix)) {
			result.push_back(current.text());
		}
	}
	return result;
}

std::string title_of(presentation& deck, std::size_t index) {
	const auto title = deck.get_slide(index).find_placeholder({"title", "ctrTitle"});
	return title ? title->text() : std::string{};
}

class DeckGeneratorTest : public ::testing::Test {
protected:
	std::unique_ptr<presentation> deck = make_template();
	layout_catalog catalog = make_catalog();
	synthesis_settings settings;
	markdown_parser parser;

	void SetUp() override {
		settings.random_seed = 3;
	}
};
} // namespace

TEST_F(DeckGeneratorTest, BuildsEverySection) {
	const auto doc = parser.parse(five_chapters);
	deck_generator generator(catalog, settings);
	generator.generate(*deck, *doc);
	ASSERT_EQ(deck->slide_count(), 14U);
	EXPECT_EQ(title_of(*deck, 0), "Deck");
	EXPECT_EQ(texts_named(deck->get_slide(1), "Number"), (std::vector<std::string>{"01", "02", "03"}));
	EXPECT_EQ(texts_named(deck->get_slide(2), "Number"), (std::vector<std::string>{"04", "05"}));
	EXPECT_EQ(texts_named(deck->get_slide(2), "Label"), (std::vector<std::string>{"Four", "Five"}));
	const std::vector<std::string> chapters{"One", "Two", "Three", "Four", "Five"};
	for (std::size_t i = 0; i < chapters.size(); ++i) {
		EXPECT_EQ(title_of(*deck, 3 + (2 * i)), chapters[i]);
		EXPECT_EQ(title_of(*deck, 4 + (2 * i)), chapters[i]);
		EXPECT_EQ(texts_named(deck->get_slide(3 + (2 * i)), "Index"), (std::vector<std::string>{generator.session().format_chapter_number(static_cast<int>(i) + 1)}));
	}
	EXPECT_EQ(texts_named(deck->get_slide(4), "Title_1"), (std::vector<std::string>{"Alpha", "Beta"}));
	EXPECT_EQ(texts_named(deck->get_slide(6), "Title_1"), (std::vector<std::string>{"Gamma"}));
	EXPECT_EQ(title_of(*deck, 13), "Thank you!");
}

TEST_F(DeckGeneratorTest, SingleCatalogPageWhenChaptersFit) {
	const auto doc = parser.parse("# Short\n\n## Only\n\n### Point\n\ntext\n");
	deck_generator generator(catalog, settings);
	generator.generate(*deck, *doc);
	ASSERT_EQ(deck->slide_count(), 5U);
	EXPECT_EQ(texts_named(deck->get_slide(1), "Label"), (std::vector<std::string>{"Only"}));
	EXPECT_EQ(title_of(*deck, 2), "Only");
	EXPECT_EQ(title_of(*deck, 4), "Thank you!");
}

TEST_F(DeckGeneratorTest, SameSeedGivesSameDeck) {
	const auto doc = parser.parse(five_chapters);
	auto other = make_template();
	deck_generator first(catalog, settings);
	deck_generator second(catalog, settings);
	first.generate(*deck, *doc);
	second.generate(*other, *doc);
	EXPECT_EQ(texts_named(deck->get_slide(3), "Index"), texts_named(other->get_slide(3), "Index"));
}

TEST_F(DeckGeneratorTest, GeneratedDeckSurvivesSaveAndLoad) {
	const auto doc = parser.parse(five_chapters);
	deck_generator generator(catalog, settings);
	generator.generate(*deck, *doc);
	const wxString path = wxFileName::CreateTempFileName("slidesmith");
	deck->save(path);
	const auto loaded = presentation::load(path);
	wxRemoveFile(path);
	ASSERT_EQ(loaded->slide_count(), 14U);
	EXPECT_EQ(title_of(*loaded, 0), "Deck");
	EXPECT_EQ(texts_named(loaded->get_slide(4), "Title_1"), (std::vector<std::string>{"Alpha", "Beta"}));
	EXPECT_EQ(title_of(*loaded, 13), "Thank you!");
}

TEST_F(DeckGeneratorTest, RejectsDocumentsWithoutStructure) {
	deck_generator generator(catalog, settings);
	EXPECT_THROW(generator.generate(*deck, *parser.parse("## Chapter\n\n### Point\n")), document_exception);
	EXPECT_THROW(generator.generate(*deck, *parser.parse("# Title\n\nJust text\n")), document_exception);
	EXPECT_EQ(deck->slide_count(), 5U);
}

TEST_F(DeckGeneratorTest, RejectsChapterWithTooManyPoints) {
	const auto doc = parser.parse("# Deck\n\n## Busy\n\n### a\n\n### b\n\n### c\n\n### d\n\n### e\n");
	deck_generator generator(catalog, settings);
	EXPECT_THROW(generator.generate(*deck, *doc), generation_exception);
	EXPECT_EQ(deck->slide_count(), 5U);
	EXPECT_EQ(title_of(*deck, 0), "Cover title");
}

TEST_F(DeckGeneratorTest, RejectsShortTemplate) {
	deck->remove_slide(4);
	deck_generator generator(catalog, settings);
	EXPECT_THROW(generator.generate(*deck, *parser.parse(five_chapters)), template_exception);
}
