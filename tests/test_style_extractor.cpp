/* test_style_extractor.cpp - tests for turning example slides into catalog styles.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "exceptions.hpp"
#include "layout_catalog.hpp"
#include "slide_pages.hpp"
#include "style_extractor.hpp"
#include "synthesis_session.hpp"
#include "test_template.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/utils.h>

using namespace testing_support;

namespace {
class StyleExtractorTest : public ::testing::Test {
protected:
	std::unique_ptr<presentation> deck = make_template();
	layout_catalog catalog;
	synthesis_settings settings;
	wxString picture_dir;

	void SetUp() override {
		picture_dir = wxFileName::GetTempDir() + wxFileName::GetPathSeparator() + wxString::Format("slidesmith_pictures_%lu", wxGetProcessId());
		settings.picture_dir = picture_dir;
		catalog.add_layout("two_points");
	}

	void TearDown() override {
		if (wxFileName::DirExists(picture_dir)) {
			wxFileName::Rmdir(picture_dir, wxPATH_RMDIR_RECURSIVE);
		}
	}

	// Two titles, two bodies, a badge number, an empty spacer and a photo, after the layout's title placeholder.
	slide make_source_slide() {
		slide source = deck->add_slide(deck->layout_parts().front());
		source.insert_shape_xml(standalone(text_box(10, "Title A", "Point one", {100000, 100000, 2000000, 500000}, 2400)));
		source.insert_shape_xml(standalone(text_box(11, "Title B", "Point two", {100000, 3000000, 2000000, 500000}, 2400)));
		source.insert_shape_xml(standalone(text_box(12, "Body A", "Long text", {2500000, 100000, 6000000, 2000000}, 1400)));
		source.insert_shape_xml(standalone(text_box(13, "Body B", "More text", {2500000, 3000000, 6000000, 2000000}, 1400)));
		source.insert_shape_xml(standalone(text_box(14, "Badge", "1", {0, 0, 400000, 400000}, 3200)));
		source.insert_shape_xml(standalone(text_box(15, "Spacer", "", {0, 6000000, 9000000, 100000}, 1000)));
		source.add_picture(deck->add_media("PNGDATA", "png"), {7000000, 100000, 1000000, 1000000}, 16, "Photo");
		return source;
	}
};
} // namespace

TEST_F(StyleExtractorTest, ClassifiesAndMergesShapes) {
	style_extractor extractor(catalog, settings);
	const style& added = extractor.add_style_from_slide(make_source_slide(), "two_points", "extracted");
	EXPECT_EQ(added.name, "extracted");
	ASSERT_EQ(added.shapes.size(), 5U);

	const cshape& title = added.shapes.at("Title A_1");
	EXPECT_EQ(title.type, content_type::title);
	EXPECT_EQ(title.zorder, 1);
	ASSERT_EQ(title.locations.size(), 2U);
	EXPECT_EQ(title.locations[1], (location{100000, 3000000, 2000000, 500000}));

	const cshape& body = added.shapes.at("Body A_3");
	EXPECT_EQ(body.type, content_type::content);
	EXPECT_EQ(body.locations.size(), 2U);
	ASSERT_TRUE(body.xml.has_value());
	EXPECT_NE(body.xml->find("xmlns:a="), std::string::npos);

	EXPECT_EQ(added.shapes.at("Badge_5").type, content_type::number);
	EXPECT_EQ(added.shapes.at("Spacer_6").type, content_type::none);

	const cshape& photo = added.shapes.at("Photo_7");
	EXPECT_EQ(photo.type, content_type::picture);
	EXPECT_FALSE(photo.xml.has_value());
	ASSERT_TRUE(photo.path.has_value());
	EXPECT_EQ(read_file(wxString::FromUTF8(*photo.path)), "PNGDATA");
	EXPECT_EQ(catalog.get_layout("two_points").find_style("extracted"), &added);
}

TEST_F(StyleExtractorTest, ExtractedStyleSurvivesJson) {
	style_extractor extractor(catalog, settings);
	(void)extractor.add_style_from_slide(make_source_slide(), "two_points", "extracted");
	layout_catalog copy;
	copy.from_json(catalog.to_json());
	EXPECT_EQ(copy, catalog);
}

TEST_F(StyleExtractorTest, RejectsUnknownLayoutAndDuplicateStyle) {
	style_extractor extractor(catalog, settings);
	const slide source = make_source_slide();
	try {
		(void)extractor.add_style_from_slide(source, "three_points", "x");
		FAIL() << "expected catalog_exception";
	} catch (const catalog_exception& e) {
		EXPECT_EQ(e.get_error_code(), catalog_error_code::not_found);
	}
	(void)extractor.add_style_from_slide(source, "two_points", "x");
	try {
		(void)extractor.add_style_from_slide(source, "two_points", "x");
		FAIL() << "expected catalog_exception";
	} catch (const catalog_exception& e) {
		EXPECT_EQ(e.get_error_code(), catalog_error_code::already_exists);
	}
}

TEST_F(StyleExtractorTest, ExtractedStyleDrivesContentPage) {
	style_extractor extractor(catalog, settings);
	(void)extractor.add_style_from_slide(make_source_slide(), "two_points", "extracted");
	const std::size_t before = deck->slide_count();
	synthesis_session session(11);
	page_builder pages(*deck, catalog, settings, session);
	pages.chapter_content_page(3, {"Chapter", {"First", "Second"}, {"first text", "second text"}}, before);
	ASSERT_EQ(deck->slide_count(), before + 1);
	const slide page = deck->get_slide(before);
	EXPECT_EQ(page.shapes().size(), 8U);
	std::string titles;
	for (const auto& current : page.shapes()) {
		if (current.name() == "Title A_1") {
			titles += current.text() + ";";
		}
		if (current.kind() == shape_kind::picture) {
			EXPECT_EQ(page.image_blob(current), "PNGDATA");
		}
	}
	EXPECT_EQ(titles, "First;Second;");
}
