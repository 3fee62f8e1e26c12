/* test_presentation.cpp - tests for the in-memory PPTX package.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "constants.hpp"
#include "exceptions.hpp"
#include "presentation.hpp"
#include "shape_xml.hpp"
#include "test_template.hpp"
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <string>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>

using namespace testing_support;

namespace {
class PresentationTest : public ::testing::Test {
protected:
	std::unique_ptr<presentation> deck = make_template();
};

std::size_t paragraph_count(const shape& target) {
	return find_descendants(find_child(target.node(), "txBody"), "p").size();
}
} // namespace

TEST_F(PresentationTest, LoadsSlidesInOrder) {
	ASSERT_EQ(deck->slide_count(), 5U);
	EXPECT_EQ(deck->main_part(), "ppt/presentation.xml");
	EXPECT_EQ(deck->get_slide(0).part_name(), "ppt/slides/slide1.xml");
	EXPECT_EQ(deck->get_slide(4).part_name(), "ppt/slides/slide5.xml");
	EXPECT_EQ(deck->index_of(deck->get_slide(3)), 3U);
	EXPECT_EQ(deck->slides().size(), 5U);
	EXPECT_THROW((void)deck->get_slide(5), std::out_of_range);
	EXPECT_EQ(deck->get_slide(2).layout_part(), "ppt/slideLayouts/slideLayout1.xml");
}

TEST_F(PresentationTest, ShapesAndPlaceholders) {
	const slide catalog = deck->get_slide(1);
	const auto shapes = catalog.shapes();
	ASSERT_EQ(shapes.size(), 7U);
	EXPECT_EQ(catalog.placeholders().size(), 1U);
	const auto title = catalog.find_placeholder({"title", "ctrTitle"});
	ASSERT_TRUE(title.has_value());
	EXPECT_EQ(title->text(), "Contents");
	EXPECT_EQ(title->placeholder_type(), "title");
	EXPECT_FALSE(title->placeholder_idx().has_value());
	EXPECT_EQ(shapes[1].name(), "Number 1");
	EXPECT_EQ(shapes[1].id(), 10U);
	EXPECT_EQ(shapes[1].kind(), shape_kind::autoshape);
	EXPECT_FALSE(shapes[1].is_placeholder());
	EXPECT_TRUE(shapes[1].placeholder_type().empty());
	EXPECT_EQ(shapes[1].geometry(), (location{1000000, 1500000, 800000, 800000}));
	EXPECT_EQ(catalog.next_shape_id(), 23U);
	EXPECT_FALSE(deck->get_slide(0).find_placeholder({"body"}).has_value());
}

TEST_F(PresentationTest, PlaceholderGeometryIsInherited) {
	// ctrTitle matches the layout placeholder; title falls through to the master.
	EXPECT_EQ(deck->get_slide(0).find_placeholder({"ctrTitle"})->geometry(), (location{838200, 1709738, 10515600, 2852737}));
	EXPECT_EQ(deck->get_slide(1).find_placeholder({"title"})->geometry(), (location{838200, 365125, 10515600, 1325563}));
	EXPECT_EQ(deck->get_slide(3).find_placeholder({"title"})->geometry(), (location{500000, 300000, 10000000, 900000}));
}

TEST_F(PresentationTest, DuplicateDropsNotes) {
	const slide copy = deck->duplicate_slide(4);
	EXPECT_EQ(deck->slide_count(), 6U);
	EXPECT_EQ(copy.part_name(), "ppt/slides/slide6.xml");
	EXPECT_EQ(deck->index_of(copy), 5U);
	EXPECT_EQ(copy.find_placeholder({"title"})->text(), "The end");
	const relationship_set* rels = deck->find_relationships(copy.part_name());
	ASSERT_NE(rels, nullptr);
	EXPECT_EQ(rels->find_by_type(REL_TYPE_NOTES_SLIDE), nullptr);
	EXPECT_NE(rels->find_by_type(REL_TYPE_SLIDE_LAYOUT), nullptr);
	EXPECT_NE(deck->part_data("[Content_Types].xml").find("/ppt/slides/slide6.xml"), std::string::npos);
}

TEST_F(PresentationTest, DuplicateIsIndependent) {
	slide copy = deck->duplicate_slide(0);
	copy.find_placeholder({"ctrTitle"})->set_text("Changed");
	EXPECT_EQ(deck->get_slide(0).find_placeholder({"ctrTitle"})->text(), "Cover title");
	EXPECT_EQ(copy.find_placeholder({"ctrTitle"})->text(), "Changed");
}

TEST_F(PresentationTest, MoveSlideReorders) {
	deck->move_slide(4, 0);
	EXPECT_EQ(deck->get_slide(0).part_name(), "ppt/slides/slide5.xml");
	EXPECT_EQ(deck->get_slide(1).part_name(), "ppt/slides/slide1.xml");
	deck->move_slide(0, 4);
	EXPECT_EQ(deck->get_slide(4).part_name(), "ppt/slides/slide5.xml");
	deck->move_slide(1, 3);
	EXPECT_EQ(deck->get_slide(3).part_name(), "ppt/slides/slide2.xml");
	EXPECT_THROW(deck->move_slide(0, 5), std::out_of_range);
}

TEST_F(PresentationTest, RemoveSlideDropsPartsAndNotes) {
	deck->remove_slide(4);
	EXPECT_EQ(deck->slide_count(), 4U);
	EXPECT_FALSE(deck->has_part("ppt/slides/slide5.xml"));
	EXPECT_FALSE(deck->has_part("ppt/notesSlides/notesSlide1.xml"));
	const auto parts = deck->to_parts();
	EXPECT_FALSE(parts.contains("ppt/slides/_rels/slide5.xml.rels"));
	EXPECT_EQ(parts.at("[Content_Types].xml").find("slide5.xml"), std::string::npos);
	EXPECT_EQ(parts.at("ppt/_rels/presentation.xml.rels").find("slide5.xml"), std::string::npos);
	EXPECT_THROW(deck->remove_slide(4), std::out_of_range);
}

TEST_F(PresentationTest, NewSlideIdsStayUnique) {
	deck->remove_slide(0);
	const slide copy = deck->duplicate_slide(0);
	const std::string presentation_xml = deck->part_data(deck->main_part());
	EXPECT_NE(presentation_xml.find("id=\"261\""), std::string::npos);
	EXPECT_EQ(copy.part_name(), "ppt/slides/slide6.xml");
}

TEST_F(PresentationTest, AddSlideClonesLayoutPlaceholders) {
	const auto layouts = deck->layout_parts();
	ASSERT_EQ(layouts.size(), 1U);
	const slide added = deck->add_slide(layouts.front());
	EXPECT_EQ(deck->slide_count(), 6U);
	EXPECT_EQ(added.layout_part(), layouts.front());
	const auto placeholders = added.placeholders();
	ASSERT_EQ(placeholders.size(), 1U);
	EXPECT_EQ(placeholders.front().placeholder_type(), "ctrTitle");
	EXPECT_TRUE(placeholders.front().text().empty());
	EXPECT_EQ(placeholders.front().geometry(), (location{838200, 1709738, 10515600, 2852737}));
	EXPECT_THROW(deck->add_slide("ppt/slideLayouts/slideLayout9.xml"), template_exception);
}

TEST_F(PresentationTest, PictureRoundTrip) {
	slide cover = deck->get_slide(0);
	const std::string part = deck->add_media("PNGDATA", ".PNG");
	EXPECT_EQ(part, "ppt/media/image1.png");
	EXPECT_EQ(deck->add_media("JPGDATA", "jpg"), "ppt/media/image2.jpg");
	const shape pic = cover.add_picture(part, {1, 2, 3, 4}, cover.next_shape_id(), "Photo");
	EXPECT_EQ(pic.kind(), shape_kind::picture);
	EXPECT_EQ(pic.geometry(), (location{1, 2, 3, 4}));
	EXPECT_EQ(cover.image_blob(pic), "PNGDATA");
	const std::string types = deck->part_data("[Content_Types].xml");
	EXPECT_NE(types.find("Extension=\"png\""), std::string::npos);
	EXPECT_NE(types.find("image/jpeg"), std::string::npos);
}

TEST_F(PresentationTest, ImageBlobNeedsEmbeddedImage) {
	slide cover = deck->get_slide(0);
	const shape broken = cover.insert_shape_xml(standalone("<p:pic><p:nvPicPr><p:cNvPr id=\"9\" name=\"Broken\"/><p:cNvPicPr/><p:nvPr/></p:nvPicPr><p:blipFill><a:blip r:embed=\"rId99\"/></p:blipFill><p:spPr/></p:pic>"));
	EXPECT_THROW((void)cover.image_blob(broken), template_exception);
}

TEST_F(PresentationTest, InsertShapeXmlGoesBeforeExtensionList) {
	slide cover = deck->get_slide(0);
	cover.shape_tree().append_child("p:extLst");
	const shape added = cover.insert_shape_xml(standalone(text_box(7, "Added", "hello", {0, 0, 1, 1})), location{5, 6, 7, 8});
	EXPECT_EQ(local_name(added.node().next_sibling().name()), "extLst");
	EXPECT_EQ(added.geometry(), (location{5, 6, 7, 8}));
	EXPECT_FALSE(added.node().attribute("xmlns:a"));
	EXPECT_EQ(cover.shapes().size(), 2U);
	EXPECT_THROW(cover.insert_shape_xml("<p:sp><broken"), generation_exception);
}

TEST_F(PresentationTest, RemoveShape) {
	slide catalog = deck->get_slide(1);
	catalog.remove_shape(catalog.shapes()[1]);
	EXPECT_EQ(catalog.shapes().size(), 6U);
	EXPECT_EQ(catalog.shapes()[1].name(), "Label 1");
}

TEST_F(PresentationTest, SetTextOnPlaceholderMakesParagraphs) {
	shape title = *deck->get_slide(0).find_placeholder({"ctrTitle"});
	title.set_text("first\nsecond");
	EXPECT_EQ(title.text(), "first\nsecond");
	EXPECT_EQ(paragraph_count(title), 2U);
}

TEST_F(PresentationTest, SetTextOnTextBoxUsesLineBreaks) {
	shape label = deck->get_slide(1).shapes()[2];
	label.set_text("one\ntwo");
	EXPECT_EQ(label.text(), "one\ntwo");
	EXPECT_EQ(paragraph_count(label), 1U);
	EXPECT_STREQ(find_descendant(label.node(), "rPr").attribute("sz").as_string(), "2400");
}

TEST_F(PresentationTest, TextFrameProperties) {
	shape label = deck->get_slide(1).shapes()[2];
	label.set_word_wrap(false);
	label.set_vertical_anchor("t");
	label.set_alignment("just");
	const pugi::xml_node body_pr = find_descendant(label.node(), "bodyPr");
	EXPECT_STREQ(body_pr.attribute("wrap").as_string(), "none");
	EXPECT_STREQ(body_pr.attribute("anchor").as_string(), "t");
	EXPECT_STREQ(find_descendant(label.node(), "pPr").attribute("algn").as_string(), "just");
}

TEST_F(PresentationTest, ShapeXmlIsStandalone) {
	const shape label = deck->get_slide(1).shapes()[2];
	const std::string xml = label.xml();
	EXPECT_NE(xml.find("xmlns:a="), std::string::npos);
	EXPECT_NE(xml.find("xmlns:p="), std::string::npos);
	EXPECT_EQ(text_from_xml(xml), "Chapter");
}

TEST_F(PresentationTest, SetGeometryCreatesTransform) {
	shape title = *deck->get_slide(0).find_placeholder({"ctrTitle"});
	title.set_geometry({10, 20, 30, 40});
	EXPECT_EQ(title.geometry(), (location{10, 20, 30, 40}));
	title.set_identity(99, "Renamed");
	EXPECT_EQ(title.id(), 99U);
	EXPECT_EQ(title.name(), "Renamed");
}

TEST_F(PresentationTest, SaveAndLoadRoundTrip) {
	deck->get_slide(0).find_placeholder({"ctrTitle"})->set_text("Saved title");
	const wxString path = wxFileName::CreateTempFileName("slidesmith");
	deck->save(path);
	const auto loaded = presentation::load(path);
	wxRemoveFile(path);
	ASSERT_EQ(loaded->slide_count(), 5U);
	EXPECT_EQ(loaded->get_slide(0).find_placeholder({"ctrTitle"})->text(), "Saved title");
	EXPECT_EQ(loaded->get_slide(1).shapes().size(), 7U);
	EXPECT_TRUE(loaded->has_part("ppt/notesSlides/notesSlide1.xml"));
	EXPECT_EQ(loaded->to_parts().size(), deck->to_parts().size());
}

TEST(PresentationLoadTest, RejectsBrokenPackages) {
	wxLogNull no_log;
	EXPECT_THROW(presentation::load("/nonexistent/slidesmith/deck.pptx"), parser_exception);
	auto parts = template_parts();
	parts.erase("_rels/.rels");
	EXPECT_THROW(presentation::from_parts(parts), parser_exception);
	parts = template_parts();
	parts.erase("ppt/presentation.xml");
	EXPECT_THROW(presentation::from_parts(parts), parser_exception);
}

TEST(RelationshipSetTest, AddReusesAndRelativizes) {
	relationship_set rels("ppt/slides/slide1.xml");
	const std::string first = rels.add(REL_TYPE_IMAGE, "ppt/media/image1.png");
	EXPECT_EQ(first, "rId1");
	EXPECT_EQ(rels.find(first)->target, "../media/image1.png");
	EXPECT_EQ(rels.add(REL_TYPE_IMAGE, "ppt/media/image1.png"), first);
	EXPECT_EQ(rels.add(REL_TYPE_IMAGE, "ppt/media/image2.png"), "rId2");
	EXPECT_EQ(rels.target_part("rId2"), "ppt/media/image2.png");
	EXPECT_TRUE(rels.target_part("rId7").empty());
	rels.insert({"rId10", REL_TYPE_SLIDE_LAYOUT, "../slideLayouts/slideLayout1.xml", false});
	EXPECT_EQ(rels.next_id(), "rId11");
	EXPECT_THROW(rels.insert({"rId10", REL_TYPE_IMAGE, "x.png", false}), std::invalid_argument);
	rels.remove("rId1");
	EXPECT_EQ(rels.find("rId1"), nullptr);
}

TEST(RelationshipSetTest, ParsesExternalTargets) {
	const auto rels = relationship_set::parse("ppt/slides/slide1.xml",
		"<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
		"<Relationship Id=\"rId1\" Type=\"hyperlink\" Target=\"https://example.com\" TargetMode=\"External\"/></Relationships>");
	ASSERT_EQ(rels.items().size(), 1U);
	EXPECT_TRUE(rels.items().front().external);
	EXPECT_TRUE(rels.target_part("rId1").empty());
	const auto reparsed = relationship_set::parse("ppt/slides/slide1.xml", rels.to_xml());
	EXPECT_TRUE(reparsed.items().front().external);
}

TEST(RelationshipSetTest, RelsPartNames) {
	EXPECT_EQ(rels_part_name("ppt/slides/slide1.xml"), "ppt/slides/_rels/slide1.xml.rels");
	EXPECT_EQ(rels_part_name("ppt/presentation.xml"), "ppt/_rels/presentation.xml.rels");
	EXPECT_EQ(rels_part_name(""), "_rels/.rels");
}
