/* test_layout_catalog.cpp - tests for the layout catalog and its JSON form.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "exceptions.hpp"
#include "layout_catalog.hpp"
#include "test_template.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <random>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>

using nlohmann::json;

namespace {
const char* const sample_catalog = R"({
	"two_points": {
		"style_a": {
			"Title_1": {"xml": "<p:sp/>", "zorder": 2, "content_type": "title", "path": null,
				"location": [{"x": 1, "y": 2, "width": 3, "height": 4}, {"x": 5, "y": 6, "width": 7, "height": 8}]},
			"Photo_2": {"xml": null, "zorder": 1, "content_type": "picture", "path": "components/picture",
				"location": [{"x": 0, "y": 0, "width": 10, "height": 10}]},
			"Line_3": {"xml": "<p:cxnSp/>", "zorder": 0, "content_type": null, "path": null, "location": []}
		},
		"style_b": {}
	},
	"one_point": {}
})";

catalog_error_code error_code_of(const std::string& text) {
	layout_catalog catalog;
	try {
		catalog.from_json(text);
	} catch (const catalog_exception& e) {
		return e.get_error_code();
	}
	return catalog_error_code::generic;
}
} // namespace

TEST(LayoutCatalogTest, ParsesShapesAndTypes) {
	layout_catalog catalog;
	catalog.from_json(sample_catalog);
	EXPECT_EQ(catalog.layout_names(), (std::vector<std::string>{"one_point", "two_points"}));
	const layout_type& layout = catalog.get_layout("two_points");
	EXPECT_EQ(layout.style_names(), (std::vector<std::string>{"style_a", "style_b"}));
	const style* entry = layout.find_style("style_a");
	ASSERT_NE(entry, nullptr);
	const cshape& title = entry->shapes.at("Title_1");
	EXPECT_EQ(title.type, content_type::title);
	EXPECT_EQ(title.zorder, 2);
	ASSERT_EQ(title.locations.size(), 2U);
	EXPECT_EQ(title.locations[1], (location{5, 6, 7, 8}));
	const cshape& photo = entry->shapes.at("Photo_2");
	EXPECT_EQ(photo.type, content_type::picture);
	EXPECT_FALSE(photo.xml.has_value());
	EXPECT_EQ(photo.path, "components/picture");
	EXPECT_EQ(entry->shapes.at("Line_3").type, content_type::none);
}

TEST(LayoutCatalogTest, ShapesComeOutInPaintOrder) {
	layout_catalog catalog;
	catalog.from_json(sample_catalog);
	const auto ordered = catalog.get_layout("two_points").find_style("style_a")->by_zorder();
	ASSERT_EQ(ordered.size(), 3U);
	EXPECT_EQ(ordered[0].first, "Line_3");
	EXPECT_EQ(ordered[1].first, "Photo_2");
	EXPECT_EQ(ordered[2].first, "Title_1");
}

TEST(LayoutCatalogTest, JsonRoundTripPreservesCatalog) {
	layout_catalog original;
	original.from_json(sample_catalog);
	layout_catalog copy;
	copy.from_json(original.to_json());
	EXPECT_EQ(original, copy);
	EXPECT_EQ(original.to_json(), copy.to_json());
}

TEST(LayoutCatalogTest, NoneTypeIsWrittenAsNull) {
	layout_catalog catalog;
	catalog.from_json(sample_catalog);
	const json written = json::parse(catalog.to_json());
	EXPECT_TRUE(written["two_points"]["style_a"]["Line_3"]["content_type"].is_null());
	EXPECT_EQ(written["two_points"]["style_a"]["Title_1"]["content_type"], "title");
	EXPECT_TRUE(written["two_points"]["style_a"]["Photo_2"]["xml"].is_null());
}

TEST(LayoutCatalogTest, UnknownContentTypeFallsBackToNone) {
	wxLogNull no_log;
	layout_catalog catalog;
	catalog.from_json(R"({"one_point": {"s": {"x": {"xml": "<a/>", "zorder": 0, "content_type": "video", "path": null, "location": []}}}})");
	EXPECT_EQ(catalog.get_layout("one_point").find_style("s")->shapes.at("x").type, content_type::none);
}

TEST(LayoutCatalogTest, MalformedInputIsRejected) {
	EXPECT_EQ(error_code_of("{not json"), catalog_error_code::malformed);
	EXPECT_EQ(error_code_of("[1, 2]"), catalog_error_code::malformed);
	EXPECT_EQ(error_code_of(R"({"one_point": 3})"), catalog_error_code::malformed);
	EXPECT_EQ(error_code_of(R"({"one_point": {"s": {"x": 1}}})"), catalog_error_code::malformed);
	EXPECT_EQ(error_code_of(R"({"one_point": {"s": {"x": {"zorder": "high"}}}})"), catalog_error_code::malformed);
}

TEST(LayoutCatalogTest, FailedParseKeepsPreviousContents) {
	layout_catalog catalog;
	catalog.from_json(sample_catalog);
	EXPECT_THROW(catalog.from_json("{broken"), catalog_exception);
	EXPECT_NE(catalog.find_layout("two_points"), nullptr);
}

TEST(LayoutCatalogTest, LookupErrors) {
	layout_catalog catalog;
	catalog.from_json(sample_catalog);
	EXPECT_EQ(catalog.find_layout("nine_points"), nullptr);
	try {
		(void)catalog.get_layout("nine_points");
		FAIL() << "expected catalog_exception";
	} catch (const catalog_exception& e) {
		EXPECT_EQ(e.get_error_code(), catalog_error_code::not_found);
	}
	try {
		catalog.add_layout("one_point");
		FAIL() << "expected catalog_exception";
	} catch (const catalog_exception& e) {
		EXPECT_EQ(e.get_error_code(), catalog_error_code::already_exists);
	}
	EXPECT_EQ(catalog.find_layout("one_point")->find_style("missing"), nullptr);
}

TEST(LayoutCatalogTest, RandomStyleComesFromLayout) {
	layout_catalog catalog;
	catalog.from_json(sample_catalog);
	std::mt19937 rng(7);
	std::set<std::string> seen;
	for (int i = 0; i < 50; ++i) {
		const style* picked = catalog.get_random_style("two_points", rng);
		ASSERT_NE(picked, nullptr);
		seen.insert(picked->name);
	}
	EXPECT_EQ(seen, (std::set<std::string>{"style_a", "style_b"}));
	EXPECT_EQ(catalog.get_random_style("one_point", rng), nullptr);
	EXPECT_EQ(catalog.get_random_style("nine_points", rng), nullptr);
}

TEST(LayoutCatalogTest, SavesAndLoadsFiles) {
	const layout_catalog original = testing_support::make_catalog();
	const wxString path = wxFileName::CreateTempFileName("slidesmith");
	original.save(path);
	const layout_catalog loaded(path);
	EXPECT_EQ(original, loaded);
	layout_catalog reloaded;
	reloaded.reload(path);
	EXPECT_EQ(original, reloaded);
	wxRemoveFile(path);
}

TEST(LayoutCatalogTest, MissingFileIsNotFound) {
	wxLogNull no_log;
	try {
		layout_catalog catalog(wxString("/nonexistent/slidesmith/catalog.json"));
		FAIL() << "expected catalog_exception";
	} catch (const catalog_exception& e) {
		EXPECT_EQ(e.get_error_code(), catalog_error_code::not_found);
	}
}

TEST(LayoutCatalogTest, ContentTypeNames) {
	EXPECT_EQ(content_type_name(content_type::content), "content");
	EXPECT_TRUE(content_type_name(content_type::none).empty());
	EXPECT_EQ(parse_content_type("number"), content_type::number);
	EXPECT_FALSE(parse_content_type("").has_value());
}
