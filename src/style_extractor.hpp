/* style_extractor.hpp - turns an example slide into a new catalog style.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "layout_catalog.hpp"
#include "presentation.hpp"
#include "synthesis_session.hpp"
#include <string>
#include <utility>

class style_extractor {
public:
	style_extractor(layout_catalog& target, synthesis_settings options) : catalog{target}, settings{std::move(options)} {
	}

	// Adds the slide's non-placeholder shapes as a style of an existing layout. Picture
	// shapes have their image written under the picture directory.
	const style& add_style_from_slide(const slide& source, const std::string& layout_name, const std::string& style_name);

private:
	layout_catalog& catalog;
	synthesis_settings settings;
};
