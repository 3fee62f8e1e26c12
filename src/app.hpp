/* app.hpp - console application entry point header.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "config_manager.hpp"
#include "layout_catalog.hpp"
#include <wx/app.h>
#include <wx/cmdline.h>
#include <wx/string.h>

class app : public wxAppConsole {
public:
	app() = default;
	~app() = default;
	app(const app&) = delete;
	app& operator=(const app&) = delete;
	app(app&&) = delete;
	app& operator=(app&&) = delete;
	bool OnInit() override;
	int OnRun() override;
	int OnExit() override;

	[[nodiscard]] config_manager& get_config_manager() {
		return config_mgr;
	}

private:
	config_manager config_mgr;
	wxString catalog_override;
	long seed_override{-1};

	int run_command(const wxCmdLineParser& parser);
	int generate(const wxString& markdown_path, const wxString& template_path, const wxString& output_path);
	int add_style(const wxString& deck_path, const wxString& slide_number, const wxString& layout_name, const wxString& style_name);
	int list_styles();
	wxString catalog_path() const;
	synthesis_settings current_settings() const;
};

wxDECLARE_APP(app);
