/* app.cpp - console application entry point.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "constants.hpp"
#include "deck_generator.hpp"
#include "exceptions.hpp"
#include "markdown_parser.hpp"
#include "presentation.hpp"
#include "style_extractor.hpp"
#include <exception>
#include <wx/crt.h>
#include <wx/log.h>
#include <wx/translation.h>

wxIMPLEMENT_APP_CONSOLE(app);

namespace {
const wxCmdLineEntryDesc command_line_desc[] = {
	{wxCMD_LINE_SWITCH, "h", "help", "show this help", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
	{wxCMD_LINE_SWITCH, "v", "verbose", "log every synthesis decision", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_OPTION, "c", "config", "configuration file to use", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, nullptr, "catalog", "layout catalog file to use", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "s", "seed", "random seed, 0 for a fresh one", wxCMD_LINE_VAL_NUMBER, 0},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "generate | add-style | list-styles", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "arguments", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL | wxCMD_LINE_PARAM_MULTIPLE},
	wxCMD_LINE_DESC_END,
};

int usage_error(const wxCmdLineParser& parser, const wxString& message) {
	wxLogError("%s", message);
	parser.Usage();
	return 2;
}
} // namespace

bool app::OnInit() {
	SetAppName(APP_NAME);
	return true;
}

int app::OnRun() {
	wxCmdLineParser parser(command_line_desc, argc, argv);
	parser.SetLogo(APP_NAME + " " + APP_VERSION);
	switch (parser.Parse()) {
		case -1:
			return 0;
		case 0:
			break;
		default:
			return 2;
	}
	if (parser.Found("verbose")) {
		wxLog::SetVerbose(true);
		wxLog::SetLogLevel(wxLOG_Debug);
	}
	wxString config_path;
	parser.Found("config", &config_path);
	if (!config_mgr.initialize(config_path)) {
		wxLogError(_("Failed to initialize configuration"));
		return 1;
	}
	parser.Found("catalog", &catalog_override);
	if (!parser.Found("seed", &seed_override)) {
		seed_override = -1;
	} else if (seed_override < 0) {
		return usage_error(parser, _("The seed must not be negative"));
	}
	try {
		return run_command(parser);
	} catch (const parser_exception& e) {
		wxLogError("%s", e.get_display_message());
	} catch (const catalog_exception& e) {
		wxLogError(_("Catalog error: %s"), e.get_message());
	} catch (const slidesmith_exception& e) {
		wxLogError("%s", e.get_message());
	} catch (const std::exception& e) {
		wxLogError(_("Unexpected error: %s"), wxString::FromUTF8(e.what()));
	}
	return 1;
}

int app::OnExit() {
	config_mgr.shutdown();
	return wxAppConsole::OnExit();
}

int app::run_command(const wxCmdLineParser& parser) {
	const wxString command = parser.GetParam(0);
	const size_t arg_count = parser.GetParamCount() - 1;
	if (command == "generate") {
		if (arg_count != 3) {
			return usage_error(parser, _("generate needs <markdown> <template> <output>"));
		}
		return generate(parser.GetParam(1), parser.GetParam(2), parser.GetParam(3));
	}
	if (command == "add-style") {
		if (arg_count != 4) {
			return usage_error(parser, _("add-style needs <deck> <slide> <layout> <style>"));
		}
		return add_style(parser.GetParam(1), parser.GetParam(2), parser.GetParam(3), parser.GetParam(4));
	}
	if (command == "list-styles") {
		if (arg_count != 0) {
			return usage_error(parser, _("list-styles takes no arguments"));
		}
		return list_styles();
	}
	return usage_error(parser, wxString::Format(_("Unknown command: %s"), command));
}

int app::generate(const wxString& markdown_path, const wxString& template_path, const wxString& output_path) {
	const layout_catalog catalog{catalog_path()};
	const markdown_parser parser;
	const auto doc = parser.load(markdown_path);
	const auto deck = presentation::load(template_path);
	deck_generator generator{catalog, current_settings()};
	generator.generate(*deck, *doc);
	deck->save(output_path);
	return 0;
}

int app::add_style(const wxString& deck_path, const wxString& slide_number, const wxString& layout_name, const wxString& style_name) {
	long number = 0;
	if (!slide_number.ToLong(&number) || number < 1) {
		wxLogError(_("Invalid slide number: %s"), slide_number);
		return 2;
	}
	const wxString path = catalog_path();
	layout_catalog catalog{path};
	const auto deck = presentation::load(deck_path);
	if (static_cast<size_t>(number) > deck->slide_count()) {
		wxLogError(_("%s has only %d slides"), deck_path, static_cast<int>(deck->slide_count()));
		return 2;
	}
	style_extractor extractor{catalog, current_settings()};
	extractor.add_style_from_slide(deck->get_slide(static_cast<size_t>(number - 1)), layout_name.utf8_string(), style_name.utf8_string());
	catalog.save(path);
	return 0;
}

int app::list_styles() {
	const layout_catalog catalog{catalog_path()};
	for (const auto& name : catalog.layout_names()) {
		const layout_type& layout = catalog.get_layout(name);
		wxPrintf("%s\n", wxString::FromUTF8(name));
		for (const auto& style_name : layout.style_names()) {
			const style* found = layout.find_style(style_name);
			wxPrintf("\t%s (%d shapes)\n", wxString::FromUTF8(style_name), found != nullptr ? static_cast<int>(found->shapes.size()) : 0);
		}
	}
	return 0;
}

wxString app::catalog_path() const {
	if (!catalog_override.IsEmpty()) {
		return catalog_override;
	}
	return config_mgr.get(config_manager::catalog_path);
}

synthesis_settings app::current_settings() const {
	synthesis_settings settings = config_mgr.to_synthesis_settings();
	if (seed_override >= 0) {
		settings.random_seed = static_cast<unsigned int>(seed_override);
	}
	return settings;
}
