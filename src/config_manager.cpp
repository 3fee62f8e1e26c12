/* config_manager.cpp - manages reading from and writing to our INI-based config file.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include <functional>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/string.h>

namespace {
constexpr int CONFIG_VERSION_CURRENT = 1;

inline long read_config_value(wxFileConfig* cfg, const wxString& key, long default_val) {
	return cfg->ReadLong(key, default_val);
}

inline int read_config_value(wxFileConfig* cfg, const wxString& key, int default_val) {
	return static_cast<int>(cfg->ReadLong(key, default_val));
}

inline double read_config_value(wxFileConfig* cfg, const wxString& key, double default_val) {
	double value = default_val;
	cfg->Read(key, &value, default_val);
	return value;
}

inline wxString read_config_value(wxFileConfig* cfg, const wxString& key, const wxString& default_val) {
	return cfg->Read(key, default_val);
}
} // namespace

config_manager::~config_manager() {
	if (config) {
		shutdown();
	}
}

bool config_manager::initialize(const wxString& path) {
	config_path = path.IsEmpty() ? get_default_config_path() : path;
	config = std::make_unique<wxFileConfig>(APP_NAME, "", config_path);
	if (!config) {
		return false;
	}
	if (wxConfigBase::Get(false) == nullptr) {
		wxConfigBase::Set(config.get());
		owns_global_config = true;
	}
	load_defaults();
	wxLogDebug("Using config %s", config_path);
	return true;
}

void config_manager::flush() {
	if (!config) {
		return;
	}
	config->Flush();
}

void config_manager::shutdown() {
	if (!config) {
		return;
	}
	config->Flush();
	if (owns_global_config) {
		wxConfigBase::Set(nullptr);
		owns_global_config = false;
	}
	config.reset();
}

template <typename T>
T config_manager::get_app_setting(const wxString& key, const T& default_value) const {
	T result = default_value;
	with_app_section([this, &key, &default_value, &result]() {
		result = read_config_value(config.get(), key, default_value);
	});
	return result;
}

template <typename T>
void config_manager::set_app_setting(const wxString& key, const T& value) {
	with_app_section([this, &key, &value]() {
		config->Write(key, value);
	});
}

synthesis_settings config_manager::to_synthesis_settings() const {
	synthesis_settings settings;
	settings.max_catalog_number_length = get(max_catalog_number_length);
	settings.max_catalog_number = get(max_catalog_number);
	settings.background_tolerance = get(background_tolerance);
	settings.area_slack = get(area_slack);
	settings.picture_dir = get(picture_dir);
	settings.cover_fallback_title = get(cover_fallback_title).utf8_string();
	settings.end_page_text = get(end_page_text).utf8_string();
	settings.random_seed = static_cast<unsigned int>(get(random_seed));
	return settings;
}

wxString config_manager::get_default_config_path() {
	const wxString appdata_dir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(appdata_dir)) {
		wxFileName::Mkdir(appdata_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL);
	}
	return appdata_dir + wxFileName::GetPathSeparator() + CONFIG_FILE_NAME;
}

void config_manager::load_defaults() {
	auto set_default_if_missing = [this](const auto& setting) {
		config->SetPath("/app");
		if (!config->HasEntry(setting.key)) {
			config->Write(setting.key, setting.default_value);
		}
		config->SetPath("/");
	};
	set_default_if_missing(catalog_path);
	set_default_if_missing(picture_dir);
	set_default_if_missing(area_slack);
	set_default_if_missing(background_tolerance);
	set_default_if_missing(max_catalog_number);
	set_default_if_missing(max_catalog_number_length);
	set_default_if_missing(random_seed);
	set_default_if_missing(cover_fallback_title);
	set_default_if_missing(end_page_text);
	if (get(config_version) != CONFIG_VERSION_CURRENT) {
		set(config_version, CONFIG_VERSION_CURRENT);
	}
}

void config_manager::with_app_section(const std::function<void()>& func) const {
	if (!config) {
		return;
	}
	config->SetPath("/app");
	func();
	config->SetPath("/");
}

template int config_manager::get_app_setting<int>(const wxString&, const int&) const;
template long config_manager::get_app_setting<long>(const wxString&, const long&) const;
template double config_manager::get_app_setting<double>(const wxString&, const double&) const;
template wxString config_manager::get_app_setting<wxString>(const wxString&, const wxString&) const;
template void config_manager::set_app_setting<int>(const wxString&, const int&);
template void config_manager::set_app_setting<long>(const wxString&, const long&);
template void config_manager::set_app_setting<double>(const wxString&, const double&);
template void config_manager::set_app_setting<wxString>(const wxString&, const wxString&);
