/* utils.hpp - shared string, path and zip helpers.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <wx/string.h>
#include <wx/zipstrm.h>

[[nodiscard]] std::string trim_string(const std::string& str);
[[nodiscard]] std::string to_lower(std::string_view input);
[[nodiscard]] bool is_all_digits(std::string_view input) noexcept;
[[nodiscard]] std::string zero_pad(int number, int width = 2);
[[nodiscard]] std::string number_to_words(int number);
[[nodiscard]] bool is_image_path(std::string_view path);
[[nodiscard]] std::string url_decode(std::string_view encoded);
[[nodiscard]] std::string convert_to_utf8(const std::string& input);
[[nodiscard]] std::string read_zip_entry(wxZipInputStream& zip);
[[nodiscard]] std::optional<std::string> read_file(const wxString& path);
[[nodiscard]] bool write_file(const wxString& path, const std::string& data);
// Directory part of a package part name, without a trailing slash.
[[nodiscard]] std::string part_directory(std::string_view part_name);
// Resolves a relationship target against the directory of its source part.
[[nodiscard]] std::string resolve_part_path(std::string_view base_dir, std::string_view target);
// Target of to_part as seen from the directory of from_part.
[[nodiscard]] std::string relative_part_path(std::string_view from_part, std::string_view to_part);
