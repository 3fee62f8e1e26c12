/* utils.cpp - shared string, path and zip helpers.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/strconv.h>
#include <wx/string.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;

constexpr std::array<std::string_view, 20> small_numbers{"zero", "one", "two", "three", "four", "five", "six", "seven", "eight", "nine", "ten", "eleven", "twelve", "thirteen", "fourteen", "fifteen", "sixteen", "seventeen", "eighteen", "nineteen"};
constexpr std::array<std::string_view, 10> tens_words{"", "", "twenty", "thirty", "forty", "fifty", "sixty", "seventy", "eighty", "ninety"};

constexpr std::array<std::string_view, 9> image_extensions{"bmp", "jpg", "jpeg", "pgm", "png", "ppm", "tif", "tiff", "webp"};

std::string words_below_thousand(int number) {
	std::string result;
	if (number >= 100) {
		result = std::string(small_numbers[static_cast<std::size_t>(number / 100)]) + " hundred";
		number %= 100;
		if (number == 0) {
			return result;
		}
		result += " and ";
	}
	if (number < 20) {
		return result + std::string(small_numbers[static_cast<std::size_t>(number)]);
	}
	result += tens_words[static_cast<std::size_t>(number / 10)];
	if (number % 10 != 0) {
		result += "-" + std::string(small_numbers[static_cast<std::size_t>(number % 10)]);
	}
	return result;
}

std::vector<std::string> split_path(std::string_view path) {
	std::vector<std::string> segments;
	std::string current;
	for (const char ch : path) {
		if (ch == '/') {
			segments.push_back(std::move(current));
			current.clear();
		} else {
			current.push_back(ch);
		}
	}
	segments.push_back(std::move(current));
	return segments;
}
} // namespace

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	auto is_nbsp = [&](std::string::const_iterator it) -> bool {
		return it != str.end() && std::next(it) != str.end() && static_cast<unsigned char>(*it) == UTF8_NBSP_FIRST && static_cast<unsigned char>(*std::next(it)) == UTF8_NBSP_SECOND;
	};
	while (start != end && ((std::isspace(static_cast<unsigned char>(*start)) != 0) || is_nbsp(start))) {
		if (is_nbsp(start)) {
			start += 2;
		} else {
			++start;
		}
	}
	while (start != end) {
		auto prev = std::prev(end);
		if (std::isspace(static_cast<unsigned char>(*prev)) != 0) {
			end = prev;
		} else if (prev != start && std::prev(prev) != start && is_nbsp(std::prev(prev))) {
			end = std::prev(prev);
		} else {
			break;
		}
	}
	return {start, end};
}

std::string to_lower(std::string_view input) {
	std::string result(input);
	std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
		return static_cast<char>(std::tolower(ch));
	});
	return result;
}

bool is_all_digits(std::string_view input) noexcept {
	return !input.empty() && std::all_of(input.begin(), input.end(), [](unsigned char ch) {
		return std::isdigit(ch) != 0;
	});
}

std::string zero_pad(int number, int width) {
	std::string digits = std::to_string(number);
	if (static_cast<int>(digits.size()) < width) {
		digits.insert(0, static_cast<std::size_t>(width) - digits.size(), '0');
	}
	return digits;
}

std::string number_to_words(int number) {
	if (number < 0) {
		return "minus " + number_to_words(-number);
	}
	if (number < 1000) {
		return words_below_thousand(number);
	}
	static constexpr std::array<std::pair<int, std::string_view>, 3> scales{{{1000000000, "billion"}, {1000000, "million"}, {1000, "thousand"}}};
	std::string result;
	for (const auto& [value, name] : scales) {
		if (number >= value) {
			if (!result.empty()) {
				result += ", ";
			}
			result += words_below_thousand(number / value) + " " + std::string(name);
			number %= value;
		}
	}
	if (number > 0) {
		result += number < 100 ? " and " : ", ";
		result += words_below_thousand(number);
	}
	return result;
}

bool is_image_path(std::string_view path) {
	const auto dot = path.rfind('.');
	if (dot == std::string_view::npos) {
		return false;
	}
	const std::string ext = to_lower(path.substr(dot + 1));
	return std::find(image_extensions.begin(), image_extensions.end(), ext) != image_extensions.end();
}

// Percent escapes only; relationship targets keep a literal '+'.
std::string url_decode(std::string_view encoded) {
	auto hex = [](char c) -> int {
		if (c >= '0' && c <= '9') {
			return c - '0';
		}
		if (c >= 'a' && c <= 'f') {
			return c - 'a' + 10;
		}
		if (c >= 'A' && c <= 'F') {
			return c - 'A' + 10;
		}
		return -1;
	};
	std::string out;
	out.reserve(encoded.size());
	for (size_t i = 0; i < encoded.size(); ++i) {
		const char c = encoded[i];
		if (c == '%' && i + 2 < encoded.size()) {
			const int hi = hex(encoded[i + 1]);
			const int lo = hex(encoded[i + 2]);
			if (hi >= 0 && lo >= 0) {
				out.push_back(static_cast<char>((hi << 4) | lo));
				i += 2;
				continue;
			}
		}
		out.push_back(c);
	}
	return out;
}

std::string convert_to_utf8(const std::string& input) {
	if (input.empty()) {
		return input;
	}
	const auto* data = reinterpret_cast<const unsigned char*>(input.data());
	const size_t len = input.length();
	auto try_convert = [&](size_t bom_size, wxMBConv& conv) -> std::optional<std::string> {
		const wxString content(input.data() + bom_size, conv, len - bom_size);
		if (!content.empty()) {
			return std::string(content.ToUTF8());
		}
		return std::nullopt;
	};
	if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
		return input.substr(3);
	}
	if (len >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
		wxMBConvUTF16LE conv;
		if (auto result = try_convert(2, conv)) {
			return *result;
		}
	}
	if (len >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
		wxMBConvUTF16BE conv;
		if (auto result = try_convert(2, conv)) {
			return *result;
		}
	}
	// Anything that is not valid UTF-8 is assumed to be Latin-1.
	if (!wxString::FromUTF8(input.data(), len).empty()) {
		return input;
	}
	const wxString latin1(input.data(), wxConvISO8859_1, len);
	return std::string(latin1.ToUTF8());
}

std::string read_zip_entry(wxZipInputStream& zip) {
	constexpr int buffer_size = 4096;
	std::ostringstream buffer;
	char buf[buffer_size];
	while (zip.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(zip.LastRead()));
	}
	return buffer.str();
}

std::optional<std::string> read_file(const wxString& path) {
	wxFileInputStream file_stream(path);
	if (!file_stream.IsOk()) {
		return std::nullopt;
	}
	const size_t file_size = file_stream.GetSize();
	std::string buffer(file_size, '\0');
	if (file_size > 0) {
		file_stream.Read(buffer.data(), file_size);
		if (file_stream.LastRead() != file_size) {
			return std::nullopt;
		}
	}
	return buffer;
}

bool write_file(const wxString& path, const std::string& data) {
	wxFileOutputStream out(path);
	if (!out.IsOk()) {
		return false;
	}
	out.Write(data.data(), data.size());
	return out.LastWrite() == data.size() && out.Close();
}

std::string part_directory(std::string_view part_name) {
	const auto slash = part_name.rfind('/');
	return slash == std::string_view::npos ? std::string{} : std::string(part_name.substr(0, slash));
}

std::string resolve_part_path(std::string_view base_dir, std::string_view target) {
	const std::string decoded = url_decode(target);
	std::string combined;
	if (!decoded.empty() && decoded.front() == '/') {
		combined = decoded.substr(1);
	} else if (base_dir.empty()) {
		combined = decoded;
	} else {
		combined = std::string(base_dir) + "/" + decoded;
	}
	std::vector<std::string> resolved;
	for (auto& segment : split_path(combined)) {
		if (segment.empty() || segment == ".") {
			continue;
		}
		if (segment == "..") {
			if (!resolved.empty()) {
				resolved.pop_back();
			}
			continue;
		}
		resolved.push_back(std::move(segment));
	}
	std::string result;
	for (const auto& segment : resolved) {
		if (!result.empty()) {
			result += '/';
		}
		result += segment;
	}
	return result;
}

std::string relative_part_path(std::string_view from_part, std::string_view to_part) {
	const std::string from_dir_name = part_directory(from_part);
	const auto to = split_path(to_part);
	std::vector<std::string> from_dir;
	if (!from_dir_name.empty()) {
		from_dir = split_path(from_dir_name);
	}
	std::size_t common = 0;
	while (common < from_dir.size() && common + 1 < to.size() && from_dir[common] == to[common]) {
		++common;
	}
	std::string result;
	for (std::size_t i = common; i < from_dir.size(); ++i) {
		result += "../";
	}
	for (std::size_t i = common; i < to.size(); ++i) {
		result += to[i];
		if (i + 1 < to.size()) {
			result += '/';
		}
	}
	return result;
}
