/* exceptions.hpp - exception types raised by the document and deck pipeline.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <stdexcept>
#include <wx/string.h>

enum class error_severity {
	error,
	warning
};

class slidesmith_exception : public std::runtime_error {
public:
	explicit slidesmith_exception(const wxString& msg, error_severity sev = error_severity::error) : std::runtime_error(msg.utf8_string()), message{msg}, severity{sev} {
	}

	[[nodiscard]] error_severity get_severity() const noexcept {
		return severity;
	}

	[[nodiscard]] const wxString& get_message() const noexcept {
		return message;
	}

private:
	wxString message;
	error_severity severity;
};

// Input files that could not be read or decoded.
class parser_exception : public slidesmith_exception {
public:
	parser_exception(const wxString& msg, const wxString& fp, error_severity sev = error_severity::error) : slidesmith_exception(msg, sev), file_path{fp} {
	}

	[[nodiscard]] const wxString& get_file_path() const noexcept {
		return file_path;
	}

	[[nodiscard]] wxString get_display_message() const {
		if (file_path.IsEmpty()) {
			return get_message();
		}
		return wxString::Format("%s: %s", file_path, get_message());
	}

private:
	wxString file_path;
};

// The template deck does not have the structure the generator needs.
class template_exception : public slidesmith_exception {
public:
	using slidesmith_exception::slidesmith_exception;
};

// Content could not be mapped onto the chosen style.
class generation_exception : public slidesmith_exception {
public:
	using slidesmith_exception::slidesmith_exception;
};

// The Markdown document lacks the headings a deck is built from.
class document_exception : public slidesmith_exception {
public:
	using slidesmith_exception::slidesmith_exception;
};

enum class catalog_error_code {
	generic,
	not_found,
	already_exists,
	malformed
};

class catalog_exception : public slidesmith_exception {
public:
	catalog_exception(const wxString& msg, catalog_error_code code = catalog_error_code::generic) : slidesmith_exception(msg), error_code{code} {
	}

	[[nodiscard]] catalog_error_code get_error_code() const noexcept {
		return error_code;
	}

private:
	catalog_error_code error_code;
};
