/* element.hpp - arena-backed Markdown element tree with pre-order threading.
 *
 * Slidesmith.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using element_id = std::size_t;

inline constexpr element_id null_element = std::numeric_limits<element_id>::max();

enum class element_type {
	none = 0,
	document = 1 << 0,
	heading = 1 << 1,
	paragraph = 1 << 2,
	code_block = 1 << 3,
	table = 1 << 4,
	picture = 1 << 5,
};

inline constexpr element_type operator|(element_type a, element_type b) noexcept {
	return static_cast<element_type>(static_cast<int>(a) | static_cast<int>(b));
}

inline constexpr element_type operator&(element_type a, element_type b) noexcept {
	return static_cast<element_type>(static_cast<int>(a) & static_cast<int>(b));
}

inline constexpr element_type& operator|=(element_type& a, element_type b) noexcept {
	return a = a | b;
}

inline constexpr bool matches_type(element_type types, element_type t) noexcept {
	return types == element_type::none || (types & t) != element_type::none;
}

enum class table_kind {
	markdown,
	html
};

// Every node owns its child list; all other links are non-owning arena indices.
class element {
public:
	element() = default;
	virtual ~element() = default;
	element(const element&) = delete;
	element& operator=(const element&) = delete;
	element(element&&) = delete;
	element& operator=(element&&) = delete;

	[[nodiscard]] virtual element_type type() const noexcept = 0;
	[[nodiscard]] virtual std::string element_text() const = 0;

	[[nodiscard]] virtual std::string element_text_source() const {
		return element_text();
	}

	// The single string a leaf contributes to get_text.
	[[nodiscard]] virtual std::string own_string(bool strip) const;

	[[nodiscard]] bool is_container() const noexcept {
		return type() == element_type::document || type() == element_type::heading;
	}

	element_id parent{null_element};
	element_id previous_element{null_element};
	element_id next_element{null_element};
	element_id previous_sibling{null_element};
	element_id next_sibling{null_element};
	std::vector<element_id> contents;
	bool decomposed{false};

protected:
	friend class element_tree;

	virtual void reset_payload() {
	}
};

class document_root : public element {
public:
	[[nodiscard]] element_type type() const noexcept override {
		return element_type::document;
	}

	[[nodiscard]] std::string element_text() const override {
		return {};
	}
};

class heading : public element {
public:
	heading(int lvl, std::string txt) : level{lvl}, text{std::move(txt)} {
	}

	heading(int lvl, std::string txt, std::string src) : level{lvl}, text{std::move(txt)}, source{std::move(src)} {
	}

	[[nodiscard]] element_type type() const noexcept override {
		return element_type::heading;
	}

	[[nodiscard]] std::string element_text() const override {
		return text;
	}

	[[nodiscard]] std::string element_text_source() const override;

	int level{1};
	std::string text;
	std::optional<std::string> source;

protected:
	void reset_payload() override;
};

class paragraph : public element {
public:
	explicit paragraph(std::string txt) : text{std::move(txt)} {
	}

	[[nodiscard]] element_type type() const noexcept override {
		return element_type::paragraph;
	}

	[[nodiscard]] std::string element_text() const override {
		return text;
	}

	[[nodiscard]] std::string own_string(bool strip) const override;

	std::string text;

protected:
	void reset_payload() override {
		text.clear();
	}
};

class code_block : public element {
public:
	explicit code_block(std::string c, std::string lang = {}) : code{std::move(c)}, language{std::move(lang)} {
	}

	[[nodiscard]] element_type type() const noexcept override {
		return element_type::code_block;
	}

	[[nodiscard]] std::string element_text() const override {
		return code;
	}

	[[nodiscard]] std::string element_text_source() const override;
	[[nodiscard]] std::string own_string(bool strip) const override;

	std::string code;
	std::string language;

protected:
	void reset_payload() override;
};

class table : public element {
public:
	table(std::vector<std::string> hdrs, std::string txt, table_kind k = table_kind::markdown) : headers{std::move(hdrs)}, text{std::move(txt)}, kind{k} {
	}

	[[nodiscard]] element_type type() const noexcept override {
		return element_type::table;
	}

	[[nodiscard]] std::string element_text() const override {
		return text;
	}

	std::vector<std::string> headers;
	std::string text;
	table_kind kind{table_kind::markdown};
	std::size_t row_count{0};
	std::size_t column_count{0};

protected:
	void reset_payload() override;
};

class picture : public element {
public:
	picture(std::string s, std::optional<std::string> alt = std::nullopt, std::optional<std::string> ttl = std::nullopt) : src{std::move(s)}, alt_text{std::move(alt)}, title{std::move(ttl)} {
	}

	[[nodiscard]] element_type type() const noexcept override {
		return element_type::picture;
	}

	[[nodiscard]] std::string element_text() const override;

	std::string src;
	std::optional<std::string> alt_text;
	std::optional<std::string> title;

protected:
	void reset_payload() override;
};

class element_tree {
public:
	element_tree();
	~element_tree() = default;
	element_tree(const element_tree&) = delete;
	element_tree& operator=(const element_tree&) = delete;
	element_tree(element_tree&&) = default;
	element_tree& operator=(element_tree&&) = default;

	[[nodiscard]] static constexpr element_id root() noexcept {
		return 0;
	}

	template <typename T, typename... Args>
	element_id create(Args&&... args) {
		nodes.push_back(std::make_unique<T>(std::forward<Args>(args)...));
		return nodes.size() - 1;
	}

	[[nodiscard]] std::size_t arena_size() const noexcept {
		return nodes.size();
	}

	[[nodiscard]] bool is_valid(element_id id) const noexcept {
		return id < nodes.size();
	}

	[[nodiscard]] element& at(element_id id);
	[[nodiscard]] const element& at(element_id id) const;

	template <typename T>
	[[nodiscard]] T* get_if(element_id id) noexcept {
		return is_valid(id) ? dynamic_cast<T*>(nodes[id].get()) : nullptr;
	}

	template <typename T>
	[[nodiscard]] const T* get_if(element_id id) const noexcept {
		return is_valid(id) ? dynamic_cast<const T*>(nodes[id].get()) : nullptr;
	}

	void setup(element_id node, element_id parent = null_element, element_id previous_element = null_element, element_id next_element = null_element, element_id previous_sibling = null_element, element_id next_sibling = null_element);
	std::vector<element_id> insert(element_id parent, std::size_t position, element_id node);
	std::vector<element_id> insert(element_id parent, std::size_t position, std::initializer_list<element_id> new_nodes);
	std::vector<element_id> insert(element_id parent, std::size_t position, const std::vector<element_id>& new_nodes);
	std::vector<element_id> insert(element_id parent, std::size_t position, const char*) = delete;
	std::vector<element_id> insert(element_id parent, std::size_t position, std::string_view) = delete;
	// Moves every node of other into this arena and splices its root's children in at position.
	std::vector<element_id> insert_document(element_id parent, std::size_t position, element_tree&& other);
	element_id append(element_id parent, element_id node);
	element_id append(element_id parent, const char*) = delete;
	element_id append(element_id parent, std::string_view) = delete;
	element_id extract(element_id node);
	void decompose(element_id node);
	void clear(element_id node, bool decompose_children = false);

	[[nodiscard]] std::optional<std::size_t> index(element_id parent, element_id child) const noexcept;
	[[nodiscard]] bool is_decomposed(element_id node) const noexcept;
	[[nodiscard]] element_id last_descendant(element_id node, bool is_initialized = true, bool accept_self = true) const noexcept;
	[[nodiscard]] std::vector<element_id> children(element_id node) const;
	[[nodiscard]] std::vector<element_id> descendants(element_id node) const;
	[[nodiscard]] std::vector<element_id> next_siblings(element_id node) const;
	[[nodiscard]] std::vector<element_id> previous_siblings(element_id node) const;
	[[nodiscard]] std::vector<element_id> next_elements(element_id node) const;
	[[nodiscard]] std::vector<element_id> previous_elements(element_id node) const;
	[[nodiscard]] std::vector<element_id> parents(element_id node) const;

	[[nodiscard]] std::vector<std::string> all_strings(element_id node, bool strip = false, element_type types = element_type::none) const;
	[[nodiscard]] std::string get_text(element_id node, std::string_view separator = "\n", bool strip = false, element_type types = element_type::none) const;

private:
	std::vector<std::unique_ptr<element>> nodes;

	element_id insert_one(element_id parent, std::size_t position, element_id node);
	void check_insertable(element_id parent, element_id node) const;
	[[nodiscard]] element* ptr(element_id id) noexcept {
		return id < nodes.size() ? nodes[id].get() : nullptr;
	}
};
