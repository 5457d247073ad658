/* section.hpp - sections of a book's reading order and the providers that expose them.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <Poco/AutoPtr.h>
#include <Poco/DOM/Document.h>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

using document_ptr = Poco::AutoPtr<Poco::XML::Document>;
using document_factory = std::function<std::future<document_ptr>()>;

class section {
public:
	section(size_t section_index, document_factory section_factory, bool section_linear = true);
	section(size_t section_index, document_factory section_factory, bool section_linear, size_t character_count);
	~section() = default;
	section(const section&) = delete;
	section& operator=(const section&) = delete;
	section(section&&) = delete;
	section& operator=(section&&) = delete;

	[[nodiscard]] size_t get_index() const noexcept {
		return index;
	}

	[[nodiscard]] bool is_linear() const noexcept {
		return linear;
	}

	[[nodiscard]] bool has_document() const noexcept {
		return static_cast<bool>(factory);
	}

	// Every call produces a freshly parsed document; throws when the section has no document.
	[[nodiscard]] std::future<document_ptr> create_document() const;
	// Computed from the parsed document on first use, then cached for the section's lifetime.
	[[nodiscard]] size_t get_character_count() const;

private:
	size_t index;
	document_factory factory;
	bool linear;
	mutable std::once_flag count_flag;
	mutable size_t cached_count{0};

	[[nodiscard]] size_t count_characters() const;
};

class section_provider {
public:
	virtual ~section_provider() = default;
	[[nodiscard]] virtual size_t get_section_count() const = 0;
	// Returns nullptr when index is out of range.
	[[nodiscard]] virtual const section* get_section(size_t index) const = 0;
};

class section_list : public section_provider {
public:
	section_list() = default;
	~section_list() override = default;
	section_list(const section_list&) = delete;
	section_list& operator=(const section_list&) = delete;
	section_list(section_list&&) = default;
	section_list& operator=(section_list&&) = default;
	section& add_section(document_factory factory, bool linear = true);
	[[nodiscard]] size_t get_section_count() const override;
	[[nodiscard]] const section* get_section(size_t index) const override;

private:
	std::vector<std::unique_ptr<section>> sections;
};
