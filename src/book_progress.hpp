/* book_progress.hpp - book-wide progress: fraction, section, virtual page and reading time.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include "navigation_resolver.hpp"
#include "section.hpp"
#include "section_progress.hpp"
#include "spine_weight_index.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

struct progress_options {
	size_t characters_per_page{DEFAULT_CHARACTERS_PER_PAGE};
	size_t characters_per_minute{DEFAULT_CHARACTERS_PER_MINUTE};
};

struct section_position {
	size_t current{0};
	size_t total{0};
};

struct page_location {
	size_t current{0};
	size_t next{0};
	size_t total{1};
};

// Estimated minutes left.
struct reading_time {
	size_t section{0};
	size_t total{0};
};

struct book_progress {
	double fraction{0.0};
	section_position section;
	page_location location;
	reading_time time;
};

class book_progress_calculator {
public:
	book_progress_calculator(const section_provider& sections, const navigation_resolver& resolver, progress_options opts = {});
	~book_progress_calculator() = default;
	book_progress_calculator(const book_progress_calculator&) = delete;
	book_progress_calculator& operator=(const book_progress_calculator&) = delete;
	book_progress_calculator(book_progress_calculator&&) = delete;
	book_progress_calculator& operator=(book_progress_calculator&&) = delete;

	// Returns nullopt for unresolvable locations and for locations inside non-linear sections.
	[[nodiscard]] std::optional<book_progress> get_book_progress(const std::string& location) const noexcept;
	[[nodiscard]] std::optional<local_progress> get_progress(const std::string& location) const noexcept;
	// Built from every section's character count on first use.
	[[nodiscard]] const spine_weight_index& get_spine_index() const;

	[[nodiscard]] const progress_options& get_options() const noexcept {
		return options;
	}

private:
	const section_provider& provider;
	section_progress facade;
	progress_options options;
	mutable std::once_flag index_flag;
	mutable spine_weight_index spine_index;

	[[nodiscard]] std::optional<book_progress> compute(const section_measurement& measurement) const;
};

[[nodiscard]] size_t page_for_position(double position, size_t characters_per_page, size_t total_pages) noexcept;
[[nodiscard]] size_t minutes_for_characters(double characters, size_t characters_per_minute) noexcept;
