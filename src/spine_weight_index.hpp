/* spine_weight_index.hpp - character weights of the linear reading order.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "section.hpp"
#include <cstddef>
#include <vector>

struct spine_entry {
	size_t section_index{0};
	size_t character_count{0};
	size_t characters_before{0};
};

// Character weights of the linear sections in reading order, with running prefix sums.
class spine_weight_index {
public:
	spine_weight_index() = default;
	explicit spine_weight_index(const section_provider& provider);
	~spine_weight_index() = default;
	spine_weight_index(const spine_weight_index&) = default;
	spine_weight_index& operator=(const spine_weight_index&) = default;
	spine_weight_index(spine_weight_index&&) = default;
	spine_weight_index& operator=(spine_weight_index&&) = default;
	void build(const section_provider& provider);
	// Returns nullptr for non-linear or unknown sections.
	[[nodiscard]] const spine_entry* find(size_t section_index) const noexcept;
	[[nodiscard]] std::vector<double> get_section_fractions() const;

	[[nodiscard]] const std::vector<spine_entry>& get_entries() const noexcept {
		return entries;
	}

	[[nodiscard]] size_t get_total_characters() const noexcept {
		return total_characters;
	}

private:
	std::vector<spine_entry> entries;
	size_t total_characters{0};
};
