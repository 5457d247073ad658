/* spine_weight_index.cpp - character weights of the linear reading order.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "spine_weight_index.hpp"
#include <algorithm>
#include <cstddef>
#include <vector>

spine_weight_index::spine_weight_index(const section_provider& provider) {
	build(provider);
}

void spine_weight_index::build(const section_provider& provider) {
	entries.clear();
	total_characters = 0;
	const size_t count = provider.get_section_count();
	for (size_t i = 0; i < count; ++i) {
		const section* sec = provider.get_section(i);
		if (sec == nullptr || !sec->is_linear()) {
			continue;
		}
		const size_t characters = sec->get_character_count();
		entries.push_back({.section_index = i, .character_count = characters, .characters_before = total_characters});
		total_characters += characters;
	}
}

const spine_entry* spine_weight_index::find(size_t section_index) const noexcept {
	const auto it = std::ranges::lower_bound(entries, section_index, {}, &spine_entry::section_index);
	if (it == entries.end() || it->section_index != section_index) {
		return nullptr;
	}
	return &*it;
}

std::vector<double> spine_weight_index::get_section_fractions() const {
	std::vector<double> fractions;
	if (total_characters == 0) {
		return fractions;
	}
	fractions.reserve(entries.size() + 1);
	for (const auto& entry : entries) {
		fractions.push_back(static_cast<double>(entry.characters_before) / static_cast<double>(total_characters));
	}
	fractions.push_back(1.0);
	return fractions;
}
