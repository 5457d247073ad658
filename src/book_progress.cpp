/* book_progress.cpp - book-wide progress: fraction, section, virtual page and reading time.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "book_progress.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <mutex>
#include <wx/log.h>
#include <wx/string.h>

book_progress_calculator::book_progress_calculator(const section_provider& sections, const navigation_resolver& resolver, progress_options opts) : provider{sections}, facade{sections, resolver}, options{opts} {
	options.characters_per_page = std::max<size_t>(options.characters_per_page, 1);
	options.characters_per_minute = std::max<size_t>(options.characters_per_minute, 1);
}

std::optional<book_progress> book_progress_calculator::get_book_progress(const std::string& location) const noexcept {
	const auto measurement = facade.measure(location);
	if (!measurement) {
		return std::nullopt;
	}
	try {
		return compute(*measurement);
	} catch (const std::exception& e) {
		wxLogError("Couldn't compute book progress for %s: %s", wxString::FromUTF8(location), wxString::FromUTF8(e.what()));
	} catch (...) {
		wxLogError("Couldn't compute book progress for %s: unknown error", wxString::FromUTF8(location));
	}
	return std::nullopt;
}

std::optional<local_progress> book_progress_calculator::get_progress(const std::string& location) const noexcept {
	return facade.get_progress(location);
}

const spine_weight_index& book_progress_calculator::get_spine_index() const {
	std::call_once(index_flag, [this]() {
		spine_index.build(provider);
	});
	return spine_index;
}

std::optional<book_progress> book_progress_calculator::compute(const section_measurement& measurement) const {
	const auto& index = get_spine_index();
	const spine_entry* entry = index.find(measurement.index);
	if (entry == nullptr) {
		wxLogDebug("Section %zu isn't part of the linear reading order", measurement.index);
		return std::nullopt;
	}
	const size_t total_characters = index.get_total_characters();
	const auto weight = static_cast<double>(entry->character_count);
	const auto section_start = static_cast<double>(entry->characters_before);
	// Scale first so that an anchor's own offset maps back to an exact character position.
	auto position_of = [&](size_t offset) {
		if (measurement.offsets.total == 0) {
			return section_start;
		}
		return section_start + static_cast<double>(offset) * weight / static_cast<double>(measurement.offsets.total);
	};
	book_progress progress;
	progress.section = {.current = measurement.index, .total = provider.get_section_count()};
	if (total_characters == 0) {
		return progress;
	}
	const double start = position_of(measurement.offsets.start);
	const auto book_total = static_cast<double>(total_characters);
	const size_t per_page = options.characters_per_page;
	progress.fraction = std::clamp(start / book_total, 0.0, 1.0);
	progress.location.total = std::max<size_t>(1, (total_characters + per_page - 1) / per_page);
	progress.location.current = page_for_position(start, per_page, progress.location.total);
	progress.location.next = progress.location.current;
	if (!measurement.collapsed) {
		const size_t end_page = page_for_position(position_of(measurement.offsets.end), per_page, progress.location.total);
		progress.location.next = std::max(progress.location.current, end_page);
	}
	progress.time.total = minutes_for_characters(book_total - start, options.characters_per_minute);
	progress.time.section = minutes_for_characters(weight - (start - section_start), options.characters_per_minute);
	return progress;
}

size_t page_for_position(double position, size_t characters_per_page, size_t total_pages) noexcept {
	if (position <= 0.0 || characters_per_page == 0 || total_pages == 0) {
		return 0;
	}
	const auto page = static_cast<size_t>(std::floor(position / static_cast<double>(characters_per_page)));
	return std::min(page, total_pages - 1);
}

size_t minutes_for_characters(double characters, size_t characters_per_minute) noexcept {
	if (characters <= 0.0 || characters_per_minute == 0) {
		return 0;
	}
	return static_cast<size_t>(std::ceil(characters / static_cast<double>(characters_per_minute)));
}
