/* section_progress.hpp - resolves location references to progress within a single section.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "navigation_resolver.hpp"
#include "section.hpp"
#include "section_offset_calculator.hpp"
#include <cstddef>
#include <optional>
#include <string>

struct local_progress {
	size_t index{0};
	double fraction{0.0};
};

struct section_measurement {
	size_t index{0};
	section_offsets offsets;
	bool collapsed{true};

	[[nodiscard]] double fraction() const noexcept;
	[[nodiscard]] double end_fraction() const noexcept;
};

// Resolves a location reference to a position inside one section. Never throws: every failure, including a fault
// raised by the resolver or the document loader, comes back as nullopt.
class section_progress {
public:
	section_progress(const section_provider& sections, const navigation_resolver& nav);
	~section_progress() = default;
	section_progress(const section_progress&) = delete;
	section_progress& operator=(const section_progress&) = delete;
	section_progress(section_progress&&) = delete;
	section_progress& operator=(section_progress&&) = delete;

	[[nodiscard]] std::optional<local_progress> get_progress(const std::string& location) const noexcept;
	[[nodiscard]] std::optional<section_measurement> measure(const std::string& location) const noexcept;

private:
	const section_provider& provider;
	const navigation_resolver& resolver;

	[[nodiscard]] std::optional<section_measurement> try_measure(const std::string& location) const;
};

[[nodiscard]] double local_fraction(size_t before, size_t total) noexcept;
