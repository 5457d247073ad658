/* section_offset_calculator.hpp - character offsets of anchors within a section document.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "anchor.hpp"
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Node.h>
#include <cstddef>
#include <optional>

struct section_offsets {
	size_t start{0}; // characters before the anchor's start boundary
	size_t end{0};   // characters before the anchor's end boundary; equals start for point anchors
	size_t total{0};
};

// Counts characters of the text and CDATA nodes under the document body (or the document element when there is no
// body), in document order. Markup contributes nothing itself.
class section_offset_calculator {
public:
	explicit section_offset_calculator(const Poco::XML::Document& doc);
	~section_offset_calculator() = default;
	section_offset_calculator(const section_offset_calculator&) = delete;
	section_offset_calculator& operator=(const section_offset_calculator&) = delete;
	section_offset_calculator(section_offset_calculator&&) = delete;
	section_offset_calculator& operator=(section_offset_calculator&&) = delete;

	[[nodiscard]] size_t total_characters() const;
	// Returns nullopt when the target does not belong to this document.
	[[nodiscard]] std::optional<section_offsets> measure(const anchor_target& target) const;
	[[nodiscard]] std::optional<size_t> characters_before(const text_boundary& boundary) const;
	[[nodiscard]] std::optional<size_t> characters_before(const Poco::XML::Node* node) const;

private:
	struct walk_state {
		const Poco::XML::Node* target{nullptr};
		bool include_target{false};
		size_t count{0};
		bool found{false};
	};

	const Poco::XML::Document& document;
	const Poco::XML::Node* text_root{nullptr};

	bool walk(const Poco::XML::Node* node, bool inside_root, walk_state& state) const;
	[[nodiscard]] std::optional<size_t> count_until(const Poco::XML::Node* target, bool include_target) const;
};

[[nodiscard]] Poco::XML::Node* find_text_root(const Poco::XML::Document& doc);
[[nodiscard]] bool is_text_node(const Poco::XML::Node* node) noexcept;
[[nodiscard]] size_t text_node_length(const Poco::XML::Node* node);
[[nodiscard]] size_t count_section_characters(const Poco::XML::Document& doc);
