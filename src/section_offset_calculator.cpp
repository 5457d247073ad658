/* section_offset_calculator.cpp - character offsets of anchors within a section document.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "section_offset_calculator.hpp"
#include "utils.hpp"
#include <Poco/DOM/Element.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <type_traits>
#include <variant>

using Poco::XML::Node;

namespace {
bool contains(const Node* ancestor, const Node* node) noexcept {
	for (const Node* current = node; current != nullptr; current = current->parentNode()) {
		if (current == ancestor) {
			return true;
		}
	}
	return false;
}
} // namespace

section_offset_calculator::section_offset_calculator(const Poco::XML::Document& doc) : document{doc}, text_root{find_text_root(doc)} {
}

size_t section_offset_calculator::total_characters() const {
	return count_until(nullptr, false).value_or(0);
}

std::optional<section_offsets> section_offset_calculator::measure(const anchor_target& target) const {
	return std::visit([this](const auto& value) -> std::optional<section_offsets> {
		using T = std::decay_t<decltype(value)>;
		std::optional<size_t> start;
		std::optional<size_t> end;
		if constexpr (std::is_same_v<T, text_range>) {
			start = characters_before(value.start);
			end = value.collapsed() ? start : characters_before(value.end);
		} else {
			start = characters_before(value);
			end = start;
		}
		if (!start) {
			return std::nullopt;
		}
		section_offsets offsets;
		offsets.total = total_characters();
		offsets.start = std::min(*start, offsets.total);
		offsets.end = std::clamp(end.value_or(offsets.start), offsets.start, offsets.total);
		return offsets;
	},
		target);
}

std::optional<size_t> section_offset_calculator::characters_before(const text_boundary& boundary) const {
	const Node* container = boundary.container;
	if (container == nullptr) {
		return std::nullopt;
	}
	if (is_text_node(container)) {
		const auto before = count_until(container, false);
		if (!before) {
			return std::nullopt;
		}
		if (!contains(text_root, container)) {
			return before;
		}
		return *before + std::min(boundary.offset, text_node_length(container));
	}
	size_t child_index = 0;
	for (const Node* child = container->firstChild(); child != nullptr; child = child->nextSibling()) {
		if (child_index++ == boundary.offset) {
			return count_until(child, false);
		}
	}
	// Offset past the last child: the boundary follows everything inside the container.
	return count_until(container, true);
}

std::optional<size_t> section_offset_calculator::characters_before(const Node* node) const {
	if (node == nullptr) {
		return std::nullopt;
	}
	return count_until(node, false);
}

bool section_offset_calculator::walk(const Node* node, bool inside_root, walk_state& state) const {
	if (node == text_root) {
		inside_root = true;
	}
	if (node == state.target && !state.include_target) {
		state.found = true;
		return true;
	}
	if (inside_root && is_text_node(node)) {
		state.count += text_node_length(node);
	}
	for (const Node* child = node->firstChild(); child != nullptr; child = child->nextSibling()) {
		if (walk(child, inside_root, state)) {
			return true;
		}
	}
	if (node == state.target) {
		state.found = true;
		return true;
	}
	return false;
}

std::optional<size_t> section_offset_calculator::count_until(const Node* target, bool include_target) const {
	if (text_root == nullptr) {
		if (target != nullptr && !contains(&document, target)) {
			return std::nullopt;
		}
		return 0;
	}
	walk_state state;
	state.target = target;
	state.include_target = include_target;
	walk(&document, false, state);
	if (target != nullptr && !state.found) {
		return std::nullopt;
	}
	return state.count;
}

Node* find_text_root(const Poco::XML::Document& doc) {
	Node* root = doc.documentElement();
	if (root == nullptr) {
		return nullptr;
	}
	for (Node* child = root->firstChild(); child != nullptr; child = child->nextSibling()) {
		if (child->nodeType() != Node::ELEMENT_NODE) {
			continue;
		}
		std::string name = child->localName();
		std::ranges::transform(name, name.begin(), ::tolower);
		if (name == "body") {
			return child;
		}
	}
	return root;
}

bool is_text_node(const Node* node) noexcept {
	if (node == nullptr) {
		return false;
	}
	const auto type = node->nodeType();
	return type == Node::TEXT_NODE || type == Node::CDATA_SECTION_NODE;
}

size_t text_node_length(const Node* node) {
	if (!is_text_node(node)) {
		return 0;
	}
	return utf8_length(node->getNodeValue());
}

size_t count_section_characters(const Poco::XML::Document& doc) {
	const section_offset_calculator calculator(doc);
	return calculator.total_characters();
}
