/* anchor.hpp - anchor and text boundary types used to locate positions inside section documents.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Node.h>
#include <cstddef>
#include <functional>
#include <optional>
#include <variant>

// A boundary point inside a section document. When the container is a text node the offset counts characters into
// it; otherwise the boundary sits before the container's offset-th child.
struct text_boundary {
	Poco::XML::Node* container{nullptr};
	size_t offset{0};
};

struct text_range {
	text_boundary start;
	text_boundary end;

	[[nodiscard]] bool collapsed() const noexcept {
		return start.container == end.container && start.offset == end.offset;
	}
};

[[nodiscard]] inline text_range make_point(Poco::XML::Node* container, size_t offset) noexcept {
	return {{container, offset}, {container, offset}};
}

// What an anchor evaluates to once a document is at hand: a region or a single structural node.
using anchor_target = std::variant<text_range, Poco::XML::Node*>;

// Anchors that can only be located once the section document has been parsed.
using anchor_function = std::function<std::optional<anchor_target>(Poco::XML::Document&)>;

// Direct regions and nodes must belong to a document that outlives the progress call.
using anchor = std::variant<text_range, Poco::XML::Node*, anchor_function>;
