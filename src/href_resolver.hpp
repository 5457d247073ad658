/* href_resolver.hpp - resolves manifest-relative hrefs to sections and anchors.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "epub_book.hpp"
#include "navigation_resolver.hpp"
#include <string>
#include <utility>

// Resolves "chapter.xhtml#fragment" references, relative to the package document, against an epub_book. Without a
// fragment the anchor is the start of the section; with one it is the element carrying that id. Throws
// parser_exception for an empty reference or one that names no spine item.
class href_resolver : public navigation_resolver {
public:
	explicit href_resolver(const epub_book& epub) : book{epub} {
	}

	[[nodiscard]] navigation_result resolve(const std::string& location) const override;

private:
	const epub_book& book;
};

// Splits "path#fragment" and percent-decodes both halves.
[[nodiscard]] std::pair<std::string, std::string> split_href(const std::string& href);
