/* href_resolver.cpp - resolves manifest-relative hrefs to sections and anchors.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "href_resolver.hpp"
#include "parser_exception.hpp"
#include "section_offset_calculator.hpp"
#include "utils.hpp"
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Element.h>
#include <Poco/DOM/Node.h>
#include <optional>
#include <string>
#include <utility>
#include <wx/string.h>
#include <wx/translation.h>

navigation_result href_resolver::resolve(const std::string& location) const {
	const std::string href = trim_string(location);
	if (href.empty()) {
		throw parser_exception(_("Empty location"), error_severity::warning);
	}
	auto [file_path, fragment] = split_href(href);
	if (file_path.empty()) {
		throw parser_exception(wxString::Format(_("Location %s names no section"), wxString::FromUTF8(location)), error_severity::warning);
	}
	auto index = book.find_section_index(resolve_path(book.get_opf_dir(), file_path));
	if (!index) {
		index = book.find_section_index(file_path);
	}
	if (!index) {
		throw parser_exception(wxString::Format(_("No section matches %s"), wxString::FromUTF8(location)), error_severity::warning);
	}
	navigation_result result;
	result.index = index;
	if (fragment.empty()) {
		result.target = anchor_function([](Poco::XML::Document& doc) -> std::optional<anchor_target> {
			Poco::XML::Node* root = find_text_root(doc);
			if (root == nullptr) {
				return anchor_target{static_cast<Poco::XML::Node*>(&doc)};
			}
			return anchor_target{make_point(root, 0)};
		});
	} else {
		result.target = anchor_function([id = std::move(fragment)](Poco::XML::Document& doc) -> std::optional<anchor_target> {
			Poco::XML::Element* element = doc.getElementById(id, "id");
			if (element == nullptr) {
				return std::nullopt;
			}
			return anchor_target{static_cast<Poco::XML::Node*>(element)};
		});
	}
	return result;
}

std::pair<std::string, std::string> split_href(const std::string& href) {
	const size_t hash_pos = href.find('#');
	if (hash_pos == std::string::npos) {
		return {url_decode(href), {}};
	}
	return {url_decode(href.substr(0, hash_pos)), url_decode(href.substr(hash_pos + 1))};
}
