/* xhtml_loader.hpp - parses section content into a Poco DOM.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "section.hpp"
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Element.h>
#include <Poco/DOM/Node.h>
#include <lexbor/html/html.h>
#include <memory>
#include <string>
#include <string_view>

// Parses section content into a Poco DOM. XHTML goes through Poco's XML parser; text/html, or XML that fails to
// parse, goes through lexbor and is copied into an equivalent Poco document. Throws parser_exception when neither
// parser accepts the content.
[[nodiscard]] document_ptr parse_section_document(const std::string& content, std::string_view media_type = "application/xhtml+xml");

class html_document_builder {
public:
	html_document_builder();
	~html_document_builder() = default;
	html_document_builder(const html_document_builder&) = delete;
	html_document_builder& operator=(const html_document_builder&) = delete;
	html_document_builder(html_document_builder&&) = default;
	html_document_builder& operator=(html_document_builder&&) = default;
	// Returns a null pointer when lexbor rejects the content.
	[[nodiscard]] document_ptr build(const std::string& html_content);

private:
	struct DocumentDeleter {
		void operator()(lxb_html_document_t* doc) const noexcept {
			if (doc) {
				lxb_html_document_destroy(doc);
			}
		}
	};
	using DocumentPtr = std::unique_ptr<lxb_html_document_t, DocumentDeleter>;

	DocumentPtr doc;

	void copy_children(lxb_dom_node_t* source, Poco::XML::Document& target_doc, Poco::XML::Node* target_parent);
	static void copy_attributes(lxb_dom_element_t* source, Poco::XML::Element* target);
	[[nodiscard]] static std::string get_tag_name(lxb_dom_element_t* element);
};

[[nodiscard]] document_ptr parse_xml_document(const std::string& content);
[[nodiscard]] bool is_html_content(std::string_view media_type) noexcept;
