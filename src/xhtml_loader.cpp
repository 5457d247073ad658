/* xhtml_loader.cpp - parses section content into a Poco DOM.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "xhtml_loader.hpp"
#include "constants.hpp"
#include "parser_exception.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/DOM/DOMParser.h>
#include <Poco/DOM/Text.h>
#include <Poco/Exception.h>
#include <Poco/SAX/XMLReader.h>
#include <lexbor/dom/interfaces/attr.h>
#include <lexbor/dom/interfaces/element.h>
#include <lexbor/html/parser.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

document_ptr parse_section_document(const std::string& content, std::string_view media_type) {
	if (!is_html_content(media_type)) {
		try {
			return parse_xml_document(content);
		} catch (const Poco::Exception& e) {
			wxLogDebug("XML parsing failed (%s), retrying as HTML", wxString::FromUTF8(e.displayText()));
		}
	}
	html_document_builder builder;
	document_ptr doc = builder.build(content);
	if (doc.isNull()) {
		throw parser_exception(_("Couldn't parse section content"));
	}
	return doc;
}

html_document_builder::html_document_builder() : doc(lxb_html_document_create()) {
	if (!doc) {
		throw std::runtime_error("Failed to create Lexbor HTML document");
	}
}

document_ptr html_document_builder::build(const std::string& html_content) {
	const auto status = lxb_html_document_parse(doc.get(), reinterpret_cast<const lxb_char_t*>(html_content.data()), html_content.length());
	if (status != LXB_STATUS_OK) {
		return {};
	}
	document_ptr result(new Poco::XML::Document);
	if (auto* node = lxb_dom_interface_node(doc.get())) {
		copy_children(node, *result, result.get());
	}
	return result;
}

void html_document_builder::copy_children(lxb_dom_node_t* source, Poco::XML::Document& target_doc, Poco::XML::Node* target_parent) {
	for (auto* child = source->first_child; child != nullptr; child = child->next) {
		switch (child->type) {
			case LXB_DOM_NODE_TYPE_ELEMENT: {
				auto* element = lxb_dom_interface_element(child);
				Poco::AutoPtr<Poco::XML::Element> copy = target_doc.createElementNS(XHTML_NAMESPACE, get_tag_name(element));
				copy_attributes(element, copy.get());
				target_parent->appendChild(copy);
				copy_children(child, target_doc, copy.get());
				break;
			}
			case LXB_DOM_NODE_TYPE_TEXT:
			case LXB_DOM_NODE_TYPE_CDATA_SECTION: {
				size_t length = 0;
				const auto* text = lxb_dom_node_text_content(child, &length);
				if (text != nullptr && length > 0) {
					Poco::AutoPtr<Poco::XML::Text> copy = target_doc.createTextNode(std::string(reinterpret_cast<const char*>(text), length));
					target_parent->appendChild(copy);
				}
				break;
			}
			default:
				// Comments, doctypes and processing instructions carry no readable text.
				break;
		}
	}
}

void html_document_builder::copy_attributes(lxb_dom_element_t* source, Poco::XML::Element* target) {
	for (auto* attr = lxb_dom_element_first_attribute(source); attr != nullptr; attr = lxb_dom_element_next_attribute(attr)) {
		size_t name_length = 0;
		size_t value_length = 0;
		const auto* name = lxb_dom_attr_qualified_name(attr, &name_length);
		const auto* value = lxb_dom_attr_value(attr, &value_length);
		if (name == nullptr || name_length == 0) {
			continue;
		}
		std::string attr_value;
		if (value != nullptr) {
			attr_value.assign(reinterpret_cast<const char*>(value), value_length);
		}
		target->setAttribute(std::string(reinterpret_cast<const char*>(name), name_length), attr_value);
	}
}

std::string html_document_builder::get_tag_name(lxb_dom_element_t* element) {
	size_t length = 0;
	const auto* name = lxb_dom_element_qualified_name(element, &length);
	if (name == nullptr || length == 0) {
		return "span";
	}
	return {reinterpret_cast<const char*>(name), length};
}

document_ptr parse_xml_document(const std::string& content) {
	Poco::XML::DOMParser parser;
	parser.setFeature(Poco::XML::XMLReader::FEATURE_NAMESPACES, true);
	parser.setFeature(Poco::XML::XMLReader::FEATURE_EXTERNAL_GENERAL_ENTITIES, false);
	parser.setFeature(Poco::XML::XMLReader::FEATURE_EXTERNAL_PARAMETER_ENTITIES, false);
	parser.setFeature(Poco::XML::DOMParser::FEATURE_FILTER_WHITESPACE, false);
	document_ptr doc(parser.parseString(content));
	return doc;
}

bool is_html_content(std::string_view media_type) noexcept {
	return media_type == "text/html";
}
