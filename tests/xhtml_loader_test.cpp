/* xhtml_loader_test.cpp - tests for xhtml_loader.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "parser_exception.hpp"
#include "section_offset_calculator.hpp"
#include "test_helpers.hpp"
#include "xhtml_loader.hpp"
#include <Poco/DOM/Element.h>
#include <gtest/gtest.h>
#include <string>

TEST(XhtmlLoaderTest, ParsesXhtml) {
	auto doc = parse_section_document(wrap_body("<p id=\"x\">Hello</p>"));
	ASSERT_FALSE(doc.isNull());
	ASSERT_NE(doc->documentElement(), nullptr);
	EXPECT_EQ(doc->documentElement()->localName(), "html");
	Poco::XML::Element* paragraph = find_by_id(*doc, "x");
	ASSERT_NE(paragraph, nullptr);
	EXPECT_EQ(paragraph->innerText(), "Hello");
}

TEST(XhtmlLoaderTest, KeepsWhitespaceText) {
	auto doc = make_document("<p>a</p>\n<p>b</p>");
	EXPECT_EQ(count_section_characters(*doc), 3u);
}

TEST(XhtmlLoaderTest, ParsesHtmlMediaType) {
	auto doc = parse_section_document("<!DOCTYPE html><html><head><title>Title</title></head><body><p id=\"x\">Hi<br>there<!-- note --></p></body></html>", "text/html");
	ASSERT_FALSE(doc.isNull());
	EXPECT_EQ(count_section_characters(*doc), 7u);
	Poco::XML::Element* paragraph = find_by_id(*doc, "x");
	ASSERT_NE(paragraph, nullptr);
	EXPECT_EQ(paragraph->localName(), "p");
}

TEST(XhtmlLoaderTest, MalformedXmlFallsBackToHtml) {
	const std::string content = "<html xmlns=\"http://www.w3.org/1999/xhtml\"><body><p id=\"x\">a&nbsp;b<p>unclosed</body></html>";
	document_ptr doc;
	ASSERT_NO_THROW(doc = parse_section_document(content));
	ASSERT_FALSE(doc.isNull());
	EXPECT_EQ(count_section_characters(*doc), 11u);
	EXPECT_NE(find_by_id(*doc, "x"), nullptr);
}

TEST(XhtmlLoaderTest, HtmlWithoutMarkupGetsBody) {
	auto doc = parse_section_document("just text", "text/html");
	ASSERT_FALSE(doc.isNull());
	EXPECT_EQ(count_section_characters(*doc), 9u);
}

TEST(XhtmlLoaderTest, StrictXmlParserRejectsMalformedContent) {
	EXPECT_ANY_THROW(static_cast<void>(parse_xml_document("<p>unclosed")));
}

TEST(XhtmlLoaderTest, ParsingIsDeterministic) {
	const std::string content = wrap_body("<h1>Title</h1><p>One <em>two</em> three.</p>");
	auto first = parse_section_document(content);
	auto second = parse_section_document(content);
	EXPECT_EQ(count_section_characters(*first), count_section_characters(*second));
	EXPECT_EQ(count_section_characters(*first), 19u);
}

TEST(XhtmlLoaderTest, HtmlMediaTypeCheck) {
	EXPECT_TRUE(is_html_content("text/html"));
	EXPECT_FALSE(is_html_content("application/xhtml+xml"));
	EXPECT_FALSE(is_html_content(""));
}
