/* epub_book_test.cpp - tests for epub_book.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub_book.hpp"
#include "epub_fixture.hpp"
#include "parser_exception.hpp"
#include <Poco/Path.h>
#include <gtest/gtest.h>
#include <memory>

TEST_F(EpubFixture, LoadsMetadataAndSpine) {
	const auto book = epub_book::load(write_sample_book());
	ASSERT_NE(book, nullptr);
	EXPECT_EQ(book->get_title(), "Test Book");
	EXPECT_EQ(book->get_author(), "A. Writer");
	EXPECT_EQ(book->get_opf_dir().toString(Poco::Path::PATH_UNIX), "OEBPS/");
	ASSERT_EQ(book->get_section_count(), 4u);
	EXPECT_TRUE(book->get_section(0)->is_linear());
	EXPECT_FALSE(book->get_section(1)->is_linear());
	EXPECT_TRUE(book->get_section(2)->is_linear());
	EXPECT_EQ(book->get_section(4), nullptr);
}

TEST_F(EpubFixture, MissingContentHasNoDocument) {
	const auto book = epub_book::load(write_sample_book());
	ASSERT_NE(book, nullptr);
	EXPECT_TRUE(book->get_section(2)->has_document());
	EXPECT_FALSE(book->get_section(3)->has_document());
	EXPECT_EQ(book->get_section(3)->get_character_count(), 0u);
}

TEST_F(EpubFixture, SectionDocumentsAreParsedOnRequest) {
	const auto book = epub_book::load(write_sample_book());
	ASSERT_NE(book, nullptr);
	const section* first = book->get_section(0);
	const document_ptr doc = first->create_document().get();
	ASSERT_FALSE(doc.isNull());
	EXPECT_NE(doc->getElementById("b", "id"), nullptr);
	const document_ptr again = first->create_document().get();
	EXPECT_NE(doc.get(), again.get());
	EXPECT_EQ(first->get_character_count(), 8u);
	EXPECT_EQ(book->get_section(2)->get_character_count(), 8u);
}

TEST_F(EpubFixture, SectionLookupByPath) {
	const auto book = epub_book::load(write_sample_book());
	ASSERT_NE(book, nullptr);
	EXPECT_EQ(book->get_section_href(0), "OEBPS/text/ch1.xhtml");
	EXPECT_EQ(book->get_section_href(9), "");
	EXPECT_EQ(book->find_section_index("OEBPS/text/ch1.xhtml").value_or(99), 0u);
	EXPECT_EQ(book->find_section_index("OEBPS/text/chapter 2.xhtml").value_or(99), 2u);
	EXPECT_EQ(book->find_section_index("OEBPS/text/chapter%202.xhtml").value_or(99), 2u);
	EXPECT_FALSE(book->find_section_index("OEBPS/text/none.xhtml").has_value());
}

TEST_F(EpubFixture, MissingFileIsNotABook) {
	EXPECT_EQ(epub_book::load("/nonexistent/path/book.epub"), nullptr);
}

TEST_F(EpubFixture, ArchiveWithoutContainerIsNotABook) {
	EXPECT_EQ(epub_book::load(write_archive({{"mimetype", "application/epub+zip"}})), nullptr);
}

TEST_F(EpubFixture, MissingPackageDocumentThrows) {
	const wxString path = write_archive({{"META-INF/container.xml", container_for("OEBPS/missing.opf")}});
	EXPECT_THROW(static_cast<void>(epub_book::load(path)), parser_exception);
}

TEST_F(EpubFixture, PackageWithoutSpineThrows) {
	const wxString path = write_archive({
		{"META-INF/container.xml", container_for("content.opf")},
		{"content.opf", "<package><metadata/><manifest><item id=\"a\" href=\"a.xhtml\" media-type=\"application/xhtml+xml\"/></manifest></package>"},
	});
	try {
		static_cast<void>(epub_book::load(path));
		FAIL() << "expected parser_exception";
	} catch (const parser_exception& e) {
		EXPECT_EQ(e.get_file_path(), path);
		EXPECT_EQ(e.get_severity(), error_severity::error);
	}
}
