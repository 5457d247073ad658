/* epub_book.hpp - exposes an EPUB package as an ordered list of sections.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "section.hpp"
#include <Poco/Path.h>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <wx/string.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

struct manifest_item {
	std::string path;
	std::string media_type;
};

struct spine_item {
	std::string idref;
	std::string path; // Empty when the idref names no manifest item.
	std::string media_type;
	bool linear{true};
};

// An EPUB package exposed as a sequence of sections, one per spine item. Section content is read from the archive
// up front; each document request parses it again on a worker thread.
class epub_book : public section_provider {
public:
	~epub_book() override = default;
	epub_book(const epub_book&) = delete;
	epub_book& operator=(const epub_book&) = delete;
	epub_book(epub_book&&) = delete;
	epub_book& operator=(epub_book&&) = delete;

	// Returns nullptr when the file can't be opened or isn't an OCF container; throws parser_exception for a package
	// document that is missing or malformed.
	[[nodiscard]] static std::unique_ptr<epub_book> load(const wxString& path);

	[[nodiscard]] size_t get_section_count() const override;
	[[nodiscard]] const section* get_section(size_t index) const override;

	[[nodiscard]] const std::string& get_title() const noexcept {
		return title;
	}

	[[nodiscard]] const std::string& get_author() const noexcept {
		return author;
	}

	[[nodiscard]] const Poco::Path& get_opf_dir() const noexcept {
		return opf_dir;
	}

	// Archive path of the section's content document, empty when out of range.
	[[nodiscard]] std::string get_section_href(size_t index) const;
	// Looks a section up by its archive path, tolerating percent-encoding differences.
	[[nodiscard]] std::optional<size_t> find_section_index(std::string_view archive_path) const;

private:
	using entry_map = std::map<std::string, std::unique_ptr<wxZipEntry>>;

	std::string title;
	std::string author;
	Poco::Path opf_dir;
	std::map<std::string, manifest_item> manifest_items;
	std::vector<spine_item> spine_items;
	section_list sections;

	epub_book() = default;
	void parse_opf(const std::string& content);
	void build_sections(wxFileInputStream& stream, const entry_map& entries);
	[[nodiscard]] static std::optional<std::string> read_entry(wxFileInputStream& stream, const entry_map& entries, const std::string& name);
	[[nodiscard]] static std::string find_opf_path(const std::string& container_content);
};
