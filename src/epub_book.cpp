/* epub_book.cpp - exposes an EPUB package as an ordered list of sections.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub_book.hpp"
#include "parser_exception.hpp"
#include "utils.hpp"
#include "xhtml_loader.hpp"
#include <Poco/Path.h>
#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

std::unique_ptr<epub_book> epub_book::load(const wxString& path) {
	auto fp = std::make_unique<wxFileInputStream>(path);
	if (!fp->IsOk()) {
		return nullptr;
	}
	entry_map entries;
	{
		wxZipInputStream zip_index(*fp);
		while (wxZipEntry* entry = zip_index.GetNextEntry()) {
			const std::string name = entry->GetName(wxPATH_UNIX).ToStdString(wxConvUTF8);
			entries[name] = std::unique_ptr<wxZipEntry>(entry);
		}
	}
	const auto container_content = read_entry(*fp, entries, "META-INF/container.xml");
	if (!container_content) {
		return nullptr;
	}
	const std::string opf_filename = find_opf_path(*container_content);
	if (opf_filename.empty()) {
		return nullptr;
	}
	const auto opf_content = read_entry(*fp, entries, opf_filename);
	if (!opf_content) {
		throw parser_exception(_("No OPF file found"), path);
	}
	std::unique_ptr<epub_book> book(new epub_book());
	book->opf_dir = Poco::Path(opf_filename, Poco::Path::PATH_UNIX).makeParent();
	try {
		book->parse_opf(*opf_content);
	} catch (const parser_exception& e) {
		throw parser_exception(e.get_message(), path, e.get_severity());
	}
	book->build_sections(*fp, entries);
	return book;
}

size_t epub_book::get_section_count() const {
	return sections.get_section_count();
}

const section* epub_book::get_section(size_t index) const {
	return sections.get_section(index);
}

std::string epub_book::get_section_href(size_t index) const {
	if (index >= spine_items.size()) {
		return {};
	}
	return spine_items[index].path;
}

std::optional<size_t> epub_book::find_section_index(std::string_view archive_path) const {
	const std::string wanted = url_decode(archive_path);
	for (size_t i = 0; i < spine_items.size(); ++i) {
		const auto& item = spine_items[i];
		if (!item.path.empty() && (item.path == archive_path || url_decode(item.path) == wanted)) {
			return i;
		}
	}
	return std::nullopt;
}

std::string epub_book::find_opf_path(const std::string& container_content) {
	pugi::xml_document doc;
	if (!doc.load_buffer(container_content.data(), container_content.size())) {
		return {};
	}
	for (auto rootfile : doc.child("container").child("rootfiles").children("rootfile")) {
		std::string full_path = rootfile.attribute("full-path").as_string();
		if (!full_path.empty()) {
			return full_path;
		}
	}
	// Some packages prefix the container vocabulary.
	auto rootfile = doc.find_node([](pugi::xml_node n) {
		const std::string_view name = n.name();
		return name == "rootfile" || (name.size() > 9 && name.substr(name.size() - 9) == ":rootfile");
	});
	return rootfile.attribute("full-path").as_string();
}

void epub_book::parse_opf(const std::string& content) {
	pugi::xml_document doc;
	if (!doc.load_buffer(content.data(), content.size())) {
		throw parser_exception(_("Invalid OPF"));
	}
	auto package = doc.child("package");
	if (package == nullptr) {
		package = doc.first_child();
	}
	if (auto metadata = package.child("metadata")) {
		for (auto child : metadata.children()) {
			std::string name = child.name();
			const auto pos = name.find(':');
			if (pos != std::string::npos) {
				name = name.substr(pos + 1);
			}
			if (name == "title" && title.empty()) {
				title = trim_string(child.text().as_string());
			} else if (name == "creator" && author.empty()) {
				author = trim_string(child.text().as_string());
			}
		}
	}
	auto manifest = package.child("manifest");
	if (manifest == nullptr) {
		throw parser_exception(_("No manifest"));
	}
	for (auto item_node : manifest.children("item")) {
		const std::string href = item_node.attribute("href").as_string();
		const std::string id = item_node.attribute("id").as_string();
		manifest_item item;
		item.path = resolve_path(opf_dir, href);
		item.media_type = item_node.attribute("media-type").as_string();
		manifest_items.emplace(id, std::move(item));
	}
	auto spine = package.child("spine");
	if (spine == nullptr) {
		throw parser_exception(_("No spine"));
	}
	for (auto itemref : spine.children("itemref")) {
		spine_item item;
		item.idref = itemref.attribute("idref").as_string();
		item.linear = std::string_view(itemref.attribute("linear").as_string()) != "no";
		auto it = manifest_items.find(item.idref);
		if (it != manifest_items.end()) {
			item.path = it->second.path;
			item.media_type = it->second.media_type;
		}
		spine_items.push_back(std::move(item));
	}
}

void epub_book::build_sections(wxFileInputStream& stream, const entry_map& entries) {
	for (const auto& item : spine_items) {
		std::optional<std::string> content;
		if (!item.path.empty()) {
			content = read_entry(stream, entries, item.path);
		}
		if (!content) {
			wxLogWarning("Spine item %s has no readable content", wxString::FromUTF8(item.idref));
			sections.add_section({}, item.linear);
			continue;
		}
		auto shared_content = std::make_shared<const std::string>(std::move(*content));
		auto factory = [shared_content, media_type = item.media_type]() {
			return std::async(std::launch::async, [shared_content, media_type]() {
				return parse_section_document(*shared_content, media_type);
			});
		};
		sections.add_section(std::move(factory), item.linear);
	}
}

std::optional<std::string> epub_book::read_entry(wxFileInputStream& stream, const entry_map& entries, const std::string& name) {
	wxZipEntry* entry = find_zip_entry(name, entries);
	if (entry == nullptr) {
		return std::nullopt;
	}
	stream.SeekI(0);
	wxZipInputStream zis(stream);
	if (!zis.OpenEntry(*entry)) {
		return std::nullopt;
	}
	return read_zip_entry(zis);
}
