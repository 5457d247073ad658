/* section.cpp - sections of a book's reading order and the providers that expose them.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "section.hpp"
#include "section_offset_calculator.hpp"
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <utility>
#include <wx/log.h>
#include <wx/string.h>

section::section(size_t section_index, document_factory section_factory, bool section_linear) : index{section_index}, factory{std::move(section_factory)}, linear{section_linear} {
}

section::section(size_t section_index, document_factory section_factory, bool section_linear, size_t character_count) : section(section_index, std::move(section_factory), section_linear) {
	std::call_once(count_flag, [this, character_count]() {
		cached_count = character_count;
	});
}

std::future<document_ptr> section::create_document() const {
	if (!factory) {
		throw std::logic_error("Section has no document");
	}
	return factory();
}

size_t section::get_character_count() const {
	std::call_once(count_flag, [this]() {
		cached_count = count_characters();
	});
	return cached_count;
}

size_t section::count_characters() const {
	if (!factory) {
		return 0;
	}
	try {
		const document_ptr doc = factory().get();
		if (doc.isNull()) {
			return 0;
		}
		return count_section_characters(*doc);
	} catch (const std::exception& e) {
		wxLogWarning("Couldn't count characters of section %zu: %s", index, wxString::FromUTF8(e.what()));
	} catch (...) {
		wxLogWarning("Couldn't count characters of section %zu: unknown error", index);
	}
	return 0;
}

section& section_list::add_section(document_factory factory, bool linear) {
	sections.push_back(std::make_unique<section>(sections.size(), std::move(factory), linear));
	return *sections.back();
}

size_t section_list::get_section_count() const {
	return sections.size();
}

const section* section_list::get_section(size_t index) const {
	if (index >= sections.size()) {
		return nullptr;
	}
	return sections[index].get();
}
