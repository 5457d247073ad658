/* section_progress.cpp - resolves location references to progress within a single section.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "section_progress.hpp"
#include "parser_exception.hpp"
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Node.h>
#include <algorithm>
#include <exception>
#include <type_traits>
#include <variant>
#include <wx/log.h>
#include <wx/string.h>

using Poco::XML::Node;

namespace {
const Poco::XML::Document* owner_document(const anchor_target& target) {
	const Node* node = std::visit([](const auto& value) -> const Node* {
		using T = std::decay_t<decltype(value)>;
		if constexpr (std::is_same_v<T, text_range>) {
			return value.start.container;
		} else {
			return value;
		}
	},
		target);
	if (node == nullptr) {
		return nullptr;
	}
	if (node->nodeType() == Node::DOCUMENT_NODE) {
		return static_cast<const Poco::XML::Document*>(node);
	}
	return node->ownerDocument();
}

bool is_collapsed(const anchor_target& target) noexcept {
	const auto* range = std::get_if<text_range>(&target);
	return range == nullptr || range->collapsed();
}
} // namespace

double section_measurement::fraction() const noexcept {
	return local_fraction(offsets.start, offsets.total);
}

double section_measurement::end_fraction() const noexcept {
	return local_fraction(offsets.end, offsets.total);
}

section_progress::section_progress(const section_provider& sections, const navigation_resolver& nav) : provider{sections}, resolver{nav} {
}

std::optional<local_progress> section_progress::get_progress(const std::string& location) const noexcept {
	const auto measurement = measure(location);
	if (!measurement) {
		return std::nullopt;
	}
	return local_progress{.index = measurement->index, .fraction = measurement->fraction()};
}

std::optional<section_measurement> section_progress::measure(const std::string& location) const noexcept {
	try {
		return try_measure(location);
	} catch (const parser_exception& e) {
		if (e.get_severity() == error_severity::warning) {
			wxLogWarning("Couldn't resolve location %s: %s", wxString::FromUTF8(location), e.get_display_message());
		} else {
			wxLogError("Couldn't resolve location %s: %s", wxString::FromUTF8(location), e.get_display_message());
		}
	} catch (const std::exception& e) {
		wxLogError("Couldn't resolve location %s: %s", wxString::FromUTF8(location), wxString::FromUTF8(e.what()));
	} catch (...) {
		wxLogError("Couldn't resolve location %s: unknown error", wxString::FromUTF8(location));
	}
	return std::nullopt;
}

std::optional<section_measurement> section_progress::try_measure(const std::string& location) const {
	const navigation_result nav = resolver.resolve(location);
	if (!nav.resolved()) {
		wxLogDebug("Location %s has no section or anchor", wxString::FromUTF8(location));
		return std::nullopt;
	}
	const section* sec = provider.get_section(*nav.index);
	if (sec == nullptr || !sec->has_document()) {
		wxLogDebug("Section %zu can't produce a document", *nav.index);
		return std::nullopt;
	}
	document_ptr doc = sec->create_document().get();
	if (doc.isNull()) {
		return std::nullopt;
	}
	const auto target = std::visit([&doc](const auto& value) -> std::optional<anchor_target> {
		using T = std::decay_t<decltype(value)>;
		if constexpr (std::is_same_v<T, anchor_function>) {
			if (!value) {
				return std::nullopt;
			}
			return value(*doc);
		} else {
			return anchor_target{value};
		}
	},
		*nav.target);
	if (!target) {
		wxLogDebug("Anchor for %s isn't present in section %zu", wxString::FromUTF8(location), *nav.index);
		return std::nullopt;
	}
	const Poco::XML::Document* owner = owner_document(*target);
	const section_offset_calculator calculator(owner != nullptr ? *owner : *doc);
	const auto offsets = calculator.measure(*target);
	if (!offsets) {
		return std::nullopt;
	}
	return section_measurement{.index = *nav.index, .offsets = *offsets, .collapsed = is_collapsed(*target)};
}

double local_fraction(size_t before, size_t total) noexcept {
	if (total == 0) {
		return 0.0;
	}
	return std::clamp(static_cast<double>(before) / static_cast<double>(total), 0.0, 1.0);
}
