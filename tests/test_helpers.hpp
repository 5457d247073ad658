/* test_helpers.hpp - shared fixtures for building section documents and resolvers.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "anchor.hpp"
#include "navigation_resolver.hpp"
#include "section.hpp"
#include "xhtml_loader.hpp"
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Element.h>
#include <Poco/DOM/Node.h>
#include <future>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <wx/log.h>
#include <wx/string.h>

inline std::string wrap_body(const std::string& body) {
	return "<?xml version=\"1.0\" encoding=\"UTF-8\"?><html xmlns=\"http://www.w3.org/1999/xhtml\"><head><title>Heading text</title></head><body>" + body + "</body></html>";
}

inline document_ptr make_document(const std::string& body) {
	return parse_section_document(wrap_body(body));
}

inline document_factory make_factory(const std::string& body) {
	auto content = std::make_shared<const std::string>(wrap_body(body));
	return [content]() {
		return std::async(std::launch::deferred, [content]() {
			return parse_section_document(*content);
		});
	};
}

inline Poco::XML::Element* find_by_id(Poco::XML::Document& doc, const std::string& id) {
	return doc.getElementById(id, "id");
}

// First text node under the element with the given id.
inline Poco::XML::Node* text_of(Poco::XML::Document& doc, const std::string& id) {
	Poco::XML::Element* element = find_by_id(doc, id);
	if (element == nullptr || element->firstChild() == nullptr) {
		throw std::invalid_argument("no text under #" + id);
	}
	return element->firstChild();
}

// Lazy point anchor inside the text of the element with the given id.
inline anchor text_point(const std::string& id, size_t offset) {
	return anchor_function([id, offset](Poco::XML::Document& doc) -> std::optional<anchor_target> {
		Poco::XML::Element* element = doc.getElementById(id, "id");
		if (element == nullptr || element->firstChild() == nullptr) {
			return std::nullopt;
		}
		return anchor_target{make_point(element->firstChild(), offset)};
	});
}

inline anchor element_anchor(const std::string& id) {
	return anchor_function([id](Poco::XML::Document& doc) -> std::optional<anchor_target> {
		Poco::XML::Element* element = doc.getElementById(id, "id");
		if (element == nullptr) {
			return std::nullopt;
		}
		return anchor_target{static_cast<Poco::XML::Node*>(element)};
	});
}

// Resolves locations from a fixed table; anything else is unresolved.
class table_resolver : public navigation_resolver {
public:
	void add(const std::string& location, size_t index, anchor target) {
		entries[location] = {index, std::move(target)};
	}

	[[nodiscard]] navigation_result resolve(const std::string& location) const override {
		auto it = entries.find(location);
		if (it == entries.end()) {
			return {};
		}
		navigation_result result;
		result.index = it->second.first;
		result.target = it->second.second;
		return result;
	}

private:
	std::map<std::string, std::pair<size_t, anchor>> entries;
};

// Collects log records while alive; the previous target and level are restored on destruction.
class log_capture : public wxLog {
public:
	log_capture() : previous_level{wxLog::GetLogLevel()}, previous_target{wxLog::SetActiveTarget(this)} {
		wxLog::SetLogLevel(wxLOG_Max);
	}

	~log_capture() override {
		wxLog::SetActiveTarget(previous_target);
		wxLog::SetLogLevel(previous_level);
	}

	log_capture(const log_capture&) = delete;
	log_capture& operator=(const log_capture&) = delete;
	log_capture(log_capture&&) = delete;
	log_capture& operator=(log_capture&&) = delete;

	[[nodiscard]] std::vector<wxString> messages_at(wxLogLevel level) const {
		std::vector<wxString> result;
		for (const auto& [record_level, message] : records) {
			if (record_level == level) {
				result.push_back(message);
			}
		}
		return result;
	}

protected:
	void DoLogRecord(wxLogLevel level, const wxString& msg, const wxLogRecordInfo&) override {
		records.emplace_back(level, msg);
	}

private:
	wxLogLevel previous_level;
	wxLog* previous_target;
	std::vector<std::pair<wxLogLevel, wxString>> records;
};
