/* utils.cpp - various utility functions.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <Poco/Path.h>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <wx/string.h>
#include <wx/zipstrm.h>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;
} // namespace

size_t utf8_length(std::string_view text) {
	if (text.empty()) {
		return 0;
	}
	return wxString::FromUTF8(text.data(), text.size()).length();
}

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	auto is_nbsp = [&](std::string::const_iterator it) -> bool {
		return it != str.end() && std::next(it) != str.end() && static_cast<unsigned char>(*it) == UTF8_NBSP_FIRST && static_cast<unsigned char>(*std::next(it)) == UTF8_NBSP_SECOND;
	};
	while (start != end && ((std::isspace(static_cast<unsigned char>(*start)) != 0) || is_nbsp(start))) {
		if (is_nbsp(start)) {
			start += 2;
		} else {
			++start;
		}
	}
	while (start != end) {
		auto prev = std::prev(end);
		if (std::isspace(static_cast<unsigned char>(*prev)) != 0) {
			end = prev;
		} else if (prev != start && std::prev(prev) != start && is_nbsp(std::prev(prev))) {
			end = std::prev(prev);
		} else {
			break;
		}
	}
	return {start, end};
}

std::string url_decode(std::string_view encoded) {
	auto hex = [](char c) -> int {
		if (c >= '0' && c <= '9') {
			return c - '0';
		}
		if (c >= 'a' && c <= 'f') {
			return c - 'a' + 10;
		}
		if (c >= 'A' && c <= 'F') {
			return c - 'A' + 10;
		}
		return -1;
	};
	std::string out;
	out.reserve(encoded.size());
	for (size_t i = 0; i < encoded.size(); ++i) {
		char c = encoded[i];
		if (c == '%') {
			if (i + 2 < encoded.size()) {
				int hi = hex(encoded[i + 1]);
				int lo = hex(encoded[i + 2]);
				if (hi >= 0 && lo >= 0) {
					out.push_back(static_cast<char>((hi << 4) | lo));
					i += 2;
					continue;
				}
			}
			out.push_back('%');
		} else {
			out.push_back(c);
		}
	}
	return out;
}

std::string resolve_path(const Poco::Path& base_dir, const std::string& href) {
	Poco::Path file_path(base_dir);
	file_path.resolve(Poco::Path(href, Poco::Path::PATH_UNIX));
	return file_path.toString(Poco::Path::PATH_UNIX);
}

std::string read_zip_entry(wxZipInputStream& zip) {
	constexpr int buffer_size = 4096;
	std::ostringstream buffer;
	char buf[buffer_size];
	while (zip.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(zip.LastRead()));
	}
	return buffer.str();
}

wxZipEntry* find_zip_entry(const std::string& filename, const std::map<std::string, std::unique_ptr<wxZipEntry>>& entries) {
	auto it = entries.find(filename);
	if (it != entries.end()) {
		return it->second.get();
	}
	auto decoded = url_decode(filename);
	if (decoded != filename) {
		it = entries.find(decoded);
		if (it != entries.end()) {
			return it->second.get();
		}
	}
	auto url_encode = [](std::string_view in) {
		static const char hex[] = "0123456789ABCDEF";
		std::string out;
		out.reserve(in.size());
		for (unsigned char ch : in) {
			bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == '/' || ch == ':';
			if (unreserved) {
				out.push_back(static_cast<char>(ch));
			} else {
				out.push_back('%');
				out.push_back(hex[(ch >> 4) & 0xF]);
				out.push_back(hex[ch & 0xF]);
			}
		}
		return out;
	};
	std::string encoded = url_encode(filename);
	if (encoded != filename) {
		it = entries.find(encoded);
		if (it != entries.end()) {
			return it->second.get();
		}
	}
	return nullptr;
}
