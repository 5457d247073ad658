/* utils.hpp - various utility functions.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <Poco/Path.h>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <wx/zipstrm.h>

// Length in wxString characters, the unit used for every character count and text offset.
[[nodiscard]] size_t utf8_length(std::string_view text);
[[nodiscard]] std::string trim_string(const std::string& str);
[[nodiscard]] std::string url_decode(std::string_view encoded);
// Resolves an href against a directory in the archive, collapsing "." and ".." segments.
[[nodiscard]] std::string resolve_path(const Poco::Path& base_dir, const std::string& href);
[[nodiscard]] std::string read_zip_entry(wxZipInputStream& zip);
[[nodiscard]] wxZipEntry* find_zip_entry(const std::string& filename, const std::map<std::string, std::unique_ptr<wxZipEntry>>& entries);
