/* config_manager.hpp - persistent settings and per-document reading state.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "book_progress.hpp"
#include <memory>
#include <wx/fileconf.h>
#include <wx/string.h>

template <typename T>
struct app_setting {
	const char* key;
	T default_value;

	constexpr app_setting(const char* k, const T& def) : key{k}, default_value{def} {
	}
};

// Reading-rate settings live under /app; each opened book gets its own doc_<hash> group holding the last location
// and the book fraction it produced.
class config_manager {
public:
	static constexpr app_setting<int> characters_per_page{"characters_per_page", DEFAULT_CHARACTERS_PER_PAGE};
	static constexpr app_setting<int> characters_per_minute{"characters_per_minute", DEFAULT_CHARACTERS_PER_MINUTE};

	config_manager() = default;
	~config_manager();
	config_manager(const config_manager&) = delete;
	config_manager& operator=(const config_manager&) = delete;
	config_manager(config_manager&&) = default;
	config_manager& operator=(config_manager&&) = default;
	// An empty path selects paperback-progress.ini in the user data directory.
	bool initialize(const wxString& path = wxEmptyString);
	void flush();
	void shutdown();

	wxFileConfig* get_config() const {
		return config.get();
	}

	bool is_initialized() const {
		return config != nullptr;
	}

	template <typename T>
	T get(const app_setting<T>& setting) const {
		T value = setting.default_value;
		if (config) {
			config->Read(app_key(setting.key), &value, setting.default_value);
		}
		return value;
	}

	template <typename T>
	void set(const app_setting<T>& setting, const T& value) {
		if (config) {
			config->Write(app_key(setting.key), value);
		}
	}

	// Falls back to the defaults, with a warning, for non-positive values.
	progress_options get_progress_options() const;
	void set_document_location(const wxString& path, const wxString& location);
	wxString get_document_location(const wxString& path) const;
	void set_document_fraction(const wxString& path, double fraction);
	double get_document_fraction(const wxString& path) const;

private:
	std::unique_ptr<wxFileConfig> config;
	bool owns_global_config{false};

	static wxString app_key(const char* key) {
		return wxString("/app/") + key;
	}

	static wxString get_config_path();
	void load_defaults();
	// Key inside the document's doc_<base64url(sha1(path))> group.
	static wxString document_key(const wxString& path, const wxString& key);
};
