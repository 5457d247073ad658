/* config_manager.cpp - persistent settings and per-document reading state.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include <algorithm>
#include <cstddef>
#include <mbedtls/base64.h>
#include <mbedtls/sha1.h>
#include <mbedtls/version.h>
#include <string>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/string.h>

namespace {
constexpr size_t SHA1_DIGEST_SIZE = 20;

int sha1_compute(const unsigned char* data, size_t len, unsigned char out[SHA1_DIGEST_SIZE]) {
#if MBEDTLS_VERSION_NUMBER >= 0x03000000
	return mbedtls_sha1(data, len, out);
#else
	return mbedtls_sha1_ret(data, len, out);
#endif
}

// Group names can't contain '/', so the digest uses the URL-safe alphabet without padding.
std::string b64_url_encode(const unsigned char* data, size_t len) {
	unsigned char buffer[64]{};
	size_t written{0};
	if (mbedtls_base64_encode(buffer, sizeof(buffer), &written, data, len) != 0) {
		return {};
	}
	std::string out(reinterpret_cast<const char*>(buffer), written);
	std::replace(out.begin(), out.end(), '+', '-');
	std::replace(out.begin(), out.end(), '/', '_');
	out.erase(std::remove(out.begin(), out.end(), '='), out.end());
	return out;
}
} // namespace

config_manager::~config_manager() {
	if (config) {
		shutdown();
	}
}

bool config_manager::initialize(const wxString& path) {
	const wxString config_path = path.IsEmpty() ? get_config_path() : path;
	if (config_path.IsEmpty()) {
		return false;
	}
	config = std::make_unique<wxFileConfig>(APP_NAME, "", config_path);
	if (wxConfigBase::Get(false) == nullptr) {
		wxConfigBase::Set(config.get());
		owns_global_config = true;
	}
	load_defaults();
	return true;
}

void config_manager::flush() {
	if (config) {
		config->Flush();
	}
}

void config_manager::shutdown() {
	if (!config) {
		return;
	}
	config->Flush();
	if (owns_global_config) {
		wxConfigBase::Set(nullptr);
		owns_global_config = false;
	}
	config.reset();
}

progress_options config_manager::get_progress_options() const {
	progress_options options;
	const int per_page = get(characters_per_page);
	if (per_page > 0) {
		options.characters_per_page = static_cast<size_t>(per_page);
	} else {
		wxLogWarning("Ignoring invalid %s value %d", characters_per_page.key, per_page);
	}
	const int per_minute = get(characters_per_minute);
	if (per_minute > 0) {
		options.characters_per_minute = static_cast<size_t>(per_minute);
	} else {
		wxLogWarning("Ignoring invalid %s value %d", characters_per_minute.key, per_minute);
	}
	return options;
}

void config_manager::set_document_location(const wxString& path, const wxString& location) {
	if (config) {
		config->Write(document_key(path, "last_location"), location);
	}
}

wxString config_manager::get_document_location(const wxString& path) const {
	if (!config) {
		return {};
	}
	return config->Read(document_key(path, "last_location"), wxString());
}

void config_manager::set_document_fraction(const wxString& path, double fraction) {
	if (config) {
		config->Write(document_key(path, "last_fraction"), fraction);
	}
}

double config_manager::get_document_fraction(const wxString& path) const {
	if (!config) {
		return 0.0;
	}
	return config->ReadDouble(document_key(path, "last_fraction"), 0.0);
}

wxString config_manager::get_config_path() {
	const wxString dir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(dir) && !wxFileName::Mkdir(dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
		wxLogError("Couldn't create configuration directory %s", dir);
		return {};
	}
	return wxFileName(dir, APP_NAME + ".ini").GetFullPath();
}

void config_manager::load_defaults() {
	auto set_default_if_missing = [this](const auto& setting) {
		const wxString key = app_key(setting.key);
		if (!config->HasEntry(key)) {
			config->Write(key, setting.default_value);
		}
	};
	set_default_if_missing(characters_per_page);
	set_default_if_missing(characters_per_minute);
}

wxString config_manager::document_key(const wxString& path, const wxString& key) {
	unsigned char digest[SHA1_DIGEST_SIZE]{};
	const wxScopedCharBuffer utf8 = path.ToUTF8();
	if (sha1_compute(reinterpret_cast<const unsigned char*>(utf8.data()), utf8.length(), digest) != 0) {
		wxString escaped = path;
		escaped.Replace("/", "_");
		return wxString::Format("/doc_%s/%s", escaped, key);
	}
	return wxString::Format("/doc_%s/%s", wxString::FromUTF8(b64_url_encode(digest, sizeof(digest))), key);
}
