/* app.cpp - console entry point reporting reading progress for an EPUB book.
 *
 * Paperback.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "constants.hpp"
#include "href_resolver.hpp"
#include "parser_exception.hpp"
#include <memory>
#include <wx/crt.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/translation.h>

wxIMPLEMENT_APP_CONSOLE(app);

namespace {
const wxCmdLineEntryDesc command_line_desc[] = {
	{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
	{wxCMD_LINE_OPTION, "p", "page-size", "characters per virtual page", wxCMD_LINE_VAL_NUMBER},
	{wxCMD_LINE_OPTION, "r", "rate", "reading rate in characters per minute", wxCMD_LINE_VAL_NUMBER},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "book.epub", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "location", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL},
	wxCMD_LINE_DESC_END,
};
} // namespace

bool app::OnInit() {
	if (!wxAppConsole::OnInit()) {
		return false;
	}
	if (!config_mgr.initialize()) {
		wxLogError(_("Failed to initialize configuration"));
		return false;
	}
	return true;
}

void app::OnInitCmdLine(wxCmdLineParser& parser) {
	parser.SetDesc(command_line_desc);
	parser.SetLogo(wxString::Format("%s %s", APP_NAME, APP_VERSION));
}

bool app::OnCmdLineParsed(wxCmdLineParser& parser) {
	wxFileName file_path{parser.GetParam(0)};
	file_path.Normalize(wxPATH_NORM_ABSOLUTE);
	book_path = file_path.GetFullPath();
	if (parser.GetParamCount() > 1) {
		location = parser.GetParam(1);
	}
	long value{0};
	if (parser.Found("p", &value)) {
		page_size_override = value;
	}
	if (parser.Found("r", &value)) {
		rate_override = value;
	}
	return true;
}

int app::OnRun() {
	if (!wxFileName::FileExists(book_path)) {
		wxLogError(_("File not found: %s"), book_path);
		return 1;
	}
	std::unique_ptr<epub_book> book;
	try {
		book = epub_book::load(book_path);
	} catch (const parser_exception& e) {
		wxLogError("%s", e.get_display_message());
		return 1;
	}
	if (!book) {
		wxLogError(_("Failed to load document: %s"), book_path);
		return 1;
	}
	if (location.IsEmpty()) {
		location = config_mgr.get_document_location(book_path);
	}
	if (location.IsEmpty()) {
		location = wxString::FromUTF8(book->get_section_href(0));
	}
	const href_resolver resolver(*book);
	const book_progress_calculator calculator(*book, resolver, resolve_options());
	const auto progress = calculator.get_book_progress(location.ToStdString(wxConvUTF8));
	if (!progress) {
		wxLogError(_("Couldn't determine progress for %s"), location);
		return 1;
	}
	print_progress(*book, location, *progress);
	config_mgr.set_document_location(book_path, location);
	config_mgr.set_document_fraction(book_path, progress->fraction);
	config_mgr.flush();
	return 0;
}

int app::OnExit() {
	config_mgr.shutdown();
	return wxAppConsole::OnExit();
}

progress_options app::resolve_options() const {
	progress_options options = config_mgr.get_progress_options();
	if (page_size_override) {
		if (*page_size_override > 0) {
			options.characters_per_page = static_cast<size_t>(*page_size_override);
		} else {
			wxLogWarning(_("Ignoring invalid page size %ld"), *page_size_override);
		}
	}
	if (rate_override) {
		if (*rate_override > 0) {
			options.characters_per_minute = static_cast<size_t>(*rate_override);
		} else {
			wxLogWarning(_("Ignoring invalid reading rate %ld"), *rate_override);
		}
	}
	return options;
}

void app::print_progress(const epub_book& book, const wxString& location, const book_progress& progress) {
	if (!book.get_title().empty()) {
		wxPrintf("%s\n", wxString::FromUTF8(book.get_title()));
	}
	if (!book.get_author().empty()) {
		wxPrintf("%s\n", wxString::FromUTF8(book.get_author()));
	}
	wxPrintf("%s: %s\n", _("Location"), location);
	wxPrintf("%s: %.1f%%\n", _("Progress"), progress.fraction * 100.0);
	wxPrintf("%s: %zu / %zu\n", _("Section"), progress.section.current + 1, progress.section.total);
	if (progress.location.next != progress.location.current) {
		wxPrintf("%s: %zu-%zu / %zu\n", _("Page"), progress.location.current + 1, progress.location.next + 1, progress.location.total);
	} else {
		wxPrintf("%s: %zu / %zu\n", _("Page"), progress.location.current + 1, progress.location.total);
	}
	wxPrintf("%s: %zu min\n", _("Time left in section"), progress.time.section);
	wxPrintf("%s: %zu min\n", _("Time left in book"), progress.time.total);
}
