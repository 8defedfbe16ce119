#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include "App.h"

#include <string>
#include <vector>

namespace
{
wxString from_std(const std::string &s)
{
	return wxString::FromUTF8(s.c_str());
}

void print_conflict_group(const char *title, const std::vector<ConflictEntry> &entries)
{
	if (entries.empty())
		return;
	wxPrintf("%s (%d):\n", title, (int)entries.size());
	for (const auto &entry : entries)
	{
		wxPrintf("  %s -> %s\n", from_std(entry.originalPath.string()), from_std(entry.newName));
	}
}
} // namespace

void App::PrintConflictReport(const ConflictReport &report) const
{
	if (!report.HasConflicts())
	{
		wxPrintf("No conflicts found.\n");
		return;
	}
	print_conflict_group("Duplicate names", report.duplicates);
	print_conflict_group("Invalid characters", report.invalidChars);
	print_conflict_group("Would overwrite existing files", report.existingFiles);
}

void App::PrintOutcomeReport(const OutcomeReport &report) const
{
	for (const auto &result : report.results)
	{
		wxPrintf("%s\n", from_std(SchemeRenamer::FormatOutcomeLine(result)));
	}
	wxPrintf("[%s] %s\n", from_std(SchemeRenamer::ToString(report.status)), from_std(report.message));
}
