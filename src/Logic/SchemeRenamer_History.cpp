#include "SchemeRenamer.h"

#include <wx/datetime.h>
#include <wx/ffile.h>
#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/string.h>

#include <filesystem>
#include <string>
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

// Gets the path to the history log file in user's app data directory
fs::path SchemeRenamer::GetHistoryLogPath()
{
	wxString stdPath = wxStandardPaths::Get().GetUserDataDir();
	fs::path logDir = fs::path(std::string(stdPath.utf8_str()));
	std::error_code ec;
	if (!fs::exists(logDir, ec))
	{
		fs::create_directories(logDir, ec);
		if (ec)
		{
			wxLogWarning("Could not create history directory '%s': %s", logDir.string().c_str(), ec.message().c_str());
		}
	}
	return logDir / "rename_history.log";
}

// Appends one block per batch: a "# <time> <operation>: <summary>" header followed by
// the successful entries. Failed entries are not history and a batch without any
// success leaves the log untouched
bool SchemeRenamer::WriteHistoryLog(const OutcomeReport &report, const std::string &operationType, const fs::path &logPath)
{
	wxString block;
	for (const auto &result : report.results)
	{
		if (result.outcome == EntryOutcome::Success)
			block << "  " << wxString::FromUTF8(FormatOutcomeLine(result).c_str()) << "\n";
	}
	if (block.IsEmpty())
		return true;

	const wxString header = wxString::Format("# %s %s: %s\n", wxDateTime::Now().Format("%Y-%m-%d %H:%M:%S"),
											 wxString::FromUTF8(operationType.c_str()), wxString::FromUTF8(report.message.c_str()));

	wxFFile logFile;
	{
		wxLogNull noOpenErrors; // reported below with the path
		logFile.Open(wxString::FromUTF8(logPath.string().c_str()), "a");
	}
	if (!logFile.IsOpened())
	{
		wxLogWarning("Could not open history log '%s'", logPath.string().c_str());
		return false;
	}

	const bool written = logFile.Write(header + block, wxConvUTF8);
	return logFile.Close() && written;
}
