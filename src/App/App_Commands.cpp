#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/config.h>
#include <wx/log.h>

#include "App.h"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace
{
wxString from_path(const fs::path &p)
{
	return wxString::FromUTF8(p.string().c_str());
}
} // namespace

// Handles --list-profiles, --save-profile and --delete-profile against the config store
int App::RunProfileCommands()
{
	wxConfigBase *cfg = wxConfigBase::Get();
	if (!cfg)
	{
		wxLogError("RunProfileCommands: wxConfigBase::Get() returned nullptr.");
		return APP_EXIT_FAILED;
	}

	if (!m_deleteProfileName.IsEmpty())
	{
		if (!SchemeRenamer::DeleteProfile(*cfg, m_deleteProfileName))
		{
			wxLogError("Profile '%s' could not be deleted.", m_deleteProfileName);
			return APP_EXIT_FAILED;
		}
		wxLogMessage("Profile '%s' deleted.", m_deleteProfileName);
	}

	if (!m_saveProfileName.IsEmpty())
	{
		if (!SchemeRenamer::SaveProfile(*cfg, m_saveProfileName, m_scheme))
		{
			return APP_EXIT_USAGE;
		}
		wxLogMessage("Profile '%s' saved.", m_saveProfileName);
	}

	if (m_listProfiles)
	{
		const wxArrayString names = SchemeRenamer::GetProfileNames(*cfg);
		for (const auto &name : names)
		{
			wxPrintf("%s\n", name);
		}
	}
	return APP_EXIT_OK;
}

int App::RunPreview()
{
	const std::vector<PreviewPair> previews = SchemeRenamer::GetExamplePreviews(m_paths, m_scheme, (std::size_t)m_previewCount);
	for (const auto &preview : previews)
	{
		wxPrintf("%s -> %s\n", wxString::FromUTF8(preview.first.c_str()), wxString::FromUTF8(preview.second.c_str()));
	}
	if (m_paths.size() > previews.size())
	{
		wxPrintf("... and %d more files\n", (int)(m_paths.size() - previews.size()));
	}
	return APP_EXIT_OK;
}

int App::RunCheck()
{
	const ConflictReport report = SchemeRenamer::CheckConflicts(m_paths, m_scheme, m_destination);
	PrintConflictReport(report);
	return report.HasConflicts() ? APP_EXIT_CONFLICTS : APP_EXIT_OK;
}

// Runs the conflict check, then the batch; the check blocks the batch unless --force is given
int App::RunApply()
{
	const ConflictReport conflicts = SchemeRenamer::CheckConflicts(m_paths, m_scheme, m_destination);
	if (conflicts.HasConflicts())
	{
		PrintConflictReport(conflicts);
		if (!m_force)
		{
			wxLogError("Nothing renamed: resolve the conflicts above or pass --force.");
			return APP_EXIT_CONFLICTS;
		}
		wxLogWarning("Proceeding despite %d conflict(s).", (int)conflicts.TotalIssues());
	}

	const OutcomeReport report = SchemeRenamer::ApplyRename(SchemeRenamer::MakeEntries(m_paths), m_scheme, m_destination);
	PrintOutcomeReport(report);

	if (m_writeHistory)
	{
		const fs::path logPath = m_historyPath ? *m_historyPath : SchemeRenamer::GetHistoryLogPath();
		if (!SchemeRenamer::WriteHistoryLog(report, m_destination ? "Move" : "Rename", logPath))
		{
			wxLogWarning("Could not write rename history to '%s'.", from_path(logPath));
		}
	}

	if (wxConfigBase *cfg = wxConfigBase::Get())
	{
		SchemeRenamer::SaveLastScheme(*cfg, m_scheme);
	}

	switch (report.status)
	{
	case BatchStatus::Success:
		return APP_EXIT_OK;
	case BatchStatus::Partial:
		return APP_EXIT_PARTIAL;
	case BatchStatus::Error:
	default:
		return APP_EXIT_FAILED;
	}
}
