#ifndef APP_H
#define APP_H

#include <wx/app.h>
#include <wx/cmdline.h>

#include "SchemeRenamer.h"

#include <filesystem>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

enum class AppCommand
{
	Preview,
	Check,
	Apply
};

// Process exit codes reported by App::OnRun
enum AppExitCode
{
	APP_EXIT_OK = 0,
	APP_EXIT_USAGE = 1,
	APP_EXIT_CONFLICTS = 2,
	APP_EXIT_PARTIAL = 3,
	APP_EXIT_FAILED = 4
};

class App : public wxAppConsole
{
public:
	virtual bool OnInit() override;
	virtual int OnRun() override;
	virtual int OnExit() override;
	virtual void OnInitCmdLine(wxCmdLineParser &parser) override;
	virtual bool OnCmdLineParsed(wxCmdLineParser &parser) override;

private:
	// Command line state
	AppCommand m_command = AppCommand::Preview;
	SchemeConfig m_scheme;
	std::vector<fs::path> m_paths;
	std::optional<fs::path> m_destination;
	long m_previewCount = 5;
	bool m_force = false;
	bool m_writeHistory = true;
	std::optional<fs::path> m_historyPath;
	wxString m_configFile;
	wxString m_profileName;
	bool m_useLastScheme = false;
	wxString m_saveProfileName;
	wxString m_deleteProfileName;
	bool m_listProfiles = false;
	bool m_usageError = false;

	// Parsing helpers (App.cpp)
	bool ParseSchemeOptions(wxCmdLineParser &parser);
	void InitConfigStore();

	// Commands (App_Commands.cpp)
	int RunProfileCommands();
	int RunPreview();
	int RunCheck();
	int RunApply();

	// Report printing (App_Report.cpp)
	void PrintConflictReport(const ConflictReport &report) const;
	void PrintOutcomeReport(const OutcomeReport &report) const;
};

wxDECLARE_APP(App);

#endif // APP_H
