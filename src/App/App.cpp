#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/cmdline.h>
#include <wx/config.h>
#include <wx/fileconf.h>
#include <wx/log.h>

#include "App.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

wxIMPLEMENT_APP_CONSOLE(App);

namespace
{
std::string to_std(const wxString &s)
{
	return std::string(s.utf8_str());
}
} // namespace

bool App::OnInit()
{
	SetAppName("BatchRenamer");
	SetVendorName("BatchRenamer");

	// Parses the command line; OnCmdLineParsed sets up the config store and the scheme
	if (!wxAppConsole::OnInit())
	{
		delete wxConfigBase::Set(nullptr);
		return false;
	}
	return true;
}

int App::OnExit()
{
	// Releases the configuration object created in InitConfigStore
	delete wxConfigBase::Set(nullptr);
	return wxAppConsole::OnExit();
}

void App::OnInitCmdLine(wxCmdLineParser &parser)
{
	wxAppConsole::OnInitCmdLine(parser); // -h/--help and --verbose

	parser.SetLogo("Batch renames files by a naming scheme, with a conflict check before anything is touched.");
	parser.AddOption("c", "command", "preview, check or apply (default: preview)");

	// Scheme
	parser.AddLongOption("replace-name", "replace every stem with this name");
	parser.AddLongOption("prefix", "text inserted before the stem");
	parser.AddLongOption("suffix", "text appended after the stem");
	parser.AddLongOption("find", "literal text to find in the stem");
	parser.AddLongOption("replace", "replacement for --find");
	parser.AddLongOption("case", "preserve, lower, upper or title");
	parser.AddLongSwitch("number", "add a sequence number to each name");
	parser.AddLongOption("padding", "minimum digits of the sequence number", wxCMD_LINE_VAL_NUMBER);
	parser.AddLongOption("start", "first sequence number", wxCMD_LINE_VAL_NUMBER);
	parser.AddLongOption("step", "increment between sequence numbers", wxCMD_LINE_VAL_NUMBER);
	parser.AddLongOption("position", "prefix or suffix");
	parser.AddLongOption("separator", "text between the number and the stem");

	// Run control
	parser.AddOption("d", "dest", "move the renamed files into this folder");
	parser.AddOption("n", "count", "number of files shown by preview", wxCMD_LINE_VAL_NUMBER);
	parser.AddSwitch("f", "force", "apply even when the conflict check reports issues");
	parser.AddLongOption("history", "history log file (default: per-user data dir)");
	parser.AddLongSwitch("no-history", "do not append applied renames to the history log");

	// Configuration store and profiles
	parser.AddLongOption("config", "configuration file to use instead of the platform default");
	parser.AddOption("p", "profile", "load a saved scheme profile before applying other options");
	parser.AddLongSwitch("last", "start from the scheme of the last apply (ignored with --profile)");
	parser.AddLongOption("save-profile", "save the resulting scheme under this profile name");
	parser.AddLongOption("delete-profile", "delete a saved scheme profile");
	parser.AddLongSwitch("list-profiles", "list saved scheme profiles");

	parser.AddParam("files", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_MULTIPLE | wxCMD_LINE_PARAM_OPTIONAL);
}

// Opens the configuration store: an explicit file when --config is given, else the platform default
void App::InitConfigStore()
{
	wxConfigBase *cfg = nullptr;
	if (!m_configFile.IsEmpty())
	{
		cfg = new wxFileConfig(GetAppName(), GetVendorName(), m_configFile, wxEmptyString, wxCONFIG_USE_LOCAL_FILE);
	}
	else
	{
		cfg = new wxConfig(GetAppName());
	}
	delete wxConfigBase::Set(cfg);
}

bool App::OnCmdLineParsed(wxCmdLineParser &parser)
{
	if (!wxAppConsole::OnCmdLineParsed(parser))
	{
		return false;
	}

	parser.Found("config", &m_configFile);
	InitConfigStore();

	wxString value;
	if (parser.Found("command", &value))
	{
		value.MakeLower();
		if (value == "preview")
			m_command = AppCommand::Preview;
		else if (value == "check")
			m_command = AppCommand::Check;
		else if (value == "apply")
			m_command = AppCommand::Apply;
		else
		{
			wxLogError("Unknown command '%s'.", value);
			m_usageError = true;
		}
	}

	if (!ParseSchemeOptions(parser))
	{
		m_usageError = true;
	}

	if (parser.Found("dest", &value))
	{
		m_destination = fs::path(to_std(value));
	}
	if (parser.Found("count", &m_previewCount) && m_previewCount < 0)
	{
		wxLogError("--count cannot be negative.");
		m_usageError = true;
	}
	m_force = parser.Found("force");
	m_writeHistory = !parser.Found("no-history");
	if (parser.Found("history", &value))
	{
		m_historyPath = fs::path(to_std(value));
	}

	parser.Found("save-profile", &m_saveProfileName);
	parser.Found("delete-profile", &m_deleteProfileName);
	m_listProfiles = parser.Found("list-profiles");

	for (size_t i = 0; i < parser.GetParamCount(); ++i)
	{
		fs::path path(to_std(parser.GetParam(i)));
		std::error_code ec;
		fs::path absolutePath = fs::absolute(path, ec);
		m_paths.push_back(ec ? path : absolutePath);
	}

	if (m_usageError)
	{
		parser.Usage();
	}
	return true;
}

// Builds the scheme: a saved profile or the last applied scheme (if requested) overridden by explicit options
bool App::ParseSchemeOptions(wxCmdLineParser &parser)
{
	parser.Found("profile", &m_profileName);
	m_useLastScheme = parser.Found("last");

	wxConfigBase *cfg = wxConfigBase::Get();
	if (cfg)
	{
		std::optional<SchemeConfig> base = SchemeRenamer::LoadBaseScheme(*cfg, m_profileName, m_useLastScheme);
		if (!base)
		{
			return false;
		}
		m_scheme = *base;
	}
	else if (!m_profileName.IsEmpty())
	{
		wxLogError("Profile '%s' could not be found.", m_profileName);
		return false;
	}

	bool ok = true;
	wxString value;
	long number = 0;

	if (parser.Found("replace-name", &value))
	{
		m_scheme.replaceName = true;
		m_scheme.newName = to_std(value);
	}
	if (parser.Found("prefix", &value))
		m_scheme.prefix = to_std(value);
	if (parser.Found("suffix", &value))
		m_scheme.suffix = to_std(value);
	if (parser.Found("find", &value))
		m_scheme.find = to_std(value);
	if (parser.Found("replace", &value))
		m_scheme.replace = to_std(value);

	if (parser.Found("case", &value))
	{
		std::optional<CaseOption> option = SchemeRenamer::ParseCaseOption(to_std(value));
		if (option)
		{
			m_scheme.caseOption = *option;
		}
		else
		{
			wxLogError("Unknown case option '%s'.", value);
			ok = false;
		}
	}

	if (parser.Found("number"))
		m_scheme.useNumbering = true;
	if (parser.Found("padding", &number))
	{
		if (number < 1)
		{
			wxLogError("--padding must be at least 1.");
			ok = false;
		}
		else
		{
			m_scheme.numberOptions.padding = (unsigned int)number;
		}
	}
	if (parser.Found("start", &number))
		m_scheme.numberOptions.start = (int)number;
	if (parser.Found("step", &number))
		m_scheme.numberOptions.step = (int)number;
	if (parser.Found("position", &value))
	{
		std::optional<NumberPosition> position = SchemeRenamer::ParseNumberPosition(to_std(value));
		if (position)
		{
			m_scheme.numberOptions.position = *position;
		}
		else
		{
			wxLogError("Unknown number position '%s'.", value);
			ok = false;
		}
	}
	if (parser.Found("separator", &value))
		m_scheme.numberOptions.separator = to_std(value);

	return ok;
}

int App::OnRun()
{
	if (m_usageError)
	{
		return APP_EXIT_USAGE;
	}

	int profileResult = RunProfileCommands();
	if (profileResult != APP_EXIT_OK)
	{
		return profileResult;
	}

	if (m_paths.empty())
	{
		// Profile management alone is a complete invocation
		if (m_listProfiles || !m_saveProfileName.IsEmpty() || !m_deleteProfileName.IsEmpty())
		{
			return APP_EXIT_OK;
		}
		wxLogError("No files given.");
		return APP_EXIT_USAGE;
	}

	switch (m_command)
	{
	case AppCommand::Check:
		return RunCheck();
	case AppCommand::Apply:
		return RunApply();
	case AppCommand::Preview:
	default:
		return RunPreview();
	}
}
