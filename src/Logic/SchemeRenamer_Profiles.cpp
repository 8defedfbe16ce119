#include "SchemeRenamer.h"

#include <wx/config.h>
#include <wx/log.h>

#include <optional>
#include <string>

namespace
{
const wxString ProfilesRoot = "/Profiles";
const wxString LastSchemeRoot = "/Scheme";

wxString from_std(const std::string &s)
{
	return wxString::FromUTF8(s.c_str());
}

std::string to_std(const wxString &s)
{
	return std::string(s.utf8_str());
}

wxString trimmed(const wxString &name)
{
	wxString result = name;
	result.Trim(true).Trim(false);
	return result;
}

// Config group of a profile; surrounding blanks are not part of the name
wxString profile_path(const wxString &name)
{
	return ProfilesRoot + "/" + trimmed(name);
}
} // namespace

// Writes every scheme field as an entry of the config's current group
void SchemeRenamer::WriteSchemeEntries(wxConfigBase &cfg, const SchemeConfig &config)
{
	cfg.Write("ReplaceName", config.replaceName);
	cfg.Write("NewName", from_std(config.newName));
	cfg.Write("Prefix", from_std(config.prefix));
	cfg.Write("Suffix", from_std(config.suffix));
	cfg.Write("Find", from_std(config.find));
	cfg.Write("Replace", from_std(config.replace));
	cfg.Write("CaseOption", (long)config.caseOption);
	cfg.Write("UseNumbering", config.useNumbering);
	cfg.Write("NumberPadding", (long)config.numberOptions.padding);
	cfg.Write("NumberStart", (long)config.numberOptions.start);
	cfg.Write("NumberStep", (long)config.numberOptions.step);
	cfg.Write("NumberPosition", (long)config.numberOptions.position);
	cfg.Write("NumberSeparator", from_std(config.numberOptions.separator));
}

// Reads a scheme from the config's current group; missing keys fall back to the scheme defaults
SchemeConfig SchemeRenamer::ReadSchemeEntries(wxConfigBase &cfg)
{
	const SchemeConfig defaults;
	SchemeConfig config;
	config.replaceName = cfg.ReadBool("ReplaceName", defaults.replaceName);
	config.newName = to_std(cfg.Read("NewName", wxEmptyString));
	config.prefix = to_std(cfg.Read("Prefix", wxEmptyString));
	config.suffix = to_std(cfg.Read("Suffix", wxEmptyString));
	config.find = to_std(cfg.Read("Find", wxEmptyString));
	config.replace = to_std(cfg.Read("Replace", wxEmptyString));

	long caseValue = cfg.ReadLong("CaseOption", (long)defaults.caseOption);
	if (caseValue < (long)CaseOption::Preserve || caseValue > (long)CaseOption::Title)
	{
		wxLogWarning("Ignoring unknown case option %ld in configuration", caseValue);
		caseValue = (long)defaults.caseOption;
	}
	config.caseOption = (CaseOption)caseValue;

	config.useNumbering = cfg.ReadBool("UseNumbering", defaults.useNumbering);
	long padding = cfg.ReadLong("NumberPadding", (long)defaults.numberOptions.padding);
	config.numberOptions.padding = padding < 1 ? 1u : (unsigned int)padding;
	config.numberOptions.start = (int)cfg.ReadLong("NumberStart", defaults.numberOptions.start);
	config.numberOptions.step = (int)cfg.ReadLong("NumberStep", defaults.numberOptions.step);
	config.numberOptions.position = cfg.ReadLong("NumberPosition", (long)defaults.numberOptions.position) == (long)NumberPosition::Prefix
										? NumberPosition::Prefix
										: NumberPosition::Suffix;
	config.numberOptions.separator = to_std(cfg.Read("NumberSeparator", from_std(defaults.numberOptions.separator)));
	return config;
}

// Profile names become config groups, so path separators and bare numbers are refused
bool SchemeRenamer::IsValidProfileName(const wxString &name)
{
	const wxString bare = trimmed(name);
	if (bare.IsEmpty())
	{
		return false;
	}
	return bare.find('/') == wxString::npos && bare.find('\\') == wxString::npos && !bare.IsNumber();
}

// Stores 'config' under /Profiles/<name>, replacing any profile of the same name
bool SchemeRenamer::SaveProfile(wxConfigBase &cfg, const wxString &name, const SchemeConfig &config)
{
	if (!IsValidProfileName(name))
	{
		wxLogError("Invalid profile name '%s'.", name);
		return false;
	}

	const wxString profilePath = profile_path(name);
	if (cfg.HasGroup(profilePath) && !cfg.DeleteGroup(profilePath))
	{
		// Writing over the old entries still yields the new values
		wxLogWarning("SaveProfile: Failed to delete existing profile group '%s'.", profilePath);
	}

	cfg.SetPath(profilePath);
	WriteSchemeEntries(cfg, config);
	cfg.SetPath("/");
	return cfg.Flush();
}

std::optional<SchemeConfig> SchemeRenamer::LoadProfile(wxConfigBase &cfg, const wxString &name)
{
	const wxString profilePath = profile_path(name);
	if (!IsValidProfileName(name) || !cfg.HasGroup(profilePath))
	{
		return std::nullopt;
	}

	cfg.SetPath(profilePath);
	SchemeConfig config = ReadSchemeEntries(cfg);
	cfg.SetPath("/");
	return config;
}

bool SchemeRenamer::DeleteProfile(wxConfigBase &cfg, const wxString &name)
{
	const wxString profilePath = profile_path(name);
	if (!IsValidProfileName(name) || !cfg.HasGroup(profilePath))
	{
		return false;
	}
	if (!cfg.DeleteGroup(profilePath))
	{
		wxLogError("DeleteProfile: Failed to delete profile group '%s'.", profilePath);
		return false;
	}
	return cfg.Flush();
}

// Sorted names of all saved profiles
wxArrayString SchemeRenamer::GetProfileNames(wxConfigBase &cfg)
{
	wxArrayString names;
	if (!cfg.HasGroup(ProfilesRoot))
	{
		return names;
	}

	cfg.SetPath(ProfilesRoot);
	long index;
	wxString groupName;
	bool continueSearch = cfg.GetFirstGroup(groupName, index);
	while (continueSearch)
	{
		names.Add(groupName);
		continueSearch = cfg.GetNextGroup(groupName, index);
	}
	cfg.SetPath("/");
	names.Sort();
	return names;
}

void SchemeRenamer::SaveLastScheme(wxConfigBase &cfg, const SchemeConfig &config)
{
	cfg.SetPath(LastSchemeRoot);
	WriteSchemeEntries(cfg, config);
	cfg.SetPath("/");
	if (!cfg.Flush())
	{
		wxLogWarning("Could not write the last used scheme to the configuration store.");
	}
}

SchemeConfig SchemeRenamer::LoadLastScheme(wxConfigBase &cfg)
{
	if (!cfg.HasGroup(LastSchemeRoot))
	{
		return SchemeConfig();
	}
	cfg.SetPath(LastSchemeRoot);
	SchemeConfig config = ReadSchemeEntries(cfg);
	cfg.SetPath("/");
	return config;
}

// Scheme that command-line overrides are applied on top of: a named profile wins,
// then the last applied scheme when asked for, else the defaults
std::optional<SchemeConfig> SchemeRenamer::LoadBaseScheme(wxConfigBase &cfg, const wxString &profileName, bool useLastScheme)
{
	if (!profileName.IsEmpty())
	{
		std::optional<SchemeConfig> profile = LoadProfile(cfg, profileName);
		if (!profile)
		{
			wxLogError("Profile '%s' could not be found.", profileName);
		}
		return profile;
	}
	if (useLastScheme)
	{
		if (!cfg.HasGroup(LastSchemeRoot))
		{
			wxLogVerbose("No scheme has been applied yet, starting from defaults.");
		}
		return LoadLastScheme(cfg);
	}
	return SchemeConfig();
}
