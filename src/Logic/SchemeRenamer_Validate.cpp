#include "SchemeRenamer.h"

#include <wx/log.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error> // For std::error_code
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

FilenameRules SchemeRenamer::NativeFilenameRules()
{
#ifdef _WIN32
	return FilenameRules::Windows;
#else
	return FilenameRules::Posix;
#endif
}

std::string_view SchemeRenamer::InvalidFilenameChars(FilenameRules rules)
{
	if (rules == FilenameRules::Windows)
	{
		return R"(\/:*?"<>|)";
	}
	return "/";
}

bool SchemeRenamer::ContainsInvalidChars(const std::string &name, FilenameRules rules)
{
	return name.find_first_of(InvalidFilenameChars(rules).data()) != std::string::npos;
}

// True when something other than 'source' already sits at 'target'. Symlinks are not followed,
// so a dangling link still occupies its name; a target that is the source under another
// spelling (case-only rename) does not. 'ec' is set only for errors other than "not found"
bool SchemeRenamer::TargetOccupied(const fs::path &source, const fs::path &target, std::error_code &ec)
{
	const fs::file_status status = fs::symlink_status(target, ec);
	if (ec)
	{
		if (ec == std::errc::no_such_file_or_directory)
		{
			ec.clear();
		}
		return false;
	}
	if (!fs::exists(status))
	{
		return false;
	}

	std::error_code sameEc;
	return !(fs::equivalent(source, target, sameEc) && !sameEc);
}

ConflictReport SchemeRenamer::CheckConflicts(const std::vector<fs::path> &paths, const SchemeConfig &config,
											 const std::optional<fs::path> &destinationFolder)
{
	return CheckConflicts(paths, config, destinationFolder, NativeFilenameRules());
}

// Pre-flight pass over a whole batch; reads the filesystem but never modifies it
// Each entry is checked independently for duplicates, illegal characters and overwrites,
// so one entry may land in several categories
ConflictReport SchemeRenamer::CheckConflicts(const std::vector<fs::path> &paths, const SchemeConfig &config,
											 const std::optional<fs::path> &destinationFolder, FilenameRules rules)
{
	ConflictReport report;
	std::unordered_map<std::string, fs::path> firstByName; // Computed name -> first path that produced it

	for (std::size_t i = 0; i < paths.size(); ++i)
	{
		const fs::path &originalPath = paths[i];
		const std::string newName = ComposeName(originalPath, static_cast<int>(i), config);

		if (ContainsInvalidChars(newName, rules))
		{
			report.invalidChars.push_back({originalPath, newName});
		}

		// Only repeats are flagged; the first occurrence keeps its name
		if (!firstByName.emplace(newName, originalPath).second)
		{
			report.duplicates.push_back({originalPath, newName});
		}

		const fs::path targetPath = destinationFolder ? (*destinationFolder / newName)
													  : (originalPath.parent_path() / newName);
		if (originalPath.lexically_normal() != targetPath.lexically_normal())
		{
			std::error_code ec;
			const bool targetExists = TargetOccupied(originalPath, targetPath, ec);
			if (ec)
			{
				wxLogDebug("Could not check target '%s': %s", targetPath.string().c_str(), ec.message().c_str());
			}
			else if (targetExists)
			{
				report.existingFiles.push_back({originalPath, newName});
			}
		}
	}

	if (report.HasConflicts())
	{
		wxLogVerbose("Conflict check found %d duplicate(s), %d invalid name(s), %d existing target(s)",
					 static_cast<int>(report.duplicates.size()), static_cast<int>(report.invalidChars.size()),
					 static_cast<int>(report.existingFiles.size()));
	}
	return report;
}
