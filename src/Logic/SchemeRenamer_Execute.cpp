#include "SchemeRenamer.h"

#include <wx/log.h>

#include <vector>
#include <string>
#include <filesystem>
#include <system_error> // For std::error_code
#include <stdexcept>	// For std::exception safety

namespace fs = std::filesystem;

namespace
{
// Lexical comparison that ignores "." and ".." segments, used to spot no-op renames
bool same_location(const fs::path &a, const fs::path &b)
{
	return a.lexically_normal() == b.lexically_normal();
}

// Existence test that does not follow symlinks, so a dangling link still counts as present
bool path_present(const fs::path &p, std::error_code &ec)
{
	return fs::exists(fs::symlink_status(p, ec));
}
} // namespace

// Maps a filesystem error onto the outcome categories of the report
EntryOutcome SchemeRenamer::ClassifyError(const std::error_code &ec)
{
	if (ec == std::errc::no_such_file_or_directory)
	{
		return EntryOutcome::FileNotFound;
	}
	if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted || ec == std::errc::read_only_file_system)
	{
		return EntryOutcome::PermissionDenied;
	}
	if (ec == std::errc::file_exists)
	{
		return EntryOutcome::DestinationExists;
	}
	return EntryOutcome::Error;
}

// Renames 'source' to 'target', falling back to copy + delete when they live on different devices
// On a failed fallback the partial copy is removed and the source is left in place
std::error_code SchemeRenamer::MoveAcrossDevices(const fs::path &source, const fs::path &target)
{
	std::error_code ec;
	fs::rename(source, target, ec);
	if (ec != std::errc::cross_device_link)
	{
		return ec;
	}

	wxLogVerbose("'%s' and '%s' are on different devices, copying instead", source.string().c_str(), target.string().c_str());
	std::error_code copyEc;
	fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, copyEc);
	if (copyEc)
	{
		std::error_code cleanupEc;
		fs::remove_all(target, cleanupEc);
		return copyEc;
	}

	std::error_code removeEc;
	fs::remove_all(source, removeEc);
	if (removeEc)
	{
		// Keep a single copy of the data: undo the copy when the source cannot be deleted
		std::error_code cleanupEc;
		fs::remove_all(target, cleanupEc);
		if (cleanupEc)
		{
			wxLogWarning("Could not remove copied file '%s' after failed move: %s", target.string().c_str(), cleanupEc.message().c_str());
		}
		return removeEc;
	}
	return {};
}

// Executes the renames (or moves into 'destinationFolder') for a batch, strictly in input order
// A failing entry is recorded and processing continues with the next one
OutcomeReport SchemeRenamer::ApplyRename(const std::vector<BatchEntry> &entries, const SchemeConfig &config,
										 const std::optional<fs::path> &destinationFolder,
										 const std::function<bool()> &cancelRequested)
{
	OutcomeReport report;

	// The destination is prepared once, before any entry is touched
	if (destinationFolder)
	{
		std::error_code ec;
		const bool exists = fs::exists(*destinationFolder, ec);
		if (!ec && !exists)
		{
			fs::create_directories(*destinationFolder, ec);
		}
		else if (!ec && !fs::is_directory(*destinationFolder, ec) && !ec)
		{
			ec = std::make_error_code(std::errc::not_a_directory);
		}
		if (ec)
		{
			report.status = BatchStatus::Error;
			report.message = "Failed to create destination folder: " + ec.message();
			wxLogError("Failed to create destination folder '%s': %s", destinationFolder->string().c_str(), ec.message().c_str());
			return report;
		}
	}

	report.results.reserve(entries.size());
	for (const auto &entry : entries)
	{
		if (cancelRequested && cancelRequested())
		{
			report.cancelled = true;
			break;
		}

		EntryResult result;
		result.originalPath = entry.path;
		try
		{
			const std::string newName = ComposeName(entry.path, entry.index, config);
			result.newPath = destinationFolder ? (*destinationFolder / newName) : (entry.path.parent_path() / newName);

			std::error_code existEc, targetExistEc, opEc;

			bool sourceExists = path_present(entry.path, existEc);
			if (existEc && existEc != std::errc::no_such_file_or_directory)
			{
				result.outcome = ClassifyError(existEc);
				result.message = existEc.message();
			}
			else if (!sourceExists)
			{
				result.outcome = EntryOutcome::FileNotFound;
				result.message = "Source file not found (" + entry.path.string() + ")";
			}
			else if (same_location(entry.path, result.newPath))
			{
				wxLogDebug("Name of '%s' is unchanged, nothing to do", entry.path.string().c_str());
			}
			else
			{
				// rename(2) silently replaces an existing target, so collisions are caught up front
				// with the same test the conflict check uses
				const bool targetExists = TargetOccupied(entry.path, result.newPath, targetExistEc);

				if (targetExistEc)
				{
					result.outcome = ClassifyError(targetExistEc);
					result.message = targetExistEc.message();
				}
				else if (targetExists)
				{
					result.outcome = EntryOutcome::DestinationExists;
					result.message = "Target path already exists (" + result.newPath.string() + ")";
				}
				else
				{
					if (destinationFolder)
					{
						opEc = MoveAcrossDevices(entry.path, result.newPath);
					}
					else
					{
						fs::rename(entry.path, result.newPath, opEc);
					}

					if (opEc)
					{
						result.outcome = ClassifyError(opEc);
						result.message = opEc.message();
					}
				}
			}
		}
		catch (const fs::filesystem_error &ex)
		{
			result.outcome = ClassifyError(ex.code());
			result.message = ex.what();
		}
		catch (const std::exception &ex)
		{
			result.outcome = EntryOutcome::Error;
			result.message = ex.what();
		}

		if (result.outcome == EntryOutcome::Success)
		{
			++report.successCount;
			wxLogVerbose("Renamed '%s' -> '%s'", result.originalPath.string().c_str(), result.newPath.string().c_str());
		}
		else
		{
			++report.failureCount;
			wxLogWarning("Could not rename '%s': %s", result.originalPath.string().c_str(), ToLabel(result).c_str());
		}
		report.results.push_back(std::move(result));
	}

	if (report.failureCount == 0)
	{
		report.status = BatchStatus::Success;
	}
	else if (report.successCount > 0)
	{
		report.status = BatchStatus::Partial;
	}
	else
	{
		report.status = BatchStatus::Error;
	}

	report.message = "Renamed " + std::to_string(report.successCount) + " files successfully";
	if (report.failureCount > 0)
	{
		report.message += ", " + std::to_string(report.failureCount) + " failed";
	}
	if (report.cancelled)
	{
		report.message += " (cancelled, " + std::to_string(entries.size() - report.results.size()) + " not processed)";
	}
	return report;
}
