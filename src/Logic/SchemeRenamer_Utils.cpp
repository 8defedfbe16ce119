#include "SchemeRenamer.h"

#include <algorithm>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace
{
std::string to_lower(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(),
				   [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; });
	return s;
}
} // namespace

// Computes start + index * step and left-pads it with zeros to at least 'padding' digits
// Wider numbers are kept whole; a negative value keeps its sign ahead of the padding
std::string SchemeRenamer::FormatNumber(int index, unsigned int padding, int start, int step)
{
	const long long number = static_cast<long long>(start) + static_cast<long long>(index) * step;
	if (padding < 1)
	{
		padding = 1;
	}
	std::ostringstream ss;
	if (number < 0)
	{
		ss << '-' << std::setw(padding > 1 ? padding - 1 : 1) << std::setfill('0') << -number;
	}
	else
	{
		ss << std::setw(padding) << std::setfill('0') << number;
	}
	return ss.str();
}

// Splits a filename at its last dot; leading dots (".bashrc") never start an extension
NameParts SchemeRenamer::SplitExtension(const std::string &filename)
{
	NameParts parts;
	const std::size_t firstNonDot = filename.find_first_not_of('.');
	const std::size_t lastDot = filename.find_last_of('.');
	if (firstNonDot == std::string::npos || lastDot == std::string::npos || lastDot < firstNonDot)
	{
		parts.stem = filename;
		return parts;
	}
	parts.stem = filename.substr(0, lastDot);
	parts.extension = filename.substr(lastDot);
	return parts;
}

// Replaces every literal occurrence of 'find' in 'subject' with 'replace', scanning left to right
std::string SchemeRenamer::PerformFindReplace(std::string subject, const std::string &find, const std::string &replace)
{
	if (find.empty() || subject.empty())
	{
		return subject;
	}

	std::size_t pos = 0;
	while ((pos = subject.find(find, pos)) != std::string::npos)
	{
		subject.replace(pos, find.length(), replace);
		// Skip the inserted text so a replacement containing 'find' cannot loop forever
		pos += replace.length();
	}
	return subject;
}

std::vector<BatchEntry> SchemeRenamer::MakeEntries(const std::vector<fs::path> &paths)
{
	std::vector<BatchEntry> entries;
	entries.reserve(paths.size());
	int index = 0;
	for (const auto &path : paths)
	{
		entries.push_back({path, index++});
	}
	return entries;
}

std::string SchemeRenamer::ToString(CaseOption option)
{
	switch (option)
	{
	case CaseOption::Lower:
		return "lower";
	case CaseOption::Upper:
		return "upper";
	case CaseOption::Title:
		return "title";
	case CaseOption::Preserve:
	default:
		return "preserve";
	}
}

std::string SchemeRenamer::ToString(NumberPosition position)
{
	return position == NumberPosition::Prefix ? "prefix" : "suffix";
}

std::string SchemeRenamer::ToString(BatchStatus status)
{
	switch (status)
	{
	case BatchStatus::Partial:
		return "partial";
	case BatchStatus::Error:
		return "error";
	case BatchStatus::Success:
	default:
		return "success";
	}
}

// Human-readable outcome for one entry of an Outcome Report
std::string SchemeRenamer::ToLabel(const EntryResult &result)
{
	switch (result.outcome)
	{
	case EntryOutcome::Success:
		return "success";
	case EntryOutcome::FileNotFound:
		return "File not found";
	case EntryOutcome::PermissionDenied:
		return "Permission denied";
	case EntryOutcome::DestinationExists:
		return "Destination file already exists";
	case EntryOutcome::Error:
	default:
		return "Error: " + result.message;
	}
}

// "<old> -> <new>", followed by the outcome label for anything but a success
std::string SchemeRenamer::FormatOutcomeLine(const EntryResult &result)
{
	std::string line = result.originalPath.string() + " -> " + result.newPath.string();
	if (result.outcome != EntryOutcome::Success)
	{
		line += ": " + ToLabel(result);
	}
	return line;
}

std::optional<CaseOption> SchemeRenamer::ParseCaseOption(const std::string &name)
{
	const std::string key = to_lower(name);
	if (key == "preserve")
		return CaseOption::Preserve;
	if (key == "lower")
		return CaseOption::Lower;
	if (key == "upper")
		return CaseOption::Upper;
	if (key == "title" || key == "title case")
		return CaseOption::Title;
	return std::nullopt;
}

std::optional<NumberPosition> SchemeRenamer::ParseNumberPosition(const std::string &name)
{
	const std::string key = to_lower(name);
	if (key == "prefix")
		return NumberPosition::Prefix;
	if (key == "suffix")
		return NumberPosition::Suffix;
	return std::nullopt;
}
