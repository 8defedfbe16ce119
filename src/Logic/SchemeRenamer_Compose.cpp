#include "SchemeRenamer.h"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Splices the formatted sequence number into 'stem' at the configured side and reattaches 'extension'
std::string SchemeRenamer::AddSequentialNumber(const std::string &stem, const std::string &extension, int index, const NumberOptions &options)
{
	const std::string number = FormatNumber(index, options.padding, options.start, options.step);
	if (options.position == NumberPosition::Prefix)
	{
		return number + options.separator + stem + extension;
	}
	return stem + options.separator + number + extension;
}

std::string SchemeRenamer::AddSequentialNumber(const std::string &filename, int index, const NumberOptions &options)
{
	const NameParts parts = SplitExtension(filename);
	return AddSequentialNumber(parts.stem, parts.extension, index, options);
}

// Builds the new filename for one batch entry. The original extension is carried through
// every stage untouched; only the stem is rewritten, in this order:
//   1. full replacement by newName, or prefix + stem + suffix
//   2. literal find/replace
//   3. case transformation
//   4. sequential numbering
// Pure: the path does not need to exist.
std::string SchemeRenamer::ComposeName(const fs::path &originalPath, int index, const SchemeConfig &config)
{
	const NameParts original = SplitExtension(originalPath.filename().string());
	const std::string &extension = original.extension;

	std::string stem;
	if (config.replaceName)
	{
		stem = config.newName;
	}
	else
	{
		stem = config.prefix + original.stem + config.suffix;
	}

	if (!config.find.empty())
	{
		stem = PerformFindReplace(stem, config.find, config.replace);
	}

	if (config.caseOption != CaseOption::Preserve)
	{
		stem = TransformCase(stem, config.caseOption);
	}

	if (config.useNumbering)
	{
		return AddSequentialNumber(stem, extension, index, config.numberOptions);
	}
	return stem + extension;
}

// Previews the first 'count' files of a batch as (original filename, new filename) pairs
std::vector<PreviewPair> SchemeRenamer::GetExamplePreviews(const std::vector<fs::path> &paths, const SchemeConfig &config, std::size_t count)
{
	std::vector<PreviewPair> previews;
	const std::size_t shown = std::min(paths.size(), count);
	previews.reserve(shown);
	for (std::size_t i = 0; i < shown; ++i)
	{
		previews.emplace_back(paths[i].filename().string(), ComposeName(paths[i], static_cast<int>(i), config));
	}
	return previews;
}
