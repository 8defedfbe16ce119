#ifndef SCHEMERENAMER_H
#define SCHEMERENAMER_H

#include <vector>
#include <string>
#include <string_view>
#include <filesystem>
#include <functional>
#include <optional>
#include <utility>
#include <system_error>
#include <cstddef>

#include <wx/string.h>
#include <wx/arrstr.h>

class wxConfigBase;

namespace fs = std::filesystem;

enum class CaseOption
{
	Preserve,
	Lower,
	Upper,
	Title
};

enum class NumberPosition
{
	Prefix,
	Suffix
};

// Which characters a target filesystem refuses in a filename
enum class FilenameRules
{
	Posix,
	Windows
};

struct NumberOptions
{
	unsigned int padding = 2;
	int start = 1;
	int step = 1;
	NumberPosition position = NumberPosition::Suffix;
	std::string separator = "_";
};

// The full set of renaming options for one batch run
struct SchemeConfig
{
	bool replaceName = false;
	std::string newName;
	std::string prefix;
	std::string suffix;
	std::string find;
	std::string replace;
	CaseOption caseOption = CaseOption::Preserve;
	bool useNumbering = false;
	NumberOptions numberOptions;
};

struct BatchEntry
{
	fs::path path;
	int index = 0;
};

// Filename split into stem and extension (extension keeps its leading dot)
struct NameParts
{
	std::string stem;
	std::string extension;
};

struct ConflictEntry
{
	fs::path originalPath;
	std::string newName;
};

struct ConflictReport
{
	std::vector<ConflictEntry> duplicates;
	std::vector<ConflictEntry> invalidChars;
	std::vector<ConflictEntry> existingFiles;

	bool HasConflicts() const { return TotalIssues() > 0; }
	std::size_t TotalIssues() const { return duplicates.size() + invalidChars.size() + existingFiles.size(); }
};

enum class EntryOutcome
{
	Success,
	FileNotFound,
	PermissionDenied,
	DestinationExists,
	Error
};

struct EntryResult
{
	fs::path originalPath;
	fs::path newPath;
	EntryOutcome outcome = EntryOutcome::Success;
	std::string message; // Underlying error text, empty on success
};

enum class BatchStatus
{
	Success,
	Partial,
	Error
};

struct OutcomeReport
{
	BatchStatus status = BatchStatus::Success;
	std::vector<EntryResult> results;
	std::string message;
	std::size_t successCount = 0;
	std::size_t failureCount = 0;
	bool cancelled = false;
};

using PreviewPair = std::pair<std::string, std::string>;

class SchemeRenamer
{
private:
	static EntryOutcome ClassifyError(const std::error_code &ec);
	static std::error_code MoveAcrossDevices(const fs::path &source, const fs::path &target);
	static bool TargetOccupied(const fs::path &source, const fs::path &target, std::error_code &ec);
	static void WriteSchemeEntries(wxConfigBase &cfg, const SchemeConfig &config);
	static SchemeConfig ReadSchemeEntries(wxConfigBase &cfg);

public:
	// Case Transformer
	static std::string ImprovedTitleCase(const std::string &text);
	static std::string TransformCase(const std::string &stem, CaseOption option);

	// Sequence Numberer
	static std::string FormatNumber(int index, unsigned int padding, int start, int step);
	static std::string AddSequentialNumber(const std::string &stem, const std::string &extension, int index, const NumberOptions &options);
	static std::string AddSequentialNumber(const std::string &filename, int index, const NumberOptions &options);

	// Name Composer
	static NameParts SplitExtension(const std::string &filename);
	static std::string PerformFindReplace(std::string subject, const std::string &find, const std::string &replace);
	static std::string ComposeName(const fs::path &originalPath, int index, const SchemeConfig &config);
	static std::vector<PreviewPair> GetExamplePreviews(const std::vector<fs::path> &paths, const SchemeConfig &config, std::size_t count = 5);

	// Conflict Validator
	static FilenameRules NativeFilenameRules();
	static std::string_view InvalidFilenameChars(FilenameRules rules);
	static bool ContainsInvalidChars(const std::string &name, FilenameRules rules);
	static ConflictReport CheckConflicts(const std::vector<fs::path> &paths, const SchemeConfig &config,
										 const std::optional<fs::path> &destinationFolder = std::nullopt);
	static ConflictReport CheckConflicts(const std::vector<fs::path> &paths, const SchemeConfig &config,
										 const std::optional<fs::path> &destinationFolder, FilenameRules rules);

	// Batch Applier
	static OutcomeReport ApplyRename(const std::vector<BatchEntry> &entries, const SchemeConfig &config,
									 const std::optional<fs::path> &destinationFolder = std::nullopt,
									 const std::function<bool()> &cancelRequested = nullptr);
	static std::vector<BatchEntry> MakeEntries(const std::vector<fs::path> &paths);

	// Reporting helpers
	static std::string ToString(CaseOption option);
	static std::string ToString(NumberPosition position);
	static std::string ToString(BatchStatus status);
	static std::string ToLabel(const EntryResult &result);
	static std::string FormatOutcomeLine(const EntryResult &result);
	static std::optional<CaseOption> ParseCaseOption(const std::string &name);
	static std::optional<NumberPosition> ParseNumberPosition(const std::string &name);

	// Scheme persistence through wxConfigBase
	static bool IsValidProfileName(const wxString &name);
	static bool SaveProfile(wxConfigBase &cfg, const wxString &name, const SchemeConfig &config);
	static std::optional<SchemeConfig> LoadProfile(wxConfigBase &cfg, const wxString &name);
	static bool DeleteProfile(wxConfigBase &cfg, const wxString &name);
	static wxArrayString GetProfileNames(wxConfigBase &cfg);
	static void SaveLastScheme(wxConfigBase &cfg, const SchemeConfig &config);
	static SchemeConfig LoadLastScheme(wxConfigBase &cfg);
	static std::optional<SchemeConfig> LoadBaseScheme(wxConfigBase &cfg, const wxString &profileName, bool useLastScheme);

	// Rename history log
	static fs::path GetHistoryLogPath();
	static bool WriteHistoryLog(const OutcomeReport &report, const std::string &operationType, const fs::path &logPath);

	static const std::vector<std::string> TitleCaseSmallWords;
};

#endif // SCHEMERENAMER_H
