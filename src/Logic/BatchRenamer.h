#ifndef BATCHRENAMER_H
#define BATCHRENAMER_H

#include <vector>
#include <string>
#include <filesystem>
#include <functional>
#include <optional>
#include <utility>
#include <cstddef>

namespace fs = std::filesystem;

class HistoryLog;
struct Session;

enum class SortMethod
{
	Alphabetical,
	DateModified,
	DateModifiedDesc,
	DateCreated,
	DateCreatedDesc,
	SelectionOrder
};

enum class ConflictStrategy
{
	Skip,
	AddSuffix,
	AutoIncrement,
	Prompt
};

// Auto derives the width from the file count; Fixed uses RenameConfig::paddingWidth
enum class PaddingMode
{
	Auto,
	None,
	Fixed
};

struct RenameConfig
{
	std::string baseName;
	long startNumber = 1;
	std::string separator = "_";
	SortMethod sortMethod = SortMethod::Alphabetical;
	ConflictStrategy conflictStrategy = ConflictStrategy::AutoIncrement;
	PaddingMode padding = PaddingMode::Auto;
	int paddingWidth = 0; // Fixed only
};

struct PlanEntry
{
	fs::path Source;
	fs::path Target;
	bool Valid = false;
	std::optional<std::string> Diagnostic;
};

struct RenameResult
{
	fs::path Source;
	fs::path Target;
	bool Success = false;
	std::optional<std::string> Error;
};

struct RenameExecutionResult
{
	std::vector<RenameResult> results;
	std::optional<std::string> sessionId; // Set when a history session was recorded
	bool historySaved = false;
	bool overallSuccess = false;
};

struct UndoResult
{
	std::vector<RenameResult> results;
	bool overallSuccess = false;
};

struct VerificationStats
{
	std::size_t total = 0;
	std::size_t successful = 0;
	std::size_t failed = 0;
	std::size_t skipped = 0;
	double successRate = 0.0;
	std::vector<RenameResult> failures;
};

// Receives (1-based index, total, current file name) before each file is processed
using ProgressCallback = std::function<void(std::size_t, std::size_t, const std::string &)>;

std::string ToLower(std::string s);

class BatchRenamer
{
public:
	static const char *const SkipDiagnostic;
	static const char *const PromptDiagnostic;
	static const char *const LockedDiagnostic;
	static const int AutoIncrementSearchLimit;

	static std::string FormatNumber(long number, int width);
	static bool iequals(const std::string &a, const std::string &b);
	static std::string ExtractExtension(const fs::path &file);
	static fs::path ResolvePath(const fs::path &path);
	static bool SamePath(const fs::path &a, const fs::path &b);
	static std::string CurrentTimestamp(const char *format);

	static int GetPaddingWidth(const RenameConfig &config, std::size_t totalFiles);
	static std::string SynthesizeName(const RenameConfig &config, long index, int width, const std::string &extension);

	static std::string SortMethodToString(SortMethod method);
	static SortMethod ParseSortMethod(const std::string &key);
	static std::string ConflictStrategyToString(ConflictStrategy strategy);
	static ConflictStrategy ParseConflictStrategy(const std::string &key);
	static std::string PaddingModeToString(PaddingMode mode, int width = 0);
	// Numeric keys give Fixed and store the number in 'width'
	static PaddingMode ParsePaddingMode(const std::string &key, int &width);

	static std::vector<fs::path> SortFiles(const std::vector<fs::path> &files, SortMethod method);
	static std::vector<bool> FindConflicts(const std::vector<std::pair<fs::path, fs::path>> &pairs);

	static std::vector<PlanEntry> calculateRenamePlan(const std::vector<fs::path> &files, const RenameConfig &config);
	static std::vector<PlanEntry> revalidatePlan(std::vector<PlanEntry> plan);
	static RenameExecutionResult performRename(const std::vector<PlanEntry> &plan, HistoryLog &history,
											   const ProgressCallback &progress = nullptr);
	static UndoResult performUndo(const Session &session, const ProgressCallback &progress = nullptr);
	static VerificationStats verifyResults(const std::vector<RenameResult> &results);

private:
	// Moves 'from' to 'to'. Returns the classified failure message, or nothing on success.
	static std::optional<std::string> RenameFile(const fs::path &from, const fs::path &to);
};

#endif // BATCHRENAMER_H
