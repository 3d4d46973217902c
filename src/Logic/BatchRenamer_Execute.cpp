#include "BatchRenamer.h"
#include "HistoryLog.h"

#include <wx/log.h>

#include <vector>
#include <string>
#include <filesystem>
#include <optional>
#include <system_error> // For std::error_code
#include <stdexcept>	// For std::exception safety

namespace fs = std::filesystem;

namespace
{
	bool IsLockError(const std::error_code &ec)
	{
		return ec == std::errc::permission_denied ||
			   ec == std::errc::operation_not_permitted ||
			   ec == std::errc::device_or_resource_busy ||
			   ec == std::errc::text_file_busy;
	}
}

std::optional<std::string> BatchRenamer::RenameFile(const fs::path &from, const fs::path &to)
{
	try
	{
		std::error_code renameEc;
		fs::rename(from, to, renameEc);
		if (!renameEc)
		{
			return std::nullopt;
		}
		if (IsLockError(renameEc))
		{
			return std::string(LockedDiagnostic);
		}
		return "OS Error: " + renameEc.message();
	}
	catch (const fs::filesystem_error &ex)
	{
		if (IsLockError(ex.code()))
		{
			return std::string(LockedDiagnostic);
		}
		return "OS Error: " + ex.code().message();
	}
	catch (const std::exception &ex)
	{
		return "Unexpected error: " + std::string(ex.what());
	}
}

// Executes the rename plan entry by entry. A failing entry is reported and the batch continues.
RenameExecutionResult BatchRenamer::performRename(const std::vector<PlanEntry> &plan, HistoryLog &history,
												  const ProgressCallback &progress)
{
	RenameExecutionResult results;
	std::vector<HistoryRecord> completed;
	bool anyFailure = false;
	const std::size_t total = plan.size();

	for (std::size_t i = 0; i < total; ++i)
	{
		const PlanEntry &entry = plan[i];
		if (progress)
		{
			progress(i + 1, total, entry.Source.filename().string());
		}

		RenameResult result;
		result.Source = entry.Source;
		result.Target = entry.Target;

		if (!entry.Valid)
		{
			result.Error = entry.Diagnostic.value_or("Invalid plan entry");
			results.results.push_back(result);
			anyFailure = true;
			continue;
		}

		if (SamePath(entry.Source, entry.Target))
		{
			// Already named as planned
			wxLogWarning("Skipping identity rename for '%s'.", entry.Source.filename().string().c_str());
			result.Success = true;
			results.results.push_back(result);
			continue;
		}

		// Never overwrite, even if the target appeared after planning
		std::error_code targetExistEc;
		bool targetExists = fs::exists(entry.Target, targetExistEc);
		if (targetExistEc)
		{
			result.Error = "Cannot check target path " + entry.Target.filename().string() + ": " + targetExistEc.message();
			results.results.push_back(result);
			anyFailure = true;
			continue;
		}
		if (targetExists)
		{
			result.Error = "Target path already exists: " + entry.Target.filename().string();
			results.results.push_back(result);
			anyFailure = true;
			continue;
		}

		result.Error = RenameFile(entry.Source, entry.Target);
		result.Success = !result.Error.has_value();
		if (result.Success)
		{
			completed.push_back({entry.Source.string(), entry.Target.string()});
		}
		else
		{
			anyFailure = true;
		}
		results.results.push_back(result);
	}

	if (!completed.empty())
	{
		results.sessionId = history.addSession(completed);
		results.historySaved = results.sessionId.has_value() && history.lastSaveSucceeded();
	}

	results.overallSuccess = !plan.empty() && !anyFailure;
	wxLogDebug("Rename batch finished: %lu renamed, %lu entries.",
			   static_cast<unsigned long>(completed.size()), static_cast<unsigned long>(total));
	return results;
}

// Summarizes a result list. A failure whose message mentions "skip" counts as skipped.
VerificationStats BatchRenamer::verifyResults(const std::vector<RenameResult> &results)
{
	VerificationStats stats;
	stats.total = results.size();
	for (const auto &result : results)
	{
		if (result.Success)
		{
			stats.successful++;
			continue;
		}
		stats.failed++;
		stats.failures.push_back(result);
		if (result.Error && ToLower(*result.Error).find("skip") != std::string::npos)
		{
			stats.skipped++;
		}
	}
	stats.successRate = stats.total == 0 ? 0.0
										 : static_cast<double>(stats.successful) / static_cast<double>(stats.total) * 100.0;
	return stats;
}
