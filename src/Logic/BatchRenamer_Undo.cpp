#include "BatchRenamer.h"
#include "HistoryLog.h"

#include <wx/log.h>

#include <vector>
#include <string>
#include <filesystem>
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

// Reverts every record of a session, newest rename first. The session itself stays in the history.
UndoResult BatchRenamer::performUndo(const Session &session, const ProgressCallback &progress)
{
	UndoResult results;
	bool anyFailure = false;
	const std::size_t total = session.Records.size();

	std::size_t position = 0;
	for (auto it = session.Records.rbegin(); it != session.Records.rend(); ++it)
	{
		const fs::path currentPath(it->NewPath);
		const fs::path originalPath(it->OldPath);
		if (progress)
		{
			progress(++position, total, currentPath.filename().string());
		}

		RenameResult result;
		result.Source = currentPath;
		result.Target = originalPath;

		std::error_code existEc, targetExistEc;
		if (!fs::exists(currentPath, existEc) || existEc)
		{
			result.Error = "File not found";
		}
		else if (fs::exists(originalPath, targetExistEc))
		{
			result.Error = "Target path already exists";
		}
		else if (targetExistEc)
		{
			result.Error = "Cannot check target path: " + targetExistEc.message();
		}
		else
		{
			result.Error = RenameFile(currentPath, originalPath);
		}

		result.Success = !result.Error.has_value();
		if (!result.Success)
		{
			anyFailure = true;
		}
		results.results.push_back(result);
	}

	results.overallSuccess = !anyFailure;
	wxLogDebug("Undo of session %s finished with %s.", session.Id.c_str(), anyFailure ? "failures" : "no failures");
	return results;
}
