#include "BatchRenamer.h"

// Diagnostics shared between the planner, the executor and result verification.
// verifyResults counts a failure as skipped when its message mentions "skip".
const char *const BatchRenamer::SkipDiagnostic = "File already exists (will be skipped)";
const char *const BatchRenamer::PromptDiagnostic = "Target already exists, resolution required";
const char *const BatchRenamer::LockedDiagnostic = "Permission denied - file may be locked or in use";

// Number of indices auto_increment tries past the conflicting one before using a timestamp
const int BatchRenamer::AutoIncrementSearchLimit = 10000;
