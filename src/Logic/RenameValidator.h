#ifndef RENAMEVALIDATOR_H
#define RENAMEVALIDATOR_H

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <cstddef>

#include "BatchRenamer.h"

namespace fs = std::filesystem;

struct ValidationResult
{
	bool valid = false;
	std::string errorMessage;
};

struct FileListReport
{
	bool valid = false;
	std::string errorMessage;
	std::size_t total = 0;
	std::size_t accessible = 0;
	std::size_t locked = 0;
	std::size_t missing = 0;
	std::vector<std::pair<std::string, std::string>> errors; // {file, reason}
};

// Stateless checks applied to naming input and rename pairs.
// Each returns the first failing rule in a fixed order.
class RenameValidator
{
public:
	static const std::string ForbiddenChars;
	static const std::vector<std::string> ReservedNames;
	static const std::size_t MaxFilenameLength;
	static const std::size_t MaxPathLength;
	static const long MaxStartNumber;
	static const std::size_t MaxSeparatorLength;

	static ValidationResult ValidateBaseName(const std::string &name);
	static ValidationResult ValidateSeparator(const std::string &separator);
	static ValidationResult ValidateStartNumber(long number);
	static ValidationResult ValidateStartNumber(const std::string &text);
	static ValidationResult ValidateFileAccess(const fs::path &file);
	static ValidationResult ValidatePathLength(const fs::path &newPath);
	static ValidationResult ValidateRenamePair(const fs::path &source, const fs::path &target);
	static ValidationResult ValidateConfig(const RenameConfig &config);
	static FileListReport ValidateFilesList(const std::vector<fs::path> &files);

private:
	static bool IsDirectoryWritable(const fs::path &dir);
};

#endif // RENAMEVALIDATOR_H
