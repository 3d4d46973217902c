#include "RenameValidator.h"

#include <wx/string.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error> // For std::error_code
#include <vector>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

const std::string RenameValidator::ForbiddenChars = R"(<>:"/\|?*)";
const std::vector<std::string> RenameValidator::ReservedNames = {
	"CON", "PRN", "AUX", "NUL",
	"COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
	"LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};
const std::size_t RenameValidator::MaxFilenameLength = 255;
// Windows MAX_PATH, applied on every platform so plans stay portable
const std::size_t RenameValidator::MaxPathLength = 260;
const long RenameValidator::MaxStartNumber = 999999;
const std::size_t RenameValidator::MaxSeparatorLength = 5;

namespace
{
	const char *const WhitespaceChars = " \t\r\n\v\f";
	const char *const LockedMessage = "File is locked or you don't have permission";
	const char *const MissingMessage = "File does not exist";

	ValidationResult Ok()
	{
		return {true, ""};
	}

	ValidationResult Fail(const std::string &message)
	{
		return {false, message};
	}

	std::string Trim(const std::string &value)
	{
		const auto begin = value.find_first_not_of(WhitespaceChars);
		if (begin == std::string::npos)
		{
			return {};
		}
		const auto end = value.find_last_not_of(WhitespaceChars);
		return value.substr(begin, end - begin + 1);
	}

	// Code points in a UTF-8 string; bytes when the text is not valid UTF-8
	std::size_t CharacterCount(const std::string &text)
	{
		wxString decoded = wxString::FromUTF8(text.c_str());
		if (decoded.IsEmpty() && !text.empty())
		{
			return text.length();
		}
		return decoded.length();
	}

	bool IsLockErrno(int err)
	{
		return err == EACCES || err == EPERM || err == EBUSY
#ifdef ETXTBSY
			   || err == ETXTBSY
#endif
			;
	}
}

// Checks the base name used for every synthesized target
ValidationResult RenameValidator::ValidateBaseName(const std::string &name)
{
	if (Trim(name).empty())
	{
		return Fail("Base name cannot be empty");
	}

	// Report every forbidden character present, in the order of the forbidden set
	std::string found;
	for (char c : ForbiddenChars)
	{
		if (name.find(c) != std::string::npos)
		{
			if (!found.empty())
				found += ", ";
			found += c;
		}
	}
	if (!found.empty())
	{
		return Fail("Base name contains forbidden characters: " + found);
	}

	std::string upper = name;
	std::transform(upper.begin(), upper.end(), upper.begin(),
				   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	if (std::find(ReservedNames.begin(), ReservedNames.end(), upper) != ReservedNames.end())
	{
		return Fail("'" + name + "' is a reserved system name and cannot be used");
	}

	if (name != Trim(name))
	{
		return Fail("Base name cannot have leading or trailing spaces");
	}

	if (name.back() == '.')
	{
		return Fail("Base name cannot end with a period");
	}

	return Ok();
}

ValidationResult RenameValidator::ValidateSeparator(const std::string &separator)
{
	if (separator.empty())
	{
		return Ok(); // No separator between base name and number
	}
	if (separator.find_first_of(ForbiddenChars) != std::string::npos)
	{
		return Fail("Separator contains forbidden characters");
	}
	if (separator.length() > MaxSeparatorLength)
	{
		return Fail("Separator is too long (max: 5 characters)");
	}
	return Ok();
}

ValidationResult RenameValidator::ValidateStartNumber(long number)
{
	if (number < 0)
	{
		return Fail("Starting number must be non-negative");
	}
	if (number > MaxStartNumber)
	{
		return Fail("Starting number is too large (max: 999999)");
	}
	return Ok();
}

// Text form, as typed into an input field
ValidationResult RenameValidator::ValidateStartNumber(const std::string &text)
{
	const std::string trimmed = Trim(text);
	try
	{
		std::size_t consumed = 0;
		long long value = std::stoll(trimmed, &consumed);
		if (consumed != trimmed.size())
		{
			return Fail("Starting number must be a valid integer");
		}
		if (value < 0)
		{
			return Fail("Starting number must be non-negative");
		}
		if (value > MaxStartNumber)
		{
			return Fail("Starting number is too large (max: 999999)");
		}
		return Ok();
	}
	catch (const std::invalid_argument &)
	{
		return Fail("Starting number must be a valid integer");
	}
	catch (const std::out_of_range &)
	{
		if (!trimmed.empty() && trimmed.front() == '-')
		{
			return Fail("Starting number must be non-negative");
		}
		return Fail("Starting number is too large (max: 999999)");
	}
}

// Opening for append neither truncates nor needs write content; it fails on files
// another process holds exclusively or that we lack permission for
ValidationResult RenameValidator::ValidateFileAccess(const fs::path &file)
{
	std::error_code ec;
	if (!fs::exists(file, ec) || ec)
	{
		return Fail(MissingMessage);
	}
	if (!fs::is_regular_file(file, ec) || ec)
	{
		return Fail("Path is not a file");
	}

	errno = 0;
#ifdef _WIN32
	std::FILE *handle = _wfopen(file.c_str(), L"a");
#else
	std::FILE *handle = std::fopen(file.c_str(), "a");
#endif
	if (!handle)
	{
		const int err = errno;
		if (IsLockErrno(err))
		{
			return Fail(LockedMessage);
		}
		return Fail("Cannot access file: " + std::generic_category().message(err));
	}
	std::fclose(handle);
	return Ok();
}

// Limits are in characters, not encoded bytes
ValidationResult RenameValidator::ValidatePathLength(const fs::path &newPath)
{
	const std::size_t filenameLength = CharacterCount(newPath.filename().string());
	if (filenameLength > MaxFilenameLength)
	{
		return Fail("Filename too long (" + std::to_string(filenameLength) + " > " +
					std::to_string(MaxFilenameLength) + " chars)");
	}

	const std::size_t fullPathLength = CharacterCount(BatchRenamer::ResolvePath(newPath).string());
	if (fullPathLength > MaxPathLength)
	{
		return Fail("Full path too long (" + std::to_string(fullPathLength) + " > " +
					std::to_string(MaxPathLength) + " chars)");
	}
	return Ok();
}

bool RenameValidator::IsDirectoryWritable(const fs::path &dir)
{
	const fs::path checkDir = dir.empty() ? fs::path(".") : dir;
#ifdef _WIN32
	return _waccess(checkDir.c_str(), 2) == 0;
#else
	return access(checkDir.c_str(), W_OK) == 0;
#endif
}

// Validates a single source -> target pair right before it is committed to a plan
ValidationResult RenameValidator::ValidateRenamePair(const fs::path &source, const fs::path &target)
{
	std::error_code ec;
	if (!fs::exists(source, ec) || ec)
	{
		return Fail("Source file does not exist: " + source.filename().string());
	}

	ValidationResult access = ValidateFileAccess(source);
	if (!access.valid)
	{
		return access;
	}

	if (BatchRenamer::SamePath(source, target))
	{
		return Fail("Source and destination are the same");
	}

	ValidationResult length = ValidatePathLength(target);
	if (!length.valid)
	{
		return length;
	}

	const fs::path destDir = target.parent_path();
	if (!IsDirectoryWritable(destDir))
	{
		return Fail("Destination directory is not writable: " + destDir.string());
	}

	return Ok();
}

// A configuration that fails here is a caller bug, not a per-file problem
ValidationResult RenameValidator::ValidateConfig(const RenameConfig &config)
{
	ValidationResult result = ValidateBaseName(config.baseName);
	if (!result.valid)
		return result;
	result = ValidateSeparator(config.separator);
	if (!result.valid)
		return result;
	return ValidateStartNumber(config.startNumber);
}

// Batch pre-check used before a plan is requested
FileListReport RenameValidator::ValidateFilesList(const std::vector<fs::path> &files)
{
	FileListReport report;
	if (files.empty())
	{
		report.errorMessage = "No files selected";
		return report;
	}

	report.total = files.size();
	for (const auto &file : files)
	{
		ValidationResult access = ValidateFileAccess(file);
		if (access.valid)
		{
			report.accessible++;
			continue;
		}
		if (access.errorMessage == MissingMessage)
		{
			report.missing++;
		}
		else if (access.errorMessage == LockedMessage)
		{
			report.locked++;
		}
		report.errors.push_back({file.string(), access.errorMessage});
	}

	if (report.accessible == 0)
	{
		report.errorMessage = "No accessible files found";
		return report;
	}
	report.valid = true;
	return report;
}
