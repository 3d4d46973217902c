#include "BatchRenamer.h"
#include "RenameValidator.h"

#include <wx/log.h>
#include <wx/string.h>

#include <filesystem>
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <algorithm>    // For std::stable_sort
#include <chrono>
#include <cstdint>
#include <stdexcept>    // For std::invalid_argument
#include <system_error> // For std::error_code

#include <sys/types.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace
{
	const char *const RevalidateConflictDiagnostic = "Target conflicts with an existing file or another entry";

	// Tracks the targets already handed out in the current plan. A target is taken when an
	// earlier entry claimed it, or when some other file already lives there on disk.
	class TargetRegistry
	{
	public:
		bool isTaken(const fs::path &source, const fs::path &target) const
		{
			const fs::path resolvedTarget = BatchRenamer::ResolvePath(target);
			if (m_claimed.count(resolvedTarget.string()))
			{
				return true;
			}

			std::error_code ec;
			bool exists = fs::exists(target, ec);
			if (ec)
			{
				// Cannot prove the path is free
				return true;
			}
			return exists && resolvedTarget != BatchRenamer::ResolvePath(source);
		}

		void claim(const fs::path &target)
		{
			m_claimed.insert(BatchRenamer::ResolvePath(target).string());
		}

	private:
		std::set<std::string> m_claimed;
	};

	// Modification time in nanoseconds since the file clock epoch; unreadable files sort first
	std::int64_t ModifiedKey(const fs::path &file)
	{
		std::error_code ec;
		auto time = fs::last_write_time(file, ec);
		if (ec)
		{
			return INT64_MIN;
		}
		return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
	}

	// Creation time on Windows, inode change time elsewhere (the closest POSIX stat offers)
	std::int64_t CreatedKey(const fs::path &file)
	{
#ifdef _WIN32
		struct _stat64 st;
		if (_wstat64(file.c_str(), &st) != 0)
		{
			return INT64_MIN;
		}
		return static_cast<std::int64_t>(st.st_ctime) * 1000000000LL;
#else
		struct stat st;
		if (::stat(file.c_str(), &st) != 0)
		{
			return INT64_MIN;
		}
#if defined(__APPLE__)
		return static_cast<std::int64_t>(st.st_ctimespec.tv_sec) * 1000000000LL + st.st_ctimespec.tv_nsec;
#elif defined(__linux__)
		return static_cast<std::int64_t>(st.st_ctim.tv_sec) * 1000000000LL + st.st_ctim.tv_nsec;
#else
		return static_cast<std::int64_t>(st.st_ctime) * 1000000000LL;
#endif
#endif
	}

	// Lowercased file name; non-ASCII letters fold too. Names that are not valid UTF-8 are taken byte-wise.
	wxString SortKey(const fs::path &file)
	{
		const std::string name = file.filename().string();
		wxString key = wxString::FromUTF8(name.c_str());
		if (key.IsEmpty() && !name.empty())
		{
			key = wxString::From8BitData(name.c_str());
		}
		return key.Lower();
	}

	std::vector<fs::path> SortByTime(const std::vector<fs::path> &files, std::int64_t (*keyOf)(const fs::path &), bool descending)
	{
		// Stat every file once; the comparator only looks at cached keys
		std::vector<std::pair<std::int64_t, fs::path>> keyed;
		keyed.reserve(files.size());
		for (const auto &file : files)
		{
			keyed.emplace_back(keyOf(file), file);
		}
		std::stable_sort(keyed.begin(), keyed.end(),
						 [descending](const auto &a, const auto &b)
						 {
							 return descending ? (a.first > b.first) : (a.first < b.first);
						 });

		std::vector<fs::path> sorted;
		sorted.reserve(keyed.size());
		for (auto &pair : keyed)
		{
			sorted.push_back(std::move(pair.second));
		}
		return sorted;
	}

	// add_suffix: stem_copy.ext, stem_copy2.ext, stem_copy3.ext, ...
	fs::path ResolveWithSuffix(const fs::path &source, const fs::path &target, const TargetRegistry &registry)
	{
		const std::string extension = BatchRenamer::ExtractExtension(target);
		const std::string name = target.filename().string();
		const std::string stem = name.substr(0, name.size() - extension.size());
		const fs::path parent = target.parent_path();

		for (long counter = 1;; ++counter)
		{
			std::string candidateName = stem + "_copy" + (counter > 1 ? std::to_string(counter) : "") + extension;
			fs::path candidate = parent / candidateName;
			if (!registry.isTaken(source, candidate))
			{
				return candidate;
			}
		}
	}

	// auto_increment: first free index at or after the conflicting one, then a timestamped name
	fs::path ResolveWithIncrement(const fs::path &source, const fs::path &target, long index,
								  const RenameConfig &config, int width, const TargetRegistry &registry)
	{
		const std::string extension = BatchRenamer::ExtractExtension(target);
		const fs::path parent = target.parent_path();

		for (long searchIndex = index; searchIndex <= index + BatchRenamer::AutoIncrementSearchLimit; ++searchIndex)
		{
			fs::path candidate = parent / BatchRenamer::SynthesizeName(config, searchIndex, width, extension);
			if (!registry.isTaken(source, candidate))
			{
				return candidate;
			}
		}

		wxLogWarning("No free index found within %d attempts for '%s'; falling back to a timestamped name.",
					 BatchRenamer::AutoIncrementSearchLimit, source.filename().string().c_str());
		fs::path fallback = parent / (config.baseName + config.separator + BatchRenamer::CurrentTimestamp("%Y%m%d_%H%M%S") + extension);
		if (registry.isTaken(source, fallback))
		{
			return ResolveWithSuffix(source, fallback, registry);
		}
		return fallback;
	}

	// Validates the entry's final pair and reserves its target for the rest of the plan
	void FinalizeEntry(PlanEntry &entry, TargetRegistry &registry)
	{
		std::error_code ec;
		if (BatchRenamer::SamePath(entry.Source, entry.Target) && fs::exists(entry.Source, ec) && !ec)
		{
			// Already carries its target name; the executor treats it as a no-op
			entry.Valid = true;
			entry.Diagnostic.reset();
			registry.claim(entry.Target);
			return;
		}

		ValidationResult check = RenameValidator::ValidateRenamePair(entry.Source, entry.Target);
		entry.Valid = check.valid;
		if (check.valid)
		{
			entry.Diagnostic.reset();
			registry.claim(entry.Target);
		}
		else
		{
			entry.Diagnostic = check.errorMessage;
		}
	}
}

// Orders the input according to 'method'. Unknown or unsortable data keeps a stable order.
std::vector<fs::path> BatchRenamer::SortFiles(const std::vector<fs::path> &files, SortMethod method)
{
	switch (method)
	{
	case SortMethod::SelectionOrder:
		return files;
	case SortMethod::DateModified:
		return SortByTime(files, &ModifiedKey, false);
	case SortMethod::DateModifiedDesc:
		return SortByTime(files, &ModifiedKey, true);
	case SortMethod::DateCreated:
		return SortByTime(files, &CreatedKey, false);
	case SortMethod::DateCreatedDesc:
		return SortByTime(files, &CreatedKey, true);
	case SortMethod::Alphabetical:
	default:
		break;
	}

	// Case-insensitive by file name; lowercase keys computed once
	std::vector<std::pair<wxString, fs::path>> keyed;
	keyed.reserve(files.size());
	for (const auto &file : files)
	{
		keyed.emplace_back(SortKey(file), file);
	}
	std::stable_sort(keyed.begin(), keyed.end(),
					 [](const auto &a, const auto &b) { return a.first.Cmp(b.first) < 0; });

	std::vector<fs::path> sorted;
	sorted.reserve(keyed.size());
	for (auto &pair : keyed)
	{
		sorted.push_back(std::move(pair.second));
	}
	return sorted;
}

// Flags each (source, target) pair whose target is occupied on disk by another file or was
// already used by an earlier pair. The first pair to use a target keeps it.
std::vector<bool> BatchRenamer::FindConflicts(const std::vector<std::pair<fs::path, fs::path>> &pairs)
{
	TargetRegistry registry;
	std::vector<bool> conflicts;
	conflicts.reserve(pairs.size());
	for (const auto &pair : pairs)
	{
		bool taken = registry.isTaken(pair.first, pair.second);
		if (!taken)
		{
			registry.claim(pair.second);
		}
		conflicts.push_back(taken);
	}
	return conflicts;
}

// Builds the rename plan: sort, number, synthesize, detect and resolve conflicts, validate.
// Never touches the filesystem beyond reading it, so repeated calls give the same plan.
std::vector<PlanEntry> BatchRenamer::calculateRenamePlan(const std::vector<fs::path> &files, const RenameConfig &config)
{
	ValidationResult configCheck = RenameValidator::ValidateConfig(config);
	if (!configCheck.valid)
	{
		throw std::invalid_argument("Invalid rename configuration: " + configCheck.errorMessage);
	}

	std::vector<PlanEntry> plan;
	if (files.empty())
	{
		return plan; // Nothing to rename is not an error
	}

	const std::vector<fs::path> sortedFiles = SortFiles(files, config.sortMethod);
	const int width = GetPaddingWidth(config, sortedFiles.size());

	TargetRegistry registry;
	long index = config.startNumber;
	std::size_t invalidCount = 0;
	plan.reserve(sortedFiles.size());

	for (const auto &source : sortedFiles)
	{
		PlanEntry entry;
		entry.Source = source;
		entry.Target = source.parent_path() / SynthesizeName(config, index, width, ExtractExtension(source));

		bool unresolved = false;
		if (registry.isTaken(source, entry.Target))
		{
			switch (config.conflictStrategy)
			{
			case ConflictStrategy::Skip:
				entry.Valid = false;
				entry.Diagnostic = std::string(SkipDiagnostic);
				unresolved = true;
				break;
			case ConflictStrategy::AddSuffix:
				entry.Target = ResolveWithSuffix(source, entry.Target, registry);
				break;
			case ConflictStrategy::AutoIncrement:
				entry.Target = ResolveWithIncrement(source, entry.Target, index, config, width, registry);
				break;
			case ConflictStrategy::Prompt:
			default:
				// Left for the caller to resolve, then revalidatePlan
				entry.Valid = false;
				entry.Diagnostic = std::string(PromptDiagnostic);
				unresolved = true;
				break;
			}
		}

		if (!unresolved)
		{
			FinalizeEntry(entry, registry);
		}
		if (!entry.Valid)
		{
			invalidCount++;
		}

		plan.push_back(std::move(entry));
		index++;
	}

	wxLogDebug("Calculated %lu rename entries (%lu invalid).",
			   static_cast<unsigned long>(plan.size()), static_cast<unsigned long>(invalidCount));
	return plan;
}

// Re-checks a plan the caller edited (e.g. after resolving prompted conflicts by hand).
// Conflicts are reported, never resolved.
std::vector<PlanEntry> BatchRenamer::revalidatePlan(std::vector<PlanEntry> plan)
{
	TargetRegistry registry;
	for (auto &entry : plan)
	{
		if (registry.isTaken(entry.Source, entry.Target))
		{
			entry.Valid = false;
			entry.Diagnostic = std::string(RevalidateConflictDiagnostic);
			continue;
		}
		FinalizeEntry(entry, registry);
	}
	return plan;
}
