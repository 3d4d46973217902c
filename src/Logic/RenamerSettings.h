#ifndef RENAMERSETTINGS_H
#define RENAMERSETTINGS_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "BatchRenamer.h"

class wxConfigBase;

namespace fs = std::filesystem;

// Persists the default RenameConfig, the history store location and named profiles
// in a wxConfigBase. The backend is borrowed, never owned.
class RenamerSettings
{
public:
	// nullptr selects the process-wide wxConfigBase::Get()
	explicit RenamerSettings(wxConfigBase *cfg = nullptr);

	RenameConfig loadConfig() const;
	void saveConfig(const RenameConfig &config);

	fs::path getHistoryPath() const;
	void setHistoryPath(const fs::path &path);

	static bool IsValidProfileName(const std::string &name);
	std::vector<std::string> getProfileNames() const;
	bool saveProfile(const std::string &name, const RenameConfig &config);
	std::optional<RenameConfig> loadProfile(const std::string &name) const;
	bool deleteProfile(const std::string &name);

private:
	wxConfigBase *m_cfg;

	RenameConfig ReadConfig(const std::string &prefix) const;
	void WriteConfig(const std::string &prefix, const RenameConfig &config);
};

#endif // RENAMERSETTINGS_H
