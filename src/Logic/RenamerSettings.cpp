#include "RenamerSettings.h"
#include "HistoryLog.h"

#include <wx/config.h>
#include <wx/log.h>
#include <wx/string.h>

#include <algorithm> // For std::sort
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{
	wxString ToWx(const std::string &value)
	{
		return wxString::FromUTF8(value.c_str());
	}

	std::string FromWx(const wxString &value)
	{
		return std::string(value.ToUTF8().data());
	}

	wxString ProfilePath(const std::string &name)
	{
		return "/Profiles/" + ToWx(name);
	}
}

RenamerSettings::RenamerSettings(wxConfigBase *cfg)
	: m_cfg(cfg ? cfg : wxConfigBase::Get())
{
	if (!m_cfg)
	{
		wxLogWarning("RenamerSettings: no configuration backend available; defaults will be used.");
	}
}

// Reads a config stored under 'prefix' ("/Inputs/" or "/Profiles/<name>/"); missing keys keep defaults
RenameConfig RenamerSettings::ReadConfig(const std::string &prefix) const
{
	RenameConfig config;
	if (!m_cfg)
		return config;

	const wxString base = ToWx(prefix);
	config.baseName = FromWx(m_cfg->Read(base + "BaseName", ToWx(config.baseName)));
	config.startNumber = m_cfg->ReadLong(base + "StartNumber", config.startNumber);
	config.separator = FromWx(m_cfg->Read(base + "Separator", ToWx(config.separator)));
	config.sortMethod = BatchRenamer::ParseSortMethod(
		FromWx(m_cfg->Read(base + "SortMethod", ToWx(BatchRenamer::SortMethodToString(config.sortMethod)))));
	config.conflictStrategy = BatchRenamer::ParseConflictStrategy(
		FromWx(m_cfg->Read(base + "ConflictStrategy", ToWx(BatchRenamer::ConflictStrategyToString(config.conflictStrategy)))));
	config.padding = BatchRenamer::ParsePaddingMode(
		FromWx(m_cfg->Read(base + "Padding", ToWx(BatchRenamer::PaddingModeToString(config.padding)))), config.paddingWidth);
	return config;
}

void RenamerSettings::WriteConfig(const std::string &prefix, const RenameConfig &config)
{
	const wxString base = ToWx(prefix);
	m_cfg->Write(base + "BaseName", ToWx(config.baseName));
	m_cfg->Write(base + "StartNumber", config.startNumber);
	m_cfg->Write(base + "Separator", ToWx(config.separator));
	m_cfg->Write(base + "SortMethod", ToWx(BatchRenamer::SortMethodToString(config.sortMethod)));
	m_cfg->Write(base + "ConflictStrategy", ToWx(BatchRenamer::ConflictStrategyToString(config.conflictStrategy)));
	m_cfg->Write(base + "Padding", ToWx(BatchRenamer::PaddingModeToString(config.padding, config.paddingWidth)));
}

// Last used naming inputs
RenameConfig RenamerSettings::loadConfig() const
{
	return ReadConfig("/Inputs/");
}

void RenamerSettings::saveConfig(const RenameConfig &config)
{
	if (!m_cfg)
		return;
	WriteConfig("/Inputs/", config);
	m_cfg->Flush();
}

fs::path RenamerSettings::getHistoryPath() const
{
	if (!m_cfg)
		return HistoryLog::DefaultStorePath();

	wxString stored = m_cfg->Read("/History/StorePath", wxEmptyString);
	if (stored.IsEmpty())
	{
		return HistoryLog::DefaultStorePath();
	}
	return fs::path(stored.ToStdWstring());
}

void RenamerSettings::setHistoryPath(const fs::path &path)
{
	if (!m_cfg)
		return;
	m_cfg->Write("/History/StorePath", wxString(path.wstring()));
	m_cfg->Flush();
}

// Names become config groups, so path separators and bare numbers are rejected
bool RenamerSettings::IsValidProfileName(const std::string &name)
{
	wxString profileName = ToWx(name);
	profileName.Trim(true).Trim(false);
	if (profileName.IsEmpty())
		return false;
	return profileName.find('/') == wxString::npos && profileName.find('\\') == wxString::npos && !profileName.IsNumber();
}

// Sorted list of saved profile names
std::vector<std::string> RenamerSettings::getProfileNames() const
{
	std::vector<std::string> names;
	if (!m_cfg)
		return names;

	const wxString oldPath = m_cfg->GetPath();
	m_cfg->SetPath("/Profiles");

	long index;
	wxString groupName;
	bool continueSearch = m_cfg->GetFirstGroup(groupName, index);
	while (continueSearch)
	{
		names.push_back(FromWx(groupName));
		continueSearch = m_cfg->GetNextGroup(groupName, index);
	}

	m_cfg->SetPath(oldPath);
	std::sort(names.begin(), names.end());
	return names;
}

// Stores 'config' under 'name', replacing any profile of the same name
bool RenamerSettings::saveProfile(const std::string &name, const RenameConfig &config)
{
	if (!IsValidProfileName(name))
	{
		wxLogWarning("Invalid profile name '%s': avoid slashes and purely numeric names.", name.c_str());
		return false;
	}
	if (!m_cfg)
		return false;

	wxString trimmed = ToWx(name);
	trimmed.Trim(true).Trim(false);
	const std::string profileName = FromWx(trimmed);
	const wxString profilePath = ProfilePath(profileName);

	// Clean slate so no stale keys survive an overwrite
	if (m_cfg->HasGroup(profilePath) && !m_cfg->DeleteGroup(profilePath))
	{
		wxLogWarning("Failed to delete existing profile group '%s'. Overwrite might leave stale keys.", profilePath);
	}

	WriteConfig("/Profiles/" + profileName + "/", config);
	m_cfg->Flush();
	wxLogDebug("Profile '%s' saved.", profileName.c_str());
	return true;
}

std::optional<RenameConfig> RenamerSettings::loadProfile(const std::string &name) const
{
	if (!m_cfg || !IsValidProfileName(name) || !m_cfg->HasGroup(ProfilePath(name)))
	{
		return std::nullopt;
	}
	return ReadConfig("/Profiles/" + name + "/");
}

// Returns whether a profile of that name existed and was removed
bool RenamerSettings::deleteProfile(const std::string &name)
{
	if (!m_cfg || !IsValidProfileName(name))
		return false;

	const wxString profilePath = ProfilePath(name);
	if (!m_cfg->HasGroup(profilePath))
		return false;

	if (!m_cfg->DeleteGroup(profilePath))
	{
		wxLogError("Failed to delete profile group '%s'.", profilePath);
		return false;
	}
	m_cfg->Flush();
	return true;
}
