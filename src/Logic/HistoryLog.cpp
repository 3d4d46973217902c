#include "HistoryLog.h"
#include "BatchRenamer.h"

#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/string.h>

#include <json/json.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <system_error> // For std::error_code
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace
{
	Json::Value SessionToJson(const Session &session)
	{
		Json::Value files(Json::arrayValue);
		for (const auto &record : session.Records)
		{
			Json::Value entry(Json::objectValue);
			entry["old_path"] = record.OldPath;
			entry["new_path"] = record.NewPath;
			files.append(entry);
		}

		Json::Value obj(Json::objectValue);
		obj["id"] = session.Id;
		obj["timestamp"] = session.Timestamp;
		obj["count"] = static_cast<Json::UInt64>(session.Count);
		obj["files"] = files;
		return obj;
	}

	// Returns nothing for entries that do not look like a session written by this class
	std::optional<Session> SessionFromJson(const Json::Value &obj)
	{
		if (!obj.isObject() || !obj["id"].isString() || !obj["files"].isArray())
		{
			return std::nullopt;
		}

		Session session;
		session.Id = obj["id"].asString();
		session.Timestamp = obj["timestamp"].isString() ? obj["timestamp"].asString() : std::string();
		for (const auto &entry : obj["files"])
		{
			if (!entry.isObject() || !entry["old_path"].isString() || !entry["new_path"].isString())
			{
				return std::nullopt;
			}
			session.Records.push_back({entry["old_path"].asString(), entry["new_path"].asString()});
		}
		session.Count = obj["count"].isUInt64() ? static_cast<std::size_t>(obj["count"].asUInt64())
												: session.Records.size();
		return session;
	}
}

HistoryLog::HistoryLog()
	: HistoryLog(DefaultStorePath())
{
}

HistoryLog::HistoryLog(fs::path storePath)
	: m_storePath(std::move(storePath))
{
	load();
}

// Gets the path to the history store in the user's app data directory
fs::path HistoryLog::DefaultStorePath()
{
	wxString stdPath = wxStandardPaths::Get().GetUserDataDir();
	if (stdPath.IsEmpty())
	{
		return fs::current_path() / "rename_history.json";
	}
	return fs::path(stdPath.ToStdWstring()) / "rename_history.json";
}

void HistoryLog::load()
{
	m_sessions.clear();

	std::error_code ec;
	if (!fs::exists(m_storePath, ec) || ec)
	{
		return; // First run; nothing recorded yet
	}

	std::ifstream stream(m_storePath, std::ios::binary);
	if (!stream.is_open())
	{
		wxLogWarning("History store '%s' could not be opened; starting with an empty history.", m_storePath.string().c_str());
		return;
	}

	Json::CharReaderBuilder reader;
	Json::Value root;
	std::string errors;
	if (!Json::parseFromStream(reader, stream, &root, &errors))
	{
		wxLogWarning("History store '%s' is corrupt (%s); starting with an empty history.", m_storePath.string().c_str(), errors.c_str());
		return;
	}

	if (!root.isObject() || !root["sessions"].isArray())
	{
		wxLogWarning("History store '%s' has no session list; starting with an empty history.", m_storePath.string().c_str());
		return;
	}

	for (const auto &obj : root["sessions"])
	{
		if (auto session = SessionFromJson(obj))
		{
			m_sessions.push_back(std::move(*session));
		}
		else
		{
			wxLogWarning("Ignoring malformed session in history store '%s'.", m_storePath.string().c_str());
		}
	}
}

// Rewrites the whole store. A failed write is logged and leaves the in-memory state untouched.
bool HistoryLog::save()
{
	Json::Value sessions(Json::arrayValue);
	for (const auto &session : m_sessions)
	{
		sessions.append(SessionToJson(session));
	}
	Json::Value root(Json::objectValue);
	root["sessions"] = sessions;

	std::error_code ec;
	if (m_storePath.has_parent_path() && !fs::exists(m_storePath.parent_path(), ec))
	{
		fs::create_directories(m_storePath.parent_path(), ec);
		if (ec)
		{
			wxLogError("Failed to create history directory '%s': %s", m_storePath.parent_path().string().c_str(), ec.message().c_str());
			m_lastSaveOk = false;
			return false;
		}
	}

	std::ofstream stream(m_storePath, std::ios::binary | std::ios::trunc);
	if (!stream.is_open())
	{
		wxLogError("Failed to save history: cannot open '%s' for writing.", m_storePath.string().c_str());
		m_lastSaveOk = false;
		return false;
	}

	Json::StreamWriterBuilder builder;
	builder["indentation"] = "    ";
	builder["emitUTF8"] = true;
	std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
	writer->write(root, &stream);
	stream << '\n';
	stream.close();

	m_lastSaveOk = !stream.fail();
	if (!m_lastSaveOk)
	{
		wxLogError("Failed to save history: write to '%s' did not complete.", m_storePath.string().c_str());
	}
	return m_lastSaveOk;
}

// Random (version 4) UUID rendered in the usual 8-4-4-4-12 form
std::string HistoryLog::GenerateSessionId()
{
	static std::mt19937_64 rng(std::random_device{}());
	std::uniform_int_distribution<std::uint64_t> dist;
	std::uint64_t high = dist(rng);
	std::uint64_t low = dist(rng);

	high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
	low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // RFC 4122 variant

	std::ostringstream oss;
	oss << std::hex << std::setfill('0')
		<< std::setw(8) << (high >> 32) << '-'
		<< std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
		<< std::setw(4) << (high & 0xFFFF) << '-'
		<< std::setw(4) << (low >> 48) << '-'
		<< std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
	return oss.str();
}

std::optional<std::string> HistoryLog::addSession(const std::vector<HistoryRecord> &records)
{
	if (records.empty())
	{
		return std::nullopt;
	}

	Session session;
	session.Id = GenerateSessionId();
	session.Timestamp = BatchRenamer::CurrentTimestamp("%Y-%m-%dT%H:%M:%S");
	session.Count = records.size();
	session.Records = records;

	// Newest first
	m_sessions.insert(m_sessions.begin(), session);
	save();

	wxLogDebug("Recorded rename session %s with %lu file(s).", session.Id.c_str(), static_cast<unsigned long>(session.Count));
	return session.Id;
}

const std::vector<Session> &HistoryLog::getSessions() const
{
	return m_sessions;
}

std::optional<Session> HistoryLog::getSession(const std::string &id) const
{
	for (const auto &session : m_sessions)
	{
		if (session.Id == id)
		{
			return session;
		}
	}
	return std::nullopt;
}

// Walks the history from the newest session to the oldest. Each time a record's new path
// matches the cursor, the cursor moves to that record's old path, so A->B followed later
// by B->C traces C back to A. Plain linear rescan; no index is kept.
std::optional<std::string> HistoryLog::traceOriginalName(const fs::path &currentPath) const
{
	fs::path cursor = BatchRenamer::ResolvePath(currentPath);
	bool found = false;

	for (const auto &session : m_sessions)
	{
		for (const auto &record : session.Records)
		{
			if (BatchRenamer::ResolvePath(record.NewPath) == cursor)
			{
				cursor = BatchRenamer::ResolvePath(record.OldPath);
				found = true;
			}
		}
	}

	if (!found)
	{
		return std::nullopt;
	}
	return cursor.filename().string();
}

bool HistoryLog::clear()
{
	m_sessions.clear();
	return save();
}
