#ifndef HISTORYLOG_H
#define HISTORYLOG_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <cstddef>

namespace fs = std::filesystem;

struct HistoryRecord
{
	std::string OldPath;
	std::string NewPath;
};

struct Session
{
	std::string Id;
	std::string Timestamp; // ISO-8601, local time
	std::size_t Count = 0;
	std::vector<HistoryRecord> Records;
};

// Persistent, newest-first list of rename sessions backed by a single JSON file.
// The whole file is rewritten on every mutation. Unreadable or corrupt storage
// is treated as an empty history. Not safe for concurrent writers.
class HistoryLog
{
public:
	// Uses DefaultStorePath()
	HistoryLog();
	explicit HistoryLog(fs::path storePath);

	static fs::path DefaultStorePath();

	// Records one batch. Returns the new session id, or nothing for an empty batch.
	std::optional<std::string> addSession(const std::vector<HistoryRecord> &records);
	const std::vector<Session> &getSessions() const;
	std::optional<Session> getSession(const std::string &id) const;
	// File name the given path had before the chain of recorded renames that produced it
	std::optional<std::string> traceOriginalName(const fs::path &currentPath) const;
	bool clear();

	const fs::path &getStorePath() const { return m_storePath; }
	bool lastSaveSucceeded() const { return m_lastSaveOk; }

private:
	fs::path m_storePath;
	std::vector<Session> m_sessions;
	bool m_lastSaveOk = true;

	void load();
	bool save();
	static std::string GenerateSessionId();
};

#endif // HISTORYLOG_H
