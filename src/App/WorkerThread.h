#ifndef WORKERTHREAD_H
#define WORKERTHREAD_H

#include <wx/thread.h>
#include <wx/event.h>

#include "BatchRenamer.h"
#include "HistoryLog.h"

#include <string>
#include <vector>

enum class WorkerTask
{
	CALCULATE_PREVIEW,
	PERFORM_RENAME,
	UNDO_SESSION
};

// Payload of EVT_PREVIEW_COMPLETE
struct PreviewResult
{
	std::vector<PlanEntry> plan;
	bool success = false;
	std::string errorMessage; // Set when planning threw (malformed configuration)
};

// Progress: GetInt() = 1-based index, GetExtraLong() = total, GetString() = file name
wxDECLARE_EVENT(EVT_WORKER_PROGRESS, wxThreadEvent);
// Completion events carry a heap-allocated result in their client data; the receiver deletes it.
// EVT_PREVIEW_COMPLETE -> PreviewResult, EVT_RENAME_COMPLETE -> RenameExecutionResult,
// EVT_UNDO_COMPLETE -> UndoResult
wxDECLARE_EVENT(EVT_PREVIEW_COMPLETE, wxCommandEvent);
wxDECLARE_EVENT(EVT_RENAME_COMPLETE, wxCommandEvent);
wxDECLARE_EVENT(EVT_UNDO_COMPLETE, wxCommandEvent);

class WorkerThread : public wxThread
{
public:
	// Constructor for CALCULATE_PREVIEW task
	WorkerThread(wxEvtHandler *handler, const std::vector<fs::path> &files, const RenameConfig &config);

	// Constructor for PERFORM_RENAME task. 'history' must outlive the thread.
	WorkerThread(wxEvtHandler *handler, const std::vector<PlanEntry> &plan, HistoryLog *history);

	// Constructor for UNDO_SESSION task
	WorkerThread(wxEvtHandler *handler, const Session &session);

	virtual ~WorkerThread() {};

	WorkerTask GetTask() const { return m_task; }

protected:
	virtual ExitCode Entry() override;

private:
	wxEvtHandler *m_handler;
	WorkerTask m_task;

	// CALCULATE_PREVIEW
	std::vector<fs::path> m_files;
	RenameConfig m_config;

	// PERFORM_RENAME
	std::vector<PlanEntry> m_plan;
	HistoryLog *m_history = nullptr;

	// UNDO_SESSION
	Session m_session;

	void PostProgress(std::size_t index, std::size_t total, const std::string &fileName);
	void PostResultEvent(wxEventType eventType, void *data);
	const char *TaskName() const;
};

#endif // WORKERTHREAD_H
