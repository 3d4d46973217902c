#include "WorkerThread.h"

#include <wx/log.h>
#include <wx/string.h>

#include <stdexcept>

wxDEFINE_EVENT(EVT_WORKER_PROGRESS, wxThreadEvent);
wxDEFINE_EVENT(EVT_PREVIEW_COMPLETE, wxCommandEvent);
wxDEFINE_EVENT(EVT_RENAME_COMPLETE, wxCommandEvent);
wxDEFINE_EVENT(EVT_UNDO_COMPLETE, wxCommandEvent);

// Constructor for CALCULATE_PREVIEW task
WorkerThread::WorkerThread(wxEvtHandler *handler, const std::vector<fs::path> &files, const RenameConfig &config)
    : wxThread(wxTHREAD_JOINABLE),
      m_handler(handler),
      m_task(WorkerTask::CALCULATE_PREVIEW),
      m_files(files),
      m_config(config)
{
}

// Constructor for PERFORM_RENAME task
WorkerThread::WorkerThread(wxEvtHandler *handler, const std::vector<PlanEntry> &plan, HistoryLog *history)
    : wxThread(wxTHREAD_JOINABLE),
      m_handler(handler),
      m_task(WorkerTask::PERFORM_RENAME),
      m_plan(plan),
      m_history(history)
{
}

// Constructor for UNDO_SESSION task
WorkerThread::WorkerThread(wxEvtHandler *handler, const Session &session)
    : wxThread(wxTHREAD_JOINABLE),
      m_handler(handler),
      m_task(WorkerTask::UNDO_SESSION),
      m_session(session)
{
}

const char *WorkerThread::TaskName() const
{
    switch (m_task)
    {
    case WorkerTask::CALCULATE_PREVIEW:
        return "Preview";
    case WorkerTask::PERFORM_RENAME:
        return "Rename";
    default:
        return "Undo";
    }
}

void WorkerThread::PostProgress(std::size_t index, std::size_t total, const std::string &fileName)
{
    if (!m_handler)
        return;

    wxThreadEvent event(EVT_WORKER_PROGRESS);
    event.SetInt(static_cast<int>(index));
    event.SetExtraLong(static_cast<long>(total));
    event.SetString(wxString::FromUTF8(fileName.c_str()));
    wxQueueEvent(m_handler, event.Clone());
}

// Queues a completion event; ownership of 'data' passes to the receiver
void WorkerThread::PostResultEvent(wxEventType eventType, void *data)
{
    if (m_handler)
    {
        wxCommandEvent event(eventType);
        event.SetClientData(data);
        wxQueueEvent(m_handler, event.Clone());
    }
    else if (data)
    {
        // Nobody to hand the result to
        wxLogDebug("WorkerThread::PostResultEvent: Handler is null, deleting event data.");
        if (eventType == EVT_PREVIEW_COMPLETE)
            delete static_cast<PreviewResult *>(data);
        else if (eventType == EVT_RENAME_COMPLETE)
            delete static_cast<RenameExecutionResult *>(data);
        else if (eventType == EVT_UNDO_COMPLETE)
            delete static_cast<UndoResult *>(data);
    }
}

wxThread::ExitCode WorkerThread::Entry()
{
    if (TestDestroy())
        return (ExitCode)0;

    ProgressCallback progress = [this](std::size_t index, std::size_t total, const std::string &name)
    {
        PostProgress(index, total, name);
    };

    try
    {
        if (m_task == WorkerTask::CALCULATE_PREVIEW)
        {
            PreviewResult *results = new PreviewResult();
            try
            {
                results->plan = BatchRenamer::calculateRenamePlan(m_files, m_config);
                results->success = true;
            }
            catch (const std::invalid_argument &e)
            {
                results->errorMessage = e.what();
            }
            PostResultEvent(EVT_PREVIEW_COMPLETE, results);
        }
        else if (m_task == WorkerTask::PERFORM_RENAME)
        {
            if (!m_history)
            {
                throw std::logic_error("No history log supplied for the rename batch");
            }
            RenameExecutionResult *results = new RenameExecutionResult();
            *results = BatchRenamer::performRename(m_plan, *m_history, progress);
            PostResultEvent(EVT_RENAME_COMPLETE, results);
        }
        else if (m_task == WorkerTask::UNDO_SESSION)
        {
            UndoResult *results = new UndoResult();
            *results = BatchRenamer::performUndo(m_session, progress);
            PostResultEvent(EVT_UNDO_COMPLETE, results);
        }
    }
    catch (const std::exception &e)
    {
        wxLogError("Unhandled std::exception in worker thread (%s): %s", TaskName(), e.what());
        const std::string message = "Unexpected error: " + std::string(e.what());
        if (m_task == WorkerTask::CALCULATE_PREVIEW)
        {
            PreviewResult *errRes = new PreviewResult();
            errRes->errorMessage = message;
            PostResultEvent(EVT_PREVIEW_COMPLETE, errRes);
        }
        else if (m_task == WorkerTask::PERFORM_RENAME)
        {
            RenameExecutionResult *errRes = new RenameExecutionResult();
            RenameResult failure;
            failure.Error = message;
            errRes->results.push_back(failure);
            PostResultEvent(EVT_RENAME_COMPLETE, errRes);
        }
        else
        {
            UndoResult *errRes = new UndoResult();
            RenameResult failure;
            failure.Error = message;
            errRes->results.push_back(failure);
            PostResultEvent(EVT_UNDO_COMPLETE, errRes);
        }
    }

    return (ExitCode)0;
}
