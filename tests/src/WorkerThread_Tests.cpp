#include "TestFixtures.h"
#include "../../src/App/WorkerThread.h"

#include <wx/event.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class WorkerThreadTest : public BatchRenamerFilesystemTest
{
protected:
    wxEvtHandler handler;
    std::vector<int> progressIndexes;
    std::vector<std::string> progressNames;
    long progressTotal = 0;
    std::unique_ptr<PreviewResult> preview;
    std::unique_ptr<RenameExecutionResult> rename;
    std::unique_ptr<UndoResult> undo;

    void SetUp() override
    {
        BatchRenamerFilesystemTest::SetUp();
        handler.Bind(EVT_WORKER_PROGRESS, [this](wxThreadEvent &event)
                     {
                         progressIndexes.push_back(event.GetInt());
                         progressTotal = event.GetExtraLong();
                         progressNames.push_back(event.GetString().ToStdString());
                     });
        handler.Bind(EVT_PREVIEW_COMPLETE, [this](wxCommandEvent &event)
                     { preview.reset(static_cast<PreviewResult *>(event.GetClientData())); });
        handler.Bind(EVT_RENAME_COMPLETE, [this](wxCommandEvent &event)
                     { rename.reset(static_cast<RenameExecutionResult *>(event.GetClientData())); });
        handler.Bind(EVT_UNDO_COMPLETE, [this](wxCommandEvent &event)
                     { undo.reset(static_cast<UndoResult *>(event.GetClientData())); });
    }

    // Runs the thread to completion, then delivers everything it queued
    void RunToCompletion(WorkerThread &thread)
    {
        ASSERT_EQ(thread.Run(), wxTHREAD_NO_ERROR);
        thread.Wait();
        while (handler.HasPendingEvents())
        {
            handler.ProcessPendingEvents();
        }
    }
};

TEST_F(WorkerThreadTest, PreviewDeliversPlan)
{
    CreateDummyFile(tempTestDir / "b.txt");
    CreateDummyFile(tempTestDir / "a.txt");
    RenameConfig config;
    config.baseName = "note";

    WorkerThread thread(&handler, {tempTestDir / "b.txt", tempTestDir / "a.txt"}, config);
    RunToCompletion(thread);

    ASSERT_TRUE(preview);
    EXPECT_TRUE(preview->success);
    ASSERT_EQ(preview->plan.size(), 2u);
    EXPECT_EQ(preview->plan[0].Target.filename().string(), "note_1.txt");
}

TEST_F(WorkerThreadTest, PreviewReportsInvalidConfig)
{
    RenameConfig config;
    config.baseName = "";

    WorkerThread thread(&handler, std::vector<fs::path>{}, config);
    RunToCompletion(thread);

    ASSERT_TRUE(preview);
    EXPECT_FALSE(preview->success);
    EXPECT_EQ(preview->errorMessage.rfind("Invalid rename configuration", 0), 0u);
}

TEST_F(WorkerThreadTest, RenameThenUndoWithProgress)
{
    HistoryLog history(tempTestDir / "history.json");
    CreateDummyFile(tempTestDir / "x.txt");
    CreateDummyFile(tempTestDir / "y.txt");
    RenameConfig config;
    config.baseName = "item";
    std::vector<PlanEntry> plan = BatchRenamer::calculateRenamePlan({tempTestDir / "x.txt", tempTestDir / "y.txt"}, config);

    WorkerThread renameThread(&handler, plan, &history);
    RunToCompletion(renameThread);

    ASSERT_TRUE(rename);
    EXPECT_TRUE(rename->overallSuccess);
    EXPECT_TRUE(fs::exists(tempTestDir / "item_1.txt"));
    EXPECT_EQ(progressIndexes, (std::vector<int>{1, 2}));
    EXPECT_EQ(progressTotal, 2);
    EXPECT_EQ(progressNames, (std::vector<std::string>{"x.txt", "y.txt"}));
    ASSERT_TRUE(rename->sessionId.has_value());

    std::optional<Session> session = history.getSession(*rename->sessionId);
    ASSERT_TRUE(session.has_value());
    WorkerThread undoThread(&handler, *session);
    RunToCompletion(undoThread);

    ASSERT_TRUE(undo);
    EXPECT_TRUE(undo->overallSuccess);
    EXPECT_TRUE(fs::exists(tempTestDir / "x.txt"));
    EXPECT_TRUE(fs::exists(tempTestDir / "y.txt"));
    EXPECT_FALSE(fs::exists(tempTestDir / "item_1.txt"));
}

TEST_F(WorkerThreadTest, RenameWithoutHistoryFails)
{
    WorkerThread thread(&handler, std::vector<PlanEntry>{}, nullptr);
    RunToCompletion(thread);

    ASSERT_TRUE(rename);
    EXPECT_FALSE(rename->overallSuccess);
    ASSERT_EQ(rename->results.size(), 1u);
    EXPECT_EQ(rename->results[0].Error.value_or("").rfind("Unexpected error: ", 0), 0u);
}
