#include "TestFixtures.h"
#include "../../src/Logic/HistoryLog.h"
#include <fstream>
#include <string>
#include <vector>
#include <optional>

namespace fs = std::filesystem;

TEST_F(BatchRenamerFilesystemTest, History_AddAndReload)
{
    fs::path store = tempTestDir / "nested" / "history.json";
    std::string firstId;
    std::string secondId;
    {
        HistoryLog history(store);
        EXPECT_TRUE(history.getSessions().empty());

        std::optional<std::string> first = history.addSession({{"/x/a.txt", "/x/b.txt"}});
        std::optional<std::string> second = history.addSession({{"/x/c.txt", "/x/d.txt"}, {"/x/e.txt", "/x/f.txt"}});
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(second.has_value());
        EXPECT_NE(*first, *second);
        EXPECT_EQ(first->size(), 36u);
        EXPECT_EQ((*first)[14], '4');
        EXPECT_TRUE(history.lastSaveSucceeded());
        firstId = *first;
        secondId = *second;
    }
    ASSERT_TRUE(fs::exists(store));

    HistoryLog reloaded(store);
    const std::vector<Session> &sessions = reloaded.getSessions();
    ASSERT_EQ(sessions.size(), 2u);
    // Newest first
    EXPECT_EQ(sessions[0].Id, secondId);
    EXPECT_EQ(sessions[0].Count, 2u);
    EXPECT_EQ(sessions[0].Records[1].NewPath, "/x/f.txt");
    EXPECT_EQ(sessions[1].Id, firstId);
    EXPECT_EQ(sessions[1].Timestamp.size(), 19u);

    std::optional<Session> found = reloaded.getSession(firstId);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->Records[0].OldPath, "/x/a.txt");
    EXPECT_FALSE(reloaded.getSession("no-such-id").has_value());
}

TEST_F(BatchRenamerFilesystemTest, History_EmptyBatchIsNoOp)
{
    fs::path store = tempTestDir / "history.json";
    HistoryLog history(store);
    EXPECT_FALSE(history.addSession({}).has_value());
    EXPECT_TRUE(history.getSessions().empty());
    EXPECT_FALSE(fs::exists(store));
}

TEST_F(BatchRenamerFilesystemTest, History_TraceMultiHop)
{
    HistoryLog history(tempTestDir / "history.json");
    fs::path a = tempTestDir / "A.txt";
    fs::path b = tempTestDir / "B.txt";
    fs::path c = tempTestDir / "C.txt";

    history.addSession({{a.string(), b.string()}});
    history.addSession({{b.string(), c.string()}});

    std::optional<std::string> traced = history.traceOriginalName(c);
    ASSERT_TRUE(traced.has_value());
    EXPECT_EQ(*traced, "A.txt");

    EXPECT_EQ(history.traceOriginalName(b).value_or(""), "A.txt");
    EXPECT_FALSE(history.traceOriginalName(tempTestDir / "unrelated.txt").has_value());
}

TEST_F(BatchRenamerFilesystemTest, History_CorruptStoreLoadsEmpty)
{
    fs::path store = tempTestDir / "history.json";
    CreateDummyFile(store, "{ this is not json");

    HistoryLog history(store);
    EXPECT_TRUE(history.getSessions().empty());

    // Still usable; the next write replaces the corrupt content
    ASSERT_TRUE(history.addSession({{"/old", "/new"}}).has_value());
    HistoryLog reloaded(store);
    EXPECT_EQ(reloaded.getSessions().size(), 1u);
}

TEST_F(BatchRenamerFilesystemTest, History_WrongShapeLoadsEmpty)
{
    fs::path store = tempTestDir / "history.json";
    CreateDummyFile(store, "[1, 2, 3]");
    EXPECT_TRUE(HistoryLog(store).getSessions().empty());

    CreateDummyFile(store, R"({"sessions": [{"id": "ok", "timestamp": "t", "count": 1,
        "files": [{"old_path": "/a", "new_path": "/b"}]}, {"id": 5}]})");
    HistoryLog partial(store);
    ASSERT_EQ(partial.getSessions().size(), 1u);
    EXPECT_EQ(partial.getSessions()[0].Id, "ok");
}

TEST_F(BatchRenamerFilesystemTest, History_Clear)
{
    fs::path store = tempTestDir / "history.json";
    HistoryLog history(store);
    history.addSession({{"/a", "/b"}});
    EXPECT_TRUE(history.clear());
    EXPECT_TRUE(history.getSessions().empty());
    EXPECT_TRUE(HistoryLog(store).getSessions().empty());
}

TEST_F(BatchRenamerFilesystemTest, History_FailedSaveKeepsMemory)
{
    // A directory where the store file should be makes every write fail
    fs::path store = tempTestDir / "history.json";
    fs::create_directories(store);

    HistoryLog history(store);
    std::optional<std::string> id = history.addSession({{"/a", "/b"}});
    ASSERT_TRUE(id.has_value());
    EXPECT_FALSE(history.lastSaveSucceeded());
    EXPECT_EQ(history.getSessions().size(), 1u);
}
