#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "FakeProcFilesystem.h"
#include "core/Logging.h"
#include "net/SocketOwnerWalker.h"

namespace sock_scan {

using testing_support::FakeProcFilesystem;
using ::testing::Exactly;
using ::testing::Invoke;

namespace {

const char* kRoot = "/p";
const char* kTable = "   0: 0100007F:1F90 00000000:0000 0A 00000000:00000000 00:00000000 00000000 0 0 1\n";

class MockTickSource : public TickSource {
public:
    MOCK_METHOD(void, wait, (), (override));
};

}

class SocketOwnerWalkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }

    FakeProcFilesystem fs;
    ConnectionTableReader reader{fs, kRoot};
    SocketOwnerWalker walker{fs, kRoot, reader};
    std::string buffer;
};

TEST_F(SocketOwnerWalkerTest, PausesAndRereadsEveryBlock) {
    fs.add_process(kRoot, 1, "one", 9);
    fs.add_process(kRoot, 2, "two", 9);
    fs.set_tables(kRoot, 1, kTable, "");
    fs.set_tables(kRoot, 2, kTable, "");
    fs.add_fd(kRoot, 1, "3", 31, S_IFSOCK);
    fs.add_fd(kRoot, 1, "4", 41, S_IFSOCK);
    fs.add_fd(kRoot, 1, "5", 51, S_IFSOCK);
    fs.add_fd(kRoot, 2, "3", 32, S_IFSOCK);
    fs.add_fd(kRoot, 2, "4", 42, S_IFSOCK);

    std::vector<ProcessHandle> group{{1, "one"}, {2, "two"}};
    MockTickSource ticks;
    EXPECT_CALL(ticks, wait()).Times(Exactly(2));

    WalkResult r = walker.walk(group, buffer, ticks, 2);

    EXPECT_EQ(r.pauses, 2u);
    EXPECT_EQ(r.rereads, 2u);
    EXPECT_FALSE(r.stopped_early);
    EXPECT_EQ(r.sockets.size(), 5u);
    EXPECT_EQ(r.sockets.at(31)->pid, 1);
    EXPECT_EQ(r.sockets.at(42)->pid, 2);
    // First pause happens inside pid 1 and rereads from it; the second
    // happens inside pid 2 and starts there.
    EXPECT_EQ(fs.reads("/p/1/net/tcp"), 1u);
    EXPECT_EQ(fs.reads("/p/2/net/tcp"), 1u);
}

TEST_F(SocketOwnerWalkerTest, RereadHappensAfterWait) {
    fs.add_process(kRoot, 1, "one", 9);
    fs.set_tables(kRoot, 1, kTable, "");
    fs.add_fd(kRoot, 1, "3", 31, S_IFSOCK);
    fs.add_fd(kRoot, 1, "4", 41, S_IFSOCK);

    std::vector<ProcessHandle> group{{1, "one"}};
    MockTickSource ticks;
    EXPECT_CALL(ticks, wait()).WillOnce(Invoke([this] {
        EXPECT_EQ(fs.reads("/p/1/net/tcp"), 0u);
    }));

    WalkResult r = walker.walk(group, buffer, ticks, 1);
    EXPECT_EQ(r.pauses, 1u);
    EXPECT_EQ(fs.reads("/p/1/net/tcp"), 1u);
}

TEST_F(SocketOwnerWalkerTest, ZeroBlockSizeNeverPauses) {
    fs.add_process(kRoot, 1, "one", 9);
    for (int i = 0; i < 50; ++i) fs.add_fd(kRoot, 1, std::to_string(i), 1000 + i, S_IFSOCK);

    std::vector<ProcessHandle> group{{1, "one"}};
    MockTickSource ticks;
    EXPECT_CALL(ticks, wait()).Times(0);

    WalkResult r = walker.walk(group, buffer, ticks, 0);
    EXPECT_EQ(r.sockets.size(), 50u);
    EXPECT_EQ(r.descriptors, 50u);
}

TEST_F(SocketOwnerWalkerTest, NonSocketDescriptorsCountTowardsBlock) {
    fs.add_process(kRoot, 1, "one", 9);
    fs.set_tables(kRoot, 1, kTable, "");
    fs.add_fd(kRoot, 1, "0", 7, S_IFCHR);
    fs.add_fd(kRoot, 1, "1", 8, S_IFREG);
    fs.add_fd(kRoot, 1, "2", 9, S_IFSOCK);

    std::vector<ProcessHandle> group{{1, "one"}};
    MockTickSource ticks;
    EXPECT_CALL(ticks, wait()).Times(1);

    WalkResult r = walker.walk(group, buffer, ticks, 2);
    EXPECT_EQ(r.descriptors, 3u);
    EXPECT_EQ(r.socket_descriptors, 1u);
    ASSERT_EQ(r.sockets.size(), 1u);
    EXPECT_TRUE(r.sockets.count(9));
}

TEST_F(SocketOwnerWalkerTest, StopsWhenTablesEmptyAfterPause) {
    fs.add_process(kRoot, 1, "one", 9);
    fs.set_tables(kRoot, 1, "", "");
    fs.add_fd(kRoot, 1, "3", 31, S_IFSOCK);
    fs.add_fd(kRoot, 1, "4", 41, S_IFSOCK);
    fs.add_fd(kRoot, 1, "5", 51, S_IFSOCK);

    std::vector<ProcessHandle> group{{1, "one"}};
    MockTickSource ticks;
    EXPECT_CALL(ticks, wait()).Times(1);

    WalkResult r = walker.walk(group, buffer, ticks, 1);
    EXPECT_TRUE(r.stopped_early);
    EXPECT_EQ(r.stop_error, 0);
    // The descriptor inspected before the pause is kept.
    ASSERT_EQ(r.sockets.size(), 1u);
    EXPECT_TRUE(r.sockets.count(31));
}

TEST_F(SocketOwnerWalkerTest, StopsWhenTablesUnreadableAfterPause) {
    fs.add_process(kRoot, 1, "one", 9);
    fs.add_file_error("/p/1/net/tcp", ESRCH);
    fs.add_fd(kRoot, 1, "3", 31, S_IFSOCK);
    fs.add_fd(kRoot, 1, "4", 41, S_IFSOCK);

    std::vector<ProcessHandle> group{{1, "one"}};
    MockTickSource ticks;
    EXPECT_CALL(ticks, wait()).Times(1);

    WalkResult r = walker.walk(group, buffer, ticks, 1);
    EXPECT_TRUE(r.stopped_early);
    EXPECT_EQ(r.stop_error, ESRCH);
    EXPECT_EQ(r.sockets.size(), 1u);
}

TEST_F(SocketOwnerWalkerTest, SkipsProcessWithUnreadableFdDirectory) {
    fs.add_process(kRoot, 1, "one", 9);
    fs.add_process(kRoot, 2, "two", 9);
    fs.add_dir_error("/p/1/fd", EACCES);
    fs.add_fd(kRoot, 2, "3", 77, S_IFSOCK);

    std::vector<ProcessHandle> group{{1, "one"}, {2, "two"}};
    MockTickSource ticks;
    EXPECT_CALL(ticks, wait()).Times(0);

    WalkResult r = walker.walk(group, buffer, ticks, 300);
    EXPECT_EQ(r.processes_unreadable, 1u);
    ASSERT_EQ(r.sockets.size(), 1u);
    EXPECT_EQ(r.sockets.at(77)->name, "two");
}

TEST_F(SocketOwnerWalkerTest, LaterHolderWinsSharedInode) {
    fs.add_process(kRoot, 1, "parent", 9);
    fs.add_process(kRoot, 2, "child", 9);
    fs.add_fd(kRoot, 1, "3", 500, S_IFSOCK);
    fs.add_fd(kRoot, 2, "3", 500, S_IFSOCK);

    std::vector<ProcessHandle> group{{1, "parent"}, {2, "child"}};
    MockTickSource ticks;
    EXPECT_CALL(ticks, wait()).Times(0);

    WalkResult r = walker.walk(group, buffer, ticks, 300);
    ASSERT_EQ(r.sockets.size(), 1u);
    EXPECT_EQ(r.sockets.at(500)->pid, 2);
}

TEST_F(SocketOwnerWalkerTest, VanishedDescriptorIsIgnored) {
    fs.add_process(kRoot, 1, "one", 9);
    fs.add_dir("/p/1/fd", {"3", "4"});
    fs.add_stat("/p/1/fd/4", 44, S_IFSOCK | 0777);

    std::vector<ProcessHandle> group{{1, "one"}};
    MockTickSource ticks;
    EXPECT_CALL(ticks, wait()).Times(0);

    WalkResult r = walker.walk(group, buffer, ticks, 300);
    EXPECT_EQ(r.descriptors, 2u);
    ASSERT_EQ(r.sockets.size(), 1u);
    EXPECT_TRUE(r.sockets.count(44));
}

}
