#include <gtest/gtest.h>
#include "FakeProcFilesystem.h"
#include "core/Logging.h"
#include "net/ConnectionTableReader.h"

namespace sock_scan {

using testing_support::FakeProcFilesystem;

class ConnectionTableReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }

    FakeProcFilesystem fs;
    ConnectionTableReader reader{fs, "/proc"};
    std::string buffer;
};

TEST_F(ConnectionTableReaderTest, ConcatenatesTcpAndTcp6) {
    fs.set_tables("/proc", 10, "v4\n", "v6\n");
    std::vector<ProcessHandle> group{{10, "a"}};

    ConnectionReadResult r = reader.read(buffer, group);
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(r.found);
    EXPECT_EQ(buffer, "v4\nv6\n");
}

TEST_F(ConnectionTableReaderTest, ZeroBytesIsNotFound) {
    fs.set_tables("/proc", 10, "", "");
    std::vector<ProcessHandle> group{{10, "a"}};

    ConnectionReadResult r = reader.read(buffer, group);
    EXPECT_TRUE(r.ok());
    EXPECT_FALSE(r.found);
}

TEST_F(ConnectionTableReaderTest, OnlyTcp6HasContent) {
    fs.set_tables("/proc", 10, "", "v6\n");
    std::vector<ProcessHandle> group{{10, "a"}};

    ConnectionReadResult r = reader.read(buffer, group);
    EXPECT_TRUE(r.found);
    EXPECT_EQ(buffer, "v6\n");
}

TEST_F(ConnectionTableReaderTest, FirstSuccessfulMemberAnswers) {
    fs.set_tables("/proc", 10, "first\n", "");
    fs.set_tables("/proc", 20, "second\n", "");
    std::vector<ProcessHandle> group{{10, "a"}, {20, "b"}};

    reader.read(buffer, group);
    EXPECT_EQ(buffer, "first\n");
    EXPECT_EQ(fs.reads("/proc/20/net/tcp"), 0u);
}

TEST_F(ConnectionTableReaderTest, PartialReadOfFailedMemberIsDiscarded) {
    fs.add_file("/proc/10/net/tcp", "stale\n");
    fs.add_file_error("/proc/10/net/tcp6", ESRCH);
    fs.set_tables("/proc", 20, "fresh\n", "");
    std::vector<ProcessHandle> group{{10, "a"}, {20, "b"}};

    ConnectionReadResult r = reader.read(buffer, group);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(buffer, "fresh\n");
}

TEST_F(ConnectionTableReaderTest, StartsAtGivenMember) {
    fs.set_tables("/proc", 10, "first\n", "");
    fs.set_tables("/proc", 20, "second\n", "");
    std::vector<ProcessHandle> group{{10, "a"}, {20, "b"}};

    reader.read(buffer, group, 1);
    EXPECT_EQ(buffer, "second\n");
    EXPECT_EQ(fs.reads("/proc/10/net/tcp"), 0u);
}

TEST_F(ConnectionTableReaderTest, AllMembersFailReportsLastError) {
    fs.add_file_error("/proc/10/net/tcp", EACCES);
    fs.add_file_error("/proc/20/net/tcp", ESRCH);
    std::vector<ProcessHandle> group{{10, "a"}, {20, "b"}};
    buffer = "leftover";

    ConnectionReadResult r = reader.read(buffer, group);
    EXPECT_FALSE(r.ok());
    EXPECT_FALSE(r.found);
    EXPECT_EQ(r.error, ESRCH);
    EXPECT_EQ(r.error_path, "/proc/20/net/tcp");
    EXPECT_TRUE(buffer.empty());
}

TEST_F(ConnectionTableReaderTest, Tcp6ErrorReportedWhenTcpSucceeded) {
    fs.add_file("/proc/10/net/tcp", "v4\n");
    fs.add_file_error("/proc/10/net/tcp6", EAFNOSUPPORT);
    std::vector<ProcessHandle> group{{10, "a"}};

    ConnectionReadResult r = reader.read(buffer, group);
    EXPECT_EQ(r.error, EAFNOSUPPORT);
    EXPECT_EQ(r.error_path, "/proc/10/net/tcp6");
}

TEST_F(ConnectionTableReaderTest, EmptyGroupIsNotAnError) {
    std::vector<ProcessHandle> group;
    ConnectionReadResult r = reader.read(buffer, group);
    EXPECT_TRUE(r.ok());
    EXPECT_FALSE(r.found);
}

}
