#include <ctime>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "scanport/scan/agent_updater.hpp"
#include "test_support.hpp"

using scanport::core::StatusCode;
using scanport::scan::AgentSource;
using scanport::scan::AgentUpdater;

namespace {
    void write_file(const std::string& path, const std::string& text) {
        std::ofstream(path) << text;
    }

    std::string read_file(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    bool exists(const std::string& path) {
        struct stat st{};
        return ::stat(path.c_str(), &st) == 0;
    }

    // Pushes mtime back by the given number of seconds.
    void age_file(const std::string& path, long seconds) {
        struct timespec times[2]{};
        ::clock_gettime(CLOCK_REALTIME, &times[0]);
        times[0].tv_sec -= seconds;
        times[1] = times[0];
        ASSERT_EQ(::utimensat(AT_FDCWD, path.c_str(), times, 0), 0);
    }

    // Counts entries other than . and .. in dir.
    int entry_count(const std::string& dir) {
        DIR* d = ::opendir(dir.c_str());
        if (d == nullptr) {
            return -1;
        }
        int n = 0;
        while (const dirent* e = ::readdir(d)) {
            const std::string name = e->d_name;
            if (name != "." && name != "..") {
                ++n;
            }
        }
        ::closedir(d);
        return n;
    }
}

// ============================================================================
// fetch_to_file
// ============================================================================

class FetchTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(tmp_.path().empty());
        ASSERT_EQ(scanport::scan::fetch_init().code, StatusCode::Ok);
        origin_ = tmp_.sub("origin");
        target_ = tmp_.sub("target");
        ASSERT_EQ(scanport::storage::create_directories(origin_.c_str()).code, StatusCode::Ok);
        ASSERT_EQ(scanport::storage::create_directories(target_.c_str()).code, StatusCode::Ok);
    }

    std::string url(const char* name) const { return "file://" + origin_ + "/" + name; }

    scanport::test::TempDir tmp_;
    std::string origin_;
    std::string target_;
};

TEST_F(FetchTest, DownloadsIntoDestination) {
    write_file(origin_ + "/agent.jar", "PK agent bytes");
    std::string detail;
    ASSERT_EQ(scanport::scan::fetch_to_file(url("agent.jar"), target_ + "/agent.jar", 5000, &detail).code,
              StatusCode::Ok)
        << detail;
    EXPECT_EQ(read_file(target_ + "/agent.jar"), "PK agent bytes");
    EXPECT_EQ(entry_count(target_), 1);
}

TEST_F(FetchTest, ReplacesExistingFile) {
    write_file(origin_ + "/agent.jar", "v2");
    write_file(target_ + "/agent.jar", "v1");
    ASSERT_EQ(scanport::scan::fetch_to_file(url("agent.jar"), target_ + "/agent.jar", 5000, nullptr).code,
              StatusCode::Ok);
    EXPECT_EQ(read_file(target_ + "/agent.jar"), "v2");
}

TEST_F(FetchTest, MissingSourceIsNetworkErrorAndLeavesNothing) {
    std::string detail;
    EXPECT_EQ(scanport::scan::fetch_to_file(url("absent.jar"), target_ + "/agent.jar", 5000, &detail).code,
              StatusCode::Network);
    EXPECT_FALSE(detail.empty());
    EXPECT_EQ(entry_count(target_), 0);
}

TEST_F(FetchTest, FailedDownloadKeepsPreviousFile) {
    write_file(target_ + "/agent.jar", "v1");
    EXPECT_EQ(scanport::scan::fetch_to_file(url("absent.jar"), target_ + "/agent.jar", 5000, nullptr).code,
              StatusCode::Network);
    EXPECT_EQ(read_file(target_ + "/agent.jar"), "v1");
    EXPECT_EQ(entry_count(target_), 1);
}

TEST_F(FetchTest, UnwritableDestinationIsIoError) {
    write_file(origin_ + "/agent.jar", "bytes");
    EXPECT_EQ(scanport::scan::fetch_to_file(url("agent.jar"), tmp_.sub("no-such-dir/agent.jar"), 5000, nullptr).code,
              StatusCode::Io);
}

TEST(Fetch, EmptyArgumentsAreInvalid) {
    EXPECT_EQ(scanport::scan::fetch_to_file("", "/tmp/x", 0, nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(scanport::scan::fetch_to_file("file:///tmp/x", "", 0, nullptr).code, StatusCode::Invalid);
}

// ============================================================================
// AgentUpdater
// ============================================================================

class AgentUpdaterTest : public FetchTest {
protected:
    void SetUp() override {
        FetchTest::SetUp();
        write_file(origin_ + "/agent.jar", "latest");
        src_.url = url("agent.jar");
        src_.jar_path = target_ + "/wss-unified-agent.jar";
        src_.timeout_ms = 5000;
    }

    AgentSource src_;
};

TEST_F(AgentUpdaterTest, EnsurePresentDownloadsMissingJar) {
    AgentUpdater updater(src_);
    ASSERT_EQ(updater.ensure_present().code, StatusCode::Ok);
    EXPECT_EQ(read_file(src_.jar_path), "latest");
    EXPECT_EQ(updater.downloads(), 1u);

    // second call finds it on disk
    ASSERT_EQ(updater.ensure_present().code, StatusCode::Ok);
    EXPECT_EQ(updater.downloads(), 1u);
}

TEST_F(AgentUpdaterTest, EnsurePresentKeepsExistingJar) {
    write_file(src_.jar_path, "local");
    AgentUpdater updater(src_);
    ASSERT_EQ(updater.ensure_present().code, StatusCode::Ok);
    EXPECT_EQ(read_file(src_.jar_path), "local");
    EXPECT_EQ(updater.downloads(), 0u);
}

TEST_F(AgentUpdaterTest, EnsurePresentReportsFailedDownload) {
    src_.url = url("absent.jar");
    AgentUpdater updater(src_);
    EXPECT_EQ(updater.ensure_present().code, StatusCode::Network);
    EXPECT_FALSE(exists(src_.jar_path));
}

TEST_F(AgentUpdaterTest, FreshJarIsNotRefreshed) {
    write_file(src_.jar_path, "local");
    AgentUpdater updater(src_);
    EXPECT_FALSE(updater.is_stale());
    EXPECT_FALSE(updater.refresh_in_background());
    updater.wait();
    EXPECT_EQ(read_file(src_.jar_path), "local");
    EXPECT_EQ(updater.downloads(), 0u);
}

TEST_F(AgentUpdaterTest, MissingJarIsNotStale) {
    AgentUpdater updater(src_);
    EXPECT_FALSE(updater.is_stale());
    EXPECT_FALSE(updater.refresh_in_background());
}

TEST_F(AgentUpdaterTest, StaleJarIsRefreshedInBackground) {
    write_file(src_.jar_path, "old");
    age_file(src_.jar_path, 25 * 60 * 60);
    AgentUpdater updater(src_);
    ASSERT_TRUE(updater.is_stale());

    ASSERT_TRUE(updater.refresh_in_background());
    updater.wait();
    EXPECT_EQ(read_file(src_.jar_path), "latest");
    EXPECT_EQ(updater.downloads(), 1u);
    EXPECT_FALSE(updater.is_stale());
    EXPECT_FALSE(updater.refresh_in_background());
}

TEST_F(AgentUpdaterTest, FailedRefreshKeepsStaleJar) {
    write_file(src_.jar_path, "old");
    age_file(src_.jar_path, 25 * 60 * 60);
    src_.url = url("absent.jar");
    AgentUpdater updater(src_);

    ASSERT_TRUE(updater.refresh_in_background());
    updater.wait();
    EXPECT_EQ(read_file(src_.jar_path), "old");
    EXPECT_EQ(updater.downloads(), 0u);
    EXPECT_EQ(entry_count(target_), 1);
}

TEST_F(AgentUpdaterTest, HardLinkTakenBeforeRefreshKeepsOldJar) {
    write_file(src_.jar_path, "old");
    const std::string pinned = target_ + "/pinned.jar";
    ASSERT_EQ(::link(src_.jar_path.c_str(), pinned.c_str()), 0);

    AgentUpdater updater(src_);
    ASSERT_EQ(updater.refresh().code, StatusCode::Ok);
    EXPECT_EQ(read_file(src_.jar_path), "latest");
    EXPECT_EQ(read_file(pinned), "old");
}

TEST_F(AgentUpdaterTest, EmptyJarPathIsInvalid) {
    src_.jar_path.clear();
    AgentUpdater updater(src_);
    EXPECT_EQ(updater.ensure_present().code, StatusCode::Invalid);
    EXPECT_EQ(updater.refresh().code, StatusCode::Invalid);
}
