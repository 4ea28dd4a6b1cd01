#include <atomic>
#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "scanport/scan/process.hpp"
#include "test_support.hpp"

using scanport::core::CancelToken;
using scanport::core::StatusCode;
using scanport::scan::ProcessResult;
using scanport::scan::ProcessSpec;
using scanport::scan::run_process;

namespace {
    ProcessSpec sh(const std::string& script) {
        ProcessSpec spec{};
        spec.argv = {"/bin/sh", "-c", script};
        return spec;
    }
}

TEST(ScanProcess, CapturesOutputAndExitCode) {
    ProcessResult r{};
    ASSERT_EQ(run_process(sh("echo out; echo err >&2; exit 3"), CancelToken{}, &r).code, StatusCode::Ok);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.term_signal, 0);
    EXPECT_EQ(r.out, "out\n");
    EXPECT_EQ(r.err, "err\n");
}

TEST(ScanProcess, StdinIsEmpty) {
    ProcessResult r{};
    ASSERT_EQ(run_process(sh("wc -c"), CancelToken{}, &r).code, StatusCode::Ok);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_NE(r.out.find('0'), std::string::npos);
}

TEST(ScanProcess, RunsInWorkingDirectory) {
    scanport::test::TempDir tmp;
    ProcessSpec spec = sh("pwd -P");
    spec.cwd = tmp.path();
    ProcessResult r{};
    ASSERT_EQ(run_process(spec, CancelToken{}, &r).code, StatusCode::Ok);
    EXPECT_NE(r.out.find("scanport_test_"), std::string::npos);
}

TEST(ScanProcess, MissingBinaryIsInvocationError) {
    ProcessSpec spec{};
    spec.argv = {"/nonexistent/scanport-no-such-binary"};
    ProcessResult r{};
    const auto s = run_process(spec, CancelToken{}, &r);
    EXPECT_EQ(s.code, StatusCode::ScanInvocation);
    EXPECT_NE(r.err.find("cannot execute"), std::string::npos);
}

TEST(ScanProcess, TimeoutKillsProcessGroup) {
    ProcessSpec spec = sh("sleep 30 & sleep 30");
    spec.timeout_ms = 200;
    ProcessResult r{};
    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(run_process(spec, CancelToken{}, &r).code, StatusCode::ScanTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_NE(r.term_signal, 0);
}

TEST(ScanProcess, StopFlagCancels) {
    std::atomic<bool> stop{true};
    ProcessResult r{};
    EXPECT_EQ(run_process(sh("sleep 30"), CancelToken(-1, &stop), &r).code, StatusCode::Cancelled);
}

TEST(ScanProcess, PeerHangupCancels) {
    scanport::net::FdStream a, b;
    scanport::test::make_stream_pair(&a, &b);
    b.close();
    ProcessResult r{};
    EXPECT_EQ(run_process(sh("sleep 30"), CancelToken(a.fd(), nullptr), &r).code, StatusCode::Cancelled);
}

TEST(ScanProcess, OutputIsCapped) {
    ProcessSpec spec = sh("head -c 200000 /dev/zero");
    spec.output_cap_bytes = 1000;
    ProcessResult r{};
    ASSERT_EQ(run_process(spec, CancelToken{}, &r).code, StatusCode::Ok);
    EXPECT_EQ(r.out.size(), 1000u);
    EXPECT_TRUE(r.out_truncated);
    EXPECT_FALSE(r.err_truncated);
}

TEST(ScanProcess, EmptyArgvIsInvalid) {
    ProcessResult r{};
    EXPECT_EQ(run_process(ProcessSpec{}, CancelToken{}, &r).code, StatusCode::Invalid);
}
