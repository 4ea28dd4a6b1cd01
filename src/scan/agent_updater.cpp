#include "scanport/scan/agent_updater.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>

#include <curl/curl.h>

#include "scanport/core/log.hpp"

namespace scanport::scan {

using scanport::core::StatusCode;
using scanport::core::StatusDomain;
using scanport::core::is_ok;
using scanport::core::make_status;
using scanport::core::ok_status;

namespace {
    constexpr const char* kTag = "agent";

    struct FileSink {
        int fd{-1};
        int error{0};
        scanport::core::u64 bytes{0};
    };

    // Returning less than asked aborts the transfer with CURLE_WRITE_ERROR.
    size_t write_body(char* data, size_t size, size_t nmemb, void* user) noexcept {
        auto* sink = static_cast<FileSink*>(user);
        const size_t len = size * nmemb;
        size_t done = 0;
        while (done < len) {
            const ssize_t n = ::write(sink->fd, data + done, len - done);
            if (n < 0) {
                if (errno == EINTR) continue;
                sink->error = errno;
                return done;
            }
            done += static_cast<size_t>(n);
        }
        sink->bytes += len;
        return len;
    }

    void set_detail(std::string* detail, const std::string& text) {
        if (detail != nullptr) {
            *detail = text;
        }
    }
} // namespace

Status fetch_init() noexcept {
    static std::mutex init_mutex;
    static bool initialized = false;

    std::lock_guard<std::mutex> lock(init_mutex);
    if (!initialized) {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            return make_status(StatusDomain::External, StatusCode::Unavailable);
        }
        initialized = true;
    }
    return ok_status();
}

Status fetch_to_file(const std::string& url, const std::string& dest, u32 timeout_ms, std::string* detail) noexcept {
    if (url.empty() || dest.empty()) {
        return make_status(StatusDomain::Scan, StatusCode::Invalid);
    }
    Status st = fetch_init();
    if (!is_ok(st)) {
        set_detail(detail, "libcurl initialization failed");
        return st;
    }

    std::string tmp = dest + ".partial.XXXXXX";
    const int fd = mkstemp(tmp.data());
    if (fd < 0) {
        const int e = errno;
        set_detail(detail, "cannot create " + tmp + ": " + std::strerror(e));
        return make_status(StatusDomain::Scan, StatusCode::Io, static_cast<u32>(e));
    }
    (void)fcntl(fd, F_SETFD, FD_CLOEXEC);
    (void)fchmod(fd, 0644);

    CURL* h = curl_easy_init();
    if (h == nullptr) {
        ::close(fd);
        ::unlink(tmp.c_str());
        set_detail(detail, "curl_easy_init failed");
        return make_status(StatusDomain::External, StatusCode::Unavailable);
    }

    FileSink sink{fd};
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
    if (timeout_ms > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    }

    const CURLcode rc = curl_easy_perform(h);
    long http_status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_status);
    curl_easy_cleanup(h);

    if (rc != CURLE_OK) {
        ::close(fd);
        ::unlink(tmp.c_str());
        if (sink.error != 0) {
            set_detail(detail, "cannot write " + tmp + ": " + std::strerror(sink.error));
            return make_status(StatusDomain::Scan, StatusCode::Io, static_cast<u32>(sink.error));
        }
        set_detail(detail, url + ": " + (errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc)));
        const u32 aux = http_status >= 400 ? static_cast<u32>(http_status) : static_cast<u32>(rc);
        return make_status(StatusDomain::Net, StatusCode::Network, aux);
    }

    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        const int e = errno;
        ::unlink(tmp.c_str());
        set_detail(detail, "cannot flush " + tmp + ": " + std::strerror(e));
        return make_status(StatusDomain::Scan, StatusCode::Io, static_cast<u32>(e));
    }
    if (::rename(tmp.c_str(), dest.c_str()) != 0) {
        const int e = errno;
        ::unlink(tmp.c_str());
        set_detail(detail, "cannot move download to " + dest + ": " + std::strerror(e));
        return make_status(StatusDomain::Scan, StatusCode::Io, static_cast<u32>(e));
    }
    return ok_status();
}

AgentUpdater::AgentUpdater(AgentSource src) : src_(std::move(src)) {}

AgentUpdater::~AgentUpdater() {
    wait();
}

bool AgentUpdater::is_stale() const noexcept {
    struct stat st{};
    if (::stat(src_.jar_path.c_str(), &st) != 0) {
        return false;
    }
    const auto mtime = std::chrono::system_clock::from_time_t(st.st_mtime);
    return std::chrono::system_clock::now() - mtime > std::chrono::seconds(src_.max_age_s);
}

Status AgentUpdater::download_locked() noexcept {
    SCANPORT_LOG_INFO(kTag, "pulling %s", src_.url.c_str());
    std::string detail;
    const Status st = fetch_to_file(src_.url, src_.jar_path, src_.timeout_ms, &detail);
    if (!is_ok(st)) {
        SCANPORT_LOG_ERROR(kTag, "agent download failed: %s", detail.c_str());
        return st;
    }
    downloads_.fetch_add(1);
    SCANPORT_LOG_INFO(kTag, "agent updated at %s", src_.jar_path.c_str());
    return ok_status();
}

Status AgentUpdater::ensure_present() noexcept {
    if (src_.jar_path.empty()) {
        return make_status(StatusDomain::Scan, StatusCode::Invalid);
    }
    // A present jar never waits behind a background refresh.
    if (::access(src_.jar_path.c_str(), R_OK) == 0) {
        return ok_status();
    }
    std::lock_guard<std::mutex> lock(fetch_mutex_);
    if (::access(src_.jar_path.c_str(), R_OK) == 0) {
        return ok_status();
    }
    SCANPORT_LOG_INFO(kTag, "agent jar %s not found", src_.jar_path.c_str());
    return download_locked();
}

Status AgentUpdater::refresh() noexcept {
    if (src_.jar_path.empty()) {
        return make_status(StatusDomain::Scan, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(fetch_mutex_);
    return download_locked();
}

bool AgentUpdater::refresh_in_background() noexcept {
    if (!is_stale()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (busy_.load()) {
        return false;
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    SCANPORT_LOG_INFO(kTag, "agent jar is older than %u s, refreshing", src_.max_age_s);
    busy_.store(true);
    try {
        worker_ = std::thread([this] {
            const Status st = refresh();
            if (!is_ok(st)) {
                SCANPORT_LOG_WARN(kTag, "keeping the current agent jar");
            }
            busy_.store(false);
        });
    } catch (const std::system_error& e) {
        busy_.store(false);
        SCANPORT_LOG_WARN(kTag, "cannot start agent refresh: %s", e.what());
        return false;
    }
    return true;
}

void AgentUpdater::wait() noexcept {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

} // namespace scanport::scan
