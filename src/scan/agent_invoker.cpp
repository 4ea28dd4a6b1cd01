#include "scanport/scan/agent_invoker.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

#include "scanport/core/log.hpp"
#include "scanport/storage/scratch.hpp"

namespace scanport::scan {

using scanport::core::CancelToken;
using scanport::core::StatusCode;
using scanport::core::StatusDomain;
using scanport::core::is_ok;
using scanport::core::make_status;
using scanport::core::ok_status;
using scanport::net::OutcomeStatus;
using scanport::net::ScanConfig;
using scanport::net::ScanOutcome;

namespace fs = std::filesystem;

namespace {
    constexpr const char* kAgentName = "wss-unified-agent.jar";
    constexpr const char* kConfigName = "wss-generated-file.config";
    constexpr auto kAgentMaxAge = std::chrono::hours(24);

    constexpr const char* kDefaultProperties[][2] = {
        {"go.collectDependenciesAtRuntime", "true"},
        {"failErrorLevel", "ALL"},
        {"fileSystemScan", "true"},
        {"resolveAllDependencies", "true"},
        {"python.installVirtualEnv", "true"},
    };

    // Extra keys that would shadow what the server sets itself.
    constexpr const char* kReservedKeys[] = {
        "apiKey", "productToken", "projectName", "requesterEmail", "userKey", "wss.url",
        "wssUrl", "organizationKey", "orgToken",
        "go.collectDependenciesAtRuntime", "failErrorLevel", "fileSystemScan",
        "resolveAllDependencies", "python.installVirtualEnv",
    };

    bool is_reserved(const std::string& key) noexcept {
        for (const char* r : kReservedKeys) {
            if (key == r) {
                return true;
            }
        }
        return false;
    }

    bool key_is_safe(const std::string& key) noexcept {
        if (key.empty()) {
            return false;
        }
        return key.find_first_of("=:\r\n") == std::string::npos;
    }

    std::string dir_of(const std::string& path) {
        const std::string::size_type slash = path.rfind('/');
        if (slash == std::string::npos) {
            return ".";
        }
        if (slash == 0) {
            return "/";
        }
        return path.substr(0, slash);
    }

    std::string tail(const std::string& s, std::size_t max_len) {
        return s.size() <= max_len ? s : s.substr(s.size() - max_len);
    }

    // Converts a non-Ok run_process status into the invoker's taxonomy and
    // fills the outcome detail.
    Status fail_run(Status st, const char* what, const ProcessResult& pr, u32 timeout_ms, ScanOutcome* out) {
        out->status = OutcomeStatus::Failure;
        out->exit_code = pr.exit_code;
        switch (st.code) {
            case StatusCode::Cancelled:
                out->detail = std::string(what) + " cancelled";
                out->error = StatusCode::Cancelled;
                return make_status(StatusDomain::Scan, StatusCode::Cancelled);
            case StatusCode::ScanTimeout:
                out->detail = std::string(what) + " exceeded the scan timeout of " + std::to_string(timeout_ms) + " ms";
                out->error = StatusCode::ScanTimeout;
                return make_status(StatusDomain::Scan, StatusCode::ScanTimeout, timeout_ms);
            default:
                out->detail = std::string(what) + " could not be started";
                if (!pr.err.empty()) {
                    out->detail += ": " + pr.err;
                }
                out->error = StatusCode::ScanInvocation;
                return make_status(StatusDomain::Scan, StatusCode::ScanInvocation, st.aux);
        }
    }

    Status write_file_append(const std::string& path, const std::string& text) noexcept {
        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
        if (fd < 0) {
            return make_status(StatusDomain::Scan, StatusCode::Io, errno);
        }
        (void)fchmod(fd, 0600);

        std::size_t written = 0;
        while (written < text.size()) {
            const ssize_t n = ::write(fd, text.data() + written, text.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                const int e = errno;
                ::close(fd);
                return make_status(StatusDomain::Scan, StatusCode::Io, e);
            }
            written += static_cast<std::size_t>(n);
        }
        if (::close(fd) != 0) {
            return make_status(StatusDomain::Scan, StatusCode::Io, errno);
        }
        return ok_status();
    }

    class AgentRun {
    public:
        AgentRun(const AgentConfig& cfg, AgentUpdater* updater, const ScanConfig& scan, const CancelToken& cancel,
                 ScanOutcome* out)
            : cfg_(cfg), updater_(updater), scan_(scan), cancel_(cancel), out_(out), tag_(scan.project_name.c_str()) {}

        ~AgentRun() {
            if (!linked_agent_.empty()) {
                (void)unlink(linked_agent_.c_str());
            }
            if (!config_path_.empty()) {
                (void)unlink(config_path_.c_str());
            }
        }

        Status run(const std::string& archive_path) {
            work_dir_ = dir_of(archive_path) + "/scan";
            Status st = scanport::storage::create_directories(work_dir_.c_str());
            if (!is_ok(st)) {
                return internal("cannot create work directory " + work_dir_, st);
            }

            std::string target = archive_path;
            if (cfg_.unpack_layers) {
                target = work_dir_ + "/src";
                st = unpack(archive_path, target);
                if (!is_ok(st)) {
                    return st;
                }
            }

            st = prepare_agent();
            if (!is_ok(st)) {
                return st;
            }
            st = prepare_config();
            if (!is_ok(st)) {
                return st;
            }
            return run_agent(target);
        }

    private:
        Status internal(const std::string& what, Status st) {
            out_->status = OutcomeStatus::Failure;
            out_->detail = what + ": " + std::strerror(static_cast<int>(st.aux));
            out_->error = StatusCode::ScanInvocation;
            return make_status(StatusDomain::Scan, StatusCode::ScanInvocation, st.aux);
        }

        ProcessSpec spec(std::vector<std::string> argv) const {
            ProcessSpec p{};
            p.argv = std::move(argv);
            p.cwd = work_dir_;
            p.timeout_ms = cfg_.timeout_ms;
            p.output_cap_bytes = cfg_.output_cap_bytes;
            return p;
        }

        Status unpack(const std::string& archive_path, const std::string& dest) {
            Status st = scanport::storage::create_directories(dest.c_str());
            if (!is_ok(st)) {
                return internal("cannot create " + dest, st);
            }

            ProcessResult pr{};
            st = run_process(spec({"tar", "--no-same-owner", "-xf", archive_path, "-C", dest}), cancel_, &pr);
            if (!is_ok(st)) {
                return fail_run(st, "archive unpack", pr, cfg_.timeout_ms, out_);
            }
            if (pr.exit_code != 0) {
                out_->status = OutcomeStatus::Failure;
                out_->exit_code = pr.exit_code;
                out_->detail = "archive is not a readable tar: " + tail(pr.err, 4096);
                out_->error = StatusCode::CorruptArchive;
                return make_status(StatusDomain::Scan, StatusCode::CorruptArchive, static_cast<u32>(pr.exit_code));
            }

            // Image exports carry one tar per layer at the top level.
            std::vector<fs::path> layers;
            std::error_code ec;
            for (fs::directory_iterator it(dest, ec), end; !ec && it != end; it.increment(ec)) {
                const fs::path& p = it->path();
                if (p.extension() == ".tar" && it->is_regular_file(ec)) {
                    layers.push_back(p);
                }
            }
            if (ec) {
                SCANPORT_LOG_WARN(tag_, "listing %s failed: %s", dest.c_str(), ec.message().c_str());
            }

            for (const fs::path& layer : layers) {
                if (cancel_.cancelled()) {
                    return fail_run(make_status(StatusDomain::Scan, StatusCode::Cancelled),
                                    "archive unpack", pr, cfg_.timeout_ms, out_);
                }
                fs::path layer_dir = layer;
                layer_dir.replace_extension();
                st = scanport::storage::create_directories(layer_dir.c_str());
                if (!is_ok(st)) {
                    SCANPORT_LOG_WARN(tag_, "cannot create %s, skipping layer", layer_dir.c_str());
                    continue;
                }

                ProcessResult lr{};
                st = run_process(spec({"tar", "--no-same-owner", "-xf", layer.string(), "-C", layer_dir.string()}),
                                 cancel_, &lr);
                if (st.code == StatusCode::Cancelled || st.code == StatusCode::ScanTimeout) {
                    return fail_run(st, "layer unpack", lr, cfg_.timeout_ms, out_);
                }
                if (!is_ok(st) || lr.exit_code != 0) {
                    SCANPORT_LOG_WARN(tag_, "layer %s unpacked with errors: %s",
                                      layer.filename().c_str(), tail(lr.err, 512).c_str());
                }
                fs::remove(layer, ec);
            }
            return ok_status();
        }

        Status prepare_agent() {
            if (cfg_.agent_jar.empty()) {
                out_->status = OutcomeStatus::Failure;
                out_->detail = "no agent jar configured";
                out_->error = StatusCode::ScanInvocation;
                return make_status(StatusDomain::Scan, StatusCode::ScanInvocation);
            }

            if (updater_ != nullptr) {
                const Status us = updater_->ensure_present();
                if (!is_ok(us)) {
                    out_->status = OutcomeStatus::Failure;
                    out_->detail = "agent jar " + cfg_.agent_jar + " missing and could not be downloaded";
                    out_->error = StatusCode::ScanInvocation;
                    return make_status(StatusDomain::Scan, StatusCode::ScanInvocation, us.aux);
                }
            }

            struct stat st{};
            if (stat(cfg_.agent_jar.c_str(), &st) != 0) {
                const int e = errno;
                out_->status = OutcomeStatus::Failure;
                out_->detail = "agent jar " + cfg_.agent_jar + " unavailable: " + std::strerror(e);
                out_->error = StatusCode::ScanInvocation;
                return make_status(StatusDomain::Scan, StatusCode::ScanInvocation, static_cast<u32>(e));
            }

            const auto mtime = std::chrono::system_clock::from_time_t(st.st_mtime);
            if (std::chrono::system_clock::now() - mtime > kAgentMaxAge) {
                if (updater_ == nullptr) {
                    SCANPORT_LOG_WARN(tag_, "agent jar %s is older than 24 hours", cfg_.agent_jar.c_str());
                } else if (updater_->refresh_in_background()) {
                    SCANPORT_LOG_INFO(tag_, "scanning with the current agent while a newer one is fetched");
                }
            }

            // A hard link pins this exact jar even if a refresh renames a new
            // one into place mid-scan.
            const std::string link_path = work_dir_ + "/" + kAgentName;
            if (link(cfg_.agent_jar.c_str(), link_path.c_str()) == 0) {
                linked_agent_ = link_path;
                agent_path_ = link_path;
            } else {
                SCANPORT_LOG_WARN(tag_, "cannot hard-link agent jar (%s), using %s",
                                  std::strerror(errno), cfg_.agent_jar.c_str());
                agent_path_ = cfg_.agent_jar;
            }
            return ok_status();
        }

        Status prepare_config() {
            config_path_ = work_dir_ + "/" + kConfigName;

            if (cfg_.run_detect) {
                std::vector<std::string> argv{cfg_.java_path, "-jar", agent_path_, "-detect"};
                ProcessResult pr{};
                const Status st = run_process(spec(std::move(argv)), cancel_, &pr);
                if (st.code == StatusCode::Cancelled || st.code == StatusCode::ScanTimeout ||
                    st.code == StatusCode::ScanInvocation) {
                    return fail_run(st, "agent -detect", pr, cfg_.timeout_ms, out_);
                }
                if (!is_ok(st) || pr.exit_code != 0) {
                    SCANPORT_LOG_WARN(tag_, "agent -detect exited with %d, continuing without a base config",
                                      pr.exit_code);
                }
            } else if (!cfg_.base_config_path.empty()) {
                std::error_code ec;
                fs::copy_file(cfg_.base_config_path, config_path_, fs::copy_options::overwrite_existing, ec);
                if (ec) {
                    out_->status = OutcomeStatus::Failure;
                    out_->detail = "cannot copy base config " + cfg_.base_config_path + ": " + ec.message();
                    out_->error = StatusCode::ScanInvocation;
                    return make_status(StatusDomain::Scan, StatusCode::ScanInvocation,
                                       static_cast<u32>(ec.value()));
                }
            }

            std::vector<Property> props;
            std::vector<std::string> dropped;
            build_engine_properties(scan_, &props, &dropped);
            for (const std::string& key : dropped) {
                SCANPORT_LOG_WARN(tag_, "ignoring extraWsConfig key '%s'", key.c_str());
            }

            const Status st = write_file_append(config_path_, "\n" + render_properties(props));
            if (!is_ok(st)) {
                return internal("cannot write " + config_path_, st);
            }
            return ok_status();
        }

        Status run_agent(const std::string& target) {
            std::vector<std::string> argv;
            argv.reserve(cfg_.jvm_args.size() + 7);
            argv.push_back(cfg_.java_path);
            argv.insert(argv.end(), cfg_.jvm_args.begin(), cfg_.jvm_args.end());
            argv.insert(argv.end(), {"-jar", agent_path_, "-c", config_path_, "-d", target});

            SCANPORT_LOG_INFO(tag_, "agent start");
            ProcessResult pr{};
            const Status st = run_process(spec(std::move(argv)), cancel_, &pr);
            if (!is_ok(st)) {
                return fail_run(st, "scan engine", pr, cfg_.timeout_ms, out_);
            }

            out_->exit_code = pr.exit_code;
            out_->error = StatusCode::Ok;
            if (pr.exit_code == 0) {
                out_->status = OutcomeStatus::Success;
                out_->detail = std::move(pr.out);
            } else {
                out_->status = OutcomeStatus::Failure;
                out_->detail = std::move(pr.err);
                out_->detail += pr.out;
            }
            SCANPORT_LOG_INFO(tag_, "agent exited with %d", pr.exit_code);
            return ok_status();
        }

        const AgentConfig& cfg_;
        AgentUpdater* updater_;
        const ScanConfig& scan_;
        const CancelToken& cancel_;
        ScanOutcome* out_;
        const char* tag_;

        std::string work_dir_;
        std::string agent_path_;
        std::string linked_agent_;
        std::string config_path_;
    };
} // namespace

void build_engine_properties(const ScanConfig& cfg, std::vector<Property>* out, std::vector<std::string>* dropped) {
    if (out == nullptr) {
        return;
    }
    out->clear();
    out->reserve(6 + std::size(kDefaultProperties) + cfg.extra.size());

    out->emplace_back("apiKey", cfg.api_key);
    out->emplace_back("productToken", cfg.product_token);
    out->emplace_back("projectName", cfg.project_name);
    out->emplace_back("requesterEmail", cfg.requester_email);
    out->emplace_back("userKey", cfg.user_key);
    out->emplace_back("wss.url", cfg.wss_url);

    for (const auto& kv : kDefaultProperties) {
        out->emplace_back(kv[0], kv[1]);
    }

    for (const auto& [key, value] : cfg.extra) {
        if (is_reserved(key) || !key_is_safe(key)) {
            if (dropped != nullptr) {
                dropped->push_back(key);
            }
            continue;
        }
        out->emplace_back(key, value);
    }
}

std::string render_properties(const std::vector<Property>& props) {
    std::string text;
    for (const auto& [key, value] : props) {
        text += key;
        text += '=';
        // Line breaks would start a new property.
        for (char c : value) {
            if (c == '\n') {
                text += "\\n";
            } else if (c == '\r') {
                text += "\\r";
            } else {
                text += c;
            }
        }
        text += '\n';
    }
    return text;
}

Status AgentScanInvoker::invoke(const ScanConfig& config,
                                const std::string& archive_path,
                                const CancelToken& cancel,
                                ScanOutcome* out) noexcept {
    if (out == nullptr || archive_path.empty()) {
        return make_status(StatusDomain::Scan, StatusCode::Invalid);
    }
    return invoke_guarded(out, [&] {
        *out = ScanOutcome{};
        AgentRun run(cfg_, updater_, config, cancel, out);
        return run.run(archive_path);
    });
}

} // namespace scanport::scan
