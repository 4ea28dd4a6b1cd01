#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

#include <signal.h>

#include "scanport/cli/commands.hpp"
#include "scanport/cli/options.hpp"
#include "scanport/client/submit.hpp"
#include "scanport/core/errors.hpp"
#include "scanport/core/log.hpp"
#include "scanport/scan/agent_invoker.hpp"
#include "scanport/scan/agent_updater.hpp"
#include "scanport/scan/slots.hpp"
#include "scanport/security/secrets.hpp"
#include "scanport/session/chunk_reader.hpp"
#include "scanport/server/server.hpp"
#include "scanport/storage/scratch.hpp"

using scanport::cli::OptionId;
using scanport::cli::OptionType;

// ========================================================================
// Defaults
// ========================================================================

namespace {
    constexpr scanport::core::u16 kDefaultPort = 8000;
    constexpr scanport::core::i64 kDefaultWorkers = 4;
    constexpr scanport::core::i64 kDefaultReadTimeoutMs = 60 * 1000;
    constexpr scanport::core::i64 kDefaultScanTimeoutMs = 60 * 60 * 1000;
    constexpr scanport::core::i64 kDefaultMaxChunkBytes = 16 << 20;
    constexpr scanport::core::u32 kMaxControlFrameBytes = 1u << 20;
    constexpr scanport::core::i64 kDefaultSubmitChunkBytes = 1 << 20;

    constexpr scanport::cli::OptionSpec kServeOptions[] = {
        {OptionId::Port, OptionType::I64, "port", 'p'},
        {OptionId::Bind, OptionType::String, "bind", 'b'},
        {OptionId::Workers, OptionType::I64, "workers", 'w'},
        {OptionId::ScratchRoot, OptionType::String, "scratch-root", '\0'},
        {OptionId::Java, OptionType::String, "java", '\0'},
        {OptionId::AgentJar, OptionType::String, "agent-jar", '\0'},
        {OptionId::AgentUrl, OptionType::String, "agent-url", '\0'},
        {OptionId::NoAgentUpdate, OptionType::Flag, "no-agent-update", '\0'},
        {OptionId::BaseConfig, OptionType::String, "base-config", '\0'},
        {OptionId::Detect, OptionType::Flag, "detect", '\0'},
        {OptionId::NoUnpack, OptionType::Flag, "no-unpack", '\0'},
        {OptionId::ReadTimeoutMs, OptionType::I64, "read-timeout-ms", '\0'},
        {OptionId::ScanTimeoutMs, OptionType::I64, "scan-timeout-ms", '\0'},
        {OptionId::MaxChunkBytes, OptionType::I64, "max-chunk-bytes", '\0'},
        {OptionId::MaxArchiveBytes, OptionType::I64, "max-archive-bytes", '\0'},
        {OptionId::TrailingWindowMs, OptionType::I64, "trailing-window-ms", '\0'},
        {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
        {OptionId::Quiet, OptionType::Flag, "quiet", 'q'},
        {OptionId::Help, OptionType::Flag, "help", 'h'},
    };

    constexpr scanport::cli::OptionSpec kSubmitOptions[] = {
        {OptionId::Host, OptionType::String, "host", 'H'},
        {OptionId::Port, OptionType::I64, "port", 'p'},
        {OptionId::Config, OptionType::String, "config", 'c'},
        {OptionId::ChunkSize, OptionType::I64, "chunk-size", '\0'},
        {OptionId::ReadTimeoutMs, OptionType::I64, "timeout-ms", '\0'},
        {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
        {OptionId::Quiet, OptionType::Flag, "quiet", 'q'},
        {OptionId::Help, OptionType::Flag, "help", 'h'},
    };

    constexpr scanport::cli::CommandSpec kCommands[] = {
        {scanport::cli::CommandId::Serve, "serve", "accept uploads and run scans"},
        {scanport::cli::CommandId::Submit, "submit", "upload an archive and print the scan result"},
        {scanport::cli::CommandId::Help, "help", "show this help"},
    };

    scanport::server::Server* g_server = nullptr;

    void stop_handler(int sig) {
        (void)sig;
        if (g_server != nullptr) {
            g_server->request_stop();
        }
    }

// ========================================================================
// Helpers
// ========================================================================

    void print_status_error(const char* context, scanport::core::Status s) {
        fprintf(stderr, "error: %s failed (code=%s, domain=%s, aux=%u)\n",
                context,
                scanport::core::status_code_name(s.code),
                scanport::core::status_domain_name(s.domain),
                s.aux);
        if ((s.code == scanport::core::StatusCode::Io || s.code == scanport::core::StatusCode::Network) && s.aux != 0) {
            fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
        }
    }

    const char* env_or(const char* name, const char* fallback) {
        const char* v = std::getenv(name);
        return (v != nullptr && *v != '\0') ? v : fallback;
    }

    const char* string_opt(const scanport::cli::ParsedOptions& opts, OptionId id, const char* fallback) {
        const scanport::cli::ParsedOption* o = scanport::cli::find_option(opts, id);
        return o != nullptr ? o->value.str : fallback;
    }

    bool flag_opt(const scanport::cli::ParsedOptions& opts, OptionId id) {
        return scanport::cli::find_option(opts, id) != nullptr;
    }

    // Integer option within [lo, hi]; prints the error itself.
    bool int_opt(const scanport::cli::ParsedOptions& opts, OptionId id, const char* name,
                 scanport::core::i64 lo, scanport::core::i64 hi, scanport::core::i64 fallback,
                 scanport::core::i64* out) {
        const scanport::cli::ParsedOption* o = scanport::cli::find_option(opts, id);
        const scanport::core::i64 v = o != nullptr ? o->value.i64v : fallback;
        if (v < lo || v > hi) {
            fprintf(stderr, "error: --%s must be between %lld and %lld\n", name,
                    static_cast<long long>(lo), static_cast<long long>(hi));
            return false;
        }
        *out = v;
        return true;
    }

    void apply_log_level(const scanport::cli::ParsedOptions& opts) {
        if (flag_opt(opts, OptionId::Verbose)) {
            scanport::core::log_set_level(scanport::core::LogLevel::Debug);
        } else if (flag_opt(opts, OptionId::Quiet)) {
            scanport::core::log_set_level(scanport::core::LogLevel::Warn);
        }
    }

    std::string default_scratch_root() {
        return std::string(env_or("TMPDIR", "/tmp")) + "/scanport";
    }

// ========================================================================
// Command Handlers
// ========================================================================

    void handle_help() {
        printf("usage: scanport <command> [options]\n\n");
        printf("Commands:\n");
        for (const auto& c : kCommands) {
            printf("  %-8s %s\n", c.name, c.summary);
        }
        printf("\nserve options:\n");
        printf("  -p, --port N             listen port (default %u)\n", static_cast<unsigned>(kDefaultPort));
        printf("  -b, --bind ADDR          listen address (default 0.0.0.0)\n");
        printf("  -w, --workers N          concurrent scans (default %lld)\n", static_cast<long long>(kDefaultWorkers));
        printf("      --scratch-root DIR   session scratch root ($SCANPORT_SCRATCH_ROOT)\n");
        printf("      --java PATH          java executable ($SCANPORT_JAVA, default java)\n");
        printf("      --agent-jar PATH     unified agent jar ($SCANPORT_AGENT_JAR)\n");
        printf("      --agent-url URL      where to fetch the agent jar ($SCANPORT_AGENT_URL)\n");
        printf("      --no-agent-update    never download or refresh the agent jar\n");
        printf("      --base-config PATH   agent config to start from\n");
        printf("      --detect             generate the base config with -detect\n");
        printf("      --no-unpack          scan the archive without unpacking it\n");
        printf("      --read-timeout-ms N  wait per inbound frame (default %lld)\n", static_cast<long long>(kDefaultReadTimeoutMs));
        printf("      --scan-timeout-ms N  wait for the engine (default %lld)\n", static_cast<long long>(kDefaultScanTimeoutMs));
        printf("      --max-chunk-bytes N  largest chunk accepted (default %lld)\n", static_cast<long long>(kDefaultMaxChunkBytes));
        printf("      --max-archive-bytes N  largest archive accepted (default unlimited)\n");
        printf("      --trailing-window-ms N  listen for excess data after the archive (default %u)\n",
               static_cast<unsigned>(scanport::session::kDefaultTrailingWindowMs));
        printf("  -v, --verbose / -q, --quiet\n");
        printf("\nsubmit options: <archive>\n");
        printf("  -H, --host HOST          server host (default 127.0.0.1)\n");
        printf("  -p, --port N             server port (default %u)\n", static_cast<unsigned>(kDefaultPort));
        printf("  -c, --config FILE        scan configuration JSON\n");
        printf("      --chunk-size N       bytes per chunk (default %lld)\n", static_cast<long long>(kDefaultSubmitChunkBytes));
        printf("      --timeout-ms N       wait for the reply (default unlimited)\n");
    }

    int handle_serve(const scanport::cli::CliArgs& args) {
        scanport::cli::ParsedOption buf[64]{};
        scanport::cli::ParsedOptions opts{buf, 0, 64};
        scanport::core::u32 consumed = 0;
        scanport::core::Status s = scanport::cli::parse_options(
            args, kServeOptions, sizeof(kServeOptions) / sizeof(kServeOptions[0]), &opts, &consumed);
        if (!scanport::core::is_ok(s)) {
            fprintf(stderr, "error: serve: bad option %s\n", s.aux < args.argc ? args.argv[s.aux] : "");
            return 2;
        }
        if (consumed != args.argc) {
            fprintf(stderr, "error: serve: unexpected argument %s\n", args.argv[consumed]);
            return 2;
        }
        if (flag_opt(opts, OptionId::Help)) {
            handle_help();
            return 0;
        }
        apply_log_level(opts);

        scanport::core::i64 port = 0, workers = 0, read_timeout = 0, scan_timeout = 0, max_chunk = 0, max_archive = 0;
        scanport::core::i64 trailing_window = 0;
        if (!int_opt(opts, OptionId::Port, "port", 0, 65535, kDefaultPort, &port) ||
            !int_opt(opts, OptionId::Workers, "workers", 1, 1024, kDefaultWorkers, &workers) ||
            !int_opt(opts, OptionId::ReadTimeoutMs, "read-timeout-ms", 0, 0x7fffffff, kDefaultReadTimeoutMs, &read_timeout) ||
            !int_opt(opts, OptionId::ScanTimeoutMs, "scan-timeout-ms", 0, 0x7fffffff, kDefaultScanTimeoutMs, &scan_timeout) ||
            !int_opt(opts, OptionId::MaxChunkBytes, "max-chunk-bytes", 1, 0x7fffffff, kDefaultMaxChunkBytes, &max_chunk) ||
            !int_opt(opts, OptionId::MaxArchiveBytes, "max-archive-bytes", 0, INT64_MAX, 0, &max_archive) ||
            !int_opt(opts, OptionId::TrailingWindowMs, "trailing-window-ms", 0, 60 * 1000,
                     scanport::session::kDefaultTrailingWindowMs, &trailing_window)) {
            return 2;
        }

        scanport::scan::AgentConfig agent{};
        agent.java_path = string_opt(opts, OptionId::Java, env_or("SCANPORT_JAVA", "java"));
        agent.agent_jar = string_opt(opts, OptionId::AgentJar, env_or("SCANPORT_AGENT_JAR", ""));
        agent.base_config_path = string_opt(opts, OptionId::BaseConfig, "");
        agent.run_detect = flag_opt(opts, OptionId::Detect);
        agent.unpack_layers = !flag_opt(opts, OptionId::NoUnpack);
        agent.timeout_ms = static_cast<scanport::core::u32>(scan_timeout);
        if (agent.agent_jar.empty()) {
            fprintf(stderr, "error: serve: no agent jar (use --agent-jar or SCANPORT_AGENT_JAR)\n");
            return 2;
        }

        s = scanport::security::secrets_init();
        if (!scanport::core::is_ok(s)) {
            print_status_error("libsodium init", s);
            return 1;
        }

        const std::string scratch_root =
            string_opt(opts, OptionId::ScratchRoot, env_or("SCANPORT_SCRATCH_ROOT", default_scratch_root().c_str()));
        scanport::storage::ScratchArea scratch(scratch_root);
        s = scratch.init();
        if (!scanport::core::is_ok(s)) {
            print_status_error("scratch root", s);
            return 1;
        }

        scanport::scan::AgentSource source{};
        source.url = string_opt(opts, OptionId::AgentUrl, env_or("SCANPORT_AGENT_URL", scanport::scan::kAgentDownloadUrl));
        source.jar_path = agent.agent_jar;
        scanport::scan::AgentUpdater updater(std::move(source));
        const bool auto_update = !flag_opt(opts, OptionId::NoAgentUpdate);
        if (auto_update) {
            s = scanport::scan::fetch_init();
            if (!scanport::core::is_ok(s)) {
                print_status_error("libcurl init", s);
                return 1;
            }
            // A failed download here is retried by the first scan that needs the jar.
            s = updater.ensure_present();
            if (!scanport::core::is_ok(s)) {
                SCANPORT_LOG_WARN(nullptr, "agent jar %s unavailable at startup", agent.agent_jar.c_str());
            } else {
                updater.refresh_in_background();
            }
        }

        scanport::scan::InvocationSlots slots(static_cast<scanport::core::u32>(workers));
        scanport::scan::AgentScanInvoker invoker(std::move(agent), auto_update ? &updater : nullptr);

        scanport::session::SessionResources res{};
        res.scratch = &scratch;
        res.slots = &slots;
        res.invoker = &invoker;
        res.decoder.max_frame_bytes = kMaxControlFrameBytes;
        res.decoder.metadata.max_chunk_bytes = static_cast<scanport::core::u32>(max_chunk);
        res.decoder.metadata.max_archive_bytes = static_cast<scanport::core::u64>(max_archive);
        res.decoder.read_timeout_ms = static_cast<scanport::core::u32>(read_timeout);
        res.decoder.trailing_window_ms = static_cast<scanport::core::u32>(trailing_window);

        scanport::server::ServerConfig scfg{};
        scfg.bind_address = string_opt(opts, OptionId::Bind, "0.0.0.0");
        scfg.port = static_cast<scanport::core::u16>(port);

        scanport::server::Server server(scfg, res);
        s = server.listen();
        if (!scanport::core::is_ok(s)) {
            print_status_error("listen", s);
            return 1;
        }

        g_server = &server;
        struct sigaction sa{};
        sa.sa_handler = stop_handler;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
        signal(SIGPIPE, SIG_IGN);

        SCANPORT_LOG_INFO(nullptr, "scratch=%s workers=%lld agent=%s", scratch_root.c_str(),
                          static_cast<long long>(workers), invoker.config().agent_jar.c_str());
        s = server.serve();
        g_server = nullptr;
        if (!scanport::core::is_ok(s)) {
            print_status_error("serve", s);
            return 1;
        }
        return 0;
    }

    int handle_submit(const scanport::cli::CliArgs& args) {
        scanport::cli::ParsedOption buf[32]{};
        scanport::cli::ParsedOptions opts{buf, 0, 32};
        scanport::core::u32 consumed = 0;
        scanport::core::Status s = scanport::cli::parse_options(
            args, kSubmitOptions, sizeof(kSubmitOptions) / sizeof(kSubmitOptions[0]), &opts, &consumed);
        if (!scanport::core::is_ok(s)) {
            fprintf(stderr, "error: submit: bad option %s\n", s.aux < args.argc ? args.argv[s.aux] : "");
            return 2;
        }
        if (flag_opt(opts, OptionId::Help)) {
            handle_help();
            return 0;
        }
        apply_log_level(opts);
        if (consumed + 1 != args.argc) {
            fprintf(stderr, "error: submit: expected exactly one archive path\n");
            return 2;
        }
        const char* archive = args.argv[consumed];
        const char* config_path = string_opt(opts, OptionId::Config, nullptr);
        if (config_path == nullptr) {
            fprintf(stderr, "error: submit: --config is required\n");
            return 2;
        }

        scanport::core::i64 port = 0, chunk = 0, timeout = 0;
        if (!int_opt(opts, OptionId::Port, "port", 1, 65535, kDefaultPort, &port) ||
            !int_opt(opts, OptionId::ChunkSize, "chunk-size", 1, 0x7fffffff, kDefaultSubmitChunkBytes, &chunk) ||
            !int_opt(opts, OptionId::ReadTimeoutMs, "timeout-ms", 0, 0x7fffffff, 0, &timeout)) {
            return 2;
        }

        scanport::net::ScanConfig cfg{};
        std::string detail;
        s = scanport::client::load_config_file(config_path, &cfg, &detail);
        if (!scanport::core::is_ok(s)) {
            fprintf(stderr, "error: submit: %s\n", detail.empty() ? config_path : detail.c_str());
            return 2;
        }

        signal(SIGPIPE, SIG_IGN);
        scanport::net::FdStream stream;
        const char* host = string_opt(opts, OptionId::Host, "127.0.0.1");
        s = scanport::client::connect_tcp(host, static_cast<scanport::core::u16>(port), &stream);
        if (!scanport::core::is_ok(s)) {
            print_status_error("connect", s);
            scanport::security::wipe_config(&cfg);
            return 1;
        }

        scanport::client::SubmitOptions sopts{};
        sopts.chunk_size = static_cast<scanport::core::u32>(chunk);
        sopts.reply_timeout_ms = static_cast<scanport::core::u32>(timeout);
        scanport::client::SubmitReply reply{};
        s = scanport::client::submit_file(stream, cfg, archive, sopts, &reply);
        scanport::security::wipe_config(&cfg);
        if (!scanport::core::is_ok(s)) {
            print_status_error("submit", s);
            return 1;
        }

        if (reply.type == scanport::net::FrameType::Error) {
            fprintf(stderr, "error: %s: %s\n", reply.error.kind.c_str(), reply.error.message.c_str());
            return 1;
        }
        const bool ok = reply.outcome.status == scanport::net::OutcomeStatus::Success;
        fwrite(reply.outcome.detail.data(), 1, reply.outcome.detail.size(), stdout);
        if (!reply.outcome.detail.empty() && reply.outcome.detail.back() != '\n') {
            fputc('\n', stdout);
        }
        if (reply.outcome.error != scanport::core::StatusCode::Ok) {
            fprintf(stderr, "error: %s\n", scanport::core::error_kind_name(reply.outcome.error));
        }
        fprintf(stderr, "%s (exit code %d)\n", ok ? "success" : "failure", reply.outcome.exit_code);
        return ok ? 0 : 1;
    }
} // namespace

// ========================================================================
// Entry Point
// ========================================================================

int main(int argc, char** argv) {
    if (argc < 2) {
        handle_help();
        return 2;
    }
    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        handle_help();
        return 0;
    }

    const scanport::cli::CliArgs args{argv + 1, static_cast<scanport::core::u32>(argc - 1)};
    scanport::cli::CommandInvocation inv{};
    scanport::core::u32 consumed = 0;
    const scanport::core::Status s = scanport::cli::parse_command(
        args, kCommands, sizeof(kCommands) / sizeof(kCommands[0]), &inv, &consumed);
    if (!scanport::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s' (try 'scanport help')\n", argv[1]);
        return 2;
    }

    switch (inv.id) {
        case scanport::cli::CommandId::Serve:
            return handle_serve(inv.args);
        case scanport::cli::CommandId::Submit:
            return handle_submit(inv.args);
        case scanport::cli::CommandId::Help:
            handle_help();
            return 0;
        case scanport::cli::CommandId::None:
            break;
    }
    handle_help();
    return 2;
}
