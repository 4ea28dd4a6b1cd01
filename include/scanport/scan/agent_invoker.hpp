#pragma once

#include <string>
#include <utility>
#include <vector>

#include "scanport/scan/agent_updater.hpp"
#include "scanport/scan/invoker.hpp"
#include "scanport/scan/process.hpp"

namespace scanport::scan {

    struct AgentConfig {
        std::string java_path{"java"};
        std::string agent_jar;
        std::vector<std::string> jvm_args{"-Xms256m", "-Xmx512m"};
        std::string base_config_path;   // copied as the config base when set
        bool run_detect{false};         // otherwise: java -jar agent -detect
        bool unpack_layers{true};
        u32 timeout_ms{0};              // engine wall clock; 0 = unbounded
        u32 output_cap_bytes{4u << 20};
    };

    using Property = std::pair<std::string, std::string>;

    // Engine property list for cfg: the six mandatory keys under their engine
    // names, the fixed defaults, then extraWsConfig. Extra keys that name a
    // mandatory or default property (or contain '=', ':' or a line break) are
    // skipped and reported through dropped.
    void build_engine_properties(const scanport::net::ScanConfig& cfg,
                                 std::vector<Property>* out,
                                 std::vector<std::string>* dropped);

    // Renders properties as "key=value" lines.
    [[nodiscard]] std::string render_properties(const std::vector<Property>& props);

    // Runs the unified agent through java -jar inside <archive dir>/scan.
    // With an updater, a missing jar is downloaded before the run and a stale
    // one is refreshed in the background.
    class AgentScanInvoker final : public ScanInvoker {
    public:
        explicit AgentScanInvoker(AgentConfig cfg, AgentUpdater* updater = nullptr)
            : cfg_(std::move(cfg)), updater_(updater) {}

        [[nodiscard]] Status invoke(const scanport::net::ScanConfig& config,
                                    const std::string& archive_path,
                                    const scanport::core::CancelToken& cancel,
                                    scanport::net::ScanOutcome* out) noexcept override;

        [[nodiscard]] const AgentConfig& config() const noexcept { return cfg_; }

    private:
        AgentConfig cfg_;
        AgentUpdater* updater_;
    };

} // namespace scanport::scan
