#include "scanport/cli/commands.hpp"

#include <cstring>

namespace scanport::cli {
    scanport::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return scanport::core::make_status(scanport::core::StatusDomain::Cli, scanport::core::StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return scanport::core::make_status(scanport::core::StatusDomain::Cli, scanport::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return scanport::core::make_status(scanport::core::StatusDomain::Cli, scanport::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return scanport::core::make_status(scanport::core::StatusDomain::Cli, scanport::core::StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name == nullptr || std::strcmp(s.name, cmd) != 0) {
                continue;
            }
            out->id = s.id;
            out->args.argv = args.argv + 1;
            out->args.argc = args.argc - 1;
            *consumed = 1;
            return scanport::core::ok_status();
        }
        return scanport::core::make_status(scanport::core::StatusDomain::Cli, scanport::core::StatusCode::NotFound);
    }
} // namespace scanport::cli
