#pragma once

#include <type_traits>

#include "scanport/cli/options.hpp"
#include "scanport/core/errors.hpp"

namespace scanport::cli {
    using u32 = scanport::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Serve = 2,
        Submit = 3,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* summary{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs; args of the result is the remainder.
    [[nodiscard]] scanport::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace scanport::cli
