#pragma once

#include <type_traits>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"

namespace scanport::cli {
    using u8 = scanport::core::u8;
    using u32 = scanport::core::u32;
    using i64 = scanport::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Port,
        Bind,
        Workers,
        ScratchRoot,
        Java,
        AgentJar,
        AgentUrl,
        NoAgentUpdate,
        BaseConfig,
        Detect,
        NoUnpack,
        ReadTimeoutMs,
        ScanTimeoutMs,
        MaxChunkBytes,
        MaxArchiveBytes,
        TrailingWindowMs,
        Verbose,
        Quiet,
        Host,
        Config,
        ChunkSize,
        Help,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-provided storage; parse_options never allocates.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options and stops at the first positional argument or
    // after "--". consumed is the number of argv entries used. Unknown
    // options, missing or malformed values and a full out buffer are Invalid
    // (aux = index of the offending argument).
    [[nodiscard]] scanport::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence of id, or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace scanport::cli
