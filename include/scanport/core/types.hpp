#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace scanport::core{

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    // 16 random bytes rendered as 32 lowercase hex chars plus terminator.
    inline constexpr u32 kSessionIdChars = 32;

    struct SessionId {
        char s[kSessionIdChars + 1]{};

        [[nodiscard]] constexpr bool is_valid() const noexcept { return s[0] != '\0'; }
        [[nodiscard]] constexpr const char* c_str() const noexcept { return s; }
    };

    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_trivially_copyable_v<SessionId>);
    static_assert(std::is_standard_layout_v<SessionId>);

} // namespace scanport::core
