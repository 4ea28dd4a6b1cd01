#pragma once

#include <cstdint>
#include <type_traits>

#include "scanport/core/types.hpp"

namespace scanport::net {
    using u8 = scanport::core::u8;
    using u16 = scanport::core::u16;
    using u32 = scanport::core::u32;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    // Every message on a session connection is one frame; the type tag is
    // what the segment decoder dispatches on.
    enum class FrameType : u16 {
        Metadata = 1,
        Config = 2,
        Chunk = 3,
        Result = 4,
        Error = 5,
    };

    struct FrameHeader {
        u16 version{1};
        FrameType type{FrameType::Metadata};
        u16 flags{0};
        u32 payload_len{0};
        u32 sequence{0};
    };

    // Layout (big-endian / network order):
    // 0..1 version(u16), 2..3 type(u16), 4..5 flags(u16), 6..7 reserved(u16=0),
    // 8..11 payload_len(u32), 12..15 sequence(u32).
    inline constexpr u32 kFrameHeaderBytes = 16;
    inline constexpr u16 kFrameVersion = 1;

    enum class FrameParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
    };

    [[nodiscard]] constexpr bool frame_header_valid(const FrameHeader& h, u32 max_payload) noexcept {
        return h.version == kFrameVersion && h.payload_len <= max_payload;
    }

    [[nodiscard]] const char* frame_type_name(FrameType t) noexcept;

    // Big-endian on wire. Returns bytes written (0 on failure).
    [[nodiscard]] u32 frame_write_header(const FrameHeader& h, BufferMut out) noexcept;

    // Parses a header from the first bytes of 'in' (does not consume).
    [[nodiscard]] FrameParseResult frame_read_header(BufferView in, FrameHeader* out) noexcept;

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
    static_assert(std::is_trivially_copyable_v<FrameHeader>);
    static_assert(std::is_standard_layout_v<FrameHeader>);

} // namespace scanport::net
