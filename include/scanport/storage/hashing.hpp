#pragma once

#include <blake3.h>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/net/framing.hpp"

namespace scanport::storage {
    using u8 = scanport::core::u8;
    using u32 = scanport::core::u32;
    using u64 = scanport::core::u64;
    using BufferView = scanport::net::BufferView;

    [[nodiscard]] constexpr bool hash_is_zero(const scanport::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] scanport::core::Status hash_compute(BufferView data, scanport::core::Hash256* out) noexcept;

    // 64 lowercase hex chars plus terminator; out_size must be >= 65.
    void hash_to_hex(const scanport::core::Hash256& h, char* out, std::size_t out_size) noexcept;

    // Incremental BLAKE3 over data that arrives in pieces.
    class Hasher {
    public:
        Hasher() noexcept;

        void reset() noexcept;
        [[nodiscard]] scanport::core::Status update(BufferView data) noexcept;
        void finalize(scanport::core::Hash256* out) const noexcept;

        [[nodiscard]] u64 bytes() const noexcept { return bytes_; }

    private:
        blake3_hasher state_;
        u64 bytes_{0};
    };

} // namespace scanport::storage
