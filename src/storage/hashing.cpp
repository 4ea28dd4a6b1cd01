#include "scanport/storage/hashing.hpp"

#include <cstddef>

namespace scanport::storage {
    scanport::core::Status hash_compute(BufferView data, scanport::core::Hash256* out) noexcept {
        if (out == nullptr){
            return scanport::core::make_status(scanport::core::StatusDomain::Storage, scanport::core::StatusCode::Invalid);
        }

        Hasher hasher;
        const scanport::core::Status s = hasher.update(data);
        if (!scanport::core::is_ok(s)){
            return s;
        }
        hasher.finalize(out);
        return scanport::core::ok_status();
    }

    void hash_to_hex(const scanport::core::Hash256& h, char* out, std::size_t out_size) noexcept {
        static const char hex[] = "0123456789abcdef";
        if (out == nullptr || out_size == 0){
            return;
        }
        std::size_t pos = 0;
        for (std::size_t i = 0; i < h.b.size() && pos + 2 < out_size; ++i){
            out[pos++] = hex[(h.b[i] >> 4) & 0xF];
            out[pos++] = hex[h.b[i] & 0xF];
        }
        out[pos] = '\0';
    }

    Hasher::Hasher() noexcept {
        reset();
    }

    void Hasher::reset() noexcept {
        blake3_hasher_init(&state_);
        bytes_ = 0;
    }

    scanport::core::Status Hasher::update(BufferView data) noexcept {
        if (data.len > 0 && data.data == nullptr){
            return scanport::core::make_status(scanport::core::StatusDomain::Storage, scanport::core::StatusCode::Invalid);
        }
        if (data.len > 0){
            blake3_hasher_update(&state_, data.data, static_cast<size_t>(data.len));
            bytes_ += data.len;
        }
        return scanport::core::ok_status();
    }

    // blake3_hasher_finalize does not modify the hasher, so more input may follow.
    void Hasher::finalize(scanport::core::Hash256* out) const noexcept {
        if (out == nullptr){
            return;
        }
        blake3_hasher_finalize(&state_, out->b.data(), out->b.size());
    }
} // namespace scanport::storage
