#pragma once

#include <string>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/net/protocol.hpp"

namespace scanport::security {
    // Initializes libsodium once per process. Unavailable if it cannot.
    [[nodiscard]] scanport::core::Status secrets_init() noexcept;

    // 16 bytes from the OS CSPRNG, hex encoded.
    [[nodiscard]] scanport::core::Status make_session_id(scanport::core::SessionId* out) noexcept;

    // Overwrites the string's bytes with zeros, then empties it.
    void wipe_string(std::string* s) noexcept;

    // Wipes every credential and extra value in cfg.
    void wipe_config(scanport::net::ScanConfig* cfg) noexcept;

} // namespace scanport::security
