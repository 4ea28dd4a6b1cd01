#include "scanport/security/secrets.hpp"

#include <array>

#include <sodium.h>

namespace scanport::security {
    namespace {
        constexpr scanport::core::u32 kSessionIdBytes = scanport::core::kSessionIdChars / 2;
    } // namespace

    scanport::core::Status secrets_init() noexcept {
        // sodium_init is idempotent and thread-safe; 1 means already done.
        if (sodium_init() < 0) {
            return scanport::core::make_status(scanport::core::StatusDomain::External, scanport::core::StatusCode::Unavailable);
        }
        return scanport::core::ok_status();
    }

    scanport::core::Status make_session_id(scanport::core::SessionId* out) noexcept {
        if (out == nullptr) {
            return scanport::core::make_status(scanport::core::StatusDomain::Security, scanport::core::StatusCode::Invalid);
        }
        const scanport::core::Status init = secrets_init();
        if (!scanport::core::is_ok(init)) {
            return init;
        }

        std::array<unsigned char, kSessionIdBytes> raw{};
        randombytes_buf(raw.data(), raw.size());
        sodium_bin2hex(out->s, sizeof(out->s), raw.data(), raw.size());
        sodium_memzero(raw.data(), raw.size());
        return scanport::core::ok_status();
    }

    void wipe_string(std::string* s) noexcept {
        if (s == nullptr) {
            return;
        }
        if (!s->empty()) {
            sodium_memzero(s->data(), s->size());
        }
        s->clear();
    }

    void wipe_config(scanport::net::ScanConfig* cfg) noexcept {
        if (cfg == nullptr) {
            return;
        }
        wipe_string(&cfg->api_key);
        wipe_string(&cfg->product_token);
        wipe_string(&cfg->user_key);
        wipe_string(&cfg->requester_email);
        wipe_string(&cfg->wss_url);
        wipe_string(&cfg->project_name);
        for (auto& kv : cfg->extra) {
            wipe_string(&kv.first);
            wipe_string(&kv.second);
        }
        cfg->extra.clear();
    }
} // namespace scanport::security
