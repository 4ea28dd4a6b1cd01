#pragma once

#include <string>
#include <utility>
#include <vector>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/net/framing.hpp"

namespace scanport::net {
    using u64 = scanport::core::u64;
    using i64 = scanport::core::i64;
    using Status = scanport::core::Status;
    using StatusCode = scanport::core::StatusCode;

    // Segment 1.
    struct TransferMetadata {
        u32 chunk_size{0};
        u64 length{0};
    };

    struct MetadataLimits {
        u32 max_chunk_bytes{0};   // 0 = unbounded
        u64 max_archive_bytes{0}; // 0 = unbounded
    };

    // Mandatory config keys, as bits of the MissingConfigField aux mask.
    enum class ConfigField : u32 {
        ApiKey = 0,
        ProductToken,
        ProjectName,
        RequesterEmail,
        UserKey,
        WssUrl,
    };
    inline constexpr u32 kMandatoryFieldCount = 6;

    [[nodiscard]] constexpr u32 config_field_bit(ConfigField f) noexcept {
        return 1u << static_cast<u32>(f);
    }

    // Wire key ("apiKey", "wssUrl", ...).
    [[nodiscard]] const char* config_field_name(ConfigField f) noexcept;

    // "userKey" or "apiKey, wssUrl" for a MissingConfigField mask.
    [[nodiscard]] std::string missing_fields_list(u32 mask);

    // Segment 2. apiKey is the organization token; see DESIGN.md.
    struct ScanConfig {
        std::string api_key;
        std::string product_token;
        std::string project_name;
        std::string requester_email;
        std::string user_key;
        std::string wss_url;
        // extraWsConfig, sorted by key; non-string values as compact JSON.
        std::vector<std::pair<std::string, std::string>> extra;
    };

    enum class OutcomeStatus : u8 {
        Pending = 0,
        Success,
        Failure,
    };

    // Final answer of a session, carried by a Result frame. error is Ok for
    // an engine run that completed (either way) and names the failure kind
    // otherwise (ScanTimeout, ScanInvocation, CorruptArchive).
    struct ScanOutcome {
        OutcomeStatus status{OutcomeStatus::Pending};
        std::string detail;
        int exit_code{-1};
        StatusCode error{StatusCode::Ok};
    };

    // Early failure, carried by an Error frame.
    struct ErrorMessage {
        std::string kind;
        std::string message;
    };

    // MalformedMetadata on bad JSON, wrong types, chunkSize <= 0, length < 0
    // or a limit violation; detail says which.
    [[nodiscard]] Status decode_metadata(BufferView payload,
                                         const MetadataLimits& limits,
                                         TransferMetadata* out,
                                         std::string* detail) noexcept;

    // UnexpectedSegment when the payload is not a JSON object or
    // extraWsConfig is not an object. MissingConfigField when mandatory keys
    // are absent, empty or not strings; aux holds the ConfigField mask.
    [[nodiscard]] Status decode_config(BufferView payload,
                                       ScanConfig* out,
                                       std::string* detail) noexcept;

    [[nodiscard]] Status encode_metadata(const TransferMetadata& m, std::string* out) noexcept;
    [[nodiscard]] Status encode_config(const ScanConfig& c, std::string* out) noexcept;

    [[nodiscard]] Status encode_result(const ScanOutcome& o, std::string* out) noexcept;
    [[nodiscard]] Status decode_result(BufferView payload, ScanOutcome* out) noexcept;

    [[nodiscard]] Status encode_error(StatusCode kind, const std::string& message, std::string* out) noexcept;
    [[nodiscard]] Status decode_error(BufferView payload, ErrorMessage* out) noexcept;

    [[nodiscard]] inline BufferView as_view(const std::string& s) noexcept {
        return BufferView{reinterpret_cast<const u8*>(s.data()), static_cast<u32>(s.size())};
    }

} // namespace scanport::net
