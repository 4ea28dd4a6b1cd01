#include "scanport/core/errors.hpp"

namespace scanport::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Busy: return "Busy";
            case StatusCode::Io: return "Io";
            case StatusCode::Network: return "Network";
            case StatusCode::Timeout: return "Timeout";
            case StatusCode::Closed: return "Closed";
            case StatusCode::Cancelled: return "Cancelled";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::MalformedMetadata: return "MalformedMetadata";
            case StatusCode::UnexpectedSegment: return "UnexpectedSegment";
            case StatusCode::MissingConfigField: return "MissingConfigField";
            case StatusCode::TruncatedStream: return "TruncatedStream";
            case StatusCode::Overflow: return "Overflow";
            case StatusCode::ScanTimeout: return "ScanTimeout";
            case StatusCode::ScanInvocation: return "ScanInvocation";
            case StatusCode::CorruptArchive: return "CorruptArchive";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Net: return "Net";
            case StatusDomain::Session: return "Session";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Scan: return "Scan";
            case StatusDomain::Security: return "Security";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    const char* error_kind_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::MalformedMetadata: return "MalformedMetadataError";
            case StatusCode::UnexpectedSegment: return "UnexpectedSegmentError";
            case StatusCode::MissingConfigField: return "MissingConfigFieldError";
            case StatusCode::TruncatedStream: return "TruncatedStreamError";
            case StatusCode::Overflow: return "OverflowError";
            case StatusCode::ScanTimeout: return "ScanTimeoutError";
            case StatusCode::ScanInvocation: return "ScanInvocationError";
            case StatusCode::CorruptArchive: return "CorruptArchiveError";
            default:
                return "InternalError";
        }
    }
} // namespace scanport::core
