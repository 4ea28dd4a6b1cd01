#pragma once

#include <cerrno>
#include <new>
#include <string>

#include "scanport/core/cancel.hpp"
#include "scanport/core/errors.hpp"
#include "scanport/net/protocol.hpp"

namespace scanport::scan {
    using Status = scanport::core::Status;

    // Runs the scan engine once against a materialized archive.
    //
    // Ok means the engine ran to completion; out->status says whether it
    // reported success. A non-Ok status means it could not produce a verdict:
    // ScanInvocation (launch failed), ScanTimeout, CorruptArchive, or
    // Cancelled when cancel fired. out->detail carries diagnostics in every
    // case. Implementations never retry.
    class ScanInvoker {
    public:
        virtual ~ScanInvoker() = default;

        [[nodiscard]] virtual Status invoke(const scanport::net::ScanConfig& config,
                                            const std::string& archive_path,
                                            const scanport::core::CancelToken& cancel,
                                            scanport::net::ScanOutcome* out) noexcept = 0;
    };

    // Runs an invoker body, turning allocation failure into a ScanInvocation
    // outcome so it cannot escape a noexcept invoke().
    template <typename Body>
    [[nodiscard]] Status invoke_guarded(scanport::net::ScanOutcome* out, Body&& body) noexcept {
        try {
            return body();
        } catch (const std::bad_alloc&) {
            out->status = scanport::net::OutcomeStatus::Failure;
            out->error = scanport::core::StatusCode::ScanInvocation;
            out->detail.clear();
            return scanport::core::make_status(scanport::core::StatusDomain::Scan,
                                               scanport::core::StatusCode::ScanInvocation, ENOMEM);
        }
    }

} // namespace scanport::scan
