#pragma once

#include <string>
#include <vector>

#include "scanport/core/cancel.hpp"
#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"

namespace scanport::scan {
    using u32 = scanport::core::u32;
    using Status = scanport::core::Status;

    struct ProcessSpec {
        std::vector<std::string> argv;  // argv[0] is looked up on PATH
        std::string cwd;                // empty = inherit
        u32 timeout_ms{0};              // 0 = no limit
        u32 output_cap_bytes{4u << 20}; // per stream; excess is dropped
    };

    struct ProcessResult {
        int exit_code{-1};   // -1 when killed by a signal
        int term_signal{0};
        std::string out;
        std::string err;
        bool out_truncated{false};
        bool err_truncated{false};
    };

    // Runs argv as a child in its own process group with stdin on /dev/null,
    // capturing stdout and stderr. Ok once the child exits (any exit code).
    // ScanInvocation when it cannot be started (aux = errno), ScanTimeout when
    // timeout_ms elapses, Cancelled when cancel fires. On either of the last
    // two the whole process group is killed and reaped before returning.
    [[nodiscard]] Status run_process(const ProcessSpec& spec,
                                     const scanport::core::CancelToken& cancel,
                                     ProcessResult* out) noexcept;

} // namespace scanport::scan
