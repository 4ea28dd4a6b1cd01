#pragma once

#include <string>
#include <utility>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/storage/hashing.hpp"

namespace scanport::storage {

using SessionId = scanport::core::SessionId;
using Status = scanport::core::Status;

inline constexpr const char* kArchiveName = "archive.tar";
inline constexpr const char* kArchivePartialName = "archive.tar.partial";

// Creates path and any missing parents (mode 0700). Existing dirs are fine.
[[nodiscard]] Status create_directories(const char* path) noexcept;

// Recursively deletes path. A missing path is not an error.
[[nodiscard]] Status remove_tree(const char* path) noexcept;

// Scratch namespace shared by all sessions of one server. Each session gets
// <root>/<sessionId>; nothing else is ever written under root.
class ScratchArea {
public:
    explicit ScratchArea(std::string root) : root_(std::move(root)) {}

    // Creates root if needed.
    [[nodiscard]] Status init() noexcept;

    [[nodiscard]] const std::string& root() const noexcept { return root_; }
    [[nodiscard]] std::string session_dir(const SessionId& id) const;

    // Fails with Busy if the directory already exists.
    [[nodiscard]] Status create_session_dir(const SessionId& id, std::string* out) noexcept;

    // Idempotent: removing an absent session dir is Ok.
    [[nodiscard]] Status remove_session_dir(const SessionId& id) noexcept;

private:
    std::string root_;
};

struct ArchiveInfo {
    std::string path;
    u64 size_bytes{0};
    scanport::core::Hash256 digest{};
};

// Streaming archive writer. Bytes land in <dir>/archive.tar.partial and
// become visible as <dir>/archive.tar only after commit() checks the byte
// count, fsyncs and renames.
class ArchiveWriter {
public:
    ArchiveWriter() noexcept = default;
    ~ArchiveWriter() noexcept;

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // expected_bytes is the declared length commit() insists on.
    [[nodiscard]] Status open(const std::string& dir, u64 expected_bytes) noexcept;

    // Overflow if the write would pass expected_bytes.
    [[nodiscard]] Status write(BufferView data) noexcept;

    // TruncatedStream (aux = bytes written) on a short archive.
    [[nodiscard]] Status commit(ArchiveInfo* out) noexcept;

    // Closes and unlinks the partial file. Safe to call repeatedly.
    void abort() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] u64 bytes_written() const noexcept { return hasher_.bytes(); }
    [[nodiscard]] u64 expected_bytes() const noexcept { return expected_; }

private:
    std::string dir_;
    std::string partial_path_;
    int fd_{-1};
    u64 expected_{0};
    Hasher hasher_;
};

// One-shot form: writes bytes as the archive of session id.
[[nodiscard]] Status materialize(ScratchArea& area,
                                 const SessionId& id,
                                 BufferView bytes,
                                 ArchiveInfo* out) noexcept;

} // namespace scanport::storage
