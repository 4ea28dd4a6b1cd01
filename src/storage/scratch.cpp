#include "scanport/storage/scratch.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace scanport::storage {

using namespace scanport::core;

// ========================================================================
// Directory helpers
// ========================================================================

Status create_directories(const char* path) noexcept {
    if (path == nullptr || path[0] == '\0') {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    char tmp[1024];
    const int n = snprintf(tmp, sizeof(tmp), "%s", path);
    if (n < 0 || static_cast<size_t>(n) >= sizeof(tmp)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    // Walk the path creating each component in turn.
    for (char* p = tmp + 1; *p != '\0'; ++p) {
        if (*p != '/') {
            continue;
        }
        *p = '\0';
        if (mkdir(tmp, 0700) != 0 && errno != EEXIST) {
            return make_status(StatusDomain::Storage, StatusCode::Io, errno);
        }
        *p = '/';
    }
    if (mkdir(tmp, 0700) != 0 && errno != EEXIST) {
        return make_status(StatusDomain::Storage, StatusCode::Io, errno);
    }

    struct stat st{};
    if (stat(tmp, &st) != 0) {
        return make_status(StatusDomain::Storage, StatusCode::Io, errno);
    }
    if (!S_ISDIR(st.st_mode)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    return ok_status();
}

namespace {
    int remove_entry(const char* path, const struct stat*, int, struct FTW*) {
        if (::remove(path) != 0 && errno != ENOENT) {
            return errno;
        }
        return 0;
    }
} // namespace

Status remove_tree(const char* path) noexcept {
    if (path == nullptr || path[0] == '\0') {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    struct stat st{};
    if (lstat(path, &st) != 0) {
        if (errno == ENOENT) {
            return ok_status();
        }
        return make_status(StatusDomain::Storage, StatusCode::Io, errno);
    }

    // Depth-first, never following symlinks out of the tree.
    const int rc = nftw(path, remove_entry, 16, FTW_DEPTH | FTW_PHYS);
    if (rc != 0) {
        return make_status(StatusDomain::Storage, StatusCode::Io, rc > 0 ? static_cast<u32>(rc) : errno);
    }
    return ok_status();
}

// ========================================================================
// ScratchArea
// ========================================================================

Status ScratchArea::init() noexcept {
    if (root_.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    return create_directories(root_.c_str());
}

std::string ScratchArea::session_dir(const SessionId& id) const {
    return root_ + "/" + id.c_str();
}

Status ScratchArea::create_session_dir(const SessionId& id, std::string* out) noexcept {
    if (out == nullptr || !id.is_valid()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::string dir = session_dir(id);
    if (mkdir(dir.c_str(), 0700) != 0) {
        if (errno == EEXIST) {
            return make_status(StatusDomain::Storage, StatusCode::Busy);
        }
        return make_status(StatusDomain::Storage, StatusCode::Io, errno);
    }
    *out = std::move(dir);
    return ok_status();
}

Status ScratchArea::remove_session_dir(const SessionId& id) noexcept {
    if (!id.is_valid()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    return remove_tree(session_dir(id).c_str());
}

// ========================================================================
// ArchiveWriter
// ========================================================================

ArchiveWriter::~ArchiveWriter() noexcept {
    abort();
}

Status ArchiveWriter::open(const std::string& dir, u64 expected_bytes) noexcept {
    if (fd_ >= 0 || dir.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    dir_ = dir;
    partial_path_ = dir + "/" + kArchivePartialName;
    expected_ = expected_bytes;
    hasher_.reset();

    fd_ = ::open(partial_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        return make_status(StatusDomain::Storage, StatusCode::Io, errno);
    }
    return ok_status();
}

Status ArchiveWriter::write(BufferView data) noexcept {
    if (fd_ < 0 || (data.len > 0 && data.data == nullptr)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (data.len > expected_ - bytes_written()) {
        return make_status(StatusDomain::Storage, StatusCode::Overflow, data.len);
    }

    u32 written = 0;
    while (written < data.len) {
        const ssize_t n = ::write(fd_, data.data + written, data.len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_status(StatusDomain::Storage, StatusCode::Io, errno);
        }
        written += static_cast<u32>(n);
    }
    return hasher_.update(data);
}

Status ArchiveWriter::commit(ArchiveInfo* out) noexcept {
    if (out == nullptr || fd_ < 0) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (bytes_written() != expected_) {
        const u64 got = bytes_written();
        abort();
        return make_status(StatusDomain::Storage, StatusCode::TruncatedStream,
                           got > 0xffffffffull ? 0xffffffffu : static_cast<u32>(got));
    }

    if (fsync(fd_) != 0) {
        const int e = errno;
        abort();
        return make_status(StatusDomain::Storage, StatusCode::Io, e);
    }
    ::close(fd_);
    fd_ = -1;

    std::string final_path = dir_ + "/" + kArchiveName;
    if (rename(partial_path_.c_str(), final_path.c_str()) != 0) {
        const int e = errno;
        unlink(partial_path_.c_str());
        partial_path_.clear();
        return make_status(StatusDomain::Storage, StatusCode::Io, e);
    }
    partial_path_.clear();

    out->path = std::move(final_path);
    out->size_bytes = bytes_written();
    hasher_.finalize(&out->digest);
    return ok_status();
}

void ArchiveWriter::abort() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!partial_path_.empty()) {
        unlink(partial_path_.c_str());
        partial_path_.clear();
    }
}

Status materialize(ScratchArea& area, const SessionId& id, BufferView bytes, ArchiveInfo* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::string dir;
    Status s = area.create_session_dir(id, &dir);
    if (s.code == StatusCode::Busy) {
        dir = area.session_dir(id);
    } else if (!is_ok(s)) {
        return s;
    }

    ArchiveWriter writer;
    s = writer.open(dir, bytes.len);
    if (!is_ok(s)) {
        return s;
    }
    s = writer.write(bytes);
    if (!is_ok(s)) {
        writer.abort();
        return s;
    }
    return writer.commit(out);
}

} // namespace scanport::storage
