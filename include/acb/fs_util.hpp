#pragma once

#include <acb/result.hpp>
#include <string>

namespace acb {

// Owning POSIX file descriptor. close() reports errors; the destructor
// closes silently.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;
    ~FileDescriptor();

    int get() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    Status close();

private:
    int fd_ = -1;
};

// Unique sibling of `target`: <parent>/.<name>.<tag>-<16 hex chars>.
// Nothing is created on disk.
std::string scratch_path(const std::string& target, const std::string& tag);

// mkdir -p
Status ensure_directory(const std::string& dir);

// Best-effort recursive removal; failures are logged at debug level.
void remove_quietly(const std::string& path);

// Atomically replaces `dest` with the file at `src` (same filesystem).
Status replace_file(const std::string& src, const std::string& dest);

// Moves every top-level child of `scratch_dir` into `dest_dir`, replacing
// same-named children, then removes `scratch_dir`. A replaced child is moved
// aside first and put back when its replacement cannot be moved in.
Status promote_children(const std::string& scratch_dir, const std::string& dest_dir);

// True for a non-empty relative path with no root and no ".." component.
bool is_safe_relative_path(const std::string& name);

} // namespace acb
