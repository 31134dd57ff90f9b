#pragma once

#include <acb/cancel.hpp>
#include <acb/result.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct archive;

namespace acb {

struct PackReport {
    std::vector<std::string> entries;    // archive names, in write order
    std::vector<std::string> warnings;   // benign problems that did not abort
    uint64_t bytes_written = 0;          // size of the finished archive
};

struct UnpackReport {
    std::vector<std::string> extracted;  // files written, relative to destination
    std::vector<std::string> skipped;    // directory markers
    std::vector<std::string> warnings;
};

// Packs a directory tree into a single zip archive.
//
// Every immediate child of the source directory is stored under its own
// name; directories are stored recursively with a "name/" marker entry
// followed by their subtree. Children are visited in sorted order so the
// same tree always yields the same entry sequence.
class ArchiveWriter {
public:
    // Deflate level 9 unless changed
    explicit ArchiveWriter(int compression_level = 9);

    // Streams file contents straight into `destination_archive`. A path that
    // disappears while packing is a warning; any other failure aborts and
    // removes the partially written archive.
    Result<PackReport> pack(const std::string& source_dir,
                            const std::string& destination_archive,
                            const CancelToken* cancel = nullptr) const;

private:
    int compression_level_;
};

struct ArchiveEntry {
    std::string name;
    bool is_directory = false;
    std::optional<int64_t> size;
    uint32_t mode = 0;
};

// Pull-based, forward-only view over the entries of a zip archive.
// next() may only be called once the previous entry's data has been
// consumed with copy_to() or abandoned.
class EntryCursor {
public:
    static Result<EntryCursor> open(const std::string& archive_path);

    EntryCursor(EntryCursor&&) noexcept;
    EntryCursor& operator=(EntryCursor&&) noexcept;
    ~EntryCursor();

    // Header of the next entry, std::nullopt once the archive is exhausted.
    // Warnings raised by the archive reader are appended to `warnings`.
    Result<std::optional<ArchiveEntry>> next(std::vector<std::string>* warnings = nullptr);

    // Streams the current entry's decompressed bytes to the open descriptor.
    Result<uint64_t> copy_to(int fd, const CancelToken* cancel = nullptr);

    const std::string& path() const { return path_; }

private:
    struct ReadDeleter {
        void operator()(struct ::archive* a) const;
    };

    EntryCursor(std::string path, struct ::archive* a);

    std::string path_;
    std::unique_ptr<struct ::archive, ReadDeleter> archive_;
};

// Unpacks a zip archive into a directory, one entry at a time.
//
// Entries are extracted into a scratch directory beside the destination and
// moved into the destination only after every entry succeeded, so a failed
// or cancelled unpack leaves the destination untouched.
class ArchiveReader {
public:
    Result<UnpackReport> unpack(const std::string& source_archive,
                                const std::string& destination_dir,
                                const CancelToken* cancel = nullptr) const;
};

} // namespace acb
