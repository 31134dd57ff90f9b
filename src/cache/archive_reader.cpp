#include <acb/archive.hpp>
#include <acb/fs_util.hpp>
#include <acb/log.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace acb {

static constexpr size_t BUFF_SIZE = 1 << 16;

static std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

// ---------------------------------------------------------------------------
// EntryCursor
// ---------------------------------------------------------------------------

void EntryCursor::ReadDeleter::operator()(struct ::archive* a) const {
    archive_read_free(a);
}

EntryCursor::EntryCursor(std::string path, struct ::archive* a)
    : path_(std::move(path)), archive_(a) {}

EntryCursor::EntryCursor(EntryCursor&&) noexcept = default;
EntryCursor& EntryCursor::operator=(EntryCursor&&) noexcept = default;
EntryCursor::~EntryCursor() = default;

Result<EntryCursor> EntryCursor::open(const std::string& archive_path) {
    std::error_code ec;
    if (!fs::is_regular_file(archive_path, ec)) {
        return AcbError{AcbError::NotFound, "archive does not exist", "", archive_path};
    }

    struct ::archive* a = archive_read_new();
    if (!a) return AcbError{AcbError::Archive, "archive_read_new() failed"};
    EntryCursor cursor(archive_path, a);

    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, archive_path.c_str(), BUFF_SIZE) != ARCHIVE_OK) {
        return AcbError{AcbError::Archive,
            "archive_read_open_filename() - " + archive_message(a), "", archive_path};
    }
    return Result<EntryCursor>::ok(std::move(cursor));
}

Result<std::optional<ArchiveEntry>> EntryCursor::next(std::vector<std::string>* warnings) {
    struct archive_entry* entry = nullptr;
    int r = archive_read_next_header(archive_.get(), &entry);
    if (r == ARCHIVE_EOF) {
        return Result<std::optional<ArchiveEntry>>::ok(std::nullopt);
    }
    if (r == ARCHIVE_WARN) {
        std::string w = archive_message(archive_.get());
        log::warn("%s: %s", path_.c_str(), w.c_str());
        if (warnings) warnings->push_back(w);
    } else if (r != ARCHIVE_OK) {
        return AcbError{AcbError::Archive,
            "archive_read_next_header() - " + archive_message(archive_.get()), "", path_};
    }

    ArchiveEntry out;
    const char* name = archive_entry_pathname(entry);
    out.name = name ? name : "";
    out.is_directory = archive_entry_filetype(entry) == AE_IFDIR
                       || (!out.name.empty() && out.name.back() == '/');
    if (archive_entry_size_is_set(entry)) {
        out.size = archive_entry_size(entry);
    }
    out.mode = archive_entry_perm(entry);
    return Result<std::optional<ArchiveEntry>>::ok(std::move(out));
}

Result<uint64_t> EntryCursor::copy_to(int fd, const CancelToken* cancel) {
    uint64_t total = 0;
    char buff[BUFF_SIZE];
    for (;;) {
        if (is_cancelled(cancel)) {
            return AcbError{AcbError::Cancelled, "extraction cancelled"};
        }

        la_ssize_t r = archive_read_data(archive_.get(), buff, sizeof(buff));
        if (r == 0) break;
        if (r < 0) {
            return AcbError{AcbError::Archive,
                "archive_read_data() - " + archive_message(archive_.get())};
        }

        const char* p = buff;
        size_t left = static_cast<size_t>(r);
        while (left > 0) {
            ssize_t w = ::write(fd, p, left);
            if (w < 0) {
                if (errno == EINTR) continue;
                return AcbError{AcbError::IO,
                    std::string("write() failed: ") + strerror(errno)};
            }
            p += w;
            left -= static_cast<size_t>(w);
        }
        total += static_cast<uint64_t>(r);
    }
    return Result<uint64_t>::ok(total);
}

// ---------------------------------------------------------------------------
// ArchiveReader
// ---------------------------------------------------------------------------

// Writes one file entry below `root`. The output descriptor is closed
// before returning, so at most one entry is open at any time.
static Status extract_entry(EntryCursor& cursor, const ArchiveEntry& entry,
                            const fs::path& root, const CancelToken* cancel) {
    fs::path target = root / entry.name;
    ACB_TRY(ensure_directory(target.parent_path().string()));

    mode_t mode = entry.mode != 0 ? static_cast<mode_t>(entry.mode) : 0644;
    FileDescriptor fd(::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
    if (!fd.is_open()) {
        return AcbError{AcbError::IO,
            std::string("open() failed: ") + strerror(errno), "", entry.name};
    }

    auto copied = cursor.copy_to(fd.get(), cancel);
    if (copied.is_err()) {
        auto err = std::move(copied).error();
        err.file = entry.name;
        return err;
    }
    if (entry.size && static_cast<uint64_t>(*entry.size) != copied.value()) {
        return AcbError{AcbError::Archive,
            "entry size mismatch: expected " + std::to_string(*entry.size)
                + " bytes, got " + std::to_string(copied.value()),
            "", entry.name};
    }

    auto closed = fd.close();
    if (closed.is_err()) {
        auto err = std::move(closed).error();
        err.file = entry.name;
        return err;
    }
    return ok_status();
}

static Status unpack_into(EntryCursor& cursor, const fs::path& scratch,
                          UnpackReport& report, const CancelToken* cancel) {
    for (;;) {
        if (is_cancelled(cancel)) {
            return AcbError{AcbError::Cancelled, "extraction cancelled"};
        }

        auto next = cursor.next(&report.warnings);
        ACB_TRY(next);
        if (!next.value().has_value()) break;
        const ArchiveEntry& entry = *next.value();

        if (entry.is_directory) {
            log::trace("skipping directory marker %s", entry.name.c_str());
            report.skipped.push_back(entry.name);
            continue;
        }

        if (!is_safe_relative_path(entry.name)) {
            return AcbError{AcbError::Archive,
                "refusing to extract entry outside the destination", "", entry.name};
        }

        auto extracted = extract_entry(cursor, entry, scratch, cancel);
        if (extracted.is_err()) {
            auto err = std::move(extracted).error();
            log::warn("failed to restore %s: %s", entry.name.c_str(), err.message.c_str());
            return err;
        }
        report.extracted.push_back(entry.name);
    }
    return ok_status();
}

Result<UnpackReport> ArchiveReader::unpack(const std::string& source_archive,
                                           const std::string& destination_dir,
                                           const CancelToken* cancel) const {
    // EntryCursor is move-only, so no ACB_TRY here
    auto cursor = EntryCursor::open(source_archive);
    if (cursor.is_err()) return std::move(cursor).error();

    fs::path dest(destination_dir);
    fs::path parent = dest.has_filename() ? dest.parent_path() : dest.parent_path().parent_path();
    if (!parent.empty()) {
        ACB_TRY(ensure_directory(parent.string()));
    }

    std::string scratch = scratch_path(destination_dir, "restore");
    ACB_TRY(ensure_directory(scratch));

    UnpackReport report;
    auto status = unpack_into(cursor.value(), scratch, report, cancel);
    if (status.is_err()) {
        remove_quietly(scratch);
        auto err = std::move(status).error();
        if (err.hint.empty()) {
            err.hint = std::to_string(report.extracted.size())
                       + " entries had been extracted; destination left unchanged";
        }
        return err;
    }

    auto promoted = promote_children(scratch, destination_dir);
    if (promoted.is_err()) {
        remove_quietly(scratch);
        return std::move(promoted).error();
    }

    log::debug("restored %zu files from %s", report.extracted.size(),
               source_archive.c_str());
    return Result<UnpackReport>::ok(std::move(report));
}

} // namespace acb
