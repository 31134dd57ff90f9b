#include <acb/archive.hpp>
#include <acb/fs_util.hpp>
#include <acb/log.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace acb {

namespace {

constexpr size_t BUFF_SIZE = 1 << 16;

struct WriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

struct EntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using WriteHandle = std::unique_ptr<struct archive, WriteDeleter>;
using EntryHandle = std::unique_ptr<struct archive_entry, EntryDeleter>;

std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

std::vector<fs::path> sorted_children(const fs::path& dir, std::error_code& ec) {
    std::vector<fs::path> children;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    std::sort(children.begin(), children.end());
    return children;
}

// Packing state for one archive. Helpers return an error only for failures
// that must abort; vanished paths and ARCHIVE_WARN land in report.warnings.
class Packer {
public:
    Packer(struct archive* out, PackReport& report, const CancelToken* cancel)
        : out_(out), report_(report), cancel_(cancel) {}

    Status add_child(const fs::path& path, const std::string& name) {
        if (is_cancelled(cancel_)) {
            return AcbError{AcbError::Cancelled, "packing cancelled", "", name};
        }

        std::error_code ec;
        fs::file_status st = fs::symlink_status(path, ec);
        if (ec || !fs::exists(st)) {
            warn(name, "path disappeared before it could be archived");
            return ok_status();
        }

        if (fs::is_regular_file(st)) {
            log::debug("adding %s file to the cache...", name.c_str());
            return add_file(path, name);
        }
        if (fs::is_directory(st)) {
            log::debug("adding %s directory to the cache...", name.c_str());
            return add_directory(path, name);
        }

        warn(name, "not a regular file or directory, skipped");
        return ok_status();
    }

private:
    void warn(const std::string& name, const std::string& what) {
        log::warn("%s: %s", name.c_str(), what.c_str());
        report_.warnings.push_back(name + ": " + what);
    }

    // ARCHIVE_WARN is benign, anything below it aborts
    Status check(int rc, const char* call, const std::string& name) {
        if (rc == ARCHIVE_OK) return ok_status();
        if (rc == ARCHIVE_WARN) {
            warn(name, std::string(call) + ": " + archive_message(out_));
            return ok_status();
        }
        return AcbError{AcbError::Archive,
            std::string(call) + "() - " + archive_message(out_), "", name};
    }

    Status add_directory(const fs::path& dir, const std::string& name) {
        struct stat st {};
        if (::stat(dir.c_str(), &st) != 0) {
            if (errno == ENOENT) {
                warn(name, "directory disappeared before it could be archived");
                return ok_status();
            }
            return AcbError{AcbError::IO,
                std::string("stat() failed: ") + strerror(errno), "", dir.string()};
        }

        EntryHandle entry(archive_entry_new());
        if (!entry) return AcbError{AcbError::Archive, "archive_entry_new() failed"};

        std::string marker = name + "/";
        archive_entry_set_pathname(entry.get(), marker.c_str());
        archive_entry_set_filetype(entry.get(), AE_IFDIR);
        archive_entry_set_perm(entry.get(), st.st_mode & 07777);
        archive_entry_set_mtime(entry.get(), st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
        ACB_TRY(check(archive_write_header(out_, entry.get()), "archive_write_header", marker));
        report_.entries.push_back(marker);

        std::error_code ec;
        auto children = sorted_children(dir, ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory) {
                warn(name, "directory disappeared while it was being archived");
                return ok_status();
            }
            return AcbError{AcbError::IO,
                "cannot list directory: " + ec.message(), "", dir.string()};
        }

        for (const auto& child : children) {
            ACB_TRY(add_child(child, name + "/" + child.filename().string()));
        }
        return ok_status();
    }

    Status add_file(const fs::path& path, const std::string& name) {
        FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
        if (!fd.is_open()) {
            if (errno == ENOENT) {
                warn(name, "file disappeared before it could be archived");
                return ok_status();
            }
            return AcbError{AcbError::IO,
                std::string("open() failed: ") + strerror(errno), "", path.string()};
        }

        struct stat st {};
        if (::fstat(fd.get(), &st) != 0) {
            return AcbError{AcbError::IO,
                std::string("fstat() failed: ") + strerror(errno), "", path.string()};
        }

        EntryHandle entry(archive_entry_new());
        if (!entry) return AcbError{AcbError::Archive, "archive_entry_new() failed"};

        archive_entry_set_pathname(entry.get(), name.c_str());
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), st.st_mode & 07777);
        archive_entry_set_mtime(entry.get(), st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
        archive_entry_set_size(entry.get(), st.st_size);
        ACB_TRY(check(archive_write_header(out_, entry.get()), "archive_write_header", name));

        // Never send more than the header announced
        int64_t remaining = st.st_size;
        char buff[BUFF_SIZE];
        while (remaining > 0) {
            if (is_cancelled(cancel_)) {
                return AcbError{AcbError::Cancelled, "packing cancelled", "", name};
            }
            size_t want = static_cast<size_t>(std::min<int64_t>(remaining, BUFF_SIZE));
            ssize_t r = ::read(fd.get(), buff, want);
            if (r < 0) {
                if (errno == EINTR) continue;
                return AcbError{AcbError::IO,
                    std::string("read() failed: ") + strerror(errno), "", path.string()};
            }
            if (r == 0) {
                return AcbError{AcbError::IO,
                    "file shrank while it was being archived", "", path.string()};
            }
            la_ssize_t w = archive_write_data(out_, buff, static_cast<size_t>(r));
            if (w < 0) {
                return AcbError{AcbError::Archive,
                    "archive_write_data() - " + archive_message(out_), "", name};
            }
            remaining -= r;
        }

        ACB_TRY(check(archive_write_finish_entry(out_), "archive_write_finish_entry", name));
        report_.entries.push_back(name);
        return fd.close();
    }

    struct archive* out_;
    PackReport& report_;
    const CancelToken* cancel_;
};

Result<PackReport> pack_into(const std::string& source_dir,
                             const std::string& destination,
                             int compression_level,
                             const CancelToken* cancel) {
    PackReport report;

    WriteHandle out(archive_write_new());
    if (!out) return AcbError{AcbError::Archive, "archive_write_new() failed"};

    if (archive_write_set_format_zip(out.get()) != ARCHIVE_OK) {
        return AcbError{AcbError::Archive,
            "archive_write_set_format_zip() - " + archive_message(out.get())};
    }

    std::string level = "zip:compression=deflate,zip:compression-level="
                        + std::to_string(compression_level);
    if (archive_write_set_options(out.get(), level.c_str()) != ARCHIVE_OK) {
        // Older libarchive lacks compression-level; default deflate still works
        std::string w = "compression options not applied: " + archive_message(out.get());
        log::warn("%s", w.c_str());
        report.warnings.push_back(w);
    }

    if (archive_write_open_filename(out.get(), destination.c_str()) != ARCHIVE_OK) {
        return AcbError{AcbError::IO,
            "archive_write_open_filename() - " + archive_message(out.get()), "",
            destination};
    }

    std::error_code ec;
    auto children = sorted_children(source_dir, ec);
    if (ec) {
        return AcbError{AcbError::IO,
            "cannot list build output: " + ec.message(), "", source_dir};
    }

    Packer packer(out.get(), report, cancel);
    for (const auto& child : children) {
        ACB_TRY(packer.add_child(child, child.filename().string()));
    }

    // Flushes buffered data and closes the output file; must succeed before
    // the archive can be considered complete
    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        return AcbError{AcbError::Archive,
            "archive_write_close() - " + archive_message(out.get()), "", destination};
    }

    report.bytes_written = fs::file_size(destination, ec);
    if (ec) {
        return AcbError{AcbError::IO,
            "cannot stat written archive: " + ec.message(), "", destination};
    }
    return Result<PackReport>::ok(std::move(report));
}

} // namespace

ArchiveWriter::ArchiveWriter(int compression_level)
    : compression_level_(std::clamp(compression_level, 1, 9)) {}

Result<PackReport> ArchiveWriter::pack(const std::string& source_dir,
                                       const std::string& destination_archive,
                                       const CancelToken* cancel) const {
    std::error_code ec;
    if (!fs::is_directory(source_dir, ec)) {
        return AcbError{AcbError::NotFound,
            "build output directory does not exist", "", source_dir};
    }

    auto result = pack_into(source_dir, destination_archive, compression_level_, cancel);
    if (result.is_err()) {
        log::error("%s", result.error().format().c_str());
        remove_quietly(destination_archive);
        return result;
    }

    log::debug("archive %s written, %llu total bytes", destination_archive.c_str(),
               static_cast<unsigned long long>(result.value().bytes_written));
    return result;
}

} // namespace acb
