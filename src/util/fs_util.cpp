#include <acb/fs_util.hpp>
#include <acb/log.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace fs = std::filesystem;

namespace acb {

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

FileDescriptor::~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
}

Status FileDescriptor::close() {
    if (fd_ < 0) return ok_status();
    int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) {
        return AcbError{AcbError::IO, std::string("close() failed: ") + strerror(errno)};
    }
    return ok_status();
}

// /dev/urandom with a random_device fallback
static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

std::string scratch_path(const std::string& target, const std::string& tag) {
    static const char hex_chars[] = "0123456789abcdef";
    uint8_t bytes[8];
    fill_random_bytes(bytes, sizeof(bytes));

    std::string suffix;
    suffix.reserve(16);
    for (uint8_t b : bytes) {
        suffix += hex_chars[b >> 4];
        suffix += hex_chars[b & 0x0F];
    }

    fs::path p(target);
    std::string name = p.filename().string();
    if (name.empty()) name = p.parent_path().filename().string();
    fs::path parent = p.has_filename() ? p.parent_path() : p.parent_path().parent_path();
    return (parent / ("." + name + "." + tag + "-" + suffix)).string();
}

Status ensure_directory(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return AcbError{AcbError::IO,
            "cannot create directory: " + ec.message(), "", dir};
    }
    if (!fs::is_directory(dir, ec)) {
        return AcbError{AcbError::IO, "path exists but is not a directory", "", dir};
    }
    return ok_status();
}

void remove_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        log::debug("could not remove %s: %s", path.c_str(), ec.message().c_str());
    }
}

Status replace_file(const std::string& src, const std::string& dest) {
    std::error_code ec;
    fs::rename(src, dest, ec);
    if (ec) {
        return AcbError{AcbError::IO,
            "cannot move " + src + " into place: " + ec.message(), "", dest};
    }
    return ok_status();
}

Status promote_children(const std::string& scratch_dir, const std::string& dest_dir) {
    ACB_TRY(ensure_directory(dest_dir));

    std::error_code ec;
    std::vector<fs::path> children;
    for (fs::directory_iterator it(scratch_dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        return AcbError{AcbError::IO,
            "cannot list scratch directory: " + ec.message(), "", scratch_dir};
    }

    for (const auto& child : children) {
        fs::path target = fs::path(dest_dir) / child.filename();

        // Existing child moves aside first and comes back if the swap fails
        std::string backup;
        if (fs::exists(fs::symlink_status(target, ec))) {
            backup = scratch_path(target.string(), "old");
            fs::rename(target, backup, ec);
            if (ec) {
                return AcbError{AcbError::IO,
                    "cannot move existing path aside: " + ec.message(), "",
                    target.string()};
            }
        }

        fs::rename(child, target, ec);
        if (ec) {
            AcbError err{AcbError::IO,
                "cannot promote restored path: " + ec.message(), "",
                target.string()};
            if (!backup.empty()) {
                std::error_code undo_ec;
                fs::rename(backup, target, undo_ec);
                if (undo_ec) {
                    log::error("could not put %s back: %s", target.c_str(),
                               undo_ec.message().c_str());
                    err.hint = "previous contents left at " + backup;
                }
            }
            return err;
        }

        if (!backup.empty()) remove_quietly(backup);
    }

    remove_quietly(scratch_dir);
    return ok_status();
}

bool is_safe_relative_path(const std::string& name) {
    if (name.empty()) return false;
    fs::path p(name);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace acb
