#include <acb/build_cache.hpp>
#include <acb/cache_key.hpp>
#include <acb/fs_util.hpp>
#include <acb/log.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace acb {

BuildCacheStore::BuildCacheStore(const BuilderOptions& opts) {
    init(opts, current_platform(), Environment::from_process());
}

BuildCacheStore::BuildCacheStore(const BuilderOptions& opts, Platform platform,
                                 const Environment& env) {
    init(opts, platform, env);
}

void BuildCacheStore::init(const BuilderOptions& opts, Platform platform,
                           const Environment& env) {
    if (opts.no_cache) {
        log::debug("build cache disabled by no-cache");
        return;
    }

    key_ = CacheKeyBuilder::compute_key(opts);
    log::debug("build cache hash is %s", key_.c_str());

    LocatorOptions locator;
    locator.base_dir = opts.cache.dir;
    locator.app_namespace = opts.cache.app_namespace;

    auto root = resolve_cache_root(platform, env, locator);
    if (root.is_err()) {
        log::warn("build cache disabled: %s", root.error().message.c_str());
        root_error_ = std::move(root).error();
        return;
    }
    root_ = std::move(root).value();
    enabled_ = true;
}

std::string BuildCacheStore::entry_path() const {
    if (!enabled_) return "";
    return (fs::path(root_) / (key_ + "." + ARCHIVE_EXTENSION)).string();
}

bool BuildCacheStore::exists() const {
    if (!enabled_) return false;
    std::error_code ec;
    return fs::is_regular_file(entry_path(), ec);
}

Result<UnpackReport> BuildCacheStore::restore(const std::string& destination_dir,
                                              const CancelToken* cancel) const {
    if (!enabled_) {
        return AcbError{AcbError::InvalidArg, "build cache is disabled",
            root_error_ ? root_error_->message : "caching was turned off with no-cache"};
    }

    std::string source = entry_path();
    if (!exists()) {
        return AcbError{AcbError::NotFound, "no cached build for this configuration",
            "key " + key_, source};
    }

    log::debug("opening cached build %s", source.c_str());
    auto report = reader_.unpack(source, destination_dir, cancel);
    if (report.is_ok()) {
        log::debug("build copied from cache");
    }
    return report;
}

Result<PackReport> BuildCacheStore::store(const std::string& source_dir,
                                          const CancelToken* cancel) const {
    if (!enabled_) {
        return Result<PackReport>::ok(PackReport{});
    }

    log::debug("caching build files to %s", root_.c_str());
    ACB_TRY(ensure_directory(root_));

    // Pack next to the entry and rename over it, so concurrent readers
    // never see a half-written archive
    std::string dest = entry_path();
    std::string tmp = scratch_path(dest, "tmp");

    auto report = writer_.pack(source_dir, tmp, cancel);
    if (report.is_err()) {
        remove_quietly(tmp);
        return report;
    }

    auto moved = replace_file(tmp, dest);
    if (moved.is_err()) {
        remove_quietly(tmp);
        return std::move(moved).error();
    }

    log::debug("cache build saved, %llu total bytes",
               static_cast<unsigned long long>(report.value().bytes_written));
    return report;
}

} // namespace acb
