#pragma once

#include <acb/archive.hpp>
#include <acb/cache_locator.hpp>
#include <acb/options.hpp>
#include <acb/result.hpp>
#include <optional>
#include <string>

namespace acb {

// Whole-build cache: one zip archive per cache key under the cache root.
//
// Layout:
//   <root>/<sha256 of tracked options>.zip
//
// The key and root are computed once, at construction, unless caching is
// disabled with `no-cache`.
class BuildCacheStore {
public:
    static constexpr const char* ARCHIVE_EXTENSION = "zip";

    // Resolves the root for the running platform and environment
    explicit BuildCacheStore(const BuilderOptions& opts);
    BuildCacheStore(const BuilderOptions& opts, Platform platform, const Environment& env);

    bool caching_enabled() const { return enabled_; }
    const std::string& key() const { return key_; }
    const std::string& root() const { return root_; }
    std::string entry_path() const;

    // Set when the cache root could not be resolved (caching is then off)
    const std::optional<AcbError>& root_error() const { return root_error_; }

    // True iff caching is enabled and <root>/<key>.zip is a regular file
    bool exists() const;

    // Extracts the cached build into `destination_dir`. Fails with NotFound
    // when there is no entry for the key; on any failure the destination is
    // left as it was.
    Result<UnpackReport> restore(const std::string& destination_dir,
                                 const CancelToken* cancel = nullptr) const;

    // Archives `source_dir` as the entry for the key, replacing any previous
    // entry atomically. No-op when caching is disabled.
    Result<PackReport> store(const std::string& source_dir,
                             const CancelToken* cancel = nullptr) const;

private:
    void init(const BuilderOptions& opts, Platform platform, const Environment& env);

    bool enabled_ = false;
    std::string key_;
    std::string root_;
    std::optional<AcbError> root_error_;
    ArchiveWriter writer_;
    ArchiveReader reader_;
};

} // namespace acb
