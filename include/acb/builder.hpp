#pragma once

#include <acb/build_cache.hpp>
#include <acb/bundler.hpp>
#include <acb/cancel.hpp>
#include <acb/options.hpp>
#include <acb/result.hpp>
#include <string>

namespace acb {

struct BuildOutcome {
    bool from_cache = false;
    bool cached = false;          // a fresh build was stored in the cache
    std::string destination;
    size_t file_count = 0;
};

// Builds the console into options.destination, reusing a cached build when
// one exists for the current options.
//
// A failed restore counts as a cache miss and falls through to a full build;
// a failed store is logged and does not fail the build. The cache entry is
// made from the bundler output alone, never from other files already in the
// destination.
class ConsoleBuilder {
public:
    explicit ConsoleBuilder(BuilderOptions opts);
    ConsoleBuilder(BuilderOptions opts, BuildCacheStore cache);

    Result<BuildOutcome> build(const CancelToken* cancel = nullptr) const;

    const BuildCacheStore& cache() const { return cache_; }

private:
    Status copy_output(const std::string& from, const std::string& to) const;

    BuilderOptions opts_;
    BuildCacheStore cache_;
    Bundler bundler_;
};

} // namespace acb
