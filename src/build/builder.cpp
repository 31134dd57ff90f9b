#include <acb/builder.hpp>
#include <acb/fs_util.hpp>
#include <acb/log.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace acb {

static size_t count_files(const std::string& dir) {
    size_t n = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) ++n;
    }
    return n;
}

ConsoleBuilder::ConsoleBuilder(BuilderOptions opts)
    : ConsoleBuilder(opts, BuildCacheStore(opts)) {}

ConsoleBuilder::ConsoleBuilder(BuilderOptions opts, BuildCacheStore cache)
    : opts_(std::move(opts)),
      cache_(std::move(cache)),
      bundler_(opts_.working_dir, opts_.bundler) {}

Status ConsoleBuilder::copy_output(const std::string& from, const std::string& to) const {
    std::error_code ec;
    if (!fs::is_directory(from, ec)) {
        return AcbError{AcbError::NotFound,
            "bundler did not produce an output directory", "", from};
    }
    ACB_TRY(ensure_directory(to));

    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return AcbError{AcbError::IO,
            "cannot copy build output: " + ec.message(), "", to};
    }
    return ok_status();
}

Result<BuildOutcome> ConsoleBuilder::build(const CancelToken* cancel) const {
    auto report = opts_.validate();
    for (const auto& w : report.warnings) {
        log::warn("%s", w.c_str());
    }
    if (!report.ok()) {
        for (const auto& e : report.errors) {
            log::error("%s", e.c_str());
        }
        return AcbError{AcbError::Config, "invalid builder options",
            report.errors.front()};
    }

    BuildOutcome outcome;
    outcome.destination = opts_.destination;

    if (cache_.exists()) {
        log::info("restoring build from cache...");
        auto restored = cache_.restore(opts_.destination, cancel);
        if (restored.is_ok()) {
            outcome.from_cache = true;
            outcome.file_count = restored.value().extracted.size();
            log::info("build restored from cache (%zu files)", outcome.file_count);
            return Result<BuildOutcome>::ok(std::move(outcome));
        }
        if (restored.error().code == AcbError::Cancelled) {
            return std::move(restored).error();
        }
        log::warn("cache restore failed, rebuilding: %s",
                  restored.error().format().c_str());
    }

    ACB_TRY(bundler_.bundle());
    const std::string output = bundler_.output_dir();
    ACB_TRY(copy_output(output, opts_.destination));
    outcome.file_count = count_files(output);

    if (cache_.caching_enabled()) {
        auto stored = cache_.store(output, cancel);
        if (stored.is_ok()) {
            outcome.cached = true;
        } else {
            log::warn("could not cache the build: %s", stored.error().format().c_str());
        }
    }

    log::info("build finished: %zu files in %s", outcome.file_count,
              opts_.destination.c_str());
    return Result<BuildOutcome>::ok(std::move(outcome));
}

} // namespace acb
