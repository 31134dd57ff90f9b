#include <acb/cache_locator.hpp>
#include <acb/log.hpp>

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace acb {

Platform current_platform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Other;
#endif
}

const char* platform_name(Platform p) {
    switch (p) {
        case Platform::Linux:   return "linux";
        case Platform::MacOS:   return "darwin";
        case Platform::Windows: return "win32";
        case Platform::Other:   return "other";
    }
    return "unknown";
}

std::string Environment::get(const std::string& name) const {
    auto it = vars.find(name);
    return it == vars.end() ? std::string() : it->second;
}

Environment Environment::from_process() {
    Environment env;
    for (const char* name : {"HOME", "APPDATA"}) {
        if (const char* v = std::getenv(name)) env.vars[name] = v;
    }
    return env;
}

static Result<std::string> home_relative(const Environment& env, Platform platform,
                                         const char* suffix) {
    std::string home = env.get("HOME");
    if (home.empty()) {
        return AcbError{AcbError::Config,
            "cannot determine cache root: HOME is not set",
            std::string("set HOME, APPDATA or [cache] dir (platform ")
                + platform_name(platform) + ")"};
    }
    return Result<std::string>::ok((fs::path(home) / suffix).string());
}

Result<std::string> resolve_cache_root(Platform platform,
                                       const Environment& env,
                                       const LocatorOptions& opts) {
    std::string base;
    if (!opts.base_dir.empty()) {
        base = opts.base_dir;
    } else if (!env.get("APPDATA").empty()) {
        base = env.get("APPDATA");
    } else if (platform == Platform::MacOS) {
        auto r = home_relative(env, platform, "Library/Preferences");
        ACB_TRY(r);
        base = r.value();
    } else if (platform == Platform::Linux) {
        auto r = home_relative(env, platform, ".config");
        ACB_TRY(r);
        base = r.value();
    } else {
        base = "/var/local";
    }

    if (opts.app_namespace.empty()) {
        return AcbError{AcbError::Config,
            "cannot determine cache root: empty application namespace"};
    }

    std::string root = (fs::path(base) / opts.app_namespace / "cache" / "builds").string();
    log::debug("build cache root is %s", root.c_str());
    return Result<std::string>::ok(root);
}

} // namespace acb
