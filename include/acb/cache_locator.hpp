#pragma once

#include <acb/result.hpp>
#include <string>
#include <unordered_map>

namespace acb {

enum class Platform { Linux, MacOS, Windows, Other };

Platform current_platform();
const char* platform_name(Platform p);

// Snapshot of the environment variables the locator may consult.
struct Environment {
    std::unordered_map<std::string, std::string> vars;

    // Value of `name`, or "" when unset
    std::string get(const std::string& name) const;

    // HOME and APPDATA from the running process
    static Environment from_process();
};

struct LocatorOptions {
    std::string base_dir;                       // overrides APPDATA/platform default
    std::string app_namespace = "api-console";
};

// Directory holding the build cache archives:
//   <base>/<app_namespace>/cache/builds
// where base is, in order: base_dir, $APPDATA, then
//   MacOS   $HOME/Library/Preferences
//   Linux   $HOME/.config
//   others  /var/local
// Fails with Config when the selected branch needs HOME and it is unset.
Result<std::string> resolve_cache_root(Platform platform,
                                       const Environment& env,
                                       const LocatorOptions& opts = LocatorOptions{});

} // namespace acb
