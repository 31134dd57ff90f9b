#include <catch2/catch.hpp>
#include <acb/cache_locator.hpp>

using namespace acb;

static Environment env_with(std::initializer_list<std::pair<const std::string, std::string>> vars) {
    Environment env;
    env.vars = vars;
    return env;
}

TEST_CASE("Linux root under HOME/.config", "[cache_locator]") {
    auto r = resolve_cache_root(Platform::Linux, env_with({{"HOME", "/home/u"}}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "/home/u/.config/api-console/cache/builds");
}

TEST_CASE("macOS root under Library/Preferences", "[cache_locator]") {
    auto r = resolve_cache_root(Platform::MacOS, env_with({{"HOME", "/Users/u"}}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "/Users/u/Library/Preferences/api-console/cache/builds");
}

TEST_CASE("APPDATA wins over the platform default", "[cache_locator]") {
    auto env = env_with({{"HOME", "/home/u"}, {"APPDATA", "/data/roaming"}});
    for (auto p : {Platform::Linux, Platform::MacOS, Platform::Windows, Platform::Other}) {
        auto r = resolve_cache_root(p, env);
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == "/data/roaming/api-console/cache/builds");
    }
}

TEST_CASE("Other platforms fall back to /var/local", "[cache_locator]") {
    auto r = resolve_cache_root(Platform::Other, Environment{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "/var/local/api-console/cache/builds");

    auto w = resolve_cache_root(Platform::Windows, Environment{});
    REQUIRE(w.is_ok());
    REQUIRE(w.value() == "/var/local/api-console/cache/builds");
}

TEST_CASE("Base dir override wins over everything", "[cache_locator]") {
    LocatorOptions opts;
    opts.base_dir = "/tmp/acb";
    auto r = resolve_cache_root(Platform::Linux,
                                env_with({{"HOME", "/home/u"}, {"APPDATA", "/a"}}), opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "/tmp/acb/api-console/cache/builds");
}

TEST_CASE("Custom namespace", "[cache_locator]") {
    LocatorOptions opts;
    opts.app_namespace = "my-console";
    auto r = resolve_cache_root(Platform::Linux, env_with({{"HOME", "/home/u"}}), opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "/home/u/.config/my-console/cache/builds");
}

TEST_CASE("Missing HOME is a config error", "[cache_locator]") {
    for (auto p : {Platform::Linux, Platform::MacOS}) {
        auto r = resolve_cache_root(p, Environment{});
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == AcbError::Config);
    }
    auto empty_home = resolve_cache_root(Platform::Linux, env_with({{"HOME", ""}}));
    REQUIRE(empty_home.is_err());
}

TEST_CASE("Empty namespace is a config error", "[cache_locator]") {
    LocatorOptions opts;
    opts.app_namespace = "";
    auto r = resolve_cache_root(Platform::Other, Environment{}, opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AcbError::Config);
}

TEST_CASE("Environment lookup", "[cache_locator]") {
    auto env = env_with({{"HOME", "/home/u"}});
    REQUIRE(env.get("HOME") == "/home/u");
    REQUIRE(env.get("APPDATA").empty());
    REQUIRE(std::string(platform_name(Platform::MacOS)) == "darwin");
    REQUIRE(std::string(platform_name(Platform::Windows)) == "win32");
}
