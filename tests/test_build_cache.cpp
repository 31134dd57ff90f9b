#include <catch2/catch.hpp>
#include <acb/build_cache.hpp>
#include <acb/sha256.hpp>
#include "helpers.hpp"

using namespace acb;

static BuilderOptions cache_options(const TempDir& dir, const std::string& tag = "4.0.0") {
    BuilderOptions o;
    o.tag_name = tag;
    o.cache.dir = (dir / "cache").string();
    return o;
}

static BuildCacheStore make_store(const BuilderOptions& o) {
    return BuildCacheStore(o, Platform::Linux, Environment{});
}

TEST_CASE("Store layout is <root>/<key>.zip", "[build_cache]") {
    TempDir dir("bc_layout");
    auto store = make_store(cache_options(dir));

    REQUIRE(store.caching_enabled());
    REQUIRE(store.key() == SHA256::hash_hex("tn:5:4.0.0;"));
    REQUIRE(store.root() == (dir / "cache/api-console/cache/builds").string());
    REQUIRE(store.entry_path() == store.root() + "/" + store.key() + ".zip");
}

TEST_CASE("no-cache disables every operation", "[build_cache]") {
    TempDir dir("bc_disabled");
    auto o = cache_options(dir);
    o.no_cache = true;
    auto store = make_store(o);

    REQUIRE_FALSE(store.caching_enabled());
    REQUIRE(store.key().empty());
    REQUIRE_FALSE(store.exists());
    REQUIRE_FALSE(store.root_error().has_value());

    write_file(dir / "out/index.html", "x");
    auto stored = store.store((dir / "out").string());
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().entries.empty());
    REQUIRE_FALSE(fs::exists(dir / "cache"));

    auto restored = store.restore((dir / "dest").string());
    REQUIRE(restored.is_err());
    REQUIRE(restored.error().code == AcbError::InvalidArg);
}

TEST_CASE("Unresolvable root disables caching", "[build_cache]") {
    BuilderOptions o;
    o.tag_name = "4.0.0";
    auto store = BuildCacheStore(o, Platform::Linux, Environment{});

    REQUIRE_FALSE(store.caching_enabled());
    REQUIRE(store.root_error().has_value());
    REQUIRE(store.root_error()->code == AcbError::Config);
    REQUIRE_FALSE(store.exists());
}

TEST_CASE("exists follows the entry file", "[build_cache]") {
    TempDir dir("bc_exists");
    auto store = make_store(cache_options(dir));
    REQUIRE_FALSE(store.exists());

    write_file(store.entry_path(), "placeholder");
    REQUIRE(store.exists());

    fs::remove(store.entry_path());
    REQUIRE_FALSE(store.exists());
}

TEST_CASE("Restoring a missing entry is NotFound", "[build_cache]") {
    TempDir dir("bc_missing");
    auto store = make_store(cache_options(dir));
    auto r = store.restore((dir / "dest").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AcbError::NotFound);
    REQUIRE_FALSE(fs::exists(dir / "dest"));
}

TEST_CASE("Store then restore a console build", "[build_cache]") {
    TempDir dir("bc_roundtrip");
    write_file(dir / "build/index.html", "<html></html>");
    write_file(dir / "build/styles/app.css", "body{}");

    auto store = make_store(cache_options(dir));
    auto stored = store.store((dir / "build").string());
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().bytes_written > 0);
    REQUIRE(store.exists());

    // A second store for the same options sees the same entry
    auto again = make_store(cache_options(dir));
    REQUIRE(again.exists());

    auto restored = again.restore((dir / "restored").string());
    REQUIRE(restored.is_ok());
    REQUIRE(read_file(dir / "restored/index.html") == "<html></html>");
    REQUIRE(read_file(dir / "restored/styles/app.css") == "body{}");
}

TEST_CASE("Different options use different entries", "[build_cache]") {
    TempDir dir("bc_keys");
    write_file(dir / "build/index.html", "v4");

    auto v4 = make_store(cache_options(dir, "4.0.0"));
    auto v5 = make_store(cache_options(dir, "5.0.0"));
    REQUIRE(v4.entry_path() != v5.entry_path());

    REQUIRE(v4.store((dir / "build").string()).is_ok());
    REQUIRE(v4.exists());
    REQUIRE_FALSE(v5.exists());
}

TEST_CASE("Storing twice replaces the entry", "[build_cache]") {
    TempDir dir("bc_idempotent");
    auto store = make_store(cache_options(dir));

    write_file(dir / "build/index.html", "first");
    REQUIRE(store.store((dir / "build").string()).is_ok());

    write_file(dir / "build/index.html", "second");
    REQUIRE(store.store((dir / "build").string()).is_ok());

    // Only the entry remains in the root, no temporary files
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(store.root())) {
        REQUIRE(e.path().string() == store.entry_path());
        ++n;
    }
    REQUIRE(n == 1);

    REQUIRE(store.restore((dir / "dest").string()).is_ok());
    REQUIRE(read_file(dir / "dest/index.html") == "second");
}

TEST_CASE("Failed store keeps the previous entry", "[build_cache]") {
    TempDir dir("bc_failed_store");
    auto store = make_store(cache_options(dir));

    write_file(dir / "build/index.html", "good");
    REQUIRE(store.store((dir / "build").string()).is_ok());
    auto before = read_file(store.entry_path());

    auto r = store.store((dir / "does-not-exist").string());
    REQUIRE(r.is_err());
    REQUIRE(read_file(store.entry_path()) == before);
}

TEST_CASE("Corrupt entry fails restore without touching the destination", "[build_cache]") {
    TempDir dir("bc_corrupt");
    auto store = make_store(cache_options(dir));
    write_file(store.entry_path(), "garbage");
    write_file(dir / "dest/index.html", "old");

    auto r = store.restore((dir / "dest").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AcbError::Archive);
    REQUIRE(read_file(dir / "dest/index.html") == "old");
}
