#include <catch2/catch.hpp>
#include <acb/fs_util.hpp>
#include "helpers.hpp"

#include <fcntl.h>

using namespace acb;

TEST_CASE("scratch_path is a hidden sibling", "[fs_util]") {
    auto p = fs::path(scratch_path("/tmp/cache/abc.zip", "tmp"));
    REQUIRE(p.parent_path() == "/tmp/cache");

    std::string name = p.filename().string();
    REQUIRE(name.rfind(".abc.zip.tmp-", 0) == 0);
    REQUIRE(name.size() == std::string(".abc.zip.tmp-").size() + 16);
}

TEST_CASE("scratch_path handles a trailing slash", "[fs_util]") {
    auto p = fs::path(scratch_path("/tmp/out/build/", "restore"));
    REQUIRE(p.parent_path() == "/tmp/out");
    REQUIRE(p.filename().string().rfind(".build.restore-", 0) == 0);
}

TEST_CASE("scratch_path is unique per call", "[fs_util]") {
    REQUIRE(scratch_path("/tmp/x", "t") != scratch_path("/tmp/x", "t"));
}

TEST_CASE("ensure_directory creates nested directories", "[fs_util]") {
    TempDir dir("fs_mkdir");
    auto nested = (dir / "a/b/c").string();
    REQUIRE(ensure_directory(nested).is_ok());
    REQUIRE(fs::is_directory(nested));
    REQUIRE(ensure_directory(nested).is_ok());
}

TEST_CASE("ensure_directory fails on a regular file", "[fs_util]") {
    TempDir dir("fs_mkdir_file");
    write_file(dir / "plain", "x");
    auto r = ensure_directory((dir / "plain").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AcbError::IO);
}

TEST_CASE("replace_file overwrites the destination", "[fs_util]") {
    TempDir dir("fs_replace");
    write_file(dir / "new", "fresh");
    write_file(dir / "old", "stale");

    REQUIRE(replace_file((dir / "new").string(), (dir / "old").string()).is_ok());
    REQUIRE(read_file(dir / "old") == "fresh");
    REQUIRE_FALSE(fs::exists(dir / "new"));
}

TEST_CASE("promote_children replaces same-named children only", "[fs_util]") {
    TempDir dir("fs_promote");
    write_file(dir / "scratch/index.html", "new index");
    write_file(dir / "scratch/styles/app.css", "new css");
    write_file(dir / "dest/index.html", "old index");
    write_file(dir / "dest/styles/old.css", "old css");
    write_file(dir / "dest/keep.txt", "untouched");

    REQUIRE(promote_children((dir / "scratch").string(), (dir / "dest").string()).is_ok());

    REQUIRE(read_file(dir / "dest/index.html") == "new index");
    REQUIRE(read_file(dir / "dest/styles/app.css") == "new css");
    REQUIRE_FALSE(fs::exists(dir / "dest/styles/old.css"));
    REQUIRE(read_file(dir / "dest/keep.txt") == "untouched");
    REQUIRE_FALSE(fs::exists(dir / "scratch"));
}

TEST_CASE("promote_children swaps a directory for a file without leftovers", "[fs_util]") {
    TempDir dir("fs_promote_swap");
    write_file(dir / "scratch/styles", "now a file");
    write_file(dir / "dest/styles/app.css", "old css");

    REQUIRE(promote_children((dir / "scratch").string(), (dir / "dest").string()).is_ok());
    REQUIRE(read_file(dir / "dest/styles") == "now a file");

    for (const auto& e : fs::directory_iterator(dir / "dest")) {
        REQUIRE(e.path().filename().string().find(".old-") == std::string::npos);
    }
}

TEST_CASE("promote_children puts the old child back when the move fails", "[fs_util]") {
    // The scratch directory is itself the child being replaced, so once it is
    // moved aside its own child can no longer be renamed into place
    TempDir dir("fs_promote_undo");
    write_file(dir / "dest/x/x", "inner");

    auto r = promote_children((dir / "dest/x").string(), (dir / "dest").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AcbError::IO);
    REQUIRE(read_file(dir / "dest/x/x") == "inner");

    for (const auto& e : fs::directory_iterator(dir / "dest")) {
        REQUIRE(e.path().filename() == "x");
    }
}

TEST_CASE("remove_quietly tolerates missing paths", "[fs_util]") {
    TempDir dir("fs_remove");
    write_file(dir / "tree/a/b.txt", "x");
    remove_quietly((dir / "tree").string());
    REQUIRE_FALSE(fs::exists(dir / "tree"));
    remove_quietly((dir / "tree").string());
}

TEST_CASE("is_safe_relative_path", "[fs_util]") {
    REQUIRE(is_safe_relative_path("index.html"));
    REQUIRE(is_safe_relative_path("styles/app.css"));
    REQUIRE(is_safe_relative_path("a/./b"));

    REQUIRE_FALSE(is_safe_relative_path(""));
    REQUIRE_FALSE(is_safe_relative_path("/etc/passwd"));
    REQUIRE_FALSE(is_safe_relative_path("../escape.txt"));
    REQUIRE_FALSE(is_safe_relative_path("a/../../b"));
}

TEST_CASE("FileDescriptor closes once and moves ownership", "[fs_util]") {
    TempDir dir("fs_fd");
    write_file(dir / "f", "data");

    FileDescriptor a(::open((dir / "f").c_str(), O_RDONLY));
    REQUIRE(a.is_open());

    FileDescriptor b(std::move(a));
    REQUIRE_FALSE(a.is_open());
    REQUIRE(b.is_open());

    REQUIRE(b.close().is_ok());
    REQUIRE_FALSE(b.is_open());
    REQUIRE(b.close().is_ok());
}
