#include <catch2/catch.hpp>
#include <acb/log.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace acb;

namespace {

// Routes log output into a vector for the lifetime of the object
struct CapturedLog {
    std::vector<std::pair<log::Level, std::string>> lines;
    log::Level saved;

    explicit CapturedLog(log::Level lvl) : saved(log::get_level()) {
        log::set_level(lvl);
        log::set_sink([this](log::Level l, const std::string& msg) {
            lines.emplace_back(l, msg);
        });
    }
    ~CapturedLog() {
        log::set_sink(nullptr);
        log::set_level(saved);
    }
};

} // namespace

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    auto saved = log::get_level();
    for (auto lvl : {log::Trace, log::Debug, log::Info, log::Warn, log::Error}) {
        log::set_level(lvl);
        REQUIRE(log::get_level() == lvl);
    }
    log::set_level(saved);
}

TEST_CASE("level names parse back", "[log]") {
    for (auto lvl : {log::Trace, log::Debug, log::Info, log::Warn, log::Error}) {
        log::Level parsed;
        REQUIRE(log::parse_level(log::level_name(lvl), parsed));
        REQUIRE(parsed == lvl);
    }
    log::Level ignored;
    REQUIRE_FALSE(log::parse_level("verbose", ignored));
}

TEST_CASE("sink receives formatted messages", "[log]") {
    CapturedLog cap(log::Trace);
    log::info("restored %d files from %s", 3, "cache");
    log::warn("disk at %d%%", 95);

    REQUIRE(cap.lines.size() == 2);
    REQUIRE(cap.lines[0].first == log::Info);
    REQUIRE(cap.lines[0].second == "restored 3 files from cache");
    REQUIRE(cap.lines[1].first == log::Warn);
    REQUIRE(cap.lines[1].second == "disk at 95%");
}

TEST_CASE("messages below the level are dropped", "[log]") {
    CapturedLog cap(log::Warn);
    log::trace("t");
    log::debug("d");
    log::info("i");
    log::warn("w");
    log::error("e");

    REQUIRE(cap.lines.size() == 2);
    REQUIRE(cap.lines[0].second == "w");
    REQUIRE(cap.lines[1].second == "e");
}

TEST_CASE("long messages are not truncated", "[log]") {
    CapturedLog cap(log::Debug);
    std::string big(5000, 'x');
    log::debug("%s", big.c_str());
    REQUIRE(cap.lines.size() == 1);
    REQUIRE(cap.lines[0].second.size() == 5000);
}
