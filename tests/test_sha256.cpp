#include <catch2/catch.hpp>
#include <acb/sha256.hpp>

using namespace acb;

TEST_CASE("SHA256 empty string", "[sha256]") {
    REQUIRE(SHA256::hash_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SHA256 'abc' (NIST vector)", "[sha256]") {
    REQUIRE(SHA256::hash_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 two-block message (NIST vector)", "[sha256]") {
    REQUIRE(SHA256::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("SHA256 one million 'a'", "[sha256]") {
    SHA256 ctx;
    std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) ctx.update(chunk);
    REQUIRE(ctx.finish_hex() ==
            "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_CASE("SHA256 split updates match one-shot", "[sha256]") {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    for (size_t split : {size_t(0), size_t(1), size_t(55), size_t(56)}) {
        SHA256 ctx;
        ctx.update(msg.substr(0, split));
        ctx.update(msg.substr(split));
        REQUIRE(ctx.finish_hex() == SHA256::hash_hex(msg));
    }
}

TEST_CASE("SHA256 hasher is reusable after finish", "[sha256]") {
    SHA256 ctx;
    ctx.update("first message");
    ctx.finish();
    ctx.update("abc");
    REQUIRE(ctx.finish_hex() == SHA256::hash_hex("abc"));
}
