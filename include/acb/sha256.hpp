#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace acb {

using Sha256Digest = std::array<uint8_t, 32>;

// Incremental SHA-256 (FIPS 180-4).
class SHA256 {
public:
    SHA256();

    void update(const void* data, size_t len);
    void update(const std::string& s);

    // Pads the message and returns the digest. The hasher is reset
    // afterwards and can be reused for a new message.
    Sha256Digest finish();
    std::string finish_hex();

    static std::string hash_hex(const std::string& input);
    static std::string to_hex(const Sha256Digest& digest);

private:
    void reset();
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_;
    uint64_t message_len_;
};

} // namespace acb
