#include <acb/sha256.hpp>
#include <algorithm>
#include <cstring>

namespace acb {

// Round constants, FIPS 180-4 section 4.2.2
static constexpr uint32_t K[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

// Initial hash value, FIPS 180-4 section 5.3.3
static constexpr uint32_t H0[8] = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

static inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

SHA256::SHA256() {
    reset();
}

void SHA256::reset() {
    std::memcpy(h_.data(), H0, sizeof(H0));
    pending_len_ = 0;
    message_len_ = 0;
}

void SHA256::compress(const uint8_t* block) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) {
        const uint8_t* p = block + i * 4;
        w[i] = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16)
             | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    }
    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    uint32_t v[8];
    std::memcpy(v, h_.data(), sizeof(v));

    for (int i = 0; i < 64; ++i) {
        // v = {a, b, c, d, e, f, g, h}
        uint32_t s1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
        uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
        uint32_t t1 = v[7] + s1 + choose + K[i] + w[i];
        uint32_t s0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
        uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
        uint32_t t2 = s0 + majority;

        std::memmove(v + 1, v, 7 * sizeof(uint32_t));
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (int i = 0; i < 8; ++i) h_[i] += v[i];
}

void SHA256::update(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    message_len_ += len;

    while (len > 0) {
        if (pending_len_ == 0 && len >= 64) {
            compress(p);
            p += 64;
            len -= 64;
            continue;
        }
        size_t take = std::min(len, pending_.size() - pending_len_);
        std::memcpy(pending_.data() + pending_len_, p, take);
        pending_len_ += take;
        p += take;
        len -= take;
        if (pending_len_ == pending_.size()) {
            compress(pending_.data());
            pending_len_ = 0;
        }
    }
}

void SHA256::update(const std::string& s) {
    update(s.data(), s.size());
}

Sha256Digest SHA256::finish() {
    uint64_t bit_len = message_len_ * 8;

    pending_[pending_len_++] = 0x80;
    if (pending_len_ > 56) {
        std::memset(pending_.data() + pending_len_, 0, 64 - pending_len_);
        compress(pending_.data());
        pending_len_ = 0;
    }
    std::memset(pending_.data() + pending_len_, 0, 56 - pending_len_);
    for (int i = 0; i < 8; ++i) {
        pending_[56 + i] = uint8_t(bit_len >> (56 - 8 * i));
    }
    compress(pending_.data());

    Sha256Digest out;
    for (int i = 0; i < 8; ++i) {
        out[i * 4]     = uint8_t(h_[i] >> 24);
        out[i * 4 + 1] = uint8_t(h_[i] >> 16);
        out[i * 4 + 2] = uint8_t(h_[i] >> 8);
        out[i * 4 + 3] = uint8_t(h_[i]);
    }
    reset();
    return out;
}

std::string SHA256::finish_hex() {
    return to_hex(finish());
}

std::string SHA256::to_hex(const Sha256Digest& digest) {
    static const char digits[] = "0123456789abcdef";
    std::string out(64, '0');
    for (size_t i = 0; i < digest.size(); ++i) {
        out[2 * i] = digits[digest[i] >> 4];
        out[2 * i + 1] = digits[digest[i] & 0x0f];
    }
    return out;
}

std::string SHA256::hash_hex(const std::string& input) {
    SHA256 ctx;
    ctx.update(input);
    return ctx.finish_hex();
}

} // namespace acb
