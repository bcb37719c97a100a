#include "Crypto.h"
#include <algorithm>
#include <cstring>

namespace {

    const uint32_t K[64] = {
        0x428a2f98,0x71374491,0xb5c0fbcf,0xe9b5dba5,0x3956c25b,0x59f111f1,0x923f82a4,0xab1c5ed5,
        0xd807aa98,0x12835b01,0x243185be,0x550c7dc3,0x72be5d74,0x80deb1fe,0x9bdc06a7,0xc19bf174,
        0xe49b69c1,0xefbe4786,0x0fc19dc6,0x240ca1cc,0x2de92c6f,0x4a7484aa,0x5cb0a9dc,0x76f988da,
        0x983e5152,0xa831c66d,0xb00327c8,0xbf597fc7,0xc6e00bf3,0xd5a79147,0x06ca6351,0x14292967,
        0x27b70a85,0x2e1b2138,0x4d2c6dfc,0x53380d13,0x650a7354,0x766a0abb,0x81c2c92e,0x92722c85,
        0xa2bfe8a1,0xa81a664b,0xc24b8b70,0xc76c51a3,0xd192e819,0xd6990624,0xf40e3585,0x106aa070,
        0x19a4c116,0x1e376c08,0x2748774c,0x34b0bcb5,0x391c0cb3,0x4ed8aa4a,0x5b9cca4f,0x682e6ff3,
        0x748f82ee,0x78a5636f,0x84c87814,0x8cc70208,0x90befffa,0xa4506ceb,0xbef9a3f7,0xc67178f2,
    };

    inline uint32_t Rotr(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }

} // namespace

namespace BlackRoom {

    Sha256::Sha256()
        : m_State{ 0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19 }
        , m_Block{} {
    }

    void Sha256::Compress(const uint8_t* blk) {
        uint32_t W[64];
        for (int t = 0; t < 16; ++t)
            W[t] = (uint32_t)blk[t * 4] << 24 | (uint32_t)blk[t * 4 + 1] << 16 | (uint32_t)blk[t * 4 + 2] << 8 | blk[t * 4 + 3];
        for (int t = 16; t < 64; ++t) {
            uint32_t s0 = Rotr(W[t - 15], 7) ^ Rotr(W[t - 15], 18) ^ (W[t - 15] >> 3);
            uint32_t s1 = Rotr(W[t - 2], 17) ^ Rotr(W[t - 2], 19) ^ (W[t - 2] >> 10);
            W[t] = W[t - 16] + s0 + W[t - 7] + s1;
        }
        uint32_t a = m_State[0], b = m_State[1], c = m_State[2], d = m_State[3];
        uint32_t e = m_State[4], f = m_State[5], g = m_State[6], h = m_State[7];
        for (int t = 0; t < 64; ++t) {
            uint32_t S1 = Rotr(e, 6) ^ Rotr(e, 11) ^ Rotr(e, 25);
            uint32_t ch = (e & f) ^ ((~e) & g);
            uint32_t t1 = h + S1 + ch + K[t] + W[t];
            uint32_t S0 = Rotr(a, 2) ^ Rotr(a, 13) ^ Rotr(a, 22);
            uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
            uint32_t t2 = S0 + maj;
            h = g; g = f; f = e; e = d + t1; d = c; c = b; b = a; a = t1 + t2;
        }
        m_State[0] += a; m_State[1] += b; m_State[2] += c; m_State[3] += d;
        m_State[4] += e; m_State[5] += f; m_State[6] += g; m_State[7] += h;
    }

    void Sha256::Update(const uint8_t* data, size_t len) {
        m_TotalLen += len;
        if (m_BlockLen > 0) {
            const size_t take = std::min(len, sizeof(m_Block) - m_BlockLen);
            std::memcpy(m_Block + m_BlockLen, data, take);
            m_BlockLen += take;
            data += take;
            len -= take;
            if (m_BlockLen < sizeof(m_Block)) return;
            Compress(m_Block);
            m_BlockLen = 0;
        }
        while (len >= 64) {
            Compress(data);
            data += 64;
            len -= 64;
        }
        if (len > 0) {
            std::memcpy(m_Block, data, len);
            m_BlockLen = len;
        }
    }

    std::array<uint8_t, 32> Sha256::Final() {
        const uint64_t bits = m_TotalLen * 8;
        m_Block[m_BlockLen++] = 0x80;
        if (m_BlockLen > 56) {
            std::memset(m_Block + m_BlockLen, 0, sizeof(m_Block) - m_BlockLen);
            Compress(m_Block);
            m_BlockLen = 0;
        }
        std::memset(m_Block + m_BlockLen, 0, 56 - m_BlockLen);
        for (int j = 0; j < 8; ++j) m_Block[63 - j] = (uint8_t)(bits >> (j * 8));
        Compress(m_Block);

        std::array<uint8_t, 32> out{};
        for (int j = 0; j < 8; ++j) {
            out[j * 4 + 0] = (uint8_t)(m_State[j] >> 24);
            out[j * 4 + 1] = (uint8_t)(m_State[j] >> 16);
            out[j * 4 + 2] = (uint8_t)(m_State[j] >> 8);
            out[j * 4 + 3] = (uint8_t)(m_State[j]);
        }
        return out;
    }

    std::string BytesToHex(const uint8_t* buf, size_t n) {
        static const char hex[] = "0123456789abcdef";
        std::string s; s.reserve(n * 2);
        for (size_t i = 0; i < n; ++i) { s += hex[buf[i] >> 4]; s += hex[buf[i] & 15]; }
        return s;
    }

    std::string Sha256Hex(const std::string& data) {
        Sha256 h;
        h.Update(data);
        const auto digest = h.Final();
        return BytesToHex(digest.data(), digest.size());
    }

} // namespace BlackRoom
