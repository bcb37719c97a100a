#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace BlackRoom {

    // Incremental SHA-256 (FIPS 180-4).
    class Sha256 {
    public:
        Sha256();

        void Update(const uint8_t* data, size_t len);
        void Update(const std::string& data) {
            Update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        }
        std::array<uint8_t, 32> Final();

    private:
        void Compress(const uint8_t* block);

        uint32_t m_State[8];
        uint8_t m_Block[64];
        size_t m_BlockLen = 0;
        uint64_t m_TotalLen = 0;
    };

    std::string BytesToHex(const uint8_t* buf, size_t n);

    /// Lowercase hex digest of the whole payload.
    std::string Sha256Hex(const std::string& data);

} // namespace BlackRoom
