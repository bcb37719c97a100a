#include "Crypto.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

namespace {

    using BlackRoom::BytesToHex;
    using BlackRoom::Sha256;
    using BlackRoom::Sha256Hex;

    void TestKnownDigests() {
        assert(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        assert(Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        assert(Sha256Hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")
            == "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    }

    void TestMillionAs() {
        assert(Sha256Hex(std::string(1000000, 'a'))
            == "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
    }

    void TestIncrementalMatchesOneShot() {
        std::string payload;
        for (int i = 0; i < 1000; ++i) payload += static_cast<char>(i * 31 + 7);

        // Uneven chunk sizes straddle the 64-byte block boundary.
        Sha256 h;
        size_t pos = 0;
        size_t chunk = 1;
        while (pos < payload.size()) {
            const size_t n = std::min(chunk, payload.size() - pos);
            h.Update(payload.substr(pos, n));
            pos += n;
            chunk = chunk * 2 + 3;
        }
        const auto digest = h.Final();
        assert(BytesToHex(digest.data(), digest.size()) == Sha256Hex(payload));
    }

    void TestBytesToHex() {
        const uint8_t bytes[] = { 0x00, 0xff, 0x1a, 0x09 };
        assert(BytesToHex(bytes, sizeof(bytes)) == "00ff1a09");
        assert(BytesToHex(bytes, 0).empty());
    }

} // namespace

int main() {
    TestKnownDigests();
    TestMillionAs();
    TestIncrementalMatchesOneShot();
    TestBytesToHex();

    std::cout << "blackroom_unit_crypto: pass\n";
    return 0;
}
