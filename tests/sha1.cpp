#include "chunkswarm/crypto/Sha1.hpp"

#include <cassert>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace {

std::span<const std::uint8_t> as_bytes(const std::string& text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

int main() {
    using chunkswarm::crypto::Sha1;

    assert(Sha1::hex_digest(as_bytes("")) == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    assert(Sha1::hex_digest(as_bytes("abc")) == "a9993e364706816aba3e25717850c26c9cd0d89d");
    assert(Sha1::hex_digest(as_bytes("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"))
           == "84983e441c3bd26ebaae4aa1f95129e5e54670f1");

    // One million 'a' fed in uneven pieces crosses many block boundaries.
    Sha1 incremental;
    const std::string piece(997, 'a');
    std::size_t fed = 0;
    while (fed + piece.size() <= 1'000'000) {
        incremental.update(as_bytes(piece));
        fed += piece.size();
    }
    incremental.update(as_bytes(std::string(1'000'000 - fed, 'a')));
    assert(incremental.finalize_hex() == "34aa973cd4c4daa4f61eeb2bdbad27316534016f");

    const auto digest = Sha1::digest(as_bytes("abc"));
    assert(digest.size() == Sha1::kDigestSize);
    assert(digest[0] == 0xa9 && digest[19] == 0x9d);

    return 0;
}
