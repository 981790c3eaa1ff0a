#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace chunkswarm::crypto {

class Sha1 {
public:
    static constexpr std::size_t kDigestSize = 20;
    using Digest = std::array<std::uint8_t, kDigestSize>;

    Sha1();

    void update(std::span<const std::uint8_t> data);
    Digest finalize();
    std::string finalize_hex();

    static Digest digest(std::span<const std::uint8_t> data);
    static std::string hex_digest(std::span<const std::uint8_t> data);

private:
    void transform(const std::uint8_t block[64]);
    void reset();

    std::array<std::uint32_t, 5> state_{};
    std::array<std::uint8_t, 64> buffer_{};
    std::size_t buffer_size_{0};
    std::uint64_t bit_len_{0};
};

}  // namespace chunkswarm::crypto
