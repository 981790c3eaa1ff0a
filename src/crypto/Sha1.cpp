#include "chunkswarm/crypto/Sha1.hpp"

#include "chunkswarm/Types.hpp"

#include <algorithm>
#include <cstring>

namespace chunkswarm::crypto {

namespace {

constexpr std::array<std::uint32_t, 5> kInitialState = {
    0x67452301u, 0xEFCDAB89u, 0x98BADCFEu, 0x10325476u, 0xC3D2E1F0u};

constexpr std::uint32_t rotl(std::uint32_t value, int shift) noexcept {
    return (value << shift) | (value >> (32 - shift));
}

std::uint32_t read_be32(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
           (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) |
           static_cast<std::uint32_t>(data[3]);
}

void write_be32(std::uint8_t* out, std::uint32_t value) {
    out[0] = static_cast<std::uint8_t>((value >> 24) & 0xFFu);
    out[1] = static_cast<std::uint8_t>((value >> 16) & 0xFFu);
    out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFFu);
    out[3] = static_cast<std::uint8_t>(value & 0xFFu);
}

}  // namespace

Sha1::Sha1() {
    reset();
}

void Sha1::reset() {
    state_ = kInitialState;
    buffer_.fill(0);
    buffer_size_ = 0;
    bit_len_ = 0;
}

void Sha1::update(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return;
    }

    bit_len_ += static_cast<std::uint64_t>(data.size()) * 8;

    std::size_t offset = 0;
    while (offset < data.size()) {
        const auto space = static_cast<std::size_t>(64 - buffer_size_);
        const auto chunk = std::min<std::size_t>(space, data.size() - offset);
        std::memcpy(buffer_.data() + buffer_size_, data.data() + offset, chunk);
        buffer_size_ += chunk;
        offset += chunk;

        if (buffer_size_ == 64) {
            transform(buffer_.data());
            buffer_size_ = 0;
        }
    }
}

Sha1::Digest Sha1::finalize() {
    buffer_[buffer_size_++] = 0x80;

    if (buffer_size_ > 56) {
        std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_size_), buffer_.end(), 0);
        transform(buffer_.data());
        buffer_size_ = 0;
    }

    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_size_), buffer_.begin() + 56, 0);
    buffer_size_ = 56;

    for (int i = 7; i >= 0; --i) {
        buffer_[buffer_size_++] = static_cast<std::uint8_t>((bit_len_ >> (i * 8)) & 0xFFu);
    }

    transform(buffer_.data());

    Digest digest{};
    for (std::size_t i = 0; i < state_.size(); ++i) {
        write_be32(digest.data() + static_cast<std::ptrdiff_t>(i * 4), state_[i]);
    }

    reset();
    return digest;
}

std::string Sha1::finalize_hex() {
    const auto value = finalize();
    return bytes_to_hex(value.data(), value.size());
}

Sha1::Digest Sha1::digest(std::span<const std::uint8_t> data) {
    Sha1 hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::string Sha1::hex_digest(std::span<const std::uint8_t> data) {
    Sha1 hasher;
    hasher.update(data);
    return hasher.finalize_hex();
}

void Sha1::transform(const std::uint8_t block[64]) {
    std::array<std::uint32_t, 80> schedule;

    for (std::size_t i = 0; i < 16; ++i) {
        schedule[i] = read_be32(block + static_cast<std::ptrdiff_t>(i * 4));
    }

    for (std::size_t i = 16; i < schedule.size(); ++i) {
        schedule[i] = rotl(schedule[i - 3] ^ schedule[i - 8] ^ schedule[i - 14] ^ schedule[i - 16], 1);
    }

    auto a = state_[0];
    auto b = state_[1];
    auto c = state_[2];
    auto d = state_[3];
    auto e = state_[4];

    for (std::size_t i = 0; i < schedule.size(); ++i) {
        std::uint32_t f = 0;
        std::uint32_t k = 0;
        if (i < 20) {
            f = (b & c) | ((~b) & d);
            k = 0x5A827999u;
        } else if (i < 40) {
            f = b ^ c ^ d;
            k = 0x6ED9EBA1u;
        } else if (i < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8F1BBCDCu;
        } else {
            f = b ^ c ^ d;
            k = 0xCA62C1D6u;
        }

        const auto temp = rotl(a, 5) + f + e + k + schedule[i];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = temp;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
}

}  // namespace chunkswarm::crypto
