#include "meshstore/crypto/Sha256.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <vector>

namespace meshstore::crypto {

namespace {

constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

constexpr std::size_t kLengthOffset = Sha256::kBlockSize - 8;
constexpr std::size_t kFileReadBlock = 4096;

constexpr std::uint32_t rotr(std::uint32_t value, int shift) noexcept {
    return (value >> shift) | (value << (32 - shift));
}

std::uint32_t load_be32(const std::uint8_t* data) noexcept {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
           (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) |
           static_cast<std::uint32_t>(data[3]);
}

}  // namespace

Sha256::Sha256()
    : state_(kInitialState) {}

void Sha256::update(std::span<const std::uint8_t> data) {
    total_bytes_ += data.size();

    auto remaining = data;
    if (pending_size_ > 0) {
        const auto take = std::min(kBlockSize - pending_size_, remaining.size());
        std::memcpy(pending_.data() + pending_size_, remaining.data(), take);
        pending_size_ += take;
        remaining = remaining.subspan(take);
        if (pending_size_ < kBlockSize) {
            return;
        }
        compress(pending_.data());
        pending_size_ = 0;
    }

    while (remaining.size() >= kBlockSize) {
        compress(remaining.data());
        remaining = remaining.subspan(kBlockSize);
    }

    if (!remaining.empty()) {
        std::memcpy(pending_.data(), remaining.data(), remaining.size());
        pending_size_ = remaining.size();
    }
}

Digest Sha256::finalize() {
    const std::uint64_t bit_length = total_bytes_ * 8;

    pending_[pending_size_++] = 0x80;
    if (pending_size_ > kLengthOffset) {
        std::fill(pending_.begin() + static_cast<std::ptrdiff_t>(pending_size_), pending_.end(), 0);
        compress(pending_.data());
        pending_size_ = 0;
    }
    std::fill(pending_.begin() + static_cast<std::ptrdiff_t>(pending_size_),
              pending_.begin() + static_cast<std::ptrdiff_t>(kLengthOffset),
              0);
    for (std::size_t i = 0; i < 8; ++i) {
        pending_[kLengthOffset + i] = static_cast<std::uint8_t>((bit_length >> (56 - 8 * i)) & 0xFFu);
    }
    compress(pending_.data());

    Digest digest{};
    for (std::size_t word = 0; word < state_.size(); ++word) {
        for (std::size_t byte = 0; byte < 4; ++byte) {
            digest[word * 4 + byte] = static_cast<std::uint8_t>((state_[word] >> (24 - 8 * byte)) & 0xFFu);
        }
    }

    state_ = kInitialState;
    pending_.fill(0);
    pending_size_ = 0;
    total_bytes_ = 0;
    return digest;
}

Digest Sha256::digest(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::string Sha256::hex_digest(std::span<const std::uint8_t> data) {
    return digest_to_string(digest(data));
}

void Sha256::compress(const std::uint8_t* block) {
    std::array<std::uint32_t, 64> w{};
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = load_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < w.size(); ++i) {
        const auto s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        const auto s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    auto v = state_;
    for (std::size_t i = 0; i < w.size(); ++i) {
        const auto [a, b, c, d, e, f, g, h] = v;
        const auto sigma1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        const auto choose = (e & f) ^ (~e & g);
        const auto t1 = h + sigma1 + choose + kRoundConstants[i] + w[i];
        const auto sigma0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        const auto majority = (a & b) ^ (a & c) ^ (b & c);
        const auto t2 = sigma0 + majority;

        v = {t1 + t2, a, b, c, d + t1, e, f, g};
    }

    for (std::size_t i = 0; i < state_.size(); ++i) {
        state_[i] += v[i];
    }
}

std::optional<Digest> digest_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }

    Sha256 hasher;
    std::vector<char> block(kFileReadBlock);
    while (stream) {
        stream.read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto count = stream.gcount();
        if (count > 0) {
            hasher.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(block.data()),
                                                        static_cast<std::size_t>(count)));
        }
    }
    if (stream.bad()) {
        return std::nullopt;
    }
    return hasher.finalize();
}

}  // namespace meshstore::crypto
