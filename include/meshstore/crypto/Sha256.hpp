#pragma once

#include "meshstore/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace meshstore::crypto {

class Sha256 {
public:
    static constexpr std::size_t kBlockSize = 64;

    Sha256();

    void update(std::span<const std::uint8_t> data);
    Digest finalize();

    static Digest digest(std::span<const std::uint8_t> data);
    static std::string hex_digest(std::span<const std::uint8_t> data);

private:
    void compress(const std::uint8_t* block);

    std::array<std::uint32_t, 8> state_{};
    std::array<std::uint8_t, kBlockSize> pending_{};
    std::size_t pending_size_{0};
    std::uint64_t total_bytes_{0};
};

// Streams the file through the hasher; nullopt when it cannot be read.
std::optional<Digest> digest_file(const std::filesystem::path& path);

}  // namespace meshstore::crypto
