#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace meshstore {

using NodeId = std::string;
using ByteBuffer = std::vector<std::uint8_t>;
using Digest = std::array<std::uint8_t, 32>;

inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;
inline constexpr std::size_t kFileIdLength = 16;

std::string to_hex(std::span<const std::uint8_t> bytes);
std::string digest_to_string(const Digest& digest);

// "<file_id>_chunk_<chunk_number>"
std::string make_segment_id(std::string_view file_id, std::size_t chunk_number);

}  // namespace meshstore
