#include "meshstore/Types.hpp"

namespace meshstore {

namespace {
constexpr char kHexDigits[] = "0123456789abcdef";
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string text;
    text.reserve(bytes.size() * 2);
    for (const auto byte : bytes) {
        text.push_back(kHexDigits[(byte >> 4) & 0x0Fu]);
        text.push_back(kHexDigits[byte & 0x0Fu]);
    }
    return text;
}

std::string digest_to_string(const Digest& digest) {
    return to_hex(std::span<const std::uint8_t>(digest.data(), digest.size()));
}

std::string make_segment_id(std::string_view file_id, std::size_t chunk_number) {
    std::string id(file_id);
    id.append("_chunk_");
    id.append(std::to_string(chunk_number));
    return id;
}

}  // namespace meshstore
