#include "meshstore/storage/Segment.hpp"

#include "meshstore/crypto/Sha256.hpp"

#include <utility>

namespace meshstore::storage {

bool Segment::verify() const {
    if (checksum.empty()) {
        return true;
    }
    return data.size() == size && crypto::Sha256::hex_digest(data) == checksum;
}

Segment make_segment(std::string_view file_id, std::string file_hash, std::size_t chunk_number, ByteBuffer data) {
    Segment segment{};
    segment.id = make_segment_id(file_id, chunk_number);
    segment.file_hash = std::move(file_hash);
    segment.chunk_number = chunk_number;
    segment.size = data.size();
    segment.checksum = crypto::Sha256::hex_digest(data);
    segment.data = std::move(data);
    segment.created_at = std::chrono::system_clock::now();
    return segment;
}

bool FileMetadata::complete() const {
    return missing_chunks().empty();
}

std::vector<std::size_t> FileMetadata::missing_chunks() const {
    std::vector<std::size_t> missing;
    for (std::size_t chunk = 0; chunk < total_chunks; ++chunk) {
        if (chunks.find(chunk) == chunks.end()) {
            missing.push_back(chunk);
        }
    }
    return missing;
}

}  // namespace meshstore::storage
