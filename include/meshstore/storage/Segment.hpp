#pragma once

#include "meshstore/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace meshstore::storage {

struct Segment {
    std::string id;
    std::string file_hash;
    std::size_t chunk_number{0};
    ByteBuffer data;
    std::size_t size{0};
    std::string checksum;
    std::chrono::system_clock::time_point created_at{};

    // True when no checksum is recorded or it matches the bytes.
    bool verify() const;
};

Segment make_segment(std::string_view file_id, std::string file_hash, std::size_t chunk_number, ByteBuffer data);

struct FileMetadata {
    std::string file_id;
    std::string original_filename;
    std::string file_hash;
    std::uint64_t total_size_bytes{0};
    std::size_t chunk_size_bytes{kDefaultChunkSize};
    std::size_t total_chunks{0};
    std::map<std::size_t, NodeId> chunks;
    std::chrono::system_clock::time_point created_at{};
    std::uint32_t replicas{1};

    bool complete() const;
    std::vector<std::size_t> missing_chunks() const;
};

struct ChunkedFile {
    std::string file_id;
    std::vector<Segment> segments;
};

}  // namespace meshstore::storage
