#pragma once

#include "meshstore/storage/Segment.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace meshstore::storage {

using MetadataTable = std::map<std::string, FileMetadata>;

// Sidecar layout: { "<file_id>": { original_filename, file_hash, total_size_bytes,
// chunk_size_bytes, total_chunks, chunks: { "<n>": "<node_id>" }, created_at, replicas } }
std::string encode_metadata_table(const MetadataTable& table);

// Throws Error{InvalidArgument} when the document is not a metadata table.
MetadataTable decode_metadata_table(std::string_view text);

std::string format_timestamp(std::chrono::system_clock::time_point time);
std::optional<std::chrono::system_clock::time_point> parse_timestamp(std::string_view text);

}  // namespace meshstore::storage
