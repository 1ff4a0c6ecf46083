#pragma once

#include "meshstore/Types.hpp"
#include "meshstore/log/StructuredLogger.hpp"
#include "meshstore/storage/MetadataCodec.hpp"
#include "meshstore/storage/Segment.hpp"
#include "meshstore/storage/SegmentProvider.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshstore::storage {

struct StorageInfo {
    NodeId node_id;
    std::uint64_t capacity_bytes{0};
    std::uint64_t used_bytes{0};
    std::uint64_t available_bytes{0};
    double utilization_percent{0.0};
    std::size_t segments_stored{0};
    std::size_t files_tracked{0};
    std::filesystem::path storage_path;
};

// Per-node segment store backed by one private directory:
//   <root>/<segment_id>.bin   raw segment bytes
//   <root>/metadata.json      chunk -> node index of every known file
class StorageEngine {
public:
    static constexpr const char* kMetadataFileName = "metadata.json";
    static constexpr const char* kSegmentExtension = ".bin";

    StorageEngine(NodeId node_id,
                  std::uint64_t capacity_bytes,
                  std::filesystem::path root,
                  log::LoggerPtr logger = nullptr);

    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    // Throws Error{NotFound} when the file is missing, Error{InvalidArgument}
    // for a zero chunk size.
    ChunkedFile chunk_file(const std::filesystem::path& path, std::size_t chunk_size = kDefaultChunkSize);

    // Throws Error{CapacityExceeded} without touching used bytes, or
    // Error{IoFailure} when the segment file cannot be written.
    void store_segment(const Segment& segment);

    std::optional<Segment> retrieve_segment(const std::string& segment_id);

    // Throws Error{NotFound} for unknown files and Error{ReconstructionFailed}
    // when a chunk cannot be obtained or fails verification.
    void reconstruct_file(const std::string& file_id,
                          const std::filesystem::path& output_path,
                          SegmentProvider* provider = nullptr);

    bool record_chunk_location(const std::string& file_id, std::size_t chunk_number, const NodeId& holder);
    void adopt_metadata(FileMetadata metadata);

    bool save_metadata();
    bool load_metadata();

    StorageInfo storage_info() const;
    std::optional<FileMetadata> file_metadata(const std::string& file_id) const;
    std::vector<FileMetadata> list_files() const;
    std::optional<std::string> file_id_for_hash(const std::string& file_hash) const;
    bool has_segment(const std::string& segment_id) const;

    // Removes every segment and metadata entry, leaving an empty directory.
    void clear();

    std::uint64_t used_bytes() const;
    std::uint64_t capacity_bytes() const noexcept { return capacity_bytes_; }
    const NodeId& node_id() const noexcept { return node_id_; }
    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path segment_path(const std::string& segment_id) const;
    std::filesystem::path metadata_path() const;
    bool ensure_storage_directory();
    bool write_segment_file(const Segment& segment, const std::filesystem::path& staging) const;
    std::optional<ByteBuffer> read_segment_file(const std::string& segment_id) const;
    void recover_usage();
    void index_metadata(const FileMetadata& metadata);
    bool save_metadata_locked();

    NodeId node_id_;
    std::uint64_t capacity_bytes_;
    std::filesystem::path root_;
    log::LoggerPtr logger_;

    std::uint64_t used_bytes_{0};
    std::uint64_t reserved_bytes_{0};
    std::uint64_t next_staging_id_{0};
    std::unordered_map<std::string, Segment> segments_;
    std::unordered_map<std::string, std::uint64_t> disk_sizes_;
    MetadataTable metadata_;
    std::unordered_map<std::string, std::string> file_id_by_hash_;
    mutable std::mutex mutex_;
};

}  // namespace meshstore::storage
