#include "meshstore/storage/StorageEngine.hpp"

#include "meshstore/Error.hpp"
#include "meshstore/crypto/Sha256.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace meshstore::storage {

namespace {

using Level = log::StructuredLogger::Level;

// Segment ids become file names, so anything that could leave the node
// directory is refused.
bool valid_segment_id(const std::string& segment_id) {
    if (segment_id.empty() || segment_id == "." || segment_id.find("..") != std::string::npos) {
        return false;
    }
    return segment_id.find_first_of("/\\:") == std::string::npos;
}

std::string describe_bytes(std::uint64_t bytes) {
    return std::to_string(bytes);
}

}  // namespace

StorageEngine::StorageEngine(NodeId node_id,
                             std::uint64_t capacity_bytes,
                             std::filesystem::path root,
                             log::LoggerPtr logger)
    : node_id_(std::move(node_id)),
      capacity_bytes_(capacity_bytes),
      root_(std::move(root)),
      logger_(std::move(logger)) {
    if (!ensure_storage_directory()) {
        throw Error(ErrorCode::IoFailure, "cannot create storage directory " + root_.string());
    }
    recover_usage();
    load_metadata();

    log::log_event(logger_,
                   Level::Info,
                   "storage.initialized",
                   {{"node", node_id_},
                    {"path", root_.string()},
                    {"capacity_bytes", describe_bytes(capacity_bytes_)},
                    {"used_bytes", describe_bytes(used_bytes_)}});
}

ChunkedFile StorageEngine::chunk_file(const std::filesystem::path& path, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw Error(ErrorCode::InvalidArgument, "chunk size must be positive");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw Error(ErrorCode::NotFound, "File not found: " + path.string());
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw Error(ErrorCode::IoFailure, "cannot open " + path.string());
    }

    crypto::Sha256 file_hasher;
    std::vector<ByteBuffer> chunks;
    std::uint64_t total_size = 0;
    while (stream) {
        ByteBuffer chunk(chunk_size);
        stream.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        const auto count = static_cast<std::size_t>(stream.gcount());
        if (count == 0) {
            break;
        }
        chunk.resize(count);
        file_hasher.update(chunk);
        total_size += count;
        chunks.push_back(std::move(chunk));
    }
    if (stream.bad()) {
        throw Error(ErrorCode::IoFailure, "read failed for " + path.string());
    }

    const auto file_hash = digest_to_string(file_hasher.finalize());
    ChunkedFile result{};
    result.file_id = file_hash.substr(0, kFileIdLength);
    result.segments.reserve(chunks.size());
    for (std::size_t chunk_number = 0; chunk_number < chunks.size(); ++chunk_number) {
        result.segments.push_back(make_segment(result.file_id, file_hash, chunk_number, std::move(chunks[chunk_number])));
    }

    FileMetadata metadata{};
    metadata.file_id = result.file_id;
    metadata.original_filename = path.filename().string();
    metadata.file_hash = file_hash;
    metadata.total_size_bytes = total_size;
    metadata.chunk_size_bytes = chunk_size;
    metadata.total_chunks = result.segments.size();
    metadata.created_at = std::chrono::system_clock::now();

    {
        std::scoped_lock lock(mutex_);
        index_metadata(metadata);
        metadata_[metadata.file_id] = std::move(metadata);
    }

    log::log_event(logger_,
                   Level::Info,
                   "storage.file.chunked",
                   {{"node", node_id_},
                    {"file", path.filename().string()},
                    {"file_id", result.file_id},
                    {"segments", std::to_string(result.segments.size())}});
    return result;
}

void StorageEngine::store_segment(const Segment& segment) {
    if (!valid_segment_id(segment.id)) {
        throw Error(ErrorCode::InvalidArgument, "invalid segment id '" + segment.id + "'");
    }

    const auto incoming = static_cast<std::uint64_t>(segment.data.size());
    std::uint64_t staging_id = 0;
    {
        std::scoped_lock lock(mutex_);
        // The whole segment must fit on top of current usage, rewrites included.
        if (used_bytes_ + reserved_bytes_ + incoming > capacity_bytes_) {
            log::log_event(logger_,
                           Level::Error,
                           "storage.segment.rejected",
                           {{"node", node_id_},
                            {"segment", segment.id},
                            {"size_bytes", describe_bytes(incoming)},
                            {"available_bytes", describe_bytes(capacity_bytes_ - std::min(capacity_bytes_, used_bytes_ + reserved_bytes_))}});
            throw Error(ErrorCode::CapacityExceeded,
                        "insufficient space on " + node_id_ + " for segment " + segment.id);
        }
        reserved_bytes_ += incoming;
        staging_id = next_staging_id_++;
    }

    auto staging = segment_path(segment.id);
    staging += ".tmp" + std::to_string(staging_id);
    const bool staged = write_segment_file(segment, staging);

    std::scoped_lock lock(mutex_);
    reserved_bytes_ -= incoming;
    // Publishing under the lock keeps <id>.bin in step with the cached copy.
    std::error_code ec;
    if (staged) {
        std::filesystem::rename(staging, segment_path(segment.id), ec);
    }
    if (!staged || ec) {
        std::filesystem::remove(staging, ec);
        log::log_event(logger_,
                       Level::Error,
                       "storage.segment.write_failed",
                       {{"node", node_id_}, {"segment", segment.id}});
        throw Error(ErrorCode::IoFailure, "cannot write segment " + segment.id);
    }

    auto& accounted = disk_sizes_[segment.id];
    used_bytes_ = used_bytes_ - accounted + incoming;
    accounted = incoming;

    Segment cached = segment;
    cached.size = segment.data.size();
    if (cached.created_at == std::chrono::system_clock::time_point{}) {
        cached.created_at = std::chrono::system_clock::now();
    }
    segments_.insert_or_assign(segment.id, std::move(cached));

    if (const auto owner = file_id_by_hash_.find(segment.file_hash); owner != file_id_by_hash_.end()) {
        const auto meta = metadata_.find(owner->second);
        if (meta != metadata_.end()) {
            meta->second.chunks[segment.chunk_number] = node_id_;
        }
    }
    if (!save_metadata_locked()) {
        log::log_event(logger_,
                       Level::Warning,
                       "storage.metadata.persist_failed",
                       {{"node", node_id_}, {"segment", segment.id}});
    }

    log::log_event(logger_,
                   Level::Info,
                   "storage.segment.stored",
                   {{"node", node_id_},
                    {"segment", segment.id},
                    {"size_bytes", describe_bytes(incoming)}});
}

std::optional<Segment> StorageEngine::retrieve_segment(const std::string& segment_id) {
    if (!valid_segment_id(segment_id)) {
        return std::nullopt;
    }

    {
        std::scoped_lock lock(mutex_);
        const auto it = segments_.find(segment_id);
        if (it != segments_.end()) {
            return it->second;
        }
    }

    auto bytes = read_segment_file(segment_id);
    if (!bytes.has_value()) {
        return std::nullopt;
    }

    // Only the bytes survive on disk: the parent hash and chunk position are
    // unknown here and the checksum is whatever the bytes hash to now.
    Segment segment{};
    segment.id = segment_id;
    segment.size = bytes->size();
    segment.checksum = crypto::Sha256::hex_digest(*bytes);
    segment.data = std::move(*bytes);
    segment.created_at = std::chrono::system_clock::now();

    std::scoped_lock lock(mutex_);
    const auto [it, inserted] = segments_.try_emplace(segment_id, std::move(segment));
    if (inserted) {
        log::log_event(logger_,
                       Level::Info,
                       "storage.segment.loaded",
                       {{"node", node_id_}, {"segment", segment_id}});
    }
    return it->second;
}

void StorageEngine::reconstruct_file(const std::string& file_id,
                                     const std::filesystem::path& output_path,
                                     SegmentProvider* provider) {
    const auto metadata = file_metadata(file_id);
    if (!metadata.has_value()) {
        log::log_event(logger_,
                       Level::Error,
                       "storage.reconstruct.unknown_file",
                       {{"node", node_id_}, {"file_id", file_id}});
        throw Error(ErrorCode::NotFound, "File metadata not found: " + file_id);
    }

    std::error_code ec;
    const auto parent = std::filesystem::absolute(output_path, ec).parent_path();
    if (!ec && !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    if (ec) {
        throw Error(ErrorCode::IoFailure, "cannot prepare output directory for " + output_path.string());
    }

    std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw Error(ErrorCode::IoFailure, "cannot open output file " + output_path.string());
    }

    std::uint64_t written = 0;
    for (std::size_t chunk_number = 0; chunk_number < metadata->total_chunks; ++chunk_number) {
        const auto segment_id = make_segment_id(file_id, chunk_number);

        auto segment = retrieve_segment(segment_id);
        std::string reason = "not held locally";
        if (!segment.has_value() && provider != nullptr) {
            auto fetched = provider->fetch_segment(segment_id);
            if (fetched.status == FetchStatus::Found && fetched.segment.has_value()) {
                segment = std::move(fetched.segment);
            } else {
                reason = std::string("provider reported ") + fetch_status_to_string(fetched.status);
                if (!fetched.detail.empty()) {
                    reason += ": " + fetched.detail;
                }
            }
        }

        if (!segment.has_value()) {
            log::log_event(logger_,
                           Level::Error,
                           "storage.reconstruct.missing_segment",
                           {{"node", node_id_}, {"segment", segment_id}, {"reason", reason}});
            throw Error(ErrorCode::ReconstructionFailed, "segment " + segment_id + " unavailable (" + reason + ")");
        }
        if (!segment->verify()) {
            log::log_event(logger_,
                           Level::Error,
                           "storage.reconstruct.corrupt_segment",
                           {{"node", node_id_}, {"segment", segment_id}});
            throw Error(ErrorCode::ReconstructionFailed, "segment " + segment_id + " failed checksum verification");
        }

        output.write(reinterpret_cast<const char*>(segment->data.data()),
                     static_cast<std::streamsize>(segment->data.size()));
        if (!output) {
            throw Error(ErrorCode::IoFailure, "write failed for " + output_path.string());
        }
        written += segment->data.size();
    }

    output.flush();
    if (!output) {
        throw Error(ErrorCode::IoFailure, "flush failed for " + output_path.string());
    }

    if (written != metadata->total_size_bytes) {
        log::log_event(logger_,
                       Level::Warning,
                       "storage.reconstruct.size_mismatch",
                       {{"node", node_id_},
                        {"file_id", file_id},
                        {"expected_bytes", describe_bytes(metadata->total_size_bytes)},
                        {"written_bytes", describe_bytes(written)}});
    }
    log::log_event(logger_,
                   Level::Info,
                   "storage.reconstruct.completed",
                   {{"node", node_id_},
                    {"file_id", file_id},
                    {"output", output_path.string()},
                    {"bytes", describe_bytes(written)}});
}

bool StorageEngine::record_chunk_location(const std::string& file_id, std::size_t chunk_number, const NodeId& holder) {
    std::scoped_lock lock(mutex_);
    const auto it = metadata_.find(file_id);
    if (it == metadata_.end()) {
        return false;
    }
    it->second.chunks[chunk_number] = holder;
    return save_metadata_locked();
}

void StorageEngine::adopt_metadata(FileMetadata metadata) {
    std::scoped_lock lock(mutex_);
    index_metadata(metadata);
    auto file_id = metadata.file_id;
    metadata_[file_id] = std::move(metadata);
    if (!save_metadata_locked()) {
        log::log_event(logger_,
                       Level::Warning,
                       "storage.metadata.persist_failed",
                       {{"node", node_id_}, {"file_id", file_id}});
    }
}

bool StorageEngine::save_metadata() {
    std::scoped_lock lock(mutex_);
    return save_metadata_locked();
}

bool StorageEngine::load_metadata() {
    const auto path = metadata_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return false;
    }
    const std::string text((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());

    MetadataTable loaded;
    try {
        loaded = decode_metadata_table(text);
    } catch (const Error& ex) {
        log::log_event(logger_,
                       Level::Error,
                       "storage.metadata.load_failed",
                       {{"node", node_id_}, {"path", path.string()}, {"error", ex.what()}});
        return false;
    }

    std::scoped_lock lock(mutex_);
    for (auto& [file_id, metadata] : loaded) {
        index_metadata(metadata);
        metadata_[file_id] = std::move(metadata);
    }
    log::log_event(logger_,
                   Level::Info,
                   "storage.metadata.loaded",
                   {{"node", node_id_}, {"files", std::to_string(metadata_.size())}});
    return true;
}

StorageInfo StorageEngine::storage_info() const {
    std::scoped_lock lock(mutex_);
    StorageInfo info{};
    info.node_id = node_id_;
    info.capacity_bytes = capacity_bytes_;
    info.used_bytes = used_bytes_;
    info.available_bytes = capacity_bytes_ > used_bytes_ ? capacity_bytes_ - used_bytes_ : 0;
    if (capacity_bytes_ > 0) {
        info.utilization_percent = static_cast<double>(used_bytes_) / static_cast<double>(capacity_bytes_) * 100.0;
    }
    info.segments_stored = segments_.size();
    info.files_tracked = metadata_.size();
    info.storage_path = root_;
    return info;
}

std::optional<FileMetadata> StorageEngine::file_metadata(const std::string& file_id) const {
    std::scoped_lock lock(mutex_);
    const auto it = metadata_.find(file_id);
    if (it == metadata_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FileMetadata> StorageEngine::list_files() const {
    std::scoped_lock lock(mutex_);
    std::vector<FileMetadata> files;
    files.reserve(metadata_.size());
    for (const auto& [file_id, metadata] : metadata_) {
        files.push_back(metadata);
    }
    return files;
}

std::optional<std::string> StorageEngine::file_id_for_hash(const std::string& file_hash) const {
    std::scoped_lock lock(mutex_);
    const auto it = file_id_by_hash_.find(file_hash);
    if (it == file_id_by_hash_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool StorageEngine::has_segment(const std::string& segment_id) const {
    if (!valid_segment_id(segment_id)) {
        return false;
    }
    {
        std::scoped_lock lock(mutex_);
        if (segments_.find(segment_id) != segments_.end()) {
            return true;
        }
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(segment_path(segment_id), ec);
}

void StorageEngine::clear() {
    std::scoped_lock lock(mutex_);
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec || !ensure_storage_directory()) {
        log::log_event(logger_,
                       Level::Error,
                       "storage.clear_failed",
                       {{"node", node_id_}, {"path", root_.string()}});
        throw Error(ErrorCode::IoFailure, "cannot clear " + root_.string());
    }
    segments_.clear();
    disk_sizes_.clear();
    metadata_.clear();
    file_id_by_hash_.clear();
    used_bytes_ = 0;
    log::log_event(logger_, Level::Info, "storage.cleared", {{"node", node_id_}});
}

std::uint64_t StorageEngine::used_bytes() const {
    std::scoped_lock lock(mutex_);
    return used_bytes_;
}

std::filesystem::path StorageEngine::segment_path(const std::string& segment_id) const {
    return root_ / (segment_id + kSegmentExtension);
}

std::filesystem::path StorageEngine::metadata_path() const {
    return root_ / kMetadataFileName;
}

bool StorageEngine::ensure_storage_directory() {
    std::error_code ec;
    if (std::filesystem::exists(root_, ec)) {
        return std::filesystem::is_directory(root_, ec);
    }
    return std::filesystem::create_directories(root_, ec);
}

bool StorageEngine::write_segment_file(const Segment& segment, const std::filesystem::path& staging) const {
    std::ofstream stream(staging, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return false;
    }
    stream.write(reinterpret_cast<const char*>(segment.data.data()), static_cast<std::streamsize>(segment.data.size()));
    stream.flush();
    return static_cast<bool>(stream);
}

std::optional<ByteBuffer> StorageEngine::read_segment_file(const std::string& segment_id) const {
    const auto path = segment_path(segment_id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        log::log_event(logger_,
                       Level::Error,
                       "storage.segment.read_failed",
                       {{"node", node_id_}, {"segment", segment_id}});
        return std::nullopt;
    }
    ByteBuffer data((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        return std::nullopt;
    }
    return data;
}

void StorageEngine::recover_usage() {
    std::error_code ec;
    for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != kSegmentExtension || !it->is_regular_file(ec)) {
            continue;
        }
        const auto size = it->file_size(ec);
        if (ec) {
            ec.clear();
            continue;
        }
        disk_sizes_[path.stem().string()] = size;
        used_bytes_ += size;
    }
}

void StorageEngine::index_metadata(const FileMetadata& metadata) {
    if (!metadata.file_hash.empty()) {
        file_id_by_hash_[metadata.file_hash] = metadata.file_id;
    }
}

bool StorageEngine::save_metadata_locked() {
    const auto path = metadata_path();
    auto staging = path;
    staging += ".tmp";

    {
        std::ofstream stream(staging, std::ios::binary | std::ios::trunc);
        if (!stream) {
            return false;
        }
        stream << encode_metadata_table(metadata_);
        stream.flush();
        if (!stream) {
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        return false;
    }
    return true;
}

}  // namespace meshstore::storage
