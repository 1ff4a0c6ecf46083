#include "meshstore/core/Cluster.hpp"

#include "meshstore/Error.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace meshstore::core {

namespace {

using Level = log::StructuredLogger::Level;

std::string numbered_node_id(std::size_t index) {
    std::ostringstream oss;
    oss << "Node_" << std::setw(2) << std::setfill('0') << index;
    return oss.str();
}

}  // namespace

ClusterSegmentProvider::ClusterSegmentProvider(Cluster& cluster, NodeId requester)
    : cluster_(cluster), requester_(std::move(requester)) {}

storage::FetchResult ClusterSegmentProvider::fetch_segment(const std::string& segment_id) {
    std::size_t offline = 0;
    std::size_t asked = 0;
    for (const auto& handle : cluster_.nodes()) {
        if (handle.id() == requester_) {
            continue;
        }
        auto& holder = cluster_.node(handle);
        if (!holder.is_alive()) {
            ++offline;
            continue;
        }
        ++asked;
        if (auto segment = holder.storage().retrieve_segment(segment_id)) {
            return storage::FetchResult::found(std::move(*segment));
        }
    }

    if (offline > 0) {
        return storage::FetchResult::unavailable(std::to_string(offline) + " node(s) offline, " +
                                                 std::to_string(asked) + " asked");
    }
    return storage::FetchResult::not_found(std::to_string(asked) + " node(s) asked");
}

Cluster::Cluster(Config config, log::LoggerPtr logger)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      network_(config_, logger_) {
    log::log_event(logger_,
                   Level::Info,
                   "cluster.initialized",
                   {{"network", config_.network_name}, {"storage_root", config_.storage_root}});
}

Cluster::~Cluster() {
    shutdown();
}

NodeHandle Cluster::add_node(const NodeId& id) {
    if (id.empty() || id.find_first_of("/\\") != std::string::npos || id == "." || id == "..") {
        throw Error(ErrorCode::InvalidArgument, "invalid node id '" + id + "'");
    }

    std::scoped_lock lock(mutex_);
    if (shut_down_) {
        throw Error(ErrorCode::InvalidArgument, "cluster is shut down");
    }
    if (nodes_.find(id) != nodes_.end()) {
        throw Error(ErrorCode::InvalidArgument, "node " + id + " already exists");
    }

    auto node = std::make_unique<Node>(id, config_, logger_);
    const auto address = network_.register_node(*node);

    for (const auto& existing_id : order_) {
        auto& existing = *nodes_.at(existing_id);
        node->add_peer(existing_id, existing.network_interface().address());
        existing.add_peer(id, address);
    }

    order_.push_back(id);
    nodes_.emplace(id, std::move(node));
    log::log_event(logger_, Level::Info, "cluster.node.added", {{"node", id}, {"address", address}});
    return NodeHandle(id);
}

std::vector<NodeHandle> Cluster::initialize_nodes() {
    std::vector<NodeHandle> created;
    created.reserve(config_.node_count);
    for (std::size_t index = 1; index <= config_.node_count; ++index) {
        created.push_back(add_node(numbered_node_id(index)));
    }
    return created;
}

Node& Cluster::node(const NodeHandle& handle) {
    std::scoped_lock lock(mutex_);
    auto* found = lookup(handle.id());
    if (!found) {
        throw Error(ErrorCode::NotFound, "Node not found: " + handle.id());
    }
    return *found;
}

const Node& Cluster::node(const NodeHandle& handle) const {
    std::scoped_lock lock(mutex_);
    const auto* found = lookup(handle.id());
    if (!found) {
        throw Error(ErrorCode::NotFound, "Node not found: " + handle.id());
    }
    return *found;
}

std::optional<NodeHandle> Cluster::find_node(const NodeId& id) const {
    std::scoped_lock lock(mutex_);
    if (!lookup(id)) {
        return std::nullopt;
    }
    return NodeHandle(id);
}

std::vector<NodeHandle> Cluster::nodes() const {
    std::scoped_lock lock(mutex_);
    std::vector<NodeHandle> handles;
    handles.reserve(order_.size());
    for (const auto& id : order_) {
        handles.push_back(NodeHandle(id));
    }
    return handles;
}

std::size_t Cluster::size() const {
    std::scoped_lock lock(mutex_);
    return order_.size();
}

UploadReport Cluster::distribute_file(const NodeHandle& origin,
                                      const std::filesystem::path& path,
                                      std::size_t chunk_size,
                                      std::vector<NodeHandle> targets) {
    auto& origin_node = node(origin);
    if (chunk_size == 0) {
        chunk_size = config_.chunk_size;
    }
    if (targets.empty()) {
        targets = nodes();
    }
    if (targets.empty()) {
        throw Error(ErrorCode::InvalidArgument, "no target nodes for distribution");
    }

    std::vector<Node*> target_nodes;
    target_nodes.reserve(targets.size());
    for (const auto& target : targets) {
        target_nodes.push_back(&node(target));
    }

    auto chunked = origin_node.storage().chunk_file(path, chunk_size);
    const auto metadata = origin_node.storage().file_metadata(chunked.file_id);

    UploadReport report{};
    report.file_id = chunked.file_id;
    report.total_chunks = chunked.segments.size();
    if (metadata) {
        report.original_filename = metadata->original_filename;
        report.total_size_bytes = metadata->total_size_bytes;
    }

    const auto origin_address = origin_node.network_interface().address();
    for (std::size_t index = 0; index < chunked.segments.size(); ++index) {
        const auto& segment = chunked.segments[index];
        auto& target = *target_nodes[index % target_nodes.size()];

        if (!target.is_alive()) {
            report.failed.push_back({segment.id, target.id(), "node offline"});
            log::log_event(logger_,
                           Level::Warning,
                           "cluster.upload.target_offline",
                           {{"segment", segment.id}, {"node", target.id()}});
            continue;
        }

        if (&target != &origin_node) {
            const auto target_address = target.network_interface().address();
            const auto packet = network_.make_packet(network::PacketType::Data,
                                                     origin_address,
                                                     target_address,
                                                     segment.data,
                                                     static_cast<std::uint32_t>(segment.chunk_number));
            if (!network_.send(origin_address, target_address, packet).accepted) {
                ++report.packets_dropped;
            }
        }

        try {
            target.storage().store_segment(segment);
        } catch (const Error& ex) {
            report.failed.push_back({segment.id, target.id(), ex.what()});
            log::log_event(logger_,
                           Level::Error,
                           "cluster.upload.store_failed",
                           {{"segment", segment.id}, {"node", target.id()}, {"error", ex.what()}});
            continue;
        }
        report.placements.push_back({segment.id, segment.chunk_number, target.id()});

        if (&target != &origin_node &&
            !origin_node.storage().record_chunk_location(report.file_id, segment.chunk_number, target.id())) {
            log::log_event(logger_,
                           Level::Warning,
                           "cluster.upload.placement_unrecorded",
                           {{"segment", segment.id}, {"origin", origin_node.id()}});
        }
    }

    if (!origin_node.storage().save_metadata()) {
        log::log_event(logger_,
                       Level::Warning,
                       "cluster.upload.metadata_unsaved",
                       {{"file_id", report.file_id}, {"origin", origin_node.id()}});
    }

    log::log_event(logger_,
                   report.complete() ? Level::Info : Level::Warning,
                   "cluster.upload.completed",
                   {{"file_id", report.file_id},
                    {"segments", std::to_string(report.total_chunks)},
                    {"stored", std::to_string(report.placements.size())},
                    {"failed", std::to_string(report.failed.size())}});
    return report;
}

void Cluster::reconstruct_file(const NodeHandle& owner,
                               const std::string& file_id,
                               const std::filesystem::path& output) {
    auto& owner_node = node(owner);
    ClusterSegmentProvider provider(*this, owner_node.id());
    owner_node.storage().reconstruct_file(file_id, output, &provider);
    log::log_event(logger_,
                   Level::Info,
                   "cluster.download.completed",
                   {{"file_id", file_id}, {"owner", owner_node.id()}, {"output", output.string()}});
}

std::optional<NodeHandle> Cluster::find_metadata_owner(const std::string& file_id) const {
    std::optional<NodeHandle> partial;
    for (const auto& handle : nodes()) {
        const auto metadata = node(handle).storage().file_metadata(file_id);
        if (!metadata) {
            continue;
        }
        if (metadata->complete()) {
            return handle;
        }
        if (!partial) {
            partial = handle;
        }
    }
    return partial;
}

std::vector<storage::FileMetadata> Cluster::list_files() const {
    std::map<std::string, storage::FileMetadata> merged;
    for (const auto& handle : nodes()) {
        for (auto& metadata : node(handle).storage().list_files()) {
            auto [it, inserted] = merged.try_emplace(metadata.file_id, metadata);
            if (!inserted) {
                it->second.chunks.insert(metadata.chunks.begin(), metadata.chunks.end());
            }
        }
    }

    std::vector<storage::FileMetadata> files;
    files.reserve(merged.size());
    for (auto& [file_id, metadata] : merged) {
        files.push_back(std::move(metadata));
    }
    return files;
}

std::map<NodeId, bool> Cluster::health_check() {
    return network_.broadcast_health_check();
}

void Cluster::shutdown() {
    std::vector<NodeId> registered;
    {
        std::scoped_lock lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        registered = order_;
    }

    network_.shutdown();
    for (const auto& id : registered) {
        network_.unregister_node(id);
    }
    log::log_event(logger_, Level::Info, "cluster.shutdown", {{"nodes", std::to_string(registered.size())}});
}

Node* Cluster::lookup(const NodeId& id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
}

}  // namespace meshstore::core
