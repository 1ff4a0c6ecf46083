#pragma once

#include "meshstore/Config.hpp"
#include "meshstore/Types.hpp"
#include "meshstore/core/Node.hpp"
#include "meshstore/log/StructuredLogger.hpp"
#include "meshstore/network/Network.hpp"
#include "meshstore/storage/SegmentProvider.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace meshstore::core {

// Stable reference to a node owned by a Cluster. Nodes are never moved or
// removed while the cluster lives, so a handle stays valid until teardown.
class NodeHandle {
public:
    NodeHandle() = default;

    const NodeId& id() const noexcept { return id_; }
    bool valid() const noexcept { return !id_.empty(); }

    bool operator==(const NodeHandle& other) const = default;

private:
    friend class Cluster;
    explicit NodeHandle(NodeId id) : id_(std::move(id)) {}

    NodeId id_;
};

struct SegmentPlacement {
    std::string segment_id;
    std::size_t chunk_number{0};
    NodeId node_id;
};

struct FailedSegment {
    std::string segment_id;
    NodeId node_id;
    std::string reason;
};

struct UploadReport {
    std::string file_id;
    std::string original_filename;
    std::uint64_t total_size_bytes{0};
    std::size_t total_chunks{0};
    std::vector<SegmentPlacement> placements;
    std::vector<FailedSegment> failed;
    std::size_t packets_dropped{0};

    bool complete() const noexcept { return failed.empty() && placements.size() == total_chunks; }
};

class Cluster;

// Looks for a segment on every other node of the cluster. Offline nodes are
// skipped and turn a miss into Unavailable instead of NotFound.
class ClusterSegmentProvider : public storage::SegmentProvider {
public:
    ClusterSegmentProvider(Cluster& cluster, NodeId requester);

    storage::FetchResult fetch_segment(const std::string& segment_id) override;

private:
    Cluster& cluster_;
    NodeId requester_;
};

class Cluster {
public:
    explicit Cluster(Config config, log::LoggerPtr logger = nullptr);
    ~Cluster();

    Cluster(const Cluster&) = delete;
    Cluster& operator=(const Cluster&) = delete;

    // Creates the node under <storage_root>/<id>, registers it on the network
    // and peers it with every existing node. Throws Error{InvalidArgument} for
    // a duplicate id.
    NodeHandle add_node(const NodeId& id);
    // Node_01 .. Node_NN for config().node_count.
    std::vector<NodeHandle> initialize_nodes();

    // Throws Error{NotFound} for handles this cluster did not issue.
    Node& node(const NodeHandle& handle);
    const Node& node(const NodeHandle& handle) const;
    std::optional<NodeHandle> find_node(const NodeId& id) const;
    std::vector<NodeHandle> nodes() const;
    std::size_t size() const;

    // Chunks on the origin and stores the segments round-robin across the
    // targets (every node when empty). A chunk size of 0 selects
    // config().chunk_size.
    UploadReport distribute_file(const NodeHandle& origin,
                                 const std::filesystem::path& path,
                                 std::size_t chunk_size = 0,
                                 std::vector<NodeHandle> targets = {});

    void reconstruct_file(const NodeHandle& owner, const std::string& file_id, const std::filesystem::path& output);

    // Prefers a node whose chunk map is complete.
    std::optional<NodeHandle> find_metadata_owner(const std::string& file_id) const;
    std::vector<storage::FileMetadata> list_files() const;

    std::map<NodeId, bool> health_check();

    network::Network& network() noexcept { return network_; }
    const network::Network& network() const noexcept { return network_; }
    const Config& config() const noexcept { return config_; }

    void shutdown();

private:
    Node* lookup(const NodeId& id) const;

    Config config_;
    log::LoggerPtr logger_;
    std::vector<NodeId> order_;
    std::map<NodeId, std::unique_ptr<Node>> nodes_;
    // Declared after the nodes so it is torn down first.
    network::Network network_;
    bool shut_down_{false};
    mutable std::mutex mutex_;
};

}  // namespace meshstore::core
