#pragma once

#include "meshstore/Config.hpp"
#include "meshstore/Types.hpp"
#include "meshstore/log/StructuredLogger.hpp"
#include "meshstore/network/DeliveryScheduler.hpp"
#include "meshstore/network/Interface.hpp"
#include "meshstore/network/Packet.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace meshstore::core {
class Node;
}  // namespace meshstore::core

namespace meshstore::network {

enum class SendStatus {
    Scheduled,
    UnknownDestination,
    UnknownSource,
    Dropped,
};

const char* send_status_to_string(SendStatus status) noexcept;

struct SendResult {
    SendStatus status{SendStatus::Dropped};
    bool accepted{false};
    Delay scheduled_delay{0};
    DeliveryScheduler::Ticket ticket{DeliveryScheduler::kInvalidTicket};
};

struct NodeTopology {
    std::string address;
    bool alive{false};
    std::size_t segments_stored{0};
    std::size_t files_tracked{0};
    std::uint64_t used_bytes{0};
};

struct Topology {
    std::string network_name;
    std::string cidr;
    std::size_t node_count{0};
    std::map<NodeId, NodeTopology> nodes;
};

struct NetworkStatistics {
    std::string network_name;
    std::chrono::duration<double> uptime{0.0};
    std::size_t total_nodes{0};
    std::uint64_t total_packets_sent{0};
    std::uint64_t total_packets_received{0};
    std::uint64_t total_bytes_transmitted{0};
    double average_throughput_mbps{0.0};
    double packet_loss_rate{0.0};
    std::uint64_t dropped_packets{0};
    // Keyed by address.
    std::map<std::string, InterfaceStatistics> interfaces;
};

// Address allocation, routing and delayed packet delivery between the
// interfaces of registered nodes. Nodes are not owned; a node must be
// unregistered before it is destroyed.
class Network {
public:
    explicit Network(const Config& config, log::LoggerPtr logger = nullptr);
    ~Network();

    Network(const Network&) = delete;
    Network& operator=(const Network&) = delete;

    // Throws Error{AddressSpaceExhausted} once the host range is used up.
    std::string allocate_address();

    // Throws Error{InvalidArgument} when the node id or the address is
    // already routed.
    std::string register_node(core::Node& node, std::optional<std::string> address = std::nullopt);
    bool unregister_node(const NodeId& node_id);

    Packet make_packet(PacketType type,
                       std::string source,
                       std::string destination,
                       ByteBuffer payload = {},
                       std::uint32_t sequence = 0,
                       std::uint32_t acknowledgement = 0);

    SendResult send(const std::string& source, const std::string& destination, const Packet& packet);

    std::map<NodeId, bool> broadcast_health_check() const;
    Topology topology() const;
    NetworkStatistics statistics() const;

    std::optional<NodeId> resolve(const std::string& address) const;
    std::size_t node_count() const;

    // Discards pending deliveries without running them.
    void shutdown();
    std::size_t pending_deliveries() const;
    bool wait_for_deliveries(std::chrono::milliseconds timeout);

    const std::string& name() const noexcept { return name_; }
    const std::string& cidr() const noexcept { return cidr_; }

private:
    void deliver(const std::string& destination, const Packet& packet);

    std::string name_;
    std::string cidr_;
    std::string address_prefix_;
    std::uint16_t last_host_octet_;
    double packet_loss_rate_;
    std::chrono::microseconds min_propagation_delay_;
    std::chrono::microseconds max_propagation_delay_;
    log::LoggerPtr logger_;

    std::uint16_t next_host_octet_;
    std::map<NodeId, core::Node*> nodes_;
    std::map<std::string, NodeId> routing_table_;
    std::mt19937 rng_;
    std::uint64_t next_packet_id_{1};
    std::uint64_t dropped_packets_{0};
    std::chrono::steady_clock::time_point started_at_;
    mutable std::mutex mutex_;

    DeliveryScheduler scheduler_;
};

}  // namespace meshstore::network
