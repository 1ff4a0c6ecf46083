#pragma once

#include "meshstore/Types.hpp"
#include "meshstore/network/Packet.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace meshstore::network {

using Delay = std::chrono::nanoseconds;

struct InterfaceStatistics {
    NodeId node_id;
    std::string address;
    double bandwidth_mbps{0.0};
    std::uint64_t packets_sent{0};
    std::uint64_t packets_received{0};
    std::uint64_t bytes_sent{0};
    std::uint64_t bytes_received{0};
    std::chrono::duration<double> uptime{0.0};
    double throughput_bps{0.0};
};

// Per-node send/receive bookkeeping. Sending moves no bytes; it only accounts
// the packet and reports how long the configured bandwidth needs for it.
class Interface {
public:
    static constexpr double kDefaultBandwidthMbps = 64.0;

    explicit Interface(NodeId node_id, double bandwidth_mbps = kDefaultBandwidthMbps);

    Interface(const Interface&) = delete;
    Interface& operator=(const Interface&) = delete;

    Delay send(const Packet& packet);
    void receive(Packet packet);
    std::vector<Packet> pending_packets();
    std::size_t pending_count() const;

    Delay transmission_time(std::size_t payload_bytes) const noexcept;
    double bandwidth_bytes_per_second() const noexcept { return bandwidth_bps_; }
    double bandwidth_mbps() const noexcept { return bandwidth_mbps_; }

    void assign_address(std::string address);
    std::string address() const;
    const NodeId& node_id() const noexcept { return node_id_; }

    InterfaceStatistics statistics() const;

private:
    NodeId node_id_;
    double bandwidth_mbps_;
    double bandwidth_bps_;
    std::string address_;
    std::uint64_t packets_sent_{0};
    std::uint64_t packets_received_{0};
    std::uint64_t bytes_sent_{0};
    std::uint64_t bytes_received_{0};
    std::chrono::steady_clock::time_point started_at_;
    std::vector<Packet> inbound_;
    mutable std::mutex mutex_;
};

}  // namespace meshstore::network
