#include "meshstore/network/Interface.hpp"

#include <utility>

namespace meshstore::network {

namespace {

double to_bytes_per_second(double mbps) {
    return (mbps * 1024.0 * 1024.0) / 8.0;
}

}  // namespace

Interface::Interface(NodeId node_id, double bandwidth_mbps)
    : node_id_(std::move(node_id)),
      bandwidth_mbps_(bandwidth_mbps > 0.0 ? bandwidth_mbps : kDefaultBandwidthMbps),
      bandwidth_bps_(to_bytes_per_second(bandwidth_mbps_)),
      started_at_(std::chrono::steady_clock::now()) {}

Delay Interface::send(const Packet& packet) {
    std::scoped_lock lock(mutex_);
    ++packets_sent_;
    bytes_sent_ += packet.payload_size();
    return transmission_time(packet.payload_size());
}

void Interface::receive(Packet packet) {
    std::scoped_lock lock(mutex_);
    ++packets_received_;
    bytes_received_ += packet.payload_size();
    inbound_.push_back(std::move(packet));
}

std::vector<Packet> Interface::pending_packets() {
    std::scoped_lock lock(mutex_);
    std::vector<Packet> drained;
    drained.swap(inbound_);
    return drained;
}

std::size_t Interface::pending_count() const {
    std::scoped_lock lock(mutex_);
    return inbound_.size();
}

Delay Interface::transmission_time(std::size_t payload_bytes) const noexcept {
    const std::chrono::duration<double> seconds(static_cast<double>(payload_bytes) / bandwidth_bps_);
    return std::chrono::duration_cast<Delay>(seconds);
}

void Interface::assign_address(std::string address) {
    std::scoped_lock lock(mutex_);
    address_ = std::move(address);
}

std::string Interface::address() const {
    std::scoped_lock lock(mutex_);
    return address_;
}

InterfaceStatistics Interface::statistics() const {
    std::scoped_lock lock(mutex_);
    InterfaceStatistics stats{};
    stats.node_id = node_id_;
    stats.address = address_;
    stats.bandwidth_mbps = bandwidth_mbps_;
    stats.packets_sent = packets_sent_;
    stats.packets_received = packets_received_;
    stats.bytes_sent = bytes_sent_;
    stats.bytes_received = bytes_received_;
    stats.uptime = std::chrono::steady_clock::now() - started_at_;
    if (stats.uptime.count() > 0.0) {
        stats.throughput_bps = static_cast<double>(bytes_sent_) / stats.uptime.count();
    }
    return stats;
}

}  // namespace meshstore::network
