#include "meshstore/network/Network.hpp"

#include "meshstore/Error.hpp"
#include "meshstore/core/Node.hpp"

#include <sstream>
#include <utility>

namespace meshstore::network {

namespace {

using Level = log::StructuredLogger::Level;

std::mt19937 make_rng(const std::optional<std::uint32_t>& seed) {
    if (seed) {
        return std::mt19937(*seed);
    }
    std::random_device device;
    return std::mt19937(device());
}

std::string format_delay(Delay delay) {
    std::ostringstream stream;
    stream << std::chrono::duration<double, std::milli>(delay).count() << "ms";
    return stream.str();
}

}  // namespace

const char* send_status_to_string(SendStatus status) noexcept {
    switch (status) {
        case SendStatus::Scheduled:
            return "scheduled";
        case SendStatus::UnknownDestination:
            return "unknown_destination";
        case SendStatus::UnknownSource:
            return "unknown_source";
        case SendStatus::Dropped:
            return "dropped";
    }
    return "unknown";
}

Network::Network(const Config& config, log::LoggerPtr logger)
    : name_(config.network_name),
      cidr_(config.network_cidr),
      address_prefix_(config.address_prefix),
      last_host_octet_(config.last_host_octet),
      packet_loss_rate_(config.packet_loss_rate),
      min_propagation_delay_(config.min_propagation_delay),
      max_propagation_delay_(config.max_propagation_delay),
      logger_(std::move(logger)),
      next_host_octet_(config.first_host_octet),
      rng_(make_rng(config.random_seed)),
      started_at_(std::chrono::steady_clock::now()) {
    if (max_propagation_delay_ < min_propagation_delay_) {
        std::swap(min_propagation_delay_, max_propagation_delay_);
    }
    scheduler_.start();
    log::log_event(logger_, Level::Info, "network.initialized", {{"network", name_}, {"cidr", cidr_}});
}

Network::~Network() {
    shutdown();
}

std::string Network::allocate_address() {
    std::scoped_lock lock(mutex_);
    if (next_host_octet_ > last_host_octet_) {
        log::log_event(logger_, Level::Error, "network.address.exhausted", {{"network", name_}});
        throw Error(ErrorCode::AddressSpaceExhausted, "Network full - no more addresses available on " + cidr_);
    }
    auto address = address_prefix_ + "." + std::to_string(next_host_octet_);
    ++next_host_octet_;
    log::log_event(logger_, Level::Info, "network.address.assigned", {{"address", address}});
    return address;
}

std::string Network::register_node(core::Node& node, std::optional<std::string> address) {
    {
        std::scoped_lock lock(mutex_);
        if (nodes_.find(node.id()) != nodes_.end()) {
            throw Error(ErrorCode::InvalidArgument, "node " + node.id() + " is already registered");
        }
        if (address && routing_table_.find(*address) != routing_table_.end()) {
            throw Error(ErrorCode::InvalidArgument, "address " + *address + " is already routed");
        }
    }

    const auto assigned = address ? *address : allocate_address();

    std::scoped_lock lock(mutex_);
    if (nodes_.find(node.id()) != nodes_.end() || routing_table_.find(assigned) != routing_table_.end()) {
        throw Error(ErrorCode::InvalidArgument, "node " + node.id() + " raced another registration");
    }
    node.network_interface().assign_address(assigned);
    nodes_[node.id()] = &node;
    routing_table_[assigned] = node.id();
    log::log_event(logger_, Level::Info, "network.node.registered", {{"node", node.id()}, {"address", assigned}});
    return assigned;
}

bool Network::unregister_node(const NodeId& node_id) {
    std::scoped_lock lock(mutex_);
    const auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return false;
    }
    for (auto route = routing_table_.begin(); route != routing_table_.end();) {
        if (route->second == node_id) {
            route = routing_table_.erase(route);
        } else {
            ++route;
        }
    }
    nodes_.erase(it);
    log::log_event(logger_, Level::Info, "network.node.unregistered", {{"node", node_id}});
    return true;
}

Packet Network::make_packet(PacketType type,
                            std::string source,
                            std::string destination,
                            ByteBuffer payload,
                            std::uint32_t sequence,
                            std::uint32_t acknowledgement) {
    std::string id;
    {
        std::scoped_lock lock(mutex_);
        id = "pkt-" + std::to_string(next_packet_id_++);
    }
    return Packet(type, std::move(source), std::move(destination), std::move(payload), std::move(id), sequence,
                  acknowledgement);
}

SendResult Network::send(const std::string& source, const std::string& destination, const Packet& packet) {
    SendResult result{};
    std::scoped_lock lock(mutex_);

    if (routing_table_.find(destination) == routing_table_.end()) {
        result.status = SendStatus::UnknownDestination;
        log::log_event(logger_,
                       Level::Warning,
                       "network.send.unknown_destination",
                       {{"packet", packet.id()}, {"destination", destination}});
        return result;
    }

    const auto source_route = routing_table_.find(source);
    if (source_route == routing_table_.end()) {
        result.status = SendStatus::UnknownSource;
        log::log_event(logger_,
                       Level::Warning,
                       "network.send.unknown_source",
                       {{"packet", packet.id()}, {"source", source}});
        return result;
    }

    if (!scheduler_.running()) {
        ++dropped_packets_;
        result.status = SendStatus::Dropped;
        log::log_event(logger_, Level::Warning, "network.send.after_shutdown", {{"packet", packet.id()}});
        return result;
    }

    std::uniform_real_distribution<double> loss_draw(0.0, 1.0);
    if (loss_draw(rng_) < packet_loss_rate_) {
        ++dropped_packets_;
        result.status = SendStatus::Dropped;
        log::log_event(logger_, Level::Warning, "network.packet.dropped", {{"packet", packet.id()}});
        return result;
    }

    auto* sender = nodes_.at(source_route->second);
    const auto transmission = sender->network_interface().send(packet);

    std::uniform_int_distribution<std::int64_t> propagation_draw(min_propagation_delay_.count(),
                                                                 max_propagation_delay_.count());
    const auto propagation = std::chrono::microseconds(propagation_draw(rng_));
    const auto total = transmission + std::chrono::duration_cast<Delay>(propagation);

    result.ticket = scheduler_.schedule_after(
        std::chrono::duration_cast<DeliveryScheduler::Clock::duration>(total),
        [this, destination, packet]() { deliver(destination, packet); });
    if (result.ticket == DeliveryScheduler::kInvalidTicket) {
        result.status = SendStatus::Dropped;
        ++dropped_packets_;
        return result;
    }

    result.status = SendStatus::Scheduled;
    result.accepted = true;
    result.scheduled_delay = total;
    log::log_event(logger_,
                   Level::Info,
                   "network.packet.scheduled",
                   {{"packet", packet.id()},
                    {"type", packet_type_to_string(packet.type())},
                    {"source", source},
                    {"destination", destination},
                    {"delay", format_delay(total)}});
    return result;
}

void Network::deliver(const std::string& destination, const Packet& packet) {
    std::scoped_lock lock(mutex_);
    const auto route = routing_table_.find(destination);
    if (route == routing_table_.end()) {
        log::log_event(logger_,
                       Level::Warning,
                       "network.packet.undeliverable",
                       {{"packet", packet.id()}, {"destination", destination}});
        return;
    }
    const auto node = nodes_.find(route->second);
    if (node == nodes_.end()) {
        return;
    }
    node->second->network_interface().receive(packet);
}

std::map<NodeId, bool> Network::broadcast_health_check() const {
    std::map<NodeId, bool> health;
    std::scoped_lock lock(mutex_);
    for (const auto& [node_id, node] : nodes_) {
        const bool alive = node->is_alive();
        health[node_id] = alive;
        log::log_event(logger_,
                       Level::Info,
                       "network.health_check",
                       {{"node", node_id}, {"status", alive ? "ALIVE" : "DEAD"}});
    }
    return health;
}

Topology Network::topology() const {
    Topology topology{};
    topology.network_name = name_;
    topology.cidr = cidr_;

    std::scoped_lock lock(mutex_);
    topology.node_count = nodes_.size();
    for (const auto& [node_id, node] : nodes_) {
        const auto info = node->storage().storage_info();
        NodeTopology entry{};
        entry.address = node->network_interface().address();
        entry.alive = node->is_alive();
        entry.segments_stored = info.segments_stored;
        entry.files_tracked = info.files_tracked;
        entry.used_bytes = info.used_bytes;
        topology.nodes.emplace(node_id, std::move(entry));
    }
    return topology;
}

NetworkStatistics Network::statistics() const {
    NetworkStatistics stats{};
    stats.network_name = name_;
    stats.packet_loss_rate = packet_loss_rate_;

    std::scoped_lock lock(mutex_);
    stats.uptime = std::chrono::steady_clock::now() - started_at_;
    stats.total_nodes = nodes_.size();
    stats.dropped_packets = dropped_packets_;
    for (const auto& [address, node_id] : routing_table_) {
        const auto node = nodes_.find(node_id);
        if (node == nodes_.end()) {
            continue;
        }
        auto interface_stats = node->second->network_interface().statistics();
        stats.total_packets_sent += interface_stats.packets_sent;
        stats.total_packets_received += interface_stats.packets_received;
        stats.total_bytes_transmitted += interface_stats.bytes_sent + interface_stats.bytes_received;
        stats.interfaces.emplace(address, std::move(interface_stats));
    }

    const double elapsed = stats.uptime.count();
    if (elapsed > 0.0) {
        stats.average_throughput_mbps =
            (static_cast<double>(stats.total_bytes_transmitted) * 8.0) / (1024.0 * 1024.0 * elapsed);
    }
    return stats;
}

std::optional<NodeId> Network::resolve(const std::string& address) const {
    std::scoped_lock lock(mutex_);
    const auto it = routing_table_.find(address);
    if (it == routing_table_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t Network::node_count() const {
    std::scoped_lock lock(mutex_);
    return nodes_.size();
}

void Network::shutdown() {
    if (!scheduler_.running()) {
        return;
    }
    const auto discarded = scheduler_.stop();
    log::log_event(logger_,
                   Level::Info,
                   "network.shutdown",
                   {{"network", name_}, {"discarded_deliveries", std::to_string(discarded)}});
}

std::size_t Network::pending_deliveries() const {
    return scheduler_.pending();
}

bool Network::wait_for_deliveries(std::chrono::milliseconds timeout) {
    return scheduler_.wait_until_idle(timeout);
}

}  // namespace meshstore::network
