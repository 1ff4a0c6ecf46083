#include "meshstore/core/Node.hpp"
#include "meshstore/network/Network.hpp"
#include "meshstore/network/Packet.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

using meshstore::ByteBuffer;
using meshstore::core::Node;
using meshstore::network::Network;
using meshstore::network::Packet;
using meshstore::network::PacketType;
using meshstore::network::SendStatus;

int main() {
    meshstore::test::TempDirectory scratch("packet_delivery");
    auto config = meshstore::test::quiet_config(scratch.path());

    {
        const Packet packet(PacketType::Data, "a", "b", ByteBuffer{0x0F, 0xF0, 0x01}, "pkt-x", 3, 4);
        assert(packet.checksum() == 0xFE);
        assert(packet.intact());
        assert(packet.sequence() == 3 && packet.acknowledgement() == 4);
        assert(meshstore::network::packet_type_from_string("HEALTH_CHECK") == PacketType::HealthCheck);
        assert(!meshstore::network::packet_type_from_string("PING").has_value());
    }

    // Lossless delivery lands on the destination interface.
    {
        Network network(config);
        Node alpha("alpha", config);
        Node beta("beta", config);
        const auto a = network.register_node(alpha);
        const auto b = network.register_node(beta);

        const auto first = network.make_packet(PacketType::Syn, a, b);
        const auto second = network.make_packet(PacketType::Data, a, b, ByteBuffer(4096, 0x5A), 1);
        assert(first.id() == "pkt-1");
        assert(second.id() == "pkt-2");

        const auto result = network.send(a, b, second);
        assert(result.status == SendStatus::Scheduled);
        assert(result.accepted);
        assert(result.scheduled_delay >= 1ms);
        assert(network.wait_for_deliveries(2s));

        auto received = beta.network_interface().pending_packets();
        assert(received.size() == 1);
        assert(received.front().id() == "pkt-2");
        assert(received.front().payload() == ByteBuffer(4096, 0x5A));
        assert(received.front().intact());
        assert(beta.network_interface().pending_packets().empty());

        const auto stats = network.statistics();
        assert(stats.total_packets_sent == 1);
        assert(stats.total_packets_received == 1);
        assert(stats.total_bytes_transmitted == 2 * 4096);
        assert(stats.dropped_packets == 0);

        // Unknown destination: nothing is counted on the receiving side.
        const auto stray = network.send(a, "192.168.1.200", first);
        assert(stray.status == SendStatus::UnknownDestination);
        assert(!stray.accepted);
        assert(beta.network_interface().statistics().packets_received == 1);

        const auto unknown_source = network.send("192.168.1.201", b, first);
        assert(unknown_source.status == SendStatus::UnknownSource);

        network.shutdown();
        network.unregister_node(alpha.id());
        network.unregister_node(beta.id());
    }

    // Certain loss drops silently and leaves the sender's counters alone.
    {
        auto lossy = config;
        lossy.packet_loss_rate = 1.0;
        Network network(lossy);
        Node alpha("alpha", lossy);
        Node beta("beta", lossy);
        const auto a = network.register_node(alpha);
        const auto b = network.register_node(beta);

        for (int i = 0; i < 10; ++i) {
            const auto result = network.send(a, b, network.make_packet(PacketType::Data, a, b, ByteBuffer(16, 1)));
            assert(result.status == SendStatus::Dropped);
            assert(!result.accepted);
        }
        assert(network.statistics().dropped_packets == 10);
        assert(alpha.network_interface().statistics().packets_sent == 0);

        network.unregister_node(alpha.id());
        network.unregister_node(beta.id());
    }

    // A destination that leaves before delivery never sees the packet, and
    // shutdown throws away whatever is still queued.
    {
        auto slow = config;
        slow.min_propagation_delay = 150ms;
        slow.max_propagation_delay = 150ms;
        Network network(slow);
        Node alpha("alpha", slow);
        Node beta("beta", slow);
        Node gamma("gamma", slow);
        const auto a = network.register_node(alpha);
        const auto b = network.register_node(beta);
        const auto c = network.register_node(gamma);

        assert(network.send(a, b, network.make_packet(PacketType::Data, a, b)).accepted);
        network.unregister_node(beta.id());
        assert(network.wait_for_deliveries(2s));
        assert(beta.network_interface().pending_count() == 0);

        assert(network.send(a, c, network.make_packet(PacketType::Fin, a, c)).accepted);
        assert(network.pending_deliveries() == 1);
        network.shutdown();
        assert(network.pending_deliveries() == 0);
        std::this_thread::sleep_for(200ms);
        assert(gamma.network_interface().pending_count() == 0);

        // Sending after shutdown is a drop that leaves the sender's counters alone.
        const auto sent_before = alpha.network_interface().statistics().packets_sent;
        const auto dropped_before = network.statistics().dropped_packets;
        const auto after = network.send(a, c, network.make_packet(PacketType::Fin, a, c, ByteBuffer(32, 7)));
        assert(!after.accepted);
        assert(after.status == SendStatus::Dropped);
        assert(alpha.network_interface().statistics().packets_sent == sent_before);
        assert(network.statistics().dropped_packets == dropped_before + 1);

        network.unregister_node(alpha.id());
        network.unregister_node(gamma.id());
    }

    return 0;
}
