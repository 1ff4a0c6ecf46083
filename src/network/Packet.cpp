#include "meshstore/network/Packet.hpp"

#include <array>
#include <utility>

namespace meshstore::network {

namespace {

struct PacketTypeName {
    PacketType type;
    const char* name;
};

constexpr std::array<PacketTypeName, 6> kPacketTypeNames = {{
    {PacketType::Syn, "SYN"},
    {PacketType::SynAck, "SYN_ACK"},
    {PacketType::Ack, "ACK"},
    {PacketType::Data, "DATA"},
    {PacketType::Fin, "FIN"},
    {PacketType::HealthCheck, "HEALTH_CHECK"},
}};

}  // namespace

const char* packet_type_to_string(PacketType type) noexcept {
    for (const auto& entry : kPacketTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

std::optional<PacketType> packet_type_from_string(std::string_view text) {
    for (const auto& entry : kPacketTypeNames) {
        if (text == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::uint8_t payload_checksum(std::span<const std::uint8_t> payload) noexcept {
    std::uint8_t checksum = 0;
    for (const auto byte : payload) {
        checksum ^= byte;
    }
    return checksum;
}

Packet::Packet(PacketType type,
               std::string source,
               std::string destination,
               ByteBuffer payload,
               std::string id,
               std::uint32_t sequence,
               std::uint32_t acknowledgement)
    : type_(type),
      source_(std::move(source)),
      destination_(std::move(destination)),
      payload_(std::move(payload)),
      id_(std::move(id)),
      timestamp_(std::chrono::system_clock::now()),
      sequence_(sequence),
      acknowledgement_(acknowledgement),
      checksum_(payload_checksum(payload_)) {}

bool Packet::intact() const noexcept {
    return payload_checksum(payload_) == checksum_;
}

}  // namespace meshstore::network
