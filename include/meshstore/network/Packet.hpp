#pragma once

#include "meshstore/Types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace meshstore::network {

enum class PacketType : std::uint8_t {
    Syn = 0x01,
    SynAck = 0x02,
    Ack = 0x03,
    Data = 0x04,
    Fin = 0x05,
    HealthCheck = 0x06,
};

const char* packet_type_to_string(PacketType type) noexcept;
std::optional<PacketType> packet_type_from_string(std::string_view text);

// XOR of every payload byte.
std::uint8_t payload_checksum(std::span<const std::uint8_t> payload) noexcept;

// One simulated transmission. Immutable once constructed.
class Packet {
public:
    Packet(PacketType type,
           std::string source,
           std::string destination,
           ByteBuffer payload,
           std::string id,
           std::uint32_t sequence = 0,
           std::uint32_t acknowledgement = 0);

    PacketType type() const noexcept { return type_; }
    const std::string& source() const noexcept { return source_; }
    const std::string& destination() const noexcept { return destination_; }
    const ByteBuffer& payload() const noexcept { return payload_; }
    std::size_t payload_size() const noexcept { return payload_.size(); }
    const std::string& id() const noexcept { return id_; }
    std::chrono::system_clock::time_point timestamp() const noexcept { return timestamp_; }
    std::uint32_t sequence() const noexcept { return sequence_; }
    std::uint32_t acknowledgement() const noexcept { return acknowledgement_; }
    std::uint8_t checksum() const noexcept { return checksum_; }

    bool intact() const noexcept;

private:
    PacketType type_;
    std::string source_;
    std::string destination_;
    ByteBuffer payload_;
    std::string id_;
    std::chrono::system_clock::time_point timestamp_;
    std::uint32_t sequence_;
    std::uint32_t acknowledgement_;
    std::uint8_t checksum_;
};

}  // namespace meshstore::network
