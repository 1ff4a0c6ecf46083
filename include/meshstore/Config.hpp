#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace meshstore {

struct Config {
    std::string network_name{"P2P_Storage_Network"};
    std::string network_cidr{"192.168.1.0/24"};
    std::string address_prefix{"192.168.1"};
    std::uint16_t first_host_octet{2};
    std::uint16_t last_host_octet{254};
    double packet_loss_rate{0.01};
    std::chrono::microseconds min_propagation_delay{std::chrono::milliseconds(1)};
    std::chrono::microseconds max_propagation_delay{std::chrono::milliseconds(10)};
    double bandwidth_mbps{64.0};
    std::string storage_root{"node_storage"};
    std::uint64_t capacity_bytes{10ull * 1024ull * 1024ull * 1024ull};
    std::size_t chunk_size{64 * 1024};
    std::size_t node_count{5};
    std::optional<std::uint32_t> random_seed{};
    bool logging_enabled{true};
};

// Reads a JSON object whose keys mirror the Config fields. Delays are given in
// milliseconds ("min_propagation_delay_ms"). Throws Error{InvalidConfig}.
Config load_config_file(const std::filesystem::path& path, Config base = {});
Config parse_config(std::string_view json_text, Config base = {});

}  // namespace meshstore
