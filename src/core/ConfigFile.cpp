#include "meshstore/Config.hpp"

#include "meshstore/Error.hpp"
#include "meshstore/util/Json.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace meshstore {

namespace {

using util::JsonValue;

const std::set<std::string, std::less<>> kKnownKeys = {
    "network_name",
    "network_cidr",
    "address_prefix",
    "first_host_octet",
    "last_host_octet",
    "packet_loss_rate",
    "min_propagation_delay_ms",
    "max_propagation_delay_ms",
    "bandwidth_mbps",
    "storage_root",
    "capacity_bytes",
    "chunk_size",
    "node_count",
    "random_seed",
    "logging_enabled",
};

[[noreturn]] void invalid(const std::string& message) {
    throw Error(ErrorCode::InvalidConfig, message);
}

std::optional<std::string> get_string(const JsonValue& root, std::string_view key) {
    const auto* node = root.find(key);
    if (!node) {
        return std::nullopt;
    }
    if (!node->is_string()) {
        invalid("Expected string for " + std::string(key));
    }
    return node->string_value;
}

std::optional<bool> get_bool(const JsonValue& root, std::string_view key) {
    const auto* node = root.find(key);
    if (!node) {
        return std::nullopt;
    }
    if (!node->is_bool()) {
        invalid("Expected boolean for " + std::string(key));
    }
    return node->bool_value;
}

std::optional<double> get_number(const JsonValue& root, std::string_view key) {
    const auto* node = root.find(key);
    if (!node) {
        return std::nullopt;
    }
    if (!node->is_number() || !std::isfinite(node->number_value)) {
        invalid("Expected number for " + std::string(key));
    }
    return node->number_value;
}

std::optional<std::uint64_t> get_unsigned(const JsonValue& root, std::string_view key) {
    const auto* node = root.find(key);
    if (!node) {
        return std::nullopt;
    }
    if (!node->is_number()) {
        invalid("Expected integer for " + std::string(key));
    }
    const auto value = node->as_uint64();
    if (!value) {
        invalid(std::string(key) + " must be a non-negative integer");
    }
    return value;
}

void validate(const Config& config) {
    if (config.network_name.empty()) {
        invalid("network_name must not be empty");
    }
    if (config.address_prefix.empty() || config.address_prefix.back() == '.') {
        invalid("address_prefix must look like '192.168.1'");
    }
    if (config.first_host_octet == 0 || config.last_host_octet > 254 ||
        config.first_host_octet > config.last_host_octet) {
        invalid("host octets must satisfy 1 <= first_host_octet <= last_host_octet <= 254");
    }
    if (config.packet_loss_rate < 0.0 || config.packet_loss_rate > 1.0) {
        invalid("packet_loss_rate must be between 0 and 1");
    }
    if (config.min_propagation_delay.count() < 0 ||
        config.min_propagation_delay > config.max_propagation_delay) {
        invalid("propagation delays must satisfy 0 <= min <= max");
    }
    if (config.bandwidth_mbps <= 0.0) {
        invalid("bandwidth_mbps must be positive");
    }
    if (config.storage_root.empty()) {
        invalid("storage_root must not be empty");
    }
    if (config.capacity_bytes == 0) {
        invalid("capacity_bytes must be positive");
    }
    if (config.chunk_size == 0) {
        invalid("chunk_size must be positive");
    }
    if (config.node_count == 0 ||
        config.node_count > static_cast<std::size_t>(config.last_host_octet - config.first_host_octet + 1)) {
        invalid("node_count must be between 1 and the number of host addresses");
    }
}

std::chrono::microseconds milliseconds_to_delay(double milliseconds, const char* key) {
    if (milliseconds < 0.0) {
        invalid(std::string(key) + " must be non-negative");
    }
    return std::chrono::microseconds(static_cast<std::int64_t>(std::llround(milliseconds * 1000.0)));
}

std::uint16_t to_octet(std::uint64_t value, const char* key) {
    if (value > 255) {
        invalid(std::string(key) + " must be between 0 and 255");
    }
    return static_cast<std::uint16_t>(value);
}

}  // namespace

Config parse_config(std::string_view json_text, Config base) {
    JsonValue root;
    try {
        root = util::parse_json(json_text);
    } catch (const std::runtime_error& ex) {
        invalid(std::string("Malformed configuration: ") + ex.what());
    }
    if (!root.is_object()) {
        invalid("Configuration root must be an object");
    }

    for (const auto& [key, value] : root.object_value) {
        if (kKnownKeys.find(key) == kKnownKeys.end()) {
            invalid("Unknown configuration key: " + key);
        }
    }

    Config config = std::move(base);
    if (auto value = get_string(root, "network_name")) {
        config.network_name = *value;
    }
    if (auto value = get_string(root, "network_cidr")) {
        config.network_cidr = *value;
    }
    if (auto value = get_string(root, "address_prefix")) {
        config.address_prefix = *value;
    }
    if (auto value = get_unsigned(root, "first_host_octet")) {
        config.first_host_octet = to_octet(*value, "first_host_octet");
    }
    if (auto value = get_unsigned(root, "last_host_octet")) {
        config.last_host_octet = to_octet(*value, "last_host_octet");
    }
    if (auto value = get_number(root, "packet_loss_rate")) {
        config.packet_loss_rate = *value;
    }
    if (auto value = get_number(root, "min_propagation_delay_ms")) {
        config.min_propagation_delay = milliseconds_to_delay(*value, "min_propagation_delay_ms");
    }
    if (auto value = get_number(root, "max_propagation_delay_ms")) {
        config.max_propagation_delay = milliseconds_to_delay(*value, "max_propagation_delay_ms");
    }
    if (auto value = get_number(root, "bandwidth_mbps")) {
        config.bandwidth_mbps = *value;
    }
    if (auto value = get_string(root, "storage_root")) {
        config.storage_root = *value;
    }
    if (auto value = get_unsigned(root, "capacity_bytes")) {
        config.capacity_bytes = *value;
    }
    if (auto value = get_unsigned(root, "chunk_size")) {
        config.chunk_size = static_cast<std::size_t>(*value);
    }
    if (auto value = get_unsigned(root, "node_count")) {
        config.node_count = static_cast<std::size_t>(*value);
    }
    if (const auto* seed = root.find("random_seed")) {
        if (seed->is_null()) {
            config.random_seed.reset();
        } else {
            const auto value = get_unsigned(root, "random_seed");
            if (*value > std::numeric_limits<std::uint32_t>::max()) {
                invalid("random_seed must fit within 32 bits");
            }
            config.random_seed = static_cast<std::uint32_t>(*value);
        }
    }
    if (auto value = get_bool(root, "logging_enabled")) {
        config.logging_enabled = *value;
    }

    validate(config);
    return config;
}

Config load_config_file(const std::filesystem::path& path, Config base) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        invalid("Configuration file not found: " + path.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str(), std::move(base));
}

}  // namespace meshstore
