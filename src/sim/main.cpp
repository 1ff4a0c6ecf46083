#include "meshstore/Config.hpp"
#include "meshstore/Error.hpp"
#include "meshstore/core/Cluster.hpp"
#include "meshstore/crypto/Sha256.hpp"
#include "meshstore/log/StructuredLogger.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using meshstore::Error;
using meshstore::ErrorCode;

constexpr std::size_t kDemoFileBytes = 1024 * 1024;
constexpr std::size_t kDemoChunkBytes = 256 * 1024;
constexpr auto kDeliveryWait = std::chrono::milliseconds(2000);

struct GlobalOptions {
    std::optional<std::string> config_path;
    std::optional<std::size_t> node_count;
    std::optional<std::string> storage_root;
    bool quiet{false};
};

[[noreturn]] void usage_error(const std::string& message) {
    throw Error(ErrorCode::InvalidArgument, message);
}

std::size_t parse_count(std::string_view option, std::string_view text) {
    std::size_t value = 0;
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc{} || result.ptr != end || value == 0) {
        usage_error(std::string(option) + " expects a positive integer, got '" + std::string(text) + "'");
    }
    return value;
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::array<const char*, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed;
    if (unit_index == 0 || value >= 100.0) {
        oss << std::setprecision(0);
    } else {
        oss << std::setprecision(1);
    }
    oss << value << ' ' << kUnits[unit_index];
    return oss.str();
}

void print_usage() {
    std::cout << "meshstore simulator" << std::endl;
    std::cout << "Usage: meshstore-sim [options] <command> [args]\n\n";
    std::cout << "Global options:\n"
              << "  --config <file>           Load settings from a JSON file\n"
              << "  --nodes <n>               Number of simulated nodes (default 5)\n"
              << "  --storage-root <dir>      Directory holding one folder per node (default node_storage)\n"
              << "  --quiet                   Suppress structured log output\n"
              << "  --help                    Print this help message\n\n";
    std::cout << "Commands:\n"
              << "  demo                      Upload a generated file, check health and print a report\n"
              << "  upload <file> [--chunk-size <bytes>]\n"
              << "                            Chunk a file on Node_01 and spread it round-robin\n"
              << "  download <file_id> <output> [--node <id>]\n"
              << "                            Reassemble a stored file into <output>\n"
              << "  list                      List files known to any node\n"
              << "  nodes                     List nodes with address, status and storage use\n"
              << "  storage                   Per-node capacity and utilization with cluster totals\n"
              << "  health                    Report which nodes are alive\n"
              << "  topology                  Show addresses and storage use per node\n"
              << "  stats                     Ping every node and print traffic statistics\n";
}

meshstore::Config build_config(const GlobalOptions& options) {
    meshstore::Config config{};
    if (options.config_path) {
        config = meshstore::load_config_file(*options.config_path);
    }
    if (options.node_count) {
        config.node_count = *options.node_count;
    }
    if (options.storage_root) {
        config.storage_root = *options.storage_root;
    }
    return config;
}

meshstore::log::LoggerPtr build_logger(const GlobalOptions& options, const meshstore::Config& config) {
    if (options.quiet || !config.logging_enabled) {
        return nullptr;
    }
    return std::make_shared<meshstore::log::StructuredLogger>();
}

// Each node sends one HEALTH_CHECK packet to the next one in the ring.
void ping_ring(meshstore::core::Cluster& cluster) {
    auto& network = cluster.network();
    const auto handles = cluster.nodes();
    if (handles.size() < 2) {
        return;
    }
    for (std::size_t index = 0; index < handles.size(); ++index) {
        const auto source = cluster.node(handles[index]).network_interface().address();
        const auto destination = cluster.node(handles[(index + 1) % handles.size()]).network_interface().address();
        const std::string payload = "ping " + handles[index].id();
        auto packet = network.make_packet(meshstore::network::PacketType::HealthCheck,
                                          source,
                                          destination,
                                          meshstore::ByteBuffer(payload.begin(), payload.end()),
                                          static_cast<std::uint32_t>(index));
        const auto result = network.send(source, destination, packet);
        if (!result.accepted) {
            std::cout << "  ping " << source << " -> " << destination << ": "
                      << meshstore::network::send_status_to_string(result.status) << std::endl;
        }
    }
    if (!network.wait_for_deliveries(kDeliveryWait)) {
        std::cout << "  " << network.pending_deliveries() << " deliveries still in flight" << std::endl;
    }
}

void print_health(meshstore::core::Cluster& cluster) {
    for (const auto& [node_id, alive] : cluster.health_check()) {
        std::cout << "  " << node_id << ": " << (alive ? "[ALIVE]" : "[DEAD]") << std::endl;
    }
}

void print_topology(const meshstore::core::Cluster& cluster) {
    const auto topology = cluster.network().topology();
    std::cout << "Network:  " << topology.network_name << " (" << topology.cidr << ")\n"
              << "Nodes:    " << topology.node_count << std::endl;
    for (const auto& [node_id, entry] : topology.nodes) {
        std::cout << "\n  " << node_id << ":\n"
                  << "    Address:        " << entry.address << "\n"
                  << "    Status:         " << (entry.alive ? "ALIVE" : "DEAD") << "\n"
                  << "    Segments:       " << entry.segments_stored << "\n"
                  << "    Files tracked:  " << entry.files_tracked << "\n"
                  << "    Storage used:   " << format_bytes(entry.used_bytes) << std::endl;
    }
}

void print_nodes(const meshstore::core::Cluster& cluster) {
    std::cout << "Network: " << cluster.network().name() << " (" << cluster.network().cidr() << ")\n"
              << std::left << std::setw(12) << "Node ID" << std::setw(16) << "Address" << std::setw(8) << "Status"
              << std::setw(24) << "Storage" << "Files" << std::endl;
    for (const auto& handle : cluster.nodes()) {
        const auto info = cluster.node(handle).info();
        std::cout << std::setw(12) << info.node_id << std::setw(16) << info.address << std::setw(8)
                  << (info.alive ? "ALIVE" : "DEAD") << std::setw(24)
                  << (format_bytes(info.used_bytes) + " / " + format_bytes(info.capacity_bytes)) << info.files_tracked
                  << std::endl;
    }
    std::cout << std::right;
}

void print_storage(const meshstore::core::Cluster& cluster) {
    std::uint64_t total_capacity = 0;
    std::uint64_t total_used = 0;
    std::cout << std::left << std::setw(12) << "Node ID" << std::setw(14) << "Capacity" << std::setw(14) << "Used"
              << std::setw(14) << "Available" << "Utilization" << std::endl;
    std::cout << std::fixed << std::setprecision(1);
    for (const auto& handle : cluster.nodes()) {
        const auto info = cluster.node(handle).storage().storage_info();
        total_capacity += info.capacity_bytes;
        total_used += info.used_bytes;
        std::cout << std::setw(12) << info.node_id << std::setw(14) << format_bytes(info.capacity_bytes)
                  << std::setw(14) << format_bytes(info.used_bytes) << std::setw(14)
                  << format_bytes(info.available_bytes) << info.utilization_percent << "%" << std::endl;
    }
    std::cout << std::setw(12) << "TOTAL" << std::setw(14) << format_bytes(total_capacity) << std::setw(14)
              << format_bytes(total_used) << std::setw(14) << format_bytes(total_capacity - total_used);
    if (total_capacity > 0) {
        std::cout << static_cast<double>(total_used) * 100.0 / static_cast<double>(total_capacity) << "%";
    } else {
        std::cout << "N/A";
    }
    std::cout << std::endl;
    std::cout << std::right;
    std::cout.unsetf(std::ios::floatfield);
}

void print_statistics(const meshstore::core::Cluster& cluster) {
    const auto stats = cluster.network().statistics();
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Uptime:             " << stats.uptime.count() << "s\n"
              << "Nodes:              " << stats.total_nodes << "\n"
              << "Packets sent:       " << stats.total_packets_sent << "\n"
              << "Packets received:   " << stats.total_packets_received << "\n"
              << "Packets dropped:    " << stats.dropped_packets << "\n"
              << "Data transmitted:   " << format_bytes(stats.total_bytes_transmitted) << "\n"
              << "Avg throughput:     " << stats.average_throughput_mbps << " Mbps\n"
              << "Loss rate:          " << stats.packet_loss_rate * 100.0 << "%" << std::endl;
    for (const auto& [address, interface_stats] : stats.interfaces) {
        std::cout << "  " << address << " (" << interface_stats.node_id << "): sent " << interface_stats.packets_sent
                  << " / received " << interface_stats.packets_received << std::endl;
    }
    std::cout.unsetf(std::ios::floatfield);
}

void print_upload_report(const meshstore::core::UploadReport& report) {
    std::cout << "File ID:        " << report.file_id << "\n"
              << "Name:           " << report.original_filename << "\n"
              << "Size:           " << format_bytes(report.total_size_bytes) << "\n"
              << "Segments:       " << report.total_chunks << std::endl;
    for (const auto& placement : report.placements) {
        std::cout << "  chunk " << placement.chunk_number << " -> " << placement.node_id << std::endl;
    }
    for (const auto& failure : report.failed) {
        std::cout << "  FAILED " << failure.segment_id << " on " << failure.node_id << ": " << failure.reason
                  << std::endl;
    }
    if (report.packets_dropped > 0) {
        std::cout << "Simulated packets dropped: " << report.packets_dropped << std::endl;
    }
}

int run_upload(meshstore::core::Cluster& cluster, const std::vector<std::string>& args) {
    std::optional<std::string> file;
    std::size_t chunk_size = 0;
    for (std::size_t index = 0; index < args.size(); ++index) {
        if (args[index] == "--chunk-size") {
            if (index + 1 >= args.size()) {
                usage_error("--chunk-size requires a value");
            }
            chunk_size = parse_count("--chunk-size", args[++index]);
            continue;
        }
        if (file) {
            usage_error("upload takes exactly one file");
        }
        file = args[index];
    }
    if (!file) {
        usage_error("Usage: meshstore-sim upload <file> [--chunk-size <bytes>]");
    }

    const auto nodes = cluster.nodes();
    const auto report = cluster.distribute_file(nodes.front(), *file, chunk_size);
    print_upload_report(report);
    if (!report.complete()) {
        std::cerr << "Upload incomplete: " << report.failed.size() << " segment(s) not stored" << std::endl;
        return 1;
    }
    std::cout << "[OK] Distributed across " << nodes.size() << " node(s)" << std::endl;
    return 0;
}

void verify_download(const meshstore::core::Cluster& cluster,
                     const meshstore::core::NodeHandle& owner,
                     const std::string& file_id,
                     const std::filesystem::path& output) {
    const auto metadata = cluster.node(owner).storage().file_metadata(file_id);
    const auto digest = meshstore::crypto::digest_file(output);
    if (!metadata || !digest) {
        throw Error(ErrorCode::IoFailure, "cannot verify " + output.string());
    }
    if (meshstore::digest_to_string(*digest) != metadata->file_hash) {
        throw Error(ErrorCode::ReconstructionFailed, "hash mismatch for reassembled file " + file_id);
    }
}

int run_download(meshstore::core::Cluster& cluster, const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::optional<std::string> node_id;
    for (std::size_t index = 0; index < args.size(); ++index) {
        if (args[index] == "--node") {
            if (index + 1 >= args.size()) {
                usage_error("--node requires a value");
            }
            node_id = args[++index];
            continue;
        }
        positional.push_back(args[index]);
    }
    if (positional.size() != 2) {
        usage_error("Usage: meshstore-sim download <file_id> <output> [--node <id>]");
    }
    const auto& file_id = positional[0];
    const std::filesystem::path output = positional[1];

    std::optional<meshstore::core::NodeHandle> owner;
    if (node_id) {
        owner = cluster.find_node(*node_id);
        if (!owner) {
            throw Error(ErrorCode::NotFound, "Node not found: " + *node_id);
        }
    } else {
        owner = cluster.find_metadata_owner(file_id);
        if (!owner) {
            throw Error(ErrorCode::NotFound, "File metadata not found: " + file_id);
        }
    }

    cluster.reconstruct_file(*owner, file_id, output);
    verify_download(cluster, *owner, file_id, output);

    std::error_code ec;
    const auto size = std::filesystem::file_size(output, ec);
    std::cout << "[OK] " << file_id << " reassembled by " << owner->id() << " into " << output.string();
    if (!ec) {
        std::cout << " (" << format_bytes(size) << ")";
    }
    std::cout << std::endl;
    return 0;
}

int run_list(const meshstore::core::Cluster& cluster) {
    const auto files = cluster.list_files();
    if (files.empty()) {
        std::cout << "No files stored" << std::endl;
        return 0;
    }
    for (const auto& metadata : files) {
        std::cout << metadata.file_id << "  " << metadata.original_filename << "  "
                  << format_bytes(metadata.total_size_bytes) << "  " << metadata.chunks.size() << "/"
                  << metadata.total_chunks << " chunks placed" << std::endl;
    }
    return 0;
}

std::filesystem::path write_demo_file(const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw Error(ErrorCode::IoFailure, "cannot create " + directory.string());
    }

    const auto path = directory / "test_video.bin";
    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> byte(0, 255);
    std::vector<char> data(kDemoFileBytes);
    for (auto& value : data) {
        value = static_cast<char>(byte(rng));
    }

    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    stream.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!stream) {
        throw Error(ErrorCode::IoFailure, "cannot write " + path.string());
    }
    return path;
}

int run_demo(meshstore::core::Cluster& cluster) {
    const auto work_dir = std::filesystem::path(cluster.config().storage_root) / "demo_files";
    const auto input = write_demo_file(work_dir);

    std::cout << "== File upload and distribution ==" << std::endl;
    const auto report = cluster.distribute_file(cluster.nodes().front(), input, kDemoChunkBytes);
    print_upload_report(report);

    std::cout << "\n== Network health check ==" << std::endl;
    ping_ring(cluster);
    print_health(cluster);

    std::cout << "\n== File download ==" << std::endl;
    const auto output = work_dir / "test_video.reassembled.bin";
    const auto owner = cluster.find_metadata_owner(report.file_id);
    if (!owner) {
        throw Error(ErrorCode::NotFound, "File metadata not found: " + report.file_id);
    }
    cluster.reconstruct_file(*owner, report.file_id, output);
    verify_download(cluster, *owner, report.file_id, output);
    std::cout << "[OK] " << output.string() << " matches the original" << std::endl;

    std::cout << "\n== Topology ==" << std::endl;
    print_topology(cluster);
    std::cout << "\n== Statistics ==" << std::endl;
    print_statistics(cluster);
    return report.complete() ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::optional<std::string> command;
        std::vector<std::string> command_args;
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                usage_error(std::string(option) + " requires a value");
            }
            return args[index++];
        };

        while (index < args.size()) {
            const std::string opt = args[index++];
            if (command) {
                command_args.push_back(opt);
                continue;
            }
            if (opt == "--help" || opt == "-h" || opt == "help") {
                print_usage();
                return 0;
            }
            if (opt == "--config") {
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--nodes") {
                options.node_count = parse_count(opt, require_value(opt));
                continue;
            }
            if (opt == "--storage-root") {
                options.storage_root = require_value(opt);
                continue;
            }
            if (opt == "--quiet") {
                options.quiet = true;
                continue;
            }
            if (opt.starts_with("-")) {
                usage_error("Unknown option: " + opt);
            }
            command = opt;
        }

        if (!command) {
            print_usage();
            return 1;
        }

        const auto config = build_config(options);
        meshstore::core::Cluster cluster(config, build_logger(options, config));
        cluster.initialize_nodes();

        if (*command == "demo") {
            return run_demo(cluster);
        }
        if (*command == "upload") {
            return run_upload(cluster, command_args);
        }
        if (*command == "download") {
            return run_download(cluster, command_args);
        }
        if (*command == "list") {
            return run_list(cluster);
        }
        if (*command == "nodes") {
            print_nodes(cluster);
            return 0;
        }
        if (*command == "storage") {
            print_storage(cluster);
            return 0;
        }
        if (*command == "health") {
            print_health(cluster);
            return 0;
        }
        if (*command == "topology") {
            print_topology(cluster);
            return 0;
        }
        if (*command == "stats") {
            ping_ring(cluster);
            print_statistics(cluster);
            return 0;
        }

        usage_error("Unknown command: " + *command + " (run 'meshstore-sim --help')");
    } catch (const Error& ex) {
        std::cerr << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "[E_UNEXPECTED] " << ex.what() << std::endl;
        return 1;
    }
}
