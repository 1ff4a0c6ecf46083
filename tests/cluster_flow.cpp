#include "meshstore/Error.hpp"
#include "meshstore/core/Cluster.hpp"
#include "meshstore/crypto/Sha256.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <string>

using meshstore::Error;
using meshstore::ErrorCode;
using meshstore::core::Cluster;
using meshstore::core::NodeHandle;
using meshstore::core::ProcessState;

int main() {
    meshstore::test::TempDirectory scratch("cluster_flow");
    auto config = meshstore::test::quiet_config(scratch / "nodes");
    config.node_count = 3;

    const auto data = meshstore::test::make_pattern(300'000, 77);
    const auto input = scratch / "dataset.csv";
    meshstore::test::write_file(input, data);
    const auto file_hash = meshstore::crypto::Sha256::hex_digest(data);

    std::string file_id;
    {
        Cluster cluster(config);
        const auto handles = cluster.initialize_nodes();
        assert(cluster.size() == 3);
        assert(cluster.find_node("Node_02") == handles[1]);
        assert(!cluster.find_node("Node_09").has_value());

        bool duplicate = false;
        try {
            cluster.add_node("Node_01");
        } catch (const Error& ex) {
            duplicate = ex.code == ErrorCode::InvalidArgument;
        }
        assert(duplicate);

        bool stranger = false;
        try {
            cluster.node(NodeHandle{});
        } catch (const Error& ex) {
            stranger = ex.code == ErrorCode::NotFound;
        }
        assert(stranger);

        const auto report = cluster.distribute_file(handles[0], input, 64 * 1024);
        file_id = report.file_id;
        assert(report.complete());
        assert(report.total_chunks == 5);
        assert(report.total_size_bytes == data.size());
        assert(report.original_filename == "dataset.csv");
        assert(report.placements.size() == 5);
        assert(report.placements[0].node_id == "Node_01");
        assert(report.placements[1].node_id == "Node_02");
        assert(report.placements[2].node_id == "Node_03");
        assert(report.placements[3].node_id == "Node_01");
        assert(report.placements[4].node_id == "Node_02");
        assert(report.packets_dropped == 0);

        // Chunks 1, 2 and 4 travelled over the network.
        assert(cluster.network().wait_for_deliveries(std::chrono::seconds(2)));
        const auto stats = cluster.network().statistics();
        assert(stats.total_packets_sent == 3);
        assert(stats.total_packets_received == 3);
        assert(stats.dropped_packets == 0);

        assert(cluster.node(handles[1]).storage().has_segment(file_id + "_chunk_4"));
        assert(cluster.node(handles[2]).storage().used_bytes() == 64 * 1024);

        const auto owner = cluster.find_metadata_owner(file_id);
        assert(owner == handles[0]);
        const auto metadata = cluster.node(*owner).storage().file_metadata(file_id);
        assert(metadata->complete());
        assert(metadata->file_hash == file_hash);

        const auto files = cluster.list_files();
        assert(files.size() == 1);
        assert(files.front().file_id == file_id);
        assert(files.front().chunks.size() == 5);

        const auto output = scratch / "download" / "dataset.csv";
        cluster.reconstruct_file(handles[0], file_id, output);
        assert(meshstore::test::read_file(output) == data);

        // A stopped holder makes its chunks unavailable rather than missing.
        cluster.node(handles[1]).set_state(ProcessState::Stopped);
        bool unavailable = false;
        try {
            cluster.reconstruct_file(handles[0], file_id, scratch / "download" / "again.csv");
        } catch (const Error& ex) {
            unavailable = ex.code == ErrorCode::ReconstructionFailed &&
                          std::string(ex.what()).find("unavailable") != std::string::npos;
        }
        assert(unavailable);

        // Uploads to an offline target are reported, not silently skipped.
        const auto second_input = scratch / "second.bin";
        meshstore::test::write_file(second_input, meshstore::test::make_pattern(200'000, 78));
        const auto partial = cluster.distribute_file(handles[0], second_input, 64 * 1024);
        assert(!partial.complete());
        assert(partial.total_chunks == 4);
        assert(partial.placements.size() == 3);
        assert(partial.failed.size() == 1);
        assert(partial.failed.front().node_id == "Node_02");
        assert(partial.failed.front().reason == "node offline");
        cluster.node(handles[1]).set_state(ProcessState::Running);

        bool unknown = false;
        try {
            cluster.reconstruct_file(handles[2], file_id, scratch / "download" / "nope.csv");
        } catch (const Error& ex) {
            unknown = ex.code == ErrorCode::NotFound;
        }
        assert(unknown);

        cluster.shutdown();
        assert(cluster.network().node_count() == 0);
    }

    // A fresh cluster over the same storage root picks up where the last one stopped.
    {
        Cluster cluster(config);
        const auto handles = cluster.initialize_nodes();
        const auto owner = cluster.find_metadata_owner(file_id);
        assert(owner.has_value());
        assert(owner->id() == "Node_01");

        const auto output = scratch / "after_restart.csv";
        cluster.reconstruct_file(*owner, file_id, output);
        const auto restored = meshstore::test::read_file(output);
        assert(restored == data);
        assert(meshstore::crypto::Sha256::hex_digest(restored) == file_hash);
        assert(cluster.node(handles[1]).storage().used_bytes() == 64 * 1024 + (300'000 - 4 * 64 * 1024));
    }

    return 0;
}
