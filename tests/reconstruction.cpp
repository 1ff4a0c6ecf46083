#include "meshstore/Error.hpp"
#include "meshstore/crypto/Sha256.hpp"
#include "meshstore/storage/StorageEngine.hpp"

#include "test_support.hpp"

#include <cassert>
#include <string>
#include <vector>

using meshstore::Error;
using meshstore::ErrorCode;
using meshstore::storage::FetchResult;
using meshstore::storage::SegmentProvider;
using meshstore::storage::StorageEngine;

namespace {

// Serves segments straight out of another engine and counts the calls.
class PeerProvider : public SegmentProvider {
public:
    explicit PeerProvider(StorageEngine& peer) : peer_(peer) {}

    FetchResult fetch_segment(const std::string& segment_id) override {
        requested.push_back(segment_id);
        if (auto segment = peer_.retrieve_segment(segment_id)) {
            return FetchResult::found(std::move(*segment));
        }
        return FetchResult::not_found("peer has no " + segment_id);
    }

    std::vector<std::string> requested;

private:
    StorageEngine& peer_;
};

class OfflineProvider : public SegmentProvider {
public:
    FetchResult fetch_segment(const std::string&) override {
        return FetchResult::unavailable("link down");
    }
};

class TamperingProvider : public SegmentProvider {
public:
    explicit TamperingProvider(StorageEngine& peer) : peer_(peer) {}

    FetchResult fetch_segment(const std::string& segment_id) override {
        auto segment = peer_.retrieve_segment(segment_id);
        if (!segment) {
            return FetchResult::not_found();
        }
        segment->data.front() ^= 0xFF;
        return FetchResult::found(std::move(*segment));
    }

private:
    StorageEngine& peer_;
};

bool fails_with(StorageEngine& engine,
                const std::string& file_id,
                const std::filesystem::path& output,
                SegmentProvider* provider,
                ErrorCode code,
                const std::string& fragment) {
    try {
        engine.reconstruct_file(file_id, output, provider);
    } catch (const Error& ex) {
        return ex.code == code && std::string(ex.what()).find(fragment) != std::string::npos;
    }
    return false;
}

}  // namespace

int main() {
    meshstore::test::TempDirectory scratch("reconstruction");
    StorageEngine node_a("Node_A", 16 * 1024 * 1024, scratch / "Node_A");
    StorageEngine node_b("Node_B", 16 * 1024 * 1024, scratch / "Node_B");

    const auto data = meshstore::test::make_pattern(256 * 1024, 99);
    const auto input = scratch / "upload.bin";
    meshstore::test::write_file(input, data);

    const auto chunked = node_a.chunk_file(input, 64 * 1024);
    assert(chunked.segments.size() == 4);

    // Round-robin: even chunks on A, odd chunks on B.
    for (const auto& segment : chunked.segments) {
        auto& target = segment.chunk_number % 2 == 0 ? node_a : node_b;
        target.store_segment(segment);
        if (&target == &node_b) {
            assert(node_a.record_chunk_location(chunked.file_id, segment.chunk_number, "Node_B"));
        }
    }

    const auto metadata = node_a.file_metadata(chunked.file_id);
    assert(metadata->complete());
    assert(metadata->chunks.at(0) == "Node_A");
    assert(metadata->chunks.at(1) == "Node_B");

    PeerProvider provider(node_b);
    const auto output = scratch / "out" / "download.bin";
    node_a.reconstruct_file(chunked.file_id, output, &provider);

    const auto restored = meshstore::test::read_file(output);
    assert(restored == data);
    assert(meshstore::crypto::Sha256::hex_digest(restored) == metadata->file_hash);
    const std::vector<std::string> expected_requests{chunked.file_id + "_chunk_1", chunked.file_id + "_chunk_3"};
    assert(provider.requested == expected_requests);

    // Without a provider the odd chunks cannot be found.
    assert(fails_with(node_a, chunked.file_id, scratch / "x.bin", nullptr, ErrorCode::ReconstructionFailed, "_chunk_1"));

    OfflineProvider offline;
    assert(fails_with(node_a, chunked.file_id, scratch / "x.bin", &offline, ErrorCode::ReconstructionFailed, "unavailable"));

    StorageEngine empty_peer("Node_C", 1024, scratch / "Node_C");
    PeerProvider nobody(empty_peer);
    assert(fails_with(node_a, chunked.file_id, scratch / "x.bin", &nobody, ErrorCode::ReconstructionFailed, "not_found"));

    TamperingProvider tampering(node_b);
    assert(fails_with(node_a, chunked.file_id, scratch / "x.bin", &tampering, ErrorCode::ReconstructionFailed, "checksum"));

    assert(fails_with(node_a, "0123456789abcdef", scratch / "x.bin", &provider, ErrorCode::NotFound, "0123456789abcdef"));

    // Metadata handed to another node lets it act as the owner.
    node_b.adopt_metadata(*node_a.file_metadata(chunked.file_id));
    PeerProvider from_a(node_a);
    node_b.reconstruct_file(chunked.file_id, scratch / "via_b.bin", &from_a);
    assert(meshstore::test::read_file(scratch / "via_b.bin") == data);

    return 0;
}
