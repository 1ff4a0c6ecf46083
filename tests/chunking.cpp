#include "meshstore/Error.hpp"
#include "meshstore/crypto/Sha256.hpp"
#include "meshstore/storage/StorageEngine.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <span>
#include <string>

using meshstore::Error;
using meshstore::ErrorCode;
using meshstore::crypto::Sha256;
using meshstore::storage::StorageEngine;

int main() {
    meshstore::test::TempDirectory scratch("chunking");
    StorageEngine engine("Node_01", 64ull * 1024 * 1024, scratch / "Node_01");

    const auto data = meshstore::test::make_pattern(256 * 1024, 3);
    const auto input = scratch / "movie.bin";
    meshstore::test::write_file(input, data);

    const auto chunked = engine.chunk_file(input, 64 * 1024);
    const auto file_hash = Sha256::hex_digest(data);
    assert(chunked.file_id == file_hash.substr(0, 16));
    assert(chunked.segments.size() == 4);

    for (std::size_t i = 0; i < chunked.segments.size(); ++i) {
        const auto& segment = chunked.segments[i];
        const std::span<const std::uint8_t> expected(data.data() + i * 64 * 1024, 64 * 1024);
        assert(segment.id == chunked.file_id + "_chunk_" + std::to_string(i));
        assert(segment.chunk_number == i);
        assert(segment.file_hash == file_hash);
        assert(segment.size == 64 * 1024);
        assert(std::equal(segment.data.begin(), segment.data.end(), expected.begin(), expected.end()));
        assert(segment.checksum == Sha256::hex_digest(expected));
        assert(segment.verify());
    }

    const auto metadata = engine.file_metadata(chunked.file_id);
    assert(metadata.has_value());
    assert(metadata->original_filename == "movie.bin");
    assert(metadata->file_hash == file_hash);
    assert(metadata->total_size_bytes == data.size());
    assert(metadata->chunk_size_bytes == 64 * 1024);
    assert(metadata->total_chunks == 4);
    assert(metadata->chunks.empty());
    assert(metadata->missing_chunks().size() == 4);
    assert(engine.file_id_for_hash(file_hash) == chunked.file_id);

    // Chunking does not populate the engine's own storage.
    assert(engine.used_bytes() == 0);
    assert(!engine.has_segment(chunked.segments.front().id));

    // A short tail chunk keeps its real length.
    const auto odd = meshstore::test::make_pattern(100'000, 4);
    const auto odd_path = scratch / "odd.bin";
    meshstore::test::write_file(odd_path, odd);
    const auto odd_chunked = engine.chunk_file(odd_path);
    assert(odd_chunked.segments.size() == 2);
    assert(odd_chunked.segments[1].size == 100'000 - 64 * 1024);

    const auto empty_path = scratch / "empty.bin";
    meshstore::test::write_file(empty_path, {});
    const auto empty_chunked = engine.chunk_file(empty_path);
    assert(empty_chunked.segments.empty());
    assert(engine.file_metadata(empty_chunked.file_id)->total_chunks == 0);

    bool missing = false;
    try {
        engine.chunk_file(scratch / "nope.bin");
    } catch (const Error& ex) {
        missing = ex.code == ErrorCode::NotFound;
    }
    assert(missing);

    bool zero = false;
    try {
        engine.chunk_file(input, 0);
    } catch (const Error& ex) {
        zero = ex.code == ErrorCode::InvalidArgument;
    }
    assert(zero);

    assert(engine.list_files().size() == 3);
    return 0;
}
