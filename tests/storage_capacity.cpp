#include "meshstore/Error.hpp"
#include "meshstore/storage/StorageEngine.hpp"

#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using meshstore::Error;
using meshstore::ErrorCode;
using meshstore::storage::StorageEngine;
using meshstore::storage::make_segment;

int main() {
    meshstore::test::TempDirectory scratch("storage_capacity");

    {
        StorageEngine engine("Node_01", 1000, scratch / "Node_01");
        engine.store_segment(make_segment("f0", "", 0, meshstore::ByteBuffer(600, 1)));
        assert(engine.used_bytes() == 600);

        bool rejected = false;
        try {
            engine.store_segment(make_segment("f0", "", 1, meshstore::ByteBuffer(401, 2)));
        } catch (const Error& ex) {
            rejected = ex.code == ErrorCode::CapacityExceeded;
        }
        assert(rejected);
        assert(engine.used_bytes() == 600);
        assert(!engine.has_segment("f0_chunk_1"));

        // Exactly filling the node is allowed.
        engine.store_segment(make_segment("f0", "", 1, meshstore::ByteBuffer(400, 2)));
        assert(engine.used_bytes() == 1000);

        // A full node refuses a rewrite of an id it already holds.
        bool rewrite_rejected = false;
        try {
            engine.store_segment(make_segment("f0", "", 0, meshstore::ByteBuffer(400, 3)));
        } catch (const Error& ex) {
            rewrite_rejected = ex.code == ErrorCode::CapacityExceeded;
        }
        assert(rewrite_rejected);
        assert(engine.used_bytes() == 1000);
        assert(engine.retrieve_segment("f0_chunk_0")->data == meshstore::ByteBuffer(600, 1));
        const auto info = engine.storage_info();
        assert(info.available_bytes == 0);
        assert(info.utilization_percent > 99.9);
        assert(info.segments_stored == 2);

        bool unsafe = false;
        try {
            engine.store_segment(make_segment("../escape", "", 0, meshstore::ByteBuffer(1, 1)));
        } catch (const Error& ex) {
            unsafe = ex.code == ErrorCode::InvalidArgument;
        }
        assert(unsafe);
    }

    // A rewrite that fits is committed at its new size.
    {
        StorageEngine engine("Node_03", 1000, scratch / "Node_03");
        engine.store_segment(make_segment("f1", "", 0, meshstore::ByteBuffer(300, 1)));
        engine.store_segment(make_segment("f1", "", 0, meshstore::ByteBuffer(500, 2)));
        assert(engine.used_bytes() == 500);
        assert(std::filesystem::file_size(scratch / "Node_03" / "f1_chunk_0.bin") == 500);
    }

    // Concurrent rewrites of one id leave the file on disk equal to the cached copy.
    for (int round = 0; round < 20; ++round) {
        const auto root = scratch / ("rewrite_" + std::to_string(round));
        {
            StorageEngine engine("Node_04", 1 << 20, root);
            std::thread first([&] { engine.store_segment(make_segment("same", "", 0, meshstore::ByteBuffer(4096, 0xAA))); });
            std::thread second([&] { engine.store_segment(make_segment("same", "", 0, meshstore::ByteBuffer(2048, 0x55))); });
            first.join();
            second.join();

            const auto cached = engine.retrieve_segment("same_chunk_0");
            assert(meshstore::test::read_file(root / "same_chunk_0.bin") == cached->data);
            assert(engine.used_bytes() == cached->data.size());
        }
        std::size_t entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(root)) {
            (void)entry;
            ++entries;
        }
        // One segment file and metadata.json; no staging files left behind.
        assert(entries == 2);
    }

    // Two stores that each fit but not together: the reservation lets only one through.
    for (int round = 0; round < 20; ++round) {
        const auto root = scratch / ("race_" + std::to_string(round));
        StorageEngine engine("Node_02", 1000, root);
        std::atomic<int> stored{0};
        std::atomic<int> rejected{0};

        auto attempt = [&](std::size_t chunk) {
            try {
                engine.store_segment(make_segment("race", "", chunk, meshstore::ByteBuffer(600, 9)));
                ++stored;
            } catch (const Error& ex) {
                if (ex.code == ErrorCode::CapacityExceeded) {
                    ++rejected;
                }
            }
        };

        std::thread first(attempt, 0);
        std::thread second(attempt, 1);
        first.join();
        second.join();

        assert(stored == 1);
        assert(rejected == 1);
        assert(engine.used_bytes() == 600);
    }

    return 0;
}
