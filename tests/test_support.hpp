#pragma once

#include "meshstore/Config.hpp"
#include "meshstore/Types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>

namespace meshstore::test {

// Unique scratch directory under the system temp path, removed on scope exit.
class TempDirectory {
public:
    explicit TempDirectory(const std::string& label) {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("meshstore_" + label + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }
    std::filesystem::path operator/(const std::string& child) const { return path_ / child; }

private:
    std::filesystem::path path_;
};

inline ByteBuffer make_pattern(std::size_t size, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> byte(0, 255);
    ByteBuffer data(size);
    for (auto& value : data) {
        value = static_cast<std::uint8_t>(byte(rng));
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, const ByteBuffer& data) {
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline ByteBuffer read_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    return ByteBuffer((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
}

// Lossless, fast and deterministic network settings rooted in a scratch dir.
inline Config quiet_config(const std::filesystem::path& storage_root) {
    Config config{};
    config.storage_root = storage_root.string();
    config.packet_loss_rate = 0.0;
    config.random_seed = 7;
    config.logging_enabled = false;
    return config;
}

}  // namespace meshstore::test
