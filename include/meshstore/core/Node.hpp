#pragma once

#include "meshstore/Config.hpp"
#include "meshstore/Types.hpp"
#include "meshstore/log/StructuredLogger.hpp"
#include "meshstore/network/Interface.hpp"
#include "meshstore/storage/StorageEngine.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace meshstore::core {

enum class ProcessState : std::uint8_t {
    Ready,
    Waiting,
    Running,
    Stopped,
};

inline constexpr std::size_t kProcessStateCount = 4;

const char* process_state_to_string(ProcessState state) noexcept;
std::optional<ProcessState> process_state_from_string(std::string_view text);

// Every state may move to every state, itself included.
bool transition_allowed(ProcessState from, ProcessState to) noexcept;

struct NodeInfo {
    NodeId node_id;
    std::string address;
    bool alive{false};
    ProcessState state{ProcessState::Ready};
    std::uint64_t capacity_bytes{0};
    std::uint64_t used_bytes{0};
    std::uint64_t available_bytes{0};
    std::size_t files_tracked{0};
    std::size_t segments_stored{0};
    std::map<NodeId, std::string> peers;
    std::chrono::duration<double> uptime{0.0};
};

class Node {
public:
    Node(NodeId id, const Config& config, log::LoggerPtr logger = nullptr);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const NodeId& id() const noexcept { return id_; }

    network::Interface& network_interface() noexcept { return interface_; }
    const network::Interface& network_interface() const noexcept { return interface_; }
    storage::StorageEngine& storage() noexcept { return storage_; }
    const storage::StorageEngine& storage() const noexcept { return storage_; }

    // Throws Error{InvalidArgument} for a transition the table refuses.
    void set_state(ProcessState state);
    // Throws Error{InvalidArgument} for names outside READY/WAITING/RUNNING/STOPPED.
    void set_state(std::string_view name);
    ProcessState state() const;

    void start();
    void stop();
    bool running() const;
    bool is_alive() const;

    void add_peer(const NodeId& peer_id, const std::string& address);
    bool remove_peer(const NodeId& peer_id);
    std::map<NodeId, std::string> peers() const;

    NodeInfo info() const;

private:
    NodeId id_;
    log::LoggerPtr logger_;
    network::Interface interface_;
    storage::StorageEngine storage_;
    ProcessState state_{ProcessState::Ready};
    bool running_{true};
    std::map<NodeId, std::string> peers_;
    std::chrono::steady_clock::time_point created_at_;
    mutable std::mutex mutex_;
};

}  // namespace meshstore::core
