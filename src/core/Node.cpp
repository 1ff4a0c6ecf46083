#include "meshstore/core/Node.hpp"

#include "meshstore/Error.hpp"

#include <filesystem>
#include <utility>

namespace meshstore::core {

namespace {

using Level = log::StructuredLogger::Level;

constexpr std::size_t index_of(ProcessState state) noexcept {
    return static_cast<std::size_t>(state);
}

// Rows are the current state, columns the requested one.
constexpr std::array<std::array<bool, kProcessStateCount>, kProcessStateCount> kTransitions = {{
    {{true, true, true, true}},
    {{true, true, true, true}},
    {{true, true, true, true}},
    {{true, true, true, true}},
}};

}  // namespace

const char* process_state_to_string(ProcessState state) noexcept {
    switch (state) {
        case ProcessState::Ready:
            return "READY";
        case ProcessState::Waiting:
            return "WAITING";
        case ProcessState::Running:
            return "RUNNING";
        case ProcessState::Stopped:
            return "STOPPED";
    }
    return "UNKNOWN";
}

std::optional<ProcessState> process_state_from_string(std::string_view text) {
    if (text == "READY") {
        return ProcessState::Ready;
    }
    if (text == "WAITING") {
        return ProcessState::Waiting;
    }
    if (text == "RUNNING") {
        return ProcessState::Running;
    }
    if (text == "STOPPED") {
        return ProcessState::Stopped;
    }
    return std::nullopt;
}

bool transition_allowed(ProcessState from, ProcessState to) noexcept {
    const auto row = index_of(from);
    const auto column = index_of(to);
    if (row >= kProcessStateCount || column >= kProcessStateCount) {
        return false;
    }
    return kTransitions[row][column];
}

Node::Node(NodeId id, const Config& config, log::LoggerPtr logger)
    : id_(std::move(id)),
      logger_(std::move(logger)),
      interface_(id_, config.bandwidth_mbps),
      storage_(id_, config.capacity_bytes, std::filesystem::path(config.storage_root) / id_, logger_),
      created_at_(std::chrono::steady_clock::now()) {
    log::log_event(logger_,
                   Level::Info,
                   "node.initialized",
                   {{"node", id_}, {"capacity_bytes", std::to_string(config.capacity_bytes)}});
}

void Node::set_state(ProcessState state) {
    ProcessState previous{};
    {
        std::scoped_lock lock(mutex_);
        previous = state_;
        if (!transition_allowed(previous, state)) {
            throw Error(ErrorCode::InvalidArgument,
                        std::string("transition ") + process_state_to_string(previous) + " -> " +
                            process_state_to_string(state) + " refused for " + id_);
        }
        state_ = state;
    }
    log::log_event(logger_,
                   Level::Info,
                   "node.state.changed",
                   {{"node", id_},
                    {"from", process_state_to_string(previous)},
                    {"to", process_state_to_string(state)}});
}

void Node::set_state(std::string_view name) {
    const auto state = process_state_from_string(name);
    if (!state) {
        throw Error(ErrorCode::InvalidArgument, "Invalid state: " + std::string(name));
    }
    set_state(*state);
}

ProcessState Node::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

void Node::start() {
    {
        std::scoped_lock lock(mutex_);
        running_ = true;
    }
    log::log_event(logger_, Level::Info, "node.started", {{"node", id_}});
}

void Node::stop() {
    {
        std::scoped_lock lock(mutex_);
        running_ = false;
    }
    log::log_event(logger_, Level::Info, "node.stopped", {{"node", id_}});
}

bool Node::running() const {
    std::scoped_lock lock(mutex_);
    return running_;
}

bool Node::is_alive() const {
    std::scoped_lock lock(mutex_);
    return running_ && state_ != ProcessState::Stopped;
}

void Node::add_peer(const NodeId& peer_id, const std::string& address) {
    {
        std::scoped_lock lock(mutex_);
        peers_[peer_id] = address;
    }
    log::log_event(logger_, Level::Info, "node.peer.added", {{"node", id_}, {"peer", peer_id}, {"address", address}});
}

bool Node::remove_peer(const NodeId& peer_id) {
    std::scoped_lock lock(mutex_);
    return peers_.erase(peer_id) > 0;
}

std::map<NodeId, std::string> Node::peers() const {
    std::scoped_lock lock(mutex_);
    return peers_;
}

NodeInfo Node::info() const {
    const auto storage_info = storage_.storage_info();

    NodeInfo info{};
    info.node_id = id_;
    info.address = interface_.address();
    info.capacity_bytes = storage_info.capacity_bytes;
    info.used_bytes = storage_info.used_bytes;
    info.available_bytes = storage_info.available_bytes;
    info.files_tracked = storage_info.files_tracked;
    info.segments_stored = storage_info.segments_stored;
    info.uptime = std::chrono::steady_clock::now() - created_at_;

    std::scoped_lock lock(mutex_);
    info.alive = running_ && state_ != ProcessState::Stopped;
    info.state = state_;
    info.peers = peers_;
    return info;
}

}  // namespace meshstore::core
