#include "meshstore/Error.hpp"
#include "meshstore/core/Node.hpp"

#include "test_support.hpp"

#include <cassert>
#include <string>

using meshstore::Error;
using meshstore::ErrorCode;
using meshstore::core::Node;
using meshstore::core::ProcessState;

int main() {
    const ProcessState all[] = {ProcessState::Ready, ProcessState::Waiting, ProcessState::Running, ProcessState::Stopped};
    for (const auto from : all) {
        for (const auto to : all) {
            assert(meshstore::core::transition_allowed(from, to));
        }
        const auto name = meshstore::core::process_state_to_string(from);
        assert(meshstore::core::process_state_from_string(name) == from);
    }
    assert(!meshstore::core::process_state_from_string("ready").has_value());
    assert(!meshstore::core::process_state_from_string("PAUSED").has_value());

    meshstore::test::TempDirectory scratch("node_state");
    const auto config = meshstore::test::quiet_config(scratch.path());

    Node node("Node_01", config);
    assert(node.state() == ProcessState::Ready);
    assert(node.running());
    assert(node.is_alive());
    assert(node.storage().root() == scratch.path() / "Node_01");

    node.set_state("WAITING");
    assert(node.state() == ProcessState::Waiting);
    assert(node.is_alive());

    node.set_state(ProcessState::Stopped);
    assert(!node.is_alive());
    node.set_state(ProcessState::Stopped);
    node.set_state("RUNNING");
    assert(node.is_alive());

    bool rejected = false;
    try {
        node.set_state("SLEEPING");
    } catch (const Error& ex) {
        rejected = ex.code == ErrorCode::InvalidArgument;
        assert(std::string(ex.what()) == "[E_INVALID_ARGUMENT] Invalid state: SLEEPING");
    }
    assert(rejected);
    assert(node.state() == ProcessState::Running);

    node.stop();
    assert(!node.running());
    assert(!node.is_alive());
    node.start();
    assert(node.is_alive());

    node.add_peer("Node_02", "192.168.1.3");
    node.add_peer("Node_03", "192.168.1.4");
    node.add_peer("Node_02", "192.168.1.9");
    assert(node.peers().size() == 2);
    assert(node.peers().at("Node_02") == "192.168.1.9");
    assert(node.remove_peer("Node_03"));
    assert(!node.remove_peer("Node_03"));

    const auto info = node.info();
    assert(info.node_id == "Node_01");
    assert(info.alive);
    assert(info.state == ProcessState::Running);
    assert(info.capacity_bytes == config.capacity_bytes);
    assert(info.used_bytes == 0);
    assert(info.peers.size() == 1);

    return 0;
}
