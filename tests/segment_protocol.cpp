#include "meshstore/core/Node.hpp"
#include "meshstore/crypto/Sha256.hpp"
#include "meshstore/protocol/SegmentProtocol.hpp"
#include "meshstore/util/Base64.hpp"

#include "test_support.hpp"

#include <cassert>
#include <optional>
#include <stdexcept>
#include <string>

using meshstore::core::Node;
using meshstore::protocol::RequestBuilder;
using meshstore::protocol::Response;
using meshstore::protocol::RpcSegmentProvider;
using meshstore::protocol::SegmentService;
using meshstore::storage::FetchStatus;
using meshstore::storage::make_segment;
using meshstore::util::JsonValue;

namespace protocol = meshstore::protocol;

namespace {

int error_code(const std::string& reply) {
    const auto response = protocol::decode_response(reply);
    assert(response.has_value());
    assert(response->error.has_value());
    return response->error->code;
}

}  // namespace

int main() {
    meshstore::test::TempDirectory scratch("segment_protocol");
    auto config = meshstore::test::quiet_config(scratch.path());
    config.capacity_bytes = 4096;
    Node node("Node_01", config);
    SegmentService service(node);
    RequestBuilder builder;

    // Ids are assigned in order starting at 1.
    const auto health = builder.health_check();
    assert(health.id == 1);
    assert(health.method == "health_check");
    assert(builder.get_storage_info().id == 2);
    assert(builder.last_id() == 2);

    const auto health_response = service.handle(health);
    assert(health_response.ok());
    assert(health_response.id == 1u);
    assert(health_response.result->find("status")->string_value == "healthy");
    assert(health_response.result->find("node_id")->string_value == "Node_01");
    assert(health_response.result->find("process_state")->string_value == "READY");
    assert(*health_response.result->find("storage_capacity_bytes")->as_uint64() == 4096);

    // Store then retrieve through the wire format.
    const auto segment = make_segment("feedfacecafebeef", "abc", 0, meshstore::test::make_pattern(1000, 5));
    const auto stored = protocol::decode_response(service.handle_raw(protocol::encode_request(builder.store_segment(segment))));
    assert(stored && stored->ok());
    assert(stored->id == 3u);
    assert(stored->result->find("status")->string_value == "stored");
    assert(node.storage().used_bytes() == 1000);

    const auto retrieved = service.handle(builder.retrieve_segment(segment.id));
    assert(retrieved.ok());
    const auto round = protocol::segment_from_json(*retrieved.result);
    assert(round.id == segment.id);
    assert(round.data == segment.data);
    assert(round.checksum == segment.checksum);
    assert(retrieved.result->find("size_bytes")->as_uint64() == 1000u);

    const auto info = service.handle(builder.get_storage_info());
    assert(*info.result->find("used_bytes")->as_uint64() == 1000);
    assert(*info.result->find("available_bytes")->as_uint64() == 3096);
    assert(*info.result->find("segments_stored")->as_uint64() == 1);

    // Error mapping.
    assert(error_code(service.handle_raw("{ nope")) == protocol::kParseError);
    assert(error_code(service.handle_raw(R"({"jsonrpc":"1.0","id":1,"method":"health_check"})")) == protocol::kInvalidRequest);
    assert(error_code(service.handle_raw(R"({"jsonrpc":"2.0","method":"health_check"})")) == protocol::kInvalidRequest);
    assert(error_code(service.handle_raw(R"({"jsonrpc":"2.0","id":9,"method":"health_check","params":[1]})")) ==
           protocol::kInvalidParams);
    assert(error_code(service.handle_raw(R"({"jsonrpc":"2.0","id":9,"method":"format_disk"})")) ==
           protocol::kMethodNotFound);
    assert(error_code(service.handle_raw(R"({"jsonrpc":"2.0","id":9,"method":"retrieve_segment","params":{}})")) ==
           protocol::kInvalidParams);

    // Deep nesting is a parse error, not a crash.
    const std::string deep = R"({"jsonrpc":"2.0","id":4,"method":"health_check","params":{"x":)" +
                             std::string(1'000'000, '[') + "}}";
    assert(error_code(service.handle_raw(deep)) == protocol::kParseError);
    const std::string nested_ok = R"({"jsonrpc":"2.0","id":4,"method":"health_check","params":{"x":)" +
                                  std::string(40, '[') + std::string(40, ']') + "}}";
    assert(protocol::decode_response(service.handle_raw(nested_ok))->ok());

    const auto missing = service.handle(builder.retrieve_segment("feedfacecafebeef_chunk_7"));
    assert(!missing.ok());
    assert(missing.error->code == protocol::kSegmentNotFound);
    assert(missing.id == builder.last_id());

    auto tampered = builder.store_segment(segment);
    tampered.params.set("checksum", JsonValue::string(std::string(64, '0')));
    assert(service.handle(tampered).error->code == protocol::kInvalidParams);

    auto bad_base64 = builder.store_segment(segment);
    bad_base64.params.set("data_b64", JsonValue::string("***"));
    assert(service.handle(bad_base64).error->code == protocol::kInvalidParams);

    const auto too_big = make_segment("feedfacecafebeef", "abc", 1, meshstore::test::make_pattern(3500, 6));
    assert(service.handle(builder.store_segment(too_big)).error->code == protocol::kCapacityExceeded);
    assert(node.storage().used_bytes() == 1000);

    const auto unsafe = make_segment("../evil", "", 0, meshstore::ByteBuffer(4, 1));
    assert(service.handle(builder.store_segment(unsafe)).error->code == protocol::kInvalidParams);

    // The provider maps replies to Found, NotFound and Unavailable.
    RpcSegmentProvider provider([&](const std::string& text) -> std::optional<std::string> {
        return service.handle_raw(text);
    });
    const auto found = provider.fetch_segment(segment.id);
    assert(found.status == FetchStatus::Found);
    assert(found.segment->data == segment.data);
    assert(found.segment->verify());
    assert(provider.fetch_segment("feedfacecafebeef_chunk_9").status == FetchStatus::NotFound);

    node.stop();
    const auto offline = service.handle(builder.retrieve_segment(segment.id));
    assert(offline.error->code == protocol::kInternalError);
    assert(provider.fetch_segment(segment.id).status == FetchStatus::Unavailable);
    assert(service.handle(builder.health_check()).result->find("status")->string_value == "unhealthy");
    node.start();

    RpcSegmentProvider silent([](const std::string&) -> std::optional<std::string> { return std::nullopt; });
    assert(silent.fetch_segment(segment.id).status == FetchStatus::Unavailable);

    RpcSegmentProvider garbled([](const std::string&) -> std::optional<std::string> { return std::string("<html>"); });
    assert(garbled.fetch_segment(segment.id).status == FetchStatus::Unavailable);

    RpcSegmentProvider stale([](const std::string&) -> std::optional<std::string> {
        return protocol::encode_response(Response::success(999, JsonValue::object()));
    });
    assert(stale.fetch_segment(segment.id).status == FetchStatus::Unavailable);

    RpcSegmentProvider throwing([](const std::string&) -> std::optional<std::string> {
        throw std::runtime_error("socket closed");
    });
    const auto thrown = throwing.fetch_segment(segment.id);
    assert(thrown.status == FetchStatus::Unavailable);
    assert(thrown.detail.find("socket closed") != std::string::npos);

    assert(RpcSegmentProvider(nullptr).fetch_segment(segment.id).status == FetchStatus::Unavailable);

    return 0;
}
