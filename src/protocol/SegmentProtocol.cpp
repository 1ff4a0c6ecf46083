#include "meshstore/protocol/SegmentProtocol.hpp"

#include "meshstore/Error.hpp"
#include "meshstore/core/Node.hpp"
#include "meshstore/crypto/Sha256.hpp"
#include "meshstore/util/Base64.hpp"

#include <stdexcept>
#include <utility>

namespace meshstore::protocol {

namespace {

using util::JsonValue;
using Level = log::StructuredLogger::Level;

const JsonValue& require_member(const JsonValue& object, std::string_view key, std::optional<std::uint64_t> id) {
    const auto* member = object.find(key);
    if (!member) {
        throw ProtocolError(kInvalidParams, "Missing parameter: " + std::string(key), id);
    }
    return *member;
}

std::string require_string(const JsonValue& object, std::string_view key, std::optional<std::uint64_t> id) {
    const auto& member = require_member(object, key, id);
    if (!member.is_string()) {
        throw ProtocolError(kInvalidParams, "Parameter must be a string: " + std::string(key), id);
    }
    return member.string_value;
}

std::string optional_string(const JsonValue& object, std::string_view key) {
    const auto* member = object.find(key);
    if (!member || !member->is_string()) {
        return {};
    }
    return member->string_value;
}

std::optional<std::uint64_t> optional_unsigned(const JsonValue& object, std::string_view key) {
    const auto* member = object.find(key);
    if (!member) {
        return std::nullopt;
    }
    return member->as_uint64();
}

int rpc_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:
            return kSegmentNotFound;
        case ErrorCode::CapacityExceeded:
            return kCapacityExceeded;
        case ErrorCode::InvalidArgument:
            return kInvalidParams;
        default:
            return kInternalError;
    }
}

}  // namespace

const char* method_to_string(Method method) noexcept {
    switch (method) {
        case Method::StoreSegment:
            return "store_segment";
        case Method::RetrieveSegment:
            return "retrieve_segment";
        case Method::HealthCheck:
            return "health_check";
        case Method::GetStorageInfo:
            return "get_storage_info";
    }
    return "unknown";
}

std::optional<Method> method_from_string(std::string_view text) {
    for (const auto method : {Method::StoreSegment, Method::RetrieveSegment, Method::HealthCheck, Method::GetStorageInfo}) {
        if (text == method_to_string(method)) {
            return method;
        }
    }
    return std::nullopt;
}

Response Response::success(std::uint64_t id, JsonValue result) {
    Response response{};
    response.id = id;
    response.result = std::move(result);
    return response;
}

Response Response::failure(std::optional<std::uint64_t> id, int code, std::string message) {
    Response response{};
    response.id = id;
    response.error = ErrorBody{code, std::move(message)};
    return response;
}

ProtocolError::ProtocolError(int code, std::string message, std::optional<std::uint64_t> request_id)
    : body{code, std::move(message)}, id(request_id) {}

std::string encode_request(const Request& request) {
    auto document = JsonValue::object();
    document.set("jsonrpc", JsonValue::string(kJsonRpcVersion));
    document.set("id", JsonValue::unsigned_integer(request.id));
    document.set("method", JsonValue::string(request.method));
    document.set("params", request.params.is_object() ? request.params : JsonValue::object());
    return document.dump();
}

Request decode_request(std::string_view text) {
    JsonValue document;
    try {
        document = util::parse_json(text);
    } catch (const std::runtime_error& ex) {
        throw ProtocolError(kParseError, std::string("Parse error: ") + ex.what());
    }
    if (!document.is_object()) {
        throw ProtocolError(kInvalidRequest, "Request must be a JSON object");
    }

    std::optional<std::uint64_t> id;
    if (const auto* id_value = document.find("id")) {
        id = id_value->as_uint64();
    }

    const auto* version = document.find("jsonrpc");
    if (!version || !version->is_string() || version->string_value != kJsonRpcVersion) {
        throw ProtocolError(kInvalidRequest, "jsonrpc must be \"2.0\"", id);
    }
    if (!id) {
        throw ProtocolError(kInvalidRequest, "Request id must be a non-negative integer");
    }
    const auto* method = document.find("method");
    if (!method || !method->is_string() || method->string_value.empty()) {
        throw ProtocolError(kInvalidRequest, "Request method must be a non-empty string", id);
    }

    Request request{};
    request.id = *id;
    request.method = method->string_value;
    if (const auto* params = document.find("params")) {
        if (params->is_null()) {
            request.params = JsonValue::object();
        } else if (params->is_object()) {
            request.params = *params;
        } else {
            throw ProtocolError(kInvalidParams, "params must be an object", id);
        }
    }
    return request;
}

std::string encode_response(const Response& response) {
    auto document = JsonValue::object();
    document.set("jsonrpc", JsonValue::string(kJsonRpcVersion));
    document.set("id", response.id ? JsonValue::unsigned_integer(*response.id) : JsonValue::null());
    if (response.error) {
        auto error = JsonValue::object();
        error.set("code", JsonValue::integer(response.error->code));
        error.set("message", JsonValue::string(response.error->message));
        document.set("error", std::move(error));
    } else {
        document.set("result", response.result ? *response.result : JsonValue::null());
    }
    return document.dump();
}

std::optional<Response> decode_response(std::string_view text) {
    JsonValue document;
    try {
        document = util::parse_json(text);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    if (!document.is_object()) {
        return std::nullopt;
    }
    const auto* version = document.find("jsonrpc");
    if (!version || !version->is_string() || version->string_value != kJsonRpcVersion) {
        return std::nullopt;
    }

    Response response{};
    if (const auto* id = document.find("id")) {
        response.id = id->as_uint64();
    }

    if (const auto* error = document.find("error"); error && !error->is_null()) {
        if (!error->is_object()) {
            return std::nullopt;
        }
        const auto* code = error->find("code");
        if (!code || !code->as_int64()) {
            return std::nullopt;
        }
        ErrorBody body{};
        body.code = static_cast<int>(*code->as_int64());
        body.message = optional_string(*error, "message");
        response.error = std::move(body);
        return response;
    }

    const auto* result = document.find("result");
    if (!result) {
        return std::nullopt;
    }
    response.result = *result;
    return response;
}

JsonValue segment_to_json(const storage::Segment& segment) {
    auto value = JsonValue::object();
    value.set("segment_id", JsonValue::string(segment.id));
    value.set("file_hash", JsonValue::string(segment.file_hash));
    value.set("chunk_number", JsonValue::unsigned_integer(segment.chunk_number));
    value.set("data_b64", JsonValue::string(util::base64_encode(segment.data)));
    value.set("checksum", JsonValue::string(segment.checksum));
    value.set("size_bytes", JsonValue::unsigned_integer(segment.data.size()));
    return value;
}

storage::Segment segment_from_json(const JsonValue& value) {
    if (!value.is_object()) {
        throw ProtocolError(kInvalidParams, "Segment must be an object");
    }

    storage::Segment segment{};
    segment.id = require_string(value, "segment_id", std::nullopt);
    segment.file_hash = optional_string(value, "file_hash");
    segment.checksum = optional_string(value, "checksum");
    if (const auto* chunk = value.find("chunk_number")) {
        const auto chunk_number = chunk->as_uint64();
        if (!chunk_number) {
            throw ProtocolError(kInvalidParams, "chunk_number must be a non-negative integer");
        }
        segment.chunk_number = static_cast<std::size_t>(*chunk_number);
    }

    const auto encoded = require_string(value, "data_b64", std::nullopt);
    try {
        segment.data = util::base64_decode(encoded);
    } catch (const Error& ex) {
        throw ProtocolError(kInvalidParams, std::string("data_b64: ") + ex.message);
    }
    segment.size = segment.data.size();
    if (const auto declared = optional_unsigned(value, "size_bytes"); declared && *declared != segment.size) {
        throw ProtocolError(kInvalidParams, "size_bytes does not match the decoded data");
    }
    segment.created_at = std::chrono::system_clock::now();
    return segment;
}

Request RequestBuilder::store_segment(const storage::Segment& segment) {
    return make(Method::StoreSegment, segment_to_json(segment));
}

Request RequestBuilder::retrieve_segment(const std::string& segment_id) {
    auto params = JsonValue::object();
    params.set("segment_id", JsonValue::string(segment_id));
    return make(Method::RetrieveSegment, std::move(params));
}

Request RequestBuilder::health_check() {
    return make(Method::HealthCheck, JsonValue::object());
}

Request RequestBuilder::get_storage_info() {
    return make(Method::GetStorageInfo, JsonValue::object());
}

Request RequestBuilder::make(Method method, JsonValue params) {
    Request request{};
    request.id = next_id_.fetch_add(1);
    request.method = method_to_string(method);
    request.params = std::move(params);
    return request;
}

SegmentService::SegmentService(core::Node& node, log::LoggerPtr logger)
    : node_(node), logger_(std::move(logger)) {}

Response SegmentService::handle(const Request& request) {
    const auto method = method_from_string(request.method);
    if (!method) {
        return Response::failure(request.id, kMethodNotFound, "Method not found: " + request.method);
    }

    try {
        switch (*method) {
            case Method::StoreSegment:
                return Response::success(request.id, store_segment(request));
            case Method::RetrieveSegment:
                return Response::success(request.id, retrieve_segment(request));
            case Method::HealthCheck:
                return Response::success(request.id, health_check());
            case Method::GetStorageInfo:
                return Response::success(request.id, storage_info());
        }
    } catch (const ProtocolError& ex) {
        return Response::failure(request.id, ex.body.code, ex.body.message);
    } catch (const Error& ex) {
        log::log_event(logger_,
                       Level::Error,
                       "rpc.request.failed",
                       {{"node", node_.id()}, {"method", request.method}, {"error", ex.what()}});
        return Response::failure(request.id, rpc_code_for(ex.code), ex.message);
    }
    return Response::failure(request.id, kMethodNotFound, "Method not found: " + request.method);
}

std::string SegmentService::handle_raw(std::string_view text) {
    try {
        const auto request = decode_request(text);
        return encode_response(handle(request));
    } catch (const ProtocolError& ex) {
        log::log_event(logger_,
                       Level::Warning,
                       "rpc.request.rejected",
                       {{"node", node_.id()}, {"code", std::to_string(ex.body.code)}, {"error", ex.body.message}});
        return encode_response(Response::failure(ex.id, ex.body.code, ex.body.message));
    } catch (const std::exception& ex) {
        log::log_event(logger_,
                       Level::Error,
                       "rpc.request.crashed",
                       {{"node", node_.id()}, {"error", ex.what()}});
        return encode_response(Response::failure(std::nullopt, kInternalError, ex.what()));
    }
}

JsonValue SegmentService::store_segment(const Request& request) {
    if (!node_.is_alive()) {
        throw ProtocolError(kInternalError, "Node offline: " + node_.id(), request.id);
    }

    auto segment = segment_from_json(request.params);
    if (!segment.checksum.empty() && crypto::Sha256::hex_digest(segment.data) != segment.checksum) {
        throw ProtocolError(kInvalidParams, "Checksum mismatch for segment " + segment.id, request.id);
    }
    if (segment.checksum.empty()) {
        segment.checksum = crypto::Sha256::hex_digest(segment.data);
    }
    node_.storage().store_segment(segment);

    auto result = JsonValue::object();
    result.set("status", JsonValue::string("stored"));
    result.set("segment_id", JsonValue::string(segment.id));
    result.set("size_bytes", JsonValue::unsigned_integer(segment.data.size()));
    return result;
}

JsonValue SegmentService::retrieve_segment(const Request& request) {
    if (!node_.is_alive()) {
        throw ProtocolError(kInternalError, "Node offline: " + node_.id(), request.id);
    }

    const auto segment_id = require_string(request.params, "segment_id", request.id);
    const auto segment = node_.storage().retrieve_segment(segment_id);
    if (!segment) {
        throw ProtocolError(kSegmentNotFound, "Segment not found: " + segment_id, request.id);
    }

    auto result = segment_to_json(*segment);
    result.set("status", JsonValue::string("retrieved"));
    return result;
}

JsonValue SegmentService::health_check() const {
    const auto info = node_.info();
    auto result = JsonValue::object();
    result.set("status", JsonValue::string(info.alive ? "healthy" : "unhealthy"));
    result.set("node_id", JsonValue::string(info.node_id));
    result.set("address", JsonValue::string(info.address));
    result.set("process_state", JsonValue::string(core::process_state_to_string(info.state)));
    result.set("uptime_seconds", JsonValue::number(info.uptime.count()));
    result.set("storage_used_bytes", JsonValue::unsigned_integer(info.used_bytes));
    result.set("storage_capacity_bytes", JsonValue::unsigned_integer(info.capacity_bytes));
    return result;
}

JsonValue SegmentService::storage_info() const {
    const auto info = node_.storage().storage_info();
    auto result = JsonValue::object();
    result.set("node_id", JsonValue::string(info.node_id));
    result.set("capacity_bytes", JsonValue::unsigned_integer(info.capacity_bytes));
    result.set("used_bytes", JsonValue::unsigned_integer(info.used_bytes));
    result.set("available_bytes", JsonValue::unsigned_integer(info.available_bytes));
    result.set("utilization_percent", JsonValue::number(info.utilization_percent));
    result.set("segments_stored", JsonValue::unsigned_integer(info.segments_stored));
    result.set("files_tracked", JsonValue::unsigned_integer(info.files_tracked));
    return result;
}

RpcSegmentProvider::RpcSegmentProvider(Transport transport, log::LoggerPtr logger)
    : transport_(std::move(transport)), logger_(std::move(logger)) {}

storage::FetchResult RpcSegmentProvider::fetch_segment(const std::string& segment_id) {
    if (!transport_) {
        return storage::FetchResult::unavailable("no transport configured");
    }

    const auto request = builder_.retrieve_segment(segment_id);
    std::optional<std::string> reply;
    try {
        reply = transport_(encode_request(request));
    } catch (const std::exception& ex) {
        log::log_event(logger_,
                       Level::Warning,
                       "rpc.transport.failed",
                       {{"segment", segment_id}, {"error", ex.what()}});
        return storage::FetchResult::unavailable(std::string("transport failed: ") + ex.what());
    }
    if (!reply) {
        return storage::FetchResult::unavailable("no reply");
    }

    const auto response = decode_response(*reply);
    if (!response) {
        return storage::FetchResult::unavailable("malformed reply");
    }
    if (response->id && *response->id != request.id) {
        return storage::FetchResult::unavailable("reply id does not match request");
    }
    if (response->error) {
        if (response->error->code == kSegmentNotFound) {
            return storage::FetchResult::not_found(response->error->message);
        }
        return storage::FetchResult::unavailable(response->error->message);
    }

    try {
        return storage::FetchResult::found(segment_from_json(*response->result));
    } catch (const ProtocolError& ex) {
        return storage::FetchResult::unavailable(std::string("bad segment in reply: ") + ex.body.message);
    }
}

}  // namespace meshstore::protocol
