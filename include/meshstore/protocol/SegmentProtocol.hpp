#pragma once

#include "meshstore/log/StructuredLogger.hpp"
#include "meshstore/storage/Segment.hpp"
#include "meshstore/storage/SegmentProvider.hpp"
#include "meshstore/util/Json.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace meshstore::core {
class Node;
}  // namespace meshstore::core

namespace meshstore::protocol {

inline constexpr const char* kJsonRpcVersion = "2.0";

inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kSegmentNotFound = -32004;
inline constexpr int kCapacityExceeded = -32005;

enum class Method {
    StoreSegment,
    RetrieveSegment,
    HealthCheck,
    GetStorageInfo,
};

const char* method_to_string(Method method) noexcept;
std::optional<Method> method_from_string(std::string_view text);

struct Request {
    std::uint64_t id{0};
    std::string method;
    util::JsonValue params{util::JsonValue::object()};
};

struct ErrorBody {
    int code{kInternalError};
    std::string message;
};

struct Response {
    std::optional<std::uint64_t> id;
    std::optional<util::JsonValue> result;
    std::optional<ErrorBody> error;

    bool ok() const noexcept { return result.has_value() && !error.has_value(); }

    static Response success(std::uint64_t id, util::JsonValue result);
    static Response failure(std::optional<std::uint64_t> id, int code, std::string message);
};

// Raised while decoding or dispatching; carries the JSON-RPC error to answer with.
struct ProtocolError : public std::exception {
    ErrorBody body;
    std::optional<std::uint64_t> id;

    ProtocolError(int code, std::string message, std::optional<std::uint64_t> request_id = std::nullopt);

    const char* what() const noexcept override { return body.message.c_str(); }
};

std::string encode_request(const Request& request);
// Throws ProtocolError with kParseError, kInvalidRequest or kInvalidParams.
Request decode_request(std::string_view text);

std::string encode_response(const Response& response);
// nullopt when the text is not a JSON-RPC 2.0 response.
std::optional<Response> decode_response(std::string_view text);

util::JsonValue segment_to_json(const storage::Segment& segment);
// Throws ProtocolError{kInvalidParams} for missing fields or bad base64.
storage::Segment segment_from_json(const util::JsonValue& value);

// Assigns increasing ids starting at 1.
class RequestBuilder {
public:
    Request store_segment(const storage::Segment& segment);
    Request retrieve_segment(const std::string& segment_id);
    Request health_check();
    Request get_storage_info();

    std::uint64_t last_id() const noexcept { return next_id_.load() - 1; }

private:
    Request make(Method method, util::JsonValue params);

    std::atomic<std::uint64_t> next_id_{1};
};

// Serves the four segment methods against one node.
class SegmentService {
public:
    explicit SegmentService(core::Node& node, log::LoggerPtr logger = nullptr);

    Response handle(const Request& request);
    // Decode, dispatch and encode. Every failure becomes an error response.
    std::string handle_raw(std::string_view text);

private:
    util::JsonValue store_segment(const Request& request);
    util::JsonValue retrieve_segment(const Request& request);
    util::JsonValue health_check() const;
    util::JsonValue storage_info() const;

    core::Node& node_;
    log::LoggerPtr logger_;
};

// Fetches segments by speaking the protocol through a caller-supplied
// transport. The transport returns the reply text, or nullopt when the peer
// could not be reached.
class RpcSegmentProvider : public storage::SegmentProvider {
public:
    using Transport = std::function<std::optional<std::string>(const std::string&)>;

    explicit RpcSegmentProvider(Transport transport, log::LoggerPtr logger = nullptr);

    storage::FetchResult fetch_segment(const std::string& segment_id) override;

private:
    Transport transport_;
    RequestBuilder builder_;
    log::LoggerPtr logger_;
};

}  // namespace meshstore::protocol
