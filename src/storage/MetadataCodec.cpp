#include "meshstore/storage/MetadataCodec.hpp"

#include "meshstore/Error.hpp"
#include "meshstore/util/Json.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace meshstore::storage {

namespace {

using util::JsonValue;

[[noreturn]] void malformed(const std::string& file_id, std::string_view what) {
    throw Error(ErrorCode::InvalidArgument, "metadata for '" + file_id + "': " + std::string(what));
}

const JsonValue& require(const JsonValue& entry, const std::string& file_id, std::string_view key) {
    const auto* value = entry.find(key);
    if (value == nullptr) {
        malformed(file_id, "missing " + std::string(key));
    }
    return *value;
}

std::string require_string(const JsonValue& entry, const std::string& file_id, std::string_view key) {
    const auto& value = require(entry, file_id, key);
    if (!value.is_string()) {
        malformed(file_id, std::string(key) + " must be a string");
    }
    return value.string_value;
}

std::uint64_t require_count(const JsonValue& entry, const std::string& file_id, std::string_view key) {
    const auto parsed = require(entry, file_id, key).as_uint64();
    if (!parsed.has_value()) {
        malformed(file_id, std::string(key) + " must be a non-negative integer");
    }
    return *parsed;
}

std::time_t to_time_t_utc(std::tm& tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

JsonValue encode_entry(const FileMetadata& metadata) {
    auto chunks = JsonValue::object();
    for (const auto& [chunk_number, node_id] : metadata.chunks) {
        chunks.set(std::to_string(chunk_number), JsonValue::string(node_id));
    }

    auto entry = JsonValue::object();
    entry.set("file_id", JsonValue::string(metadata.file_id));
    entry.set("original_filename", JsonValue::string(metadata.original_filename));
    entry.set("file_hash", JsonValue::string(metadata.file_hash));
    entry.set("total_size_bytes", JsonValue::unsigned_integer(metadata.total_size_bytes));
    entry.set("chunk_size_bytes", JsonValue::unsigned_integer(metadata.chunk_size_bytes));
    entry.set("total_chunks", JsonValue::unsigned_integer(metadata.total_chunks));
    entry.set("chunks", std::move(chunks));
    entry.set("created_at", JsonValue::string(format_timestamp(metadata.created_at)));
    entry.set("replicas", JsonValue::unsigned_integer(metadata.replicas));
    return entry;
}

FileMetadata decode_entry(const std::string& file_id, const JsonValue& entry) {
    if (!entry.is_object()) {
        malformed(file_id, "entry must be an object");
    }

    FileMetadata metadata{};
    metadata.file_id = file_id;
    metadata.original_filename = require_string(entry, file_id, "original_filename");
    metadata.file_hash = require_string(entry, file_id, "file_hash");
    metadata.total_size_bytes = require_count(entry, file_id, "total_size_bytes");
    metadata.chunk_size_bytes = static_cast<std::size_t>(require_count(entry, file_id, "chunk_size_bytes"));
    metadata.total_chunks = static_cast<std::size_t>(require_count(entry, file_id, "total_chunks"));

    if (const auto* chunks = entry.find("chunks"); chunks != nullptr) {
        if (!chunks->is_object()) {
            malformed(file_id, "chunks must be an object");
        }
        for (const auto& [key, holder] : chunks->object_value) {
            std::size_t chunk_number = 0;
            const auto result = std::from_chars(key.data(), key.data() + key.size(), chunk_number);
            if (result.ec != std::errc{} || result.ptr != key.data() + key.size() || !holder.is_string()) {
                malformed(file_id, "invalid chunk entry '" + key + "'");
            }
            metadata.chunks[chunk_number] = holder.string_value;
        }
    }

    metadata.created_at = std::chrono::system_clock::now();
    if (const auto* created = entry.find("created_at"); created != nullptr && created->is_string()) {
        if (const auto parsed = parse_timestamp(created->string_value); parsed.has_value()) {
            metadata.created_at = *parsed;
        }
    }

    if (const auto* replicas = entry.find("replicas"); replicas != nullptr) {
        const auto parsed = replicas->as_uint64();
        if (!parsed.has_value()) {
            malformed(file_id, "replicas must be a non-negative integer");
        }
        metadata.replicas = static_cast<std::uint32_t>(*parsed);
    }

    return metadata;
}

}  // namespace

std::string encode_metadata_table(const MetadataTable& table) {
    auto document = JsonValue::object();
    for (const auto& [file_id, metadata] : table) {
        document.set(file_id, encode_entry(metadata));
    }
    return document.dump(2);
}

MetadataTable decode_metadata_table(std::string_view text) {
    JsonValue document;
    try {
        document = util::parse_json(text);
    } catch (const std::runtime_error& ex) {
        throw Error(ErrorCode::InvalidArgument, std::string("metadata is not valid JSON: ") + ex.what());
    }
    if (!document.is_object()) {
        throw Error(ErrorCode::InvalidArgument, "metadata document must be an object");
    }

    MetadataTable table;
    for (const auto& [file_id, entry] : document.object_value) {
        table[file_id] = decode_entry(file_id, entry);
    }
    return table;
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time - seconds).count();
    const std::time_t time_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time_c);
#else
    gmtime_r(&time_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(std::string_view text) {
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream iss(std::string(text.substr(0, 19)));
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    std::int64_t micros = 0;
    auto rest = text.substr(19);
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        std::size_t digits = 0;
        while (digits < rest.size() && rest[digits] >= '0' && rest[digits] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (rest[digits] - '0');
            }
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (auto scale = digits; scale < 6; ++scale) {
            micros *= 10;
        }
        rest.remove_prefix(digits);
    }
    if (!rest.empty() && rest != "Z") {
        return std::nullopt;
    }

    const auto seconds = to_time_t_utc(tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::microseconds(micros);
}

}  // namespace meshstore::storage
