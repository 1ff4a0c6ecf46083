#include "meshstore/util/Json.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace meshstore::util {

namespace {

constexpr std::size_t kMaxNestingDepth = 64;

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input) {}

    JsonValue parse() {
        skip_whitespace();
        JsonValue value = parse_value();
        skip_whitespace();
        if (!eof()) {
            throw std::runtime_error("Unexpected trailing data after JSON document");
        }
        return value;
    }

private:
    JsonValue parse_value() {
        if (eof()) {
            throw std::runtime_error("Unexpected end of JSON input");
        }
        const char ch = peek();
        if (ch == '"') {
            return JsonValue::string(parse_string());
        }
        if (ch == '{') {
            return parse_object();
        }
        if (ch == '[') {
            return parse_array();
        }
        if (match_literal("true")) {
            return JsonValue::boolean(true);
        }
        if (match_literal("false")) {
            return JsonValue::boolean(false);
        }
        if (match_literal("null")) {
            return JsonValue::null();
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            return parse_number();
        }
        throw std::runtime_error("Invalid JSON token start");
    }

    void enter() {
        if (++depth_ > kMaxNestingDepth) {
            throw std::runtime_error("JSON nesting deeper than " + std::to_string(kMaxNestingDepth) + " levels");
        }
    }

    JsonValue parse_object() {
        enter();
        auto value = JsonValue::object();
        expect('{');
        skip_whitespace();
        if (match('}')) {
            --depth_;
            return value;
        }
        while (true) {
            skip_whitespace();
            if (eof() || peek() != '"') {
                throw std::runtime_error("Expected string key in object");
            }
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            skip_whitespace();
            value.object_value.emplace_back(std::move(key), parse_value());
            skip_whitespace();
            if (match('}')) {
                break;
            }
            expect(',');
        }
        --depth_;
        return value;
    }

    JsonValue parse_array() {
        enter();
        auto value = JsonValue::array();
        expect('[');
        skip_whitespace();
        if (match(']')) {
            --depth_;
            return value;
        }
        while (true) {
            skip_whitespace();
            value.array_value.push_back(parse_value());
            skip_whitespace();
            if (match(']')) {
                break;
            }
            expect(',');
        }
        --depth_;
        return value;
    }

    JsonValue parse_number() {
        const std::size_t start = pos_;
        match('-');
        if (!match('0')) {
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                throw std::runtime_error("Invalid number literal");
            }
            consume_digits();
        }
        if (match('.')) {
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                throw std::runtime_error("Invalid fractional number");
            }
            consume_digits();
        }
        if (!eof() && (peek() == 'e' || peek() == 'E')) {
            ++pos_;
            if (!eof() && (peek() == '+' || peek() == '-')) {
                ++pos_;
            }
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                throw std::runtime_error("Invalid exponent in number");
            }
            consume_digits();
        }

        const std::string buffer(input_.substr(start, pos_ - start));
        char* end = nullptr;
        errno = 0;
        const double parsed = std::strtod(buffer.c_str(), &end);
        if (errno == ERANGE || end != buffer.c_str() + buffer.size()) {
            throw std::runtime_error("Unable to parse number literal");
        }
        JsonValue value;
        value.type = JsonType::Number;
        value.number_value = parsed;
        value.number_text = buffer;
        return value;
    }

    std::string parse_string() {
        expect('"');
        std::string output;
        while (true) {
            if (eof()) {
                throw std::runtime_error("Unterminated string literal");
            }
            const char ch = input_[pos_++];
            if (ch == '"') {
                break;
            }
            if (static_cast<unsigned char>(ch) < 0x20) {
                throw std::runtime_error("Control characters must be escaped in strings");
            }
            if (ch != '\\') {
                output.push_back(ch);
                continue;
            }
            if (eof()) {
                throw std::runtime_error("Unterminated escape sequence");
            }
            const char esc = input_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    output.push_back(esc);
                    break;
                case 'b':
                    output.push_back('\b');
                    break;
                case 'f':
                    output.push_back('\f');
                    break;
                case 'n':
                    output.push_back('\n');
                    break;
                case 'r':
                    output.push_back('\r');
                    break;
                case 't':
                    output.push_back('\t');
                    break;
                case 'u':
                    append_utf8(parse_codepoint(), output);
                    break;
                default:
                    throw std::runtime_error("Invalid escape sequence in string");
            }
        }
        return output;
    }

    unsigned int parse_codepoint() {
        auto codepoint = read_hex4();
        if (codepoint >= 0xD800 && codepoint <= 0xDBFF && input_.substr(pos_, 2) == "\\u") {
            pos_ += 2;
            const auto low = read_hex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                throw std::runtime_error("Invalid surrogate pair");
            }
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
        }
        return codepoint;
    }

    unsigned int read_hex4() {
        if (pos_ + 4 > input_.size()) {
            throw std::runtime_error("Truncated unicode escape");
        }
        unsigned int value = 0;
        for (const char ch : input_.substr(pos_, 4)) {
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<unsigned int>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<unsigned int>(10 + ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<unsigned int>(10 + ch - 'A');
            } else {
                throw std::runtime_error("Invalid unicode escape");
            }
        }
        pos_ += 4;
        return value;
    }

    static void append_utf8(unsigned int codepoint, std::string& out) {
        if (codepoint <= 0x7F) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    void consume_digits() {
        while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
        }
    }

    void expect(char expected) {
        if (eof() || input_[pos_] != expected) {
            throw std::runtime_error(std::string("Expected '") + expected + "' in JSON input");
        }
        ++pos_;
    }

    bool match(char expected) {
        if (!eof() && input_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool match_literal(std::string_view literal) {
        if (input_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    void skip_whitespace() {
        while (!eof() && std::isspace(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
        }
    }

    char peek() const { return input_[pos_]; }
    bool eof() const { return pos_ >= input_.size(); }

    std::string_view input_;
    std::size_t pos_{0};
    std::size_t depth_{0};
};

bool integral_text(const std::string& text) {
    return !text.empty() && text.find_first_of(".eE") == std::string::npos;
}

void write_indent(std::string& out, int indent, int depth) {
    if (indent < 0) {
        return;
    }
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent * depth), ' ');
}

void dump_value(const JsonValue& value, std::string& out, int indent, int depth) {
    switch (value.type) {
        case JsonType::Null:
            out.append("null");
            return;
        case JsonType::Boolean:
            out.append(value.bool_value ? "true" : "false");
            return;
        case JsonType::Number: {
            if (!value.number_text.empty()) {
                out.append(value.number_text);
                return;
            }
            if (!std::isfinite(value.number_value)) {
                out.append("null");
                return;
            }
            char buffer[64];
            const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value.number_value);
            out.append(buffer, result.ptr);
            return;
        }
        case JsonType::String:
            out.push_back('"');
            out.append(escape_json(value.string_value));
            out.push_back('"');
            return;
        case JsonType::Array: {
            out.push_back('[');
            if (value.array_value.empty()) {
                out.push_back(']');
                return;
            }
            for (std::size_t i = 0; i < value.array_value.size(); ++i) {
                write_indent(out, indent, depth + 1);
                dump_value(value.array_value[i], out, indent, depth + 1);
                if (i + 1 < value.array_value.size()) {
                    out.push_back(',');
                }
            }
            write_indent(out, indent, depth);
            out.push_back(']');
            return;
        }
        case JsonType::Object: {
            out.push_back('{');
            if (value.object_value.empty()) {
                out.push_back('}');
                return;
            }
            for (std::size_t i = 0; i < value.object_value.size(); ++i) {
                const auto& [key, child] = value.object_value[i];
                write_indent(out, indent, depth + 1);
                out.push_back('"');
                out.append(escape_json(key));
                out.append(indent < 0 ? "\":" : "\": ");
                dump_value(child, out, indent, depth + 1);
                if (i + 1 < value.object_value.size()) {
                    out.push_back(',');
                }
            }
            write_indent(out, indent, depth);
            out.push_back('}');
            return;
        }
    }
}

}  // namespace

JsonValue JsonValue::null() {
    return JsonValue{};
}

JsonValue JsonValue::boolean(bool value) {
    JsonValue result;
    result.type = JsonType::Boolean;
    result.bool_value = value;
    return result;
}

JsonValue JsonValue::integer(std::int64_t value) {
    JsonValue result;
    result.type = JsonType::Number;
    result.number_value = static_cast<double>(value);
    result.number_text = std::to_string(value);
    return result;
}

JsonValue JsonValue::unsigned_integer(std::uint64_t value) {
    JsonValue result;
    result.type = JsonType::Number;
    result.number_value = static_cast<double>(value);
    result.number_text = std::to_string(value);
    return result;
}

JsonValue JsonValue::number(double value) {
    JsonValue result;
    result.type = JsonType::Number;
    result.number_value = value;
    return result;
}

JsonValue JsonValue::string(std::string value) {
    JsonValue result;
    result.type = JsonType::String;
    result.string_value = std::move(value);
    return result;
}

JsonValue JsonValue::object() {
    JsonValue result;
    result.type = JsonType::Object;
    return result;
}

JsonValue JsonValue::array() {
    JsonValue result;
    result.type = JsonType::Array;
    return result;
}

const JsonValue* JsonValue::find(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    for (const auto& [k, value] : object_value) {
        if (k == key) {
            return &value;
        }
    }
    return nullptr;
}

JsonValue& JsonValue::set(std::string key, JsonValue value) {
    if (!is_object()) {
        throw std::logic_error("JsonValue::set requires an object");
    }
    for (auto& [k, existing] : object_value) {
        if (k == key) {
            existing = std::move(value);
            return existing;
        }
    }
    object_value.emplace_back(std::move(key), std::move(value));
    return object_value.back().second;
}

JsonValue& JsonValue::push(JsonValue value) {
    if (!is_array()) {
        throw std::logic_error("JsonValue::push requires an array");
    }
    array_value.push_back(std::move(value));
    return array_value.back();
}

std::optional<std::uint64_t> JsonValue::as_uint64() const {
    if (!is_number() || !integral_text(number_text) || number_text.front() == '-') {
        return std::nullopt;
    }
    std::uint64_t parsed = 0;
    const auto* begin = number_text.data();
    const auto* end = begin + number_text.size();
    const auto result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<std::int64_t> JsonValue::as_int64() const {
    if (!is_number() || !integral_text(number_text)) {
        return std::nullopt;
    }
    std::int64_t parsed = 0;
    const auto* begin = number_text.data();
    const auto* end = begin + number_text.size();
    const auto result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

std::string JsonValue::dump(int indent) const {
    std::string out;
    dump_value(*this, out, indent, 0);
    return out;
}

JsonValue parse_json(std::string_view text) {
    return JsonParser(text).parse();
}

std::string escape_json(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                escaped.append("\\\"");
                break;
            case '\\':
                escaped.append("\\\\");
                break;
            case '\b':
                escaped.append("\\b");
                break;
            case '\f':
                escaped.append("\\f");
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch);
                    escaped.append(oss.str());
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    return escaped;
}

}  // namespace meshstore::util
