#include "meshstore/util/Base64.hpp"

#include "meshstore/Error.hpp"

#include <array>

namespace meshstore::util {

namespace {

constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int, 256> make_decode_table() {
    std::array<int, 256> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kBase64Alphabet[i])] = i;
    }
    return table;
}

constexpr auto kDecodeTable = make_decode_table();

}  // namespace

std::string base64_encode(std::span<const std::uint8_t> input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        const auto triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                            (static_cast<std::uint32_t>(input[i + 1]) << 8) |
                            static_cast<std::uint32_t>(input[i + 2]);
        output.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
        output.push_back(kBase64Alphabet[triple & 0x3F]);
    }

    const auto remaining = input.size() - i;
    if (remaining == 1) {
        const auto triple = static_cast<std::uint32_t>(input[i]) << 16;
        output.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        output.append("==");
    } else if (remaining == 2) {
        const auto triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                            (static_cast<std::uint32_t>(input[i + 1]) << 8);
        output.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
        output.push_back('=');
    }

    return output;
}

ByteBuffer base64_decode(std::string_view input) {
    if (input.size() % 4 != 0) {
        throw Error(ErrorCode::InvalidArgument, "invalid base64 input length");
    }

    ByteBuffer output;
    output.reserve((input.size() / 4) * 3);

    for (std::size_t i = 0; i < input.size(); i += 4) {
        const bool last_quad = i + 4 == input.size();
        const bool pad2 = input[i + 2] == '=';
        const bool pad3 = input[i + 3] == '=';
        if ((pad2 || pad3) && !last_quad) {
            throw Error(ErrorCode::InvalidArgument, "base64 padding before end of input");
        }
        if (pad2 && !pad3) {
            throw Error(ErrorCode::InvalidArgument, "invalid base64 padding");
        }

        const auto a = kDecodeTable[static_cast<unsigned char>(input[i])];
        const auto b = kDecodeTable[static_cast<unsigned char>(input[i + 1])];
        const auto c = pad2 ? 0 : kDecodeTable[static_cast<unsigned char>(input[i + 2])];
        const auto d = pad3 ? 0 : kDecodeTable[static_cast<unsigned char>(input[i + 3])];
        if (a < 0 || b < 0 || c < 0 || d < 0) {
            throw Error(ErrorCode::InvalidArgument, "invalid base64 character");
        }

        const auto triple = (static_cast<std::uint32_t>(a) << 18) | (static_cast<std::uint32_t>(b) << 12) |
                            (static_cast<std::uint32_t>(c) << 6) | static_cast<std::uint32_t>(d);
        output.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
        if (!pad2) {
            output.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
        }
        if (!pad3) {
            output.push_back(static_cast<std::uint8_t>(triple & 0xFF));
        }
    }

    return output;
}

}  // namespace meshstore::util
