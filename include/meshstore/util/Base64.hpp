#pragma once

#include "meshstore/Types.hpp"

#include <span>
#include <string>
#include <string_view>

namespace meshstore::util {

std::string base64_encode(std::span<const std::uint8_t> input);

// Throws Error{InvalidArgument} on malformed input.
ByteBuffer base64_decode(std::string_view input);

}  // namespace meshstore::util
