#pragma once

#include <exception>
#include <string>

namespace meshstore {

enum class ErrorCode {
    NotFound,
    CapacityExceeded,
    AddressSpaceExhausted,
    ReconstructionFailed,
    InvalidArgument,
    InvalidConfig,
    IoFailure
};

const char* error_code_to_string(ErrorCode code) noexcept;

struct Error : public std::exception {
    ErrorCode code;
    std::string message;
    std::string formatted;

    Error(ErrorCode c, std::string m);

    const char* what() const noexcept override { return formatted.c_str(); }
};

}  // namespace meshstore
