#include "meshstore/Error.hpp"

#include <utility>

namespace meshstore {

const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound:
            return "E_NOT_FOUND";
        case ErrorCode::CapacityExceeded:
            return "E_CAPACITY_EXCEEDED";
        case ErrorCode::AddressSpaceExhausted:
            return "E_ADDRESS_SPACE_EXHAUSTED";
        case ErrorCode::ReconstructionFailed:
            return "E_RECONSTRUCTION_FAILED";
        case ErrorCode::InvalidArgument:
            return "E_INVALID_ARGUMENT";
        case ErrorCode::InvalidConfig:
            return "E_INVALID_CONFIG";
        case ErrorCode::IoFailure:
            return "E_IO_FAILURE";
    }
    return "E_UNKNOWN";
}

Error::Error(ErrorCode c, std::string m)
    : code(c), message(std::move(m)) {
    formatted = std::string("[") + error_code_to_string(code) + "] " + message;
}

}  // namespace meshstore
