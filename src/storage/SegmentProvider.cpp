#include "meshstore/storage/SegmentProvider.hpp"

#include <utility>

namespace meshstore::storage {

const char* fetch_status_to_string(FetchStatus status) noexcept {
    switch (status) {
        case FetchStatus::Found:
            return "found";
        case FetchStatus::NotFound:
            return "not_found";
        case FetchStatus::Unavailable:
            return "unavailable";
    }
    return "unknown";
}

FetchResult FetchResult::found(Segment segment) {
    FetchResult result{};
    result.status = FetchStatus::Found;
    result.segment = std::move(segment);
    return result;
}

FetchResult FetchResult::not_found(std::string detail) {
    FetchResult result{};
    result.status = FetchStatus::NotFound;
    result.detail = std::move(detail);
    return result;
}

FetchResult FetchResult::unavailable(std::string detail) {
    FetchResult result{};
    result.status = FetchStatus::Unavailable;
    result.detail = std::move(detail);
    return result;
}

}  // namespace meshstore::storage
