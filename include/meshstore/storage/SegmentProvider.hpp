#pragma once

#include "meshstore/storage/Segment.hpp"

#include <optional>
#include <string>

namespace meshstore::storage {

enum class FetchStatus {
    Found,
    NotFound,     // every reachable holder answered and none had it
    Unavailable,  // the provider could not ask (holder down, transport failure)
};

const char* fetch_status_to_string(FetchStatus status) noexcept;

struct FetchResult {
    FetchStatus status{FetchStatus::NotFound};
    std::optional<Segment> segment;
    std::string detail;

    static FetchResult found(Segment segment);
    static FetchResult not_found(std::string detail = {});
    static FetchResult unavailable(std::string detail = {});
};

// Source of segments the reconstructing engine does not hold itself.
class SegmentProvider {
public:
    virtual ~SegmentProvider() = default;

    virtual FetchResult fetch_segment(const std::string& segment_id) = 0;
};

}  // namespace meshstore::storage
