#include "meshstore/log/StructuredLogger.hpp"

#include "meshstore/util/Json.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace meshstore::log {

namespace {

int severity(StructuredLogger::Level level) {
    switch (level) {
        case StructuredLogger::Level::Info:
            return 0;
        case StructuredLogger::Level::Warning:
            return 1;
        case StructuredLogger::Level::Error:
            return 2;
    }
    return 0;
}

}  // namespace

StructuredLogger::StructuredLogger(std::ostream& sink)
    : sink_(&sink) {}

StructuredLogger::StructuredLogger()
    : sink_(&std::clog) {}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || severity(level) < severity(minimum_)) {
        return;
    }

    std::ostringstream oss;
    oss << '{'
        << "\"ts\":\"" << util::escape_json(format_timestamp()) << "\","
        << "\"level\":\"" << level_to_string(level) << "\","
        << "\"event\":\"" << util::escape_json(event) << "\"";

    if (!fields.empty()) {
        oss << ",\"fields\":{";
        for (std::size_t i = 0; i < fields.size(); ++i) {
            const auto& [key, value] = fields[i];
            oss << "\"" << util::escape_json(key) << "\":\"" << util::escape_json(value) << "\"";
            if (i + 1 < fields.size()) {
                oss << ',';
            }
        }
        oss << '}';
    }

    oss << "}\n";
    *sink_ << oss.str();
    sink_->flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_minimum_level(Level level) {
    std::scoped_lock lock(mutex_);
    minimum_ = level;
}

std::string StructuredLogger::level_to_string(Level level) {
    switch (level) {
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now_c);
#else
    gmtime_r(&now_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fractional << 'Z';
    return oss.str();
}

}  // namespace meshstore::log
