#pragma once

#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meshstore::log {

// Writes one JSON object per line. One instance is shared by every component
// of a cluster; components hold it through std::shared_ptr and stay silent
// when given none.
class StructuredLogger {
public:
    enum class Level {
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    explicit StructuredLogger(std::ostream& sink);
    StructuredLogger();

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_minimum_level(Level level);

private:
    static std::string level_to_string(Level level);
    static std::string format_timestamp();

    std::ostream* sink_;
    bool enabled_{true};
    Level minimum_{Level::Info};
    mutable std::mutex mutex_;
};

using LoggerPtr = std::shared_ptr<StructuredLogger>;

inline void log_event(const LoggerPtr& logger,
                      StructuredLogger::Level level,
                      std::string_view event,
                      StructuredLogger::FieldList fields = {}) {
    if (logger) {
        logger->log(level, event, std::move(fields));
    }
}

}  // namespace meshstore::log
