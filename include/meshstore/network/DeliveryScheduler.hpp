#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace meshstore::network {

// Time-ordered queue of deferred actions drained by a single worker thread.
// Actions with equal due times run in scheduling order. stop() discards
// whatever is still queued.
class DeliveryScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Action = std::function<void()>;
    using Ticket = std::uint64_t;

    static constexpr Ticket kInvalidTicket = 0;

    DeliveryScheduler();
    ~DeliveryScheduler();

    DeliveryScheduler(const DeliveryScheduler&) = delete;
    DeliveryScheduler& operator=(const DeliveryScheduler&) = delete;

    void start();
    // Returns the number of actions discarded.
    std::size_t stop();
    [[nodiscard]] bool running() const;

    Ticket schedule_at(Clock::time_point due, Action action);
    Ticket schedule_after(Clock::duration delay, Action action);
    bool cancel(Ticket ticket);

    std::size_t pending() const;
    bool wait_until_idle(std::chrono::milliseconds timeout);

private:
    using Key = std::pair<Clock::time_point, Ticket>;

    void run();

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::map<Key, Action> queue_;
    std::unordered_map<Ticket, Clock::time_point> due_by_ticket_;
    Ticket next_ticket_{1};
    bool running_{false};
    bool executing_{false};
    std::thread worker_;
};

}  // namespace meshstore::network
