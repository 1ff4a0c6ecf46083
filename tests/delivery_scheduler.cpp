#include "meshstore/network/DeliveryScheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using meshstore::network::DeliveryScheduler;

int main() {
    // Due time decides the order, not the order of scheduling.
    {
        DeliveryScheduler scheduler;
        scheduler.start();

        std::mutex mutex;
        std::vector<std::string> order;
        auto record = [&](std::string label) {
            return [&, label]() {
                std::scoped_lock lock(mutex);
                order.push_back(label);
            };
        };

        const auto base = DeliveryScheduler::Clock::now() + 50ms;
        assert(scheduler.schedule_at(base + 40ms, record("late")) != DeliveryScheduler::kInvalidTicket);
        assert(scheduler.schedule_at(base, record("early-1")) != DeliveryScheduler::kInvalidTicket);
        assert(scheduler.schedule_at(base, record("early-2")) != DeliveryScheduler::kInvalidTicket);
        assert(scheduler.schedule_at(base + 20ms, record("middle")) != DeliveryScheduler::kInvalidTicket);

        assert(scheduler.wait_until_idle(2s));
        const std::vector<std::string> expected{"early-1", "early-2", "middle", "late"};
        assert(order == expected);
    }

    // Cancelled tickets never run.
    {
        DeliveryScheduler scheduler;
        scheduler.start();

        std::atomic<int> runs{0};
        const auto keep = scheduler.schedule_after(20ms, [&]() { ++runs; });
        const auto drop = scheduler.schedule_after(20ms, [&]() { runs += 100; });
        assert(keep != drop);
        assert(scheduler.cancel(drop));
        assert(!scheduler.cancel(drop));
        assert(scheduler.wait_until_idle(2s));
        assert(runs == 1);
    }

    // stop() discards pending work and refuses new work.
    {
        DeliveryScheduler scheduler;
        scheduler.start();

        std::atomic<int> runs{0};
        for (int i = 0; i < 5; ++i) {
            scheduler.schedule_after(10s, [&]() { ++runs; });
        }
        assert(scheduler.pending() == 5);

        const auto started = std::chrono::steady_clock::now();
        assert(scheduler.stop() == 5);
        assert(std::chrono::steady_clock::now() - started < 5s);
        assert(!scheduler.running());
        assert(scheduler.pending() == 0);
        assert(scheduler.schedule_after(1ms, [&]() { ++runs; }) == DeliveryScheduler::kInvalidTicket);
        assert(runs == 0);
        assert(scheduler.stop() == 0);
    }

    return 0;
}
