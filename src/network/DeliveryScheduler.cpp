#include "meshstore/network/DeliveryScheduler.hpp"

namespace meshstore::network {

DeliveryScheduler::DeliveryScheduler() = default;

DeliveryScheduler::~DeliveryScheduler() {
    stop();
}

void DeliveryScheduler::start() {
    std::scoped_lock lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread([this]() { run(); });
}

std::size_t DeliveryScheduler::stop() {
    std::size_t discarded = 0;
    {
        std::scoped_lock lock(mutex_);
        running_ = false;
        discarded = queue_.size();
        queue_.clear();
        due_by_ticket_.clear();
    }
    wake_.notify_all();

    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
    idle_.notify_all();
    return discarded;
}

bool DeliveryScheduler::running() const {
    std::scoped_lock lock(mutex_);
    return running_;
}

DeliveryScheduler::Ticket DeliveryScheduler::schedule_at(Clock::time_point due, Action action) {
    Ticket ticket = kInvalidTicket;
    {
        std::scoped_lock lock(mutex_);
        if (!running_ || !action) {
            return kInvalidTicket;
        }
        ticket = next_ticket_++;
        queue_.emplace(Key{due, ticket}, std::move(action));
        due_by_ticket_.emplace(ticket, due);
    }
    wake_.notify_one();
    return ticket;
}

DeliveryScheduler::Ticket DeliveryScheduler::schedule_after(Clock::duration delay, Action action) {
    return schedule_at(Clock::now() + delay, std::move(action));
}

bool DeliveryScheduler::cancel(Ticket ticket) {
    std::scoped_lock lock(mutex_);
    const auto it = due_by_ticket_.find(ticket);
    if (it == due_by_ticket_.end()) {
        return false;
    }
    queue_.erase(Key{it->second, ticket});
    due_by_ticket_.erase(it);
    if (queue_.empty() && !executing_) {
        idle_.notify_all();
    }
    return true;
}

std::size_t DeliveryScheduler::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_.size();
}

bool DeliveryScheduler::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_.wait_for(lock, timeout, [this]() { return queue_.empty() && !executing_; });
}

void DeliveryScheduler::run() {
    std::unique_lock lock(mutex_);
    while (running_) {
        if (queue_.empty()) {
            wake_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
            continue;
        }

        const auto next = queue_.begin();
        const auto due = next->first.first;
        if (Clock::now() < due) {
            wake_.wait_until(lock, due);
            continue;
        }

        auto action = std::move(next->second);
        due_by_ticket_.erase(next->first.second);
        queue_.erase(next);

        executing_ = true;
        lock.unlock();
        action();
        lock.lock();
        executing_ = false;

        if (queue_.empty()) {
            idle_.notify_all();
        }
    }
}

}  // namespace meshstore::network
