#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <vector>
#include "event_pusher.hpp"

namespace arbx {

// Synchronous fan-out: subscribers run on the pushing thread, in
// subscription order, before push_event returns.
class EventBus : public EventPusher {
public:
    using Subscriber = std::function<void(const Event&)>;

    explicit EventBus(size_t history_limit = 1000);

    void subscribe(Subscriber subscriber);
    void push_event(Event event) override;

    std::vector<Event> history() const;
    void clear_history();

private:
    void log_event(const Event& event) const;

    size_t history_limit_;
    mutable std::mutex mutex_;
    std::vector<Subscriber> subscribers_;
    std::deque<Event> history_;
};

} // namespace arbx
