#include "event_bus.hpp"
#include "utils/logger.hpp"

namespace arbx {

const char* event_name(const Event& event) {
    return std::visit([](auto&& arg) -> const char* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ArbitrageExecutedEvent>) {
            return "ArbitrageExecuted";
        } else if constexpr (std::is_same_v<T, ArbitrageFailedEvent>) {
            return "ArbitrageFailed";
        } else if constexpr (std::is_same_v<T, SuperProfitConvertedEvent>) {
            return "SuperProfitConverted";
        } else if constexpr (std::is_same_v<T, PausedEvent>) {
            return "Paused";
        } else if constexpr (std::is_same_v<T, UnpausedEvent>) {
            return "Unpaused";
        } else if constexpr (std::is_same_v<T, TokenApprovedEvent>) {
            return "TokenApproved";
        } else if constexpr (std::is_same_v<T, TokenBlacklistedEvent>) {
            return "TokenBlacklisted";
        } else {
            return "ThresholdsUpdated";
        }
    }, event);
}

EventBus::EventBus(size_t history_limit)
    : history_limit_(history_limit) {}

void EventBus::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(subscriber));
}

void EventBus::push_event(Event event) {
    log_event(event);

    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(event);
        while (history_.size() > history_limit_) {
            history_.pop_front();
        }
        subscribers = subscribers_;
    }

    // Observers must not be able to break the emitting operation
    for (const auto& subscriber : subscribers) {
        try {
            subscriber(event);
        } catch (const std::exception& e) {
            ARBX_LOG_ERROR("Event subscriber failed on {}: {}", event_name(event), e.what());
        }
    }
}

std::vector<Event> EventBus::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Event>(history_.begin(), history_.end());
}

void EventBus::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

void EventBus::log_event(const Event& event) const {
    std::visit([](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ArbitrageExecutedEvent>) {
            ARBX_LOG_INFO("Event ArbitrageExecuted profit={} strategy={} attempt={}",
                          arg.profit, arg.strategy, arg.attempt_id);
        } else if constexpr (std::is_same_v<T, ArbitrageFailedEvent>) {
            ARBX_LOG_WARN("Event ArbitrageFailed reason='{}' attempt={}", arg.reason, arg.attempt_id);
        } else if constexpr (std::is_same_v<T, SuperProfitConvertedEvent>) {
            ARBX_LOG_INFO("Event SuperProfitConverted amount={} attempt={}", arg.amount, arg.attempt_id);
        } else if constexpr (std::is_same_v<T, PausedEvent>) {
            ARBX_LOG_WARN("Event Paused");
        } else if constexpr (std::is_same_v<T, UnpausedEvent>) {
            ARBX_LOG_INFO("Event Unpaused");
        } else if constexpr (std::is_same_v<T, TokenApprovedEvent>) {
            ARBX_LOG_INFO("Event TokenApproved {}", arg.token);
        } else if constexpr (std::is_same_v<T, TokenBlacklistedEvent>) {
            ARBX_LOG_WARN("Event TokenBlacklisted {}", arg.token);
        } else if constexpr (std::is_same_v<T, ThresholdsUpdatedEvent>) {
            ARBX_LOG_INFO("Event ThresholdsUpdated {}", nlohmann::json(arg.config).dump());
        }
    }, event);
}

} // namespace arbx
