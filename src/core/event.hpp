#pragma once

#include <string>
#include <variant>
#include "types.hpp"

namespace arbx {

struct ArbitrageExecutedEvent {
    double profit;
    std::string strategy;
    std::string attempt_id;
};

struct ArbitrageFailedEvent {
    std::string reason;
    std::string attempt_id;
};

struct SuperProfitConvertedEvent {
    double amount;
    std::string attempt_id;
};

struct PausedEvent {};

struct UnpausedEvent {};

struct TokenApprovedEvent {
    Address token;
};

struct TokenBlacklistedEvent {
    Address token;
};

struct ThresholdsUpdatedEvent {
    RiskConfig config;
};

using Event = std::variant<ArbitrageExecutedEvent, ArbitrageFailedEvent, SuperProfitConvertedEvent,
                           PausedEvent, UnpausedEvent, TokenApprovedEvent, TokenBlacklistedEvent,
                           ThresholdsUpdatedEvent>;

const char* event_name(const Event& event);

} // namespace arbx
