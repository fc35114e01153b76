#pragma once

#include "event.hpp"

namespace arbx {

class EventPusher {
public:
    virtual ~EventPusher() = default;
    virtual void push_event(Event event) = 0;
};

} // namespace arbx
