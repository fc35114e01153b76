#pragma once

#include <stdexcept>
#include <string>

namespace arbx {

// Raised by venue adapters when a call reverts or cannot be served
class VenueException : public std::runtime_error {
public:
    explicit VenueException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace arbx
