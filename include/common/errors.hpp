#pragma once

#include <stdexcept>
#include <string>

namespace common {

/// @brief Raised when a filter step hits a singular or ill-conditioned matrix.
///
/// Not retried. The caller skips the update for that cycle and keeps the
/// predicted state.
class NumericalError : public std::runtime_error {
public:
    explicit NumericalError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace common
