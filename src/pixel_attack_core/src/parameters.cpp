#include "pixel_attack_core/parameters.hpp"
#include <limits>
#include <stdexcept>

std::size_t checked_size(const std::string& name, int64_t value, int64_t min_value)
{
    if (value < min_value) {
        throw std::invalid_argument("parameter '" + name + "' must be >= " +
                                    std::to_string(min_value) + ", got " + std::to_string(value));
    }
    if (static_cast<uint64_t>(value) > std::numeric_limits<std::size_t>::max()) {
        throw std::invalid_argument("parameter '" + name + "' is too large: " + std::to_string(value));
    }
    return static_cast<std::size_t>(value);
}
