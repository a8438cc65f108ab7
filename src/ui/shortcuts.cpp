/// @file shortcuts.cpp
/// @brief Implements number-row shortcut mapping

#include "ui/shortcuts.hpp"

namespace statgauge {

namespace {

constexpr size_t ZERO_KEY_INDEX = 9;

} // namespace

std::optional<size_t> action_for_digit(int digit, size_t action_count) {
    if (digit < 0 || digit > 9) {
        return std::nullopt;
    }
    size_t index = digit == 0 ? ZERO_KEY_INDEX : static_cast<size_t>(digit - 1);
    if (index >= action_count) {
        return std::nullopt;
    }
    return index;
}

} // namespace statgauge
