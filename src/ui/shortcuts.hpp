/// @file shortcuts.hpp
/// @brief Number-row shortcuts for the action panel.

#pragma once

#include <cstddef>
#include <optional>

namespace statgauge {

/// Action index for a number-row digit: 1-9 select the first nine actions
/// and 0 selects the tenth, as on the keyboard. Empty when the digit is out
/// of range or there are not enough actions.
std::optional<size_t> action_for_digit(int digit, size_t action_count);

} // namespace statgauge
