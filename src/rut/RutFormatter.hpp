#pragma once

#include "RutTypes.hpp"

#include <string>

namespace rut
{

// Compact form "12345678-5".
// A string is expected to carry its check digit, which is kept as found.
// A number is the numeric part only; its check digit is computed.
[[nodiscard]] std::string format(const std::string& text);
[[nodiscard]] std::string format(RutNumber number);

// Grouped form "12.345.678-5", same input rules as format()
[[nodiscard]] std::string formatGrouped(const std::string& text);
[[nodiscard]] std::string formatGrouped(RutNumber number);

// Number followed by its computed check digit, no separators: 12345678 -> "123456785"
[[nodiscard]] std::string appendCheckDigit(RutNumber number);

// Groups digits in threes from the right with '.': 12345678 -> "12.345.678"
[[nodiscard]] std::string addThousandsSeparator(RutNumber number);

} // namespace rut
