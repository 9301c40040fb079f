#pragma once

#include "RutTypes.hpp"

namespace rut
{

// Modulo-11 check digit for the numeric part of a RUT. Returns '0'-'9' or 'K'.
// Throws InvalidInput for negative numbers.
[[nodiscard]] char computeCheckDigit(RutNumber number);

// True for the characters a check digit may take ('0'-'9' and uppercase 'K')
[[nodiscard]] bool isCheckDigitChar(char c) noexcept;

} // namespace rut
