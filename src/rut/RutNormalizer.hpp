#pragma once

#include "RutTypes.hpp"

#include <string>

namespace rut
{

// Trims surrounding whitespace and removes every '.', ',' and '-'.
// "12.345.678-K" -> "12345678K"
[[nodiscard]] std::string normalize(const std::string& text);

// Splits an identifier (dots, commas and dash optional) into its numeric part
// and its uppercased check digit. The check digit is not validated and leading
// zeros of the numeric part are lost.
// Throws InvalidInput when nothing usable remains after normalization, when
// the numeric part is missing, is not made of digits, or overflows RutNumber.
[[nodiscard]] RutParts decompose(const std::string& text);

// Reads a bare numeric part (no check digit): "12.345.678" -> 12345678.
// Throws InvalidInput for empty, non-numeric or overflowing input.
[[nodiscard]] RutNumber parseNumber(const std::string& text);

// Numeric part of an identifier that carries a check digit
[[nodiscard]] RutNumber removeCheckDigit(const std::string& text);

} // namespace rut
