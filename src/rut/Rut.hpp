#pragma once

#include "RutTypes.hpp"

#include <compare>
#include <string>

namespace rut
{

// A RUT/RUN as a (number, check digit) pair.
// Holding a Rut does not imply it is valid; see hasValidCheckDigit() and validate().
class Rut
{
public:
    // 0-0
    Rut();

    // Decompose an identifier string (e.g. "12.345.678-5", "12345678K")
    explicit Rut(const std::string& text);

    // Check digit is uppercased, not verified
    Rut(RutNumber number, char checkDigit);

    // Build from the numeric part, computing the check digit
    static Rut fromNumber(RutNumber number);

    // Parse an identifier string (returns true if it decomposes)
    static bool tryParse(const std::string& text, Rut& outRut);

    RutNumber number() const { return number_; }

    char checkDigit() const { return check_digit_; }

    // "12345678-5"
    std::string toString() const;

    // "12.345.678-5"
    std::string toGroupedString() const;

    bool hasValidCheckDigit() const;

    // Throws the same errors as rut::validate
    void validate(const Limits& limits = kDefaultLimits) const;

    auto operator<=>(const Rut& other) const = default;

private:
    RutNumber number_;
    char check_digit_;
};

} // namespace rut
