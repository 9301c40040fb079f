#pragma once

#include <cstdint>

namespace rut
{

// Numeric part of a RUT/RUN, without its check digit
using RutNumber = std::int64_t;

// Result of splitting an identifier into its two parts
struct RutParts
{
    RutNumber number = 0;
    char checkDigit = '0';

    bool operator==(const RutParts& other) const = default;
};

// Range accepted by validate(). Identifiers outside it may exist legally but
// none are in active use.
struct Limits
{
    RutNumber minimum = 1'000'000;
    RutNumber maximum = 99'999'999;
};

inline constexpr Limits kDefaultLimits{};

} // namespace rut
