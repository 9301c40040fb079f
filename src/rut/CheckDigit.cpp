#include "CheckDigit.hpp"
#include "RutErrors.hpp"

#include <string>

namespace rut
{

char computeCheckDigit(RutNumber number)
{
    if (number < 0)
    {
        throw InvalidInput("Cannot compute the verification digit of the negative number " +
                           std::to_string(number) + ".");
    }

    // Digits are consumed least significant first with weights 9,8,7,6,5,4
    // repeating. The sum starts at 1 so that s - 1 is the digit to emit.
    int s = 1;
    for (int m = 0; number != 0; number /= 10, ++m)
    {
        s = (s + static_cast<int>(number % 10) * (9 - m % 6)) % 11;
    }

    return s != 0 ? static_cast<char>('0' + s - 1) : 'K';
}

bool isCheckDigitChar(char c) noexcept
{
    return (c >= '0' && c <= '9') || c == 'K';
}

} // namespace rut
