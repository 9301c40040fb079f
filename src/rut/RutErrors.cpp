#include "RutErrors.hpp"
#include "RutFormatter.hpp"

namespace rut
{

namespace
{

std::string rangeSuffix(const Limits& limits)
{
    return " Valid range is " + addThousandsSeparator(limits.minimum) + " to " +
           addThousandsSeparator(limits.maximum) + ".";
}

} // namespace

const char* toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::InvalidInput:
        return "InvalidInput";
    case ErrorKind::BelowMinimum:
        return "BelowMinimum";
    case ErrorKind::AboveMaximum:
        return "AboveMaximum";
    case ErrorKind::InvalidCheckDigitFormat:
        return "InvalidCheckDigitFormat";
    case ErrorKind::ChecksumMismatch:
        return "ChecksumMismatch";
    default:
        return "Unknown";
    }
}

RutError::RutError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
{
}

InvalidInput::InvalidInput(const std::string& message)
    : RutError(ErrorKind::InvalidInput, message)
{
}

OutOfRange::OutOfRange(ErrorKind kind, const std::string& message, RutNumber value, const Limits& limits)
    : ValidationError(kind, message)
    , value_(value)
    , limits_(limits)
{
}

BelowMinimum::BelowMinimum(RutNumber value, const Limits& limits)
    : OutOfRange(ErrorKind::BelowMinimum,
                 "The RUT cannot be less than " + addThousandsSeparator(limits.minimum) + " and the value " +
                     addThousandsSeparator(value) + " was found." + rangeSuffix(limits),
                 value, limits)
{
}

AboveMaximum::AboveMaximum(RutNumber value, const Limits& limits)
    : OutOfRange(ErrorKind::AboveMaximum,
                 "The RUT cannot be greater than " + addThousandsSeparator(limits.maximum) + " and the value " +
                     addThousandsSeparator(value) + " was found." + rangeSuffix(limits),
                 value, limits)
{
}

InvalidCheckDigitFormat::InvalidCheckDigitFormat(char found)
    : ValidationError(ErrorKind::InvalidCheckDigitFormat,
                      "The verification digit must be a character between \"0\" and \"9\", or the uppercase "
                      "letter \"K\". The value \"" +
                          std::string(1, found) + "\" was found.")
    , found_(found)
{
}

ChecksumMismatch::ChecksumMismatch(const std::string& groupedRut, char found, RutNumber number, char expected)
    : ValidationError(ErrorKind::ChecksumMismatch,
                      "The verification digit of the RUT " + groupedRut + " is incorrect. The value \"" +
                          std::string(1, found) + "\" was found and for the numeric part " +
                          addThousandsSeparator(number) + " of the RUT, the verification digit should be \"" +
                          std::string(1, expected) + "\".")
    , found_(found)
    , number_(number)
    , expected_(expected)
{
}

} // namespace rut
