#include "Rut.hpp"
#include "CheckDigit.hpp"
#include "RutErrors.hpp"
#include "RutFormatter.hpp"
#include "RutNormalizer.hpp"
#include "RutValidator.hpp"

#include <cctype>

namespace rut
{

Rut::Rut() : number_(0), check_digit_('0')
{
}

Rut::Rut(const std::string& text) : number_(0), check_digit_('0')
{
    const RutParts parts = decompose(text);
    number_ = parts.number;
    check_digit_ = parts.checkDigit;
}

Rut::Rut(RutNumber number, char checkDigit)
    : number_(number)
    , check_digit_(static_cast<char>(std::toupper(static_cast<unsigned char>(checkDigit))))
{
    if (number_ < 0)
    {
        throw InvalidInput("The numeric part of a RUT cannot be negative (" + std::to_string(number_) + ").");
    }
}

Rut Rut::fromNumber(RutNumber number)
{
    return Rut(number, computeCheckDigit(number));
}

bool Rut::tryParse(const std::string& text, Rut& outRut)
{
    try
    {
        outRut = Rut(text);
        return true;
    }
    catch (const InvalidInput&)
    {
        return false;
    }
}

std::string Rut::toString() const
{
    return std::to_string(number_) + '-' + check_digit_;
}

std::string Rut::toGroupedString() const
{
    return addThousandsSeparator(number_) + '-' + check_digit_;
}

bool Rut::hasValidCheckDigit() const
{
    return check_digit_ == computeCheckDigit(number_);
}

void Rut::validate(const Limits& limits) const
{
    rut::validate(RutParts{ number_, check_digit_ }, limits);
}

} // namespace rut
