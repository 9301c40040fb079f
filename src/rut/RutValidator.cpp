#include "RutValidator.hpp"
#include "CheckDigit.hpp"
#include "RutErrors.hpp"
#include "RutFormatter.hpp"
#include "RutNormalizer.hpp"

namespace rut
{

void validate(const std::string& text, const Limits& limits)
{
    validate(decompose(text), limits);
}

void validate(const RutParts& parts, const Limits& limits)
{
    if (parts.number < limits.minimum)
    {
        throw BelowMinimum(parts.number, limits);
    }

    if (parts.number > limits.maximum)
    {
        throw AboveMaximum(parts.number, limits);
    }

    if (!isCheckDigitChar(parts.checkDigit))
    {
        throw InvalidCheckDigitFormat(parts.checkDigit);
    }

    const char expected = computeCheckDigit(parts.number);
    if (parts.checkDigit != expected)
    {
        const std::string grouped = addThousandsSeparator(parts.number) + '-' + parts.checkDigit;
        throw ChecksumMismatch(grouped, parts.checkDigit, parts.number, expected);
    }
}

bool tryValidate(const std::string& text, std::string& outError, const Limits& limits)
{
    try
    {
        validate(text, limits);
        return true;
    }
    catch (const RutError& e)
    {
        outError = e.what();
        return false;
    }
}

bool isValid(const std::string& text, const Limits& limits)
{
    std::string ignored;
    return tryValidate(text, ignored, limits);
}

} // namespace rut
