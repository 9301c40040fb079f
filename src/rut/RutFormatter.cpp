#include "RutFormatter.hpp"
#include "CheckDigit.hpp"
#include "RutNormalizer.hpp"

namespace rut
{

std::string format(const std::string& text)
{
    const RutParts parts = decompose(text);
    return std::to_string(parts.number) + '-' + parts.checkDigit;
}

std::string format(RutNumber number)
{
    return format(appendCheckDigit(number));
}

std::string formatGrouped(const std::string& text)
{
    const RutParts parts = decompose(format(text));
    return addThousandsSeparator(parts.number) + '-' + parts.checkDigit;
}

std::string formatGrouped(RutNumber number)
{
    const RutParts parts = decompose(format(number));
    return addThousandsSeparator(parts.number) + '-' + parts.checkDigit;
}

std::string appendCheckDigit(RutNumber number)
{
    const char dv = computeCheckDigit(number);
    return std::to_string(number) + dv;
}

std::string addThousandsSeparator(RutNumber number)
{
    std::string digits = std::to_string(number);
    std::string sign;
    if (!digits.empty() && digits.front() == '-')
    {
        sign = "-";
        digits.erase(0, 1);
    }

    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    const std::size_t lead = digits.size() % 3 == 0 ? 3 : digits.size() % 3;
    out.append(digits, 0, lead);
    for (std::size_t i = lead; i < digits.size(); i += 3)
    {
        out.push_back('.');
        out.append(digits, i, 3);
    }

    return sign + out;
}

} // namespace rut
