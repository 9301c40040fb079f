#include "RutNormalizer.hpp"
#include "RutErrors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <system_error>

namespace rut
{

namespace
{

bool isSeparator(char c)
{
    return c == '.' || c == ',' || c == '-';
}

bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

RutNumber parseNumericPart(const std::string& digits, const std::string& input)
{
    if (digits.empty())
    {
        throw InvalidInput("The RUT \"" + input + "\" has no numeric part.");
    }

    const bool allDigits = std::all_of(digits.begin(), digits.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (!allDigits)
    {
        throw InvalidInput("The numeric part of the RUT \"" + input + "\" must contain only digits.");
    }

    RutNumber value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range)
    {
        throw InvalidInput("The numeric part of the RUT \"" + input + "\" is too large.");
    }
    if (ec != std::errc() || ptr != digits.data() + digits.size())
    {
        throw InvalidInput("The numeric part of the RUT \"" + input + "\" could not be read.");
    }

    return value;
}

} // namespace

std::string normalize(const std::string& text)
{
    auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();

    std::string out;
    if (first >= last)
        return out;

    out.reserve(static_cast<std::size_t>(last - first));
    std::copy_if(first, last, std::back_inserter(out), [](char c) { return !isSeparator(c); });
    return out;
}

RutParts decompose(const std::string& text)
{
    const std::string cleaned = normalize(text);
    if (cleaned.empty())
    {
        throw InvalidInput("The RUT is empty.");
    }

    RutParts parts;
    parts.checkDigit = static_cast<char>(std::toupper(static_cast<unsigned char>(cleaned.back())));
    parts.number = parseNumericPart(cleaned.substr(0, cleaned.size() - 1), text);
    return parts;
}

RutNumber parseNumber(const std::string& text)
{
    const std::string cleaned = normalize(text);
    if (cleaned.empty())
    {
        throw InvalidInput("The number is empty.");
    }
    return parseNumericPart(cleaned, text);
}

RutNumber removeCheckDigit(const std::string& text)
{
    return decompose(text).number;
}

} // namespace rut
