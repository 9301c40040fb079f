#pragma once

#include "RutTypes.hpp"

#include <string>

namespace rut
{

// Checks, in order, that the identifier decomposes, that its numeric part lies
// within limits, that the check digit is 0-9 or K, and that it matches the
// computed one. Throws the matching RutError subclass on the first failure.
void validate(const std::string& text, const Limits& limits = kDefaultLimits);

// Range, check digit shape and checksum checks on already decomposed parts
void validate(const RutParts& parts, const Limits& limits = kDefaultLimits);

// Same checks without throwing. On failure outError receives the message the
// throwing path would carry.
bool tryValidate(const std::string& text, std::string& outError, const Limits& limits = kDefaultLimits);

[[nodiscard]] bool isValid(const std::string& text, const Limits& limits = kDefaultLimits);

} // namespace rut
