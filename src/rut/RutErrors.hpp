#pragma once

#include "RutTypes.hpp"

#include <stdexcept>
#include <string>

namespace rut
{

enum class ErrorKind
{
    InvalidInput,            // empty, non-numeric or negative input
    BelowMinimum,            // numeric part below Limits::minimum
    AboveMaximum,            // numeric part above Limits::maximum
    InvalidCheckDigitFormat, // check digit is not 0-9 or K
    ChecksumMismatch         // check digit does not match the computed one
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

// Base of every error raised by the rut library
class RutError : public std::runtime_error
{
public:
    RutError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Input that cannot be decomposed into a number and a check digit
class InvalidInput : public RutError
{
public:
    explicit InvalidInput(const std::string& message);
};

// Base of the failures reported by validate()
class ValidationError : public RutError
{
public:
    using RutError::RutError;
};

class OutOfRange : public ValidationError
{
public:
    RutNumber value() const noexcept { return value_; }

    RutNumber minimum() const noexcept { return limits_.minimum; }

    RutNumber maximum() const noexcept { return limits_.maximum; }

protected:
    OutOfRange(ErrorKind kind, const std::string& message, RutNumber value, const Limits& limits);

private:
    RutNumber value_;
    Limits limits_;
};

class BelowMinimum : public OutOfRange
{
public:
    BelowMinimum(RutNumber value, const Limits& limits);
};

class AboveMaximum : public OutOfRange
{
public:
    AboveMaximum(RutNumber value, const Limits& limits);
};

class InvalidCheckDigitFormat : public ValidationError
{
public:
    explicit InvalidCheckDigitFormat(char found);

    char found() const noexcept { return found_; }

private:
    char found_;
};

class ChecksumMismatch : public ValidationError
{
public:
    // groupedRut is the identifier as supplied, rendered in grouped form
    ChecksumMismatch(const std::string& groupedRut, char found, RutNumber number, char expected);

    char found() const noexcept { return found_; }

    char expected() const noexcept { return expected_; }

    RutNumber number() const noexcept { return number_; }

private:
    char found_;
    RutNumber number_;
    char expected_;
};

} // namespace rut
