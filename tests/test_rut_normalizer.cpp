#include <catch2/catch_test_macros.hpp>

#include "rut/RutErrors.hpp"
#include "rut/RutNormalizer.hpp"

using namespace rut;

TEST_CASE("Normalizer - Separator removal", "[rut][normalizer]")
{
    REQUIRE(normalize("12.345.678-K") == "12345678K");
    REQUIRE(normalize("12,345,678-k") == "12345678k");
    REQUIRE(normalize("12345678K") == "12345678K");
    REQUIRE(normalize("  9.876.543-3\t") == "98765433");
    REQUIRE(normalize("-.,") == "");
    REQUIRE(normalize("") == "");
}

// decompose() splits without validating: 12.345.678-K carries a wrong check
// digit and still decomposes.
TEST_CASE("Normalizer - Decompose accepted shapes", "[rut][normalizer]")
{
    REQUIRE(decompose("12.345.678-K") == RutParts{ 12345678, 'K' });
    REQUIRE(decompose("12345678-K") == RutParts{ 12345678, 'K' });
    REQUIRE(decompose("12345678K") == RutParts{ 12345678, 'K' });
    REQUIRE(decompose("12,345,678-K") == RutParts{ 12345678, 'K' });
    REQUIRE(decompose("9876543-5") == RutParts{ 9876543, '5' });

    SECTION("Check digit is uppercased")
    {
        REQUIRE(decompose("1.000.005-k").checkDigit == 'K');
    }

    SECTION("Surrounding whitespace is ignored")
    {
        REQUIRE(decompose("  12.345.678-5  ") == RutParts{ 12345678, '5' });
    }
}

TEST_CASE("Normalizer - Decompose is permissive about content", "[rut][normalizer]")
{
    SECTION("Leading zeros are lost")
    {
        REQUIRE(decompose("0123-4") == RutParts{ 123, '4' });
    }

    SECTION("Any trailing character is taken as check digit")
    {
        REQUIRE(decompose("12345678-?") == RutParts{ 12345678, '?' });
    }

    SECTION("Out of range numbers decompose")
    {
        REQUIRE(decompose("999.999-9") == RutParts{ 999999, '9' });
        REQUIRE(decompose("100.000.000-0") == RutParts{ 100000000, '0' });
    }
}

TEST_CASE("Normalizer - Decompose rejects malformed input", "[rut][normalizer]")
{
    REQUIRE_THROWS_AS(decompose(""), InvalidInput);
    REQUIRE_THROWS_AS(decompose("   "), InvalidInput);
    REQUIRE_THROWS_AS(decompose(".-,"), InvalidInput);
    REQUIRE_THROWS_AS(decompose("K"), InvalidInput);
    REQUIRE_THROWS_AS(decompose("-5"), InvalidInput);
    REQUIRE_THROWS_AS(decompose("12a45-6"), InvalidInput);
    REQUIRE_THROWS_AS(decompose("12 345 678-5"), InvalidInput);
    REQUIRE_THROWS_AS(decompose("99999999999999999999-1"), InvalidInput);

    REQUIRE_THROWS_WITH(decompose(""), "The RUT is empty.");
    REQUIRE_THROWS_WITH(decompose("12a45-6"), "The numeric part of the RUT \"12a45-6\" must contain only digits.");
}

TEST_CASE("Normalizer - InvalidInput is a RutError", "[rut][normalizer]")
{
    try
    {
        (void)decompose("abc");
        FAIL("decompose did not throw");
    }
    catch (const RutError& e)
    {
        REQUIRE(e.kind() == ErrorKind::InvalidInput);
    }
}

TEST_CASE("Normalizer - Remove check digit", "[rut][normalizer]")
{
    REQUIRE(removeCheckDigit("12.345.678-K") == 12345678);
    REQUIRE(removeCheckDigit("9.876.543-5") == 9876543);
    REQUIRE(removeCheckDigit("123456785") == 12345678);
    REQUIRE_THROWS_AS(removeCheckDigit(""), InvalidInput);
}

TEST_CASE("Normalizer - Parse bare number", "[rut][normalizer]")
{
    REQUIRE(parseNumber("12345678") == 12345678);
    REQUIRE(parseNumber("12.345.678") == 12345678);
    REQUIRE(parseNumber(" 9876543 ") == 9876543);
    REQUIRE(parseNumber("0") == 0);

    REQUIRE_THROWS_AS(parseNumber(""), InvalidInput);
    REQUIRE_THROWS_AS(parseNumber("12345678K"), InvalidInput);
    REQUIRE_THROWS_AS(parseNumber("+5"), InvalidInput);
}
