#include <catch2/catch_test_macros.hpp>
#include "../src/number_format.hpp"

TEST_CASE("Number formatting", "[format]") {
    SECTION("Ordinary magnitudes use six fixed decimals") {
        REQUIRE(format_number(1.5) == "1.500000");
        REQUIRE(format_number(123.4567891) == "123.456789");
        REQUIRE(format_number(-0.81) == "-0.810000");
        REQUIRE(format_number(999999.5) == "999999.500000");
    }
    
    SECTION("Zero is fixed point and keeps its sign") {
        REQUIRE(format_number(0.0) == "0.000000");
        REQUIRE(format_number(-0.0) == "-0.000000");
    }
    
    SECTION("Tiny magnitudes switch to scientific") {
        REQUIRE(format_number(0.00001234) == "1.234000e-5");
        REQUIRE(format_number(-0.00005) == "-5.000000e-5");
        REQUIRE(format_number(-2.5e-7) == "-2.500000e-7");
        REQUIRE(format_number(1e-100) == "1.000000e-100");
    }
    
    SECTION("Threshold 1e-4 itself stays fixed") {
        REQUIRE(format_number(0.0001) == "0.000100");
    }
    
    SECTION("Large magnitudes use four scientific decimals") {
        REQUIRE(format_number(1000000.0) == "1.0000e6");
        REQUIRE(format_number(-2500000.0) == "-2.5000e6");
        REQUIRE(format_number(123456789.0) == "1.2346e8");
        REQUIRE(format_number(3.5e120) == "3.5000e120");
    }
}
