#include <catch2/catch_test_macros.hpp>
#include "checkkit/extended_data.hpp"

using checkkit::ExtendedData;

TEST_CASE("ExtendedData joins lines", "[extdata]") {
    ExtendedData extdata;

    SECTION("Nothing added") {
        REQUIRE(extdata.empty());
        REQUIRE(extdata.render() == "");
    }

    SECTION("Two lines") {
        extdata.add("x");
        extdata.add("y");
        REQUIRE(extdata.render() == "x\ny");
    }

    SECTION("Duplicates and empty lines are kept") {
        extdata.add("x");
        extdata.add("");
        extdata.add("x");
        REQUIRE(extdata.lines().size() == 3);
        REQUIRE(extdata.render() == "x\n\nx");
    }

    SECTION("Render is repeatable") {
        extdata.add("only");
        REQUIRE(extdata.render() == "only");
        REQUIRE(extdata.render() == "only");
    }
}

TEST_CASE("ExtendedData accepts lines through LineSink", "[extdata]") {
    ExtendedData extdata;
    checkkit::LineSink& sink = extdata;

    sink.ingest("[INFO] first");
    extdata.add("second");
    sink.ingest("[ERROR] third");

    REQUIRE(extdata.render() == "[INFO] first\nsecond\n[ERROR] third");
}
