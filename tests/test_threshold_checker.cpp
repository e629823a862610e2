#include <catch2/catch_test_macros.hpp>
#include "checkkit/threshold_checker.hpp"

using checkkit::Status;
using checkkit::ThresholdRange;
using checkkit::check_threshold;
using checkkit::check_threshold_text;

TEST_CASE("check_threshold classifies a percentage", "[checker]") {
    auto warning = ThresholdRange::parse(":90");
    auto critical = ThresholdRange::parse(":95");

    SECTION("Normal usage is OK") {
        REQUIRE(check_threshold(56, warning, critical) == Status::Ok);
    }

    SECTION("Warning threshold triggers warning") {
        REQUIRE(check_threshold(93, warning, critical) == Status::Warning);
    }

    SECTION("Critical threshold triggers critical") {
        REQUIRE(check_threshold(97, warning, critical) == Status::Critical);
    }

    SECTION("Boundaries belong to the range") {
        REQUIRE(check_threshold(90, warning, critical) == Status::Ok);
        REQUIRE(check_threshold(95, warning, critical) == Status::Warning);
    }
}

TEST_CASE("check_threshold tests critical before warning", "[checker]") {
    // A value alarming both thresholds is critical even when the
    // warning range is the narrower one
    auto warning = ThresholdRange::parse("50:60");
    auto critical = ThresholdRange::parse("0:10");

    REQUIRE(check_threshold(55, warning, critical) == Status::Critical);
    REQUIRE(check_threshold(5, warning, critical) == Status::Warning);
}

TEST_CASE("check_threshold with missing thresholds", "[checker]") {
    REQUIRE(check_threshold(1e9) == Status::Ok);
    REQUIRE(check_threshold(15, ThresholdRange::parse("10")) == Status::Warning);
    REQUIRE(check_threshold(15, std::nullopt, ThresholdRange::parse("10")) == Status::Critical);
    REQUIRE(check_threshold(5, std::nullopt, ThresholdRange::parse("10")) == Status::Ok);
}

TEST_CASE("check_threshold with inverted thresholds", "[checker]") {
    auto warning = ThresholdRange::parse("@10:20");
    auto critical = ThresholdRange::parse("@~:5");

    REQUIRE(check_threshold(15, warning, critical) == Status::Warning);
    REQUIRE(check_threshold(3, warning, critical) == Status::Critical);
    REQUIRE(check_threshold(7, warning, critical) == Status::Ok);
}

TEST_CASE("check_threshold_text parses expressions", "[checker]") {
    REQUIRE(check_threshold_text(15, std::string("10:20"), std::string("0:40")) == Status::Ok);
    REQUIRE(check_threshold_text(25, std::string("10:20"), std::string("0:40")) == Status::Warning);
    REQUIRE(check_threshold_text(45, std::string("10:20"), std::string("0:40")) == Status::Critical);
    REQUIRE(check_threshold_text(45, std::nullopt, std::nullopt) == Status::Ok);

    REQUIRE_THROWS_AS(check_threshold_text(1, std::string("10:2"), std::nullopt),
                      checkkit::InvalidThresholdFormat);
    REQUIRE_THROWS_AS(check_threshold_text(1, std::nullopt, std::string("oops")),
                      checkkit::InvalidThresholdFormat);
}
