#include <catch2/catch_test_macros.hpp>
#include "checkkit/result_set.hpp"
#include "checkkit/status.hpp"

using checkkit::ResultSet;
using checkkit::Status;

TEST_CASE("Status names and exit codes", "[status]") {
    REQUIRE(checkkit::exit_code(Status::Ok) == 0);
    REQUIRE(checkkit::exit_code(Status::Warning) == 1);
    REQUIRE(checkkit::exit_code(Status::Critical) == 2);
    REQUIRE(checkkit::exit_code(Status::Unknown) == 3);

    REQUIRE(checkkit::to_string(Status::Ok) == "OK");
    REQUIRE(checkkit::to_string(Status::Warning) == "WARNING");
    REQUIRE(checkkit::to_string(Status::Critical) == "CRITICAL");
    REQUIRE(checkkit::to_string(Status::Unknown) == "UNKNOWN");

    REQUIRE(checkkit::status_from_string("critical") == Status::Critical);
    REQUIRE(checkkit::status_from_string("3") == Status::Unknown);
    REQUIRE_FALSE(checkkit::status_from_string("fatal").has_value());
}

TEST_CASE("ResultSet with no results is UNKNOWN", "[results]") {
    ResultSet results;
    REQUIRE(results.empty());
    REQUIRE(results.code() == Status::Unknown);
    REQUIRE(results.message().empty());
}

TEST_CASE("ResultSet reports the worst status", "[results]") {
    ResultSet results;

    SECTION("Critical wins and its message is used") {
        results.add_result(Status::Ok, "a");
        results.add_result(Status::Critical, "b");
        results.add_result(Status::Warning, "c");

        REQUIRE(results.code() == Status::Critical);
        REQUIRE(results.message() == "b");
    }

    SECTION("Only OK results") {
        results.add_result(Status::Ok, "fine");
        results.add_result(Status::Ok, "also fine");

        REQUIRE(results.code() == Status::Ok);
        REQUIRE(results.message() == "fine");
    }

    SECTION("Unknown beats OK") {
        results.add_result(Status::Ok, "fine");
        results.add_result(Status::Unknown, "no data");

        REQUIRE(results.code() == Status::Unknown);
        REQUIRE(results.message() == "no data");
    }

    SECTION("Unknown never masks warning or critical") {
        results.add_result(Status::Unknown, "no data");
        results.add_result(Status::Warning, "slow");
        REQUIRE(results.code() == Status::Warning);

        results.add_result(Status::Critical, "down");
        REQUIRE(results.code() == Status::Critical);
        REQUIRE(results.message() == "down");
    }

    SECTION("Earliest message at the same status wins") {
        results.add_result(Status::Warning, "first");
        results.add_result(Status::Warning, "second");

        REQUIRE(results.message() == "first");
    }
}

TEST_CASE("ResultSet keeps insertion order", "[results]") {
    ResultSet results;
    results.add_result(Status::Critical, "x");
    results.add_result(Status::Ok, "y");
    results.add_result(Status::Critical, "x");

    REQUIRE(results.size() == 3);
    REQUIRE(results.results()[0].message == "x");
    REQUIRE(results.results()[1].status == Status::Ok);
    REQUIRE(results.results()[2].status == Status::Critical);
}

TEST_CASE("ResultSet joins messages by level", "[results]") {
    ResultSet results;
    results.add_result(Status::Ok, "disk ok");
    results.add_result(Status::Critical, "cpu high");
    results.add_result(Status::Warning, "");
    results.add_result(Status::Critical, "load high");
    results.add_result(Status::Unknown, "sensor missing");

    REQUIRE(results.message({Status::Critical}) == "cpu high, load high");
    REQUIRE(results.message({Status::Ok, Status::Warning, Status::Critical}, " / ")
            == "disk ok / cpu high / load high");
    REQUIRE(results.message({Status::Warning}).empty());
}
