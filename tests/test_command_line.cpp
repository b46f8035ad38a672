#include <catch2/catch_test_macros.hpp>

#include "controller/CommandLine.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using blockfall::controller::parseCommandLine;
using blockfall::controller::usage;

TEST_CASE("No flags gives the default configuration", "[cli]") {
    const auto options = parseCommandLine(std::vector<std::string>{});

    CHECK_FALSE(options.showHelp);
    CHECK(options.config.rows == 20);
    CHECK(options.config.cols == 10);
    CHECK(options.config.lockDelaySeconds == 0.5);
    CHECK(options.config.dropIntervalSeconds == 0.5);
    CHECK(options.config.spawn.row == 0);
    CHECK(options.config.spawn.col == 3);
    CHECK_FALSE(options.config.seed.has_value());
}

TEST_CASE("All flags are parsed into the configuration", "[cli]") {
    const auto options = parseCommandLine(std::vector<std::string>{
        "--rows", "24", "--cols", "12", "--lock-delay", "0.75",
        "--drop-interval", "0.25", "--seed", "1234"});

    CHECK(options.config.rows == 24);
    CHECK(options.config.cols == 12);
    CHECK(options.config.lockDelaySeconds == 0.75);
    CHECK(options.config.dropIntervalSeconds == 0.25);
    REQUIRE(options.config.seed.has_value());
    CHECK(*options.config.seed == 1234u);
}

TEST_CASE("--help is reported to the caller", "[cli]") {
    const auto options = parseCommandLine(std::vector<std::string>{"--help"});
    REQUIRE(options.showHelp);
    REQUIRE(usage("blockfall").find("--drop-interval") != std::string::npos);
}

TEST_CASE("Narrow boards move the spawn column inside the grid", "[cli]") {
    const auto options = parseCommandLine(std::vector<std::string>{"--cols", "3"});
    REQUIRE(options.config.spawn.col == 1);
}

TEST_CASE("Bad command lines are rejected", "[cli]") {
    using Args = std::vector<std::string>;

    REQUIRE_THROWS_AS(parseCommandLine(Args{"--speed", "3"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--rows"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--rows", "ten"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--rows", "10x"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--rows", "0"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--lock-delay", "-1"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--drop-interval", "0"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--rows", "100000", "--cols", "100000"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--drop-interval", "1e12"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--lock-delay", "1e300"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--seed", "-4"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--seed", "99999999999"}), std::invalid_argument);
}
