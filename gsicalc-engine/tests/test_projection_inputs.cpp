#include <catch2/catch.hpp>
#include "projection_inputs.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

using namespace gsicalc;
using Catch::Detail::Approx;

TEST_CASE("ProjectionInputs defaults", "[inputs]") {
    ProjectionInputs in;

    REQUIRE(in.investment == Approx(1000000.0));
    REQUIRE(in.current_spot == Approx(563.22));
    REQUIRE(in.spx_price_return == Approx(8.0));
    REQUIRE(in.spx_div_yield == Approx(1.3));
    REQUIRE(in.credit_yield == Approx(5.0));
    REQUIRE(in.volatility == Approx(15.0));
    REQUIRE(in.mgmt_fee == Approx(1.5));
    REQUIRE(in.carry_fee == Approx(20.0));
    REQUIRE(in.risk_free_rate == Approx(4.0));
    REQUIRE(in.years == 10);
    REQUIRE(in.steps() == 40);

    REQUIRE_NOTHROW(validate_inputs(in));
}

TEST_CASE("to_fields lists every input", "[inputs]") {
    ProjectionInputs in;
    auto fields = in.to_fields();

    REQUIRE(fields.size() == 10);
    REQUIRE(fields.at("years") == "10");
    REQUIRE(fields.at("investment") == "1e+06");
    REQUIRE(fields.count("risk_free_rate") == 1);
}

TEST_CASE("validate_inputs rejects out-of-domain values", "[inputs]") {
    ProjectionInputs in;

    SECTION("Investment") {
        in.investment = 0.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
        in.investment = -1.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
        in.investment = std::nan("");
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }

    SECTION("Spot") {
        in.current_spot = 0.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }

    SECTION("Price return at -100%") {
        in.spx_price_return = -100.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }

    SECTION("Index growth base must stay positive") {
        in.spx_price_return = -99.0;
        in.spx_div_yield = -5.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }

    SECTION("Private equity growth base must stay positive") {
        // Index net is about -0.85, PE net about -1.04
        in.spx_price_return = -85.0;
        in.spx_div_yield = 0.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }

    SECTION("Credit yield") {
        in.credit_yield = -100.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }

    SECTION("Volatility") {
        in.volatility = -1.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }

    SECTION("Management fee") {
        in.mgmt_fee = -0.5;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
        in.mgmt_fee = 100.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }

    SECTION("Carry fee") {
        in.carry_fee = -1.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
        in.carry_fee = 101.0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }

    SECTION("Years") {
        in.years = 0;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
        in.years = ProjectionInputs::MAX_YEARS + 1;
        REQUIRE_THROWS_AS(validate_inputs(in), ValidationError);
    }
}

TEST_CASE("validate_inputs accepts boundary values", "[inputs]") {
    ProjectionInputs in;
    in.volatility = 0.0;
    in.mgmt_fee = 0.0;
    in.carry_fee = 100.0;
    in.credit_yield = -50.0;
    in.spx_price_return = -20.0;
    in.risk_free_rate = -1.0;
    in.years = 1;
    REQUIRE_NOTHROW(validate_inputs(in));

    in.years = ProjectionInputs::MAX_YEARS;
    REQUIRE_NOTHROW(validate_inputs(in));
}

TEST_CASE("Validation message names the field", "[inputs]") {
    ProjectionInputs in;
    in.years = 0;
    try {
        validate_inputs(in);
        FAIL("Expected ValidationError");
    } catch (const ValidationError& e) {
        std::string message = e.what();
        REQUIRE(message.find("years") != std::string::npos);
        REQUIRE(message.find("[1, 100]") != std::string::npos);
    }
}

TEST_CASE("years_from_double accepts whole numbers only", "[inputs]") {
    REQUIRE(years_from_double(10.0) == 10);
    REQUIRE(years_from_double(1.0) == 1);
    REQUIRE(years_from_double(100.0) == 100);

    REQUIRE_THROWS_AS(years_from_double(10.5), ValidationError);
    REQUIRE_THROWS_AS(years_from_double(0.0), ValidationError);
    REQUIRE_THROWS_AS(years_from_double(-3.0), ValidationError);
    REQUIRE_THROWS_AS(years_from_double(101.0), ValidationError);
    REQUIRE_THROWS_AS(years_from_double(std::nan("")), ValidationError);
}
