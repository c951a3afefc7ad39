#include <catch2/catch.hpp>
#include "projection.hpp"
#include "logger.hpp"
#include "errors.hpp"
#include <cmath>

using namespace gsicalc;
using Catch::Detail::Approx;

// ============================================================================
// Helper functions for setting up test data
// ============================================================================

namespace {

// Reference market scenario at the master cost basis of the demo book
ProjectionInputs make_reference_inputs() {
    ProjectionInputs in;
    in.investment = 7289316.47;
    in.current_spot = 563.22;
    in.spx_price_return = 8.0;
    in.spx_div_yield = 1.3;
    in.credit_yield = 5.0;
    in.volatility = 15.0;
    in.mgmt_fee = 1.5;
    in.carry_fee = 20.0;
    in.risk_free_rate = 4.0;
    in.years = 10;
    return in;
}

ProjectionConfig make_config() {
    ProjectionConfig config;
    config.start = PeriodStart(2026, 1);
    config.run_id = "test";
    return config;
}

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    config.enable_file = false;
    Logger::get_instance().configure(config);
}

constexpr double REL = 1e-9;

} // anonymous namespace

// ============================================================================
// Carry waterfall
// ============================================================================

TEST_CASE("apply_carry leaves values alone without profit", "[projection][carry]") {
    CarryAllocation c = apply_carry(400.0, 500.0, 300.0, 1000.0, 20.0);

    REQUIRE(c.credit == 400.0);
    REQUIRE(c.option == 500.0);
    REQUIRE(c.intrinsic == 300.0);
    REQUIRE(c.carry == 0.0);
    REQUIRE_FALSE(c.skipped);

    // Exactly at the investment is not a profit either
    CarryAllocation even = apply_carry(500.0, 500.0, 300.0, 1000.0, 20.0);
    REQUIRE(even.carry == 0.0);
    REQUIRE(even.credit == 500.0);
}

TEST_CASE("apply_carry splits carry pro rata", "[projection][carry]") {
    // Combined 1200, profit 200, carry 40: credit holds 1/4, options 3/4
    CarryAllocation c = apply_carry(300.0, 900.0, 800.0, 1000.0, 20.0);

    REQUIRE(c.carry == Approx(40.0));
    REQUIRE(c.credit == Approx(290.0));
    REQUIRE(c.option == Approx(870.0));
    REQUIRE(c.intrinsic == Approx(770.0));
    REQUIRE_FALSE(c.skipped);

    // Total value falls by exactly the carry
    REQUIRE(c.credit + c.option == Approx(1200.0 - 40.0));
}

TEST_CASE("apply_carry with zero carry fee is neutral", "[projection][carry]") {
    CarryAllocation c = apply_carry(300.0, 900.0, 800.0, 1000.0, 0.0);
    REQUIRE(c.credit == Approx(300.0));
    REQUIRE(c.option == Approx(900.0));
    REQUIRE(c.carry == 0.0);
}

TEST_CASE("apply_carry skips a non-positive combined value", "[projection][carry]") {
    // Profit over a negative base with nothing to pro-rate against
    CarryAllocation c = apply_carry(-10.0, 5.0, 2.0, -20.0, 20.0);

    REQUIRE(c.skipped);
    REQUIRE(c.credit == -10.0);
    REQUIRE(c.option == 5.0);
    REQUIRE(c.intrinsic == 2.0);
    REQUIRE(c.carry == 0.0);
    REQUIRE_FALSE(std::isnan(c.credit));
}

// ============================================================================
// Quarterly step
// ============================================================================

TEST_CASE("project_step matches the reference scenario", "[projection]") {
    ProjectionInputs in = make_reference_inputs();
    ScaledState state = scale_portfolio(ReferencePortfolio::demo(), in.investment);

    SECTION("Quarter 1, below the investment") {
        StepValues s = project_step(in, state, 1);
        REQUIRE(s.credit == Approx(3518824.6870576967).epsilon(REL));
        REQUIRE(s.option == Approx(2532649.9190214174).epsilon(REL));
        REQUIRE(s.intrinsic == Approx(369199.20384361956).epsilon(REL));
        REQUIRE(s.total == Approx(6051474.606079115).epsilon(REL));
        REQUIRE_FALSE(s.carry_skipped);
    }

    SECTION("Quarter 20, carry taken") {
        StepValues s = project_step(in, state, 20);
        REQUIRE(s.credit == Approx(3836570.611709336).epsilon(REL));
        REQUIRE(s.option == Approx(6653530.075905019).epsilon(REL));
        REQUIRE(s.intrinsic == Approx(7794099.330272004).epsilon(REL));
        REQUIRE(s.total == Approx(10490100.687614355).epsilon(REL));
    }

    SECTION("Last quarter prices at intrinsic") {
        StepValues s = project_step(in, state, 40);
        REQUIRE(s.option == Approx(16365674.796352563).epsilon(REL));
        REQUIRE(s.intrinsic == s.option);
        REQUIRE(s.total == Approx(20573006.35574785).epsilon(REL));
    }
}

TEST_CASE("project_step does not depend on evaluation order", "[projection]") {
    ProjectionInputs in = make_reference_inputs();
    ScaledState state = scale_portfolio(ReferencePortfolio::demo(), in.investment);

    StepValues late = project_step(in, state, 30);
    StepValues early = project_step(in, state, 3);
    StepValues late_again = project_step(in, state, 30);

    REQUIRE(late.total == late_again.total);
    REQUIRE(late.credit == late_again.credit);
    REQUIRE(late.option == late_again.option);
    REQUIRE(early.total != late.total);
}

// ============================================================================
// Full projection
// ============================================================================

TEST_CASE("Reference scenario at the master cost basis", "[projection]") {
    quiet_logger();
    ProjectionResult r = run_projection(make_reference_inputs(), ReferencePortfolio::demo(),
                                        make_config());

    REQUIRE(r.steps == 40);
    REQUIRE(r.series.size() == 41);
    REQUIRE(r.series.labels.size() == 41);
    REQUIRE(r.series.bonds.size() == 41);
    REQUIRE(r.carry_skipped_steps.empty());
    REQUIRE(r.execution_time_ms >= 0.0);

    SECTION("Starting point") {
        REQUIRE(r.series.strategy[0] == Approx(6615806.76).epsilon(REL));
        REQUIRE(r.series.credit[0] == Approx(3489323.6).epsilon(REL));
        REQUIRE(r.series.options[0] == Approx(3126483.16).epsilon(REL));
        REQUIRE(r.series.intrinsic[0] == 0.0);
        REQUIRE(r.series.index[0] == Approx(7289316.47));
        REQUIRE(r.series.private_equity[0] == Approx(7289316.47));
        REQUIRE(r.series.bonds[0] == Approx(7289316.47));
    }

    SECTION("Quarter 1") {
        REQUIRE(r.series.strategy[1] == Approx(6051474.606079115).epsilon(REL));
        REQUIRE(r.series.index[1] == Approx(7452672.577785658).epsilon(REL));
        REQUIRE(r.series.private_equity[1] == Approx(7424824.357934948).epsilon(REL));
        REQUIRE(r.series.bonds[1] == Approx(7399765.123515269).epsilon(REL));
    }

    SECTION("Quarter 4") {
        REQUIRE(r.series.strategy[4] == Approx(6595190.940732365).epsilon(REL));
        REQUIRE(r.series.credit[4] == Approx(3608832.9333).epsilon(REL));
        REQUIRE(r.series.options[4] == Approx(2986358.0074323644).epsilon(REL));
        REQUIRE(r.series.intrinsic[4] == Approx(1503253.7800560032).epsilon(REL));
        REQUIRE(r.series.index[4] == Approx(7965036.106769).epsilon(REL));
        REQUIRE(r.series.private_equity[4] == Approx(7850535.52365824).epsilon(REL));
        REQUIRE(r.series.bonds[4] == Approx(7741254.09114).epsilon(REL));
    }

    SECTION("Quarter 20") {
        REQUIRE(r.series.strategy[20] == Approx(10490100.687614355).epsilon(REL));
        REQUIRE(r.series.index[20] == Approx(11355114.587871592).epsilon(REL));
        REQUIRE(r.series.private_equity[20] == Approx(10690059.301919471).epsilon(REL));
        REQUIRE(r.series.bonds[20] == Approx(9847123.60789242).epsilon(REL));
    }

    SECTION("Horizon") {
        REQUIRE(r.series.strategy[40] == Approx(20573006.35574785).epsilon(REL));
        REQUIRE(r.series.credit[40] == Approx(4207331.559395287).epsilon(REL));
        REQUIRE(r.series.options[40] == Approx(16365674.796352563).epsilon(REL));
        REQUIRE(r.series.intrinsic[40] == Approx(16365674.796352563).epsilon(REL));
        REQUIRE(r.series.index[40] == Approx(17688713.041113753).epsilon(REL));
        REQUIRE(r.series.private_equity[40] == Approx(16074021.660739878).epsilon(REL));
        REQUIRE(r.series.bonds[40] == Approx(13302460.353887232).epsilon(REL));
    }

    SECTION("Metrics") {
        const ProjectionMetrics& m = r.metrics;
        REQUIRE(m.initial_notional == Approx(22566148.220000003).epsilon(REL));
        REQUIRE(m.final_value == Approx(20573006.35574785).epsilon(REL));
        REQUIRE(m.moic == Approx(2.8223505510315494).epsilon(REL));
        REQUIRE(m.irr == Approx(10.933086213899657).epsilon(REL));
        REQUIRE(m.index_final == Approx(17688713.041113753).epsilon(REL));
        REQUIRE(m.index_moic == Approx(2.4266627898395736).epsilon(REL));
        REQUIRE(m.index_irr == Approx(9.27).epsilon(REL));
    }

    SECTION("Labels") {
        REQUIRE(r.series.labels[0] == "Jan 26");
        REQUIRE(r.series.labels[1] == "Apr 26");
        REQUIRE(r.series.labels[40] == "Jan 36");
    }
}

TEST_CASE("Projection of a one million investment over five years", "[projection]") {
    quiet_logger();
    ProjectionInputs in = make_reference_inputs();
    in.investment = 1000000.0;
    in.years = 5;

    ProjectionResult r = run_projection(in, ReferencePortfolio::demo(), make_config());

    REQUIRE(r.steps == 20);
    REQUIRE(r.series.size() == 21);

    REQUIRE(r.scaled.ratio == Approx(1000000.0 / 7289316.47).epsilon(REL));
    REQUIRE(r.series.strategy[0] == Approx(907603.173387806).epsilon(REL));
    REQUIRE(r.series.credit[0] == Approx(478690.0958904313).epsilon(REL));
    REQUIRE(r.series.options[0] == Approx(428913.07749737473).epsilon(REL));

    REQUIRE(r.series.strategy[1] == Approx(786833.7416995639).epsilon(REL));
    REQUIRE(r.series.credit[1] == Approx(482737.2637118741).epsilon(REL));
    REQUIRE(r.series.options[1] == Approx(304096.47798768984).epsilon(REL));
    REQUIRE(r.series.intrinsic[1] == Approx(50649.35860078244).epsilon(REL));
    REQUIRE(r.series.index[1] == Approx(1022410.3464924274).epsilon(REL));
    REQUIRE(r.series.private_equity[1] == Approx(1018589.93068728).epsilon(REL));
    REQUIRE(r.series.bonds[1] == Approx(1015152.1276336173).epsilon(REL));

    REQUIRE(r.series.strategy[20] == Approx(1564283.3094209097).epsilon(REL));
    REQUIRE(r.series.credit[20] == Approx(519616.48686644813).epsilon(REL));
    REQUIRE(r.series.options[20] == Approx(1044666.8225544615).epsilon(REL));
    REQUIRE(r.series.intrinsic[20] == Approx(r.series.options[20]).epsilon(REL));
    REQUIRE(r.series.index[20] == Approx(1557774.948392602).epsilon(REL));
    REQUIRE(r.series.private_equity[20] == Approx(1466537.9594802354).epsilon(REL));
    REQUIRE(r.series.bonds[20] == Approx(1350898.0778128323).epsilon(REL));

    REQUIRE(r.metrics.initial_notional == Approx(3095783.852007732).epsilon(REL));
    REQUIRE(r.metrics.moic == Approx(1.5642833094209097).epsilon(REL));
    REQUIRE(r.metrics.irr == Approx(9.361153485309238).epsilon(REL));
    REQUIRE(r.metrics.index_irr == Approx(9.27).epsilon(REL));
}

TEST_CASE("Projection in a falling market", "[projection]") {
    quiet_logger();
    ProjectionInputs in = make_reference_inputs();
    in.spx_price_return = -20.0;
    in.credit_yield = -30.0;
    in.years = 3;

    ProjectionResult r = run_projection(in, ReferencePortfolio::demo(), make_config());

    REQUIRE(r.metrics.moic == Approx(0.15691239584117786).epsilon(REL));
    REQUIRE(r.metrics.irr == Approx(-46.0631286595932).epsilon(REL));
    REQUIRE(r.metrics.index_final == Approx(3912709.3220046894).epsilon(REL));
    REQUIRE(r.metrics.index_irr == Approx(-18.730000000000004).epsilon(REL));

    // Options expire worthless; strategy never goes negative
    for (size_t i = 0; i < r.series.size(); ++i) {
        REQUIRE(r.series.strategy[i] >= 0.0);
        REQUIRE(r.series.options[i] >= 0.0);
    }
    REQUIRE(r.series.options.back() == 0.0);
    REQUIRE(r.carry_skipped_steps.empty());
}

TEST_CASE("Series invariants hold at every step", "[projection]") {
    quiet_logger();
    ProjectionInputs in = make_reference_inputs();
    ProjectionResult r = run_projection(in, ReferencePortfolio::demo(), make_config());

    for (size_t i = 0; i < r.series.size(); ++i) {
        REQUIRE(r.series.strategy[i] == Approx(r.series.credit[i] + r.series.options[i]));
        REQUIRE(r.series.options[i] >= 0.0);
        REQUIRE(r.series.intrinsic[i] >= 0.0);
        REQUIRE(r.series.credit[i] > 0.0);
    }

    // Benchmarks grow monotonically with positive rates
    for (size_t i = 1; i < r.series.size(); ++i) {
        REQUIRE(r.series.index[i] > r.series.index[i - 1]);
        REQUIRE(r.series.private_equity[i] > r.series.private_equity[i - 1]);
        REQUIRE(r.series.bonds[i] > r.series.bonds[i - 1]);
    }
}

TEST_CASE("Zero fees leave gross values", "[projection]") {
    quiet_logger();
    ProjectionInputs in = make_reference_inputs();
    in.mgmt_fee = 0.0;
    in.carry_fee = 0.0;

    ProjectionResult r = run_projection(in, ReferencePortfolio::demo(), make_config());

    // Credit sleeve compounds at the credit yield alone
    REQUIRE(r.series.credit[4] == Approx(3489323.6 * 1.05).epsilon(REL));
    REQUIRE(r.series.credit[40] == Approx(3489323.6 * std::pow(1.05, 10.0)).epsilon(REL));
}

TEST_CASE("Parallel and serial projections agree", "[projection]") {
    quiet_logger();
    ProjectionInputs in = make_reference_inputs();

    ProjectionConfig serial = make_config();
    ProjectionConfig parallel = make_config();
    parallel.parallel_steps = true;

    ProjectionResult a = run_projection(in, ReferencePortfolio::demo(), serial);
    ProjectionResult b = run_projection(in, ReferencePortfolio::demo(), parallel);

    REQUIRE(a.series.size() == b.series.size());
    for (size_t i = 0; i < a.series.size(); ++i) {
        REQUIRE(a.series.strategy[i] == b.series.strategy[i]);
        REQUIRE(a.series.intrinsic[i] == b.series.intrinsic[i]);
        REQUIRE(a.series.private_equity[i] == b.series.private_equity[i]);
        REQUIRE(a.series.labels[i] == b.series.labels[i]);
    }
    REQUIRE(a.metrics.irr == b.metrics.irr);
}

TEST_CASE("Projection validates before computing", "[projection]") {
    quiet_logger();
    ProjectionInputs in;

    SECTION("Bad inputs") {
        in.investment = 0.0;
        REQUIRE_THROWS_AS(run_projection(in, ReferencePortfolio::demo()), ValidationError);
    }

    SECTION("Bad portfolio") {
        ReferencePortfolio no_options({CreditPosition(100.0, 100.0)}, 100.0);
        REQUIRE_THROWS_AS(run_projection(in, no_options), ValidationError);
    }

    SECTION("Bad horizon") {
        in.years = 0;
        REQUIRE_THROWS_AS(run_projection(in, ReferencePortfolio::demo()), ValidationError);
    }
}

TEST_CASE("One year projection has five grid points", "[projection]") {
    quiet_logger();
    ProjectionInputs in;
    in.years = 1;

    ProjectionResult r = run_projection(in, ReferencePortfolio::demo(), make_config());
    REQUIRE(r.steps == 4);
    REQUIRE(r.series.size() == 5);
    REQUIRE(r.series.labels.back() == "Jan 27");
}
