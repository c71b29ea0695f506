/**
 * Parameter Sweep Test Suite
 *
 * Tests sweep construction and the threaded runner:
 * - Range validation and point generation
 * - Per-variable parameter rewriting keeps arrays consistent
 * - Points come back in range order regardless of thread count
 * - A rejected or throwing point is recorded, not fatal
 * - Best point and improvement over baseline
 */

#include "sweep/sweep.hpp"
#include "jamgame/logging.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace jamgame;
using namespace jamgame::sweep;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static SweepConfig makeConfig(SweepVariable variable, double min, double max, double step) {
    SweepConfig config;
    config.variable = variable;
    config.min = min;
    config.max = max;
    config.step = step;
    return config;
}

// ============================================================================
// Range Tests
// ============================================================================

bool test_range() {
    TEST("Range generation");

    auto values = sweepRange(makeConfig(SweepVariable::TAU, 0.0, 0.5, 0.1));
    if (values.size() != 6)
        FAIL("Expected 6 points, got " + std::to_string(values.size()));
    if (std::abs(values.back() - 0.5) > 1e-12)
        FAIL("Last point " + std::to_string(values.back()));

    if (!validateSweepConfig(makeConfig(SweepVariable::ND, 0, 4, 0)))
        FAIL("Zero step accepted");
    if (!validateSweepConfig(makeConfig(SweepVariable::ND, 4, 0, 1)))
        FAIL("Reversed range accepted");
    if (!validateSweepConfig(makeConfig(SweepVariable::N, 1, 100, 1)))
        FAIL("100-point sweep accepted");
    if (validateSweepConfig(makeConfig(SweepVariable::N, 1, 50, 1)))
        FAIL("50-point sweep rejected");

    try {
        runSweep(defaultEquilibriumParams(), makeConfig(SweepVariable::ND, 0, 4, -1));
        FAIL("runSweep accepted a bad range");
    } catch (const std::invalid_argument&) {
        // expected
    }

    PASS();
    return true;
}

// ============================================================================
// Parameter Rewrite Tests
// ============================================================================

bool test_apply_decoy_count() {
    TEST("ND rewrites non-real channels");

    EquilibriumParams base = defaultEquilibriumParams();
    EquilibriumParams p = applySweepValue(base, SweepVariable::ND, 2);

    auto counts = countChannelTypes(p.channels);
    if (counts.real != 6 || counts.decoy != 2 || counts.inactive != 4)
        FAIL("Expected 6/2/4 after ND=2");
    if (p.channels[6].type != ChannelType::DECOY || p.channels[8].type != ChannelType::INACTIVE)
        FAIL("Decoys not assigned in index order");

    // More decoys than free channels caps at the free count
    p = applySweepValue(base, SweepVariable::ND, 20);
    if (countChannelTypes(p.channels).decoy != 6)
        FAIL("ND not capped at N - real");

    PASS();
    return true;
}

bool test_apply_sizes() {
    TEST("N, M, D rewrites keep arrays consistent");

    EquilibriumParams base = defaultEquilibriumParams();

    EquilibriumParams p = applySweepValue(base, SweepVariable::N, 16);
    if (p.N != 16 || p.channels.size() != 16 || p.h[0].size() != 16 || p.g[1].size() != 16)
        FAIL("N=16 arrays not resized");
    if (auto err = validateParams(p)) FAIL("N=16 invalid: " + *err);

    p = applySweepValue(base, SweepVariable::N, 2);
    if (p.N != 4)
        FAIL("N below 4 not clamped");

    p = applySweepValue(base, SweepVariable::M, 3);
    if (p.M != 3 || p.PJ.size() != 3 || p.g.size() != 3)
        FAIL("M=3 arrays not resized");
    if (auto err = validateParams(p)) FAIL("M=3 invalid: " + *err);

    p = applySweepValue(base, SweepVariable::D, 1);
    if (p.D != 1 || p.PT.size() != 1 || p.h.size() != 1)
        FAIL("D=1 arrays not resized");
    for (const auto& ch : p.channels) {
        if (ch.owner != 0) FAIL("Owner not remapped for D=1");
    }

    p = applySweepValue(base, SweepVariable::PJ, 30);
    if (p.PJ.size() != 2 || p.PJ[0] != 15.0 || p.PJ[1] != 15.0)
        FAIL("PJ not split evenly");

    p = applySweepValue(base, SweepVariable::TAU, 0.7);
    if (p.tau != 0.7)
        FAIL("tau not applied");

    PASS();
    return true;
}

// ============================================================================
// Runner Tests
// ============================================================================

bool test_points_in_order() {
    TEST("Points in range order on a worker pool");

    SweepConfig config = makeConfig(SweepVariable::ND, 0, 4, 1);
    config.threads = 3;
    SweepResult result = runSweep(defaultEquilibriumParams(), config);

    if (result.points.size() != 5)
        FAIL("Expected 5 points, got " + std::to_string(result.points.size()));
    for (size_t k = 0; k < result.points.size(); ++k) {
        if (result.points[k].variable != static_cast<double>(k))
            FAIL("Point " + std::to_string(k) + " out of order");
        if (!result.points[k].error.empty())
            FAIL("Point failed: " + result.points[k].error);
    }
    if (result.baseline.variable != 0.0)
        FAIL("Baseline not at range minimum");
    if (result.points[0].jammer_waste != 0.0)
        FAIL("ND=0 point shows jammer waste");

    // Single-threaded run gives the same numbers
    config.threads = 1;
    SweepResult serial = runSweep(defaultEquilibriumParams(), config);
    for (size_t k = 0; k < result.points.size(); ++k) {
        if (serial.points[k].u_real != result.points[k].u_real)
            FAIL("Threaded and serial results differ at point " + std::to_string(k));
    }

    PASS();
    return true;
}

bool test_best_and_improvement() {
    TEST("Best point and improvement");

    SweepResult result = runSweep(defaultEquilibriumParams(), makeConfig(SweepVariable::ND, 0, 4, 1));

    for (const auto& p : result.points) {
        if (p.u_real > result.best_point.u_real)
            FAIL("Best point is not the maximum");
    }
    if (result.best_point.u_real < result.baseline.u_real)
        FAIL("Best point below baseline");

    double expected = (result.best_point.u_real - result.baseline.u_real) / result.baseline.u_real * 100.0;
    if (std::abs(result.improvement_percent - expected) > 1e-9)
        FAIL("Improvement " + std::to_string(result.improvement_percent));

    PASS();
    return true;
}

bool test_invalid_point_recorded() {
    TEST("Rejected point recorded with its error");

    SweepConfig config = makeConfig(SweepVariable::TAU, 0, 2 * MAX_POWER, MAX_POWER);
    SweepResult result = runSweep(defaultEquilibriumParams(), config);

    if (result.points.size() != 3)
        FAIL("Expected 3 points");

    const auto& bad = result.points[2];
    if (bad.error.find("tau") == std::string::npos)
        FAIL("Error does not name tau: '" + bad.error + "'");
    if (bad.u_real != 0.0 || bad.converged || bad.iterations != 0)
        FAIL("Rejected point not zeroed");
    if (!result.points[0].error.empty())
        FAIL("Valid point marked failed");

    PASS();
    return true;
}

bool test_throwing_point_recorded() {
    TEST("Solve that throws is recorded on its point");

    SweepConfig config = makeConfig(SweepVariable::ND, 0, 4, 1);
    config.threads = 2;
    config.solve = [](const EquilibriumParams& p) {
        if (countChannelTypes(p.channels).decoy == 3)
            throw std::runtime_error("solver blew up");
        return solveEquilibrium(p);
    };
    SweepResult result = runSweep(defaultEquilibriumParams(), config);

    if (result.points.size() != 5)
        FAIL("Sweep did not finish all points");
    const auto& bad = result.points[3];
    if (bad.error != "solver blew up")
        FAIL("Error not recorded: '" + bad.error + "'");
    if (bad.variable != 3.0 || bad.u_real != 0.0 || bad.converged)
        FAIL("Throwing point not zeroed");
    for (size_t k = 0; k < result.points.size(); ++k) {
        if (k != 3 && !result.points[k].error.empty())
            FAIL("Point " + std::to_string(k) + " marked failed");
    }

    PASS();
    return true;
}

bool test_huge_count_rejected() {
    TEST("Oversized count reaches validation");

    SweepConfig config = makeConfig(SweepVariable::M, 1, 1e15, 5e14);
    SweepResult result = runSweep(defaultEquilibriumParams(), config);

    if (result.points.size() != 3)
        FAIL("Expected 3 points");
    if (result.points[2].error.find("M must be between") == std::string::npos)
        FAIL("Huge M not rejected: '" + result.points[2].error + "'");

    PASS();
    return true;
}

bool test_oracle_comparison() {
    TEST("Oracle comparison fills u_oracle");

    SweepConfig config = makeConfig(SweepVariable::PJ, 10, 20, 10);
    config.oracle_comparison = true;
    SweepResult result = runSweep(defaultEquilibriumParams(), config);

    for (const auto& p : result.points) {
        if (!p.u_oracle)
            FAIL("Missing u_oracle at PJ=" + std::to_string(p.variable));
    }

    PASS();
    return true;
}

int main() {
    std::cout << "=== Parameter Sweep Test Suite ===\n\n";

    setLogLevel(LogLevel::ERROR);

    std::cout << "Range Tests:\n";
    test_range();

    std::cout << "\nParameter Rewrite Tests:\n";
    test_apply_decoy_count();
    test_apply_sizes();

    std::cout << "\nRunner Tests:\n";
    test_points_in_order();
    test_best_and_improvement();
    test_invalid_point_recorded();
    test_throwing_point_recorded();
    test_huge_count_rejected();
    test_oracle_comparison();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " tests passed ===\n";

    if (tests_passed == tests_run) {
        std::cout << "All tests PASSED!\n";
        return 0;
    } else {
        std::cout << "Some tests FAILED!\n";
        return 1;
    }
}
