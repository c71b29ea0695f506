/**
 * Budget Projection Test Suite
 *
 * Tests clamp-then-rescale projection:
 * - Output sums to the budget
 * - Negative entries clamp to zero
 * - All-zero input falls back to an even split
 * - In-place use (input and output share storage)
 */

#include "engine/projection.hpp"
#include <cmath>
#include <iostream>
#include <vector>

using namespace jamgame;
using namespace jamgame::engine;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static double sum(const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) s += x;
    return s;
}

bool test_rescale_to_budget() {
    TEST("Rescale to budget");

    auto out = projectToBudget({1.0, 2.0, 1.0}, 8.0);

    if (std::abs(sum(out) - 8.0) > 1e-12)
        FAIL("Sum is " + std::to_string(sum(out)));
    if (std::abs(out[1] - 4.0) > 1e-12)
        FAIL("Proportions not kept: " + std::to_string(out[1]));

    PASS();
    return true;
}

bool test_clamp_negative() {
    TEST("Negative entries clamp to zero");

    auto out = projectToBudget({-3.0, 1.0, 3.0}, 10.0);

    if (out[0] != 0.0)
        FAIL("Negative entry kept: " + std::to_string(out[0]));
    if (std::abs(out[1] - 2.5) > 1e-12 || std::abs(out[2] - 7.5) > 1e-12)
        FAIL("Wrong split after clamp");

    PASS();
    return true;
}

bool test_zero_fallback() {
    TEST("All non-positive input splits evenly");

    auto out = projectToBudget({0.0, -1.0, 0.0, -5.0}, 10.0);

    for (double v : out) {
        if (std::abs(v - 2.5) > 1e-12)
            FAIL("Expected 2.5 per slot, got " + std::to_string(v));
    }

    PASS();
    return true;
}

bool test_zero_budget() {
    TEST("Zero budget gives zero row");

    auto out = projectToBudget({1.0, 2.0, 3.0}, 0.0);

    for (double v : out) {
        if (v != 0.0) FAIL("Non-zero entry " + std::to_string(v));
    }

    PASS();
    return true;
}

bool test_idempotent() {
    TEST("Projecting a feasible row is a no-op");

    std::vector<double> row = {0.2, 4.8, 4.8, 0.2};
    auto out = projectToBudget(row, 10.0);

    for (size_t i = 0; i < row.size(); ++i) {
        if (std::abs(out[i] - row[i]) > 1e-12)
            FAIL("Entry " + std::to_string(i) + " moved");
    }

    PASS();
    return true;
}

bool test_in_place() {
    TEST("In-place projection");

    std::vector<double> row = {-1.0, 1.0, 3.0};
    projectToBudget(std::span<const double>(row), 2.0, std::span<double>(row));

    if (row[0] != 0.0 || std::abs(row[1] - 0.5) > 1e-12 || std::abs(row[2] - 1.5) > 1e-12)
        FAIL("Aliased projection wrong");

    PASS();
    return true;
}

bool test_empty() {
    TEST("Empty input");

    auto out = projectToBudget(std::vector<double>{}, 10.0);
    if (!out.empty())
        FAIL("Expected empty output");

    PASS();
    return true;
}

int main() {
    std::cout << "=== Budget Projection Test Suite ===\n\n";

    test_rescale_to_budget();
    test_clamp_negative();
    test_zero_fallback();
    test_zero_budget();
    test_idempotent();
    test_in_place();
    test_empty();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " tests passed ===\n";

    if (tests_passed == tests_run) {
        std::cout << "All tests PASSED!\n";
        return 0;
    } else {
        std::cout << "Some tests FAILED!\n";
        return 1;
    }
}
