/**
 * Parameter Validation Test Suite
 *
 * Tests input checks and the shared type helpers:
 * - Default scenario layout is valid
 * - Each rejected field is named in the message
 * - Enum names parse case-insensitively
 * - Channel type counting
 * - Seeded stream values
 * - Log level filtering
 */

#include "jamgame/equilibrium.hpp"
#include "jamgame/logging.hpp"
#include "model/seeded_random.hpp"
#include <iostream>
#include <string>

using namespace jamgame;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

// Expect validation to fail with a message containing `needle`
static bool rejects(const EquilibriumParams& p, const std::string& needle, std::string& got) {
    auto err = validateParams(p);
    got = err ? *err : "<accepted>";
    return err && err->find(needle) != std::string::npos;
}

bool test_default_layout() {
    TEST("Default scenario layout");

    EquilibriumParams p = defaultEquilibriumParams();

    if (auto err = validateParams(p))
        FAIL("Default rejected: " + *err);

    auto counts = countChannelTypes(p.channels);
    if (counts.real != 6 || counts.decoy != 4 || counts.inactive != 2)
        FAIL("Expected 6/4/2 real/decoy/inactive");

    auto per = channelCountsPerDefender(p.channels, p.D);
    for (int d = 0; d < p.D; ++d) {
        if (per.real[d] != 3 || per.decoy[d] != 2)
            FAIL("Defender " + std::to_string(d) + " layout wrong");
    }

    // Interleaved ownership
    if (p.channels[0].owner != 0 || p.channels[1].owner != 1 || p.channels[6].type != ChannelType::DECOY)
        FAIL("Channels not interleaved across defenders");

    PASS();
    return true;
}

bool test_scalar_ranges() {
    TEST("Scalar ranges");

    std::string got;
    EquilibriumParams p = defaultEquilibriumParams();

    p.alpha = 0.0;
    if (!rejects(p, "alpha must be between 0.01 and 1", got)) FAIL(got);
    p.alpha = 0.3;

    p.sigma2 = 0.0;
    if (!rejects(p, "sigma2", got)) FAIL(got);
    p.sigma2 = 1.0;

    p.epsilon = 2.0;
    if (!rejects(p, "epsilon", got)) FAIL(got);
    p.epsilon = 1e-3;

    p.max_iter = MAX_ITER + 1;
    if (!rejects(p, "maxIter must be between 1 and 1000", got)) FAIL(got);
    p.max_iter = 100;

    p.tau = -0.1;
    if (!rejects(p, "tau", got)) FAIL(got);
    p.tau = 0.2;

    p.top_k = 0;
    if (!rejects(p, "topK", got)) FAIL(got);

    PASS();
    return true;
}

bool test_counts() {
    TEST("Player and channel counts");

    std::string got;
    EquilibriumParams p = defaultEquilibriumParams();

    p.N = MAX_N + 1;
    if (!rejects(p, "N must be between", got)) FAIL(got);

    p = defaultEquilibriumParams();
    p.D = 0;
    if (!rejects(p, "D must be between", got)) FAIL(got);

    p = defaultEquilibriumParams();
    p.M = MAX_M + 1;
    if (!rejects(p, "M must be between", got)) FAIL(got);

    // Zero-sized defaults are raised to one player and channel
    p = defaultEquilibriumParams(4, 0, 0);
    if (p.D != 1 || p.M != 1 || p.PT.size() != 1 || p.g.size() != 1)
        FAIL("D=0/M=0 defaults not raised to one player");
    for (const auto& ch : p.channels) {
        if (ch.owner != 0) FAIL("Channel owned by missing defender");
    }
    if (auto err = validateParams(p)) FAIL("Raised defaults invalid: " + *err);

    p = defaultEquilibriumParams(-3, 2, 2);
    if (p.N != 1 || p.channels.size() != 1 || p.h[1].size() != 1)
        FAIL("Negative N not raised to one channel");

    PASS();
    return true;
}

bool test_array_shapes() {
    TEST("Budget, gain and channel array shapes");

    std::string got;
    EquilibriumParams p = defaultEquilibriumParams();

    p.PT = {10.0};
    if (!rejects(p, "PT must have 2 entries", got)) FAIL(got);

    p = defaultEquilibriumParams();
    p.PJ[1] = MAX_POWER * 2;
    if (!rejects(p, "PJ[1]", got)) FAIL(got);

    p = defaultEquilibriumParams();
    p.h[1].pop_back();
    if (!rejects(p, "h row 1 must have N entries", got)) FAIL(got);

    p = defaultEquilibriumParams();
    p.g[0][3] = -1.0;
    if (!rejects(p, "g must contain non-negative", got)) FAIL(got);

    p = defaultEquilibriumParams();
    p.channels.pop_back();
    if (!rejects(p, "channelConfig must have N entries", got)) FAIL(got);

    p = defaultEquilibriumParams();
    p.channels[5].owner = 2;
    if (!rejects(p, "channelConfig[5].owner must be < D", got)) FAIL(got);

    PASS();
    return true;
}

bool test_parse_names() {
    TEST("Enum names parse case-insensitively");

    if (parseJammerStrategy("J2_topK") != JammerStrategy::TOP_K) FAIL("J2_topK");
    if (parseJammerStrategy("Gradient") != JammerStrategy::GRADIENT) FAIL("Gradient");
    if (parseJammerObjective("ORACLE") != JammerObjective::ORACLE) FAIL("ORACLE");
    if (parseAttackerMode("independent") != AttackerMode::INDEPENDENT) FAIL("independent");
    if (parseChannelType("Decoy") != ChannelType::DECOY) FAIL("Decoy");
    if (parseInitMode("gain_weighted") != InitMode::GAIN_WEIGHTED) FAIL("gain_weighted");
    if (parseGainDistribution("rayleigh") != GainDistribution::RAYLEIGH) FAIL("rayleigh");
    if (parseJammerStrategy("j4")) FAIL("Unknown strategy accepted");

    // Every printed name reads back
    for (auto s : {JammerStrategy::UNIFORM, JammerStrategy::TOP_K, JammerStrategy::GRADIENT}) {
        if (parseJammerStrategy(jammerStrategyToString(s)) != s)
            FAIL(std::string("Name does not parse back: ") + jammerStrategyToString(s));
    }

    PASS();
    return true;
}

bool test_generated_gains() {
    TEST("Generated gains are seeded and in range");

    EquilibriumParams a = defaultEquilibriumParams();
    EquilibriumParams b = defaultEquilibriumParams();
    generateGains(a, GainDistribution::UNIFORM, 11);
    generateGains(b, GainDistribution::UNIFORM, 11);

    if (a.h != b.h || a.g != b.g)
        FAIL("Same seed gave different gains");

    for (const auto& row : a.h) {
        for (double v : row) {
            if (v < 0.5 || v > 2.0) FAIL("Uniform gain out of range: " + std::to_string(v));
        }
    }

    EquilibriumParams r = defaultEquilibriumParams();
    generateGains(r, GainDistribution::RAYLEIGH, 11);
    if (auto err = validateParams(r))
        FAIL("Rayleigh gains rejected: " + *err);

    PASS();
    return true;
}

bool test_seeded_stream() {
    TEST("Seeded stream uses exact integer arithmetic");

    // Seed 1 states: 1103527590, 377401575, 662824084
    model::SeededRandom random(1);
    const double expected[] = {1103527590.0, 377401575.0, 662824084.0};
    for (double state : expected) {
        double v = random.next();
        if (v != state / 2147483647.0)
            FAIL("Stream value " + std::to_string(v) + " for state " + std::to_string(state));
    }

    PASS();
    return true;
}

bool test_log_levels() {
    TEST("Log level filtering and names");

    LogLevel saved = g_log_level;

    setLogLevel(LogLevel::WARN);
    bool ok = logEnabled(LogLevel::ERROR) && logEnabled(LogLevel::WARN) &&
              !logEnabled(LogLevel::INFO) && !logEnabled(LogLevel::TRACE);

    setLogLevel(LogLevel::TRACE);
    ok = ok && logEnabled(LogLevel::DEBUG) && logEnabled(LogLevel::TRACE);

    setLogLevel(saved);
    if (!ok)
        FAIL("Level threshold not applied");

    if (std::string(logLevelName(LogLevel::WARN)) != "WARN " ||
        std::string(logLevelName(LogLevel::TRACE)) != "TRACE")
        FAIL("Level names wrong");

    PASS();
    return true;
}

int main() {
    std::cout << "=== Parameter Validation Test Suite ===\n\n";

    test_default_layout();
    test_scalar_ranges();
    test_counts();
    test_array_shapes();
    test_parse_names();
    test_generated_gains();
    test_seeded_stream();
    test_log_levels();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " tests passed ===\n";

    if (tests_passed == tests_run) {
        std::cout << "All tests PASSED!\n";
        return 0;
    } else {
        std::cout << "Some tests FAILED!\n";
        return 1;
    }
}
