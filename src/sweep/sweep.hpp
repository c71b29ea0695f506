#pragma once

#include "jamgame/equilibrium.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace jamgame {
namespace sweep {

constexpr int MAX_SWEEP_POINTS = 50;

// Parameter varied across a sweep
enum class SweepVariable {
    ND,     // Decoy channel count
    TAU,    // Sensing threshold
    N,      // Channel count
    M,      // Attacker count
    D,      // Defender count
    PJ,     // Total jammer budget, split evenly across attackers
};

const char* sweepVariableToString(SweepVariable variable);
std::optional<SweepVariable> parseSweepVariable(const std::string& name);

struct SweepConfig {
    SweepVariable variable = SweepVariable::ND;
    double min = 0.0;
    double max = 4.0;
    double step = 1.0;
    unsigned threads = 0;           // 0 = hardware concurrency
    bool oracle_comparison = false; // Also run each point against an oracle jammer

    // Replaces the per-point solve when set; called from worker threads
    std::function<EquilibriumResult(const EquilibriumParams&)> solve;
};

struct SweepPoint {
    double variable = 0.0;
    double u_real = 0.0;            // totalRealThroughput
    std::optional<double> u_oracle; // Same point against an oracle jammer
    double dilution_factor = 0.0;
    double jammer_waste = 0.0;
    bool converged = false;
    int iterations = 0;
    std::string error;              // Set when the point was rejected or its solve threw
};

struct SweepResult {
    SweepVariable variable = SweepVariable::ND;
    std::vector<SweepPoint> points;
    SweepPoint baseline;            // Run at config.min
    SweepPoint best_point;          // Highest u_real, baseline included
    double improvement_percent = 0.0;
};

// Values min, min+step, ... <= max. Returns an error message for a bad range.
std::optional<std::string> validateSweepConfig(const SweepConfig& config);
std::vector<double> sweepRange(const SweepConfig& config);

// Copy of base with one variable changed, keeping every array consistent
EquilibriumParams applySweepValue(const EquilibriumParams& base, SweepVariable variable, double value);

/**
 * Solve one independent game per range value on a worker pool.
 *
 * Points come back in range order. A point whose parameters fail
 * validation, or whose solve throws, is recorded with zeros and its error;
 * it does not stop the sweep. Throws std::invalid_argument if the sweep
 * range itself is bad.
 */
SweepResult runSweep(const EquilibriumParams& base, const SweepConfig& config);

} // namespace sweep
} // namespace jamgame
