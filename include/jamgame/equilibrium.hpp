#pragma once

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jamgame {

// Input limits enforced by validateParams()
constexpr int MAX_N = 100;          // Max channels
constexpr int MAX_D = 20;           // Max defenders
constexpr int MAX_M = 20;           // Max attackers
constexpr int MAX_ITER = 1000;      // Max equilibrium iterations
constexpr double MAX_POWER = 10000; // Max power budget / sigma2 / tau

/**
 * Equilibrium game parameters
 *
 * N channels shared by D defenders and M attackers. Each channel has one
 * owning defender and a fixed type. Gains are indexed h[d][i], g[m][i].
 */
struct EquilibriumParams {
    int N = 12;                         // Channels
    int D = 2;                          // Defenders
    int M = 2;                          // Attackers

    std::vector<double> PT;             // Power budget per defender (length D)
    std::vector<double> PJ;             // Power budget per attacker (length M)

    double sigma2 = 1.0;                // Noise variance (> 0)
    double tau = 0.2;                   // Sensing threshold (>= 0)

    std::vector<std::vector<double>> h; // Defender gains, D x N
    std::vector<std::vector<double>> g; // Attacker gains, M x N

    double alpha = 0.3;                 // Damping factor (0 < alpha <= 1)
    int max_iter = 100;
    double epsilon = 1e-3;              // Convergence threshold on maxChange

    std::vector<ChannelConfig> channels; // Type + owner per channel (length N)

    JammerStrategy jammer_strategy = JammerStrategy::UNIFORM;
    JammerObjective jammer_objective = JammerObjective::DECEPTION;
    AttackerMode attacker_mode = AttackerMode::COORDINATED;
    int top_k = 3;                      // Used by JammerStrategy::TOP_K

    // Initialization. random_init selects InitMode::RANDOM regardless of init_mode.
    bool random_init = false;
    InitMode init_mode = InitMode::UNIFORM;
    std::optional<uint64_t> seed;

    GainDistribution gain_distribution = GainDistribution::UNIFORM;

    InitMode effectiveInitMode() const {
        return random_init ? InitMode::RANDOM : init_mode;
    }
};

struct PlayerAllocation {
    int player_id = 0;
    std::vector<double> allocation;     // Power per channel (length N)
    double utility = 0.0;
};

struct ConvergenceEntry {
    int iter = 0;
    double max_change = 0.0;
    std::vector<double> defender_utilities;
    std::vector<double> attacker_utilities;
    std::vector<double> defender_deltas; // Per-player max |change| this iteration
    std::vector<double> attacker_deltas;
};

struct ChannelSummary {
    int channel = 0;
    int owner = 0;
    ChannelType type = ChannelType::INACTIVE;
    double total_defender_power = 0.0;
    double total_attacker_power = 0.0;  // Summed over all attackers
    double sinr = 0.0;
    double rate = 0.0;                  // log2(1 + SINR)
    double h = 0.0;                     // Owner's gain
    double g = 0.0;                     // Mean attacker gain
    bool is_active = false;
};

struct EquilibriumMetrics {
    double jammer_waste_on_decoys = 0.0;   // Fraction of attacker power on decoys
    double dilution_factor = 0.0;          // |A| / |R|
    // Reserved for callers that run a second pass; the engine leaves them at 0
    double oracle_gap = 0.0;
    double improvement_over_no_decoys = 0.0;
    double total_real_throughput = 0.0;    // Sum of log2(1+SINR) over real channels
    double total_decoy_power = 0.0;
    int active_channel_count = 0;
    int real_channel_count = 0;
    bool symmetric_equilibrium = false;
};

struct OracleResult {
    std::vector<PlayerAllocation> defenders;
    std::vector<PlayerAllocation> attackers;
    EquilibriumMetrics metrics;
};

struct EquilibriumResult {
    std::vector<PlayerAllocation> defenders;
    std::vector<PlayerAllocation> attackers;
    bool converged = false;
    int iterations = 0;
    double max_change = 0.0;            // Final iteration's maxChange
    std::vector<ConvergenceEntry> convergence_history;
    std::vector<ChannelSummary> channel_summary;
    EquilibriumMetrics metrics;
    std::optional<OracleResult> oracle_result;
};

/**
 * Check parameters before a run.
 * Returns an error message naming the offending field, or nullopt if valid.
 */
std::optional<std::string> validateParams(const EquilibriumParams& params);

/**
 * Run the damped best-response iteration to an approximate equilibrium.
 *
 * Pure function of its input (given a seed): no shared state, safe to call
 * concurrently from several threads.
 * Throws std::invalid_argument if validateParams() rejects the input.
 */
EquilibriumResult solveEquilibrium(const EquilibriumParams& params);

/**
 * Run the configured game, then the same game against an oracle jammer,
 * and attach the second run as oracle_result.
 */
EquilibriumResult solveWithOracleBaseline(const EquilibriumParams& params);

// Default scenario: channel i owned by i % D; per defender the first 3
// channels are real, the next 2 decoys, the rest inactive. Unit gains,
// budgets of 10. N, D and M below 1 are raised to 1; values above the
// limits are kept so that validateParams() reports them.
EquilibriumParams defaultEquilibriumParams(int N = 12, int D = 2, int M = 2);

// Fill params.h / params.g from a gain distribution (no-op for CUSTOM)
void generateGains(EquilibriumParams& params, GainDistribution distribution,
                   std::optional<uint64_t> seed = std::nullopt);

} // namespace jamgame
