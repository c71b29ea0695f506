#pragma once

#include "activation.hpp"
#include "model/game_model.hpp"
#include <span>

namespace jamgame {
namespace engine {

// Which of a defender's channels count toward its utility
enum class UtilityScope {
    REAL_ONLY,   // Real channels only (true throughput, oracle jammer view)
    ALL_ACTIVE,  // Real and decoy channels alike (deception jammer view)
};

// Decoys have no rate objective; these keep them minimally funded
constexpr double DECOY_GRADIENT_BELOW_TAU = 0.1;
constexpr double DECOY_GRADIENT_ACTIVE = 0.01;

/**
 * Defender utility: sum over owned channels in scope of ln(1 + SINR),
 * SINR = x[d][i] h[d][i] / (sigma2 + sum_m y[m][i] g[m][i]).
 * Channels with x[d][i] <= 0 contribute nothing.
 */
double defenderUtility(const model::GameModel& model, int d,
                       const model::AllocationMatrix& x, const model::AllocationMatrix& y,
                       UtilityScope scope);

/**
 * Attacker utility: minus the summed defender utility, computed over real
 * channels (oracle) or all transmitting channels (deception). Identical for
 * every attacker since they share one objective.
 */
double attackerUtility(const model::GameModel& model,
                       const model::AllocationMatrix& x, const model::AllocationMatrix& y,
                       JammerObjective objective);

// d u_d / d x[d][i] over defender d's channels; zero elsewhere
void defenderGradient(const model::GameModel& model, int d,
                      const model::AllocationMatrix& x, const model::AllocationMatrix& y,
                      std::span<double> grad);

// d(-u)/d y[m][i] over eligible active channels; zero elsewhere
void attackerGradient(const model::GameModel& model, int m,
                      const model::AllocationMatrix& x, const model::AllocationMatrix& y,
                      const ActiveSet& active, JammerObjective objective,
                      std::span<double> grad);

} // namespace engine
} // namespace jamgame
