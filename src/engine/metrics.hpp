#pragma once

#include "activation.hpp"
#include "model/game_model.hpp"
#include <vector>

namespace jamgame {
namespace engine {

// Per-channel rows for the terminal state
std::vector<ChannelSummary> buildChannelSummary(const model::GameModel& model,
                                                const model::AllocationMatrix& x,
                                                const model::AllocationMatrix& y,
                                                const ActiveSet& active);

/**
 * Aggregate diagnostics for the terminal state.
 *
 * oracle_gap and improvement_over_no_decoys are left at zero: they need a
 * second run and belong to the caller. symmetric_equilibrium is filled in
 * separately by checkSymmetricEquilibrium().
 */
EquilibriumMetrics computeMetrics(const model::GameModel& model,
                                  const model::AllocationMatrix& x,
                                  const model::AllocationMatrix& y,
                                  const ActiveSet& active);

// True when every defender row is within 10*epsilon (L1) of defender 0's.
// Needs at least two defenders. Flags degenerate outcomes, proves nothing.
bool checkSymmetricEquilibrium(const std::vector<PlayerAllocation>& defenders, double epsilon);

} // namespace engine
} // namespace jamgame
