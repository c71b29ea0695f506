#pragma once

#include "activation.hpp"
#include "jammer_strategy.hpp"
#include "model/game_model.hpp"
#include <memory>
#include <vector>

namespace jamgame {
namespace engine {

/**
 * Damped best-response iteration
 *
 * States: ITERATING -> CONVERGED (maxChange < epsilon)
 *                   -> EXHAUSTED (max_iter reached, still a valid result)
 *
 * Each iteration:
 * 1. Every defender, in index order: gradient ascent step, project onto
 *    its budget, damp against its previous row.
 * 2. Recompute the active set from the new defender rows.
 * 3. Every attacker, in index order: candidate row from the jammer
 *    strategy, damp against its previous row.
 * 4. Record utilities and per-player max |change|.
 *
 * Players update in sequence against the latest joint state. Separate
 * solver instances share nothing.
 */
class EquilibriumSolver {
public:
    enum class State {
        ITERATING,
        CONVERGED,
        EXHAUSTED,
    };

    // Ascent step size for the defender gradient
    static constexpr double STEP_SIZE = 0.5;

    // params must have passed validateParams()
    explicit EquilibriumSolver(const EquilibriumParams& params);

    // Seed x from the init rule and y from the jammer strategy. Called by the constructor.
    void initialize();

    // One full iteration. Returns this iteration's maxChange.
    double step();

    // Iterate until converged or exhausted and build the result
    EquilibriumResult run();

    State getState() const { return state_; }
    int getIterations() const { return iterations_; }
    double getMaxChange() const { return max_change_; }

    const model::GameModel& getModel() const { return model_; }
    const model::AllocationMatrix& defenderAllocations() const { return x_; }
    const model::AllocationMatrix& attackerAllocations() const { return y_; }
    const std::vector<ConvergenceEntry>& history() const { return history_; }

    // Assemble a result from the current state
    EquilibriumResult buildResult() const;

private:
    void initDefender(int d);

    model::GameModel model_;
    std::unique_ptr<IJammerStrategy> jammer_;

    model::AllocationMatrix x_;   // D x N
    model::AllocationMatrix y_;   // M x N
    ActiveSet active_;

    State state_ = State::ITERATING;
    int iterations_ = 0;
    double max_change_ = 0.0;
    std::vector<ConvergenceEntry> history_;
};

const char* solverStateToString(EquilibriumSolver::State state);

} // namespace engine
} // namespace jamgame
