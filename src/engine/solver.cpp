#include "solver.hpp"
#include "metrics.hpp"
#include "projection.hpp"
#include "utility.hpp"
#include "model/seeded_random.hpp"
#include "jamgame/logging.hpp"
#include <algorithm>
#include <cmath>

namespace jamgame {
namespace engine {

const char* solverStateToString(EquilibriumSolver::State state) {
    switch (state) {
        case EquilibriumSolver::State::ITERATING: return "iterating";
        case EquilibriumSolver::State::CONVERGED: return "converged";
        case EquilibriumSolver::State::EXHAUSTED: return "exhausted";
        default:                                  return "unknown";
    }
}

EquilibriumSolver::EquilibriumSolver(const EquilibriumParams& params)
    : model_(params)
    , jammer_(createJammerStrategy(params))
    , x_(params.D, params.N)
    , y_(params.M, params.N)
    , active_(params.N)
{
    initialize();
}

// ============================================================================
// Initialization
// ============================================================================

void EquilibriumSolver::initialize() {
    const auto& params = model_.params();
    const int N = model_.numChannels();

    x_ = model::AllocationMatrix(model_.numDefenders(), N);
    y_ = model::AllocationMatrix(model_.numAttackers(), N);
    state_ = State::ITERATING;
    iterations_ = 0;
    max_change_ = 0.0;
    history_.clear();

    model::SeededRandom random(params.seed);
    InitMode mode = params.effectiveInitMode();

    for (int d = 0; d < model_.numDefenders(); ++d) {
        const auto& owned = model_.ownedChannels(d);
        double budget = model_.defenderBudget(d);
        auto row = x_.row(d);

        if (mode == InitMode::RANDOM && !owned.empty()) {
            std::vector<double> weights;
            double sum = 0.0;
            for (size_t k = 0; k < owned.size(); ++k) {
                weights.push_back(random.next());
                sum += weights.back();
            }
            for (size_t k = 0; k < owned.size(); ++k) {
                row[owned[k]] = (sum > 0.0)
                    ? (weights[k] / sum) * budget
                    : budget / static_cast<double>(owned.size());
            }
        } else {
            initDefender(d);
        }

        // Hold the budget invariant from the first iteration on. Rows that
        // already hit the budget are left alone: rescaling by ~1 could drop
        // a decoy sitting exactly at tau below the threshold.
        double sum = x_.rowSum(d);
        if (std::abs(sum - budget) > 1e-9 * std::max(1.0, budget)) {
            projectToBudget(row, budget, row);
        }
    }

    active_ = computeActiveSet(model_, x_);

    // Every attacker answers the same jam-free opening state
    model::AllocationMatrix no_jamming(model_.numAttackers(), N);
    JammerContext ctx{model_, x_, no_jamming, active_};
    for (int m = 0; m < model_.numAttackers(); ++m) {
        jammer_->allocate(m, ctx, y_.row(m));
    }

    LOG_SOLVER(DEBUG, "Init (%s): %zu/%d channels active",
               initModeToString(mode), active_.size(), N);
}

// Decoys first at tau each (while budget lasts), the remainder over real channels
void EquilibriumSolver::initDefender(int d) {
    const auto& params = model_.params();
    auto row = x_.row(d);

    std::vector<int> real;
    std::vector<int> decoy;
    for (int i : model_.ownedChannels(d)) {
        if (model_.isReal(i)) real.push_back(i);
        else if (model_.isDecoy(i)) decoy.push_back(i);
    }

    double remaining = model_.defenderBudget(d);
    for (int i : decoy) {
        row[i] = std::min(model_.tau(), remaining / static_cast<double>(decoy.size()));
        remaining -= row[i];
    }

    if (real.empty()) return;

    double gain_sum = 0.0;
    for (int i : real) gain_sum += model_.h(d, i);

    for (int i : real) {
        if (params.effectiveInitMode() == InitMode::GAIN_WEIGHTED && gain_sum > 0.0) {
            row[i] = remaining * model_.h(d, i) / gain_sum;
        } else {
            row[i] = remaining / static_cast<double>(real.size());
        }
    }
}

// ============================================================================
// Iteration
// ============================================================================

double EquilibriumSolver::step() {
    if (state_ != State::ITERATING) return max_change_;

    const auto& params = model_.params();
    const int N = model_.numChannels();
    const int D = model_.numDefenders();
    const int M = model_.numAttackers();
    const double alpha = params.alpha;

    iterations_++;
    double max_change = 0.0;

    ConvergenceEntry entry;
    entry.iter = iterations_;

    std::vector<double> grad(N);
    std::vector<double> update(N);
    std::vector<double> candidate(N);

    // Defenders: ascent, project, damp
    for (int d = 0; d < D; ++d) {
        defenderGradient(model_, d, x_, y_, grad);

        auto row = x_.row(d);
        for (int i = 0; i < N; ++i) {
            update[i] = row[i] + STEP_SIZE * grad[i];
        }
        projectToBudget(update, model_.defenderBudget(d), candidate);

        double player_change = 0.0;
        for (int i = 0; i < N; ++i) {
            double damped = (1.0 - alpha) * row[i] + alpha * candidate[i];
            player_change = std::max(player_change, std::abs(damped - row[i]));
            row[i] = damped;
        }
        max_change = std::max(max_change, player_change);
        entry.defender_deltas.push_back(player_change);
    }

    active_ = computeActiveSet(model_, x_);

    // Attackers: strategy response, damp
    JammerContext ctx{model_, x_, y_, active_};
    for (int m = 0; m < M; ++m) {
        jammer_->respond(m, ctx, candidate);

        auto row = y_.row(m);
        double player_change = 0.0;
        for (int i = 0; i < N; ++i) {
            double damped = (1.0 - alpha) * row[i] + alpha * candidate[i];
            player_change = std::max(player_change, std::abs(damped - row[i]));
            row[i] = damped;
        }
        max_change = std::max(max_change, player_change);
        entry.attacker_deltas.push_back(player_change);
    }

    for (int d = 0; d < D; ++d) {
        entry.defender_utilities.push_back(defenderUtility(model_, d, x_, y_, UtilityScope::REAL_ONLY));
    }
    for (int m = 0; m < M; ++m) {
        entry.attacker_utilities.push_back(attackerUtility(model_, x_, y_, params.jammer_objective));
    }

    entry.max_change = max_change;
    history_.push_back(std::move(entry));
    max_change_ = max_change;

    LOG_SOLVER(TRACE, "Iter %d: maxChange=%.6g active=%zu", iterations_, max_change, active_.size());

    if (max_change < params.epsilon) {
        state_ = State::CONVERGED;
        LOG_SOLVER(DEBUG, "Converged at iteration %d with maxChange=%.6g", iterations_, max_change);
    } else if (iterations_ >= params.max_iter) {
        state_ = State::EXHAUSTED;
        LOG_SOLVER(DEBUG, "Exhausted %d iterations, maxChange=%.6g", iterations_, max_change);
    }

    return max_change;
}

EquilibriumResult EquilibriumSolver::run() {
    const auto& params = model_.params();

    LOG_SOLVER(INFO, "Running equilibrium: D=%d, M=%d, N=%d, strategy=%s, objective=%s",
               params.D, params.M, params.N,
               jammerStrategyToString(params.jammer_strategy),
               jammerObjectiveToString(params.jammer_objective));

    while (state_ == State::ITERATING) {
        step();
    }

    return buildResult();
}

EquilibriumResult EquilibriumSolver::buildResult() const {
    const auto& params = model_.params();

    EquilibriumResult result;
    result.converged = (state_ == State::CONVERGED);
    result.iterations = iterations_;
    result.max_change = max_change_;
    result.convergence_history = history_;

    // Active set from the terminal allocations
    ActiveSet active = computeActiveSet(model_, x_);

    for (int d = 0; d < model_.numDefenders(); ++d) {
        PlayerAllocation p;
        p.player_id = d;
        p.allocation = x_.rowVector(d);
        p.utility = defenderUtility(model_, d, x_, y_, UtilityScope::REAL_ONLY);
        result.defenders.push_back(std::move(p));
    }

    for (int m = 0; m < model_.numAttackers(); ++m) {
        PlayerAllocation p;
        p.player_id = m;
        p.allocation = y_.rowVector(m);
        p.utility = attackerUtility(model_, x_, y_, params.jammer_objective);
        result.attackers.push_back(std::move(p));
    }

    result.channel_summary = buildChannelSummary(model_, x_, y_, active);
    result.metrics = computeMetrics(model_, x_, y_, active);
    result.metrics.symmetric_equilibrium = checkSymmetricEquilibrium(result.defenders, params.epsilon);

    return result;
}

} // namespace engine
} // namespace jamgame
