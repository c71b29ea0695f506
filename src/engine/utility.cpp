#include "utility.hpp"
#include <algorithm>
#include <cmath>

namespace jamgame {
namespace engine {

double defenderUtility(const model::GameModel& model, int d,
                       const model::AllocationMatrix& x, const model::AllocationMatrix& y,
                       UtilityScope scope) {
    double utility = 0.0;

    for (int i : model.ownedChannels(d)) {
        if (scope == UtilityScope::REAL_ONLY && !model.isReal(i)) continue;

        double power = x(d, i);
        if (power <= 0.0) continue;

        double sinr = (power * model.h(d, i)) / model.interference(i, y);
        utility += std::log(1.0 + sinr);
    }

    return utility;
}

double attackerUtility(const model::GameModel& model,
                       const model::AllocationMatrix& x, const model::AllocationMatrix& y,
                       JammerObjective objective) {
    UtilityScope scope = (objective == JammerObjective::ORACLE)
        ? UtilityScope::REAL_ONLY
        : UtilityScope::ALL_ACTIVE;

    double total = 0.0;
    for (int d = 0; d < model.numDefenders(); ++d) {
        total += defenderUtility(model, d, x, y, scope);
    }
    return -total;
}

void defenderGradient(const model::GameModel& model, int d,
                      const model::AllocationMatrix& x, const model::AllocationMatrix& y,
                      std::span<double> grad) {
    std::fill(grad.begin(), grad.end(), 0.0);

    for (int i : model.ownedChannels(d)) {
        double power = x(d, i);
        if (model.isReal(i)) {
            double interference = model.interference(i, y);
            grad[i] = model.h(d, i) / (interference + power * model.h(d, i));
        } else {
            grad[i] = (power < model.tau()) ? DECOY_GRADIENT_BELOW_TAU : DECOY_GRADIENT_ACTIVE;
        }
    }
}

void attackerGradient(const model::GameModel& model, int m,
                      const model::AllocationMatrix& x, const model::AllocationMatrix& y,
                      const ActiveSet& active, JammerObjective objective,
                      std::span<double> grad) {
    std::fill(grad.begin(), grad.end(), 0.0);

    for (int i : active.channels()) {
        if (!isEligibleTarget(model, objective, i)) continue;

        int owner = model.owner(i);
        double power = x(owner, i);
        if (power <= 0.0) continue;

        double interference = model.interference(i, y);
        double signal = power * model.h(owner, i);
        grad[i] = (signal * model.g(m, i)) / (interference * (interference + signal));
    }
}

} // namespace engine
} // namespace jamgame
