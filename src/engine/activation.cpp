#include "activation.hpp"

namespace jamgame {
namespace engine {

ActiveSet computeActiveSet(const model::GameModel& model, const model::AllocationMatrix& x) {
    ActiveSet active(model.numChannels());
    for (int i = 0; i < model.numChannels(); ++i) {
        if (model.isInactive(i)) continue;
        if (x(model.owner(i), i) >= model.tau()) {
            active.add(i);
        }
    }
    return active;
}

bool isEligibleTarget(const model::GameModel& model, JammerObjective objective, int i) {
    return objective != JammerObjective::ORACLE || model.isReal(i);
}

std::vector<int> eligibleChannels(const model::GameModel& model, const ActiveSet& active,
                                  JammerObjective objective) {
    std::vector<int> eligible;
    eligible.reserve(active.size());
    for (int i : active.channels()) {
        if (isEligibleTarget(model, objective, i)) {
            eligible.push_back(i);
        }
    }
    return eligible;
}

} // namespace engine
} // namespace jamgame
