#pragma once

#include "model/game_model.hpp"
#include <cstdint>
#include <vector>

namespace jamgame {
namespace engine {

/**
 * Channels visible to the jammers this iteration.
 *
 * A channel is active iff it is not INACTIVE and its owner's power is at
 * or above tau. Recomputed from scratch after every defender update; no
 * state carries over between iterations.
 */
class ActiveSet {
public:
    ActiveSet() = default;
    explicit ActiveSet(int num_channels) : mask_(num_channels, 0) {}

    void add(int i) {
        if (!mask_[i]) {
            mask_[i] = 1;
            channels_.push_back(i);
        }
    }

    bool contains(int i) const { return mask_[i] != 0; }
    size_t size() const { return channels_.size(); }
    bool empty() const { return channels_.empty(); }

    // Active channel indices in ascending order
    const std::vector<int>& channels() const { return channels_; }

private:
    std::vector<uint8_t> mask_;
    std::vector<int> channels_;
};

ActiveSet computeActiveSet(const model::GameModel& model, const model::AllocationMatrix& x);

// Whether a jammer with this objective would target active channel i
bool isEligibleTarget(const model::GameModel& model, JammerObjective objective, int i);

// Active channels the jammer targets: all of them (deception) or only real ones (oracle)
std::vector<int> eligibleChannels(const model::GameModel& model, const ActiveSet& active,
                                  JammerObjective objective);

} // namespace engine
} // namespace jamgame
