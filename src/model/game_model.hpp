#pragma once

#include "jamgame/equilibrium.hpp"
#include "allocation_matrix.hpp"
#include <vector>

namespace jamgame {
namespace model {

/**
 * Read-only description of one game instance.
 *
 * Built once per run from validated parameters and owned by that run, so
 * parallel sweep points never share gain matrices or channel tables.
 */
class GameModel {
public:
    // params must have passed validateParams()
    explicit GameModel(const EquilibriumParams& params);

    int numChannels() const { return n_; }
    int numDefenders() const { return d_; }
    int numAttackers() const { return m_; }

    ChannelType type(int i) const { return channels_[i].type; }
    int owner(int i) const { return channels_[i].owner; }
    bool isReal(int i) const { return channels_[i].type == ChannelType::REAL; }
    bool isDecoy(int i) const { return channels_[i].type == ChannelType::DECOY; }
    bool isInactive(int i) const { return channels_[i].type == ChannelType::INACTIVE; }

    double h(int d, int i) const { return h_(d, i); }
    double g(int m, int i) const { return g_(m, i); }

    double defenderBudget(int d) const { return pt_[d]; }
    double attackerBudget(int m) const { return pj_[m]; }

    double sigma2() const { return params_.sigma2; }
    double tau() const { return params_.tau; }
    const EquilibriumParams& params() const { return params_; }

    // sigma2 + sum_m y[m][i] * g[m][i]
    double interference(int i, const AllocationMatrix& y) const;

    // Owned, non-inactive channels of defender d in index order
    const std::vector<int>& ownedChannels(int d) const { return owned_[d]; }

    int realChannelCount() const { return real_count_; }

private:
    EquilibriumParams params_;
    int n_;
    int d_;
    int m_;
    std::vector<ChannelConfig> channels_;
    AllocationMatrix h_;
    AllocationMatrix g_;
    std::vector<double> pt_;
    std::vector<double> pj_;
    std::vector<std::vector<int>> owned_;
    int real_count_ = 0;
};

} // namespace model
} // namespace jamgame
