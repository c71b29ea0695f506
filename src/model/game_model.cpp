#include "game_model.hpp"

namespace jamgame {
namespace model {

GameModel::GameModel(const EquilibriumParams& params)
    : params_(params)
    , n_(params.N)
    , d_(params.D)
    , m_(params.M)
    , channels_(params.channels)
    , h_(AllocationMatrix::fromRows(params.h, params.N))
    , g_(AllocationMatrix::fromRows(params.g, params.N))
    , pt_(params.PT)
    , pj_(params.PJ)
    , owned_(params.D)
{
    for (int i = 0; i < n_; ++i) {
        const auto& ch = channels_[i];
        if (ch.type == ChannelType::REAL) real_count_++;
        if (ch.type != ChannelType::INACTIVE) {
            owned_[ch.owner].push_back(i);
        }
    }
}

double GameModel::interference(int i, const AllocationMatrix& y) const {
    double total = params_.sigma2;
    for (int m = 0; m < m_; ++m) {
        total += y(m, i) * g_(m, i);
    }
    return total;
}

} // namespace model
} // namespace jamgame
