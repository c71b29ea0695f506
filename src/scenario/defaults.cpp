#include "jamgame/equilibrium.hpp"
#include "model/seeded_random.hpp"
#include <algorithm>
#include <cmath>

namespace jamgame {

EquilibriumParams defaultEquilibriumParams(int N, int D, int M) {
    EquilibriumParams p;
    // Sizes below one player or channel are raised to one
    p.N = std::max(1, N);
    p.D = std::max(1, D);
    p.M = std::max(1, M);

    // Channels interleave across defenders: per defender, the first three
    // are real, the next two decoys, the rest inactive
    p.channels.clear();
    for (int i = 0; i < p.N; ++i) {
        int defender = i % p.D;
        int position = i / p.D;

        ChannelConfig ch;
        ch.owner = defender;
        if (position < 3) {
            ch.type = ChannelType::REAL;
        } else if (position < 5) {
            ch.type = ChannelType::DECOY;
        } else {
            ch.type = ChannelType::INACTIVE;
        }
        p.channels.push_back(ch);
    }

    p.h.assign(p.D, std::vector<double>(p.N, 1.0));
    p.g.assign(p.M, std::vector<double>(p.N, 1.0));
    p.PT.assign(p.D, 10.0);
    p.PJ.assign(p.M, 10.0);

    p.sigma2 = 1.0;
    p.tau = 0.2;
    p.alpha = 0.3;
    p.max_iter = 100;
    p.epsilon = 0.001;
    p.jammer_strategy = JammerStrategy::UNIFORM;
    p.jammer_objective = JammerObjective::DECEPTION;
    p.attacker_mode = AttackerMode::COORDINATED;
    p.top_k = 3;
    p.random_init = false;
    p.gain_distribution = GainDistribution::UNIFORM;
    return p;
}

void generateGains(EquilibriumParams& params, GainDistribution distribution, std::optional<uint64_t> seed) {
    params.gain_distribution = distribution;
    if (distribution == GainDistribution::CUSTOM) return;

    model::SeededRandom random(seed);
    auto draw = [&]() {
        double u = random.next();
        if (distribution == GainDistribution::RAYLEIGH) {
            // u can reach 1.0; keep the log finite
            double tail = std::max(1.0 - u, 1e-12);
            return std::sqrt(-2.0 * std::log(tail));
        }
        return 0.5 + u * 1.5;
    };

    params.h.assign(params.D, std::vector<double>(params.N));
    params.g.assign(params.M, std::vector<double>(params.N));
    for (auto& row : params.h)
        for (double& v : row) v = draw();
    for (auto& row : params.g)
        for (double& v : row) v = draw();
}

} // namespace jamgame
