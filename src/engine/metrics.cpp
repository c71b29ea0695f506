#include "metrics.hpp"
#include <cmath>

namespace jamgame {
namespace engine {

std::vector<ChannelSummary> buildChannelSummary(const model::GameModel& model,
                                                const model::AllocationMatrix& x,
                                                const model::AllocationMatrix& y,
                                                const ActiveSet& active) {
    const int N = model.numChannels();
    const int M = model.numAttackers();

    std::vector<ChannelSummary> summary;
    summary.reserve(N);

    for (int i = 0; i < N; ++i) {
        int owner = model.owner(i);

        ChannelSummary row;
        row.channel = i;
        row.owner = owner;
        row.type = model.type(i);
        row.total_defender_power = x(owner, i);
        row.total_attacker_power = y.columnSum(i);

        if (row.total_defender_power > 0.0) {
            row.sinr = (row.total_defender_power * model.h(owner, i)) / model.interference(i, y);
            row.rate = std::log2(1.0 + row.sinr);
        }

        row.h = model.h(owner, i);
        double g_sum = 0.0;
        for (int m = 0; m < M; ++m) g_sum += model.g(m, i);
        row.g = g_sum / M;

        row.is_active = active.contains(i);
        summary.push_back(row);
    }

    return summary;
}

EquilibriumMetrics computeMetrics(const model::GameModel& model,
                                  const model::AllocationMatrix& x,
                                  const model::AllocationMatrix& y,
                                  const ActiveSet& active) {
    EquilibriumMetrics metrics;

    double jammer_on_decoys = 0.0;
    double jammer_total = 0.0;

    for (int i = 0; i < model.numChannels(); ++i) {
        int owner = model.owner(i);
        double def_power = x(owner, i);
        double jam_power = y.columnSum(i);
        jammer_total += jam_power;

        if (model.isReal(i)) {
            metrics.real_channel_count++;
            if (def_power > 0.0) {
                double sinr = (def_power * model.h(owner, i)) / model.interference(i, y);
                metrics.total_real_throughput += std::log2(1.0 + sinr);
            }
        } else if (model.isDecoy(i)) {
            metrics.total_decoy_power += def_power;
            jammer_on_decoys += jam_power;
        }
    }

    metrics.active_channel_count = static_cast<int>(active.size());
    metrics.jammer_waste_on_decoys = (jammer_total > 0.0) ? jammer_on_decoys / jammer_total : 0.0;
    metrics.dilution_factor = (metrics.real_channel_count > 0)
        ? static_cast<double>(metrics.active_channel_count) / metrics.real_channel_count
        : 1.0;

    return metrics;
}

bool checkSymmetricEquilibrium(const std::vector<PlayerAllocation>& defenders, double epsilon) {
    if (defenders.size() <= 1) return false;

    const auto& first = defenders[0].allocation;
    for (size_t d = 1; d < defenders.size(); ++d) {
        const auto& alloc = defenders[d].allocation;
        double diff = 0.0;
        for (size_t i = 0; i < alloc.size() && i < first.size(); ++i) {
            diff += std::abs(alloc[i] - first[i]);
        }
        if (diff >= epsilon * 10.0) return false;
    }
    return true;
}

} // namespace engine
} // namespace jamgame
