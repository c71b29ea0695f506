#include "jammer_strategy.hpp"
#include "projection.hpp"
#include "utility.hpp"
#include "jamgame/logging.hpp"
#include <algorithm>
#include <vector>

namespace jamgame {
namespace engine {

namespace {

void splitEvenly(const std::vector<int>& channels, double budget, std::span<double> out) {
    if (channels.empty()) return;
    double power = budget / static_cast<double>(channels.size());
    for (int i : channels) out[i] = power;
}

} // namespace

// ============================================================================
// J1: Uniform
// ============================================================================

void UniformJammer::allocate(int m, const JammerContext& ctx, std::span<double> out) const {
    std::fill(out.begin(), out.end(), 0.0);

    auto targets = eligibleChannels(ctx.model, ctx.active, objective_);
    splitEvenly(targets, ctx.model.attackerBudget(m), out);

    LOG_JAMMER(TRACE, "J1 attacker %d: %zu targets", m, targets.size());
}

// ============================================================================
// J2: Top-K concentration
// ============================================================================

void TopKJammer::allocate(int m, const JammerContext& ctx, std::span<double> out) const {
    std::fill(out.begin(), out.end(), 0.0);

    struct Scored {
        int index;
        double score;
    };

    // Perceived value of a channel: its owner's power seen through our gain
    std::vector<Scored> scored;
    for (int i : eligibleChannels(ctx.model, ctx.active, objective_)) {
        scored.push_back({i, ctx.x(ctx.model.owner(i), i) * ctx.model.g(m, i)});
    }
    if (scored.empty()) return;

    // Stable so ties keep channel order
    std::stable_sort(scored.begin(), scored.end(),
                     [](const Scored& a, const Scored& b) { return a.score > b.score; });

    size_t count = std::min(static_cast<size_t>(top_k_), scored.size());
    double total_score = 0.0;
    for (size_t k = 0; k < count; ++k) total_score += scored[k].score;

    double budget = ctx.model.attackerBudget(m);
    for (size_t k = 0; k < count; ++k) {
        out[scored[k].index] = (total_score > 0.0)
            ? (scored[k].score / total_score) * budget
            : budget / static_cast<double>(count);
    }

    LOG_JAMMER(TRACE, "J2 attacker %d: %zu of %zu targets, score %.4f", m, count, scored.size(), total_score);
}

// ============================================================================
// J3: Gradient-based
// ============================================================================

void GradientJammer::allocate(int m, const JammerContext& ctx, std::span<double> out) const {
    std::fill(out.begin(), out.end(), 0.0);
    if (ctx.active.empty()) return;

    std::vector<double> grad(out.size());
    attackerGradient(ctx.model, m, ctx.x, ctx.y, ctx.active, objective_, grad);

    double positive_sum = 0.0;
    for (double v : grad) positive_sum += std::max(0.0, v);

    double budget = ctx.model.attackerBudget(m);
    if (positive_sum > 0.0) {
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = (std::max(0.0, grad[i]) / positive_sum) * budget;
        }
    } else {
        // Nothing worth jamming by gradient: fall back to uniform
        splitEvenly(eligibleChannels(ctx.model, ctx.active, objective_), budget, out);
    }
}

void GradientJammer::respond(int m, const JammerContext& ctx, std::span<double> out) const {
    if (mode_ == AttackerMode::COORDINATED) {
        allocate(m, ctx, out);
        return;
    }

    std::vector<double> grad(out.size());
    attackerGradient(ctx.model, m, ctx.x, ctx.y, ctx.active, objective_, grad);

    auto current = ctx.y.row(m);
    std::vector<double> update(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        update[i] = current[i] + STEP_SIZE * grad[i];
    }
    projectToBudget(update, ctx.model.attackerBudget(m), out);
}

std::unique_ptr<IJammerStrategy> createJammerStrategy(const EquilibriumParams& params) {
    switch (params.jammer_strategy) {
        case JammerStrategy::UNIFORM:
            return std::make_unique<UniformJammer>(params.jammer_objective);

        case JammerStrategy::TOP_K:
            return std::make_unique<TopKJammer>(params.jammer_objective, params.top_k);

        case JammerStrategy::GRADIENT:
            return std::make_unique<GradientJammer>(params.jammer_objective, params.attacker_mode);

        default:
            return std::make_unique<UniformJammer>(params.jammer_objective);
    }
}

} // namespace engine
} // namespace jamgame
