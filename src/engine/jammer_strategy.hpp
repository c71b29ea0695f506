#pragma once

#include "activation.hpp"
#include "model/game_model.hpp"
#include <memory>
#include <span>

namespace jamgame {
namespace engine {

// Joint state a jammer reacts to
struct JammerContext {
    const model::GameModel& model;
    const model::AllocationMatrix& x;   // Defender allocations (current)
    const model::AllocationMatrix& y;   // Attacker allocations (current)
    const ActiveSet& active;
};

/**
 * Abstract Jammer Strategy Interface
 *
 * Common interface for the attacker allocation policies:
 * - Uniform (J1): equal split over eligible active channels
 * - Top-K (J2): concentrate on the highest perceived-value channels
 * - Gradient (J3): follow the attacker utility gradient
 *
 * "Eligible" means every active channel for a deception jammer and only
 * the active real channels for an oracle jammer. All implementations fill
 * a full row summing to the attacker budget, or all zeros when nothing is
 * eligible.
 */
class IJammerStrategy {
public:
    virtual ~IJammerStrategy() = default;

    virtual JammerStrategy getStrategy() const = 0;

    // Allocation row for attacker m against the given state
    virtual void allocate(int m, const JammerContext& ctx, std::span<double> out) const = 0;

    // Candidate row for attacker m during iteration (before damping).
    // Defaults to allocate(); only the independent gradient jammer differs.
    virtual void respond(int m, const JammerContext& ctx, std::span<double> out) const {
        allocate(m, ctx, out);
    }
};

class UniformJammer : public IJammerStrategy {
public:
    explicit UniformJammer(JammerObjective objective) : objective_(objective) {}

    JammerStrategy getStrategy() const override { return JammerStrategy::UNIFORM; }
    void allocate(int m, const JammerContext& ctx, std::span<double> out) const override;

private:
    JammerObjective objective_;
};

class TopKJammer : public IJammerStrategy {
public:
    TopKJammer(JammerObjective objective, int top_k) : objective_(objective), top_k_(top_k) {}

    JammerStrategy getStrategy() const override { return JammerStrategy::TOP_K; }
    void allocate(int m, const JammerContext& ctx, std::span<double> out) const override;

private:
    JammerObjective objective_;
    int top_k_;
};

/**
 * Gradient jammer.
 *
 * allocate(): keep the non-negative gradient components and scale them to
 * the budget; uniform over eligible channels if none is positive.
 *
 * respond(): coordinated attackers use allocate(). An independent attacker
 * instead takes its own ascent step from its current row and projects the
 * result onto its budget. Attacker mode has no effect under the other
 * strategies.
 */
class GradientJammer : public IJammerStrategy {
public:
    // Same step as the defender ascent
    static constexpr double STEP_SIZE = 0.5;

    GradientJammer(JammerObjective objective, AttackerMode mode) : objective_(objective), mode_(mode) {}

    JammerStrategy getStrategy() const override { return JammerStrategy::GRADIENT; }
    void allocate(int m, const JammerContext& ctx, std::span<double> out) const override;
    void respond(int m, const JammerContext& ctx, std::span<double> out) const override;

    AttackerMode getMode() const { return mode_; }

private:
    JammerObjective objective_;
    AttackerMode mode_;
};

// Factory function to create the configured jammer strategy
std::unique_ptr<IJammerStrategy> createJammerStrategy(const EquilibriumParams& params);

} // namespace engine
} // namespace jamgame
