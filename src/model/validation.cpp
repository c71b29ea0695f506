#include "jamgame/equilibrium.hpp"
#include <cmath>
#include <sstream>

namespace jamgame {

namespace {

// Format a bound without trailing zeros ("0.01", "10000", "1e-07")
std::string formatBound(double v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

std::optional<std::string> checkNumber(double value, const char* name, double min, double max) {
    if (!std::isfinite(value)) {
        return std::string(name) + " must be a finite number";
    }
    if (value < min || value > max) {
        return std::string(name) + " must be between " + formatBound(min) + " and " + formatBound(max);
    }
    return std::nullopt;
}

std::optional<std::string> checkBudgets(const std::vector<double>& budgets, const char* name, int expected) {
    if (static_cast<int>(budgets.size()) != expected) {
        return std::string(name) + " must have " + std::to_string(expected) + " entries";
    }
    for (size_t k = 0; k < budgets.size(); ++k) {
        std::string field = std::string(name) + "[" + std::to_string(k) + "]";
        if (auto err = checkNumber(budgets[k], field.c_str(), 0.0, MAX_POWER)) return err;
    }
    return std::nullopt;
}

std::optional<std::string> checkGains(const std::vector<std::vector<double>>& gains, const char* name,
                                      int rows, int cols) {
    if (static_cast<int>(gains.size()) != rows) {
        return std::string(name) + " must have " + std::to_string(rows) + " rows";
    }
    for (size_t r = 0; r < gains.size(); ++r) {
        if (static_cast<int>(gains[r].size()) != cols) {
            return std::string(name) + " row " + std::to_string(r) + " must have N entries";
        }
        for (double v : gains[r]) {
            if (!std::isfinite(v) || v < 0.0) {
                return std::string(name) + " must contain non-negative numbers";
            }
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> validateParams(const EquilibriumParams& p) {
    // Counts first: everything below is sized by them
    if (p.N < 1 || p.N > MAX_N)
        return "N must be between 1 and " + std::to_string(MAX_N);
    if (p.D < 1 || p.D > MAX_D)
        return "D must be between 1 and " + std::to_string(MAX_D);
    if (p.M < 1 || p.M > MAX_M)
        return "M must be between 1 and " + std::to_string(MAX_M);

    if (auto err = checkNumber(p.sigma2, "sigma2", 0.0001, MAX_POWER)) return err;
    if (auto err = checkNumber(p.tau, "tau", 0.0, MAX_POWER)) return err;
    if (auto err = checkNumber(p.alpha, "alpha", 0.01, 1.0)) return err;
    if (p.max_iter < 1 || p.max_iter > MAX_ITER)
        return "maxIter must be between 1 and " + std::to_string(MAX_ITER);
    if (auto err = checkNumber(p.epsilon, "epsilon", 0.0000001, 1.0)) return err;
    if (p.top_k < 1 || p.top_k > MAX_N)
        return "topK must be between 1 and " + std::to_string(MAX_N);

    if (auto err = checkBudgets(p.PT, "PT", p.D)) return err;
    if (auto err = checkBudgets(p.PJ, "PJ", p.M)) return err;

    if (auto err = checkGains(p.h, "h", p.D, p.N)) return err;
    if (auto err = checkGains(p.g, "g", p.M, p.N)) return err;

    if (static_cast<int>(p.channels.size()) != p.N) {
        return "channelConfig must have N entries";
    }
    for (int i = 0; i < p.N; ++i) {
        const auto& ch = p.channels[i];
        std::string field = "channelConfig[" + std::to_string(i) + "]";
        if (ch.owner < 0 || ch.owner >= p.D) {
            return field + ".owner must be < D";
        }
        switch (ch.type) {
            case ChannelType::REAL:
            case ChannelType::DECOY:
            case ChannelType::INACTIVE:
                break;
            default:
                return field + ".type must be real, decoy or inactive";
        }
    }

    switch (p.jammer_strategy) {
        case JammerStrategy::UNIFORM:
        case JammerStrategy::TOP_K:
        case JammerStrategy::GRADIENT:
            break;
        default:
            return "jammerStrategy must be J1_uniform, J2_topK, or J3_optimization";
    }
    switch (p.jammer_objective) {
        case JammerObjective::DECEPTION:
        case JammerObjective::ORACLE:
            break;
        default:
            return "jammerObjective must be deception or oracle";
    }
    switch (p.attacker_mode) {
        case AttackerMode::COORDINATED:
        case AttackerMode::INDEPENDENT:
            break;
        default:
            return "attackerMode must be coordinated or independent";
    }
    switch (p.init_mode) {
        case InitMode::UNIFORM:
        case InitMode::GAIN_WEIGHTED:
        case InitMode::RANDOM:
            break;
        default:
            return "initMode must be uniform, gain_weighted or random";
    }

    return std::nullopt;
}

} // namespace jamgame
