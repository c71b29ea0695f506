#include "sweep.hpp"
#include "jamgame/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace jamgame {
namespace sweep {

const char* sweepVariableToString(SweepVariable variable) {
    switch (variable) {
        case SweepVariable::ND:  return "ND";
        case SweepVariable::TAU: return "tau";
        case SweepVariable::N:   return "N";
        case SweepVariable::M:   return "M";
        case SweepVariable::D:   return "D";
        case SweepVariable::PJ:  return "PJ";
        default:                 return "unknown";
    }
}

std::optional<SweepVariable> parseSweepVariable(const std::string& name) {
    std::string s;
    for (char c : name) s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "nd") return SweepVariable::ND;
    if (s == "tau") return SweepVariable::TAU;
    if (s == "n") return SweepVariable::N;
    if (s == "m") return SweepVariable::M;
    if (s == "d") return SweepVariable::D;
    if (s == "pj") return SweepVariable::PJ;
    return std::nullopt;
}

std::optional<std::string> validateSweepConfig(const SweepConfig& config) {
    if (!std::isfinite(config.min) || !std::isfinite(config.max) || !std::isfinite(config.step)) {
        return "sweep range must be finite";
    }
    if (config.step <= 0.0) {
        return "sweep step must be > 0";
    }
    if (config.max < config.min) {
        return "sweep max must be >= min";
    }
    // Tolerance so 0.1-style steps still reach max
    double count = std::floor((config.max - config.min) / config.step + 1e-9) + 1.0;
    if (count > MAX_SWEEP_POINTS) {
        return "sweep range exceeds maximum of " + std::to_string(MAX_SWEEP_POINTS) + " points";
    }
    return std::nullopt;
}

std::vector<double> sweepRange(const SweepConfig& config) {
    std::vector<double> values;
    if (validateSweepConfig(config)) return values;

    int count = static_cast<int>(std::floor((config.max - config.min) / config.step + 1e-9)) + 1;
    for (int k = 0; k < count; ++k) {
        values.push_back(config.min + k * config.step);
    }
    return values;
}

namespace {

// Rounded count, bounded above every size limit so oversized counts still
// reach validation without overflowing the cast
int roundedCount(double value, int floor) {
    double bounded = std::clamp(value, static_cast<double>(floor), 1000.0);
    return static_cast<int>(std::lround(bounded));
}

} // namespace

EquilibriumParams applySweepValue(const EquilibriumParams& base, SweepVariable variable, double value) {
    EquilibriumParams p = base;

    switch (variable) {
        case SweepVariable::ND: {
            // Real channels stay; non-real channels in index order become decoys
            // until the target is met, the rest go inactive
            int real = countChannelTypes(base.channels).real;
            long target = std::min<long>(roundedCount(value, 0), base.N - real);
            long decoys = 0;
            for (auto& ch : p.channels) {
                if (ch.type == ChannelType::REAL) continue;
                if (decoys < target) {
                    ch.type = ChannelType::DECOY;
                    decoys++;
                } else {
                    ch.type = ChannelType::INACTIVE;
                }
            }
            break;
        }

        case SweepVariable::TAU:
            p.tau = value;
            break;

        case SweepVariable::N: {
            int n = roundedCount(value, 4);
            if (n == base.N) break;
            p.N = n;
            for (auto& row : p.h) row.resize(n, 1.0);
            for (auto& row : p.g) row.resize(n, 1.0);
            if (n > static_cast<int>(base.channels.size())) {
                int added = n - static_cast<int>(base.channels.size());
                for (int k = 0; k < added; ++k) {
                    p.channels.push_back({ChannelType::INACTIVE, k % base.D});
                }
            } else {
                p.channels.resize(n);
            }
            break;
        }

        case SweepVariable::M: {
            int m = roundedCount(value, 1);
            p.M = m;
            p.PJ.resize(m, 10.0);
            p.g.resize(m, std::vector<double>(base.N, 1.0));
            break;
        }

        case SweepVariable::D: {
            int d = roundedCount(value, 1);
            p.D = d;
            p.PT.resize(d, 10.0);
            p.h.resize(d, std::vector<double>(base.N, 1.0));
            for (auto& ch : p.channels) {
                if (ch.owner >= d) ch.owner = ch.owner % d;
            }
            break;
        }

        case SweepVariable::PJ: {
            double per_attacker = value / base.M;
            p.PJ.assign(base.M, per_attacker);
            break;
        }
    }

    return p;
}

namespace {

SweepPoint runPoint(const EquilibriumParams& base, const SweepConfig& config, double value) {
    SweepPoint point;
    point.variable = value;

    EquilibriumParams params = applySweepValue(base, config.variable, value);
    if (auto err = validateParams(params)) {
        LOG_SWEEP(WARN, "Sweep point %s=%g failed: %s",
                  sweepVariableToString(config.variable), value, err->c_str());
        point.error = *err;
        return point;
    }

    EquilibriumResult result;
    if (config.solve) {
        result = config.solve(params);
    } else if (config.oracle_comparison) {
        result = solveWithOracleBaseline(params);
    } else {
        result = solveEquilibrium(params);
    }

    point.u_real = result.metrics.total_real_throughput;
    point.dilution_factor = result.metrics.dilution_factor;
    point.jammer_waste = result.metrics.jammer_waste_on_decoys;
    point.converged = result.converged;
    point.iterations = result.iterations;
    if (result.oracle_result) {
        point.u_oracle = result.oracle_result->metrics.total_real_throughput;
    }
    return point;
}

} // namespace

SweepResult runSweep(const EquilibriumParams& base, const SweepConfig& config) {
    if (auto err = validateSweepConfig(config)) {
        throw std::invalid_argument(*err);
    }

    std::vector<double> range = sweepRange(config);

    // Slot 0 is the baseline (range minimum), the rest are the range points.
    // Each task writes only its own slot.
    std::vector<double> values;
    values.push_back(config.min);
    values.insert(values.end(), range.begin(), range.end());
    std::vector<SweepPoint> slots(values.size());

    unsigned n_threads = config.threads;
    if (n_threads == 0) {
        n_threads = std::thread::hardware_concurrency();
        if (n_threads == 0) n_threads = 1;
    }
    n_threads = std::min<unsigned>(n_threads, static_cast<unsigned>(values.size()));

    LOG_SWEEP(INFO, "Sweep %s over %zu points on %u threads",
              sweepVariableToString(config.variable), range.size(), n_threads);

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t k = next.fetch_add(1); k < values.size(); k = next.fetch_add(1)) {
            try {
                slots[k] = runPoint(base, config, values[k]);
            } catch (const std::exception& e) {
                LOG_SWEEP(ERROR, "Sweep point %s=%g threw: %s",
                          sweepVariableToString(config.variable), values[k], e.what());
                SweepPoint failed;
                failed.variable = values[k];
                failed.error = e.what();
                slots[k] = std::move(failed);
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(n_threads);
    for (unsigned t = 0; t < n_threads; ++t) {
        pool.emplace_back(worker);
    }
    for (auto& th : pool) {
        th.join();
    }

    SweepResult result;
    result.variable = config.variable;
    result.baseline = slots[0];
    result.points.assign(slots.begin() + 1, slots.end());

    result.best_point = result.baseline;
    for (const auto& point : result.points) {
        if (point.u_real > result.best_point.u_real) {
            result.best_point = point;
        }
    }

    if (result.baseline.u_real > 0.0) {
        result.improvement_percent =
            (result.best_point.u_real - result.baseline.u_real) / result.baseline.u_real * 100.0;
    }

    LOG_SWEEP(INFO, "Best %s = %g with U_real = %.4f (%+.1f%% vs baseline)",
              sweepVariableToString(config.variable), result.best_point.variable,
              result.best_point.u_real, result.improvement_percent);

    return result;
}

} // namespace sweep
} // namespace jamgame
