#include "jamgame/equilibrium.hpp"
#include "jamgame/logging.hpp"
#include "solver.hpp"
#include <stdexcept>

namespace jamgame {

EquilibriumResult solveEquilibrium(const EquilibriumParams& params) {
    if (auto err = validateParams(params)) {
        LOG_SOLVER(WARN, "Rejected parameters: %s", err->c_str());
        throw std::invalid_argument(*err);
    }

    engine::EquilibriumSolver solver(params);
    return solver.run();
}

EquilibriumResult solveWithOracleBaseline(const EquilibriumParams& params) {
    EquilibriumResult result = solveEquilibrium(params);

    EquilibriumParams oracle_params = params;
    oracle_params.jammer_objective = JammerObjective::ORACLE;
    EquilibriumResult oracle = solveEquilibrium(oracle_params);

    OracleResult attached;
    attached.defenders = std::move(oracle.defenders);
    attached.attackers = std::move(oracle.attackers);
    attached.metrics = oracle.metrics;
    result.oracle_result = std::move(attached);

    LOG_SOLVER(INFO, "Oracle baseline: U_real %.4f (configured) vs %.4f (oracle)",
               result.metrics.total_real_throughput,
               result.oracle_result->metrics.total_real_throughput);

    return result;
}

} // namespace jamgame
