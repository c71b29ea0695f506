#pragma once

#include "jamgame/equilibrium.hpp"
#include <iosfwd>
#include <string>

namespace jamgame {
namespace scenario {

/**
 * INI scenario files
 *
 *   [Game]     channels, defenders, attackers, sigma2, tau
 *   [Budgets]  PT, PJ                 (comma lists; one value fills every player)
 *   [Solver]   alpha, max_iter, epsilon
 *   [Jammer]   strategy, objective, attacker_mode, top_k
 *   [Init]     random, mode, seed
 *   [Gains]    distribution, seed, h0..h{D-1}, g0..g{M-1} (rows for custom)
 *   [Channels] types, owners          (comma lists of N entries)
 *
 * Missing keys fall back to defaultEquilibriumParams() for the given
 * sizes. Loading checks syntax and names only; range checks are left to
 * validateParams().
 */
class ScenarioFile {
public:
    // Returns false and sets error on unreadable files or bad values
    static bool load(const std::string& path, EquilibriumParams& params, std::string& error);
    static bool parse(std::istream& in, EquilibriumParams& params, std::string& error);

    // Gains are written out as custom rows so a reload reproduces the run
    static bool save(const std::string& path, const EquilibriumParams& params);
    static void write(std::ostream& out, const EquilibriumParams& params);
};

} // namespace scenario
} // namespace jamgame
