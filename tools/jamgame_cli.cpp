/**
 * jamgame CLI - Decoy/jammer equilibrium runner
 *
 * Solves one game (or a parameter sweep) and prints allocations, the
 * per-channel summary and equilibrium metrics.
 *
 * Usage:
 *   ./jamgame_cli [options]
 *
 * Options:
 *   --scenario <file>   Load an INI scenario (default: built-in 12-channel game)
 *   --sweep <var> <min> <max> <step>
 *                       Sweep ND, tau, N, M, D or PJ instead of a single run
 *   --help              List all options
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <stdexcept>

#include "jamgame/equilibrium.hpp"
#include "jamgame/logging.hpp"
#include "scenario/scenario_file.hpp"
#include "sweep/sweep.hpp"

using namespace jamgame;

class EquilibriumCLI {
public:
    EquilibriumCLI() : params_(defaultEquilibriumParams()) {}

    EquilibriumParams& params() { return params_; }

    void setShowHistory(bool v) { show_history_ = v; }
    void setOracle(bool v) { oracle_ = v; }
    void setSweep(const sweep::SweepConfig& config) { sweep_ = config; }
    void setThreads(unsigned n) { threads_ = n; }
    void setSavePath(const std::string& path) { save_path_ = path; }

    int run() {
        if (auto err = validateParams(params_)) {
            std::cerr << "Invalid parameters: " << *err << "\n";
            return 1;
        }

        if (!save_path_.empty()) {
            if (!scenario::ScenarioFile::save(save_path_, params_)) {
                std::cerr << "Could not write " << save_path_ << "\n";
                return 1;
            }
            std::cout << "Scenario saved to " << save_path_ << "\n";
        }

        printHeader();

        if (sweep_) {
            return runSweep();
        }

        EquilibriumResult result = oracle_ ? solveWithOracleBaseline(params_) : solveEquilibrium(params_);
        printPlayers(result);
        printChannels(result);
        printMetrics(result.metrics);
        if (result.oracle_result) {
            std::cout << "\n=== ORACLE BASELINE ===\n";
            printMetrics(result.oracle_result->metrics);
        }
        if (show_history_) {
            printHistory(result);
        }
        printStatus(result);
        return 0;
    }

private:
    int runSweep() {
        sweep::SweepConfig config = *sweep_;
        config.threads = threads_;
        config.oracle_comparison = oracle_;

        if (auto err = sweep::validateSweepConfig(config)) {
            std::cerr << "Invalid sweep: " << *err << "\n";
            return 1;
        }

        sweep::SweepResult result = sweep::runSweep(params_, config);

        std::cout << "\n=== SWEEP: " << sweep::sweepVariableToString(result.variable) << " ===\n";
        std::cout << std::setw(10) << "value" << std::setw(12) << "U_real";
        if (oracle_) std::cout << std::setw(12) << "U_oracle";
        std::cout << std::setw(12) << "dilution" << std::setw(12) << "waste"
                  << std::setw(8) << "iters" << "  status\n";

        auto printPoint = [&](const sweep::SweepPoint& p) {
            std::cout << std::fixed << std::setprecision(3)
                      << std::setw(10) << p.variable << std::setw(12) << p.u_real;
            if (oracle_) std::cout << std::setw(12) << p.u_oracle.value_or(0.0);
            std::cout << std::setw(12) << p.dilution_factor << std::setw(12) << p.jammer_waste
                      << std::setw(8) << p.iterations << "  ";
            if (!p.error.empty()) {
                std::cout << "\033[31m" << p.error << "\033[0m\n";
            } else {
                std::cout << (p.converged ? "converged" : "exhausted") << "\n";
            }
        };

        for (const auto& p : result.points) printPoint(p);

        std::cout << "\nBaseline (" << sweep::sweepVariableToString(result.variable) << "="
                  << result.baseline.variable << "): U_real = " << result.baseline.u_real << "\n";
        std::cout << "Best     (" << sweep::sweepVariableToString(result.variable) << "="
                  << result.best_point.variable << "): U_real = " << result.best_point.u_real
                  << " (" << std::showpos << std::setprecision(1) << result.improvement_percent
                  << std::noshowpos << "%)\n";
        return 0;
    }

    void printHeader() {
        auto counts = countChannelTypes(params_.channels);
        std::cout << "\n";
        std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
        std::cout << "║              Decoy / Jammer Equilibrium Solver               ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
        std::cout << "\n";
        std::cout << "Configuration:\n";
        std::cout << "  Channels:   " << params_.N << " (" << counts.real << " real, "
                  << counts.decoy << " decoy, " << counts.inactive << " inactive)\n";
        std::cout << "  Players:    " << params_.D << " defenders, " << params_.M << " attackers\n";
        std::cout << "  Jammer:     " << jammerStrategyToString(params_.jammer_strategy) << ", "
                  << jammerObjectiveToString(params_.jammer_objective) << ", "
                  << attackerModeToString(params_.attacker_mode) << "\n";
        std::cout << "  Noise/tau:  sigma2=" << params_.sigma2 << " tau=" << params_.tau << "\n";
        std::cout << "  Iteration:  alpha=" << params_.alpha << " eps=" << params_.epsilon
                  << " maxIter=" << params_.max_iter << "\n";
        std::cout << "  Init:       " << initModeToString(params_.effectiveInitMode());
        if (params_.seed) std::cout << " (seed " << *params_.seed << ")";
        std::cout << "\n";
    }

    void printRow(const char* label, const PlayerAllocation& p) {
        std::cout << "  " << label << std::setw(2) << p.player_id << "  U="
                  << std::setw(9) << p.utility << "  [";
        for (size_t i = 0; i < p.allocation.size(); ++i) {
            if (i) std::cout << " ";
            std::cout << std::setw(6) << p.allocation[i];
        }
        std::cout << "]\n";
    }

    void printPlayers(const EquilibriumResult& result) {
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "\n=== ALLOCATIONS ===\n";
        for (const auto& d : result.defenders) printRow("Defender", d);
        for (const auto& m : result.attackers) printRow("Attacker", m);
    }

    void printChannels(const EquilibriumResult& result) {
        std::cout << "\n=== CHANNELS ===\n";
        std::cout << std::setw(4) << "ch" << std::setw(7) << "owner" << std::setw(10) << "type"
                  << std::setw(10) << "x" << std::setw(10) << "y" << std::setw(10) << "SINR"
                  << std::setw(10) << "rate" << std::setw(8) << "h" << std::setw(8) << "g"
                  << "  active\n";
        for (const auto& ch : result.channel_summary) {
            std::cout << std::setw(4) << ch.channel << std::setw(7) << ch.owner
                      << std::setw(10) << channelTypeToString(ch.type)
                      << std::setw(10) << ch.total_defender_power
                      << std::setw(10) << ch.total_attacker_power
                      << std::setw(10) << ch.sinr << std::setw(10) << ch.rate
                      << std::setw(8) << ch.h << std::setw(8) << ch.g
                      << "  " << (ch.is_active ? "yes" : "-") << "\n";
        }
    }

    void printMetrics(const EquilibriumMetrics& m) {
        std::cout << "\n=== METRICS ===\n";
        std::cout << "  Real throughput:   " << m.total_real_throughput << " bit/s/Hz\n";
        std::cout << "  Decoy power:       " << m.total_decoy_power << "\n";
        std::cout << "  Jammer waste:      " << m.jammer_waste_on_decoys * 100.0 << " %\n";
        std::cout << "  Dilution factor:   " << m.dilution_factor << " ("
                  << m.active_channel_count << " active / " << m.real_channel_count << " real)\n";
        std::cout << "  Symmetric:         " << (m.symmetric_equilibrium ? "yes" : "no") << "\n";
    }

    void printHistory(const EquilibriumResult& result) {
        std::cout << "\n=== CONVERGENCE ===\n";
        std::cout << std::setw(6) << "iter" << std::setw(14) << "maxChange" << "  defender utilities\n";
        for (const auto& e : result.convergence_history) {
            std::cout << std::setw(6) << e.iter << std::setw(14) << std::scientific
                      << std::setprecision(3) << e.max_change << std::fixed << " ";
            for (double u : e.defender_utilities) std::cout << " " << std::setw(8) << u;
            std::cout << "\n";
        }
    }

    void printStatus(const EquilibriumResult& result) {
        std::cout << "\n";
        if (result.converged) {
            std::cout << "  \033[32m✓ Converged after " << result.iterations << " iterations\033[0m";
        } else {
            std::cout << "  \033[33m✗ Not converged after " << result.iterations << " iterations\033[0m";
        }
        std::cout << " (maxChange " << std::scientific << std::setprecision(3)
                  << result.max_change << std::fixed << ")\n\n";
    }

    EquilibriumParams params_;
    bool show_history_ = false;
    bool oracle_ = false;
    std::optional<sweep::SweepConfig> sweep_;
    unsigned threads_ = 0;
    std::string save_path_;
};

static void printUsage(const char* name) {
    std::cout << "jamgame - Decoy/jammer equilibrium solver\n\n";
    std::cout << "Usage: " << name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --scenario <file>     Load scenario INI file\n";
    std::cout << "  --channels <N>        Default layout with N channels (default: 12)\n";
    std::cout << "  --strategy <s>        uniform | topk | gradient\n";
    std::cout << "  --objective <o>       deception | oracle\n";
    std::cout << "  --attackers <mode>    coordinated | independent\n";
    std::cout << "  --topk <K>            Targets for the top-K jammer\n";
    std::cout << "  --seed <n>            Seed for random init and gains\n";
    std::cout << "  --random-init         Seeded random defender initialization\n";
    std::cout << "  --gains <dist>        uniform | rayleigh (random gains)\n";
    std::cout << "  --oracle              Also solve against an oracle jammer\n";
    std::cout << "  --history             Print the convergence history\n";
    std::cout << "  --sweep <var> <min> <max> <step>\n";
    std::cout << "                        Sweep ND | tau | N | M | D | PJ\n";
    std::cout << "  --threads <n>         Sweep worker threads (default: all cores)\n";
    std::cout << "  --save <file>         Write the effective scenario to file\n";
    std::cout << "  --verbose             Debug logging\n";
    std::cout << "  --quiet               Errors only\n";
}

template <typename T, typename P>
static T parseOrThrow(const std::string& option, const std::string& value, P parse) {
    auto parsed = parse(value);
    if (!parsed) throw std::invalid_argument(option + ": unknown value '" + value + "'");
    return *parsed;
}

int main(int argc, char* argv[]) {
    EquilibriumCLI cli;
    auto& params = cli.params();
    std::optional<GainDistribution> gains;

    setLogLevel(LogLevel::WARN);

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--scenario" && has_value) {
                std::string error;
                if (!scenario::ScenarioFile::load(argv[++i], params, error)) {
                    std::cerr << error << "\n";
                    return 1;
                }
            } else if (arg == "--channels" && has_value) {
                params = defaultEquilibriumParams(std::stoi(argv[++i]));
            } else if (arg == "--strategy" && has_value) {
                params.jammer_strategy = parseOrThrow<JammerStrategy>(arg, argv[++i], parseJammerStrategy);
            } else if (arg == "--objective" && has_value) {
                params.jammer_objective = parseOrThrow<JammerObjective>(arg, argv[++i], parseJammerObjective);
            } else if (arg == "--attackers" && has_value) {
                params.attacker_mode = parseOrThrow<AttackerMode>(arg, argv[++i], parseAttackerMode);
            } else if (arg == "--topk" && has_value) {
                params.top_k = std::stoi(argv[++i]);
            } else if (arg == "--seed" && has_value) {
                params.seed = std::stoull(argv[++i]);
            } else if (arg == "--random-init") {
                params.random_init = true;
            } else if (arg == "--gains" && has_value) {
                gains = parseOrThrow<GainDistribution>(arg, argv[++i], parseGainDistribution);
            } else if (arg == "--oracle") {
                cli.setOracle(true);
            } else if (arg == "--history") {
                cli.setShowHistory(true);
            } else if (arg == "--sweep" && i + 4 < argc) {
                sweep::SweepConfig config;
                config.variable = parseOrThrow<sweep::SweepVariable>(arg, argv[++i], sweep::parseSweepVariable);
                config.min = std::stod(argv[++i]);
                config.max = std::stod(argv[++i]);
                config.step = std::stod(argv[++i]);
                cli.setSweep(config);
            } else if (arg == "--threads" && has_value) {
                cli.setThreads(static_cast<unsigned>(std::stoul(argv[++i])));
            } else if (arg == "--save" && has_value) {
                cli.setSavePath(argv[++i]);
            } else if (arg == "--verbose" || arg == "-v") {
                setLogLevel(LogLevel::DEBUG);
            } else if (arg == "--quiet" || arg == "-q") {
                setLogLevel(LogLevel::ERROR);
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument: " << e.what() << "\n";
        return 1;
    }

    // Applied last so --channels/--scenario don't overwrite generated gains
    if (gains) {
        generateGains(params, *gains, params.seed);
    }

    return cli.run();
}
