#include "scenario_file.hpp"
#include "jamgame/logging.hpp"
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace jamgame {
namespace scenario {

namespace {

using KeyMap = std::unordered_map<std::string, std::string>;

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

std::string toLower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

// Keys come back as "section.key", lower-cased
KeyMap readKeys(std::istream& in) {
    KeyMap kv;
    std::string line;
    std::string section;
    while (std::getline(in, line)) {
        size_t cut = line.find_first_of("#;");
        if (cut != std::string::npos) line = line.substr(0, cut);
        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = toLower(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty() || value.empty()) continue;
        kv[section.empty() ? key : section + "." + key] = value;
    }
    return kv;
}

// Whole-string conversions; "12abc" or "0.9" as an integer is an error
int toInt(const std::string& s) {
    size_t pos = 0;
    int value = std::stoi(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("not an integer");
    return value;
}

double toDouble(const std::string& s) {
    size_t pos = 0;
    double value = std::stod(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("not a number");
    return value;
}

uint64_t toUnsigned(const std::string& s) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
        throw std::invalid_argument("not an unsigned integer");
    size_t pos = 0;
    unsigned long long value = std::stoull(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("not an unsigned integer");
    return static_cast<uint64_t>(value);
}

// Comma list; a single value is repeated to fill count
template <typename T, typename F>
std::vector<T> toList(const std::string& s, int count, F convert) {
    std::vector<T> values;
    for (const auto& item : splitList(s)) values.push_back(convert(item));
    if (values.size() == 1 && count > 1) values.assign(count, values[0]);
    if (static_cast<int>(values.size()) != count)
        throw std::invalid_argument("expected " + std::to_string(count) + " values");
    return values;
}

class Reader {
public:
    Reader(const KeyMap& kv, std::string& error) : kv_(kv), error_(error) {}

    bool has(const std::string& key) const { return kv_.count(key) != 0; }
    bool failed() const { return !error_.empty(); }

    template <typename T, typename F>
    void read(const std::string& key, T& out, F convert) {
        if (failed()) return;
        auto it = kv_.find(key);
        if (it == kv_.end()) return;
        try {
            out = convert(it->second);
        } catch (const std::exception& e) {
            fail(key, it->second, e.what());
        }
    }

    void readInt(const std::string& key, int& out) {
        read(key, out, toInt);
    }

    void readDouble(const std::string& key, double& out) {
        read(key, out, toDouble);
    }

    void readBool(const std::string& key, bool& out) {
        read(key, out, [](const std::string& s) {
            std::string v = toLower(s);
            if (v == "1" || v == "true" || v == "yes") return true;
            if (v == "0" || v == "false" || v == "no") return false;
            throw std::invalid_argument("expected true/false");
        });
    }

    void readSeed(const std::string& key, std::optional<uint64_t>& out) {
        read(key, out, [](const std::string& s) -> std::optional<uint64_t> {
            std::string v = toLower(s);
            if (v == "none" || v == "random") return std::nullopt;
            return toUnsigned(s);
        });
    }

    // Enum by name through one of the parse* helpers
    template <typename T, typename P>
    void readEnum(const std::string& key, T& out, P parse) {
        read(key, out, [&](const std::string& s) {
            auto parsed = parse(s);
            if (!parsed) throw std::invalid_argument("unknown name");
            return *parsed;
        });
    }

    void readDoubles(const std::string& key, std::vector<double>& out, int count) {
        read(key, out, [count](const std::string& s) { return toList<double>(s, count, toDouble); });
    }

    void readInts(const std::string& key, std::vector<int>& out, int count) {
        read(key, out, [count](const std::string& s) { return toList<int>(s, count, toInt); });
    }

    void fail(const std::string& key, const std::string& value, const std::string& why) {
        if (failed()) return;
        error_ = "Invalid value for key '" + key + "': '" + value + "' (" + why + ")";
    }

private:
    const KeyMap& kv_;
    std::string& error_;
};

} // namespace

bool ScenarioFile::load(const std::string& path, EquilibriumParams& params, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open scenario file: " + path;
        return false;
    }

    if (!parse(file, params, error)) {
        LOG_SCENARIO(WARN, "%s: %s", path.c_str(), error.c_str());
        return false;
    }

    LOG_SCENARIO(INFO, "Loaded %s: N=%d D=%d M=%d", path.c_str(), params.N, params.D, params.M);
    return true;
}

bool ScenarioFile::parse(std::istream& in, EquilibriumParams& params, std::string& error) {
    error.clear();
    const KeyMap kv = readKeys(in);
    Reader r(kv, error);

    // Sizes first: defaults are laid out for them
    int N = params.N;
    int D = params.D;
    int M = params.M;
    r.readInt("game.channels", N);
    r.readInt("game.defenders", D);
    r.readInt("game.attackers", M);
    if (r.failed()) return false;
    if (N < 1 || N > MAX_N || D < 1 || D > MAX_D || M < 1 || M > MAX_M) {
        error = "game.channels, game.defenders and game.attackers must be within 1.." +
                std::to_string(MAX_N) + ", 1.." + std::to_string(MAX_D) + ", 1.." + std::to_string(MAX_M);
        return false;
    }

    EquilibriumParams p = defaultEquilibriumParams(N, D, M);

    r.readDouble("game.sigma2", p.sigma2);
    r.readDouble("game.tau", p.tau);

    r.readDoubles("budgets.pt", p.PT, D);
    r.readDoubles("budgets.pj", p.PJ, M);

    r.readDouble("solver.alpha", p.alpha);
    r.readInt("solver.max_iter", p.max_iter);
    r.readDouble("solver.epsilon", p.epsilon);

    r.readEnum("jammer.strategy", p.jammer_strategy, parseJammerStrategy);
    r.readEnum("jammer.objective", p.jammer_objective, parseJammerObjective);
    r.readEnum("jammer.attacker_mode", p.attacker_mode, parseAttackerMode);
    r.readInt("jammer.top_k", p.top_k);

    r.readBool("init.random", p.random_init);
    r.readEnum("init.mode", p.init_mode, parseInitMode);
    r.readSeed("init.seed", p.seed);

    // Gains: generated unless custom rows are given
    GainDistribution dist = GainDistribution::CUSTOM;
    std::optional<uint64_t> gain_seed;
    bool has_dist = r.has("gains.distribution");
    r.readEnum("gains.distribution", dist, parseGainDistribution);
    r.readSeed("gains.seed", gain_seed);
    if (r.failed()) return false;

    if (has_dist && dist != GainDistribution::CUSTOM) {
        generateGains(p, dist, gain_seed);
    } else {
        p.gain_distribution = GainDistribution::CUSTOM;
        for (int d = 0; d < D; ++d) r.readDoubles("gains.h" + std::to_string(d), p.h[d], N);
        for (int m = 0; m < M; ++m) r.readDoubles("gains.g" + std::to_string(m), p.g[m], N);
    }

    // Channel layout
    if (r.has("channels.types") && !r.failed()) {
        auto names = splitList(kv.at("channels.types"));
        if (static_cast<int>(names.size()) != N) {
            r.fail("channels.types", kv.at("channels.types"), "expected " + std::to_string(N) + " entries");
        } else {
            for (int i = 0; i < N; ++i) {
                auto type = parseChannelType(names[i]);
                if (!type) {
                    r.fail("channels.types", names[i], "unknown channel type");
                    break;
                }
                p.channels[i].type = *type;
            }
        }
    }
    if (r.has("channels.owners") && !r.failed()) {
        std::vector<int> owners;
        r.readInts("channels.owners", owners, N);
        if (!r.failed()) {
            for (int i = 0; i < N; ++i) p.channels[i].owner = owners[i];
        }
    }

    if (r.failed()) return false;

    params = std::move(p);
    return true;
}

bool ScenarioFile::save(const std::string& path, const EquilibriumParams& params) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_SCENARIO(ERROR, "Cannot write scenario file: %s", path.c_str());
        return false;
    }
    write(file, params);
    return static_cast<bool>(file);
}

void ScenarioFile::write(std::ostream& out, const EquilibriumParams& params) {
    auto list = [&out](const std::vector<double>& values) {
        for (size_t k = 0; k < values.size(); ++k) {
            if (k) out << ",";
            out << values[k];
        }
        out << "\n";
    };

    // Enough digits for gains to survive a reload unchanged
    auto old_precision = out.precision(17);

    out << "[Game]\n";
    out << "channels=" << params.N << "\n";
    out << "defenders=" << params.D << "\n";
    out << "attackers=" << params.M << "\n";
    out << "sigma2=" << params.sigma2 << "\n";
    out << "tau=" << params.tau << "\n";

    out << "\n[Budgets]\n";
    out << "PT=";
    list(params.PT);
    out << "PJ=";
    list(params.PJ);

    out << "\n[Solver]\n";
    out << "alpha=" << params.alpha << "\n";
    out << "max_iter=" << params.max_iter << "\n";
    out << "epsilon=" << params.epsilon << "\n";

    out << "\n[Jammer]\n";
    out << "strategy=" << jammerStrategyToString(params.jammer_strategy) << "\n";
    out << "objective=" << jammerObjectiveToString(params.jammer_objective) << "\n";
    out << "attacker_mode=" << attackerModeToString(params.attacker_mode) << "\n";
    out << "top_k=" << params.top_k << "\n";

    out << "\n[Init]\n";
    out << "random=" << (params.random_init ? "1" : "0") << "\n";
    out << "mode=" << initModeToString(params.init_mode) << "\n";
    if (params.seed) out << "seed=" << *params.seed << "\n";

    out << "\n[Gains]\n";
    out << "distribution=custom\n";
    for (size_t d = 0; d < params.h.size(); ++d) {
        out << "h" << d << "=";
        list(params.h[d]);
    }
    for (size_t m = 0; m < params.g.size(); ++m) {
        out << "g" << m << "=";
        list(params.g[m]);
    }

    out << "\n[Channels]\n";
    out << "types=";
    for (size_t i = 0; i < params.channels.size(); ++i) {
        if (i) out << ",";
        out << channelTypeToString(params.channels[i].type);
    }
    out << "\nowners=";
    for (size_t i = 0; i < params.channels.size(); ++i) {
        if (i) out << ",";
        out << params.channels[i].owner;
    }
    out << "\n";

    out.precision(old_precision);
}

} // namespace scenario
} // namespace jamgame
