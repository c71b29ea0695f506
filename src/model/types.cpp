#include "jamgame/types.hpp"
#include <algorithm>
#include <cctype>

namespace jamgame {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const char* channelTypeToString(ChannelType type) {
    switch (type) {
        case ChannelType::REAL:     return "real";
        case ChannelType::DECOY:    return "decoy";
        case ChannelType::INACTIVE: return "inactive";
        default:                    return "unknown";
    }
}

const char* jammerStrategyToString(JammerStrategy strategy) {
    switch (strategy) {
        case JammerStrategy::UNIFORM:  return "J1_uniform";
        case JammerStrategy::TOP_K:    return "J2_topK";
        case JammerStrategy::GRADIENT: return "J3_optimization";
        default:                       return "unknown";
    }
}

const char* jammerObjectiveToString(JammerObjective objective) {
    switch (objective) {
        case JammerObjective::DECEPTION: return "deception";
        case JammerObjective::ORACLE:    return "oracle";
        default:                         return "unknown";
    }
}

const char* attackerModeToString(AttackerMode mode) {
    switch (mode) {
        case AttackerMode::COORDINATED: return "coordinated";
        case AttackerMode::INDEPENDENT: return "independent";
        default:                        return "unknown";
    }
}

const char* initModeToString(InitMode mode) {
    switch (mode) {
        case InitMode::UNIFORM:       return "uniform";
        case InitMode::GAIN_WEIGHTED: return "gain_weighted";
        case InitMode::RANDOM:        return "random";
        default:                      return "unknown";
    }
}

const char* gainDistributionToString(GainDistribution dist) {
    switch (dist) {
        case GainDistribution::UNIFORM:  return "uniform";
        case GainDistribution::RAYLEIGH: return "rayleigh";
        case GainDistribution::CUSTOM:   return "custom";
        default:                         return "unknown";
    }
}

std::optional<ChannelType> parseChannelType(const std::string& name) {
    std::string s = toLower(name);
    if (s == "real" || s == "r") return ChannelType::REAL;
    if (s == "decoy" || s == "d") return ChannelType::DECOY;
    if (s == "inactive" || s == "i" || s == "off") return ChannelType::INACTIVE;
    return std::nullopt;
}

std::optional<JammerStrategy> parseJammerStrategy(const std::string& name) {
    std::string s = toLower(name);
    if (s == "uniform" || s == "j1" || s == "j1_uniform") return JammerStrategy::UNIFORM;
    if (s == "topk" || s == "top_k" || s == "j2" || s == "j2_topk") return JammerStrategy::TOP_K;
    if (s == "gradient" || s == "j3" || s == "j3_optimization") return JammerStrategy::GRADIENT;
    return std::nullopt;
}

std::optional<JammerObjective> parseJammerObjective(const std::string& name) {
    std::string s = toLower(name);
    if (s == "deception") return JammerObjective::DECEPTION;
    if (s == "oracle") return JammerObjective::ORACLE;
    return std::nullopt;
}

std::optional<AttackerMode> parseAttackerMode(const std::string& name) {
    std::string s = toLower(name);
    if (s == "coordinated") return AttackerMode::COORDINATED;
    if (s == "independent") return AttackerMode::INDEPENDENT;
    return std::nullopt;
}

std::optional<InitMode> parseInitMode(const std::string& name) {
    std::string s = toLower(name);
    if (s == "uniform") return InitMode::UNIFORM;
    if (s == "gain_weighted" || s == "gain") return InitMode::GAIN_WEIGHTED;
    if (s == "random") return InitMode::RANDOM;
    return std::nullopt;
}

std::optional<GainDistribution> parseGainDistribution(const std::string& name) {
    std::string s = toLower(name);
    if (s == "uniform") return GainDistribution::UNIFORM;
    if (s == "rayleigh") return GainDistribution::RAYLEIGH;
    if (s == "custom") return GainDistribution::CUSTOM;
    return std::nullopt;
}

ChannelCounts countChannelTypes(const std::vector<ChannelConfig>& config) {
    ChannelCounts counts;
    for (const auto& ch : config) {
        switch (ch.type) {
            case ChannelType::REAL:     counts.real++; break;
            case ChannelType::DECOY:    counts.decoy++; break;
            case ChannelType::INACTIVE: counts.inactive++; break;
        }
    }
    return counts;
}

DefenderChannelCounts channelCountsPerDefender(const std::vector<ChannelConfig>& config, int num_defenders) {
    DefenderChannelCounts counts;
    counts.real.assign(num_defenders, 0);
    counts.decoy.assign(num_defenders, 0);
    for (const auto& ch : config) {
        if (ch.owner < 0 || ch.owner >= num_defenders) continue;
        if (ch.type == ChannelType::REAL) counts.real[ch.owner]++;
        else if (ch.type == ChannelType::DECOY) counts.decoy[ch.owner]++;
    }
    return counts;
}

} // namespace jamgame
