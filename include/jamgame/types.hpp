#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jamgame {

// Channel role, fixed for the duration of a run
enum class ChannelType : uint8_t {
    REAL = 0,      // Carries genuine traffic, counts toward throughput
    DECOY = 1,     // Mimics a real channel to draw jammer power
    INACTIVE = 2,  // Never transmitted on, never visible
};

// How an attacker builds its allocation row each iteration
enum class JammerStrategy : uint8_t {
    UNIFORM = 0,   // J1: equal split over eligible active channels
    TOP_K = 1,     // J2: concentrate on the K highest perceived-value channels
    GRADIENT = 2,  // J3: follow the attacker utility gradient
};

// What the attacker is able to see
enum class JammerObjective : uint8_t {
    DECEPTION = 0, // Cannot tell decoys from real traffic
    ORACLE = 1,    // Always knows which channels are real (upper-bound baseline)
};

// Only changes behaviour together with JammerStrategy::GRADIENT
enum class AttackerMode : uint8_t {
    COORDINATED = 0,
    INDEPENDENT = 1,
};

// Defender starting allocation rule
enum class InitMode : uint8_t {
    UNIFORM = 0,        // Decoys at tau, remainder split evenly across real channels
    GAIN_WEIGHTED = 1,  // Decoys at tau, remainder weighted by h[d][i]
    RANDOM = 2,         // Seeded random weights over owned channels
};

enum class GainDistribution : uint8_t {
    UNIFORM = 0,   // 0.5 + 1.5*u
    RAYLEIGH = 1,  // sqrt(-2 ln(1-u))
    CUSTOM = 2,    // Caller-supplied gains
};

struct ChannelConfig {
    ChannelType type = ChannelType::INACTIVE;
    int owner = 0;  // Defender index
};

struct ChannelCounts {
    int real = 0;
    int decoy = 0;
    int inactive = 0;
};

struct DefenderChannelCounts {
    std::vector<int> real;
    std::vector<int> decoy;
};

// Enum <-> string
const char* channelTypeToString(ChannelType type);
const char* jammerStrategyToString(JammerStrategy strategy);
const char* jammerObjectiveToString(JammerObjective objective);
const char* attackerModeToString(AttackerMode mode);
const char* initModeToString(InitMode mode);
const char* gainDistributionToString(GainDistribution dist);

// Accept the short names used on the command line and in scenario files
// ("real", "topk", "J2_topK", ...). Case-insensitive.
std::optional<ChannelType> parseChannelType(const std::string& name);
std::optional<JammerStrategy> parseJammerStrategy(const std::string& name);
std::optional<JammerObjective> parseJammerObjective(const std::string& name);
std::optional<AttackerMode> parseAttackerMode(const std::string& name);
std::optional<InitMode> parseInitMode(const std::string& name);
std::optional<GainDistribution> parseGainDistribution(const std::string& name);

ChannelCounts countChannelTypes(const std::vector<ChannelConfig>& config);
DefenderChannelCounts channelCountsPerDefender(const std::vector<ChannelConfig>& config, int num_defenders);

} // namespace jamgame
