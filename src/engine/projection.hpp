#pragma once

#include <span>
#include <vector>

namespace jamgame {
namespace engine {

/**
 * Map v onto the non-negative vectors summing to budget.
 *
 * Clamp negatives to zero, then rescale to the budget. If nothing positive
 * remains, split the budget evenly across every slot.
 *
 * Not the Euclidean projection onto the simplex. Iteration trajectories
 * depend on this exact rule.
 */
void projectToBudget(std::span<const double> v, double budget, std::span<double> out);

std::vector<double> projectToBudget(const std::vector<double>& v, double budget);

} // namespace engine
} // namespace jamgame
