#include "projection.hpp"
#include <algorithm>

namespace jamgame {
namespace engine {

void projectToBudget(std::span<const double> v, double budget, std::span<double> out) {
    const size_t n = std::min(v.size(), out.size());
    if (n == 0) return;

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        out[i] = std::max(0.0, v[i]);
        sum += out[i];
    }

    if (sum <= 0.0) {
        std::fill(out.begin(), out.begin() + n, budget / static_cast<double>(n));
        return;
    }

    for (size_t i = 0; i < n; ++i) {
        out[i] = (out[i] / sum) * budget;
    }
}

std::vector<double> projectToBudget(const std::vector<double>& v, double budget) {
    std::vector<double> out(v.size());
    projectToBudget(std::span<const double>(v), budget, std::span<double>(out));
    return out;
}

} // namespace engine
} // namespace jamgame
