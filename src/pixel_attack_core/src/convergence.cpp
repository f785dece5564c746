#include "pixel_attack_core/convergence.hpp"
#include "pixel_attack_core/errors.hpp"
#include <string>

StopDecision stopping_criterion(const std::vector<double>& target_scores,
                                const std::vector<double>& actual_scores)
{
    if (target_scores.size() != actual_scores.size()) {
        throw ShapeMismatch("target scores " + std::to_string(target_scores.size()) +
                            " != actual scores " + std::to_string(actual_scores.size()));
    }

    StopDecision decision;
    for (std::size_t i = 0; i < target_scores.size(); ++i) {
        if (target_scores[i] > actual_scores[i]) {
            decision.best_agents.push_back(i);
        }
    }
    decision.stop = !decision.best_agents.empty();
    return decision;
}
