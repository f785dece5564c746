#ifndef PIXEL_ATTACK_CORE__CONVERGENCE_HPP_
#define PIXEL_ATTACK_CORE__CONVERGENCE_HPP_

#include <cstddef>
#include <vector>

struct StopDecision {
    bool stop = false;
    // target > actual 的所有 agent 下标
    std::vector<std::size_t> best_agents;
};

// 任意 agent 的目标类得分严格大于真实类得分即成功, 相等不算
StopDecision stopping_criterion(const std::vector<double>& target_scores,
                                const std::vector<double>& actual_scores);

#endif
