#ifndef PIXEL_ATTACK_CORE__EVALUATION_HPP_
#define PIXEL_ATTACK_CORE__EVALUATION_HPP_

#include "pixel_attack_core/classifier.hpp"
#include "pixel_attack_core/types.hpp"
#include <cstddef>
#include <vector>

struct EvaluationResult {
    // true: 子代取代父代
    std::vector<bool> update_mask;
    // 选择后的目标类/真实类得分
    std::vector<double> target_scores;
    std::vector<double> actual_scores;

    // 目标类得分最高的 agent 与真实类得分最低的 agent (可能不同)
    std::size_t best_target_agent = 0;
    std::size_t best_actual_agent = 0;
};

// divergence = score[target] - score[actual], 越大越好
// 子代 divergence >= 父代时取代父代 (相等也接受, 保持多样性)
// 分类器抛出的异常原样传出
EvaluationResult evaluation_step(const Classifier& model,
                                 const ImageBatch& parent_imgs,
                                 const ImageBatch& child_imgs,
                                 std::size_t target_class,
                                 std::size_t actual_class);

#endif
