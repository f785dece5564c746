#ifndef PIXEL_ATTACK_CORE__DE_ATTACK_HPP_
#define PIXEL_ATTACK_CORE__DE_ATTACK_HPP_

#include "pixel_attack_core/classifier.hpp"
#include "pixel_attack_core/evaluation.hpp"
#include "pixel_attack_core/types.hpp"
#include <cstddef>
#include <random>
#include <vector>

struct AttackConfig {
    // F: 差分权重 (通常 0.5)
    // CR: 交叉概率 (Su et al. 2017 使用 0.9)
    double F = 0.5;
    double CR = 0.9;
    std::size_t target_class = 0;
    std::size_t actual_class = 0;
    int max_generations = 100;
};

struct GenerationResult {
    std::vector<bool> update_mask;
    Population children;        // 修复后的子代
    Population population;      // 下一代
    bool stop = false;
    std::vector<std::size_t> best_agents;
    EvaluationResult evaluation;
};

// 完整的一代: 变异 -> 边界修复 -> 合成图像 -> 评估 -> 收敛判断 -> 选择
GenerationResult evolution_step(const Classifier& model, const Image& img,
                                const Population& parents,
                                std::size_t target_class, std::size_t actual_class,
                                double cr, double F, std::mt19937& rng);

// 持有种群, 反复调用 evolution_step 直到成功或达到代数上限
// model 由调用方持有, 生命周期必须覆盖本对象
class DEAttack {
public:
    DEAttack(const Classifier& model, Image img, Population initial, AttackConfig config);
    DEAttack(const Classifier& model, Image img, Population initial, AttackConfig config,
             unsigned int seed);

    const GenerationResult& step();
    // 成功返回 true, 代数用完返回 false
    bool run();

    const Population& population() const { return population_; }
    const AttackConfig& config() const { return config_; }
    bool converged() const { return converged_; }
    const std::vector<std::size_t>& best_agents() const { return last_.best_agents; }

    // divergence 最大的 agent; 已收敛时只在成功的 agent 中选
    std::size_t get_best_agent() const;
    double best_divergence() const;

    int current_generation = 0;

private:
    const Classifier& model_;
    Image img_;
    Population population_;
    AttackConfig config_;
    std::mt19937 rng_;

    GenerationResult last_;
    bool converged_ = false;

    void validate() const;
};

#endif
