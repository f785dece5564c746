#include "pixel_attack_core/de_attack.hpp"
#include "pixel_attack_core/boundary.hpp"
#include "pixel_attack_core/compositor.hpp"
#include "pixel_attack_core/convergence.hpp"
#include "pixel_attack_core/errors.hpp"
#include "pixel_attack_core/mutation.hpp"
#include "rclcpp/rclcpp.hpp"
#include <stdexcept>
#include <utility>

namespace {

// 按 mask 逐 agent 选择父代或子代 (整个 agent 一起替换)
template <typename T>
UnitArray<T> select_agents(const std::vector<bool>& mask, const UnitArray<T>& children,
                           const UnitArray<T>& parents)
{
    UnitArray<T> next = parents;
    for (std::size_t i = 0; i < parents.agents(); ++i) {
        if (!mask[i]) continue;
        for (std::size_t j = 0; j < parents.units(); ++j) {
            for (std::size_t k = 0; k < parents.dims(); ++k) {
                next.at(i, j, k) = children.at(i, j, k);
            }
        }
    }
    return next;
}

}  // namespace

GenerationResult evolution_step(const Classifier& model, const Image& img,
                                const Population& parents,
                                std::size_t target_class, std::size_t actual_class,
                                double cr, double F, std::mt19937& rng)
{
    parents.validate();

    // 1. 生成子代 (坐标取整, 颜色不取整, 同一组 cr/F)
    CoordArray child_coords = generate_children(parents.coords, cr, F, true, rng);
    ColorArray child_colors = generate_children(parents.colors, cr, F, false, rng);

    // 2. 边界修复
    repair_coords(child_coords, img.height(), img.width());
    repair_colors(child_colors);

    // 3. 合成父代/子代图像
    const ImageBatch parent_imgs = generate_image_variants(img, parents.coords, parents.colors);
    const ImageBatch child_imgs = generate_image_variants(img, child_coords, child_colors);

    // 4. 评估 & 收敛判断
    GenerationResult result;
    result.evaluation = evaluation_step(model, parent_imgs, child_imgs, target_class, actual_class);
    result.update_mask = result.evaluation.update_mask;

    StopDecision decision = stopping_criterion(result.evaluation.target_scores,
                                               result.evaluation.actual_scores);
    result.stop = decision.stop;
    result.best_agents = std::move(decision.best_agents);

    // 5. 坐标和颜色使用同一个 mask 选择
    result.population.coords = select_agents(result.update_mask, child_coords, parents.coords);
    result.population.colors = select_agents(result.update_mask, child_colors, parents.colors);
    result.children.coords = std::move(child_coords);
    result.children.colors = std::move(child_colors);
    return result;
}

DEAttack::DEAttack(const Classifier& model, Image img, Population initial, AttackConfig config)
: model_(model), img_(std::move(img)), population_(std::move(initial)), config_(config)
{
    std::random_device rd;
    rng_ = std::mt19937(rd());
    validate();
}

DEAttack::DEAttack(const Classifier& model, Image img, Population initial, AttackConfig config,
                   unsigned int seed)
: model_(model), img_(std::move(img)), population_(std::move(initial)), config_(config),
  rng_(seed)
{
    validate();
}

void DEAttack::validate() const {
    population_.validate();
    if (population_.size() < 2) {
        throw std::invalid_argument("DEAttack: need at least 2 agents");
    }
    if (population_.colors.dims() != img_.channels()) {
        throw ShapeMismatch("DEAttack: color dims != image channels");
    }
    if (config_.CR < 0.0 || config_.CR > 1.0) {
        throw std::invalid_argument("DEAttack: CR must be in [0, 1]");
    }
    if (config_.F < 0.0) {
        throw std::invalid_argument("DEAttack: F must be non-negative");
    }
}

const GenerationResult& DEAttack::step() {
    last_ = evolution_step(model_, img_, population_, config_.target_class, config_.actual_class,
                           config_.CR, config_.F, rng_);
    // 更新种群
    population_ = last_.population;
    converged_ = last_.stop;
    current_generation++;
    return last_;
}

bool DEAttack::run() {
    auto logger = rclcpp::get_logger("pixel_attack_core");
    while (current_generation < config_.max_generations) {
        step();
        if (converged_) {
            RCLCPP_INFO(logger, "Converged at generation %d, best agent %zu (divergence %.4f)",
                        current_generation, get_best_agent(), best_divergence());
            return true;
        }
    }
    RCLCPP_INFO(logger, "Reached max_generations=%d without success", config_.max_generations);
    return false;
}

std::size_t DEAttack::get_best_agent() const {
    if (current_generation == 0) {
        throw std::logic_error("DEAttack: no generation evaluated yet");
    }
    const auto& eval = last_.evaluation;
    auto divergence = [&eval](std::size_t i) {
        return eval.target_scores[i] - eval.actual_scores[i];
    };

    std::size_t best = converged_ ? last_.best_agents.front() : 0;
    if (converged_) {
        for (std::size_t i : last_.best_agents) {
            if (divergence(i) > divergence(best)) best = i;
        }
    } else {
        for (std::size_t i = 1; i < eval.target_scores.size(); ++i) {
            if (divergence(i) > divergence(best)) best = i;
        }
    }
    return best;
}

double DEAttack::best_divergence() const {
    const std::size_t i = get_best_agent();
    return last_.evaluation.target_scores[i] - last_.evaluation.actual_scores[i];
}
