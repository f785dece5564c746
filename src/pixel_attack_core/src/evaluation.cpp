#include "pixel_attack_core/evaluation.hpp"
#include "pixel_attack_core/errors.hpp"
#include "rclcpp/rclcpp.hpp"
#include <string>

namespace {

void check_scores(const ScoreBatch& scores, std::size_t expected,
                  std::size_t target_class, std::size_t actual_class, const char* which)
{
    if (scores.size() != expected) {
        throw ShapeMismatch(std::string(which) + " scores: batch " + std::to_string(scores.size()) +
                            " != " + std::to_string(expected));
    }
    for (const auto& row : scores) {
        if (target_class >= row.size() || actual_class >= row.size()) {
            throw ShapeMismatch(std::string(which) + " scores: class index out of range (" +
                                std::to_string(row.size()) + " classes)");
        }
    }
}

}  // namespace

EvaluationResult evaluation_step(const Classifier& model,
                                 const ImageBatch& parent_imgs,
                                 const ImageBatch& child_imgs,
                                 std::size_t target_class,
                                 std::size_t actual_class)
{
    if (parent_imgs.size() != child_imgs.size()) {
        throw ShapeMismatch("parent batch " + std::to_string(parent_imgs.size()) +
                            " != child batch " + std::to_string(child_imgs.size()));
    }
    if (parent_imgs.empty()) {
        throw ShapeMismatch("evaluation_step: empty batch");
    }
    for (std::size_t i = 0; i < parent_imgs.size(); ++i) {
        const Image& p = parent_imgs[i];
        const Image& c = child_imgs[i];
        if (p.channels() != c.channels() || p.height() != c.height() || p.width() != c.width()) {
            throw ShapeMismatch("parent/child image shape differs at agent " + std::to_string(i));
        }
    }

    // 1. 父代/子代分别推理
    const ScoreBatch parent_scores = model.score(parent_imgs);
    const ScoreBatch child_scores = model.score(child_imgs);

    const std::size_t n = parent_imgs.size();
    check_scores(parent_scores, n, target_class, actual_class, "parent");
    check_scores(child_scores, n, target_class, actual_class, "child");

    EvaluationResult result;
    result.update_mask.resize(n);
    result.target_scores.resize(n);
    result.actual_scores.resize(n);

    for (std::size_t i = 0; i < n; ++i) {
        // 2. divergence
        const double parent_div = parent_scores[i][target_class] - parent_scores[i][actual_class];
        const double child_div = child_scores[i][target_class] - child_scores[i][actual_class];

        // 3. 贪婪选择
        const bool take_child = child_div >= parent_div;
        const auto& chosen = take_child ? child_scores[i] : parent_scores[i];
        result.update_mask[i] = take_child;
        result.target_scores[i] = chosen[target_class];
        result.actual_scores[i] = chosen[actual_class];

        // 4. 目标类越大越好, 真实类越小越好
        if (result.target_scores[i] > result.target_scores[result.best_target_agent]) {
            result.best_target_agent = i;
        }
        if (result.actual_scores[i] < result.actual_scores[result.best_actual_agent]) {
            result.best_actual_agent = i;
        }
    }

    auto logger = rclcpp::get_logger("pixel_attack_core");
    RCLCPP_DEBUG(logger, "Best score for the target class: %.4f (actual %.4f)",
                 result.target_scores[result.best_target_agent],
                 result.actual_scores[result.best_target_agent]);
    RCLCPP_DEBUG(logger, "Best score for the actual class: %.4f (target %.4f)",
                 result.actual_scores[result.best_actual_agent],
                 result.target_scores[result.best_actual_agent]);

    return result;
}
