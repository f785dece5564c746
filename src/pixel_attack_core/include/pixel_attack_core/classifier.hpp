#ifndef PIXEL_ATTACK_CORE__CLASSIFIER_HPP_
#define PIXEL_ATTACK_CORE__CLASSIFIER_HPP_

#include "pixel_attack_core/types.hpp"
#include <functional>
#include <vector>

// 纯虚基类 (Interface): 被攻击的分类器只需要提供 score
// const: 只做推理, 不修改模型
class Classifier {
public:
    virtual ~Classifier() = default;

    // (batch, C, H, W) -> (batch, num_classes)
    virtual ScoreBatch score(const ImageBatch& batch) const = 0;
};

// 把单张图像的打分函数包装成批量接口
class FunctionClassifier : public Classifier {
public:
    using ScoreFunction = std::function<std::vector<double>(const Image&)>;

    explicit FunctionClassifier(ScoreFunction score_func);

    ScoreBatch score(const ImageBatch& batch) const override;

private:
    ScoreFunction score_func_;
};

#endif
