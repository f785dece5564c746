#include "pixel_attack_core/classifier.hpp"
#include <stdexcept>
#include <utility>

FunctionClassifier::FunctionClassifier(ScoreFunction score_func)
: score_func_(std::move(score_func))
{
    if (!score_func_) {
        throw std::invalid_argument("FunctionClassifier: empty score function");
    }
}

ScoreBatch FunctionClassifier::score(const ImageBatch& batch) const {
    ScoreBatch scores;
    scores.reserve(batch.size());
    for (const auto& img : batch) {
        scores.push_back(score_func_(img));
    }
    return scores;
}
