#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "pixel_attack_core/convergence.hpp"
#include "pixel_attack_core/errors.hpp"
#include "pixel_attack_core/evaluation.hpp"

namespace {

// 第一次调用返回父代得分, 第二次返回子代得分
class ScriptedClassifier : public Classifier {
public:
    ScriptedClassifier(ScoreBatch parent, ScoreBatch child)
    : parent_(std::move(parent)), child_(std::move(child)) {}

    ScoreBatch score(const ImageBatch& /*batch*/) const override {
        return (calls_++ % 2 == 0) ? parent_ : child_;
    }

    int calls() const { return calls_; }

private:
    ScoreBatch parent_;
    ScoreBatch child_;
    mutable int calls_ = 0;
};

class FailingClassifier : public Classifier {
public:
    ScoreBatch score(const ImageBatch& /*batch*/) const override {
        throw std::runtime_error("malformed input");
    }
};

ImageBatch blank_batch(std::size_t n) {
    return ImageBatch(n, Image(3, 2, 2));
}

}  // namespace

TEST(EvaluationTest, ChildReplacesParentWhenDivergenceNotWorse) {
    // target = 1, actual = 0
    ScriptedClassifier model(
        {{0.0, 1.0}, {0.0, 1.0}, {0.5, 0.5}},
        {{0.0, 2.0}, {1.0, 1.0}, {0.5, 0.5}});

    const EvaluationResult r = evaluation_step(model, blank_batch(3), blank_batch(3), 1, 0);

    EXPECT_EQ(model.calls(), 2);
    EXPECT_EQ(r.update_mask, (std::vector<bool>{true, false, true}));
    EXPECT_EQ(r.target_scores, (std::vector<double>{2.0, 1.0, 0.5}));
    EXPECT_EQ(r.actual_scores, (std::vector<double>{0.0, 0.0, 0.5}));
    EXPECT_EQ(r.best_target_agent, 0u);
    EXPECT_EQ(r.best_actual_agent, 0u);
}

TEST(EvaluationTest, BestTargetAndBestActualAgentsMayDiffer) {
    ScriptedClassifier model(
        {{0.9, 0.1}, {0.2, 0.3}},
        {{0.9, 0.1}, {0.2, 0.3}});

    const EvaluationResult r = evaluation_step(model, blank_batch(2), blank_batch(2), 0, 1);

    EXPECT_EQ(r.update_mask, (std::vector<bool>{true, true}));
    EXPECT_EQ(r.best_target_agent, 0u);
    EXPECT_EQ(r.best_actual_agent, 0u);

    ScriptedClassifier model2(
        {{0.9, 0.5}, {0.2, 0.1}},
        {{0.9, 0.5}, {0.2, 0.1}});
    const EvaluationResult r2 = evaluation_step(model2, blank_batch(2), blank_batch(2), 0, 1);
    EXPECT_EQ(r2.best_target_agent, 0u);
    EXPECT_EQ(r2.best_actual_agent, 1u);
}

TEST(EvaluationTest, BatchSizeMismatchThrows) {
    ScriptedClassifier model({{0.0, 0.0}}, {{0.0, 0.0}});
    EXPECT_THROW(evaluation_step(model, blank_batch(2), blank_batch(3), 1, 0), ShapeMismatch);
    EXPECT_EQ(model.calls(), 0);
}

TEST(EvaluationTest, ClassIndexOutsideScoresThrows) {
    ScriptedClassifier model({{0.0, 0.0}}, {{0.0, 0.0}});
    EXPECT_THROW(evaluation_step(model, blank_batch(1), blank_batch(1), 2, 0), ShapeMismatch);
}

TEST(EvaluationTest, ClassifierFailurePropagates) {
    FailingClassifier model;
    EXPECT_THROW(evaluation_step(model, blank_batch(2), blank_batch(2), 1, 0), std::runtime_error);
}

TEST(EvaluationTest, FunctionClassifierScoresEachImage) {
    FunctionClassifier model([](const Image& img) {
        return std::vector<double>{img.at(0, 0, 0), 1.0 - img.at(0, 0, 0)};
    });
    ImageBatch batch{Image(1, 1, 1, 0.25), Image(1, 1, 1, 0.75)};

    const ScoreBatch scores = model.score(batch);
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_DOUBLE_EQ(scores[0][0], 0.25);
    EXPECT_DOUBLE_EQ(scores[1][1], 0.25);
}

TEST(ConvergenceTest, StopsWhenTargetBeatsActual) {
    const StopDecision d = stopping_criterion({0.9, 0.2}, {0.5, 0.5});
    EXPECT_TRUE(d.stop);
    EXPECT_EQ(d.best_agents, (std::vector<std::size_t>{0}));
}

TEST(ConvergenceTest, TieIsNotSuccess) {
    const StopDecision d = stopping_criterion({0.3}, {0.3});
    EXPECT_FALSE(d.stop);
    EXPECT_TRUE(d.best_agents.empty());
}

TEST(ConvergenceTest, ReportsEverySuccessfulAgent) {
    const StopDecision d = stopping_criterion({1.0, 0.0, 2.0, 0.5}, {0.0, 0.0, 1.0, 0.6});
    EXPECT_TRUE(d.stop);
    EXPECT_EQ(d.best_agents, (std::vector<std::size_t>{0, 2}));
}

TEST(ConvergenceTest, LengthMismatchThrows) {
    EXPECT_THROW(stopping_criterion({1.0, 2.0}, {1.0}), ShapeMismatch);
}
