#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "eval/evaluator.hpp"
#include "test/fake_checker.hpp"

using namespace std;
using namespace codeeval;
using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;

struct mock_monitor : public monitor {
    MOCK_METHOD1(start_evaluation, void(size_t));
    MOCK_METHOD2(end_sample, void(int, const verdict &));
    MOCK_METHOD1(end_evaluation, void(const evaluation_result &));
};

class EvaluatorTest : public ::testing::Test {
protected:
    problem_set problems;

    void SetUp() override {
        for (string task_id : {"A", "B", "C"}) {
            problem p;
            p.task_id = task_id;
            p.entry_point = "f";
            problems[task_id] = p;
        }
    }

    /**
     * @brief 为每道题目交替生成 per_task 个样本
     * 第 i 道题目的前 i + 1 个样本通过，其余失败或超时
     */
    vector<codeeval::sample> make_samples(size_t per_task) {
        vector<codeeval::sample> samples;
        for (size_t j = 0; j < per_task; ++j) {
            size_t i = 0;
            for (auto &[task_id, p] : problems) {
                string completion = j <= i ? "pass " + to_string(j) : (j % 2 ? "timeout" : "fail");
                samples.push_back({task_id, completion});
                ++i;
            }
        }
        return samples;
    }
};

TEST_F(EvaluatorTest, CountsTest) {
    fake_checker checker;
    evaluator eval(checker);
    auto result = eval.evaluate(problems, make_samples(5), {1.0, 1});

    EXPECT_EQ(result.n_samples, 15u);
    EXPECT_EQ(checker.calls(), 15u);

    auto counts = result.counts();
    ASSERT_EQ(counts.size(), 3u);
    size_t total = 0;
    for (auto &[task_id, count] : counts) total += count.total;
    EXPECT_EQ(total, 15u);

    EXPECT_EQ(counts["A"].total, 5u);
    EXPECT_EQ(counts["A"].correct, 1u);
    EXPECT_EQ(counts["B"].correct, 2u);
    EXPECT_EQ(counts["C"].correct, 3u);
}

TEST_F(EvaluatorTest, CompletionIdTest) {
    fake_checker checker;
    evaluator eval(checker);
    auto result = eval.evaluate(problems, make_samples(4), {1.0, 1});

    for (auto &[task_id, verdicts] : result.results) {
        ASSERT_EQ(verdicts.size(), 4u);
        for (size_t i = 0; i < verdicts.size(); ++i) {
            EXPECT_EQ(verdicts[i].task_id, task_id);
            EXPECT_EQ(verdicts[i].completion_id, optional<size_t>(i));
        }
    }

    // A 的第 1 个样本是超时，第 2 个样本失败
    EXPECT_EQ(result.results["A"][1].result(), "timed out");
    EXPECT_EQ(result.results["A"][2].result(), "failed: AssertionError");
}

TEST_F(EvaluatorTest, ConcurrentEqualsSequentialTest) {
    auto samples = make_samples(20);

    fake_checker sequential_checker;
    evaluator sequential(sequential_checker);
    auto expected = sequential.evaluate(problems, samples, {1.0, 1});

    fake_checker concurrent_checker;
    evaluator concurrent(concurrent_checker);
    auto actual = concurrent.evaluate(problems, samples, {1.0, 4});

    EXPECT_EQ(concurrent_checker.calls(), samples.size());
    EXPECT_GT(concurrent_checker.threads(), 1u);

    ASSERT_EQ(actual.results.size(), expected.results.size());
    for (auto &[task_id, verdicts] : expected.results) {
        auto &other = actual.results.at(task_id);
        ASSERT_EQ(other.size(), verdicts.size());
        for (size_t i = 0; i < verdicts.size(); ++i) {
            EXPECT_EQ(other[i].completion_id, verdicts[i].completion_id);
            EXPECT_EQ(other[i].passed, verdicts[i].passed);
            EXPECT_EQ(other[i].result(), verdicts[i].result());
        }
    }
}

TEST_F(EvaluatorTest, UnknownTaskTest) {
    fake_checker checker;
    evaluator eval(checker);
    auto samples = make_samples(2);
    samples.push_back({"D", "pass"});

    EXPECT_THROW(eval.evaluate(problems, samples, {1.0, 1}), unknown_task_error);
    // 在执行任何样本之前就发现了错误
    EXPECT_EQ(checker.calls(), 0u);
}

TEST_F(EvaluatorTest, IncompleteEvaluationTest) {
    fake_checker checker;
    evaluator eval(checker);
    vector<codeeval::sample> samples{{"A", "pass"}, {"B", "fail"}};

    EXPECT_THROW(eval.evaluate(problems, samples, {1.0, 1}), incomplete_evaluation_error);
    EXPECT_THROW(eval.evaluate(problems, samples, {1.0, 2}), incomplete_evaluation_error);
}

TEST_F(EvaluatorTest, EmptyTest) {
    fake_checker checker;
    evaluator eval(checker);
    auto result = eval.evaluate({}, {}, {1.0, 4});
    EXPECT_EQ(result.n_samples, 0u);
    EXPECT_TRUE(result.results.empty());
}

TEST_F(EvaluatorTest, ZeroWorkersTest) {
    fake_checker checker;
    evaluator eval(checker);
    EXPECT_THROW(eval.evaluate(problems, make_samples(1), {1.0, 0}), invalid_argument);
}

TEST_F(EvaluatorTest, MonitorTest) {
    fake_checker checker;
    evaluator eval(checker);
    auto m = make_unique<mock_monitor>();
    {
        InSequence seq;
        EXPECT_CALL(*m, start_evaluation(6));
        EXPECT_CALL(*m, end_sample(0, _)).Times(6);
        EXPECT_CALL(*m, end_evaluation(Field(&evaluation_result::n_samples, 6u)));
    }
    eval.register_monitor(move(m));
    eval.evaluate(problems, make_samples(2), {1.0, 1});
}
