#include "errors.hpp"
#include "network.hpp"
#include "training.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace
{

Network make_network(std::vector<int> sizes, unsigned int seed = 42)
{
    std::minstd_rand rng(seed);
    return Network(std::move(sizes), rng);
}

Eigen::VectorXf vector_of(std::initializer_list<float> values)
{
    Eigen::VectorXf result(static_cast<Eigen::Index>(values.size()));
    std::copy(values.begin(), values.end(), result.data());
    return result;
}

std::vector<TrainingExample> sample_training_data()
{
    std::vector<TrainingExample> examples;
    std::minstd_rand rng(5);
    std::uniform_real_distribution<float> distribution(0.0f, 1.0f);
    for (int i {0}; i < 10; ++i)
    {
        const Eigen::VectorXf input =
            Eigen::VectorXf::NullaryExpr(3, [&] { return distribution(rng); });
        examples.push_back({.input = input,
                            .target_output = i % 2 == 0
                                                 ? vector_of({1.0f, 0.0f})
                                                 : vector_of({0.0f, 1.0f})});
    }
    return examples;
}

std::vector<EvaluationExample> sample_test_data()
{
    return {{.input = vector_of({0.1f, 0.2f, 0.3f}), .label = 0},
            {.input = vector_of({0.9f, 0.8f, 0.7f}), .label = 1},
            {.input = vector_of({0.5f, 0.5f, 0.5f}), .label = 0}};
}

// Single transition 2 -> 2 with identity weights and zero biases, so that the
// output of input x is sigmoid(x).
Network identity_network()
{
    return Network(
        {2, 2}, {Eigen::MatrixXf::Identity(2, 2)}, {Eigen::VectorXf::Zero(2)});
}

} // namespace

TEST(MiniBatches, PartitionEveryIndexOnce)
{
    std::minstd_rand rng(1);
    const auto batches = make_mini_batches(10, 3, rng);

    ASSERT_EQ(batches.size(), 4u);
    EXPECT_EQ(batches[0].size(), 3u);
    EXPECT_EQ(batches[1].size(), 3u);
    EXPECT_EQ(batches[2].size(), 3u);
    EXPECT_EQ(batches[3].size(), 1u);

    std::vector<std::size_t> all;
    for (const auto &batch : batches)
    {
        all.insert(all.end(), batch.begin(), batch.end());
    }
    std::sort(all.begin(), all.end());
    for (std::size_t i {0}; i < all.size(); ++i)
    {
        EXPECT_EQ(all[i], i);
    }
}

TEST(MiniBatches, BatchLargerThanDataset)
{
    std::minstd_rand rng(1);
    const auto batches = make_mini_batches(4, 10, rng);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].size(), 4u);
}

TEST(MiniBatches, ConsecutiveEpochsAreReshuffled)
{
    std::minstd_rand rng(1);
    const auto first = make_mini_batches(20, 5, rng);
    const auto second = make_mini_batches(20, 5, rng);
    EXPECT_NE(first, second);
}

TEST(MiniBatches, RejectsNonPositiveSize)
{
    std::minstd_rand rng(1);
    EXPECT_THROW(static_cast<void>(make_mini_batches(10, 0, rng)),
                 InvalidHyperparameter);
}

TEST(UpdateMiniBatch, ChangesParameters)
{
    auto network = make_network({3, 4, 2});
    const auto weights_before = network.weights();
    const auto biases_before = network.biases();
    const auto training_data = sample_training_data();

    const std::vector<std::size_t> batch {0, 1};
    update_mini_batch(network, training_data, batch, 0.5f);

    for (std::size_t l {0}; l < weights_before.size(); ++l)
    {
        EXPECT_FALSE(network.weights()[l].isApprox(weights_before[l]));
        EXPECT_FALSE(network.biases()[l].isApprox(biases_before[l]));
    }
}

TEST(UpdateMiniBatch, AppliesAveragedGradient)
{
    auto network = make_network({3, 2});
    const auto reference = network;
    const auto training_data = sample_training_data();

    const auto g0 = backprop(
        reference, training_data[0].input, training_data[0].target_output);
    const auto g1 = backprop(
        reference, training_data[1].input, training_data[1].target_output);

    const std::vector<std::size_t> batch {0, 1};
    update_mini_batch(network, training_data, batch, 2.0f);

    const Eigen::MatrixXf expected_weights =
        reference.weights()[0] - (g0.weights[0] + g1.weights[0]);
    const Eigen::VectorXf expected_biases =
        reference.biases()[0] - (g0.biases[0] + g1.biases[0]);
    EXPECT_TRUE(network.weights()[0].isApprox(expected_weights, 1e-5f));
    EXPECT_TRUE(network.biases()[0].isApprox(expected_biases, 1e-5f));
}

TEST(UpdateMiniBatch, DecreasesCostOnOrthogonalExamples)
{
    auto network = identity_network();
    const std::vector<TrainingExample> training_data {
        {.input = vector_of({1.0f, 0.0f}),
         .target_output = vector_of({0.0f, 1.0f})},
        {.input = vector_of({0.0f, 1.0f}),
         .target_output = vector_of({1.0f, 0.0f})}};

    const auto cost_before = quadratic_cost(network, training_data);
    const std::vector<std::size_t> batch {0, 1};
    update_mini_batch(network, training_data, batch, 0.1f);
    const auto cost_after = quadratic_cost(network, training_data);

    EXPECT_LT(cost_after, cost_before);
}

TEST(UpdateMiniBatch, RejectsEmptyBatch)
{
    auto network = make_network({3, 2});
    const auto training_data = sample_training_data();
    EXPECT_THROW(update_mini_batch(network, training_data, {}, 0.5f),
                 EmptyDatasetError);
}

TEST(Sgd, CallsCallbackOncePerEpoch)
{
    auto network = make_network({3, 4, 2});
    const auto training_data = sample_training_data();
    std::minstd_rand rng(2);

    std::vector<EpochReport> reports;
    sgd(network,
        training_data,
        3,
        2,
        0.5f,
        rng,
        nullptr,
        [&](const EpochReport &report) { reports.push_back(report); });

    ASSERT_EQ(reports.size(), 3u);
    for (std::size_t i {0}; i < reports.size(); ++i)
    {
        EXPECT_EQ(reports[i].epoch, static_cast<int>(i) + 1);
        EXPECT_EQ(reports[i].total_epochs, 3);
        EXPECT_GE(reports[i].elapsed_time, 0.0);
        EXPECT_FALSE(reports[i].accuracy);
        EXPECT_FALSE(reports[i].correct);
        EXPECT_FALSE(reports[i].total);
    }
    EXPECT_LE(reports[0].elapsed_time, reports[2].elapsed_time);
}

TEST(Sgd, ReportsAccuracyWithTestData)
{
    auto network = make_network({3, 4, 2});
    const auto training_data = sample_training_data();
    const auto test_data = sample_test_data();
    std::minstd_rand rng(2);

    std::vector<EpochReport> reports;
    sgd(network,
        training_data,
        2,
        2,
        0.5f,
        rng,
        &test_data,
        [&](const EpochReport &report) { reports.push_back(report); });

    ASSERT_EQ(reports.size(), 2u);
    for (const auto &report : reports)
    {
        ASSERT_TRUE(report.accuracy && report.correct && report.total);
        EXPECT_EQ(*report.total, 3);
        EXPECT_GE(*report.correct, 0);
        EXPECT_LE(*report.correct, 3);
        EXPECT_DOUBLE_EQ(*report.accuracy, *report.correct / 3.0);
    }
    EXPECT_EQ(*reports.back().correct, evaluate(network, test_data));
}

TEST(Sgd, EmptyTrainingDataLeavesNetworkUnchanged)
{
    auto network = make_network({3, 4, 2});
    const auto weights_before = network.weights();
    const auto biases_before = network.biases();
    std::minstd_rand rng(2);

    EXPECT_THROW(sgd(network, {}, 1, 1, 0.5f, rng), EmptyDatasetError);
    EXPECT_EQ(network.weights(), weights_before);
    EXPECT_EQ(network.biases(), biases_before);
}

TEST(Sgd, RejectsInvalidHyperparameters)
{
    auto network = make_network({3, 4, 2});
    const auto weights_before = network.weights();
    const auto training_data = sample_training_data();
    std::minstd_rand rng(2);

    EXPECT_THROW(sgd(network, training_data, 0, 2, 0.5f, rng),
                 InvalidHyperparameter);
    EXPECT_THROW(sgd(network, training_data, 1, 0, 0.5f, rng),
                 InvalidHyperparameter);
    EXPECT_THROW(sgd(network, training_data, 1, 2, 0.0f, rng),
                 InvalidHyperparameter);
    EXPECT_THROW(sgd(network, training_data, 1, 2, -1.0f, rng),
                 InvalidHyperparameter);
    EXPECT_THROW(sgd(network,
                     training_data,
                     1,
                     2,
                     std::numeric_limits<float>::quiet_NaN(),
                     rng),
                 InvalidHyperparameter);
    EXPECT_EQ(network.weights(), weights_before);
}

TEST(Sgd, RejectsMismatchedExamplesBeforeTraining)
{
    auto network = make_network({3, 4, 2});
    const auto weights_before = network.weights();
    auto training_data = sample_training_data();
    training_data.back().target_output = vector_of({1.0f, 0.0f, 0.0f});
    std::minstd_rand rng(2);

    EXPECT_THROW(sgd(network, training_data, 1, 2, 0.5f, rng),
                 DimensionMismatch);
    EXPECT_EQ(network.weights(), weights_before);
}

TEST(Sgd, RejectsEmptyTestData)
{
    auto network = make_network({3, 4, 2});
    const auto training_data = sample_training_data();
    const std::vector<EvaluationExample> test_data;
    std::minstd_rand rng(2);

    EXPECT_THROW(sgd(network, training_data, 1, 2, 0.5f, rng, &test_data),
                 EmptyDatasetError);
}

TEST(Sgd, CallbackExceptionStopsTraining)
{
    auto network = make_network({3, 4, 2});
    const auto weights_before = network.weights();
    const auto training_data = sample_training_data();
    std::minstd_rand rng(2);

    int calls {0};
    EXPECT_THROW(sgd(network,
                     training_data,
                     5,
                     2,
                     0.5f,
                     rng,
                     nullptr,
                     [&](const EpochReport &)
                     {
                         ++calls;
                         throw std::runtime_error("stop");
                     }),
                 std::runtime_error);

    EXPECT_EQ(calls, 1);
    // The first epoch was applied and is not rolled back
    EXPECT_NE(network.weights(), weights_before);
}

TEST(Sgd, LearnsSeparableProblem)
{
    auto network = make_network({2, 4, 2}, 3);
    std::vector<TrainingExample> training_data;
    std::vector<EvaluationExample> test_data;
    for (int i {0}; i < 40; ++i)
    {
        const auto x = static_cast<float>(i % 20) / 20.0f;
        const auto label = i < 20 ? 0 : 1;
        const auto input = label == 0 ? vector_of({x + 0.5f, 0.0f})
                                      : vector_of({0.0f, x + 0.5f});
        training_data.push_back(
            {.input = input,
             .target_output = label == 0 ? vector_of({1.0f, 0.0f})
                                         : vector_of({0.0f, 1.0f})});
        test_data.push_back({.input = input, .label = label});
    }
    std::minstd_rand rng(4);

    const auto cost_before = quadratic_cost(network, training_data);
    sgd(network, training_data, 50, 4, 3.0f, rng, &test_data);

    EXPECT_LT(quadratic_cost(network, training_data), cost_before);
    EXPECT_GE(evaluate(network, test_data), 32);
}

TEST(Evaluate, CountsMatchingLabels)
{
    const auto network = identity_network();
    // sigmoid is increasing, so the argmax of the output is the argmax of x
    const std::vector<EvaluationExample> all_correct {
        {.input = vector_of({2.0f, -1.0f}), .label = 0},
        {.input = vector_of({-1.0f, 3.0f}), .label = 1},
        {.input = vector_of({0.5f, 0.1f}), .label = 0}};
    const std::vector<EvaluationExample> all_wrong {
        {.input = vector_of({2.0f, -1.0f}), .label = 1},
        {.input = vector_of({-1.0f, 3.0f}), .label = 0}};

    EXPECT_EQ(evaluate(network, all_correct), 3);
    EXPECT_EQ(evaluate(network, all_wrong), 0);
    EXPECT_EQ(evaluate(network, {}), 0);
}

TEST(Predict, ReturnsMostActivatedOutput)
{
    const auto network = identity_network();
    EXPECT_EQ(predict(network, vector_of({0.2f, 0.9f})), 1);
    EXPECT_EQ(predict(network, vector_of({0.9f, 0.2f})), 0);
}

TEST(QuadraticCost, MatchesHandComputedValue)
{
    const auto network = identity_network();
    const std::vector<TrainingExample> training_data {
        {.input = vector_of({0.0f, 0.0f}),
         .target_output = vector_of({1.0f, 0.0f})}};

    // output is (0.5, 0.5): 0.5 * (0.25 + 0.25)
    EXPECT_NEAR(quadratic_cost(network, training_data), 0.25, 1e-6);
    EXPECT_THROW(static_cast<void>(quadratic_cost(network, {})),
                 EmptyDatasetError);
}
