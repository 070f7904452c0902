#include "errors.hpp"
#include "inspection.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

// Output of input x is sigmoid(x), so the predicted class is the index of the
// largest input
Network identity_network()
{
    return Network(
        {2, 2}, {Eigen::MatrixXf::Identity(2, 2)}, {Eigen::VectorXf::Zero(2)});
}

EvaluationExample example(float a, float b, int label)
{
    Eigen::VectorXf input(2);
    input << a, b;
    return {.input = input, .label = label};
}

class InspectionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        std::random_device device;
        m_directory = std::filesystem::temp_directory_path() /
                      ("neural_digits_images_" + std::to_string(device()));
        std::filesystem::create_directories(m_directory);
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(m_directory, error);
    }

    std::filesystem::path m_directory;
};

} // namespace

TEST(LayerStatistics, DescribesEveryTransition)
{
    Eigen::MatrixXf weights(2, 2);
    weights << 1.0f, -1.0f, 3.0f, 1.0f;
    Eigen::VectorXf biases(2);
    biases << 2.0f, 2.0f;
    const Network network({2, 2, 1},
                          {weights, Eigen::MatrixXf::Zero(1, 2)},
                          {biases, Eigen::VectorXf::Ones(1)});

    const auto statistics = layer_statistics(network);
    ASSERT_EQ(statistics.size(), 2u);

    EXPECT_EQ(statistics[0].rows, 2);
    EXPECT_EQ(statistics[0].cols, 2);
    EXPECT_FLOAT_EQ(statistics[0].weights.mean, 1.0f);
    EXPECT_FLOAT_EQ(statistics[0].weights.standard_deviation, std::sqrt(2.0f));
    EXPECT_FLOAT_EQ(statistics[0].weights.min, -1.0f);
    EXPECT_FLOAT_EQ(statistics[0].weights.max, 3.0f);
    EXPECT_FLOAT_EQ(statistics[0].biases.mean, 2.0f);
    EXPECT_FLOAT_EQ(statistics[0].biases.standard_deviation, 0.0f);

    EXPECT_EQ(statistics[1].rows, 1);
    EXPECT_EQ(statistics[1].cols, 2);
    EXPECT_FLOAT_EQ(statistics[1].biases.max, 1.0f);
}

TEST(FindMisclassifiedExamples, ReturnsWrongPredictionsInOrder)
{
    const auto network = identity_network();
    const std::vector<EvaluationExample> test_data {example(1.0f, 0.0f, 0),
                                                    example(1.0f, 0.0f, 1),
                                                    example(0.0f, 1.0f, 1),
                                                    example(0.0f, 1.0f, 0),
                                                    example(2.0f, 0.0f, 1),
                                                    example(0.0f, 2.0f, 0)};

    EXPECT_EQ(find_misclassified_examples(network, test_data),
              (std::vector<std::size_t> {1, 3, 4}));
    EXPECT_EQ(find_misclassified_examples(network, test_data, 10),
              (std::vector<std::size_t> {1, 3, 4, 5}));
    EXPECT_EQ(find_misclassified_examples(network, test_data, 10, 4),
              (std::vector<std::size_t> {1, 3}));
    EXPECT_TRUE(find_misclassified_examples(network, {}).empty());
}

TEST(FindExample, FindsSuccessfulAndUnsuccessfulPredictions)
{
    const auto network = identity_network();
    const std::vector<EvaluationExample> test_data {example(1.0f, 0.0f, 0),
                                                    example(1.0f, 0.0f, 1)};
    std::minstd_rand rng(6);

    const auto successful = find_example(network, test_data, true, 100, rng);
    ASSERT_TRUE(successful);
    EXPECT_EQ(successful->index, 0u);
    EXPECT_EQ(successful->predicted, 0);
    EXPECT_EQ(successful->actual, 0);
    EXPECT_EQ(successful->output.size(), 2);

    const auto unsuccessful =
        find_example(network, test_data, false, 100, rng);
    ASSERT_TRUE(unsuccessful);
    EXPECT_EQ(unsuccessful->index, 1u);
    EXPECT_EQ(unsuccessful->predicted, 0);
    EXPECT_EQ(unsuccessful->actual, 1);
}

TEST(FindExample, GivesUpWhenNoneMatches)
{
    const auto network = identity_network();
    const std::vector<EvaluationExample> test_data {example(1.0f, 0.0f, 0)};
    std::minstd_rand rng(6);

    EXPECT_FALSE(find_example(network, test_data, false, 20, rng));
    EXPECT_FALSE(find_example(network, {}, true, 20, rng));
}

TEST_F(InspectionTest, WritesDigitImage)
{
    const auto path = m_directory / "digit.png";
    write_digit_image(path, Eigen::VectorXf::LinSpaced(12, 0.0f, 1.0f), 4, 3);

    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_GT(std::filesystem::file_size(path), 0u);
}

TEST_F(InspectionTest, RejectsMismatchedDigitImage)
{
    const auto path = m_directory / "digit.png";
    EXPECT_THROW(write_digit_image(path, Eigen::VectorXf::Zero(10), 4, 3),
                 DimensionMismatch);
    EXPECT_THROW(write_digit_image(path, Eigen::VectorXf::Zero(12), 4, 3, 0),
                 std::invalid_argument);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(InspectionTest, WritesWeightsImage)
{
    std::minstd_rand rng(1);
    const Network network({6, 3, 2}, rng);

    for (std::size_t l {0}; l < network.weights().size(); ++l)
    {
        const auto path =
            m_directory / ("weights_" + std::to_string(l) + ".png");
        write_weights_image(path, network.weights()[l], 2);
        ASSERT_TRUE(std::filesystem::exists(path));
        EXPECT_GT(std::filesystem::file_size(path), 0u);
    }

    EXPECT_THROW(write_weights_image(m_directory / "empty.png",
                                     Eigen::MatrixXf()),
                 DimensionMismatch);
}

TEST_F(InspectionTest, ReportsUnwritableImage)
{
    const auto path = m_directory / "missing" / "digit.png";
    EXPECT_THROW(write_digit_image(path, Eigen::VectorXf::Zero(4), 2, 2),
                 std::runtime_error);
}
