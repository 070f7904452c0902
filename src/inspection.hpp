#ifndef INSPECTION_HPP
#define INSPECTION_HPP

#include "network.hpp"
#include "training.hpp"

#include <Eigen/Core>

#include <filesystem>
#include <optional>
#include <random>
#include <vector>

struct ParameterStatistics
{
    float mean;
    float standard_deviation;
    float min;
    float max;
};

struct LayerStatistics
{
    int rows;
    int cols;
    ParameterStatistics weights;
    ParameterStatistics biases;
};

struct ExamplePrediction
{
    std::size_t index;
    int predicted;
    int actual;
    Eigen::VectorXf output;
};

[[nodiscard]] std::vector<LayerStatistics>
layer_statistics(const Network &network);

// Indices of misclassified examples among the first max_check ones, at most
// max_count of them
[[nodiscard]] std::vector<std::size_t>
find_misclassified_examples(const Network &network,
                            const std::vector<EvaluationExample> &test_data,
                            std::size_t max_count = 3,
                            std::size_t max_check = 200);

// Draws random examples until one is classified correctly (or incorrectly if
// successful is false), giving up after max_attempts draws.
[[nodiscard]] std::optional<ExamplePrediction>
find_example(const Network &network,
             const std::vector<EvaluationExample> &test_data,
             bool successful,
             int max_attempts,
             std::minstd_rand &rng);

void write_digit_image(const std::filesystem::path &file_name,
                       const Eigen::VectorXf &input,
                       int width,
                       int height,
                       int scale = 4);

// Blue for positive weights, red for negative ones, brighter for larger
// magnitudes. One weight per scale x scale block, rows of the image are the
// neurons of the next layer.
void write_weights_image(const std::filesystem::path &file_name,
                         const Eigen::MatrixXf &weights,
                         int scale = 4);

#endif // INSPECTION_HPP
