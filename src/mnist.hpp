#ifndef MNIST_HPP
#define MNIST_HPP

#include "training.hpp"

#include <Eigen/Core>

#include <cstdint>
#include <filesystem>
#include <vector>

constexpr int mnist_image_width {28};
constexpr int mnist_image_height {28};
constexpr int mnist_num_classes {10};

struct IdxImages
{
    int width;
    int height;
    // One column per image, pixels in row-major order scaled to [0, 1]
    Eigen::MatrixXf pixels;
};

struct MnistData
{
    std::vector<TrainingExample> training;
    std::vector<EvaluationExample> validation;
    std::vector<EvaluationExample> test;
};

[[nodiscard]] IdxImages load_idx_images(const std::filesystem::path &path);

[[nodiscard]] std::vector<std::uint8_t>
load_idx_labels(const std::filesystem::path &path);

[[nodiscard]] Eigen::VectorXf one_hot(int label, int num_classes);

// Reads the four standard MNIST files from directory. The last
// validation_size training images are held out as the validation set.
[[nodiscard]] MnistData load_mnist(const std::filesystem::path &directory,
                                   int validation_size = 10000);

#endif // MNIST_HPP
