#include "inspection.hpp"

#include "errors.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace
{

[[nodiscard]] constexpr std::uint8_t float_to_u8(float f) noexcept
{
    return static_cast<std::uint8_t>(std::clamp(f, 0.0f, 1.0f) * 255.0f);
}

template <typename Derived>
[[nodiscard]] ParameterStatistics
compute_statistics(const Eigen::DenseBase<Derived> &values)
{
    const auto mean = values.mean();
    const auto variance = (values.derived().array() - mean).square().mean();
    return {.mean = mean,
            .standard_deviation = std::sqrt(variance),
            .min = values.minCoeff(),
            .max = values.maxCoeff()};
}

void check_scale(int scale)
{
    if (scale <= 0)
    {
        throw std::invalid_argument("Invalid image scale " +
                                    std::to_string(scale) +
                                    ": must be strictly positive");
    }
}

void store_png(const std::filesystem::path &file_name,
               int width,
               int height,
               const std::vector<std::uint8_t> &pixel_data)
{
    const auto write_result = stbi_write_png(file_name.string().c_str(),
                                             width,
                                             height,
                                             3,
                                             pixel_data.data(),
                                             width * 3);
    if (write_result == 0)
    {
        throw std::runtime_error("Failed to store image " +
                                 file_name.string());
    }
}

} // namespace

std::vector<LayerStatistics> layer_statistics(const Network &network)
{
    std::vector<LayerStatistics> statistics;
    for (std::size_t l {0}; l < network.weights().size(); ++l)
    {
        const auto &weights = network.weights()[l];
        statistics.push_back(
            {.rows = static_cast<int>(weights.rows()),
             .cols = static_cast<int>(weights.cols()),
             .weights = compute_statistics(weights),
             .biases = compute_statistics(network.biases()[l])});
    }
    return statistics;
}

std::vector<std::size_t>
find_misclassified_examples(const Network &network,
                            const std::vector<EvaluationExample> &test_data,
                            std::size_t max_count,
                            std::size_t max_check)
{
    std::vector<std::size_t> misclassified;
    const auto num_checked = std::min(max_check, test_data.size());
    for (std::size_t i {0};
         i < num_checked && misclassified.size() < max_count;
         ++i)
    {
        if (predict(network, test_data[i].input) != test_data[i].label)
        {
            misclassified.push_back(i);
        }
    }
    return misclassified;
}

std::optional<ExamplePrediction>
find_example(const Network &network,
             const std::vector<EvaluationExample> &test_data,
             bool successful,
             int max_attempts,
             std::minstd_rand &rng)
{
    if (test_data.empty())
    {
        return std::nullopt;
    }

    std::uniform_int_distribution<std::size_t> distribution(
        0, test_data.size() - 1);
    for (int attempt {0}; attempt < max_attempts; ++attempt)
    {
        const auto index = distribution(rng);
        const auto &example = test_data[index];
        auto output = feedforward(network, example.input);
        Eigen::Index predicted {};
        output.maxCoeff(&predicted);
        if ((predicted == example.label) == successful)
        {
            return ExamplePrediction {
                .index = index,
                .predicted = static_cast<int>(predicted),
                .actual = example.label,
                .output = std::move(output)};
        }
    }
    return std::nullopt;
}

void write_digit_image(const std::filesystem::path &file_name,
                       const Eigen::VectorXf &input,
                       int width,
                       int height,
                       int scale)
{
    check_scale(scale);
    if (width <= 0 || height <= 0 ||
        input.size() != static_cast<Eigen::Index>(width) * height)
    {
        throw DimensionMismatch("Input of size " +
                                std::to_string(input.size()) +
                                " is not a " + std::to_string(width) + " x " +
                                std::to_string(height) + " image");
    }

    const auto image_width = width * scale;
    const auto image_height = height * scale;
    std::vector<std::uint8_t> pixel_data(
        static_cast<std::size_t>(image_width) *
        static_cast<std::size_t>(image_height) * 3);
    for (int i {0}; i < image_height; ++i)
    {
        for (int j {0}; j < image_width; ++j)
        {
            const auto value =
                float_to_u8(input((i / scale) * width + j / scale));
            const auto index = (static_cast<std::size_t>(i) *
                                    static_cast<std::size_t>(image_width) +
                                static_cast<std::size_t>(j)) *
                               3;
            pixel_data[index] = value;
            pixel_data[index + 1] = value;
            pixel_data[index + 2] = value;
        }
    }

    store_png(file_name, image_width, image_height, pixel_data);
}

void write_weights_image(const std::filesystem::path &file_name,
                         const Eigen::MatrixXf &weights,
                         int scale)
{
    check_scale(scale);
    if (weights.size() == 0)
    {
        throw DimensionMismatch("Cannot draw an empty weight matrix");
    }

    const auto max_magnitude = weights.cwiseAbs().maxCoeff();
    const auto normalization =
        max_magnitude > 0.0f ? 1.0f / max_magnitude : 0.0f;

    const auto image_width = static_cast<int>(weights.cols()) * scale;
    const auto image_height = static_cast<int>(weights.rows()) * scale;
    std::vector<std::uint8_t> pixel_data(
        static_cast<std::size_t>(image_width) *
        static_cast<std::size_t>(image_height) * 3);
    for (int i {0}; i < image_height; ++i)
    {
        for (int j {0}; j < image_width; ++j)
        {
            const auto weight = weights(i / scale, j / scale);
            const auto intensity =
                float_to_u8(std::abs(weight) * normalization);
            const auto index = (static_cast<std::size_t>(i) *
                                    static_cast<std::size_t>(image_width) +
                                static_cast<std::size_t>(j)) *
                               3;
            pixel_data[index] = weight < 0.0f ? intensity : std::uint8_t {0};
            pixel_data[index + 1] = 0;
            pixel_data[index + 2] =
                weight > 0.0f ? intensity : std::uint8_t {0};
        }
    }

    store_png(file_name, image_width, image_height, pixel_data);
}
