#include "training.hpp"

#include "errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <string>

namespace
{

void check_hyperparameters(int num_epochs, int batch_size, float learning_rate)
{
    if (num_epochs <= 0)
    {
        throw InvalidHyperparameter("Invalid number of epochs " +
                                    std::to_string(num_epochs) +
                                    ": must be strictly positive");
    }
    if (batch_size <= 0)
    {
        throw InvalidHyperparameter("Invalid mini-batch size " +
                                    std::to_string(batch_size) +
                                    ": must be strictly positive");
    }
    if (!(learning_rate > 0.0f) || !std::isfinite(learning_rate))
    {
        throw InvalidHyperparameter("Invalid learning rate " +
                                    std::to_string(learning_rate) +
                                    ": must be strictly positive");
    }
}

void check_examples(const Network &network,
                    const std::vector<TrainingExample> &training_data)
{
    const auto input_size = network.sizes().front();
    const auto output_size = network.sizes().back();
    for (std::size_t i {0}; i < training_data.size(); ++i)
    {
        const auto &example = training_data[i];
        if (example.input.size() != input_size ||
            example.target_output.size() != output_size)
        {
            throw DimensionMismatch(
                "Training example " + std::to_string(i) + " has shape (" +
                std::to_string(example.input.size()) + ", " +
                std::to_string(example.target_output.size()) +
                "), expected (" + std::to_string(input_size) + ", " +
                std::to_string(output_size) + ")");
        }
    }
}

void check_examples(const Network &network,
                    const std::vector<EvaluationExample> &test_data)
{
    const auto input_size = network.sizes().front();
    for (std::size_t i {0}; i < test_data.size(); ++i)
    {
        if (test_data[i].input.size() != input_size)
        {
            throw DimensionMismatch(
                "Evaluation example " + std::to_string(i) + " has size " +
                std::to_string(test_data[i].input.size()) + ", expected " +
                std::to_string(input_size));
        }
    }
}

inline void accumulate(Gradients &sum, const Gradients &gradients)
{
    for (std::size_t l {0}; l < sum.weights.size(); ++l)
    {
        sum.weights[l] += gradients.weights[l];
        sum.biases[l] += gradients.biases[l];
    }
}

} // namespace

std::vector<std::vector<std::size_t>>
make_mini_batches(std::size_t num_examples,
                  int batch_size,
                  std::minstd_rand &rng)
{
    if (batch_size <= 0)
    {
        throw InvalidHyperparameter("Invalid mini-batch size " +
                                    std::to_string(batch_size) +
                                    ": must be strictly positive");
    }

    std::vector<std::size_t> indices(num_examples);
    std::iota(indices.begin(), indices.end(), std::size_t {0});
    std::shuffle(indices.begin(), indices.end(), rng);

    const auto size = static_cast<std::size_t>(batch_size);
    std::vector<std::vector<std::size_t>> batches;
    batches.reserve((num_examples + size - 1) / size);
    for (std::size_t begin {0}; begin < num_examples; begin += size)
    {
        const auto end = std::min(begin + size, num_examples);
        batches.emplace_back(
            indices.begin() + static_cast<std::ptrdiff_t>(begin),
            indices.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return batches;
}

void update_mini_batch(Network &network,
                       const std::vector<TrainingExample> &training_data,
                       std::span<const std::size_t> batch_indices,
                       float learning_rate)
{
    if (batch_indices.empty())
    {
        throw EmptyDatasetError("Empty mini-batch");
    }

    auto nabla = network.zero_gradients();
    for (const auto index : batch_indices)
    {
        const auto &example = training_data.at(index);
        accumulate(nabla,
                   backprop(network, example.input, example.target_output));
    }

    network.apply_gradients(
        nabla, -learning_rate / static_cast<float>(batch_indices.size()));
}

void sgd(Network &network,
         const std::vector<TrainingExample> &training_data,
         int num_epochs,
         int batch_size,
         float learning_rate,
         std::minstd_rand &rng,
         const std::vector<EvaluationExample> *test_data,
         const ProgressCallback &callback)
{
    if (training_data.empty())
    {
        throw EmptyDatasetError("Empty training data");
    }
    check_hyperparameters(num_epochs, batch_size, learning_rate);
    check_examples(network, training_data);
    if (test_data != nullptr)
    {
        if (test_data->empty())
        {
            throw EmptyDatasetError("Empty evaluation data");
        }
        check_examples(network, *test_data);
    }

    const auto start = std::chrono::steady_clock::now();

    for (int epoch {1}; epoch <= num_epochs; ++epoch)
    {
        const auto batches =
            make_mini_batches(training_data.size(), batch_size, rng);
        for (const auto &batch : batches)
        {
            update_mini_batch(network, training_data, batch, learning_rate);
        }

        EpochReport report {.epoch = epoch,
                            .total_epochs = num_epochs,
                            .elapsed_time = 0.0,
                            .accuracy = {},
                            .correct = {},
                            .total = {}};
        if (test_data != nullptr)
        {
            const auto correct = evaluate(network, *test_data);
            const auto total = static_cast<int>(test_data->size());
            report.correct = correct;
            report.total = total;
            report.accuracy =
                static_cast<double>(correct) / static_cast<double>(total);
        }
        report.elapsed_time = std::chrono::duration<double>(
                                  std::chrono::steady_clock::now() - start)
                                  .count();

        if (callback)
        {
            callback(report);
        }
    }
}

int predict(const Network &network, const Eigen::VectorXf &input)
{
    const auto output = feedforward(network, input);
    Eigen::Index index {};
    output.maxCoeff(&index);
    return static_cast<int>(index);
}

int evaluate(const Network &network,
             const std::vector<EvaluationExample> &test_data)
{
    return static_cast<int>(std::count_if(
        test_data.begin(),
        test_data.end(),
        [&](const EvaluationExample &example)
        { return predict(network, example.input) == example.label; }));
}

double quadratic_cost(const Network &network,
                      const std::vector<TrainingExample> &training_data)
{
    if (training_data.empty())
    {
        throw EmptyDatasetError("Cannot compute the cost of an empty dataset");
    }

    double cost {0.0};
    for (const auto &example : training_data)
    {
        const auto output = feedforward(network, example.input);
        cost += 0.5 * static_cast<double>(
                          cost_derivative(output, example.target_output)
                              .squaredNorm());
    }
    return cost / static_cast<double>(training_data.size());
}
