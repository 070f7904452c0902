#ifndef TRAINING_HPP
#define TRAINING_HPP

#include "network.hpp"

#include <Eigen/Core>

#include <functional>
#include <optional>
#include <random>
#include <span>
#include <vector>

struct TrainingExample
{
    Eigen::VectorXf input;
    Eigen::VectorXf target_output;
};

struct EvaluationExample
{
    Eigen::VectorXf input;
    int label;
};

// Sent once per epoch. The optional fields are only set when evaluation
// examples were given to sgd().
struct EpochReport
{
    int epoch;
    int total_epochs;
    double elapsed_time; // seconds since the start of training
    std::optional<double> accuracy;
    std::optional<int> correct;
    std::optional<int> total;
};

using ProgressCallback = std::function<void(const EpochReport &)>;

// Shuffled partition of [0, num_examples) into consecutive mini-batches, the
// last one possibly smaller.
[[nodiscard]] std::vector<std::vector<std::size_t>>
make_mini_batches(std::size_t num_examples,
                  int batch_size,
                  std::minstd_rand &rng);

// One gradient descent step on the examples selected by batch_indices.
void update_mini_batch(Network &network,
                       const std::vector<TrainingExample> &training_data,
                       std::span<const std::size_t> batch_indices,
                       float learning_rate);

// Mini-batch stochastic gradient descent. All arguments are validated before
// the network is modified. An exception thrown by the callback stops training
// and leaves the updates of the completed mini-batches in place.
void sgd(Network &network,
         const std::vector<TrainingExample> &training_data,
         int num_epochs,
         int batch_size,
         float learning_rate,
         std::minstd_rand &rng,
         const std::vector<EvaluationExample> *test_data = nullptr,
         const ProgressCallback &callback = {});

[[nodiscard]] int predict(const Network &network, const Eigen::VectorXf &input);

// Number of examples whose most activated output neuron matches the label.
[[nodiscard]] int evaluate(const Network &network,
                           const std::vector<EvaluationExample> &test_data);

// Mean of 0.5 * |a - y|^2 over the examples.
[[nodiscard]] double
quadratic_cost(const Network &network,
               const std::vector<TrainingExample> &training_data);

#endif // TRAINING_HPP
