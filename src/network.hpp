#ifndef NETWORK_HPP
#define NETWORK_HPP

#include <Eigen/Core>

#include <random>
#include <vector>

// Per-transition gradients (or any other quantity) shaped like the parameters
// of a Network.
struct Gradients
{
    std::vector<Eigen::VectorXf> biases;
    std::vector<Eigen::MatrixXf> weights;
};

// Fully-connected network of sigmoid layers. Transition l maps layer l
// (sizes[l] neurons) to layer l + 1 through weights (sizes[l + 1] x sizes[l])
// and biases (sizes[l + 1]).
class Network
{
public:
    Network(std::vector<int> sizes, std::minstd_rand &rng);

    // Adopts existing parameters, which must match the layer sizes exactly.
    Network(std::vector<int> sizes,
            std::vector<Eigen::MatrixXf> weights,
            std::vector<Eigen::VectorXf> biases);

    [[nodiscard]] const std::vector<int> &sizes() const noexcept
    {
        return m_sizes;
    }

    [[nodiscard]] std::size_t num_layers() const noexcept
    {
        return m_sizes.size();
    }

    [[nodiscard]] const std::vector<Eigen::MatrixXf> &weights() const noexcept
    {
        return m_weights;
    }

    [[nodiscard]] const std::vector<Eigen::VectorXf> &biases() const noexcept
    {
        return m_biases;
    }

    [[nodiscard]] Gradients zero_gradients() const;

    // parameters += scale * gradients
    void apply_gradients(const Gradients &gradients, float scale);

private:
    std::vector<int> m_sizes;
    std::vector<Eigen::MatrixXf> m_weights;
    std::vector<Eigen::VectorXf> m_biases;
};

[[nodiscard]] Eigen::VectorXf feedforward(const Network &network,
                                          const Eigen::VectorXf &input);

// Gradient of the quadratic cost 0.5 * |a - y|^2 for a single example.
[[nodiscard]] Gradients backprop(const Network &network,
                                 const Eigen::VectorXf &input,
                                 const Eigen::VectorXf &target_output);

[[nodiscard]] Eigen::VectorXf
cost_derivative(const Eigen::VectorXf &output_activations,
                const Eigen::VectorXf &target_output);

#endif // NETWORK_HPP
