#include "network.hpp"

#include "activation.hpp"
#include "errors.hpp"

#include <string>
#include <utility>

namespace
{

void check_sizes(const std::vector<int> &sizes)
{
    if (sizes.size() < 2)
    {
        throw InvalidArchitecture(
            "A network needs at least an input and an output layer, got " +
            std::to_string(sizes.size()) + " layer(s)");
    }
    for (const auto size : sizes)
    {
        if (size <= 0)
        {
            throw InvalidArchitecture("Invalid layer size of " +
                                      std::to_string(size) +
                                      ": must be strictly positive");
        }
    }
}

inline void check_dimension(const char *what,
                            Eigen::Index size,
                            Eigen::Index expected_size)
{
    if (size != expected_size)
    {
        throw DimensionMismatch(std::string(what) + " has size " +
                                std::to_string(size) + ", expected " +
                                std::to_string(expected_size));
    }
}

inline void check_shapes(const Gradients &gradients, const Network &network)
{
    const auto num_transitions = network.num_layers() - 1;
    if (gradients.weights.size() != num_transitions ||
        gradients.biases.size() != num_transitions)
    {
        throw DimensionMismatch("Gradients have " +
                                std::to_string(gradients.weights.size()) +
                                " transitions, expected " +
                                std::to_string(num_transitions));
    }
    for (std::size_t l {0}; l < num_transitions; ++l)
    {
        const auto &w = network.weights()[l];
        if (gradients.weights[l].rows() != w.rows() ||
            gradients.weights[l].cols() != w.cols())
        {
            throw DimensionMismatch("Weight gradient " + std::to_string(l) +
                                    " does not match the weight shape");
        }
        check_dimension("Bias gradient",
                        gradients.biases[l].size(),
                        network.biases()[l].size());
    }
}

inline Eigen::MatrixXf random_normal(int rows, int cols, std::minstd_rand &rng)
{
    std::normal_distribution<float> distribution(0.0f, 1.0f);
    return Eigen::MatrixXf::NullaryExpr(rows, cols,
                                        [&] { return distribution(rng); });
}

} // namespace

Network::Network(std::vector<int> sizes, std::minstd_rand &rng)
    : m_sizes(std::move(sizes))
{
    check_sizes(m_sizes);

    m_weights.reserve(m_sizes.size() - 1);
    m_biases.reserve(m_sizes.size() - 1);
    for (std::size_t l {0}; l < m_sizes.size() - 1; ++l)
    {
        m_biases.emplace_back(random_normal(m_sizes[l + 1], 1, rng));
        m_weights.push_back(random_normal(m_sizes[l + 1], m_sizes[l], rng));
    }
}

Network::Network(std::vector<int> sizes,
                 std::vector<Eigen::MatrixXf> weights,
                 std::vector<Eigen::VectorXf> biases)
    : m_sizes(std::move(sizes)),
      m_weights(std::move(weights)),
      m_biases(std::move(biases))
{
    check_sizes(m_sizes);

    const auto num_transitions = m_sizes.size() - 1;
    if (m_weights.size() != num_transitions ||
        m_biases.size() != num_transitions)
    {
        throw InvalidArchitecture(
            "Expected " + std::to_string(num_transitions) +
            " weight matrices and bias vectors, got " +
            std::to_string(m_weights.size()) + " and " +
            std::to_string(m_biases.size()));
    }
    for (std::size_t l {0}; l < num_transitions; ++l)
    {
        if (m_weights[l].rows() != m_sizes[l + 1] ||
            m_weights[l].cols() != m_sizes[l] ||
            m_biases[l].size() != m_sizes[l + 1])
        {
            throw InvalidArchitecture("Parameters of transition " +
                                      std::to_string(l) +
                                      " do not match the layer sizes");
        }
    }
}

Gradients Network::zero_gradients() const
{
    Gradients gradients;
    gradients.biases.reserve(m_biases.size());
    gradients.weights.reserve(m_weights.size());
    for (std::size_t l {0}; l < m_weights.size(); ++l)
    {
        gradients.biases.push_back(Eigen::VectorXf::Zero(m_biases[l].size()));
        gradients.weights.push_back(
            Eigen::MatrixXf::Zero(m_weights[l].rows(), m_weights[l].cols()));
    }
    return gradients;
}

void Network::apply_gradients(const Gradients &gradients, float scale)
{
    check_shapes(gradients, *this);

    for (std::size_t l {0}; l < m_weights.size(); ++l)
    {
        m_weights[l].noalias() += scale * gradients.weights[l];
        m_biases[l].noalias() += scale * gradients.biases[l];
    }
}

Eigen::VectorXf feedforward(const Network &network,
                            const Eigen::VectorXf &input)
{
    check_dimension("Input", input.size(), network.sizes().front());

    Eigen::VectorXf activation = input;
    for (std::size_t l {0}; l < network.weights().size(); ++l)
    {
        Eigen::VectorXf z = network.biases()[l];
        z.noalias() += network.weights()[l] * activation;
        activation = sigmoid(z);
    }
    return activation;
}

Gradients backprop(const Network &network,
                   const Eigen::VectorXf &input,
                   const Eigen::VectorXf &target_output)
{
    check_dimension("Input", input.size(), network.sizes().front());
    check_dimension(
        "Target output", target_output.size(), network.sizes().back());

    const auto &weights = network.weights();
    const auto &biases = network.biases();
    const auto num_transitions = weights.size();

    // activations[0] is the input, zs[l] feeds activations[l + 1]
    std::vector<Eigen::VectorXf> activations;
    std::vector<Eigen::VectorXf> zs;
    activations.reserve(num_transitions + 1);
    zs.reserve(num_transitions);
    activations.push_back(input);
    for (std::size_t l {0}; l < num_transitions; ++l)
    {
        Eigen::VectorXf z = biases[l];
        z.noalias() += weights[l] * activations.back();
        activations.push_back(sigmoid(z));
        zs.push_back(std::move(z));
    }

    Gradients nabla;
    nabla.biases.resize(num_transitions);
    nabla.weights.resize(num_transitions);

    Eigen::VectorXf delta =
        cost_derivative(activations.back(), target_output)
            .cwiseProduct(sigmoid_prime(zs.back()));
    nabla.weights.back() =
        delta * activations[num_transitions - 1].transpose();
    nabla.biases.back() = delta;

    for (std::size_t l {num_transitions - 1}; l > 0; --l)
    {
        Eigen::VectorXf propagated = weights[l].transpose() * delta;
        delta = propagated.cwiseProduct(sigmoid_prime(zs[l - 1]));
        nabla.weights[l - 1] = delta * activations[l - 1].transpose();
        nabla.biases[l - 1] = delta;
    }

    return nabla;
}

Eigen::VectorXf cost_derivative(const Eigen::VectorXf &output_activations,
                                const Eigen::VectorXf &target_output)
{
    check_dimension(
        "Target output", target_output.size(), output_activations.size());
    return output_activations - target_output;
}
