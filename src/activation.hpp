#ifndef ACTIVATION_HPP
#define ACTIVATION_HPP

#include <Eigen/Core>

#include <algorithm>
#include <cmath>
#include <limits>

// Evaluated in double from exp(-|z|), which cannot overflow. Float cannot
// represent sigmoid(z) for z above about 17 or below about -87, so the result
// is bounded to [smallest normal float, largest float below 1].
[[nodiscard]] inline float sigmoid(float z)
{
    const auto e = std::exp(-std::abs(static_cast<double>(z)));
    const auto s = z >= 0.0f ? 1.0 / (1.0 + e) : e / (1.0 + e);
    return std::clamp(static_cast<float>(s),
                      std::numeric_limits<float>::min(),
                      1.0f - std::numeric_limits<float>::epsilon() / 2.0f);
}

// sigmoid(z) * (1 - sigmoid(z)), without the cancellation in 1 - sigmoid(z)
[[nodiscard]] inline float sigmoid_prime(float z)
{
    const auto e = std::exp(-std::abs(static_cast<double>(z)));
    return std::max(static_cast<float>(e / ((1.0 + e) * (1.0 + e))),
                    std::numeric_limits<float>::min());
}

[[nodiscard]] inline Eigen::VectorXf sigmoid(const Eigen::VectorXf &z)
{
    return z.unaryExpr([](float v) { return sigmoid(v); });
}

[[nodiscard]] inline Eigen::VectorXf sigmoid_prime(const Eigen::VectorXf &z)
{
    return z.unaryExpr([](float v) { return sigmoid_prime(v); });
}

#endif // ACTIVATION_HPP
