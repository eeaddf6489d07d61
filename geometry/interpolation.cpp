#include "interpolation.hpp"
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace animatic {

Profile profile_from_string(std::string_view name) {
    if (name == "linear") return Profile::Linear;
    if (name == "quadratic") return Profile::Quadratic;
    if (name == "neg_quadratic") return Profile::NegQuadratic;
    if (name == "sinusoid") return Profile::Sinusoid;
    if (name == "sigmoid") return Profile::Sigmoid;
    throw std::invalid_argument("Unknown interpolation profile: " + std::string(name));
}

std::string to_string(Profile profile) {
    switch (profile) {
        case Profile::Linear: return "linear";
        case Profile::Quadratic: return "quadratic";
        case Profile::NegQuadratic: return "neg_quadratic";
        case Profile::Sinusoid: return "sinusoid";
        case Profile::Sigmoid: return "sigmoid";
    }
    return "unknown";
}

std::vector<double> profile_shape(Profile profile, int n) {
    if (n < 2) {
        throw std::invalid_argument("profile_shape requires at least 2 samples");
    }

    std::vector<double> shape(static_cast<size_t>(n));
    const double last = static_cast<double>(n - 1);

    for (int i = 0; i < n; ++i) {
        double t = static_cast<double>(i) / last;  // linspace(0, 1, n)
        double v = 0.0;
        switch (profile) {
            case Profile::Linear:
                v = t;
                break;
            case Profile::Quadratic:
                v = t * t;
                break;
            case Profile::NegQuadratic:
                v = 1.0 - (1.0 - t) * (1.0 - t);
                break;
            case Profile::Sinusoid:
                v = 0.5 - std::cos(std::numbers::pi * t) / 2.0;
                break;
            case Profile::Sigmoid:
                v = 1.0 / (1.0 + std::exp(-10.0 * (t - 0.5)));
                break;
        }
        shape[static_cast<size_t>(i)] = v;
    }

    // Sigmoid and sinusoid do not reach exactly 0 and 1; rescale so they do.
    const double first = shape.front();
    const double span = shape.back() - first;
    for (double& v : shape) {
        v = (v - first) / span;
    }
    shape.front() = 0.0;
    shape.back() = 1.0;

    return shape;
}

}  // namespace animatic
