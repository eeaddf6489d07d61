#ifndef ANIMATIC_GEOMETRY_INTERPOLATION_HPP
#define ANIMATIC_GEOMETRY_INTERPOLATION_HPP

#include <string>
#include <string_view>
#include <vector>

namespace animatic {

// Shape of the transition between two values.
enum class Profile {
    Linear,
    Quadratic,      // slow start
    NegQuadratic,   // slow finish
    Sinusoid,       // half cosine ease-in/ease-out
    Sigmoid         // logistic, steeper middle than Sinusoid
};

Profile profile_from_string(std::string_view name);
std::string to_string(Profile profile);

// Normalized profile samples: n values, first exactly 0.0, last exactly 1.0.
// Requires n >= 2.
std::vector<double> profile_shape(Profile profile, int n);

// n values spanning start -> end along the profile.
//
// n <= 1 yields the single value `end`: a one-frame transition snaps to its
// target. For n > 1 the first element is `start` and the last is `end`
// bit-for-bit, independent of rounding in the shape curve.
//
// T needs T - T, T + T and T * double (double, Vec2, Vec3 all qualify).
template <typename T>
std::vector<T> interpolate(const T& start, const T& end, int n, Profile profile = Profile::Sigmoid) {
    if (n <= 1) {
        return {end};
    }
    std::vector<double> shape = profile_shape(profile, n);
    const T delta = end - start;

    std::vector<T> result;
    result.reserve(static_cast<size_t>(n));
    for (double s : shape) {
        result.push_back(start + delta * s);
    }
    result.front() = start;
    result.back() = end;
    return result;
}

}  // namespace animatic

#endif // ANIMATIC_GEOMETRY_INTERPOLATION_HPP
