#ifndef ANIMATIC_SERIALIZATION_FLATNESS_JSON_HPP
#define ANIMATIC_SERIALIZATION_FLATNESS_JSON_HPP

#include "config_json.hpp"
#include <geometry/flatness.hpp>
#include <nlohmann/json.hpp>

namespace animatic {

inline void to_json(nlohmann::json& j, const FlatnessStep& step) {
    j = {
        {"separation", step.separation},
        {"slope", step.slope},
        {"p0", step.p0},
        {"p1", step.p1}
    };
}

inline void from_json(const nlohmann::json& j, FlatnessStep& step) {
    step.separation = j.at("separation").get<double>();
    step.slope = j.at("slope").get<Vec2>();
    step.p0 = j.at("p0").get<Vec2>();
    step.p1 = j.at("p1").get<Vec2>();
}

inline nlohmann::json flatness_to_json(const FlatnessResult& result) {
    return {
        {"flatness", result.flatness},
        {"steps", result.steps}
    };
}

inline FlatnessResult flatness_from_json(const nlohmann::json& j) {
    FlatnessResult result;
    result.flatness = j.at("flatness").get<double>();
    result.steps = j.at("steps").get<std::vector<FlatnessStep>>();
    return result;
}

}  // namespace animatic

#endif // ANIMATIC_SERIALIZATION_FLATNESS_JSON_HPP
