#ifndef ANIMATIC_SERIALIZATION_CONFIG_JSON_HPP
#define ANIMATIC_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <scene/attribute.hpp>
#include <timeline/scene.hpp>
#include <export/video_sink.hpp>
#include <demos/dial_inspection.hpp>
#include <demos/flatness_roll.hpp>

namespace animatic {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
}

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
    v.z = j.size() > 2 ? j[2].get<double>() : 0.0;
}

// Color as [r, g, b]
inline void to_json(nlohmann::json& j, const Color& c) {
    j = nlohmann::json::array({c.r, c.g, c.b});
}

inline void from_json(const nlohmann::json& j, Color& c) {
    c.r = j.at(0).get<uint8_t>();
    c.g = j.at(1).get<uint8_t>();
    c.b = j.at(2).get<uint8_t>();
}

// SceneConfig serialization. Missing keys keep the values already in
// `config`, so callers can start from a demo's defaults.
inline void to_json(nlohmann::json& j, const SceneConfig& config) {
    j = {
        {"width", config.width},
        {"height", config.height},
        {"resolution", config.resolution},
        {"fps", config.fps},
        {"background", config.background}
    };
    if (config.origin) {
        j["origin"] = *config.origin;
    }
}

inline void from_json(const nlohmann::json& j, SceneConfig& config) {
    config.width = j.value("width", config.width);
    config.height = j.value("height", config.height);
    config.resolution = j.value("resolution", config.resolution);
    config.fps = j.value("fps", config.fps);
    if (j.contains("background")) {
        config.background = j["background"].get<Color>();
    }
    if (j.contains("origin")) {
        config.origin = j["origin"].get<Vec2>();
    }
}

// ExportConfig serialization
inline void to_json(nlohmann::json& j, const ExportConfig& config) {
    j = {
        {"sink", config.sink},
        {"output", config.output},
        {"ffmpeg_path", config.ffmpeg_path},
        {"ffmpeg_extra_args", config.ffmpeg_extra_args},
        {"font", config.font}
    };
}

inline void from_json(const nlohmann::json& j, ExportConfig& config) {
    config.sink = j.value("sink", config.sink);
    config.output = j.value("output", config.output);
    config.ffmpeg_path = j.value("ffmpeg_path", config.ffmpeg_path);
    config.ffmpeg_extra_args = j.value("ffmpeg_extra_args", config.ffmpeg_extra_args);
    config.font = j.value("font", config.font);
}

// DialDemoConfig serialization
inline void to_json(nlohmann::json& j, const DialDemoConfig& config) {
    j = {
        {"diameter", config.diameter},
        {"dial_position", config.dial_position},
        {"part_width", config.part_width},
        {"part_extension", config.part_extension},
        {"part_thickness", config.part_thickness},
        {"part_position", config.part_position},
        {"part_color", config.part_color},
        {"annotation_color", config.annotation_color},
        {"low_reading", config.low_reading},
        {"high_reading", config.high_reading}
    };
}

inline void from_json(const nlohmann::json& j, DialDemoConfig& config) {
    config.diameter = j.value("diameter", config.diameter);
    if (j.contains("dial_position")) config.dial_position = j["dial_position"].get<Vec3>();
    config.part_width = j.value("part_width", config.part_width);
    config.part_extension = j.value("part_extension", config.part_extension);
    config.part_thickness = j.value("part_thickness", config.part_thickness);
    if (j.contains("part_position")) config.part_position = j["part_position"].get<Vec3>();
    if (j.contains("part_color")) config.part_color = j["part_color"].get<Color>();
    if (j.contains("annotation_color")) config.annotation_color = j["annotation_color"].get<Color>();
    config.low_reading = j.value("low_reading", config.low_reading);
    config.high_reading = j.value("high_reading", config.high_reading);
}

// FlatnessDemoConfig serialization
inline void to_json(nlohmann::json& j, const FlatnessDemoConfig& config) {
    j = {
        {"step_duration", config.step_duration},
        {"point_size", config.point_size},
        {"point_color", config.point_color},
        {"lower_color", config.lower_color},
        {"upper_color", config.upper_color},
        {"cycle", config.cycle}
    };
}

inline void from_json(const nlohmann::json& j, FlatnessDemoConfig& config) {
    config.step_duration = j.value("step_duration", config.step_duration);
    config.point_size = j.value("point_size", config.point_size);
    if (j.contains("point_color")) config.point_color = j["point_color"].get<Color>();
    if (j.contains("lower_color")) config.lower_color = j["lower_color"].get<Color>();
    if (j.contains("upper_color")) config.upper_color = j["upper_color"].get<Color>();
    config.cycle = j.value("cycle", config.cycle);
}

}  // namespace animatic

#endif // ANIMATIC_SERIALIZATION_CONFIG_JSON_HPP
