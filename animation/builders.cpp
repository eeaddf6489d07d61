#include "builders.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

namespace animatic {
namespace animation {

namespace {

void sweep_frames(Scene& scene, int n, int first, const std::string& alias,
                  const std::string& attribute, const AttributeValue& start,
                  const AttributeValue& end, Profile profile) {
    auto samples = std::make_shared<const std::vector<AttributeValue>>(
        interpolate_values(start, end, n, profile));
    for (size_t i = 0; i < samples->size(); ++i) {
        scene.append_instruction(first + static_cast<int>(i),
                                 instruction::SweepAttribute{alias, attribute, samples, i});
    }
}

}  // namespace

int frame_count(double duration, int fps) {
    return std::max(1, static_cast<int>(duration * fps));
}

int start_frame(const Scene& scene, double t_start) {
    if (t_start == kAppend) {
        return scene.last_frame();
    }
    if (t_start < 0.0) {
        throw std::invalid_argument("start time must be non-negative or kAppend");
    }
    return static_cast<int>(t_start * scene.config().fps);
}

void pause(Scene& scene, double duration) {
    int n = frame_count(duration, scene.config().fps);
    scene.append_instruction(scene.last_frame() + n, instruction::Marker{});
}

void slide(Scene& scene, double duration, const std::string& alias, const Vec3& displacement,
           Profile profile, double t_start) {
    const int n = frame_count(duration, scene.config().fps);
    const int start = start_frame(scene, t_start);
    const std::vector<Vec3> values = interpolate(vec3::zero(), displacement, n, profile);

    if (values.size() == 1) {
        scene.append_instruction(start, instruction::Translate{alias, values[0]});
        return;
    }
    for (size_t i = 1; i < values.size(); ++i) {
        scene.append_instruction(start + static_cast<int>(i),
                                 instruction::Translate{alias, values[i] - values[i - 1]});
    }
}

void slide_to(Scene& scene, double duration, const std::string& alias, const Vec3& target,
              Profile profile, double t_start) {
    const int n = frame_count(duration, scene.config().fps);
    const int start = start_frame(scene, t_start);
    const std::vector<double> values = interpolate(0.0, 1.0, n, profile);

    if (values.size() == 1) {
        scene.append_instruction(start, instruction::SetPosition{alias, target});
        return;
    }
    // Each step covers its share of the distance still remaining
    for (size_t i = 1; i < values.size(); ++i) {
        double remaining = values.back() - values[i - 1];
        double fraction = remaining != 0.0 ? (values[i] - values[i - 1]) / remaining : 1.0;
        scene.append_instruction(start + static_cast<int>(i),
                                 instruction::MoveTo{alias, target, fraction});
    }
}

void rotate(Scene& scene, double duration, const std::string& alias, const Vec3& axis,
            double angle, Profile profile, double t_start) {
    if (axis.length_squared() == 0.0) {
        throw std::invalid_argument("rotate: zero-length axis");
    }
    const int n = frame_count(duration, scene.config().fps);
    const int start = start_frame(scene, t_start);
    const std::vector<double> values = interpolate(0.0, angle, n, profile);

    if (values.size() == 1) {
        scene.append_instruction(start, instruction::Rotate{alias, Quaternion::from_axis_angle(axis, values[0])});
        return;
    }
    for (size_t i = 1; i < values.size(); ++i) {
        Quaternion step = Quaternion::from_axis_angle(axis, values[i] - values[i - 1]);
        scene.append_instruction(start + static_cast<int>(i), instruction::Rotate{alias, step});
    }
}

void sweep_attr(Scene& scene, double duration, const std::string& alias,
                const std::string& attribute, const AttributeValue& start,
                const AttributeValue& end, Profile profile, double t_start) {
    sweep_frames(scene, frame_count(duration, scene.config().fps), start_frame(scene, t_start),
                 alias, attribute, start, end, profile);
}

void set_attr(Scene& scene, const std::string& alias, const std::string& attribute,
              const AttributeValue& value, double t_start) {
    scene.append_instruction(start_frame(scene, t_start),
                             instruction::SetAttribute{alias, attribute, value});
}

void sweep_cmd(Scene& scene, double duration, const std::string& description,
               const Command& command, double t_start) {
    const int n = frame_count(duration, scene.config().fps);
    const int start = start_frame(scene, t_start);
    for (int i = 0; i < n; ++i) {
        scene.append_instruction(start + i, instruction::Custom{description, command});
    }
}

void set_cmd(Scene& scene, const std::string& description, const Command& command,
             double t_start) {
    sweep_cmd(scene, kSingleFrame, description, command, t_start);
}

void fade_in(Scene& scene, double duration, const std::string& alias,
             Profile profile, double t_start) {
    const int start = start_frame(scene, t_start);
    scene.append_instruction(start, instruction::SetAttribute{alias, "visible", true});
    sweep_frames(scene, frame_count(duration, scene.config().fps), start,
                 alias, "opacity", 0.0, 1.0, profile);
}

void fade_out(Scene& scene, double duration, const std::string& alias,
              Profile profile, double t_start) {
    const int start = start_frame(scene, t_start);
    const int n = frame_count(duration, scene.config().fps);
    sweep_frames(scene, n, start, alias, "opacity", 1.0, 0.0, profile);
    scene.append_instruction(start + n - 1, instruction::SetAttribute{alias, "visible", false});
}

}  // namespace animation
}  // namespace animatic
