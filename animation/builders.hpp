#ifndef ANIMATIC_ANIMATION_BUILDERS_HPP
#define ANIMATIC_ANIMATION_BUILDERS_HPP

#include <timeline/scene.hpp>
#include <geometry/interpolation.hpp>
#include <functional>
#include <string>

namespace animatic {
namespace animation {

// Duration sentinel: the transition happens in a single frame
constexpr double kSingleFrame = -1.0;

// Start-time sentinel: start at the last frame currently in the script
constexpr double kAppend = -1.0;

using Command = std::function<void(Scene&)>;

// Frames spanned by `duration` seconds; never less than one
int frame_count(double duration, int fps);

// Frame a transition starting at `t_start` begins on. kAppend resolves
// against the script as it is now.
int start_frame(const Scene& scene, double t_start);

// Extends the timeline by `duration` past the last scheduled frame
void pause(Scene& scene, double duration);

// Relative move of an entity by `displacement` in total
void slide(Scene& scene, double duration, const std::string& alias, const Vec3& displacement,
           Profile profile = Profile::Sigmoid, double t_start = kAppend);

// Absolute move of an entity to `target`, following the profile from
// wherever the entity is when the move starts
void slide_to(Scene& scene, double duration, const std::string& alias, const Vec3& target,
              Profile profile = Profile::Sigmoid, double t_start = kAppend);

// Relative rotation of an entity by `angle` radians about `axis`
void rotate(Scene& scene, double duration, const std::string& alias, const Vec3& axis,
            double angle, Profile profile = Profile::Sigmoid, double t_start = kAppend);

// Steps an attribute from `start` to `end`, one value per frame
void sweep_attr(Scene& scene, double duration, const std::string& alias,
                const std::string& attribute, const AttributeValue& start,
                const AttributeValue& end, Profile profile = Profile::Sigmoid,
                double t_start = kAppend);

void set_attr(Scene& scene, const std::string& alias, const std::string& attribute,
              const AttributeValue& value, double t_start = kAppend);

// Runs `command` once per frame over the duration
void sweep_cmd(Scene& scene, double duration, const std::string& description,
               const Command& command, double t_start = kAppend);

void set_cmd(Scene& scene, const std::string& description, const Command& command,
             double t_start = kAppend);

// Makes the entity visible and sweeps its opacity 0 -> 1
void fade_in(Scene& scene, double duration, const std::string& alias,
             Profile profile = Profile::Sigmoid, double t_start = kAppend);

// Sweeps the opacity 1 -> 0, then hides the entity on the last frame of the fade
void fade_out(Scene& scene, double duration, const std::string& alias,
              Profile profile = Profile::Sigmoid, double t_start = kAppend);

}  // namespace animation
}  // namespace animatic

#endif // ANIMATIC_ANIMATION_BUILDERS_HPP
