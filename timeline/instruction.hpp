#ifndef ANIMATIC_TIMELINE_INSTRUCTION_HPP
#define ANIMATIC_TIMELINE_INSTRUCTION_HPP

#include <scene/attribute.hpp>
#include <math/vec3.hpp>
#include <math/mat3.hpp>
#include <math/quaternion.hpp>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace animatic {

class Scene;

namespace instruction {

// Does nothing; extends the timeline (pauses, the frame-0 seed)
struct Marker {};

// Relative move of the entity root
struct Translate {
    std::string alias;
    Vec3 delta;
};

// Moves the root a fraction of the way from its current position to `target`
struct MoveTo {
    std::string alias;
    Vec3 target;
    double fraction = 1.0;
};

struct SetPosition {
    std::string alias;
    Vec3 position;
};

// Relative rotation of the root's axes
struct Rotate {
    std::string alias;
    Quaternion rotation;
};

struct SetOrientation {
    std::string alias;
    Mat3 orientation;
};

struct SetAttribute {
    std::string alias;
    std::string attribute;
    AttributeValue value;
};

// One step of a pre-sampled sweep. The samples are shared between every
// step of the same sweep.
struct SweepAttribute {
    std::string alias;
    std::string attribute;
    std::shared_ptr<const std::vector<AttributeValue>> samples;
    size_t index = 0;
};

// Arbitrary mutation of the scene. `description` is reported on failure.
struct Custom {
    std::string description;
    std::function<void(Scene&)> action;
};

}  // namespace instruction

using Instruction = std::variant<
    instruction::Marker,
    instruction::Translate, instruction::MoveTo, instruction::SetPosition,
    instruction::Rotate, instruction::SetOrientation,
    instruction::SetAttribute, instruction::SweepAttribute,
    instruction::Custom
>;

// Literal text of an instruction, e.g. translate("poly", [-0.012, 0, 0])
std::string describe(const Instruction& instr);

// Applies one instruction to the scene's live entities. Errors propagate
// unchanged; Scene wraps them into ReplayError.
void apply(const Instruction& instr, Scene& scene);

}  // namespace animatic

#endif // ANIMATIC_TIMELINE_INSTRUCTION_HPP
