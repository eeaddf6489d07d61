#include "instruction.hpp"
#include "scene.hpp"
#include <stdexcept>

namespace animatic {

namespace {

std::string quoted(const std::string& s) {
    return "\"" + s + "\"";
}

std::string format_quaternion(const Quaternion& q) {
    return "(" + to_string(AttributeValue{q.w}) + ", " + to_string(AttributeValue{q.x}) + ", " +
           to_string(AttributeValue{q.y}) + ", " + to_string(AttributeValue{q.z}) + ")";
}

const AttributeValue& sample_at(const instruction::SweepAttribute& sweep) {
    if (!sweep.samples || sweep.index >= sweep.samples->size()) {
        throw std::out_of_range("sweep step " + std::to_string(sweep.index) + " has no sample");
    }
    return (*sweep.samples)[sweep.index];
}

}  // namespace

std::string describe(const Instruction& instr) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, instruction::Marker>) {
            return "pass";
        } else if constexpr (std::is_same_v<T, instruction::Translate>) {
            return "translate(" + quoted(arg.alias) + ", " + to_string(AttributeValue{arg.delta}) + ")";
        } else if constexpr (std::is_same_v<T, instruction::MoveTo>) {
            return "move_to(" + quoted(arg.alias) + ", " + to_string(AttributeValue{arg.target}) +
                   ", " + to_string(AttributeValue{arg.fraction}) + ")";
        } else if constexpr (std::is_same_v<T, instruction::SetPosition>) {
            return "set_position(" + quoted(arg.alias) + ", " +
                   to_string(AttributeValue{arg.position}) + ")";
        } else if constexpr (std::is_same_v<T, instruction::Rotate>) {
            return "rotate(" + quoted(arg.alias) + ", " + format_quaternion(arg.rotation) + ")";
        } else if constexpr (std::is_same_v<T, instruction::SetOrientation>) {
            return "set_orientation(" + quoted(arg.alias) + ", " +
                   to_string(AttributeValue{arg.orientation}) + ")";
        } else if constexpr (std::is_same_v<T, instruction::SetAttribute>) {
            return "set_attr(" + quoted(arg.alias) + ", " + quoted(arg.attribute) + ", " +
                   to_string(arg.value) + ")";
        } else if constexpr (std::is_same_v<T, instruction::SweepAttribute>) {
            std::string value = (arg.samples && arg.index < arg.samples->size())
                                    ? to_string((*arg.samples)[arg.index])
                                    : "<missing>";
            return "set_attr(" + quoted(arg.alias) + ", " + quoted(arg.attribute) + ", " +
                   value + ")";
        } else {
            return arg.description;
        }
    }, instr);
}

void apply(const Instruction& instr, Scene& scene) {
    std::visit([&scene](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, instruction::Marker>) {
            return;
        } else if constexpr (std::is_same_v<T, instruction::Translate>) {
            scene.entity(arg.alias).move(NodeTree::kRoot, MoveSpec{.delta_position = arg.delta});
        } else if constexpr (std::is_same_v<T, instruction::MoveTo>) {
            NodeTree& tree = scene.entity(arg.alias);
            Vec3 delta = (arg.target - tree.local_position(NodeTree::kRoot)) * arg.fraction;
            tree.move(NodeTree::kRoot, MoveSpec{.delta_position = delta});
        } else if constexpr (std::is_same_v<T, instruction::SetPosition>) {
            scene.entity(arg.alias).move(NodeTree::kRoot, MoveSpec{.position = arg.position});
        } else if constexpr (std::is_same_v<T, instruction::Rotate>) {
            scene.entity(arg.alias).move(NodeTree::kRoot, MoveSpec{.delta_rotation = arg.rotation});
        } else if constexpr (std::is_same_v<T, instruction::SetOrientation>) {
            scene.entity(arg.alias).move(NodeTree::kRoot, MoveSpec{.orientation = arg.orientation});
        } else if constexpr (std::is_same_v<T, instruction::SetAttribute>) {
            scene.entity(arg.alias).set_attribute(NodeTree::kRoot, arg.attribute, arg.value);
        } else if constexpr (std::is_same_v<T, instruction::SweepAttribute>) {
            scene.entity(arg.alias).set_attribute(NodeTree::kRoot, arg.attribute, sample_at(arg));
        } else if constexpr (std::is_same_v<T, instruction::Custom>) {
            if (!arg.action) {
                throw std::invalid_argument("command has no action");
            }
            arg.action(scene);
        }
    }, instr);
}

}  // namespace animatic
