#ifndef ANIMATIC_COMMON_ERRORS_HPP
#define ANIMATIC_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace animatic {

// Invalid scene graph composition (unknown parent, grafting onto a missing node)
class CompositionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Unknown attribute name or a value of the wrong type for a typed field
class AttributeError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// A scheduled instruction failed while replaying the timeline.
// Carries the failing frame, the elapsed time and the literal instruction text.
class ReplayError : public std::runtime_error {
public:
    ReplayError(int frame, double time, std::string instruction, const std::string& cause)
        : std::runtime_error("Instruction failed at frame " + std::to_string(frame) +
                             " (t=" + std::to_string(time) + "s): " + instruction +
                             ": " + cause),
          frame_(frame),
          time_(time),
          instruction_(std::move(instruction)),
          cause_(cause) {}

    int frame() const { return frame_; }
    double time() const { return time_; }
    const std::string& instruction() const { return instruction_; }
    const std::string& cause() const { return cause_; }

private:
    int frame_;
    double time_;
    std::string instruction_;
    std::string cause_;
};

}  // namespace animatic

#endif // ANIMATIC_COMMON_ERRORS_HPP
