#pragma once
// TextAnimator.hpp - Cue entrance/exit animation and easing curves
// Entrance runs over the first animationDuration seconds of a cue, exit over
// the last; the animator only produces deltas, placement stays with layout

#include <string>
#include "core/ConfigData.hpp"
#include "util/Types.hpp"

namespace lf {

struct AnimationState {
    f32 opacity{1.0f};
    Vec2 offset;          // frame-space delta, re-clamped by the caller
    f32 scale{1.0f};
    f32 charProgress{1.0f}; // typewriter: fraction of characters shown

    bool operator==(const AnimationState&) const = default;
};

class TextAnimator {
public:
    static constexpr f32 kSlideDistance = 40.0f;
    static constexpr f32 kMinScale = 0.5f;

    static f32 ease(Easing easing, f32 t);

    static AnimationState compute(const Style& style,
                                  f64 timeInCue,
                                  f64 timeToCueEnd);

    // Leading part of text shown for a typewriter progress, on UTF-8
    // code point boundaries
    static std::string visibleText(const std::string& text, f32 charProgress);
};

} // namespace lf
