#include "TextAnimator.hpp"
#include <cmath>

namespace lf {

f32 TextAnimator::ease(Easing easing, f32 t) {
    t = std::clamp(t, 0.0f, 1.0f);
    switch (easing) {
    case Easing::Linear:
        return t;
    case Easing::EaseIn:
        return t * t;
    case Easing::EaseOut:
        return t * (2.0f - t);
    case Easing::EaseInOut:
        return t < 0.5f ? 2.0f * t * t : -1.0f + (4.0f - 2.0f * t) * t;
    case Easing::Bounce:
        if (t < 1.0f / 2.75f)
            return 7.5625f * t * t;
        if (t < 2.0f / 2.75f) {
            t -= 1.5f / 2.75f;
            return 7.5625f * t * t + 0.75f;
        }
        if (t < 2.5f / 2.75f) {
            t -= 2.25f / 2.75f;
            return 7.5625f * t * t + 0.9375f;
        }
        t -= 2.625f / 2.75f;
        return 7.5625f * t * t + 0.984375f;
    }
    return t;
}

AnimationState TextAnimator::compute(const Style& style,
                                     f64 timeInCue,
                                     f64 timeToCueEnd) {
    AnimationState state;
    if (style.animation == AnimationKind::None || style.animationDuration <= 0.0f)
        return state;

    const auto dur = static_cast<f64>(style.animationDuration);
    const auto in = static_cast<f32>(std::clamp(timeInCue / dur, 0.0, 1.0));
    const auto out = static_cast<f32>(std::clamp(timeToCueEnd / dur, 0.0, 1.0));
    const f32 easedIn = ease(style.easing, in);
    const f32 easedOut = ease(style.easing, out);

    switch (style.animation) {
    case AnimationKind::None:
        break;
    case AnimationKind::Fade:
        state.opacity = std::min(easedIn, easedOut);
        break;
    case AnimationKind::SlideUp:
        state.offset.y = (1.0f - easedIn) * kSlideDistance;
        state.opacity = std::min(std::clamp(easedIn, 0.0f, 1.0f), easedOut);
        break;
    case AnimationKind::ScaleIn:
        state.scale = kMinScale + (1.0f - kMinScale) * easedIn;
        state.opacity = easedOut;
        break;
    case AnimationKind::Typewriter:
        state.charProgress = easedIn;
        state.opacity = easedOut;
        break;
    }
    state.opacity = std::clamp(state.opacity, 0.0f, 1.0f);
    return state;
}

std::string TextAnimator::visibleText(const std::string& text, f32 charProgress) {
    if (charProgress >= 1.0f)
        return text;
    if (charProgress <= 0.0f)
        return {};

    usize codePoints = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80)
            ++codePoints;
    }
    auto shown = static_cast<usize>(
            std::ceil(static_cast<f32>(codePoints) * charProgress));

    usize seen = 0;
    for (usize i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (seen == shown)
                return text.substr(0, i);
            ++seen;
        }
    }
    return text;
}

} // namespace lf
