#pragma once
// TextRenderer.hpp - Paints one lyric line into a tight RGBA surface
// Outline via QPainterPath stroke, per-word highlight for sung words

#include <QImage>
#include <string>
#include <vector>
#include "core/ConfigData.hpp"
#include "layout/TextAnimator.hpp"
#include "layout/TextLayoutEngine.hpp"

namespace lf {

struct TextSurface {
    QImage image;  // RGBA8888, straight alpha
    Vec2 origin;   // canvas-space top-left of image
    Rect glyphBox; // canvas-space laid-out box, before animation scale
};

class TextRenderer {
public:
    // layout.paintPosition must already carry any animation offset
    static TextSurface render(const std::string& text,
                              const Style& style,
                              const LayoutResult& layout,
                              const AnimationState& animation,
                              const std::vector<f32>& wordProgress = {});

    // Transparent border kept around the scaled glyph box so the outline is
    // never clipped
    static f32 surfaceMargin(f32 strokeWidth);

    // Scales a surface around its centre, used by the pulse effect
    static TextSurface scaled(const TextSurface& surface, f32 factor);
};

} // namespace lf
