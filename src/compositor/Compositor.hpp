/**
 * @file Compositor.hpp
 * @brief Builds and blends one frame's layer stack.
 *
 * Layer order: background (z0), effects under the text (z1), text (z2),
 * effects over the text (z3). Blending happens at padded canvas size and
 * the result is cropped to the frame. Each call takes exactly one buffer
 * from the pool and hands it to the caller; on any error the buffer goes
 * back to the pool before returning.
 *
 * The deadline is checked between layers and once more after the crop, so
 * a slow frame comes back as a recoverable FrameRenderTimeout.
 *
 * @section Dependencies
 * - Qt6 Gui (QImage)
 * - BufferPool
 */

#pragma once
#include <optional>
#include <stop_token>
#include <vector>
#include "BackgroundSource.hpp"
#include "Layer.hpp"
#include "TextRenderer.hpp"
#include "render/BufferPool.hpp"
#include "timing/TimingTypes.hpp"

namespace lf {

class Compositor {
public:
    Compositor(FrameGeometry frame, CanvasConfig canvas);

    Result<FrameBufferPtr> composite(const BackgroundSource& background,
                                     const std::optional<TextSurface>& text,
                                     const std::vector<EffectConfig>& effects,
                                     const RenderContext& context,
                                     BufferPool& pool,
                                     TimePoint deadline = TimePoint::max(),
                                     std::stop_token stop = {}) const;

    // Ordered layer stack for a frame, exposed for inspection
    std::vector<Layer> buildLayers(const QImage& background,
                                   const std::optional<TextSurface>& text,
                                   const std::vector<EffectConfig>& effects,
                                   const RenderContext& context) const;

    const FrameGeometry& frame() const {
        return frame_;
    }
    u32 pad() const {
        return canvas_.pad;
    }

private:
    FrameGeometry frame_;
    CanvasConfig canvas_;
};

} // namespace lf
