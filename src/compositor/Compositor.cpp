#include "Compositor.hpp"
#include <algorithm>
#include <cmath>
#include "Blend.hpp"
#include "Effects.hpp"

namespace lf {

Compositor::Compositor(FrameGeometry frame, CanvasConfig canvas)
    : frame_(frame), canvas_(canvas) {
}

std::vector<Layer> Compositor::buildLayers(
        const QImage& background,
        const std::optional<TextSurface>& text,
        const std::vector<EffectConfig>& effects,
        const RenderContext& context) const {
    std::vector<Layer> layers;
    const auto pad = static_cast<i32>(canvas_.pad);
    const auto canvasW = static_cast<i32>(frame_.paddedWidth(canvas_.pad));
    const auto canvasH = static_cast<i32>(frame_.paddedHeight(canvas_.pad));

    if (!background.isNull())
        layers.push_back(Layer::image(z::Background, background, pad, pad));

    std::optional<TextSurface> surface = text;
    if (surface) {
        for (const auto& e : effects) {
            if (!e.enabled)
                continue;
            if (e.kind == EffectKind::Pulse)
                surface = TextRenderer::scaled(*surface,
                                               effects::parameter(e, context));
            else if (e.kind == EffectKind::HueShift)
                effects::rotateHue(surface->image, effects::parameter(e, context));
        }
    }

    for (const auto& e : effects) {
        if (!e.enabled)
            continue;
        const f32 param = effects::parameter(e, context);

        switch (e.kind) {
        case EffectKind::Glow:
        case EffectKind::Shadow: {
            if (!surface)
                break;
            const auto radius = static_cast<i32>(std::lround(std::max(0.0f, param)));
            QImage blurred = effects::blurredAlpha(
                    surface->image, radius, e.color, e.opacity);
            const i32 spread = effects::blurSpread(radius);
            auto x = static_cast<i32>(surface->origin.x) - spread;
            auto y = static_cast<i32>(surface->origin.y) - spread;
            if (e.kind == EffectKind::Shadow) {
                x += static_cast<i32>(std::lround(e.offset.x));
                y += static_cast<i32>(std::lround(e.offset.y));
            }
            layers.push_back(
                    Layer::image(z::UnderText, std::move(blurred), x, y));
            break;
        }
        case EffectKind::BeatFlash: {
            const f32 strength = std::clamp(param, 0.0f, 1.0f) * e.opacity *
                                 effects::beatFlashEnvelope(context);
            if (strength > 0.0f) {
                layers.push_back(Layer::solid(z::OverText, e.color, canvasW,
                                              canvasH, BlendMode::Add, strength));
            }
            break;
        }
        case EffectKind::Tint: {
            const f32 strength = std::clamp(param, 0.0f, 1.0f) * e.opacity;
            if (strength > 0.0f) {
                layers.push_back(Layer::solid(z::OverText, e.color, canvasW,
                                              canvasH, BlendMode::Multiply,
                                              strength));
            }
            break;
        }
        case EffectKind::Pulse:
        case EffectKind::HueShift:
            break;
        }
    }

    if (surface && !surface->image.isNull()) {
        layers.push_back(Layer::image(z::Text,
                                      surface->image,
                                      static_cast<i32>(surface->origin.x),
                                      static_cast<i32>(surface->origin.y)));
    }

    std::stable_sort(layers.begin(), layers.end(),
                     [](const Layer& a, const Layer& b) {
                         return a.zOrder < b.zOrder;
                     });
    return layers;
}

Result<FrameBufferPtr> Compositor::composite(
        const BackgroundSource& background,
        const std::optional<TextSurface>& text,
        const std::vector<EffectConfig>& effects,
        const RenderContext& context,
        BufferPool& pool,
        TimePoint deadline,
        std::stop_token stop) const {
    auto acquired = pool.acquire(stop);
    if (!acquired)
        return acquired;
    FrameBufferPtr buffer = std::move(acquired).value();

    auto bail = [&](Error error) {
        pool.release(std::move(buffer));
        return Result<FrameBufferPtr>::err(std::move(error));
    };
    auto checkpoint = [&]() -> std::optional<Error> {
        if (stop.stop_requested())
            return Error(ErrorKind::Cancelled, "Composite cancelled");
        if (Clock::now() > deadline) {
            return Error(ErrorKind::FrameRenderTimeout,
                         "Frame render exceeded its deadline")
                    .markRecoverable();
        }
        return std::nullopt;
    };

    buffer->timestamp = context.timestamp;
    buffer->canvas.fill(Qt::transparent);

    if (auto err = checkpoint())
        return bail(std::move(*err));
    auto layers = buildLayers(background.frameAt(context.timestamp), text,
                              effects, context);
    for (const auto& layer : layers) {
        if (auto err = checkpoint())
            return bail(std::move(*err));
        blend::layer(buffer->canvas, layer);
    }

    blend::crop(buffer->canvas, buffer->frame, buffer->pad);

    if (auto err = checkpoint())
        return bail(std::move(*err));

    return Result<FrameBufferPtr>::ok(std::move(buffer));
}

} // namespace lf
