#include "Effects.hpp"
#include <QColor>
#include <cmath>
#include <string>
#include "core/ConfigParsers.hpp"

namespace lf::effects {

namespace {
void boxBlurLine(const f32* in, f32* out, i32 n, i32 stride, i32 k) {
    const f32 norm = 1.0f / static_cast<f32>(2 * k + 1);
    f32 sum = 0.0f;
    for (i32 i = 0; i <= std::min(k, n - 1); ++i)
        sum += in[i * stride];
    for (i32 i = 0; i < n; ++i) {
        out[i * stride] = sum * norm;
        const i32 add = i + k + 1;
        const i32 sub = i - k;
        if (add < n)
            sum += in[add * stride];
        if (sub >= 0)
            sum -= in[sub * stride];
    }
}

void boxBlur(std::vector<f32>& plane, i32 w, i32 h, i32 k) {
    std::vector<f32> tmp(plane.size());
    for (i32 y = 0; y < h; ++y)
        boxBlurLine(&plane[y * w], &tmp[y * w], w, 1, k);
    for (i32 x = 0; x < w; ++x)
        boxBlurLine(&tmp[x], &plane[x], h, w, k);
}
} // namespace

f32 energyFor(const EffectConfig& effect, const RenderContext& ctx) {
    f32 e = effect.band < 0 ? ctx.energy
                            : ctx.band(static_cast<usize>(effect.band));
    return std::clamp(e, 0.0f, 1.0f);
}

f32 parameter(const EffectConfig& effect, const RenderContext& ctx) {
    return effect.base + effect.scale * energyFor(effect, ctx);
}

f32 maxParameter(const EffectConfig& effect) {
    return std::max(effect.base, effect.base + effect.scale);
}

f32 maxExtent(const EffectConfig& effect, Size textBox, f32 textMargin) {
    if (!effect.enabled)
        return 0.0f;

    switch (effect.kind) {
    case EffectKind::Glow:
        return textMargin + maxParameter(effect);
    case EffectKind::Shadow:
        return textMargin +
               std::max(std::abs(effect.offset.x), std::abs(effect.offset.y)) +
               maxParameter(effect);
    case EffectKind::Pulse:
        return std::max(0.0f, maxParameter(effect) - 1.0f) *
               std::max(textBox.width, textBox.height) / 2.0f;
    case EffectKind::BeatFlash:
    case EffectKind::Tint:
    case EffectKind::HueShift:
        return 0.0f;
    }
    return 0.0f;
}

bool drawsUnderText(EffectKind kind) {
    return kind == EffectKind::Glow || kind == EffectKind::Shadow;
}

Result<void> validate(const std::vector<EffectConfig>& effects,
                      u32 pad,
                      Size textBoxHint,
                      f32 textMargin) {
    for (const auto& e : effects) {
        if (!e.enabled)
            continue;

        const std::string name = ConfigParsers::toString(e.kind);
        const f32 minParam = std::min(e.base, e.base + e.scale);
        if ((e.kind == EffectKind::Glow || e.kind == EffectKind::Shadow) &&
            minParam < 0.0f) {
            return Result<void>::err(ErrorKind::EffectConfig,
                                     name + ": negative blur radius");
        }
        if (e.kind == EffectKind::Pulse && minParam <= 0.0f) {
            return Result<void>::err(ErrorKind::EffectConfig,
                                     name + ": scale factor must stay positive");
        }

        const f32 extent = maxExtent(e, textBoxHint, textMargin);
        if (extent > static_cast<f32>(pad)) {
            return Result<void>::err(
                    ErrorKind::EffectConfig,
                    name + " reaches " + std::to_string(extent) +
                            "px past the text, canvas padding is only " +
                            std::to_string(pad) + "px");
        }
    }
    return Result<void>::ok();
}

std::vector<EffectConfig> forStyle(const std::vector<EffectConfig>& effects,
                                   const Style& style) {
    std::vector<EffectConfig> out = effects;
    if (style.glowRadius > 0.0f) {
        EffectConfig glow;
        glow.kind = EffectKind::Glow;
        glow.base = style.glowRadius;
        glow.scale = 0.0f;
        glow.color = style.glowColor;
        glow.opacity = 1.0f;
        out.push_back(glow);
    }
    return out;
}

std::vector<EffectConfig> forSection(std::vector<EffectConfig> effects,
                                     const SectionStyle& section) {
    const f32 intensity = std::max(0.0f, section.glowIntensity);
    for (auto& e : effects) {
        if (e.kind == EffectKind::Glow || e.kind == EffectKind::Shadow) {
            e.base *= intensity;
            e.scale *= intensity;
        } else if (e.kind == EffectKind::BeatFlash && !section.energyBursts) {
            e.enabled = false;
        }
    }
    if (section.hueShift != 0.0f) {
        EffectConfig hue;
        hue.kind = EffectKind::HueShift;
        hue.base = section.hueShift;
        hue.scale = 0.0f;
        hue.opacity = 1.0f;
        effects.push_back(hue);
    }
    return effects;
}

f32 beatFlashEnvelope(const RenderContext& ctx) {
    if (ctx.onset)
        return 1.0f;
    return std::clamp(1.0f - ctx.beatPhase * 4.0f, 0.0f, 1.0f);
}

i32 blurSpread(i32 radius) {
    if (radius <= 0)
        return 0;
    const i32 k = radius / 3;
    return k > 0 ? 3 * k : radius;
}

QImage blurredAlpha(const QImage& src, i32 radius, Color color, f32 opacity) {
    const i32 spread = blurSpread(radius);
    const i32 w = src.width() + 2 * spread;
    const i32 h = src.height() + 2 * spread;
    if (w <= 0 || h <= 0)
        return {};

    const QImage in = src.format() == QImage::Format_RGBA8888
                              ? src
                              : src.convertToFormat(QImage::Format_RGBA8888);

    std::vector<f32> alpha(static_cast<usize>(w) * h, 0.0f);
    for (i32 y = 0; y < in.height(); ++y) {
        const u8* row = in.constScanLine(y);
        for (i32 x = 0; x < in.width(); ++x)
            alpha[(y + spread) * w + x + spread] = row[x * 4 + 3] / 255.0f;
    }

    if (spread > 0) {
        const i32 k = radius / 3;
        if (k > 0) {
            for (int pass = 0; pass < 3; ++pass)
                boxBlur(alpha, w, h, k);
        } else {
            boxBlur(alpha, w, h, radius);
        }
    }

    QImage out(w, h, QImage::Format_RGBA8888);
    const f32 scale = std::clamp(opacity, 0.0f, 1.0f) * (color.a / 255.0f);
    for (i32 y = 0; y < h; ++y) {
        u8* row = out.scanLine(y);
        for (i32 x = 0; x < w; ++x) {
            const f32 a = std::clamp(alpha[y * w + x] * scale, 0.0f, 1.0f);
            row[x * 4 + 0] = color.r;
            row[x * 4 + 1] = color.g;
            row[x * 4 + 2] = color.b;
            row[x * 4 + 3] = static_cast<u8>(a * 255.0f + 0.5f);
        }
    }
    return out;
}

void rotateHue(QImage& image, f32 degrees) {
    const int shift = static_cast<int>(std::lround(degrees)) % 360;
    if (shift == 0 || image.isNull())
        return;
    if (image.format() != QImage::Format_RGBA8888)
        image = image.convertToFormat(QImage::Format_RGBA8888);

    for (int y = 0; y < image.height(); ++y) {
        u8* row = image.scanLine(y);
        for (int x = 0; x < image.width(); ++x) {
            u8* p = row + x * 4;
            if (p[3] == 0)
                continue;
            QColor c(p[0], p[1], p[2]);
            int h, sat, v;
            c.getHsv(&h, &sat, &v);
            if (h < 0) // achromatic
                continue;
            c.setHsv((h + shift + 360) % 360, sat, v);
            p[0] = static_cast<u8>(c.red());
            p[1] = static_cast<u8>(c.green());
            p[2] = static_cast<u8>(c.blue());
        }
    }
}

} // namespace lf::effects
