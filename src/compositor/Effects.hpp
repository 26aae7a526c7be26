/**
 * @file Effects.hpp
 * @brief Audio-reactive effect parameters, extents and raster helpers.
 *
 * Every effect is driven by one parameter, base + scale * energy, where
 * energy is the selected band (or the mean energy) clamped to [0, 1]. The
 * largest extent an effect can reach past the glyph box is therefore known
 * before rendering starts; validateEffects() rejects a configuration whose
 * extent exceeds the canvas padding.
 *
 * - Glow: blurred text alpha under the text, parameter = blur radius
 * - Shadow: offset blurred copy under the text, parameter = blur radius
 * - Pulse: text scale factor around its centre
 * - BeatFlash: additive full-canvas flash on beats, parameter = intensity
 * - Tint: multiply full-canvas colour, parameter = strength
 * - HueShift: rotates the text hue, parameter = degrees
 *
 * A song section (see SectionMap) scales glow and shadow radius, can turn
 * beat flashes off and adds a fixed hue rotation; forSection() folds those
 * modifiers into the effect list so validation sees the final values.
 */

#pragma once
#include <QImage>
#include <vector>
#include "core/ConfigData.hpp"
#include "timing/TimingTypes.hpp"
#include "util/Result.hpp"

namespace lf::effects {

f32 energyFor(const EffectConfig& effect, const RenderContext& ctx);
f32 parameter(const EffectConfig& effect, const RenderContext& ctx);
f32 maxParameter(const EffectConfig& effect);

// Pixels beyond the glyph box at energy = 1. textMargin is how far the
// rendered text itself reaches past the box (outline and surface margin);
// blurred copies of the text start from there.
f32 maxExtent(const EffectConfig& effect, Size textBox, f32 textMargin = 0.0f);

bool drawsUnderText(EffectKind kind);

Result<void> validate(const std::vector<EffectConfig>& effects,
                      u32 pad,
                      Size textBoxHint,
                      f32 textMargin = 0.0f);

// Effects list for a style: the configured effects plus an always-on glow
// when the style asks for one
std::vector<EffectConfig> forStyle(const std::vector<EffectConfig>& effects,
                                   const Style& style);

std::vector<EffectConfig> forSection(std::vector<EffectConfig> effects,
                                     const SectionStyle& section);

// Flash envelope: 1 on an onset, otherwise decays over the first quarter
// of the beat
f32 beatFlashEnvelope(const RenderContext& ctx);

// Blurred copy of src's alpha, coloured. The result is src grown by
// blurSpread(radius) on every side.
QImage blurredAlpha(const QImage& src, i32 radius, Color color, f32 opacity);
i32 blurSpread(i32 radius);

// Rotates the hue of every visible pixel in place, alpha untouched
void rotateHue(QImage& image, f32 degrees);

} // namespace lf::effects
