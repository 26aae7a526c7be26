/**
 * @file TextLayoutEngine.hpp
 * @brief Safe-zone text placement across the padded canvas and the frame.
 *
 * Positions are computed in final-frame space against the safe zone and only
 * then translated into canvas space by adding the canvas padding, exactly
 * once. The crop that follows removes the same padding, so the cropped glyph
 * box always satisfies
 *
 *   top <= y <= frameHeight - bottom - textHeight
 *   left <= x <= frameWidth - right - textWidth
 *
 * for every pad value. Text wider than the available width is placed at the
 * left margin and allowed to overflow to the right.
 *
 * Measurements are cached per (text, family, size, bold) in a bounded LRU
 * owned by the engine; one engine lives for one job.
 *
 * @section Dependencies
 * - TextMeasurer
 * - ConfigData (SafeZoneConfig, CanvasConfig, Style)
 */

#pragma once
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include "TextMeasurer.hpp"
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace lf {

struct FrameGeometry {
    u32 width{1920};
    u32 height{1080};

    u32 paddedWidth(u32 pad) const {
        return width + 2 * pad;
    }
    u32 paddedHeight(u32 pad) const {
        return height + 2 * pad;
    }
    bool operator==(const FrameGeometry&) const = default;
};

struct LayoutResult {
    Vec2 paintPosition;   // canvas space, top-left of the glyph box
    Vec2 framePosition;   // frame space
    Rect boundingBox;     // frame space
    Size textSize;
    f32 ascent{0.0f};
    u32 fontSize{0};
    bool overflowedWidth{false}; // wide-text fallback applied

    bool operator==(const LayoutResult&) const = default;
};

class TextLayoutEngine {
public:
    TextLayoutEngine(FrameGeometry frame,
                     SafeZoneConfig safeZone,
                     CanvasConfig canvas,
                     const TextMeasurer& measurer,
                     usize cacheCapacity = 256);

    Result<LayoutResult> layout(const std::string& text,
                                const Style& style) const;

    // Same as layout() but at an explicit font size
    Result<LayoutResult> layout(const std::string& text,
                                const Style& style,
                                u32 fontSize) const;

    // Largest size <= style.fontSize, in 10% steps, that fits the safe zone.
    // Returns minSize when only the height fits there; LayoutOverflow when
    // even minSize is too tall.
    Result<u32> fitFontSize(const std::string& text,
                            const Style& style,
                            u32 minSize) const;

    // Pulls a frame-space position back inside the safe zone
    Vec2 clampToSafeZone(Vec2 framePos, Size size) const;

    // True when a frame-space glyph box satisfies the safe-zone invariant
    bool withinSafeZone(const Rect& box) const;

    TextMetrics measure(const std::string& text, const FontSpec& font) const;

    Vec2 toCanvas(Vec2 framePos) const {
        auto pad = static_cast<f32>(canvas_.pad);
        return {framePos.x + pad, framePos.y + pad};
    }

    Rect safeRect() const;
    f32 availableWidth() const;
    f32 availableHeight() const;

    const FrameGeometry& frame() const {
        return frame_;
    }
    const SafeZoneConfig& safeZone() const {
        return safeZone_;
    }
    u32 pad() const {
        return canvas_.pad;
    }

    usize cachedEntries() const;
    usize cacheHits() const;
    usize cacheMisses() const;

    static FontSpec fontFor(const Style& style, u32 fontSize);

private:
    FrameGeometry frame_;
    SafeZoneConfig safeZone_;
    CanvasConfig canvas_;
    const TextMeasurer& measurer_;

    // LRU: front is most recent
    using Entry = std::pair<std::string, TextMetrics>;
    usize capacity_;
    mutable std::list<Entry> lru_;
    mutable std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    mutable usize hits_{0};
    mutable usize misses_{0};
    mutable std::mutex cacheMutex_;
};

} // namespace lf
