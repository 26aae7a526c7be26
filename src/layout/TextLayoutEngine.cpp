#include "TextLayoutEngine.hpp"
#include <cmath>
#include "core/Logger.hpp"

namespace lf {

namespace {
std::string cacheKey(const std::string& text, const FontSpec& font) {
    std::string key = font.family;
    key += '\x1f';
    key += std::to_string(font.pixelSize);
    key += font.bold ? 'b' : 'n';
    key += '\x1f';
    key += text;
    return key;
}
} // namespace

TextLayoutEngine::TextLayoutEngine(FrameGeometry frame,
                                   SafeZoneConfig safeZone,
                                   CanvasConfig canvas,
                                   const TextMeasurer& measurer,
                                   usize cacheCapacity)
    : frame_(frame),
      safeZone_(safeZone),
      canvas_(canvas),
      measurer_(measurer),
      capacity_(std::max<usize>(1, cacheCapacity)) {
}

FontSpec TextLayoutEngine::fontFor(const Style& style, u32 fontSize) {
    return FontSpec{style.fontFamily, fontSize, style.bold};
}

TextMetrics TextLayoutEngine::measure(const std::string& text,
                                      const FontSpec& font) const {
    auto key = cacheKey(text, font);
    {
        std::lock_guard lock(cacheMutex_);
        if (auto it = index_.find(key); it != index_.end()) {
            lru_.splice(lru_.begin(), lru_, it->second);
            ++hits_;
            return it->second->second;
        }
        ++misses_;
    }

    // Measure outside the lock; two workers racing on the same key both
    // measure and the second insert just refreshes the entry
    TextMetrics m = measurer_.measure(text, font);

    std::lock_guard lock(cacheMutex_);
    if (auto it = index_.find(key); it != index_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second);
        return it->second->second;
    }
    lru_.emplace_front(key, m);
    index_[key] = lru_.begin();
    if (lru_.size() > capacity_) {
        index_.erase(lru_.back().first);
        lru_.pop_back();
    }
    return m;
}

f32 TextLayoutEngine::availableWidth() const {
    return static_cast<f32>(frame_.width) - static_cast<f32>(safeZone_.left) -
           static_cast<f32>(safeZone_.right);
}

f32 TextLayoutEngine::availableHeight() const {
    return static_cast<f32>(frame_.height) - static_cast<f32>(safeZone_.top) -
           static_cast<f32>(safeZone_.bottom);
}

Rect TextLayoutEngine::safeRect() const {
    return {static_cast<f32>(safeZone_.left),
            static_cast<f32>(safeZone_.top),
            std::max(0.0f, availableWidth()),
            std::max(0.0f, availableHeight())};
}

Result<LayoutResult> TextLayoutEngine::layout(const std::string& text,
                                              const Style& style) const {
    return layout(text, style, style.fontSize);
}

Result<LayoutResult> TextLayoutEngine::layout(const std::string& text,
                                              const Style& style,
                                              u32 fontSize) const {
    const TextMetrics m = measure(text, fontFor(style, fontSize));
    const f32 availW = availableWidth();
    const f32 availH = availableHeight();
    const auto left = static_cast<f32>(safeZone_.left);
    const auto top = static_cast<f32>(safeZone_.top);
    const auto frameW = static_cast<f32>(frame_.width);
    const auto frameH = static_cast<f32>(frame_.height);

    if (m.height > availH) {
        return Result<LayoutResult>::err(
                ErrorKind::LayoutOverflow,
                "Text height " + std::to_string(m.height) +
                        " exceeds safe zone height " + std::to_string(availH) +
                        " at font size " + std::to_string(fontSize));
    }

    LayoutResult out;
    out.textSize = {m.width, m.height};
    out.ascent = m.ascent;
    out.fontSize = fontSize;

    f32 x = left;
    if (m.width <= availW) {
        switch (style.alignment) {
        case Alignment::Left:
            x = left;
            break;
        case Alignment::Center:
            x = left + (availW - m.width) / 2.0f;
            break;
        case Alignment::Right:
            x = frameW - static_cast<f32>(safeZone_.right) - m.width;
            break;
        }
    } else {
        out.overflowedWidth = true;
    }

    f32 y = top;
    switch (style.verticalPosition) {
    case VerticalPosition::Top:
        y = top;
        break;
    case VerticalPosition::Center:
        y = top + (availH - m.height) / 2.0f;
        break;
    case VerticalPosition::Bottom:
        y = frameH - static_cast<f32>(safeZone_.bottom) - m.height;
        break;
    }
    y = std::clamp(y, top, frameH - static_cast<f32>(safeZone_.bottom) - m.height);

    out.framePosition = {x, y};
    out.boundingBox = {x, y, m.width, m.height};
    out.paintPosition = toCanvas(out.framePosition);
    return Result<LayoutResult>::ok(out);
}

Result<u32> TextLayoutEngine::fitFontSize(const std::string& text,
                                          const Style& style,
                                          u32 minSize) const {
    minSize = std::max<u32>(1, minSize);
    u32 size = std::max(style.fontSize, minSize);

    while (true) {
        const TextMetrics m = measure(text, fontFor(style, size));
        if (m.height <= availableHeight() && m.width <= availableWidth())
            return Result<u32>::ok(size);
        if (size <= minSize)
            break;
        auto next = static_cast<u32>(std::floor(static_cast<f32>(size) * 0.9f));
        size = std::max(minSize, std::min(next, size - 1));
    }

    const TextMetrics atMin = measure(text, fontFor(style, minSize));
    if (atMin.height <= availableHeight()) {
        LOG_DEBUG("Layout: '{}' still wider than safe zone at {}px", text, minSize);
        return Result<u32>::ok(minSize);
    }
    return Result<u32>::err(ErrorKind::LayoutOverflow,
                            "Text does not fit the safe zone at minimum font "
                            "size " + std::to_string(minSize));
}

Vec2 TextLayoutEngine::clampToSafeZone(Vec2 framePos, Size size) const {
    const auto left = static_cast<f32>(safeZone_.left);
    const auto top = static_cast<f32>(safeZone_.top);
    const f32 maxX = std::max(
            left,
            static_cast<f32>(frame_.width) - static_cast<f32>(safeZone_.right) -
                    size.width);
    const f32 maxY = std::max(
            top,
            static_cast<f32>(frame_.height) -
                    static_cast<f32>(safeZone_.bottom) - size.height);
    return {std::clamp(framePos.x, left, maxX),
            std::clamp(framePos.y, top, maxY)};
}

bool TextLayoutEngine::withinSafeZone(const Rect& box) const {
    const auto left = static_cast<f32>(safeZone_.left);
    const auto top = static_cast<f32>(safeZone_.top);
    const f32 maxY = static_cast<f32>(frame_.height) -
                     static_cast<f32>(safeZone_.bottom) - box.height;
    if (box.y < top || box.y > maxY)
        return false;

    if (box.width > availableWidth())
        return box.x == left;

    const f32 maxX = static_cast<f32>(frame_.width) -
                     static_cast<f32>(safeZone_.right) - box.width;
    return box.x >= left && box.x <= maxX;
}

usize TextLayoutEngine::cachedEntries() const {
    std::lock_guard lock(cacheMutex_);
    return lru_.size();
}

usize TextLayoutEngine::cacheHits() const {
    std::lock_guard lock(cacheMutex_);
    return hits_;
}

usize TextLayoutEngine::cacheMisses() const {
    std::lock_guard lock(cacheMutex_);
    return misses_;
}

} // namespace lf
