#pragma once
// TextMeasurer.hpp - Font metrics behind an interface
// The layout engine only needs extents; tests supply a deterministic measurer

#include <string>
#include <string_view>
#include "util/Types.hpp"

class QFont;

namespace lf {

struct FontSpec {
    std::string family;
    u32 pixelSize{72};
    bool bold{false};

    bool operator==(const FontSpec&) const = default;
};

struct TextMetrics {
    f32 width{0.0f};
    f32 height{0.0f};
    f32 ascent{0.0f};

    bool operator==(const TextMetrics&) const = default;
};

class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    virtual TextMetrics measure(std::string_view text,
                                const FontSpec& font) const = 0;
};

// QFontMetricsF based; safe to call from render workers
class QtTextMeasurer : public TextMeasurer {
public:
    TextMetrics measure(std::string_view text,
                        const FontSpec& font) const override;

    static QFont toQFont(const FontSpec& font);
};

} // namespace lf
