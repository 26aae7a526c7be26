#pragma once
// Layer.hpp - One entry of a frame's layer stack, alive for a single composite pass

#include <QImage>
#include <utility>
#include "util/Types.hpp"

namespace lf {

enum class BlendMode { Normal, Add, Multiply };

namespace z {
constexpr i32 Background = 0;
constexpr i32 UnderText = 1;
constexpr i32 Text = 2;
constexpr i32 OverText = 3;
} // namespace z

struct Layer {
    i32 zOrder{z::Background};
    BlendMode blendMode{BlendMode::Normal};
    f32 opacity{1.0f};

    // Canvas-space placement. A null source means a solid fill of
    // `fill` over width x height.
    i32 x{0};
    i32 y{0};
    QImage source; // RGBA8888, straight alpha
    Color fill{Color::transparent()};
    i32 width{0};
    i32 height{0};

    bool isSolid() const {
        return source.isNull();
    }

    static Layer image(i32 zOrder, QImage img, i32 x, i32 y,
                       BlendMode mode = BlendMode::Normal,
                       f32 opacity = 1.0f) {
        Layer l;
        l.zOrder = zOrder;
        l.blendMode = mode;
        l.opacity = opacity;
        l.x = x;
        l.y = y;
        l.width = img.width();
        l.height = img.height();
        l.source = std::move(img);
        return l;
    }

    static Layer solid(i32 zOrder, Color color, i32 width, i32 height,
                       BlendMode mode, f32 opacity) {
        Layer l;
        l.zOrder = zOrder;
        l.blendMode = mode;
        l.opacity = opacity;
        l.fill = color;
        l.width = width;
        l.height = height;
        return l;
    }
};

} // namespace lf
