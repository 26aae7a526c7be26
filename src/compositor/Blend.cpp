#include "Blend.hpp"
#include <cstring>

namespace lf::blend {

namespace {
inline f32 blendChannel(BlendMode mode, f32 cs, f32 cd) {
    switch (mode) {
    case BlendMode::Normal:
        return cs;
    case BlendMode::Add:
        return std::min(1.0f, cs + cd);
    case BlendMode::Multiply:
        return cs * cd;
    }
    return cs;
}

inline void blendInto(u8* d, const u8* s, BlendMode mode, f32 opacity) {
    const f32 as = (s[3] / 255.0f) * opacity;
    if (as <= 0.0f)
        return;

    if (mode == BlendMode::Normal && as >= 1.0f) {
        std::memcpy(d, s, 4);
        return;
    }

    const f32 ad = d[3] / 255.0f;
    const f32 ao = as + ad * (1.0f - as);
    if (ao <= 0.0f) {
        std::memset(d, 0, 4);
        return;
    }

    for (int c = 0; c < 3; ++c) {
        const f32 cs = s[c] / 255.0f;
        const f32 cd = d[c] / 255.0f;
        const f32 co = ((1.0f - ad) * as * cs + (1.0f - as) * ad * cd +
                        as * ad * blendChannel(mode, cs, cd)) /
                       ao;
        d[c] = static_cast<u8>(std::clamp(co * 255.0f + 0.5f, 0.0f, 255.0f));
    }
    d[3] = static_cast<u8>(std::clamp(ao * 255.0f + 0.5f, 0.0f, 255.0f));
}
} // namespace

Color pixel(Color dst, Color src, BlendMode mode, f32 opacity) {
    u8 d[4] = {dst.r, dst.g, dst.b, dst.a};
    const u8 s[4] = {src.r, src.g, src.b, src.a};
    blendInto(d, s, mode, std::clamp(opacity, 0.0f, 1.0f));
    return {d[0], d[1], d[2], d[3]};
}

void layer(QImage& canvas, const Layer& l) {
    const f32 opacity = std::clamp(l.opacity, 0.0f, 1.0f);
    if (opacity <= 0.0f || l.width <= 0 || l.height <= 0)
        return;

    const int x0 = std::max(0, l.x);
    const int y0 = std::max(0, l.y);
    const int x1 = std::min(canvas.width(), l.x + l.width);
    const int y1 = std::min(canvas.height(), l.y + l.height);
    if (x0 >= x1 || y0 >= y1)
        return;

    if (l.isSolid()) {
        const u8 s[4] = {l.fill.r, l.fill.g, l.fill.b, l.fill.a};
        for (int y = y0; y < y1; ++y) {
            u8* row = canvas.scanLine(y);
            for (int x = x0; x < x1; ++x)
                blendInto(row + x * 4, s, l.blendMode, opacity);
        }
        return;
    }

    const QImage src = l.source.format() == QImage::Format_RGBA8888
                               ? l.source
                               : l.source.convertToFormat(QImage::Format_RGBA8888);
    for (int y = y0; y < y1; ++y) {
        u8* dst = canvas.scanLine(y);
        const u8* srow = src.constScanLine(y - l.y);
        for (int x = x0; x < x1; ++x)
            blendInto(dst + x * 4, srow + (x - l.x) * 4, l.blendMode, opacity);
    }
}

void crop(const QImage& canvas, QImage& frame, u32 pad) {
    const usize rowBytes = static_cast<usize>(frame.width()) * 4;
    const usize offset = static_cast<usize>(pad) * 4;
    for (int y = 0; y < frame.height(); ++y) {
        std::memcpy(frame.scanLine(y),
                    canvas.constScanLine(y + static_cast<int>(pad)) + offset,
                    rowBytes);
    }
}

} // namespace lf::blend
