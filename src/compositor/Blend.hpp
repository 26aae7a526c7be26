#pragma once
// Blend.hpp - Straight-alpha layer blending and the canvas-to-frame crop

#include <QImage>
#include "Layer.hpp"

namespace lf::blend {

// Separable blend of src over dst, both straight alpha:
//   ao = as + ad(1 - as)
//   co = ((1 - ad) as cs + (1 - as) ad cd + as ad B(cs, cd)) / ao
// with B = cs (normal), min(1, cs + cd) (add) or cs * cd (multiply).
// `opacity` scales the source alpha.
Color pixel(Color dst, Color src, BlendMode mode, f32 opacity = 1.0f);

// Blends one layer into an RGBA8888 canvas, clipped to the canvas
void layer(QImage& canvas, const Layer& layer);

// Copies the frame region (pad, pad, frame.width, frame.height) of the
// canvas into frame, row by row
void crop(const QImage& canvas, QImage& frame, u32 pad);

} // namespace lf::blend
