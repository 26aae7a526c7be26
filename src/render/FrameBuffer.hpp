#pragma once
// FrameBuffer.hpp - Pooled canvas + cropped frame storage for one in-flight frame
// Owned by exactly one party at a time: pool, render worker, reorder buffer or
// the encoder consumer

#include <QImage>
#include <memory>
#include "util/Types.hpp"

namespace lf {

struct FrameBuffer {
    u64 index{0};
    f64 timestamp{0.0};
    u32 pad{0};
    QImage canvas; // (width + 2*pad) x (height + 2*pad), RGBA8888
    QImage frame;  // width x height, RGBA8888, filled by the crop

    FrameBuffer(u32 width, u32 height, u32 padding)
        : pad(padding),
          canvas(static_cast<int>(width + 2 * padding),
                 static_cast<int>(height + 2 * padding),
                 QImage::Format_RGBA8888),
          frame(static_cast<int>(width),
                static_cast<int>(height),
                QImage::Format_RGBA8888) {
    }
};

using FrameBufferPtr = std::unique_ptr<FrameBuffer>;

} // namespace lf
