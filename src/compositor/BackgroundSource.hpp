#pragma once
// BackgroundSource.hpp - Frame-sized background images by timestamp
// Implementations are immutable after construction and shared by all workers

#include <QImage>
#include <filesystem>
#include <memory>
#include "layout/TextLayoutEngine.hpp"
#include "util/Result.hpp"

namespace lf {

class BackgroundSource {
public:
    virtual ~BackgroundSource() = default;

    // Frame-sized RGBA8888 image; clamping or looping past the end is up to
    // the implementation
    virtual QImage frameAt(f64 timestamp) const = 0;
};

class SolidColorBackground : public BackgroundSource {
public:
    SolidColorBackground(Color color, FrameGeometry frame);

    QImage frameAt(f64 timestamp) const override;

private:
    QImage image_;
};

// Still image, scaled to cover the frame and centre-cropped
class ImageBackground : public BackgroundSource {
public:
    ImageBackground(const QImage& image, FrameGeometry frame);

    static Result<std::unique_ptr<ImageBackground>> load(
            const std::filesystem::path& path, FrameGeometry frame);

    QImage frameAt(f64 timestamp) const override;

private:
    QImage image_;
};

// Vertical linear gradient
class GradientBackground : public BackgroundSource {
public:
    GradientBackground(Color top, Color bottom, FrameGeometry frame);

    QImage frameAt(f64 timestamp) const override;

private:
    QImage image_;
};

} // namespace lf
