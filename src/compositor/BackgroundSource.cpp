#include "BackgroundSource.hpp"
#include <QLinearGradient>
#include <QPainter>
#include "core/Logger.hpp"

namespace lf {

SolidColorBackground::SolidColorBackground(Color color, FrameGeometry frame)
    : image_(static_cast<int>(frame.width),
             static_cast<int>(frame.height),
             QImage::Format_RGBA8888) {
    image_.fill(QColor(color.r, color.g, color.b, color.a));
}

QImage SolidColorBackground::frameAt(f64) const {
    return image_;
}

ImageBackground::ImageBackground(const QImage& image, FrameGeometry frame) {
    const QSize target(static_cast<int>(frame.width),
                       static_cast<int>(frame.height));
    QImage scaled = image.scaled(
            target, Qt::KeepAspectRatioByExpanding, Qt::SmoothTransformation);
    const int x = (scaled.width() - target.width()) / 2;
    const int y = (scaled.height() - target.height()) / 2;
    image_ = scaled.copy(x, y, target.width(), target.height())
                     .convertToFormat(QImage::Format_RGBA8888);
}

Result<std::unique_ptr<ImageBackground>> ImageBackground::load(
        const std::filesystem::path& path, FrameGeometry frame) {
    QImage image;
    if (!image.load(QString::fromStdString(path.string()))) {
        return Result<std::unique_ptr<ImageBackground>>::err(
                ErrorKind::Io, "Cannot load background image " + path.string());
    }
    LOG_DEBUG("Background image {} ({}x{})",
              path.string(),
              image.width(),
              image.height());
    return Result<std::unique_ptr<ImageBackground>>::ok(
            std::make_unique<ImageBackground>(image, frame));
}

QImage ImageBackground::frameAt(f64) const {
    return image_;
}

GradientBackground::GradientBackground(Color top,
                                       Color bottom,
                                       FrameGeometry frame)
    : image_(static_cast<int>(frame.width),
             static_cast<int>(frame.height),
             QImage::Format_RGBA8888) {
    QLinearGradient gradient(0, 0, 0, frame.height);
    gradient.setColorAt(0.0, QColor(top.r, top.g, top.b, top.a));
    gradient.setColorAt(1.0, QColor(bottom.r, bottom.g, bottom.b, bottom.a));

    image_.fill(Qt::transparent);
    QPainter painter(&image_);
    painter.fillRect(image_.rect(), gradient);
}

QImage GradientBackground::frameAt(f64) const {
    return image_;
}

} // namespace lf
