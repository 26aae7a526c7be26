#include "TextRenderer.hpp"
#include <QFontMetricsF>
#include <QPainter>
#include <QPainterPath>
#include <QStringList>
#include <cmath>
#include "layout/TextMeasurer.hpp"

namespace lf {

namespace {
QColor toQColor(Color c) {
    return QColor(c.r, c.g, c.b, c.a);
}

void drawRun(QPainter& painter,
             const QFont& font,
             const QString& text,
             QPointF baseline,
             const Style& style,
             QColor fill) {
    QPainterPath path;
    path.addText(baseline, font, text);

    if (style.strokeWidth > 0.0f) {
        QPen outline(toQColor(style.strokeColor));
        outline.setWidthF(style.strokeWidth * 2.0f);
        outline.setJoinStyle(Qt::RoundJoin);
        painter.strokePath(path, outline);
    }
    painter.fillPath(path, fill);
}
} // namespace

TextSurface TextRenderer::render(const std::string& text,
                                 const Style& style,
                                 const LayoutResult& layout,
                                 const AnimationState& animation,
                                 const std::vector<f32>& wordProgress) {
    TextSurface surface;
    surface.glyphBox = {layout.paintPosition.x,
                        layout.paintPosition.y,
                        layout.textSize.width,
                        layout.textSize.height};

    const f32 scale = std::max(0.01f, animation.scale);
    const f32 margin = surfaceMargin(style.strokeWidth);
    const f32 w = layout.textSize.width * scale;
    const f32 h = layout.textSize.height * scale;
    const int imgW = static_cast<int>(std::ceil(w + 2.0f * margin));
    const int imgH = static_cast<int>(std::ceil(h + 2.0f * margin));

    const f32 cx = layout.paintPosition.x + layout.textSize.width / 2.0f;
    const f32 cy = layout.paintPosition.y + layout.textSize.height / 2.0f;
    surface.origin = {std::floor(cx - w / 2.0f - margin),
                      std::floor(cy - h / 2.0f - margin)};

    surface.image = QImage(imgW, imgH, QImage::Format_RGBA8888);
    surface.image.fill(Qt::transparent);

    const std::string shown =
            TextAnimator::visibleText(text, animation.charProgress);
    if (shown.empty() || animation.opacity <= 0.0f)
        return surface;

    QFont font = QtTextMeasurer::toQFont(
            TextLayoutEngine::fontFor(style, layout.fontSize));

    QPainter painter(&surface.image);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);
    painter.setOpacity(std::clamp(animation.opacity, 0.0f, 1.0f));

    // Unscaled glyph box centred on the image centre, then scaled
    painter.translate(cx - surface.origin.x, cy - surface.origin.y);
    painter.scale(scale, scale);
    const QPointF start(-layout.textSize.width / 2.0f,
                        -layout.textSize.height / 2.0f + layout.ascent);

    const QString qtext = QString::fromStdString(shown);
    const bool highlight = !wordProgress.empty() && animation.charProgress >= 1.0f;
    if (!highlight) {
        drawRun(painter, font, qtext, start, style, toQColor(style.color));
        return surface;
    }

    QFontMetricsF fm(font);
    const QStringList words = qtext.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    qreal x = start.x();
    for (int i = 0; i < words.size(); ++i) {
        const f32 progress = static_cast<usize>(i) < wordProgress.size()
                                     ? wordProgress[static_cast<usize>(i)]
                                     : 0.0f;
        const QColor color = progress > 0.0f ? toQColor(style.highlightColor)
                                             : toQColor(style.color);
        drawRun(painter, font, words[i], QPointF(x, start.y()), style, color);
        x += fm.horizontalAdvance(words[i] + QLatin1Char(' '));
    }
    return surface;
}

f32 TextRenderer::surfaceMargin(f32 strokeWidth) {
    return std::ceil(std::max(0.0f, strokeWidth)) + 2.0f;
}

TextSurface TextRenderer::scaled(const TextSurface& surface, f32 factor) {
    if (std::abs(factor - 1.0f) < 0.001f || surface.image.isNull())
        return surface;

    const int w = std::max(1, static_cast<int>(std::lround(surface.image.width() * factor)));
    const int h = std::max(1, static_cast<int>(std::lround(surface.image.height() * factor)));

    TextSurface out;
    out.glyphBox = surface.glyphBox;
    out.image = surface.image.scaled(w, h, Qt::IgnoreAspectRatio,
                                     Qt::SmoothTransformation)
                        .convertToFormat(QImage::Format_RGBA8888);
    const f32 cx = surface.origin.x + surface.image.width() / 2.0f;
    const f32 cy = surface.origin.y + surface.image.height() / 2.0f;
    out.origin = {std::floor(cx - w / 2.0f), std::floor(cy - h / 2.0f)};
    return out;
}

} // namespace lf
